#include "gsd/structure.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace gsd {

StructureDetector::StructureDetector(std::string root, PackageLayout layout)
    : root_(std::move(root)), layout_(std::move(layout)) {}

StructureState StructureDetector::detect() const {
    return details().state;
}

StructureDetails StructureDetector::details() const {
    StructureDetails d;
    d.old_path = join_path(join_path(root_, layout_.old_command_dir), layout_.command_namespace);
    d.new_path = join_path(join_path(root_, layout_.new_command_dir), layout_.command_namespace);
    d.old_exists = is_directory(d.old_path);
    d.new_exists = is_directory(d.new_path);

    if (d.old_exists && d.new_exists) {
        d.state = StructureState::Dual;
        d.recommended_action =
            "both " + layout_.old_command_dir + "/ and " + layout_.new_command_dir +
            "/ exist; run 'gsd-opencode repair --fix-structure'";
    } else if (d.old_exists) {
        d.state = StructureState::Old;
        d.recommended_action =
            "legacy " + layout_.old_command_dir + "/ layout; run 'gsd-opencode repair --fix-structure' to migrate";
    } else if (d.new_exists) {
        d.state = StructureState::New;
    } else {
        d.state = StructureState::None;
    }

    spdlog::debug("structure of {}: {}", root_, structure_to_string(d.state));
    return d;
}

std::string StructureDetector::command_dir_for_writes(StructureState state) const {
    if (state == StructureState::Old) {
        return layout_.old_command_dir;
    }
    return layout_.new_command_dir;
}

} // namespace gsd
