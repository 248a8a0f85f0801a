#pragma once

#include "gsd/types.hpp"

#include <string>

namespace gsd {

// ============================================================================
// Structure Detection
// ============================================================================

struct StructureDetails {
    StructureState state = StructureState::None;
    std::string old_path;   // <root>/command/gsd
    std::string new_path;   // <root>/commands/gsd
    bool old_exists = false;
    bool new_exists = false;
    std::string recommended_action;
};

// Classifies which command-directory layout exists under a root. The result
// is derived from the filesystem on every call and never cached.
class StructureDetector {
public:
    StructureDetector(std::string root, PackageLayout layout);

    StructureState detect() const;
    StructureDetails details() const;

    // Command directory name new files should be written to
    std::string command_dir_for_writes(StructureState state) const;

    static bool is_healthy(StructureState state) {
        return state != StructureState::Dual;
    }

private:
    std::string root_;
    PackageLayout layout_;
};

} // namespace gsd
