#include "gsd/repairer.hpp"
#include "gsd/backup.hpp"
#include "gsd/hash.hpp"
#include "gsd/namespace_rules.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"
#include "gsd/structure.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <set>
#include <utility>

namespace gsd {

namespace fs = std::filesystem;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

void fail(RepairReport& report, const std::string& path, ErrorCode code, const std::string& msg) {
    spdlog::warn("repair {}: {}", path, msg);
    report.failed.push_back({path, Error(code, msg)});
}

} // namespace

Repairer::Repairer(InstallationRoot root, PackageLayout layout, std::string bundle_dir,
                   std::string bundle_version, PathRewriter rewriter, std::string prefix)
    : root_(std::move(root)), layout_(std::move(layout)), bundle_dir_(std::move(bundle_dir)),
      bundle_version_(std::move(bundle_version)), rewriter_(std::move(rewriter)),
      prefix_(std::move(prefix)) {}

Installer Repairer::installer() const {
    return Installer(bundle_dir_, root_, layout_, rewriter_, prefix_);
}

RepairReport Repairer::run(const RepairOptions& options) const {
    RepairReport report;

    StructureDetector detector(root_.path, layout_);
    report.structure_before = detector.detect();

    ManifestManager store(root_.path, layout_);
    Manifest manifest = store.load();
    report.warnings = manifest.warnings;

    if (manifest.status == ManifestLoadStatus::Absent && !store.version_exists() &&
        report.structure_before == StructureState::None) {
        report.installed = false;
        report.ok = true;
        report.structure_after = report.structure_before;
        return report;
    }

    if (!manifest.loaded()) {
        fresh_install(report, report.structure_before);
        if (report.failed.empty()) {
            manifest = store.load();
        }
    }

    bool changed = false;
    if (manifest.loaded() && !report.fresh_install) {
        if (!bundle_version_.empty() && !manifest.version.empty() &&
            manifest.version != bundle_version_) {
            fail(report, "version", ErrorCode::VERSION_MISMATCH,
                 "installed " + manifest.version + " but bundle is " + bundle_version_ +
                 "; run 'gsd-opencode update'");
            report.structure_after = detector.detect();
            return report;
        }

        if (options.fix_structure) {
            migrate_structure(manifest, report, changed);
        }
        repair_files(manifest, report, changed);

        std::string version = manifest.version;
        if (version.empty()) {
            version = bundle_version_;
            if (version.empty()) {
                fail(report, layout_.version_file, ErrorCode::SOURCE_MISSING,
                     "version marker missing and no bundle version available");
            } else {
                report.version_restored = true;
            }
        }

        if ((changed || report.version_restored) && !version.empty()) {
            auto saved = store.save(manifest.entries, version);
            if (saved.isErr()) {
                fail(report, layout_.manifest_file, saved.error().code(), saved.error().message());
            } else {
                report.manifest_written = true;
            }
        }
    } else if (manifest.loaded() && options.fix_structure) {
        migrate_structure(manifest, report, changed);
        if (changed) {
            auto saved = store.save(manifest.entries, manifest.version);
            if (saved.isErr()) {
                fail(report, layout_.manifest_file, saved.error().code(), saved.error().message());
            }
        }
    }

    if (report.interrupted) {
        fail(report, "repair", ErrorCode::INTERRUPTED,
             "interrupted; run 'gsd-opencode repair' again to finish");
    }

    report.structure_after = detector.detect();
    if (report.structure_after == StructureState::Dual) {
        fail(report, "structure", ErrorCode::STRUCTURE_CONFLICT,
             options.fix_structure
                 ? "both command layouts remain; " + layout_.old_command_dir + "/" +
                       layout_.command_namespace + " holds files not recorded in the manifest"
                 : "both command layouts exist; run 'gsd-opencode repair --fix-structure'");
    } else if (report.structure_after == StructureState::Old) {
        report.warnings.push_back("legacy " + layout_.old_command_dir +
                                  "/ layout; run 'gsd-opencode repair --fix-structure' to migrate");
    }

    report.ok = report.failed.empty();
    return report;
}

void Repairer::fresh_install(RepairReport& report, StructureState state) const {
    report.fresh_install = true;
    spdlog::info("manifest unusable, reinstalling bundle into {}", root_.path);

    if (bundle_dir_.empty()) {
        fail(report, layout_.manifest_file, ErrorCode::SOURCE_MISSING,
             "manifest missing and no bundle available to rebuild it");
        return;
    }

    std::string version = bundle_version_;
    if (version.empty()) {
        version = ManifestManager(root_.path, layout_).read_version();
    }

    Installer copier = installer();
    // Retain: files restored before a failure stay for the next repair
    auto result = copier.install(InstallMode::Retain, StructureDetector(root_.path, layout_)
                                                          .command_dir_for_writes(state),
                                 version);
    report.warnings.insert(report.warnings.end(), result.warnings.begin(), result.warnings.end());

    if (!result.ok) {
        for (const auto& e : result.entries) {
            report.succeeded.push_back(e.relative_path);
        }
        if (result.failures.empty() && result.error) {
            report.failed.push_back({layout_.manifest_file, *result.error});
        }
        report.failed.insert(report.failed.end(), result.failures.begin(), result.failures.end());
        return;
    }

    for (const auto& e : result.entries) {
        report.succeeded.push_back(e.relative_path);
    }
    report.modified = static_cast<int>(result.entries.size());
    report.manifest_written = true;
}

void Repairer::migrate_structure(Manifest& manifest, RepairReport& report, bool& changed) const {
    StructureState state = StructureDetector(root_.path, layout_).detect();
    if (state != StructureState::Old && state != StructureState::Dual) {
        return;
    }

    auto rules = NamespaceRules::from_layout(layout_);
    std::string old_prefix = layout_.old_command_dir + "/";
    std::string new_prefix = layout_.new_command_dir + "/";
    Installer copier = installer();

    std::set<std::string> listed;
    for (const auto& e : manifest.entries) listed.insert(e.relative_path);

    std::vector<ManifestEntry> result;
    std::vector<std::string> old_paths;

    for (const auto& entry : manifest.entries) {
        if (report.interrupted || interrupt_requested()) {
            report.interrupted = true;
            result.push_back(entry);
            continue;
        }
        if (!starts_with(entry.relative_path, old_prefix)) {
            result.push_back(entry);
            continue;
        }

        std::string old_rel = entry.relative_path;
        std::string new_rel = new_prefix + old_rel.substr(old_prefix.size());
        if (!rules.matches(old_rel) || !rules.matches(new_rel)) {
            result.push_back(entry);
            continue;
        }

        std::string old_abs = join_path(root_.path, old_rel);
        std::string new_abs = join_path(root_.path, new_rel);

        if (listed.count(new_rel)) {
            // The new layout already holds a managed copy; it wins
            old_paths.push_back(old_rel);
            changed = true;
            continue;
        }

        ManifestEntry migrated;
        auto old_bytes = read_file_bytes(old_abs);
        if (old_bytes) {
            auto new_bytes = read_file_bytes(new_abs);
            if (new_bytes && *new_bytes != *old_bytes) {
                fail(report, new_rel, ErrorCode::STRUCTURE_CONFLICT,
                     "an unmanaged file with different content already exists");
                result.push_back(entry);
                continue;
            }
            if (!new_bytes) {
                auto dir = atomic_create_directory(get_parent_directory(new_abs));
                auto written = dir.ok ? atomic_write_file(new_abs, *old_bytes) : dir;
                if (!written.ok) {
                    fail(report, new_rel,
                         written.permission_denied ? ErrorCode::PERMISSION_DENIED
                                                   : ErrorCode::WRITE_FAILED,
                         written.error);
                    result.push_back(entry);
                    continue;
                }
            }
            // The recorded hash moves with the file; a divergent copy is
            // then restored by repair_files
            migrated = ManifestEntry{new_abs, new_rel, entry.size, entry.hash};
            if (content_hash(*old_bytes) != entry.hash) {
                spdlog::warn("{} differs from the manifest; it will be restored", old_rel);
            }
        } else {
            // Old copy already gone; take it from the bundle
            auto source = bundle_dir_.empty() ? std::nullopt : copier.find_source(new_rel);
            if (!source) {
                fail(report, new_rel, ErrorCode::SOURCE_MISSING, "no source in bundle");
                result.push_back(entry);
                continue;
            }
            auto copied = copier.copy_file(*source);
            if (copied.isErr()) {
                fail(report, new_rel, copied.error().code(), copied.error().message());
                result.push_back(entry);
                continue;
            }
            migrated = copied.value();
        }

        result.push_back(migrated);
        listed.insert(new_rel);
        old_paths.push_back(old_rel);
        report.migrated.push_back(new_rel);
        changed = true;
    }
    manifest.entries = std::move(result);

    for (const auto& old_rel : old_paths) {
        std::string old_abs = join_path(root_.path, old_rel);
        if (!remove_file(old_abs)) {
            fail(report, old_rel, ErrorCode::IO_ERROR, "failed to remove migrated file");
            continue;
        }
        prune_empty_parents(root_.path, old_abs);
    }

    // Anything left under the old namespace dir belongs to the user
    std::string old_dir = join_path(join_path(root_.path, layout_.old_command_dir),
                                    layout_.command_namespace);
    std::error_code ec;
    if (is_directory(old_dir)) {
        for (fs::recursive_directory_iterator it(old_dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (!it->is_directory(ec)) {
                std::string rel = relative_to_root(root_.path, it->path().string());
                report.preserved.push_back(rel);
                report.warnings.push_back("preserved unmanaged file " + rel);
            }
        }
    }

    spdlog::info("migrated {} files to {}/", report.migrated.size(), layout_.new_command_dir);
}

void Repairer::repair_files(Manifest& manifest, RepairReport& report, bool& changed) const {
    auto rules = NamespaceRules::from_layout(layout_);
    Installer copier = installer();
    BackupManager backups(root_.path, layout_);

    for (auto& entry : manifest.entries) {
        if (report.interrupted || interrupt_requested()) {
            report.interrupted = true;
            break;
        }
        if (!rules.matches(entry.relative_path)) {
            report.warnings.push_back("not repairing " + entry.relative_path +
                                      " (outside the managed namespace)");
            continue;
        }

        auto path = normalize_under_root(root_.path, entry.relative_path);
        if (!path.ok) continue;

        bool missing = !is_regular_file(path.path);
        bool corrupted = false;
        if (!missing) {
            auto hashed = compute_sha256_file(path.path);
            if (!hashed.ok) {
                missing = true;
            } else {
                corrupted = format_content_hash(hashed.hex_digest) != entry.hash;
            }
        }

        if (!missing && !corrupted) {
            ++report.unchanged;
            continue;
        }

        auto source = bundle_dir_.empty() ? std::nullopt : copier.find_source(entry.relative_path);
        if (!source) {
            fail(report, entry.relative_path, ErrorCode::SOURCE_MISSING, "no source in bundle");
            continue;
        }

        if (corrupted) {
            auto saved = backups.backup_file(entry.relative_path);
            if (saved.isErr()) {
                fail(report, entry.relative_path, saved.error().code(), saved.error().message());
                continue;
            }
        }

        auto copied = copier.copy_file(*source);
        if (copied.isErr()) {
            fail(report, entry.relative_path, copied.error().code(), copied.error().message());
            continue;
        }

        changed = true;
        entry = copied.value();
        ++report.modified;
        report.succeeded.push_back(entry.relative_path);
        spdlog::debug("repaired {} ({})", entry.relative_path, corrupted ? "corrupted" : "missing");
    }

    report.backup_dir = backups.session_dir();
}

} // namespace gsd
