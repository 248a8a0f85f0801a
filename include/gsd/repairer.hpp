#pragma once

#include "gsd/installer.hpp"
#include "gsd/manifest.hpp"
#include "gsd/rewrite.hpp"
#include "gsd/scope.hpp"
#include "gsd/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Repairer
// ============================================================================

struct RepairOptions {
    bool fix_structure = false;
};

struct RepairReport {
    bool ok = false;
    bool installed = true;
    bool fresh_install = false;     // manifest was absent or corrupt
    bool manifest_written = false;
    bool version_restored = false;
    bool interrupted = false;       // stopped between files; the manifest still matches disk

    int unchanged = 0;
    int modified = 0;

    std::vector<std::string> succeeded;     // files re-copied
    std::vector<FileFailure> failed;
    std::vector<std::string> migrated;      // old command dir -> new
    std::vector<std::string> preserved;     // unmanaged files left in the old dir

    StructureState structure_before = StructureState::None;
    StructureState structure_after = StructureState::None;

    std::string backup_dir;
    std::vector<std::string> warnings;
};

// Restores missing or corrupted managed files from the bundle and migrates
// the legacy command layout on request. Only manifest-listed files inside
// the namespace are ever overwritten or deleted.
class Repairer {
public:
    // bundle_dir may be empty when no bundle is available; repairs that
    // need a source then fail with SOURCE_MISSING.
    Repairer(InstallationRoot root, PackageLayout layout, std::string bundle_dir,
             std::string bundle_version, PathRewriter rewriter, std::string prefix);

    RepairReport run(const RepairOptions& options) const;

private:
    void fresh_install(RepairReport& report, StructureState state) const;
    void migrate_structure(Manifest& manifest, RepairReport& report, bool& changed) const;
    void repair_files(Manifest& manifest, RepairReport& report, bool& changed) const;

    Installer installer() const;

    InstallationRoot root_;
    PackageLayout layout_;
    std::string bundle_dir_;
    std::string bundle_version_;
    PathRewriter rewriter_;
    std::string prefix_;
};

} // namespace gsd
