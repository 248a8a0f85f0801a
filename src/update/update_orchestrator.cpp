#include "gsd/update.hpp"
#include "gsd/installer.hpp"
#include "gsd/manifest.hpp"
#include "gsd/platform.hpp"
#include "gsd/structure.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace gsd {

Result<FetchedBundle> LocalBundleSource::fetch(const ResolvedVersion& version) {
    if (!is_directory(dir_)) {
        return Result<FetchedBundle>::err(
            Error(ErrorCode::SOURCE_MISSING, "bundle directory not found: " + dir_));
    }

    std::string declared = read_bundle_version(dir_);
    if (!declared.empty() && declared != version.version) {
        return Result<FetchedBundle>::err(
            Error(ErrorCode::SOURCE_MISSING,
                  "bundle at " + dir_ + " is " + declared + ", not " + version.version));
    }

    FetchedBundle bundle;
    bundle.dir = dir_;
    return Result<FetchedBundle>::ok(bundle);
}

UpdateOrchestrator::UpdateOrchestrator(InstallationRoot root, PackageLayout layout,
                                       VersionResolver& resolver, BundleSource& source,
                                       PathRewriter rewriter, std::string prefix)
    : root_(std::move(root)), layout_(std::move(layout)), resolver_(resolver), source_(source),
      rewriter_(std::move(rewriter)), prefix_(std::move(prefix)) {}

UpdateReport UpdateOrchestrator::run(const VersionRequest& request) {
    UpdateReport report;

    if (request.channel == UpdateChannel::Pinned && !parse_version(request.version)) {
        report.error = Error(ErrorCode::VERSION_RESOLUTION_FAILED,
                             "'" + request.version + "' is not a valid semantic version");
        return report;
    }

    ManifestManager store(root_.path, layout_);
    StructureDetector detector(root_.path, layout_);
    report.structure = detector.detect();
    report.from_version = store.read_version();

    if (!store.manifest_exists() && report.from_version.empty() &&
        report.structure == StructureState::None) {
        report.installed = false;
        report.ok = true;
        return report;
    }

    if (report.structure == StructureState::Dual) {
        report.error = Error(ErrorCode::STRUCTURE_CONFLICT,
                             "both command layouts exist; run 'gsd-opencode repair --fix-structure' first");
        return report;
    }

    auto resolved = resolver_.resolve(request);
    if (resolved.isErr()) {
        report.error = resolved.error();
        return report;
    }
    report.to_version = resolved.value().version;
    report.change = classify_change(report.from_version, report.to_version);

    if (report.change == VersionChange::Same) {
        spdlog::info("already at {}", report.to_version);
        report.already_current = true;
        report.ok = true;
        return report;
    }

    auto fetched = source_.fetch(resolved.value());
    if (fetched.isErr()) {
        report.error = fetched.error();
        return report;
    }

    Manifest previous = store.load();
    report.warnings = previous.warnings;

    Installer installer(fetched.value().dir, root_, layout_, rewriter_, prefix_);
    auto result = installer.install(InstallMode::Retain, detector.command_dir_for_writes(report.structure),
                                    report.to_version, previous.entries);
    source_.release(fetched.value());

    report.warnings.insert(report.warnings.end(), result.warnings.begin(), result.warnings.end());
    report.files_installed = result.entries.size();
    report.stale_removed = result.stale_removed;
    report.failures = result.failures;

    if (!result.ok) {
        report.error = result.error ? *result.error
                                    : Error(ErrorCode::WRITE_FAILED, "update did not complete");
        return report;
    }

    spdlog::info("updated {} -> {} ({})", report.from_version, report.to_version,
                 version_change_to_string(report.change));
    report.ok = true;
    return report;
}

} // namespace gsd
