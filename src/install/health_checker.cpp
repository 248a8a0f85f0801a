#include "gsd/health.hpp"
#include "gsd/hash.hpp"
#include "gsd/path_utils.hpp"
#include "gsd/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace gsd {

namespace {

void collect(const CategoryReport& category, CheckStatus status, std::vector<std::string>& out) {
    for (const auto& c : category.checks) {
        if (c.status == status && std::find(out.begin(), out.end(), c.name) == out.end()) {
            out.push_back(c.name);
        }
    }
}

HealthCheck manifest_check(const Manifest& manifest) {
    HealthCheck check;
    check.name = "manifest";
    if (manifest.status == ManifestLoadStatus::Absent) {
        check.status = CheckStatus::Missing;
        check.detail = "manifest not found; run 'gsd-opencode repair'";
    } else {
        check.status = CheckStatus::Fail;
        check.detail = "manifest is corrupt (" + manifest.error + "); run 'gsd-opencode repair'";
    }
    return check;
}

} // namespace

std::vector<std::string> HealthReport::missing() const {
    std::vector<std::string> out;
    collect(files, CheckStatus::Missing, out);
    collect(integrity, CheckStatus::Missing, out);
    out.erase(std::remove(out.begin(), out.end(), std::string("manifest")), out.end());
    return out;
}

std::vector<std::string> HealthReport::corrupted() const {
    std::vector<std::string> out;
    collect(integrity, CheckStatus::Corrupted, out);
    return out;
}

HealthChecker::HealthChecker(InstallationRoot root, PackageLayout layout)
    : root_(std::move(root)), layout_(std::move(layout)) {}

HealthReport HealthChecker::check(const std::string& expected_version) const {
    HealthReport report;
    report.expected_version = expected_version;

    ManifestManager store(root_.path, layout_);
    Manifest manifest = store.load();
    report.manifest_status = manifest.status;
    report.installed_version = manifest.version;
    report.structure_details = StructureDetector(root_.path, layout_).details();

    if (manifest.status == ManifestLoadStatus::Absent && !store.version_exists() &&
        report.structure_details.state == StructureState::None) {
        report.installed = false;
        report.passed = true;
        spdlog::debug("nothing installed at {}", root_.path);
        return report;
    }

    report.files = verify_files(manifest);
    report.version = verify_version(manifest.version, expected_version);
    report.integrity = verify_integrity(manifest);
    report.structure = verify_structure(report.structure_details);

    report.passed = report.files.passed && report.version.passed &&
                    report.integrity.passed && report.structure.passed;
    return report;
}

CategoryReport HealthChecker::verify_files(const Manifest& manifest) const {
    CategoryReport category;
    if (!manifest.loaded()) {
        category.add(manifest_check(manifest));
        return category;
    }

    for (const auto& entry : manifest.entries) {
        auto path = normalize_under_root(root_.path, entry.relative_path);
        HealthCheck check;
        check.name = entry.relative_path;
        if (!path.ok || !is_regular_file(path.path)) {
            check.status = CheckStatus::Missing;
            check.detail = "file not found";
        }
        category.add(std::move(check));
    }
    return category;
}

CategoryReport HealthChecker::verify_version(const std::string& installed,
                                             const std::string& expected) const {
    CategoryReport category;
    HealthCheck check;
    check.name = "version";

    if (installed.empty()) {
        check.status = CheckStatus::Fail;
        check.detail = "installed: none";
    } else if (!expected.empty() && installed != expected) {
        check.status = CheckStatus::Fail;
        check.detail = "installed: " + installed + ", expected: " + expected +
                       "; run 'gsd-opencode update'";
    } else {
        check.detail = "installed: " + installed;
    }

    category.add(std::move(check));
    return category;
}

CategoryReport HealthChecker::verify_integrity(const Manifest& manifest) const {
    CategoryReport category;
    if (!manifest.loaded()) {
        category.add(manifest_check(manifest));
        return category;
    }

    for (const auto& entry : manifest.entries) {
        HealthCheck check;
        check.name = entry.relative_path;

        auto path = normalize_under_root(root_.path, entry.relative_path);
        auto hashed = path.ok ? compute_sha256_file(path.path) : HashResult{};
        if (!hashed.ok) {
            check.status = CheckStatus::Missing;
            check.detail = "unreadable";
        } else if (format_content_hash(hashed.hex_digest) != entry.hash) {
            check.status = CheckStatus::Corrupted;
            check.detail = "hash mismatch";
        }
        category.add(std::move(check));
    }
    return category;
}

CategoryReport HealthChecker::verify_structure(const StructureDetails& details) const {
    CategoryReport category;
    HealthCheck check;
    check.name = "structure";
    check.detail = structure_to_string(details.state);

    switch (details.state) {
        case StructureState::Dual:
            check.status = CheckStatus::Fail;
            check.detail = details.recommended_action;
            break;
        case StructureState::Old:
            check.status = CheckStatus::Warn;
            check.detail = details.recommended_action;
            break;
        default:
            break;
    }

    category.add(std::move(check));
    return category;
}

} // namespace gsd
