#pragma once

#include "gsd/manifest.hpp"
#include "gsd/scope.hpp"
#include "gsd/structure.hpp"
#include "gsd/types.hpp"

#include <string>
#include <vector>

namespace gsd {

// ============================================================================
// Health Report
// ============================================================================

enum class CheckStatus {
    Pass,
    Warn,       // passes, but action is recommended
    Missing,
    Corrupted,
    Fail
};

inline const char* check_status_to_string(CheckStatus s) {
    switch (s) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Warn: return "warn";
        case CheckStatus::Missing: return "missing";
        case CheckStatus::Corrupted: return "corrupted";
        case CheckStatus::Fail: return "fail";
        default: return "unknown";
    }
}

struct HealthCheck {
    std::string name;           // relative path or check label
    CheckStatus status = CheckStatus::Pass;
    std::string detail;

    bool passed() const {
        return status == CheckStatus::Pass || status == CheckStatus::Warn;
    }
};

struct CategoryReport {
    bool passed = true;
    std::vector<HealthCheck> checks;

    void add(HealthCheck check) {
        if (!check.passed()) passed = false;
        checks.push_back(std::move(check));
    }
};

struct HealthReport {
    bool installed = true;
    bool passed = true;

    ManifestLoadStatus manifest_status = ManifestLoadStatus::Absent;
    std::string installed_version;
    std::string expected_version;
    StructureDetails structure_details;

    CategoryReport files;
    CategoryReport version;
    CategoryReport integrity;
    CategoryReport structure;

    // Relative paths reported Missing / Corrupted, without duplicates
    std::vector<std::string> missing() const;
    std::vector<std::string> corrupted() const;
};

// ============================================================================
// Health Checker
// ============================================================================

// Read-only diagnosis of an installation root
class HealthChecker {
public:
    HealthChecker(InstallationRoot root, PackageLayout layout);

    // expected_version empty: the version category only requires a marker
    HealthReport check(const std::string& expected_version) const;

    CategoryReport verify_files(const Manifest& manifest) const;
    CategoryReport verify_version(const std::string& installed,
                                  const std::string& expected) const;
    CategoryReport verify_integrity(const Manifest& manifest) const;
    CategoryReport verify_structure(const StructureDetails& details) const;

private:
    InstallationRoot root_;
    PackageLayout layout_;
};

} // namespace gsd
