#include <doctest/doctest.h>
#include <gsd/hash.hpp>
#include <gsd/health.hpp>
#include <gsd/manifest.hpp>
#include <gsd/repairer.hpp>
#include <gsd/scope.hpp>
#include <gsd/structure.hpp>
#include <gsd/uninstaller.hpp>
#include <gsd/update.hpp>

#include "../test_helpers.hpp"

#include <algorithm>
#include <map>

using namespace gsd;
using namespace gsd::test;

namespace {

using Snapshot = std::map<std::string, std::string>;

// Every regular file below dir, keyed by relative path
Snapshot snapshot(const std::string& dir) {
    Snapshot files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            std::string rel = fs::relative(it->path(), dir).generic_string();
            files[rel] = read_text(it->path().string());
        }
    }
    return files;
}

// A project directory with a local installation managed through ScopeManager
struct Project {
    TempDir tmp;
    ScopeManager scopes;
    InstallationRoot root;
    std::string bundle;

    Project()
        : scopes(PackageLayout{}, tmp.sub("home"), tmp.sub("project")), bundle(tmp.sub("bundle")) {
        make_bundle(bundle, "1.2.0");
        auto resolved = scopes.resolve(Scope::Local);
        REQUIRE(resolved.isOk());
        root = resolved.value();
    }

    InstallResult install() {
        Installer installer(bundle, root, PackageLayout{}, make_path_rewriter(root.scope),
                            scopes.path_prefix(root));
        return installer.install(InstallMode::Fresh, "commands", read_bundle_version(bundle));
    }

    HealthReport check() const {
        return HealthChecker(root, PackageLayout{}).check("1.2.0");
    }

    RepairReport repair(bool fix_structure = false) const {
        Repairer repairer(root, PackageLayout{}, bundle, "1.2.0", make_path_rewriter(root.scope),
                          scopes.path_prefix(root));
        RepairOptions options;
        options.fix_structure = fix_structure;
        return repairer.run(options);
    }

    std::string file(const std::string& rel) const { return join_path(root.path, rel); }
};

// Manifest entries agree with the bytes on disk
void check_converged(const InstallationRoot& root) {
    Manifest manifest = ManifestManager(root.path, PackageLayout{}).load();
    REQUIRE(manifest.loaded());
    for (const auto& entry : manifest.entries) {
        CAPTURE(entry.relative_path);
        auto bytes = read_file_bytes(join_path(root.path, entry.relative_path));
        REQUIRE(bytes.has_value());
        CHECK(bytes->size() == entry.size);
        CHECK(content_hash(*bytes) == entry.hash);
    }
}

} // namespace

TEST_CASE("local install resolves below the project directory") {
    Project p;
    CHECK(p.root.scope == Scope::Local);
    CHECK(p.root.path == p.tmp.sub("project/.opencode"));

    auto result = p.install();
    REQUIRE(result.ok);
    CHECK(result.entries.size() == kBundleFiles);
    CHECK(p.scopes.is_installed(p.root));
    CHECK(p.scopes.installed_version(p.root) == "1.2.0");
    CHECK(read_text(p.file("agents/gsd-planner.md")).find("@gsd-opencode/") == std::string::npos);
    check_converged(p.root);
    CHECK(p.check().passed);
}

TEST_CASE("repair after a clean install changes nothing") {
    Project p;
    REQUIRE(p.install().ok);
    Snapshot before = snapshot(p.root.path);

    auto report = p.repair();
    CHECK(report.ok);
    CHECK(report.modified == 0);
    CHECK(report.unchanged == static_cast<int>(kBundleFiles));
    CHECK_FALSE(report.manifest_written);
    CHECK(snapshot(p.root.path) == before);
}

TEST_CASE("user files survive uninstall and repair") {
    Project p;
    REQUIRE(p.install().ok);
    write_text(p.file("opencode.json"), "{\"theme\": \"dark\"}");
    write_text(p.file("agents/reviewer.md"), "my reviewer");
    write_text(p.file("get-shit-done-notes.md"), "notes");

    // A foreign path slipped into the manifest is still protected
    ManifestManager store(p.root.path, PackageLayout{});
    Manifest manifest = store.load();
    auto entries = manifest.entries;
    auto user = read_file_bytes(p.file("agents/reviewer.md"));
    REQUIRE(user.has_value());
    entries.push_back(ManifestEntry{p.file("agents/reviewer.md"), "agents/reviewer.md",
                                    static_cast<uint64_t>(user->size()), content_hash(*user)});
    REQUIRE(store.save(entries, "1.2.0").isOk());

    CHECK(p.repair().ok);
    CHECK(read_text(p.file("agents/reviewer.md")) == "my reviewer");

    auto removed = Uninstaller(p.root, PackageLayout{}).run({});
    CHECK(removed.ok);
    CHECK(read_text(p.file("opencode.json")) == "{\"theme\": \"dark\"}");
    CHECK(read_text(p.file("agents/reviewer.md")) == "my reviewer");
    CHECK(read_text(p.file("get-shit-done-notes.md")) == "notes");
    CHECK_FALSE(path_exists(p.file("agents/gsd-planner.md")));
    CHECK_FALSE(path_exists(p.file("get-shit-done")));
}

TEST_CASE("uninstall dry run predicts exactly what is removed") {
    Project p;
    REQUIRE(p.install().ok);
    write_text(p.file("commands/deploy.md"), "deploy");
    REQUIRE(remove_file(p.file("skills/gsd-research/SKILL.md")));

    Uninstaller uninstaller(p.root, PackageLayout{});
    UninstallOptions dry;
    dry.dry_run = true;
    auto predicted = uninstaller.run(dry);
    REQUIRE(predicted.ok);
    CHECK(predicted.removed_files.empty());
    CHECK(predicted.plan.already_missing ==
          std::vector<std::string>{"skills/gsd-research/SKILL.md"});
    Snapshot untouched = snapshot(p.root.path);
    CHECK(untouched.count("agents/gsd-planner.md") == 1);

    auto actual = uninstaller.run({});
    REQUIRE(actual.ok);

    auto sorted = [](std::vector<std::string> v) {
        std::sort(v.begin(), v.end());
        return v;
    };
    CHECK(sorted(actual.removed_files) == sorted(predicted.plan.to_remove));
    CHECK(sorted(actual.removed_dirs) == sorted(predicted.plan.directories));
    CHECK(read_text(p.file("commands/deploy.md")) == "deploy");
}

TEST_CASE("deleting a managed file is diagnosed and repaired") {
    Project p;
    REQUIRE(p.install().ok);
    REQUIRE(remove_file(p.file("commands/gsd/execute.md")));

    auto health = p.check();
    CHECK_FALSE(health.passed);
    CHECK(health.missing() == std::vector<std::string>{"commands/gsd/execute.md"});
    CHECK(health.corrupted().empty());

    auto report = p.repair();
    REQUIRE(report.ok);
    CHECK(report.unchanged == static_cast<int>(kBundleFiles) - 1);
    CHECK(report.modified == 1);
    CHECK(read_text(p.file("commands/gsd/execute.md")) == "Execute the plan.\n");

    check_converged(p.root);
    CHECK(p.check().passed);
}

TEST_CASE("corrupt manifest is diagnosed and rebuilt") {
    Project p;
    REQUIRE(p.install().ok);
    write_text(p.file("commands/deploy.md"), "deploy");
    write_text(p.file("get-shit-done/INSTALLED_FILES.json"), "{ truncated");

    auto health = p.check();
    CHECK_FALSE(health.passed);
    CHECK(health.manifest_status == ManifestLoadStatus::Corrupt);

    auto report = p.repair();
    REQUIRE(report.ok);
    CHECK(report.fresh_install);

    Manifest rebuilt = ManifestManager(p.root.path, PackageLayout{}).load();
    REQUIRE(rebuilt.loaded());
    CHECK(rebuilt.entries.size() == kBundleFiles);
    CHECK(read_text(p.file("commands/deploy.md")) == "deploy");
    check_converged(p.root);
    CHECK(p.check().passed);
}

TEST_CASE("legacy command layout migrates to the new one") {
    Project p;
    Installer installer(p.bundle, p.root, PackageLayout{}, make_path_rewriter(p.root.scope),
                        p.scopes.path_prefix(p.root));
    REQUIRE(installer.install(InstallMode::Fresh, "command", "1.2.0").ok);

    StructureDetector detector(p.root.path, PackageLayout{});
    CHECK(detector.detect() == StructureState::Old);

    create_directories(p.file("commands/gsd"));
    CHECK(detector.detect() == StructureState::Dual);
    CHECK_FALSE(p.check().passed);
    CHECK_FALSE(p.repair().ok);

    auto fixed = p.repair(true);
    REQUIRE(fixed.ok);
    CHECK(fixed.structure_after == StructureState::New);
    CHECK_FALSE(path_exists(p.file("command/gsd")));
    CHECK(is_regular_file(p.file("commands/gsd/plan.md")));

    check_converged(p.root);
    CHECK(p.check().passed);
}

TEST_CASE("update moves to a new version and keeps user files") {
    Project p;
    write_text(join_path(p.bundle, "agents/gsd-retired.md"), "retired\n");
    REQUIRE(p.install().ok);
    write_text(p.file("agents/mine.md"), "mine");

    std::string next = p.tmp.sub("bundle-next");
    make_bundle(next, "1.3.0");

    class Fixed : public VersionResolver {
    public:
        Result<ResolvedVersion> resolve(const VersionRequest&) override {
            ResolvedVersion v;
            v.package = "gsd-opencode";
            v.version = "1.3.0";
            return Result<ResolvedVersion>::ok(v);
        }
    } resolver;
    LocalBundleSource source(next);

    UpdateOrchestrator orchestrator(p.root, PackageLayout{}, resolver, source,
                                    make_path_rewriter(p.root.scope), p.scopes.path_prefix(p.root));
    auto report = orchestrator.run({});
    REQUIRE(report.ok);
    CHECK(report.change == VersionChange::Upgrade);
    CHECK(p.scopes.installed_version(p.root) == "1.3.0");
    CHECK_FALSE(path_exists(p.file("agents/gsd-retired.md")));
    CHECK(read_text(p.file("agents/mine.md")) == "mine");
    check_converged(p.root);
    CHECK(HealthChecker(p.root, PackageLayout{}).check("1.3.0").passed);

    auto again = orchestrator.run({});
    REQUIRE(again.ok);
    CHECK(again.already_current);
}
