#pragma once

#include <gsd/installer.hpp>
#include <gsd/platform.hpp>
#include <gsd/rewrite.hpp>
#include <gsd/scope.hpp>
#include <gsd/types.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace gsd::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("gsd_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return to_portable_path(path_.string()); }
    std::string sub(const std::string& rel) const { return join_path(path(), rel); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    return read_file_text(path).value_or("");
}

// Number of files make_bundle() produces, package.json included
constexpr size_t kBundleFiles = 8;

inline const std::string& binary_payload() {
    static const std::string payload("\x89PNG\r\n\x1a\n\0\0\0\x0dIHDR", 16);
    return payload;
}

// A bundle shaped like the published package
inline void make_bundle(const std::string& dir, const std::string& version) {
    write_text(join_path(dir, "agents/gsd-planner.md"),
               "# Planner\nRead @gsd-opencode/get-shit-done/workflows/plan.md\n");
    write_text(join_path(dir, "agents/gsd-executor.md"), "# Executor\n");
    write_text(join_path(dir, "commands/gsd/plan.md"),
               "Load ~/.config/opencode/get-shit-done/workflows/plan.md\n");
    write_text(join_path(dir, "commands/gsd/execute.md"), "Execute the plan.\n");
    write_text(join_path(dir, "get-shit-done/workflows/plan.md"),
               "Plan workflow " + version + "\n");
    write_text(join_path(dir, "get-shit-done/templates/logo.png"), binary_payload());
    write_text(join_path(dir, "skills/gsd-research/SKILL.md"), "Research skill\n");
    write_text(join_path(dir, "package.json"),
               "{\n  \"name\": \"gsd-opencode\",\n  \"version\": \"" + version + "\"\n}\n");
}

inline InstallationRoot local_root(const std::string& path) {
    InstallationRoot root;
    root.path = path;
    root.scope = Scope::Local;
    return root;
}

inline Installer make_installer(const std::string& bundle, const std::string& root) {
    return Installer(bundle, local_root(root), PackageLayout{}, make_path_rewriter(Scope::Local),
                     "./.opencode");
}

// Fresh install of `bundle` into `root` using the new command layout
inline InstallResult install_bundle(const std::string& bundle, const std::string& root,
                                    const std::string& command_dir = "commands") {
    return make_installer(bundle, root)
        .install(InstallMode::Fresh, command_dir, read_bundle_version(bundle));
}

} // namespace gsd::test
