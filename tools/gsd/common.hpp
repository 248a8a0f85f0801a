/**
 * gsd-opencode CLI - Common utilities and types
 */

#pragma once

#include <gsd/installer.hpp>
#include <gsd/path_utils.hpp>
#include <gsd/platform.hpp>
#include <gsd/scope.hpp>
#include <gsd/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace gsd::cli {

/**
 * Exit codes shared by all commands.
 */
constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitPermission = 2;
constexpr int kExitPathTraversal = 3;
constexpr int kExitInterrupted = 130;

inline int exit_code_for(const Error& err) {
    switch (err.code()) {
        case ErrorCode::PERMISSION_DENIED: return kExitPermission;
        case ErrorCode::PATH_TRAVERSAL: return kExitPathTraversal;
        case ErrorCode::INTERRUPTED: return kExitInterrupted;
        default: return kExitError;
    }
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string source;            // --source
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Library progress goes to stderr through spdlog so --json output on
 * stdout stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    static auto logger = spdlog::stderr_color_mt("gsd");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::optional<ErrorCode>& code = std::nullopt) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (code) {
            j["code"] = error_code_to_string(*code);
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline int report_error(const Error& err, bool json_mode) {
    print_error(err.message(), json_mode, err.code());
    return exit_code_for(err);
}

// The collector decides between immediate and collected output
inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_warnings(const std::vector<std::string>& msgs) {
    for (const auto& m : msgs) {
        print_warning(m);
    }
}

// SIGINT/SIGTERM arrived while a command was running
inline int report_interrupt(bool json_mode) {
    return report_error(Error(ErrorCode::INTERRUPTED, "interrupted"), json_mode);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Per-command setup: logging, warnings, interrupt handling.
 */
inline void begin_command(const GlobalOptions& opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);
    install_interrupt_handlers();
}

/**
 * Ask the user to type `expected` to proceed.
 */
inline bool confirm_typed(const std::string& prompt, const std::string& expected,
                          std::istream& in = std::cin, std::ostream& out = std::cerr) {
    out << prompt << " Type '" << expected << "' to continue: " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    return answer == expected;
}

/**
 * Located source bundle.
 */
struct BundleInfo {
    std::string dir;
    std::string version;
};

/**
 * Resolve the bundle directory.
 * Priority: --source > GSD_OPENCODE_SOURCE > <exe>/../share/gsd-opencode > <exe>/gsd-opencode
 */
inline Result<BundleInfo> resolve_bundle(const GlobalOptions& opts, const PackageLayout& layout) {
    std::vector<std::string> candidates;
    if (!opts.source.empty()) {
        candidates.push_back(expand_tilde(opts.source, get_home_directory()));
    } else if (auto env = get_env(layout.source_dir_env); env && !env->empty()) {
        candidates.push_back(expand_tilde(*env, get_home_directory()));
    } else {
        std::string exe_dir = get_executable_directory();
        if (!exe_dir.empty()) {
            candidates.push_back(join_path(join_path(get_parent_directory(exe_dir), "share"),
                                           layout.package_name));
            candidates.push_back(join_path(exe_dir, layout.package_name));
        }
    }

    for (const auto& dir : candidates) {
        if (!is_directory(dir)) continue;

        BundleInfo info;
        info.dir = dir;
        info.version = read_bundle_version(dir);
        if (info.version.empty()) {
            info.version = GSD_VERSION;
            print_warning("bundle has no package.json version, using " + info.version);
        }
        return Result<BundleInfo>::ok(info);
    }

    std::string where = candidates.empty() ? "(no candidates)" : candidates.front();
    return Result<BundleInfo>::err(
        Error(ErrorCode::SOURCE_MISSING,
              "source bundle not found at " + where + "; pass --source <dir>"));
}

/**
 * Pick the installation root for commands that act on an existing
 * installation. With no flag the installed scope is detected. An empty
 * optional means nothing is installed.
 */
inline Result<std::optional<InstallationRoot>> select_existing_root(const ScopeManager& scopes,
                                                                    bool global, bool local) {
    using SelectResult = Result<std::optional<InstallationRoot>>;

    if (global || local) {
        auto root = scopes.resolve_flags(global, local);
        if (root.isErr()) return SelectResult::err(root.error());
        return SelectResult::ok(root.value());
    }

    auto detected = scopes.detect_installed();
    if (detected.isErr()) return SelectResult::err(detected.error());
    return SelectResult::ok(detected.value().root);
}

inline nlohmann::json failures_to_json(const std::vector<FileFailure>& failures) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : failures) {
        arr.push_back({
            {"path", f.path},
            {"code", error_code_to_string(f.error.code())},
            {"error", f.error.message()},
        });
    }
    return arr;
}

} // namespace gsd::cli
