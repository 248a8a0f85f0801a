#pragma once

/**
 * @file types.hpp
 * @brief Core value types shared by every gsd component
 *
 * - Error / ErrorCode / Result<T>: error handling for fallible operations
 * - Scope, StructureState: installation scope and on-disk layout
 * - PackageLayout: the constants describing the managed bundle
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gsd {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for gsd operations
 */
enum class ErrorCode {
    // Scope / path resolution
    INVALID_SCOPE,
    PATH_TRAVERSAL,

    // System / IO
    PERMISSION_DENIED,
    IO_ERROR,
    WRITE_FAILED,
    INTERRUPTED,

    // Installation state
    NOT_INSTALLED,
    MANIFEST_CORRUPT,
    FILE_MISSING,
    FILE_CORRUPTED,
    STRUCTURE_CONFLICT,
    SOURCE_MISSING,
    VERSION_MISMATCH,

    // Update / config
    VERSION_RESOLUTION_FAILED,
    CONFIG_INVALID,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_SCOPE: return "invalid_scope";
        case ErrorCode::PATH_TRAVERSAL: return "path_traversal";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::WRITE_FAILED: return "write_failed";
        case ErrorCode::INTERRUPTED: return "interrupted";
        case ErrorCode::NOT_INSTALLED: return "not_installed";
        case ErrorCode::MANIFEST_CORRUPT: return "manifest_corrupt";
        case ErrorCode::FILE_MISSING: return "file_missing";
        case ErrorCode::FILE_CORRUPTED: return "file_corrupted";
        case ErrorCode::STRUCTURE_CONFLICT: return "structure_conflict";
        case ErrorCode::SOURCE_MISSING: return "source_missing";
        case ErrorCode::VERSION_MISMATCH: return "version_mismatch";
        case ErrorCode::VERSION_RESOLUTION_FAILED: return "version_resolution_failed";
        case ErrorCode::CONFIG_INVALID: return "config_invalid";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// Per-file failure in a multi-file operation
struct FileFailure {
    std::string path;           // relative path
    Error error;
};

// ============================================================================
// Scope
// ============================================================================

enum class Scope {
    Global,
    Local
};

inline const char* scope_to_string(Scope s) {
    switch (s) {
        case Scope::Global: return "global";
        case Scope::Local: return "local";
        default: return "unknown";
    }
}

std::optional<Scope> parse_scope(const std::string& str);

// ============================================================================
// Structure State
// ============================================================================

// Which of the two historical command-directory layouts is present.
enum class StructureState {
    None,
    Old,
    New,
    Dual
};

inline const char* structure_to_string(StructureState s) {
    switch (s) {
        case StructureState::None: return "none";
        case StructureState::Old: return "old";
        case StructureState::New: return "new";
        case StructureState::Dual: return "dual";
        default: return "unknown";
    }
}

// ============================================================================
// Package Layout
// ============================================================================

/**
 * @brief Constants describing the managed bundle and its on-disk layout
 *
 * Passed by value into every component so tests can substitute alternate
 * directory names and namespace prefixes.
 */
struct PackageLayout {
    std::string package_name = "gsd-opencode";
    std::string beta_package_name = "@rokicool/gsd-opencode";

    std::string global_config_dir = ".config/opencode";   // relative to $HOME
    std::string local_config_dir = ".opencode";           // relative to $PWD
    std::string config_dir_env = "OPENCODE_CONFIG_DIR";
    std::string source_dir_env = "GSD_OPENCODE_SOURCE";

    std::string old_command_dir = "command";
    std::string new_command_dir = "commands";
    std::string command_namespace = "gsd";

    std::string agents_dir = "agents";
    std::string owned_dir = "get-shit-done";
    std::string skills_dir = "skills";

    std::string manifest_file = "get-shit-done/INSTALLED_FILES.json";
    std::string version_file = "get-shit-done/VERSION";
    std::string backup_dir = ".backups";

    std::vector<std::string> namespaces = {
        "agents/gsd-",
        "command/gsd/",
        "commands/gsd/",
        "skills/gsd-",
        "get-shit-done/",
    };

    std::vector<std::string> rewrite_extensions = {".md"};
};

} // namespace gsd
