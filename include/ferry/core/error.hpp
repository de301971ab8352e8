#pragma once

/// @file error.hpp
/// @brief Error handling types for ferry_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace ferry_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    PermissionDenied,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Bundle registration and file collection errors
struct BundleError {
    enum class Kind : std::uint8_t {
        CircularDependency,    // Bundle reached again while still being registered
        PositionConflict,      // Dependent requires an earlier position than configured
        MissingConfiguration,  // basePath/baseUrl/sourcePath not set
        InvalidFileEntry,      // Malformed file entry or options map
        FileNotFound,          // Local asset file missing on disk
        InvalidConfiguration,  // Bundle could not be loaded or parsed
        NotAllowed,            // Bundle outside the allowed set
    };

    Kind kind;
    std::string message;
    std::string bundle;
    std::string axis;  // For PositionConflict ("script" or "style")
    std::string path;  // For FileNotFound

    [[nodiscard]] static BundleError circular_dependency(const std::string& name) {
        return BundleError{Kind::CircularDependency,
            "A circular dependency is detected for bundle '" + name + "'", name, {}, {}};
    }

    [[nodiscard]] static BundleError position_conflict(const std::string& name, const std::string& axis) {
        return BundleError{Kind::PositionConflict,
            "A bundle that depends on '" + name + "' has a lower " + axis +
            " position than '" + name + "' is configured with", name, axis, {}};
    }

    [[nodiscard]] static BundleError missing_configuration(const std::string& name, const std::string& what) {
        return BundleError{Kind::MissingConfiguration,
            "Bundle '" + name + "' is missing configuration: " + what, name, {}, {}};
    }

    [[nodiscard]] static BundleError invalid_file_entry(const std::string& name, const std::string& reason) {
        return BundleError{Kind::InvalidFileEntry,
            "Bundle '" + name + "' has an invalid file entry: " + reason, name, {}, {}};
    }

    [[nodiscard]] static BundleError file_not_found(const std::string& name, const std::string& file) {
        return BundleError{Kind::FileNotFound,
            "Asset file of bundle '" + name + "' does not exist: " + file, name, {}, file};
    }

    [[nodiscard]] static BundleError invalid_configuration(const std::string& name, const std::string& reason) {
        return BundleError{Kind::InvalidConfiguration,
            "Invalid configuration of bundle '" + name + "': " + reason, name, {}, {}};
    }

    [[nodiscard]] static BundleError not_allowed(const std::string& name) {
        return BundleError{Kind::NotAllowed,
            "Bundle '" + name + "' is not allowed", name, {}, {}};
    }
};

/// Directory publication errors
struct PublishError {
    enum class Kind : std::uint8_t {
        MissingConfiguration,  // sourcePath/basePath/baseUrl not set
        FileNotFound,          // Source path does not exist
        PublishIO,             // Copy or symlink failed
    };

    Kind kind;
    std::string message;
    std::string source;
    std::string destination;

    [[nodiscard]] static PublishError missing_configuration(const std::string& what) {
        return PublishError{Kind::MissingConfiguration,
            "The " + what + " must be defined to publish a bundle", {}, {}};
    }

    [[nodiscard]] static PublishError file_not_found(const std::string& source_path) {
        return PublishError{Kind::FileNotFound,
            "The source path to be published does not exist: " + source_path, source_path, {}};
    }

    [[nodiscard]] static PublishError io(const std::string& source_path,
                                         const std::string& destination_path,
                                         const std::string& reason) {
        return PublishError{Kind::PublishIO,
            "Failed to publish '" + source_path + "' to '" + destination_path + "': " + reason,
            source_path, destination_path};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        BundleError,
        PublishError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(BundleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(PublishError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific bundle error kind
    [[nodiscard]] bool is_bundle_error(BundleError::Kind kind) const {
        const auto* err = as<BundleError>();
        return err != nullptr && err->kind == kind;
    }

    /// Check for a specific publish error kind
    [[nodiscard]] bool is_publish_error(PublishError::Kind kind) const {
        const auto* err = as<PublishError>();
        return err != nullptr && err->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(BundleError::Kind kind) {
        switch (kind) {
            case BundleError::Kind::CircularDependency: return ErrorCode::ValidationError;
            case BundleError::Kind::PositionConflict: return ErrorCode::ValidationError;
            case BundleError::Kind::MissingConfiguration: return ErrorCode::InvalidState;
            case BundleError::Kind::InvalidFileEntry: return ErrorCode::InvalidArgument;
            case BundleError::Kind::FileNotFound: return ErrorCode::NotFound;
            case BundleError::Kind::InvalidConfiguration: return ErrorCode::ParseError;
            case BundleError::Kind::NotAllowed: return ErrorCode::PermissionDenied;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(PublishError::Kind kind) {
        switch (kind) {
            case PublishError::Kind::MissingConfiguration: return ErrorCode::InvalidState;
            case PublishError::Kind::FileNotFound: return ErrorCode::NotFound;
            case PublishError::Kind::PublishIO: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace ferry_core
