/// @file error.cpp
/// @brief Error handling implementation for ferry_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <ferry/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace ferry_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* bundle_error_kind_name(BundleError::Kind kind) {
    switch (kind) {
        case BundleError::Kind::CircularDependency: return "CircularDependency";
        case BundleError::Kind::PositionConflict: return "PositionConflict";
        case BundleError::Kind::MissingConfiguration: return "MissingConfiguration";
        case BundleError::Kind::InvalidFileEntry: return "InvalidFileEntry";
        case BundleError::Kind::FileNotFound: return "FileNotFound";
        case BundleError::Kind::InvalidConfiguration: return "InvalidConfiguration";
        case BundleError::Kind::NotAllowed: return "NotAllowed";
        default: return "Unknown";
    }
}

const char* publish_error_kind_name(PublishError::Kind kind) {
    switch (kind) {
        case PublishError::Kind::MissingConfiguration: return "MissingConfiguration";
        case PublishError::Kind::FileNotFound: return "FileNotFound";
        case PublishError::Kind::PublishIO: return "PublishIO";
        default: return "Unknown";
    }
}

/// Format bundle error with full context
std::string format_bundle_error(const BundleError& err) {
    std::ostringstream oss;
    oss << "[BundleError:" << bundle_error_kind_name(err.kind) << "] " << err.message;

    if (!err.bundle.empty()) {
        oss << " (bundle: " << err.bundle << ")";
    }
    if (!err.axis.empty()) {
        oss << " (axis: " << err.axis << ")";
    }
    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }

    return oss.str();
}

/// Format publish error with full context
std::string format_publish_error(const PublishError& err) {
    std::ostringstream oss;
    oss << "[PublishError:" << publish_error_kind_name(err.kind) << "] " << err.message;

    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }
    if (!err.destination.empty()) {
        oss << " (destination: " << err.destination << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, BundleError>) {
            oss << detail::format_bundle_error(err);
        } else if constexpr (std::is_same_v<T, PublishError>) {
            oss << detail::format_publish_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> bundle_errors{0};
    std::atomic<std::uint64_t> publish_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<BundleError>()) {
        s_error_stats.bundle_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<PublishError>()) {
        s_error_stats.publish_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.bundle_errors.store(0, std::memory_order_relaxed);
    s_error_stats.publish_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Bundle: " << s_error_stats.bundle_errors.load() << "\n"
        << "  Publish: " << s_error_stats.publish_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace ferry_core
