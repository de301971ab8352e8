#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ferry_core module

#include <cstdint>

namespace ferry_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct BundleError;
struct PublishError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace ferry_core
