#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ferry_bundle module

#include <cstdint>
#include <string>

namespace ferry_bundle {

// =============================================================================
// Positions
// =============================================================================

/// Where collected files are placed in the rendered page
namespace position {
constexpr int head = 1;    ///< In the head section
constexpr int begin = 2;   ///< At the beginning of the body
constexpr int end = 3;     ///< At the end of the body
constexpr int ready = 4;   ///< Deferred to document ready
constexpr int load = 5;    ///< Deferred to window load
} // namespace position

/// Which collection a position or file belongs to
enum class Axis : std::uint8_t {
    Script,
    Style
};

[[nodiscard]] inline const char* axis_name(Axis axis) {
    return axis == Axis::Script ? "script" : "style";
}

// =============================================================================
// Definition Types
// =============================================================================

struct BundleDefinition;
struct BundleCustomization;

// =============================================================================
// Loading
// =============================================================================

class BundleLoader;
class FactoryBundleLoader;
class ManifestBundleLoader;
class BundleStore;

// =============================================================================
// Resolution
// =============================================================================

struct RegistryEntry;
class RegistrationSession;
class DependencyResolver;

// =============================================================================
// Collection
// =============================================================================

struct FileEntry;
class FileCollector;

// =============================================================================
// Facade
// =============================================================================

class AssetManagerConfig;
class AssetManager;

} // namespace ferry_bundle
