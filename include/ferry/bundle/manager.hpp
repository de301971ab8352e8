#pragma once

/// @file manager.hpp
/// @brief Asset manager facade
///
/// AssetManager ties the pieces together: bundles are loaded through a
/// BundleStore, registered by a DependencyResolver (publishing through a
/// PublishCache), and collected into script/style lists by a FileCollector.
///
/// Usage:
/// @code
/// auto loader = std::make_shared<ferry_bundle::ManifestBundleLoader>("bundles");
/// auto scan = loader->scan();
/// ferry_bundle::AssetManager manager(loader, publisher, filesystem, config);
/// auto result = manager.register_bundle("app");
/// auto scripts = manager.get_script_files();
/// @endcode

#include "fwd.hpp"
#include "collector.hpp"
#include "definition.hpp"
#include "loader.hpp"
#include "resolver.hpp"
#include "store.hpp"
#include <ferry/core/error.hpp>
#include <ferry/publish/config.hpp>
#include <ferry/publish/filesystem.hpp>
#include <ferry/publish/publish_cache.hpp>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry_bundle {

// =============================================================================
// AssetManagerConfig
// =============================================================================

/// Asset manager settings
///
/// Values are immutable: every `with_*` returns a copy with one field changed.
///
/// JSON form:
/// ```json
/// {
///   "assetMap": {"jquery.js": "https://cdn.example.com/jquery.min.js"},
///   "allowedBundles": ["app"],
///   "bundles": {"legacy": false, "jquery": {"cdn": true}},
///   "publisher": {"linkAssets": true}
/// }
/// ```
class AssetManagerConfig {
public:
    AssetManagerConfig() = default;

    /// Asset path suffix -> replacement URL
    [[nodiscard]] const std::map<std::string, std::string>& asset_map() const noexcept { return m_asset_map; }

    /// Bundles that may be registered (empty allows everything)
    [[nodiscard]] const std::vector<std::string>& allowed_bundle_names() const noexcept {
        return m_allowed_bundle_names;
    }

    /// Per-bundle overrides applied at load time
    [[nodiscard]] const std::map<std::string, BundleCustomization>& customized_bundles() const noexcept {
        return m_customized_bundles;
    }

    /// Publisher section, when the configuration carried one
    [[nodiscard]] const ferry_publish::PublisherConfig& publisher() const noexcept { return m_publisher; }

    [[nodiscard]] AssetManagerConfig with_asset_map(std::map<std::string, std::string> asset_map) const;
    [[nodiscard]] AssetManagerConfig with_allowed_bundle_names(std::vector<std::string> names) const;
    [[nodiscard]] AssetManagerConfig with_customized_bundle(const std::string& name,
                                                            BundleCustomization customization) const;
    [[nodiscard]] AssetManagerConfig with_publisher(ferry_publish::PublisherConfig publisher) const;

    /// Parse from JSON
    [[nodiscard]] static ferry_core::Result<AssetManagerConfig> from_json(const nlohmann::json& j);

    /// Load and parse a JSON configuration file
    [[nodiscard]] static ferry_core::Result<AssetManagerConfig> from_file(const std::filesystem::path& path);

private:
    std::map<std::string, std::string> m_asset_map;
    std::vector<std::string> m_allowed_bundle_names;
    std::map<std::string, BundleCustomization> m_customized_bundles;
    ferry_publish::PublisherConfig m_publisher;
};

// =============================================================================
// AssetManager
// =============================================================================

/// Registers bundles and exposes their ordered files
///
/// Registration is all-or-nothing: a failed register_bundle() leaves the
/// registry as it was before the call. Published directories are kept.
///
/// Thread-safety: all methods lock an internal mutex.
class AssetManager {
public:
    /// @param loader Source of bundle definitions
    /// @param publisher Publish cache shared across managers (may be null)
    /// @param filesystem Used to check that local files exist
    /// @param config Manager settings
    AssetManager(std::shared_ptr<const BundleLoader> loader,
                 std::shared_ptr<ferry_publish::PublishCache> publisher,
                 std::shared_ptr<const ferry_publish::FilesystemOps> filesystem,
                 AssetManagerConfig config = {});

    // Non-copyable, non-movable (contains std::mutex)
    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;
    AssetManager(AssetManager&&) = delete;
    AssetManager& operator=(AssetManager&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a bundle and its dependencies
    ///
    /// @param script_position Minimum script position for the bundle
    /// @param style_position Minimum style position for the bundle
    [[nodiscard]] ferry_core::Result<void> register_bundle(
        const std::string& name,
        std::optional<int> script_position = std::nullopt,
        std::optional<int> style_position = std::nullopt);

    /// Register every allowed bundle
    [[nodiscard]] ferry_core::Result<void> register_all_allowed();

    [[nodiscard]] bool is_registered(const std::string& name) const;

    /// Copy of a registered bundle with resolved positions and publish paths
    [[nodiscard]] std::optional<BundleDefinition> get_bundle(const std::string& name) const;

    /// Snapshot of the current registry
    [[nodiscard]] RegistrationSession session() const;

    // =========================================================================
    // Files
    // =========================================================================

    /// Script files of all registered bundles in dependency order
    [[nodiscard]] ferry_core::Result<FileCollection> get_script_files() const;

    /// Style files of all registered bundles in dependency order
    [[nodiscard]] ferry_core::Result<FileCollection> get_style_files() const;

    // =========================================================================
    // Debugging
    // =========================================================================

    [[nodiscard]] std::string format_dependency_tree(const std::string& name) const;

    [[nodiscard]] const AssetManagerConfig& config() const noexcept { return m_config; }

private:
    [[nodiscard]] ferry_core::Result<void> register_locked(
        const std::string& name,
        std::optional<int> script_position,
        std::optional<int> style_position);

    [[nodiscard]] ferry_core::Result<void> check_allowed(const std::string& name);

    [[nodiscard]] ferry_core::Result<FileCollector> collect() const;

    const AssetManagerConfig m_config;
    std::shared_ptr<ferry_publish::PublishCache> m_publisher;
    std::shared_ptr<const ferry_publish::FilesystemOps> m_filesystem;
    BundleStore m_store;
    DependencyResolver m_resolver;

    mutable std::mutex m_mutex;  // Protects m_session and m_allowed_closure
    RegistrationSession m_session;
    std::optional<std::set<std::string>> m_allowed_closure;
};

} // namespace ferry_bundle
