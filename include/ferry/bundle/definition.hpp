#pragma once

/// @file definition.hpp
/// @brief Asset bundle definitions and their JSON manifest format
///
/// A bundle names a set of script and style files, the bundles it depends
/// on, and where its sources are published. Manifests look like:
///
/// ```json
/// {
///   "name": "app",
///   "depends": ["jquery"],
///   "sourcePath": "@resources/app",
///   "basePath": "@public/assets",
///   "baseUrl": "/assets",
///   "js": ["app.js", ["legacy.js", 2], {"url": "init.js", "key": "init", "defer": true}],
///   "css": ["app.css"],
///   "jsOptions": {"defer": true},
///   "publishOptions": {"forceCopy": true}
/// }
/// ```

#include "fwd.hpp"
#include <ferry/core/error.hpp>
#include <ferry/publish/publish_cache.hpp>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry_bundle {

// =============================================================================
// BundleDefinition
// =============================================================================

/// A named collection of script/style files with dependency links
///
/// File entries are kept in their raw JSON form (a URL string, a
/// `[url, position?, options?]` array, or an object with `url`, `key`,
/// `position`, `options` and inline option keys); they are validated and
/// normalized when files are collected.
struct BundleDefinition {
    std::string name;                              ///< Unique bundle name
    std::vector<std::string> dependencies;         ///< Bundles that must come first
    std::vector<nlohmann::json> script_entries;    ///< Raw script file entries
    std::vector<nlohmann::json> style_entries;     ///< Raw style file entries
    nlohmann::json script_options = nlohmann::json::object();  ///< Defaults for every script
    nlohmann::json style_options = nlohmann::json::object();   ///< Defaults for every style
    std::optional<std::string> source_path;        ///< Directory to publish (alias allowed)
    std::optional<std::string> base_path;          ///< Published directory
    std::optional<std::string> base_url;           ///< URL of the published directory
    bool is_remote = false;                        ///< Served from a CDN, never published
    std::optional<int> script_position;            ///< Minimum script position
    std::optional<int> style_position;             ///< Minimum style position
    nlohmann::json publish_options = nlohmann::json::object();  ///< e.g. {"forceCopy": true}

    /// Position for one axis
    [[nodiscard]] const std::optional<int>& position(Axis axis) const {
        return axis == Axis::Script ? script_position : style_position;
    }

    [[nodiscard]] std::optional<int>& position(Axis axis) {
        return axis == Axis::Script ? script_position : style_position;
    }

    [[nodiscard]] const std::vector<nlohmann::json>& entries(Axis axis) const {
        return axis == Axis::Script ? script_entries : style_entries;
    }

    [[nodiscard]] const nlohmann::json& default_options(Axis axis) const {
        return axis == Axis::Script ? script_options : style_options;
    }

    /// Per-bundle force-copy override from publish_options
    [[nodiscard]] std::optional<bool> force_copy() const;

    /// Build the request handed to the PublishCache
    [[nodiscard]] ferry_publish::PublishRequest publish_request() const;

    /// An empty bundle (used for disabled bundles)
    [[nodiscard]] static BundleDefinition empty(const std::string& name);

    /// Parse from JSON
    ///
    /// @param j Manifest object
    /// @param fallback_name Name used when the manifest has no `name`
    [[nodiscard]] static ferry_core::Result<BundleDefinition> from_json(
        const nlohmann::json& j,
        const std::string& fallback_name = {});

    /// Load and parse a manifest file
    [[nodiscard]] static ferry_core::Result<BundleDefinition> from_file(
        const std::filesystem::path& path);

    /// Serialize to JSON
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Integer position from JSON, or nullopt when the value is not an integer
/// or does not fit an int
[[nodiscard]] std::optional<int> position_from_json(const nlohmann::json& value);

// =============================================================================
// BundleCustomization
// =============================================================================

/// Per-name adjustment applied when a bundle is loaded
///
/// JSON form: `false` disables the bundle; an object overrides manifest
/// fields of the loaded definition.
struct BundleCustomization {
    bool disabled = false;
    nlohmann::json overrides = nlohmann::json::object();

    /// Apply to a loaded definition
    [[nodiscard]] ferry_core::Result<BundleDefinition> apply(const BundleDefinition& loaded) const;

    [[nodiscard]] static ferry_core::Result<BundleCustomization> from_json(
        const nlohmann::json& j,
        const std::string& name);
};

} // namespace ferry_bundle
