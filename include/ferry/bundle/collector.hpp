#pragma once

/// @file collector.hpp
/// @brief Ordered, deduplicated script/style file collection

#include "fwd.hpp"
#include "definition.hpp"
#include "resolver.hpp"
#include <ferry/core/error.hpp>
#include <ferry/publish/filesystem.hpp>

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace ferry_bundle {

// =============================================================================
// FileEntry
// =============================================================================

/// A collected script or style file
struct FileEntry {
    std::string url;                                 ///< Resolved URL
    int position = position::end;                    ///< Page position
    nlohmann::json options = nlohmann::json::object();  ///< Merged options

    bool operator==(const FileEntry& other) const {
        return url == other.url && position == other.position && options == other.options;
    }
};

/// Key (explicit key or URL) to entry, in insertion order
using FileCollection = nlohmann::ordered_map<std::string, FileEntry>;

// =============================================================================
// FileCollector
// =============================================================================

/// Walks a registration session and folds bundle files into two collections
///
/// Dependencies are collected before their dependents. Re-using a key
/// replaces the entry in place (last write wins, first position kept).
class FileCollector {
public:
    /// @param filesystem Used to check that local files exist
    /// @param asset_map Remap table: asset path suffix -> replacement URL
    explicit FileCollector(std::shared_ptr<const ferry_publish::FilesystemOps> filesystem,
                           std::map<std::string, std::string> asset_map = {});

    /// Collect the files of a registered bundle and its dependencies
    [[nodiscard]] ferry_core::Result<void> collect(
        const RegistrationSession& session,
        const std::string& name);

    /// Collect every bundle of a session in registration order
    [[nodiscard]] ferry_core::Result<void> collect_all(const RegistrationSession& session);

    [[nodiscard]] const FileCollection& script_files() const noexcept { return m_scripts; }
    [[nodiscard]] const FileCollection& style_files() const noexcept { return m_styles; }

    /// Forget all collected files
    void clear();

    /// Look up an asset in the remap table
    ///
    /// An exact key match wins. Otherwise a relative asset is prefixed with
    /// the bundle's source path and the longest matching key suffix is used.
    [[nodiscard]] std::optional<std::string> resolve_remap(
        const BundleDefinition& bundle,
        const std::string& asset) const;

    /// Resolve the URL of one bundle asset
    [[nodiscard]] ferry_core::Result<std::string> resolve_url(
        const BundleDefinition& bundle,
        const std::string& asset) const;

    /// True unless the URL is protocol-relative or has a scheme
    [[nodiscard]] static bool is_relative_url(const std::string& url);

private:
    struct NormalizedEntry {
        std::string url;
        std::optional<std::string> key;
        std::optional<int> position;
        nlohmann::json options = nlohmann::json::object();
    };

    [[nodiscard]] ferry_core::Result<void> collect_recursive(
        const RegistrationSession& session,
        const std::string& name);

    [[nodiscard]] ferry_core::Result<void> collect_axis(const BundleDefinition& bundle, Axis axis);

    [[nodiscard]] static ferry_core::Result<NormalizedEntry> normalize(
        const BundleDefinition& bundle,
        const nlohmann::json& raw);

    [[nodiscard]] static ferry_core::Result<void> merge_default_options(
        const BundleDefinition& bundle,
        Axis axis,
        nlohmann::json& options);

    std::shared_ptr<const ferry_publish::FilesystemOps> m_filesystem;
    std::map<std::string, std::string> m_asset_map;

    FileCollection m_scripts;
    FileCollection m_styles;
    std::set<std::string> m_collected;
};

} // namespace ferry_bundle
