#pragma once

/// @file config.hpp
/// @brief Immutable publisher configuration

#include "fwd.hpp"
#include <ferry/core/error.hpp>

#include <nlohmann/json.hpp>
#include <filesystem>

namespace ferry_publish {

// =============================================================================
// PublisherConfig
// =============================================================================

/// Publisher settings
///
/// Values are immutable: every `with_*` returns a copy with one field changed.
class PublisherConfig {
public:
    static constexpr std::filesystem::perms DEFAULT_DIR_MODE = static_cast<std::filesystem::perms>(0775);
    static constexpr std::filesystem::perms DEFAULT_FILE_MODE = static_cast<std::filesystem::perms>(0755);

    PublisherConfig() = default;

    /// Copy even when the destination directory already exists
    [[nodiscard]] bool force_copy() const noexcept { return m_force_copy; }

    /// Publish with symbolic links instead of copies
    [[nodiscard]] bool link_assets() const noexcept { return m_link_assets; }

    /// Permissions for newly created directories
    [[nodiscard]] std::filesystem::perms dir_mode() const noexcept { return m_dir_mode; }

    /// Permissions for newly copied files
    [[nodiscard]] std::filesystem::perms file_mode() const noexcept { return m_file_mode; }

    /// Custom directory-name hash (empty when the default is used)
    [[nodiscard]] const HashCallback& hash_callback() const noexcept { return m_hash_callback; }

    [[nodiscard]] PublisherConfig with_force_copy(bool force_copy) const;
    [[nodiscard]] PublisherConfig with_link_assets(bool link_assets) const;
    [[nodiscard]] PublisherConfig with_dir_mode(std::filesystem::perms mode) const;
    [[nodiscard]] PublisherConfig with_file_mode(std::filesystem::perms mode) const;
    [[nodiscard]] PublisherConfig with_hash_callback(HashCallback callback) const;

    /// Parse from JSON
    ///
    /// Recognized keys: `forceCopy`, `linkAssets` (booleans), `dirMode`,
    /// `fileMode` (integers, or octal strings such as "0775").
    [[nodiscard]] static ferry_core::Result<PublisherConfig> from_json(const nlohmann::json& j);

private:
    bool m_force_copy = false;
    bool m_link_assets = false;
    std::filesystem::perms m_dir_mode = DEFAULT_DIR_MODE;
    std::filesystem::perms m_file_mode = DEFAULT_FILE_MODE;
    HashCallback m_hash_callback;
};

} // namespace ferry_publish
