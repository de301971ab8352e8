#pragma once

/// @file path_resolver.hpp
/// @brief Alias and relative path resolution
///
/// Paths handed to the publisher may be absolute, relative to a project
/// root, or start with an alias such as `@assets/vendor/jquery`. A
/// PathResolver turns any of these into an absolute path.

#include "fwd.hpp"
#include <ferry/core/error.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace ferry_publish {

// =============================================================================
// PathResolver
// =============================================================================

/// Resolves alias or relative paths to absolute paths
class PathResolver {
public:
    virtual ~PathResolver() = default;

    /// Resolve an alias or path
    ///
    /// @param alias_or_path Path, possibly starting with an `@alias`
    /// @return Absolute path, or error if an alias is unknown
    [[nodiscard]] virtual ferry_core::Result<std::string> resolve(
        const std::string& alias_or_path) const = 0;
};

// =============================================================================
// AliasPathResolver
// =============================================================================

/// PathResolver backed by a table of `@alias` -> path mappings
///
/// - `@alias` and `@alias/rest` are replaced by the longest registered alias
/// - alias values may themselves start with another alias
/// - absolute paths pass through unchanged
/// - relative paths are joined to the root directory
class AliasPathResolver : public PathResolver {
public:
    /// Construct with the directory relative paths are resolved against
    explicit AliasPathResolver(std::filesystem::path root = std::filesystem::current_path());

    /// Register an alias (a leading '@' is added if missing)
    void set_alias(const std::string& alias, const std::string& path);

    /// Remove an alias
    /// @return true if it was registered
    bool remove_alias(const std::string& alias);

    [[nodiscard]] bool has_alias(const std::string& alias) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    [[nodiscard]] ferry_core::Result<std::string> resolve(
        const std::string& alias_or_path) const override;

private:
    [[nodiscard]] ferry_core::Result<std::string> resolve_alias(
        const std::string& path, int depth) const;

    static std::string normalize_alias(const std::string& alias);

    std::filesystem::path m_root;
    std::map<std::string, std::string> m_aliases;
};

} // namespace ferry_publish
