#pragma once

/// @file loader.hpp
/// @brief Sources of bundle definitions
///
/// A BundleLoader turns a bundle name into a definition. FactoryBundleLoader
/// builds definitions from registered callables; ManifestBundleLoader reads
/// `<name>.bundle.json` manifests from a directory.

#include "fwd.hpp"
#include "definition.hpp"
#include <ferry/core/error.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ferry_bundle {

// =============================================================================
// BundleLoader
// =============================================================================

/// Abstract source of bundle definitions
class BundleLoader {
public:
    virtual ~BundleLoader() = default;

    /// Load the definition of a bundle
    ///
    /// @param name Bundle name
    /// @return Definition, or InvalidConfiguration if the name is unknown
    [[nodiscard]] virtual ferry_core::Result<BundleDefinition> load(const std::string& name) const = 0;

    /// Loader name for debugging
    [[nodiscard]] virtual const char* name() const = 0;
};

// =============================================================================
// FactoryBundleLoader
// =============================================================================

/// Builds definitions from registered factory functions
class FactoryBundleLoader final : public BundleLoader {
public:
    using Factory = std::function<BundleDefinition()>;

    /// Register (or replace) the factory for a bundle name
    void register_factory(const std::string& name, Factory factory);

    /// Register a fixed definition under its own name
    void register_definition(BundleDefinition definition);

    [[nodiscard]] bool has_factory(const std::string& name) const;

    [[nodiscard]] ferry_core::Result<BundleDefinition> load(const std::string& name) const override;

    [[nodiscard]] const char* name() const override { return "FactoryBundleLoader"; }

private:
    std::map<std::string, Factory> m_factories;
};

// =============================================================================
// ManifestBundleLoader
// =============================================================================

/// Reads bundle manifests (`*.bundle.json`) from a directory
class ManifestBundleLoader final : public BundleLoader {
public:
    explicit ManifestBundleLoader(std::filesystem::path directory);

    /// Index every manifest in the directory by bundle name
    ///
    /// @param recursive Also scan subdirectories
    /// @return Number of manifests indexed
    [[nodiscard]] ferry_core::Result<std::size_t> scan(bool recursive = false);

    /// Load a bundle; unindexed names fall back to `<directory>/<name>.bundle.json`
    [[nodiscard]] ferry_core::Result<BundleDefinition> load(const std::string& name) const override;

    [[nodiscard]] const char* name() const override { return "ManifestBundleLoader"; }

    /// Names of indexed bundles
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }

    /// Check if a path looks like a bundle manifest
    [[nodiscard]] static bool is_manifest_path(const std::filesystem::path& path);

private:
    std::filesystem::path m_directory;
    std::map<std::string, std::filesystem::path> m_index;
};

} // namespace ferry_bundle
