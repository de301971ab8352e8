#pragma once

/// @file store.hpp
/// @brief Process-wide cache of loaded bundle definitions

#include "fwd.hpp"
#include "definition.hpp"
#include "loader.hpp"
#include <ferry/core/error.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ferry_bundle {

// =============================================================================
// BundleStore
// =============================================================================

/// Loads each bundle at most once and shares the definition
///
/// Customizations are applied on load: a disabled bundle becomes an empty
/// definition without consulting the loader. Definitions are immutable
/// once stored.
///
/// Thread-safety: load() may be called concurrently. Concurrent loads of the
/// same name run the loader once; failed loads are not cached.
class BundleStore {
public:
    using DefinitionPtr = std::shared_ptr<const BundleDefinition>;

    explicit BundleStore(std::shared_ptr<const BundleLoader> loader,
                         std::map<std::string, BundleCustomization> customizations = {});

    // Non-copyable, non-movable (contains std::mutex)
    BundleStore(const BundleStore&) = delete;
    BundleStore& operator=(const BundleStore&) = delete;
    BundleStore(BundleStore&&) = delete;
    BundleStore& operator=(BundleStore&&) = delete;

    /// Get the definition of a bundle, loading it on first use
    [[nodiscard]] ferry_core::Result<DefinitionPtr> load(const std::string& name);

    /// Check if a bundle has been loaded
    [[nodiscard]] bool is_loaded(const std::string& name) const;

    /// Number of loaded bundles
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const std::map<std::string, BundleCustomization>& customizations() const noexcept {
        return m_customizations;
    }

private:
    [[nodiscard]] ferry_core::Result<DefinitionPtr> load_uncached(const std::string& name) const;

    std::shared_ptr<const BundleLoader> m_loader;
    const std::map<std::string, BundleCustomization> m_customizations;

    mutable std::mutex m_mutex;  // Protects m_loaded and m_in_flight
    std::map<std::string, DefinitionPtr> m_loaded;
    std::map<std::string, std::shared_future<ferry_core::Result<DefinitionPtr>>> m_in_flight;
};

} // namespace ferry_bundle
