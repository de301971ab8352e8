#pragma once

/// @file resolver.hpp
/// @brief Dependency registration with cycle detection and position propagation
///
/// DependencyResolver registers a bundle and its dependency closure into a
/// RegistrationSession. The session keeps entries in topological order:
/// every dependency precedes the bundles that depend on it.

#include "fwd.hpp"
#include "definition.hpp"
#include "store.hpp"
#include <ferry/core/error.hpp>
#include <ferry/publish/publish_cache.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry_bundle {

// =============================================================================
// RegistryEntry
// =============================================================================

/// A bundle after position resolution and publishing
struct RegistryEntry {
    BundleDefinition bundle;                                ///< Copy with resolved positions
    std::optional<ferry_publish::PublishedBundle> published;  ///< Set if the bundle was published
};

// =============================================================================
// RegistrationSession
// =============================================================================

/// Registry of one logical registration session
///
/// A plain value: copy it to snapshot, assign the copy back to restore.
class RegistrationSession {
public:
    [[nodiscard]] bool contains(const std::string& name) const {
        return m_entries.count(name) > 0;
    }

    [[nodiscard]] const RegistryEntry* find(const std::string& name) const;
    [[nodiscard]] RegistryEntry* find(const std::string& name);

    /// Bundle names in registration (topological) order
    [[nodiscard]] const std::vector<std::string>& registry_order() const noexcept { return m_order; }

    [[nodiscard]] std::size_t size() const noexcept { return m_order.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_order.empty(); }

    void clear();

private:
    friend class DependencyResolver;

    /// Append a fully registered bundle
    RegistryEntry& append(RegistryEntry entry);

    std::map<std::string, RegistryEntry> m_entries;
    std::vector<std::string> m_order;
};

// =============================================================================
// DependencyResolver
// =============================================================================

/// Registers bundles and their dependency closures
///
/// Failure leaves the session partially updated; callers that need
/// all-or-nothing behavior snapshot the session first (AssetManager does).
class DependencyResolver {
public:
    /// @param store Source of bundle definitions
    /// @param publisher Publish cache, or nullptr to skip publishing
    DependencyResolver(BundleStore& store, ferry_publish::PublishCache* publisher);

    /// Register a bundle and its dependency closure
    ///
    /// @param session Registry to update
    /// @param name Bundle to register
    /// @param script_position Minimum script position required by the caller
    /// @param style_position Minimum style position required by the caller
    [[nodiscard]] ferry_core::Result<void> register_bundle(
        RegistrationSession& session,
        const std::string& name,
        std::optional<int> script_position = std::nullopt,
        std::optional<int> style_position = std::nullopt);

    /// Format the registered dependency tree of a bundle
    [[nodiscard]] static std::string format_dependency_tree(
        const RegistrationSession& session,
        const std::string& root);

private:
    [[nodiscard]] ferry_core::Result<void> register_recursive(
        RegistrationSession& session,
        const std::string& name,
        std::optional<int> script_position,
        std::optional<int> style_position,
        std::set<std::string>& visiting);

    [[nodiscard]] ferry_core::Result<RegistryEntry> create_entry(const std::string& name);

    static void format_tree_recursive(
        const RegistrationSession& session,
        const std::string& name,
        std::string& output,
        const std::string& prefix,
        std::set<std::string>& visited);

    BundleStore& m_store;
    ferry_publish::PublishCache* m_publisher;
};

} // namespace ferry_bundle
