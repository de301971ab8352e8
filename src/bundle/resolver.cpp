/// @file resolver.cpp
/// @brief Dependency resolver implementation

#include <ferry/bundle/resolver.hpp>
#include <ferry/core/log.hpp>

namespace ferry_bundle {

// =============================================================================
// RegistrationSession Implementation
// =============================================================================

const RegistryEntry* RegistrationSession::find(const std::string& name) const {
    auto it = m_entries.find(name);
    return it != m_entries.end() ? &it->second : nullptr;
}

RegistryEntry* RegistrationSession::find(const std::string& name) {
    auto it = m_entries.find(name);
    return it != m_entries.end() ? &it->second : nullptr;
}

void RegistrationSession::clear() {
    m_entries.clear();
    m_order.clear();
}

RegistryEntry& RegistrationSession::append(RegistryEntry entry) {
    auto name = entry.bundle.name;
    m_order.push_back(name);
    return m_entries.insert_or_assign(name, std::move(entry)).first->second;
}

// =============================================================================
// DependencyResolver Implementation
// =============================================================================

DependencyResolver::DependencyResolver(BundleStore& store, ferry_publish::PublishCache* publisher)
    : m_store(store)
    , m_publisher(publisher) {
}

ferry_core::Result<void> DependencyResolver::register_bundle(
    RegistrationSession& session,
    const std::string& name,
    std::optional<int> script_position,
    std::optional<int> style_position) {

    std::set<std::string> visiting;
    return register_recursive(session, name, script_position, style_position, visiting);
}

ferry_core::Result<void> DependencyResolver::register_recursive(
    RegistrationSession& session,
    const std::string& name,
    std::optional<int> script_position,
    std::optional<int> style_position,
    std::set<std::string>& visiting) {

    if (visiting.count(name)) {
        return ferry_core::Err(ferry_core::BundleError::circular_dependency(name));
    }

    if (!session.contains(name)) {
        auto created = create_entry(name);
        if (!created) {
            return ferry_core::Err(created.error());
        }

        // Dependencies see this bundle's own positions
        const auto deps = created->bundle.dependencies;
        const auto own_script = created->bundle.script_position;
        const auto own_style = created->bundle.style_position;

        visiting.insert(name);
        for (const auto& dep : deps) {
            auto result = register_recursive(session, dep, own_script, own_style, visiting);
            if (!result) {
                return result;
            }
        }
        visiting.erase(name);

        session.append(std::move(*created));
        ferry_core::bundle_logger()->debug("Registered bundle '{}' ({} dependencies)", name, deps.size());
    }

    if (!script_position && !style_position) {
        return ferry_core::Ok();
    }

    RegistryEntry* entry = session.find(name);
    bool changed = false;

    const std::pair<Axis, std::optional<int>> requirements[] = {
        {Axis::Script, script_position},
        {Axis::Style, style_position},
    };

    for (const auto& [axis, required] : requirements) {
        if (!required) {
            continue;
        }

        auto& current = entry->bundle.position(axis);
        if (!current) {
            current = required;
            changed = true;
        } else if (*current > *required) {
            return ferry_core::Err(ferry_core::BundleError::position_conflict(name, axis_name(axis)));
        } else if (*current < *required) {
            ferry_core::bundle_logger()->debug("Bundle '{}' {} position tightened {} -> {}",
                name, axis_name(axis), *current, *required);
            current = required;
            changed = true;
        }
    }

    if (!changed) {
        return ferry_core::Ok();
    }

    // Copy before recursing; the entry map may be modified below
    const auto deps = entry->bundle.dependencies;
    const auto new_script = entry->bundle.script_position;
    const auto new_style = entry->bundle.style_position;

    visiting.insert(name);
    for (const auto& dep : deps) {
        auto result = register_recursive(session, dep, new_script, new_style, visiting);
        if (!result) {
            return result;
        }
    }
    visiting.erase(name);

    return ferry_core::Ok();
}

ferry_core::Result<RegistryEntry> DependencyResolver::create_entry(const std::string& name) {
    auto loaded = m_store.load(name);
    if (!loaded) {
        return ferry_core::Err<RegistryEntry>(loaded.error());
    }

    RegistryEntry entry;
    entry.bundle = **loaded;

    if (m_publisher && !entry.bundle.is_remote && entry.bundle.source_path) {
        auto published = m_publisher->publish(entry.bundle.publish_request());
        if (!published) {
            return ferry_core::Err<RegistryEntry>(
                ferry_core::Error(published.error()).with_context("bundle", name));
        }
        entry.bundle.base_path = published->path;
        entry.bundle.base_url = published->url;
        entry.published = std::move(*published);
    }

    return ferry_core::Ok(std::move(entry));
}

// =============================================================================
// Debugging
// =============================================================================

std::string DependencyResolver::format_dependency_tree(
    const RegistrationSession& session,
    const std::string& root) {

    std::string output;
    std::set<std::string> visited;
    format_tree_recursive(session, root, output, "", visited);
    return output;
}

void DependencyResolver::format_tree_recursive(
    const RegistrationSession& session,
    const std::string& name,
    std::string& output,
    const std::string& prefix,
    std::set<std::string>& visited) {

    bool already_visited = visited.count(name) > 0;
    visited.insert(name);

    const RegistryEntry* entry = session.find(name);
    if (!entry) {
        output += name + " (NOT REGISTERED)\n";
        return;
    }

    const auto& bundle = entry->bundle;
    output += name;
    if (bundle.script_position) {
        output += " js@" + std::to_string(*bundle.script_position);
    }
    if (bundle.style_position) {
        output += " css@" + std::to_string(*bundle.style_position);
    }
    if (bundle.is_remote) {
        output += " [cdn]";
    }

    if (already_visited) {
        output += " (see above)\n";
        return;
    }
    output += "\n";

    const auto& deps = bundle.dependencies;
    for (std::size_t i = 0; i < deps.size(); ++i) {
        bool is_last = (i == deps.size() - 1);
        std::string new_prefix = prefix + (is_last ? "  " : "| ");
        output += prefix + (is_last ? "`-" : "|-");
        format_tree_recursive(session, deps[i], output, new_prefix, visited);
    }
}

} // namespace ferry_bundle
