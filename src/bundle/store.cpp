/// @file store.cpp
/// @brief Bundle store implementation

#include <ferry/bundle/store.hpp>
#include <ferry/core/log.hpp>

#include <exception>

namespace ferry_bundle {

BundleStore::BundleStore(std::shared_ptr<const BundleLoader> loader,
                         std::map<std::string, BundleCustomization> customizations)
    : m_loader(std::move(loader))
    , m_customizations(std::move(customizations)) {
}

ferry_core::Result<BundleStore::DefinitionPtr> BundleStore::load(const std::string& name) {
    std::promise<ferry_core::Result<DefinitionPtr>> promise;
    std::shared_future<ferry_core::Result<DefinitionPtr>> pending;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_loaded.find(name);
        if (it != m_loaded.end()) {
            return ferry_core::Ok(it->second);
        }

        auto flight = m_in_flight.find(name);
        if (flight != m_in_flight.end()) {
            pending = flight->second;
        } else {
            owner = true;
            pending = promise.get_future().share();
            m_in_flight.emplace(name, pending);
        }
    }

    if (!owner) {
        return pending.get();
    }

    // Waiters share this flight, so it must be settled on every exit path
    auto result = [&]() -> ferry_core::Result<DefinitionPtr> {
        try {
            return load_uncached(name);
        } catch (const std::exception& e) {
            ferry_core::bundle_logger()->warn("Loading bundle '{}' threw: {}", name, e.what());
            return ferry_core::Err<DefinitionPtr>(ferry_core::BundleError::invalid_configuration(
                name, std::string("loader threw: ") + e.what()));
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_in_flight.erase(name);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (result) {
            m_loaded.emplace(name, *result);
        }
        m_in_flight.erase(name);
    }

    promise.set_value(result);
    return result;
}

bool BundleStore::is_loaded(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.count(name) > 0;
}

std::size_t BundleStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.size();
}

ferry_core::Result<BundleStore::DefinitionPtr> BundleStore::load_uncached(const std::string& name) const {
    auto custom = m_customizations.find(name);

    if (custom != m_customizations.end() && custom->second.disabled) {
        ferry_core::bundle_logger()->debug("Bundle '{}' is disabled", name);
        return ferry_core::Ok<DefinitionPtr>(
            std::make_shared<const BundleDefinition>(BundleDefinition::empty(name)));
    }

    if (!m_loader) {
        return ferry_core::Err<DefinitionPtr>(
            ferry_core::BundleError::invalid_configuration(name, "no bundle loader configured"));
    }

    auto loaded = m_loader->load(name);
    if (!loaded) {
        return ferry_core::Err<DefinitionPtr>(loaded.error());
    }

    if (custom != m_customizations.end()) {
        auto applied = custom->second.apply(*loaded);
        if (!applied) {
            return ferry_core::Err<DefinitionPtr>(applied.error());
        }
        loaded = std::move(applied);
    }

    ferry_core::bundle_logger()->debug("Loaded bundle '{}' via {} ({} dependencies)",
        name, m_loader->name(), loaded->dependencies.size());

    return ferry_core::Ok<DefinitionPtr>(
        std::make_shared<const BundleDefinition>(std::move(*loaded)));
}

} // namespace ferry_bundle
