/// @file manager.cpp
/// @brief Asset manager implementation

#include <ferry/bundle/manager.hpp>
#include <ferry/core/log.hpp>

#include <fstream>
#include <sstream>

namespace ferry_bundle {

// =============================================================================
// AssetManagerConfig Implementation
// =============================================================================

AssetManagerConfig AssetManagerConfig::with_asset_map(std::map<std::string, std::string> asset_map) const {
    AssetManagerConfig copy = *this;
    copy.m_asset_map = std::move(asset_map);
    return copy;
}

AssetManagerConfig AssetManagerConfig::with_allowed_bundle_names(std::vector<std::string> names) const {
    AssetManagerConfig copy = *this;
    copy.m_allowed_bundle_names = std::move(names);
    return copy;
}

AssetManagerConfig AssetManagerConfig::with_customized_bundle(
    const std::string& name,
    BundleCustomization customization) const {

    AssetManagerConfig copy = *this;
    copy.m_customized_bundles[name] = std::move(customization);
    return copy;
}

AssetManagerConfig AssetManagerConfig::with_publisher(ferry_publish::PublisherConfig publisher) const {
    AssetManagerConfig copy = *this;
    copy.m_publisher = std::move(publisher);
    return copy;
}

ferry_core::Result<AssetManagerConfig> AssetManagerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return ferry_core::Err<AssetManagerConfig>(
            ferry_core::Error(ferry_core::ErrorCode::ParseError,
                "Asset manager configuration must be a JSON object"));
    }

    AssetManagerConfig config;

    if (j.contains("assetMap")) {
        if (!j["assetMap"].is_object()) {
            return ferry_core::Err<AssetManagerConfig>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError, "'assetMap' must be an object"));
        }
        for (const auto& [from, to] : j["assetMap"].items()) {
            if (!to.is_string()) {
                return ferry_core::Err<AssetManagerConfig>(
                    ferry_core::Error(ferry_core::ErrorCode::ParseError,
                        "'assetMap' value for '" + from + "' must be a string"));
            }
            config.m_asset_map[from] = to.get<std::string>();
        }
    }

    if (j.contains("allowedBundles")) {
        if (!j["allowedBundles"].is_array()) {
            return ferry_core::Err<AssetManagerConfig>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError, "'allowedBundles' must be an array"));
        }
        for (const auto& name : j["allowedBundles"]) {
            if (!name.is_string()) {
                return ferry_core::Err<AssetManagerConfig>(
                    ferry_core::Error(ferry_core::ErrorCode::ParseError,
                        "'allowedBundles' entries must be strings"));
            }
            config.m_allowed_bundle_names.push_back(name.get<std::string>());
        }
    }

    if (j.contains("bundles")) {
        if (!j["bundles"].is_object()) {
            return ferry_core::Err<AssetManagerConfig>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError, "'bundles' must be an object"));
        }
        for (const auto& [name, value] : j["bundles"].items()) {
            auto customization = BundleCustomization::from_json(value, name);
            if (!customization) {
                return ferry_core::Err<AssetManagerConfig>(customization.error());
            }
            config.m_customized_bundles[name] = std::move(*customization);
        }
    }

    if (j.contains("publisher")) {
        auto publisher = ferry_publish::PublisherConfig::from_json(j["publisher"]);
        if (!publisher) {
            return ferry_core::Err<AssetManagerConfig>(publisher.error());
        }
        config.m_publisher = std::move(*publisher);
    }

    return ferry_core::Ok(std::move(config));
}

ferry_core::Result<AssetManagerConfig> AssetManagerConfig::from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ferry_core::Err<AssetManagerConfig>(
            ferry_core::Error(ferry_core::ErrorCode::IOError,
                "Failed to open configuration file: " + path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    try {
        return from_json(nlohmann::json::parse(buffer.str()));
    } catch (const nlohmann::json::parse_error& e) {
        return ferry_core::Err<AssetManagerConfig>(
            ferry_core::Error(ferry_core::ErrorCode::ParseError,
                std::string("JSON parse error: ") + e.what()).with_context("file", path.string()));
    }
}

// =============================================================================
// AssetManager Implementation
// =============================================================================

AssetManager::AssetManager(std::shared_ptr<const BundleLoader> loader,
                           std::shared_ptr<ferry_publish::PublishCache> publisher,
                           std::shared_ptr<const ferry_publish::FilesystemOps> filesystem,
                           AssetManagerConfig config)
    : m_config(std::move(config))
    , m_publisher(std::move(publisher))
    , m_filesystem(std::move(filesystem))
    , m_store(std::move(loader), m_config.customized_bundles())
    , m_resolver(m_store, m_publisher.get()) {
}

ferry_core::Result<void> AssetManager::register_bundle(
    const std::string& name,
    std::optional<int> script_position,
    std::optional<int> style_position) {

    ferry_core::LogScope scope("AssetManager::register_bundle", "ferry_bundle");
    std::lock_guard<std::mutex> lock(m_mutex);
    return register_locked(name, script_position, style_position);
}

ferry_core::Result<void> AssetManager::register_all_allowed() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_config.allowed_bundle_names().empty()) {
        return ferry_core::Err(ferry_core::Error(ferry_core::ErrorCode::InvalidState,
            "No allowed bundles are configured"));
    }

    for (const auto& name : m_config.allowed_bundle_names()) {
        auto result = register_locked(name, std::nullopt, std::nullopt);
        if (!result) {
            return result;
        }
    }
    return ferry_core::Ok();
}

bool AssetManager::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session.contains(name);
}

std::optional<BundleDefinition> AssetManager::get_bundle(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const RegistryEntry* entry = m_session.find(name);
    if (!entry) {
        return std::nullopt;
    }
    return entry->bundle;
}

RegistrationSession AssetManager::session() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session;
}

ferry_core::Result<FileCollection> AssetManager::get_script_files() const {
    auto collector = collect();
    if (!collector) {
        return ferry_core::Err<FileCollection>(collector.error());
    }
    return ferry_core::Ok(collector->script_files());
}

ferry_core::Result<FileCollection> AssetManager::get_style_files() const {
    auto collector = collect();
    if (!collector) {
        return ferry_core::Err<FileCollection>(collector.error());
    }
    return ferry_core::Ok(collector->style_files());
}

std::string AssetManager::format_dependency_tree(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return DependencyResolver::format_dependency_tree(m_session, name);
}

// =============================================================================
// Private Methods
// =============================================================================

ferry_core::Result<void> AssetManager::register_locked(
    const std::string& name,
    std::optional<int> script_position,
    std::optional<int> style_position) {

    auto allowed = check_allowed(name);
    if (!allowed) {
        return allowed;
    }

    RegistrationSession snapshot = m_session;

    auto result = m_resolver.register_bundle(m_session, name, script_position, style_position);
    if (!result) {
        m_session = std::move(snapshot);
        ferry_core::debug::record_error(result.error());
        ferry_core::log_structured(spdlog::level::warn, "ferry_bundle", "Bundle registration failed", {
            {"bundle", name},
            {"code", ferry_core::error_code_name(result.error().code())},
            {"error", ferry_core::build_error_chain(result.error())},
        });
        return result;
    }

    return ferry_core::Ok();
}

ferry_core::Result<void> AssetManager::check_allowed(const std::string& name) {
    const auto& allowed = m_config.allowed_bundle_names();
    if (allowed.empty()) {
        return ferry_core::Ok();
    }

    if (!m_allowed_closure) {
        // Allowed bundles and everything they depend on
        std::set<std::string> closure;
        std::vector<std::string> pending(allowed.begin(), allowed.end());

        while (!pending.empty()) {
            std::string current = std::move(pending.back());
            pending.pop_back();
            if (!closure.insert(current).second) {
                continue;
            }

            auto def = m_store.load(current);
            if (!def) {
                return ferry_core::Err(def.error());
            }
            for (const auto& dep : (*def)->dependencies) {
                if (!closure.count(dep)) {
                    pending.push_back(dep);
                }
            }
        }

        m_allowed_closure = std::move(closure);
    }

    if (!m_allowed_closure->count(name)) {
        return ferry_core::Err(ferry_core::BundleError::not_allowed(name));
    }
    return ferry_core::Ok();
}

ferry_core::Result<FileCollector> AssetManager::collect() const {
    RegistrationSession session = this->session();

    FileCollector collector(m_filesystem, m_config.asset_map());
    auto result = collector.collect_all(session);
    if (!result) {
        return ferry_core::Err<FileCollector>(result.error());
    }
    return ferry_core::Ok(std::move(collector));
}

} // namespace ferry_bundle
