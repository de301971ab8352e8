/// @file loader.cpp
/// @brief Bundle loader implementations

#include <ferry/bundle/loader.hpp>
#include <ferry/core/log.hpp>

namespace ferry_bundle {

namespace {

constexpr const char* MANIFEST_SUFFIX = ".bundle.json";

} // anonymous namespace

// =============================================================================
// FactoryBundleLoader Implementation
// =============================================================================

void FactoryBundleLoader::register_factory(const std::string& name, Factory factory) {
    m_factories[name] = std::move(factory);
}

void FactoryBundleLoader::register_definition(BundleDefinition definition) {
    auto name = definition.name;
    m_factories[name] = [def = std::move(definition)]() { return def; };
}

bool FactoryBundleLoader::has_factory(const std::string& name) const {
    return m_factories.count(name) > 0;
}

ferry_core::Result<BundleDefinition> FactoryBundleLoader::load(const std::string& name) const {
    auto it = m_factories.find(name);
    if (it == m_factories.end() || !it->second) {
        return ferry_core::Err<BundleDefinition>(
            ferry_core::BundleError::invalid_configuration(name, "unknown bundle"));
    }

    BundleDefinition def = it->second();
    if (def.name.empty()) {
        def.name = name;
    }
    return ferry_core::Ok(std::move(def));
}

// =============================================================================
// ManifestBundleLoader Implementation
// =============================================================================

ManifestBundleLoader::ManifestBundleLoader(std::filesystem::path directory)
    : m_directory(std::move(directory)) {
}

bool ManifestBundleLoader::is_manifest_path(const std::filesystem::path& path) {
    const std::string filename = path.filename().string();
    const std::string suffix = MANIFEST_SUFFIX;
    return filename.size() > suffix.size() &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ferry_core::Result<std::size_t> ManifestBundleLoader::scan(bool recursive) {
    std::error_code ec;
    if (!std::filesystem::exists(m_directory, ec)) {
        return ferry_core::Err<std::size_t>(
            ferry_core::Error(ferry_core::ErrorCode::NotFound,
                "Directory not found: " + m_directory.string()));
    }

    if (!std::filesystem::is_directory(m_directory, ec)) {
        return ferry_core::Err<std::size_t>(
            ferry_core::Error(ferry_core::ErrorCode::InvalidArgument,
                "Path is not a directory: " + m_directory.string()));
    }

    std::size_t count = 0;
    ferry_core::Result<void> failure = ferry_core::Ok();

    auto process_entry = [this, &count, &failure](const std::filesystem::directory_entry& entry) {
        std::error_code entry_ec;
        if (!failure || !entry.is_regular_file(entry_ec) || !is_manifest_path(entry.path())) {
            return;
        }

        auto def = BundleDefinition::from_file(entry.path());
        if (!def) {
            failure = ferry_core::Err(def.error());
            return;
        }

        auto [it, inserted] = m_index.emplace(def->name, entry.path());
        if (!inserted && it->second != entry.path()) {
            ferry_core::bundle_logger()->warn("Bundle '{}' defined twice: {} and {}; keeping the first",
                def->name, it->second.string(), entry.path().string());
            return;
        }
        ++count;
    };

    if (recursive) {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(m_directory, ec)) {
            process_entry(entry);
        }
    } else {
        for (const auto& entry : std::filesystem::directory_iterator(m_directory, ec)) {
            process_entry(entry);
        }
    }

    if (!failure) {
        return ferry_core::Err<std::size_t>(failure.error());
    }

    ferry_core::bundle_logger()->debug("Indexed {} bundle manifests in {}", count, m_directory.string());
    return ferry_core::Ok(count);
}

ferry_core::Result<BundleDefinition> ManifestBundleLoader::load(const std::string& name) const {
    std::filesystem::path path;

    auto it = m_index.find(name);
    if (it != m_index.end()) {
        path = it->second;
    } else {
        path = m_directory / (name + MANIFEST_SUFFIX);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return ferry_core::Err<BundleDefinition>(
                ferry_core::BundleError::invalid_configuration(name, "unknown bundle"));
        }
    }

    auto def = BundleDefinition::from_file(path);
    if (!def) {
        return def;
    }

    if (def->name != name) {
        return ferry_core::Err<BundleDefinition>(
            ferry_core::BundleError::invalid_configuration(name,
                "manifest " + path.string() + " defines '" + def->name + "'"));
    }
    return def;
}

std::vector<std::string> ManifestBundleLoader::names() const {
    std::vector<std::string> result;
    result.reserve(m_index.size());
    for (const auto& [name, path] : m_index) {
        result.push_back(name);
    }
    return result;
}

} // namespace ferry_bundle
