/// @file collector.cpp
/// @brief File collector implementation

#include <ferry/bundle/collector.hpp>
#include <ferry/core/hash.hpp>
#include <ferry/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ferry_bundle {

namespace {

std::string join_url(const std::string& base, const std::string& url) {
    if (base.empty()) {
        return url;
    }
    if (base.back() == '/') {
        return base + url;
    }
    return base + "/" + url;
}

bool is_numeric_key(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

void copy_options(const nlohmann::json& from, nlohmann::json& to) {
    for (const auto& [key, value] : from.items()) {
        to[key] = value;
    }
}

} // anonymous namespace

// =============================================================================
// FileCollector Implementation
// =============================================================================

FileCollector::FileCollector(std::shared_ptr<const ferry_publish::FilesystemOps> filesystem,
                             std::map<std::string, std::string> asset_map)
    : m_filesystem(std::move(filesystem))
    , m_asset_map(std::move(asset_map)) {
}

ferry_core::Result<void> FileCollector::collect(
    const RegistrationSession& session,
    const std::string& name) {

    return collect_recursive(session, name);
}

ferry_core::Result<void> FileCollector::collect_all(const RegistrationSession& session) {
    for (const auto& name : session.registry_order()) {
        auto result = collect_recursive(session, name);
        if (!result) {
            return result;
        }
    }
    return ferry_core::Ok();
}

void FileCollector::clear() {
    m_scripts.clear();
    m_styles.clear();
    m_collected.clear();
}

bool FileCollector::is_relative_url(const std::string& url) {
    return url.rfind("//", 0) != 0 && url.find("://") == std::string::npos;
}

ferry_core::Result<void> FileCollector::collect_recursive(
    const RegistrationSession& session,
    const std::string& name) {

    if (m_collected.count(name)) {
        return ferry_core::Ok();
    }

    const RegistryEntry* entry = session.find(name);
    if (!entry) {
        return ferry_core::Err(
            ferry_core::BundleError::invalid_configuration(name, "bundle is not registered"));
    }
    m_collected.insert(name);

    for (const auto& dep : entry->bundle.dependencies) {
        auto result = collect_recursive(session, dep);
        if (!result) {
            return result;
        }
    }

    auto scripts = collect_axis(entry->bundle, Axis::Script);
    if (!scripts) {
        return scripts;
    }
    return collect_axis(entry->bundle, Axis::Style);
}

ferry_core::Result<void> FileCollector::collect_axis(const BundleDefinition& bundle, Axis axis) {
    auto& collection = axis == Axis::Script ? m_scripts : m_styles;
    const int fallback_position = axis == Axis::Script ? position::end : position::head;

    for (const auto& raw : bundle.entries(axis)) {
        auto normalized = normalize(bundle, raw);
        if (!normalized) {
            return ferry_core::Err(normalized.error());
        }

        auto url = resolve_url(bundle, normalized->url);
        if (!url) {
            return ferry_core::Err(url.error());
        }

        auto merged = merge_default_options(bundle, axis, normalized->options);
        if (!merged) {
            return merged;
        }

        FileEntry file;
        file.url = *url;
        file.position = normalized->position.value_or(
            bundle.position(axis).value_or(fallback_position));
        file.options = std::move(normalized->options);

        // ordered_map keeps the original slot on overwrite
        collection[normalized->key.value_or(*url)] = std::move(file);
    }

    return ferry_core::Ok();
}

ferry_core::Result<FileCollector::NormalizedEntry> FileCollector::normalize(
    const BundleDefinition& bundle,
    const nlohmann::json& raw) {

    NormalizedEntry entry;
    const nlohmann::json* url = nullptr;

    if (raw.is_string()) {
        url = &raw;
    } else if (raw.is_array()) {
        if (raw.empty()) {
            return ferry_core::Err<NormalizedEntry>(
                ferry_core::BundleError::invalid_file_entry(bundle.name, "empty file entry"));
        }
        url = &raw[0];
        for (std::size_t i = 1; i < raw.size(); ++i) {
            const auto& item = raw[i];
            if (item.is_number_integer()) {
                entry.position = position_from_json(item);
                if (!entry.position) {
                    return ferry_core::Err<NormalizedEntry>(
                        ferry_core::BundleError::invalid_file_entry(bundle.name,
                            "file entry position is out of range"));
                }
            } else if (item.is_object()) {
                copy_options(item, entry.options);
            } else if (!item.is_null()) {
                return ferry_core::Err<NormalizedEntry>(
                    ferry_core::BundleError::invalid_file_entry(bundle.name,
                        "file entry items must be a position or an options object"));
            }
        }
    } else if (raw.is_object()) {
        if (!raw.contains("url")) {
            return ferry_core::Err<NormalizedEntry>(
                ferry_core::BundleError::invalid_file_entry(bundle.name, "file entry has no 'url'"));
        }
        url = &raw["url"];

        for (const auto& [key, value] : raw.items()) {
            if (key == "url") {
                continue;
            }
            if (key == "key") {
                if (!value.is_string() || value.get<std::string>().empty()) {
                    return ferry_core::Err<NormalizedEntry>(
                        ferry_core::BundleError::invalid_file_entry(bundle.name,
                            "file entry 'key' must be a non-empty string"));
                }
                entry.key = value.get<std::string>();
            } else if (key == "position") {
                entry.position = position_from_json(value);
                if (!entry.position) {
                    return ferry_core::Err<NormalizedEntry>(
                        ferry_core::BundleError::invalid_file_entry(bundle.name,
                            "file entry 'position' must be an integer in int range"));
                }
            } else if (key == "options") {
                if (!value.is_object()) {
                    return ferry_core::Err<NormalizedEntry>(
                        ferry_core::BundleError::invalid_file_entry(bundle.name,
                            "file entry 'options' must be an object"));
                }
                copy_options(value, entry.options);
            } else {
                entry.options[key] = value;
            }
        }
    } else {
        return ferry_core::Err<NormalizedEntry>(
            ferry_core::BundleError::invalid_file_entry(bundle.name,
                "file entry must be a string, an array or an object"));
    }

    if (!url->is_string() || url->get<std::string>().empty()) {
        return ferry_core::Err<NormalizedEntry>(
            ferry_core::BundleError::invalid_file_entry(bundle.name,
                "file entry URL must be a non-empty string"));
    }
    entry.url = url->get<std::string>();

    return ferry_core::Ok(std::move(entry));
}

ferry_core::Result<void> FileCollector::merge_default_options(
    const BundleDefinition& bundle,
    Axis axis,
    nlohmann::json& options) {

    const auto& defaults = bundle.default_options(axis);
    if (defaults.is_null()) {
        return ferry_core::Ok();
    }
    if (!defaults.is_object()) {
        return ferry_core::Err(ferry_core::BundleError::invalid_file_entry(bundle.name,
            std::string(axis_name(axis)) + " options must be an object"));
    }

    for (const auto& [key, value] : defaults.items()) {
        if (is_numeric_key(key)) {
            return ferry_core::Err(ferry_core::BundleError::invalid_file_entry(bundle.name,
                std::string(axis_name(axis)) + " options must use named keys, got '" + key + "'"));
        }
        if (!options.contains(key)) {
            options[key] = value;
        }
    }

    return ferry_core::Ok();
}

// =============================================================================
// URL Resolution
// =============================================================================

std::optional<std::string> FileCollector::resolve_remap(
    const BundleDefinition& bundle,
    const std::string& asset) const {

    if (m_asset_map.empty()) {
        return std::nullopt;
    }

    auto exact = m_asset_map.find(asset);
    if (exact != m_asset_map.end()) {
        return exact->second;
    }

    std::string path = asset;
    if (bundle.source_path && is_relative_url(asset)) {
        path = *bundle.source_path + "/" + asset;
    }

    const std::size_t path_length = ferry_core::utf8_length(path);
    const std::string* best = nullptr;
    std::size_t best_length = 0;

    for (const auto& [from, to] : m_asset_map) {
        const std::size_t from_length = ferry_core::utf8_length(from);
        if (from.empty() || from_length > path_length || from.size() > path.size()) {
            continue;
        }
        if (path.compare(path.size() - from.size(), from.size(), from) != 0) {
            continue;
        }
        if (!best || from_length > best_length) {
            best = &to;
            best_length = from_length;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return *best;
}

ferry_core::Result<std::string> FileCollector::resolve_url(
    const BundleDefinition& bundle,
    const std::string& asset) const {

    if (auto remapped = resolve_remap(bundle, asset)) {
        ferry_core::bundle_logger()->debug("Remapped '{}' in bundle '{}' to '{}'", asset, bundle.name, *remapped);
        return ferry_core::Ok(std::move(*remapped));
    }

    if (bundle.is_remote) {
        if (bundle.base_url && is_relative_url(asset)) {
            return ferry_core::Ok(join_url(*bundle.base_url, asset));
        }
        return ferry_core::Ok(asset);
    }

    if (!bundle.base_path) {
        return ferry_core::Err<std::string>(
            ferry_core::BundleError::missing_configuration(bundle.name, "basePath"));
    }
    if (!bundle.base_url) {
        return ferry_core::Err<std::string>(
            ferry_core::BundleError::missing_configuration(bundle.name, "baseUrl"));
    }

    if (!is_relative_url(asset) || asset.front() == '/') {
        return ferry_core::Ok(asset);
    }

    const auto file = std::filesystem::path(*bundle.base_path) / asset;
    if (!m_filesystem || !m_filesystem->exists(file)) {
        return ferry_core::Err<std::string>(
            ferry_core::BundleError::file_not_found(bundle.name, file.generic_string()));
    }

    return ferry_core::Ok(join_url(*bundle.base_url, asset));
}

} // namespace ferry_bundle
