/// @file definition.cpp
/// @brief Bundle definition parsing and serialization

#include <ferry/bundle/definition.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace ferry_bundle {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

ferry_core::Error parse_error(const std::string& name, const std::string& reason) {
    return ferry_core::BundleError::invalid_configuration(name.empty() ? "<unnamed>" : name, reason);
}

/// Read an optional string field
ferry_core::Result<std::optional<std::string>> optional_string(
    const nlohmann::json& j, const char* key, const std::string& name) {

    if (!j.contains(key) || j[key].is_null()) {
        return ferry_core::Ok(std::optional<std::string>{});
    }
    if (!j[key].is_string()) {
        return ferry_core::Err<std::optional<std::string>>(
            parse_error(name, std::string("'") + key + "' must be a string"));
    }
    return ferry_core::Ok(std::optional<std::string>(j[key].get<std::string>()));
}

/// Read an optional integer field
ferry_core::Result<std::optional<int>> optional_int(
    const nlohmann::json& j, const char* key, const std::string& name) {

    if (!j.contains(key) || j[key].is_null()) {
        return ferry_core::Ok(std::optional<int>{});
    }
    auto value = position_from_json(j[key]);
    if (!value) {
        return ferry_core::Err<std::optional<int>>(
            parse_error(name, std::string("'") + key + "' must be an integer in int range"));
    }
    return ferry_core::Ok(value);
}

/// Read an optional array field as raw entries
ferry_core::Result<std::vector<nlohmann::json>> entry_array(
    const nlohmann::json& j, const char* key, const std::string& name) {

    std::vector<nlohmann::json> entries;
    if (!j.contains(key) || j[key].is_null()) {
        return ferry_core::Ok(std::move(entries));
    }
    if (!j[key].is_array()) {
        return ferry_core::Err<std::vector<nlohmann::json>>(
            parse_error(name, std::string("'") + key + "' must be an array"));
    }

    entries.reserve(j[key].size());
    for (const auto& item : j[key]) {
        entries.push_back(item);
    }
    return ferry_core::Ok(std::move(entries));
}

void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        j[key] = *value;
    }
}

void put_optional(nlohmann::json& j, const char* key, const std::optional<int>& value) {
    if (value.has_value()) {
        j[key] = *value;
    }
}

} // anonymous namespace

std::optional<int> position_from_json(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<std::int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    return std::nullopt;
}

// =============================================================================
// BundleDefinition Implementation
// =============================================================================

std::optional<bool> BundleDefinition::force_copy() const {
    if (!publish_options.is_object() || !publish_options.contains("forceCopy")) {
        return std::nullopt;
    }
    const auto& value = publish_options["forceCopy"];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    return !value.is_null();
}

ferry_publish::PublishRequest BundleDefinition::publish_request() const {
    ferry_publish::PublishRequest request;
    request.source_path = source_path.value_or("");
    request.base_path = base_path.value_or("");
    request.base_url = base_url;
    request.force_copy = force_copy();
    return request;
}

BundleDefinition BundleDefinition::empty(const std::string& name) {
    BundleDefinition def;
    def.name = name;
    return def;
}

ferry_core::Result<BundleDefinition> BundleDefinition::from_json(
    const nlohmann::json& j,
    const std::string& fallback_name) {

    if (!j.is_object()) {
        return ferry_core::Err<BundleDefinition>(
            parse_error(fallback_name, "manifest must be a JSON object"));
    }

    BundleDefinition def;

    // Name
    if (j.contains("name")) {
        if (!j["name"].is_string() || j["name"].get<std::string>().empty()) {
            return ferry_core::Err<BundleDefinition>(
                parse_error(fallback_name, "'name' must be a non-empty string"));
        }
        def.name = j["name"].get<std::string>();
    } else if (!fallback_name.empty()) {
        def.name = fallback_name;
    } else {
        return ferry_core::Err<BundleDefinition>(parse_error(fallback_name, "missing 'name'"));
    }

    // Dependencies
    if (j.contains("depends") && !j["depends"].is_null()) {
        if (!j["depends"].is_array()) {
            return ferry_core::Err<BundleDefinition>(parse_error(def.name, "'depends' must be an array"));
        }
        for (const auto& dep : j["depends"]) {
            if (!dep.is_string() || dep.get<std::string>().empty()) {
                return ferry_core::Err<BundleDefinition>(
                    parse_error(def.name, "'depends' entries must be non-empty strings"));
            }
            def.dependencies.push_back(dep.get<std::string>());
        }
    }

    // Files
    auto scripts = entry_array(j, "js", def.name);
    if (!scripts) {
        return ferry_core::Err<BundleDefinition>(scripts.error());
    }
    def.script_entries = std::move(*scripts);

    auto styles = entry_array(j, "css", def.name);
    if (!styles) {
        return ferry_core::Err<BundleDefinition>(styles.error());
    }
    def.style_entries = std::move(*styles);

    // Default options are validated during collection
    if (j.contains("jsOptions") && !j["jsOptions"].is_null()) {
        def.script_options = j["jsOptions"];
    }
    if (j.contains("cssOptions") && !j["cssOptions"].is_null()) {
        def.style_options = j["cssOptions"];
    }

    // Publishing
    auto source_path = optional_string(j, "sourcePath", def.name);
    if (!source_path) {
        return ferry_core::Err<BundleDefinition>(source_path.error());
    }
    def.source_path = std::move(*source_path);

    auto base_path = optional_string(j, "basePath", def.name);
    if (!base_path) {
        return ferry_core::Err<BundleDefinition>(base_path.error());
    }
    def.base_path = std::move(*base_path);

    auto base_url = optional_string(j, "baseUrl", def.name);
    if (!base_url) {
        return ferry_core::Err<BundleDefinition>(base_url.error());
    }
    def.base_url = std::move(*base_url);

    if (j.contains("cdn") && !j["cdn"].is_null()) {
        if (!j["cdn"].is_boolean()) {
            return ferry_core::Err<BundleDefinition>(parse_error(def.name, "'cdn' must be a boolean"));
        }
        def.is_remote = j["cdn"].get<bool>();
    }

    if (j.contains("publishOptions") && !j["publishOptions"].is_null()) {
        if (!j["publishOptions"].is_object()) {
            return ferry_core::Err<BundleDefinition>(
                parse_error(def.name, "'publishOptions' must be an object"));
        }
        def.publish_options = j["publishOptions"];
    }

    // Positions
    auto script_position = optional_int(j, "jsPosition", def.name);
    if (!script_position) {
        return ferry_core::Err<BundleDefinition>(script_position.error());
    }
    def.script_position = *script_position;

    auto style_position = optional_int(j, "cssPosition", def.name);
    if (!style_position) {
        return ferry_core::Err<BundleDefinition>(style_position.error());
    }
    def.style_position = *style_position;

    return ferry_core::Ok(std::move(def));
}

ferry_core::Result<BundleDefinition> BundleDefinition::from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ferry_core::Err<BundleDefinition>(
            ferry_core::Error(ferry_core::ErrorCode::IOError,
                "Failed to open bundle manifest: " + path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return ferry_core::Err<BundleDefinition>(
            parse_error(path.stem().string(), std::string("JSON parse error: ") + e.what())
                .with_context("file", path.string()));
    }

    // "jquery.bundle.json" -> "jquery"
    std::string fallback = path.filename().string();
    const std::string suffix = ".bundle.json";
    if (fallback.size() > suffix.size() &&
        fallback.compare(fallback.size() - suffix.size(), suffix.size(), suffix) == 0) {
        fallback.resize(fallback.size() - suffix.size());
    } else {
        fallback = path.stem().string();
    }

    auto result = from_json(j, fallback);
    if (!result) {
        return ferry_core::Err<BundleDefinition>(
            ferry_core::Error(result.error()).with_context("file", path.string()));
    }
    return result;
}

nlohmann::json BundleDefinition::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["depends"] = dependencies;
    j["js"] = script_entries;
    j["css"] = style_entries;
    j["jsOptions"] = script_options;
    j["cssOptions"] = style_options;
    put_optional(j, "sourcePath", source_path);
    put_optional(j, "basePath", base_path);
    put_optional(j, "baseUrl", base_url);
    j["cdn"] = is_remote;
    put_optional(j, "jsPosition", script_position);
    put_optional(j, "cssPosition", style_position);
    j["publishOptions"] = publish_options;
    return j;
}

// =============================================================================
// BundleCustomization Implementation
// =============================================================================

ferry_core::Result<BundleDefinition> BundleCustomization::apply(const BundleDefinition& loaded) const {
    if (disabled) {
        return ferry_core::Ok(BundleDefinition::empty(loaded.name));
    }
    if (overrides.empty()) {
        return ferry_core::Ok(loaded);
    }

    nlohmann::json merged = loaded.to_json();
    for (const auto& [key, value] : overrides.items()) {
        merged[key] = value;
    }
    merged["name"] = loaded.name;

    return BundleDefinition::from_json(merged, loaded.name);
}

ferry_core::Result<BundleCustomization> BundleCustomization::from_json(
    const nlohmann::json& j,
    const std::string& name) {

    BundleCustomization customization;

    if (j.is_boolean()) {
        if (j.get<bool>()) {
            return ferry_core::Err<BundleCustomization>(
                parse_error(name, "a bundle customization may only be 'false' or an object"));
        }
        customization.disabled = true;
        return ferry_core::Ok(std::move(customization));
    }

    if (!j.is_object()) {
        return ferry_core::Err<BundleCustomization>(
            parse_error(name, "a bundle customization must be 'false' or an object"));
    }

    customization.overrides = j;
    return ferry_core::Ok(std::move(customization));
}

} // namespace ferry_bundle
