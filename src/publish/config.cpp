/// @file config.cpp
/// @brief Publisher configuration implementation

#include <ferry/publish/config.hpp>

#include <charconv>
#include <string>

namespace ferry_publish {

namespace {

/// Parse a permission mode given as an integer or an octal string
ferry_core::Result<std::filesystem::perms> parse_mode(const nlohmann::json& j, const char* key) {
    const auto& value = j[key];

    if (value.is_number_unsigned() || value.is_number_integer()) {
        auto mode = value.get<std::int64_t>();
        if (mode < 0 || mode > 07777) {
            return ferry_core::Err<std::filesystem::perms>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError,
                    std::string("Permission mode out of range for '") + key + "'"));
        }
        return ferry_core::Ok(static_cast<std::filesystem::perms>(mode));
    }

    if (value.is_string()) {
        const auto str = value.get<std::string>();
        unsigned mode = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), mode, 8);
        if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty() || mode > 07777) {
            return ferry_core::Err<std::filesystem::perms>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError,
                    std::string("Invalid octal permission mode for '") + key + "': " + str));
        }
        return ferry_core::Ok(static_cast<std::filesystem::perms>(mode));
    }

    return ferry_core::Err<std::filesystem::perms>(
        ferry_core::Error(ferry_core::ErrorCode::ParseError,
            std::string("Permission mode '") + key + "' must be an integer or octal string"));
}

} // anonymous namespace

PublisherConfig PublisherConfig::with_force_copy(bool force_copy) const {
    PublisherConfig copy = *this;
    copy.m_force_copy = force_copy;
    return copy;
}

PublisherConfig PublisherConfig::with_link_assets(bool link_assets) const {
    PublisherConfig copy = *this;
    copy.m_link_assets = link_assets;
    return copy;
}

PublisherConfig PublisherConfig::with_dir_mode(std::filesystem::perms mode) const {
    PublisherConfig copy = *this;
    copy.m_dir_mode = mode;
    return copy;
}

PublisherConfig PublisherConfig::with_file_mode(std::filesystem::perms mode) const {
    PublisherConfig copy = *this;
    copy.m_file_mode = mode;
    return copy;
}

PublisherConfig PublisherConfig::with_hash_callback(HashCallback callback) const {
    PublisherConfig copy = *this;
    copy.m_hash_callback = std::move(callback);
    return copy;
}

ferry_core::Result<PublisherConfig> PublisherConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return ferry_core::Err<PublisherConfig>(
            ferry_core::Error(ferry_core::ErrorCode::ParseError,
                "Publisher configuration must be a JSON object"));
    }

    PublisherConfig config;

    if (j.contains("forceCopy")) {
        if (!j["forceCopy"].is_boolean()) {
            return ferry_core::Err<PublisherConfig>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError, "'forceCopy' must be a boolean"));
        }
        config.m_force_copy = j["forceCopy"].get<bool>();
    }

    if (j.contains("linkAssets")) {
        if (!j["linkAssets"].is_boolean()) {
            return ferry_core::Err<PublisherConfig>(
                ferry_core::Error(ferry_core::ErrorCode::ParseError, "'linkAssets' must be a boolean"));
        }
        config.m_link_assets = j["linkAssets"].get<bool>();
    }

    if (j.contains("dirMode")) {
        auto mode = parse_mode(j, "dirMode");
        if (!mode) {
            return ferry_core::Err<PublisherConfig>(mode.error());
        }
        config.m_dir_mode = *mode;
    }

    if (j.contains("fileMode")) {
        auto mode = parse_mode(j, "fileMode");
        if (!mode) {
            return ferry_core::Err<PublisherConfig>(mode.error());
        }
        config.m_file_mode = *mode;
    }

    return ferry_core::Ok(std::move(config));
}

} // namespace ferry_publish
