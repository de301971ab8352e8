/// @file path_resolver.cpp
/// @brief Alias path resolver implementation

#include <ferry/publish/path_resolver.hpp>

namespace ferry_publish {

namespace {

// Guards against alias values that reference each other
constexpr int MAX_ALIAS_DEPTH = 16;

std::string strip_trailing_separator(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // anonymous namespace

AliasPathResolver::AliasPathResolver(std::filesystem::path root)
    : m_root(std::move(root)) {
}

std::string AliasPathResolver::normalize_alias(const std::string& alias) {
    std::string name = strip_trailing_separator(alias);
    if (name.empty() || name.front() != '@') {
        name.insert(name.begin(), '@');
    }
    return name;
}

void AliasPathResolver::set_alias(const std::string& alias, const std::string& path) {
    m_aliases[normalize_alias(alias)] = strip_trailing_separator(path);
}

bool AliasPathResolver::remove_alias(const std::string& alias) {
    return m_aliases.erase(normalize_alias(alias)) > 0;
}

bool AliasPathResolver::has_alias(const std::string& alias) const {
    return m_aliases.count(normalize_alias(alias)) > 0;
}

ferry_core::Result<std::string> AliasPathResolver::resolve(const std::string& alias_or_path) const {
    if (alias_or_path.empty()) {
        return ferry_core::Err<std::string>(
            ferry_core::Error(ferry_core::ErrorCode::InvalidArgument, "Cannot resolve an empty path"));
    }

    auto resolved = resolve_alias(alias_or_path, 0);
    if (!resolved) {
        return resolved;
    }

    std::filesystem::path path(*resolved);
    if (path.is_relative()) {
        path = m_root / path;
    }

    return ferry_core::Ok(strip_trailing_separator(path.lexically_normal().generic_string()));
}

ferry_core::Result<std::string> AliasPathResolver::resolve_alias(const std::string& path, int depth) const {
    if (path.front() != '@') {
        return ferry_core::Ok(path);
    }

    if (depth >= MAX_ALIAS_DEPTH) {
        return ferry_core::Err<std::string>(
            ferry_core::Error(ferry_core::ErrorCode::InvalidState,
                "Alias nesting too deep while resolving: " + path));
    }

    // Longest alias whose name is followed by '/' or the end of the path
    const std::string* best_name = nullptr;
    const std::string* best_value = nullptr;
    for (const auto& [name, value] : m_aliases) {
        if (path.compare(0, name.size(), name) != 0) {
            continue;
        }
        if (path.size() != name.size() && path[name.size()] != '/') {
            continue;
        }
        if (best_name == nullptr || name.size() > best_name->size()) {
            best_name = &name;
            best_value = &value;
        }
    }

    if (best_name == nullptr) {
        return ferry_core::Err<std::string>(
            ferry_core::Error(ferry_core::ErrorCode::NotFound, "Unknown path alias: " + path)
                .with_context("path", path));
    }

    std::string expanded = *best_value + path.substr(best_name->size());
    if (expanded.empty()) {
        expanded = ".";
    }
    return resolve_alias(expanded, depth + 1);
}

} // namespace ferry_publish
