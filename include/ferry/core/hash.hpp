#pragma once

/// @file hash.hpp
/// @brief String hashing helpers used for published directory names

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace ferry_core {

namespace detail {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

} // namespace detail

/// FNV-1a 64-bit hash
[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len) noexcept {
    std::uint64_t hash = detail::FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= detail::FNV_PRIME;
    }
    return hash;
}

[[nodiscard]] inline std::uint64_t fnv1a_hash(std::string_view str) noexcept {
    return fnv1a_hash(str.data(), str.size());
}

/// FNV-1a hash folded to 32 bits and rendered as lowercase hex (no padding)
[[nodiscard]] inline std::string short_hash_hex(std::string_view str) {
    std::uint64_t hash = fnv1a_hash(str);
    auto folded = static_cast<std::uint32_t>(hash ^ (hash >> 32));

    std::ostringstream oss;
    oss << std::hex << folded;
    return oss.str();
}

/// Number of UTF-8 code points in a string (continuation bytes are not counted)
[[nodiscard]] inline std::size_t utf8_length(std::string_view str) noexcept {
    std::size_t count = 0;
    for (char c : str) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace ferry_core
