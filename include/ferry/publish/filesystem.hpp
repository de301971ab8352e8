#pragma once

/// @file filesystem.hpp
/// @brief Filesystem primitives used by the publisher

#include "fwd.hpp"
#include <ferry/core/error.hpp>

#include <cstdint>
#include <filesystem>

namespace ferry_publish {

// =============================================================================
// FilesystemOps
// =============================================================================

/// Low-level filesystem operations
///
/// Query operations never fail; they report false for paths that cannot be
/// inspected. Mutating operations return an IOError on failure.
class FilesystemOps {
public:
    virtual ~FilesystemOps() = default;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const = 0;

    [[nodiscard]] virtual bool is_file(const std::filesystem::path& path) const = 0;

    /// Last modification time in seconds
    [[nodiscard]] virtual ferry_core::Result<std::int64_t> last_modified_time(
        const std::filesystem::path& path) const = 0;

    /// Create a directory and its parents, applying mode to directories it creates
    [[nodiscard]] virtual ferry_core::Result<void> ensure_directory(
        const std::filesystem::path& path,
        std::filesystem::perms mode) = 0;

    /// Recursively copy src into dst, overwriting existing files
    ///
    /// A single-file src is copied into the dst directory under its own name.
    [[nodiscard]] virtual ferry_core::Result<void> copy_directory(
        const std::filesystem::path& src,
        const std::filesystem::path& dst,
        std::filesystem::perms dir_mode,
        std::filesystem::perms file_mode) = 0;

    /// Create a symbolic link at dst pointing to src
    [[nodiscard]] virtual ferry_core::Result<void> create_symlink(
        const std::filesystem::path& src,
        const std::filesystem::path& dst) = 0;
};

// =============================================================================
// LocalFilesystem
// =============================================================================

/// FilesystemOps on the local disk through std::filesystem
class LocalFilesystem final : public FilesystemOps {
public:
    [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
    [[nodiscard]] bool is_file(const std::filesystem::path& path) const override;

    [[nodiscard]] ferry_core::Result<std::int64_t> last_modified_time(
        const std::filesystem::path& path) const override;

    [[nodiscard]] ferry_core::Result<void> ensure_directory(
        const std::filesystem::path& path,
        std::filesystem::perms mode) override;

    [[nodiscard]] ferry_core::Result<void> copy_directory(
        const std::filesystem::path& src,
        const std::filesystem::path& dst,
        std::filesystem::perms dir_mode,
        std::filesystem::perms file_mode) override;

    [[nodiscard]] ferry_core::Result<void> create_symlink(
        const std::filesystem::path& src,
        const std::filesystem::path& dst) override;
};

} // namespace ferry_publish
