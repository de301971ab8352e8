/// @file filesystem.cpp
/// @brief Local filesystem operations

#include <ferry/publish/filesystem.hpp>

#include <chrono>
#include <system_error>
#include <vector>

namespace ferry_publish {

namespace fs = std::filesystem;

namespace {

ferry_core::Error io_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return ferry_core::Error(ferry_core::ErrorCode::IOError,
        what + " '" + path.generic_string() + "': " + ec.message())
        .with_context("path", path.generic_string());
}

/// Create missing directories from the outermost down so each gets the mode
ferry_core::Result<void> create_directories_with_mode(const fs::path& path, fs::perms mode) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return ferry_core::Ok();
    }

    std::vector<fs::path> missing;
    for (fs::path current = path; !current.empty(); current = current.parent_path()) {
        if (fs::exists(current, ec)) {
            break;
        }
        missing.push_back(current);
        if (current == current.parent_path()) {
            break;
        }
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        fs::create_directory(*it, ec);
        std::error_code dir_ec;
        if (ec && !fs::is_directory(*it, dir_ec)) {
            return ferry_core::Err(io_error("Failed to create directory", *it, ec));
        }
        fs::permissions(*it, mode, fs::perm_options::replace, ec);
        if (ec) {
            return ferry_core::Err(io_error("Failed to set permissions on", *it, ec));
        }
    }

    return ferry_core::Ok();
}

ferry_core::Result<void> copy_file_with_mode(const fs::path& src, const fs::path& dst, fs::perms mode) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return ferry_core::Err(io_error("Failed to copy file", src, ec));
    }
    fs::permissions(dst, mode, fs::perm_options::replace, ec);
    if (ec) {
        return ferry_core::Err(io_error("Failed to set permissions on", dst, ec));
    }
    return ferry_core::Ok();
}

} // anonymous namespace

bool LocalFilesystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFilesystem::is_file(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

ferry_core::Result<std::int64_t> LocalFilesystem::last_modified_time(const fs::path& path) const {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return ferry_core::Err<std::int64_t>(io_error("Failed to read modification time of", path, ec));
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch());
    return ferry_core::Ok(static_cast<std::int64_t>(seconds.count()));
}

ferry_core::Result<void> LocalFilesystem::ensure_directory(const fs::path& path, fs::perms mode) {
    return create_directories_with_mode(path, mode);
}

ferry_core::Result<void> LocalFilesystem::copy_directory(
    const fs::path& src,
    const fs::path& dst,
    fs::perms dir_mode,
    fs::perms file_mode) {

    auto dir_result = create_directories_with_mode(dst, dir_mode);
    if (!dir_result) {
        return dir_result;
    }

    std::error_code ec;
    if (fs::is_regular_file(src, ec)) {
        return copy_file_with_mode(src, dst / src.filename(), file_mode);
    }

    fs::recursive_directory_iterator it(src, fs::directory_options::follow_directory_symlink, ec);
    if (ec) {
        return ferry_core::Err(io_error("Failed to read directory", src, ec));
    }

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return ferry_core::Err(io_error("Failed to read directory", src, ec));
        }

        const fs::path target = dst / it->path().lexically_relative(src);
        if (it->is_directory(ec)) {
            auto result = create_directories_with_mode(target, dir_mode);
            if (!result) {
                return result;
            }
        } else if (it->is_regular_file(ec)) {
            auto result = copy_file_with_mode(it->path(), target, file_mode);
            if (!result) {
                return result;
            }
        }
    }

    if (ec) {
        return ferry_core::Err(io_error("Failed to read directory", src, ec));
    }

    return ferry_core::Ok();
}

ferry_core::Result<void> LocalFilesystem::create_symlink(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (fs::is_directory(src, ec)) {
        fs::create_directory_symlink(src, dst, ec);
    } else {
        fs::create_symlink(src, dst, ec);
    }

    if (ec) {
        return ferry_core::Err(io_error("Failed to create symlink", dst, ec));
    }
    return ferry_core::Ok();
}

} // namespace ferry_publish
