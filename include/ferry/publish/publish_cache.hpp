#pragma once

/// @file publish_cache.hpp
/// @brief Idempotent publication of bundle source directories
///
/// The PublishCache copies (or symlinks) a bundle's source directory into
/// `basePath/<hash>` and remembers the result per resolved source path, so
/// every source is published at most once per process.

#include "fwd.hpp"
#include "config.hpp"
#include "filesystem.hpp"
#include "path_resolver.hpp"
#include <ferry/core/error.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ferry_publish {

// =============================================================================
// PublishRequest / PublishedBundle
// =============================================================================

/// What to publish and where
struct PublishRequest {
    std::string source_path;              ///< Directory or file to publish (alias allowed)
    std::string base_path;                ///< Output directory root (alias allowed)
    std::optional<std::string> base_url;  ///< URL the output root is served under
    std::optional<bool> force_copy;       ///< Per-bundle override of the global flag
};

/// Where a source ended up
struct PublishedBundle {
    std::string path;  ///< Published directory
    std::string url;   ///< URL of the published directory

    bool operator==(const PublishedBundle& other) const {
        return path == other.path && url == other.url;
    }
};

// =============================================================================
// PublishCache
// =============================================================================

/// Publishes source directories at most once per resolved source path
///
/// Thread-safety: publish() may be called concurrently. Calls for the same
/// source serialize; one performs the filesystem work and the others wait
/// for and share its result. Failed publications are not cached.
class PublishCache {
public:
    PublishCache(std::shared_ptr<const PathResolver> resolver,
                 std::shared_ptr<FilesystemOps> filesystem,
                 PublisherConfig config = {});

    // Non-copyable, non-movable (contains std::mutex)
    PublishCache(const PublishCache&) = delete;
    PublishCache& operator=(const PublishCache&) = delete;
    PublishCache(PublishCache&&) = delete;
    PublishCache& operator=(PublishCache&&) = delete;

    /// Publish a source directory
    ///
    /// @return Published directory and URL, identical for repeated calls
    [[nodiscard]] ferry_core::Result<PublishedBundle> publish(const PublishRequest& request);

    /// Published directory of a source path, if it has been published
    [[nodiscard]] std::optional<std::string> get_published_path(const std::string& source_path) const;

    /// Published URL of a source path, if it has been published
    [[nodiscard]] std::optional<std::string> get_published_url(const std::string& source_path) const;

    [[nodiscard]] const PublisherConfig& config() const noexcept { return m_config; }

    /// Number of published sources
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] ferry_core::Result<PublishedBundle> publish_directory(
        const PublishRequest& request,
        const std::string& source);

    [[nodiscard]] ferry_core::Result<std::string> hash(const std::string& source) const;

    [[nodiscard]] ferry_core::Result<void> link_directory(
        const std::string& source,
        const std::string& destination);

    [[nodiscard]] std::optional<PublishedBundle> lookup(const std::string& source_path) const;

    std::shared_ptr<const PathResolver> m_resolver;
    std::shared_ptr<FilesystemOps> m_filesystem;
    const PublisherConfig m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, PublishedBundle> m_published;
    std::map<std::string, std::shared_future<ferry_core::Result<PublishedBundle>>> m_in_flight;
};

} // namespace ferry_publish
