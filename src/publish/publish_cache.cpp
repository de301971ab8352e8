/// @file publish_cache.cpp
/// @brief Publish cache implementation

#include <ferry/publish/publish_cache.hpp>
#include <ferry/core/hash.hpp>
#include <ferry/core/log.hpp>

#include <exception>

namespace ferry_publish {

using ferry_core::PublishError;

namespace {

std::string join_url(const std::string& base, const std::string& name) {
    if (base.empty()) {
        return name;
    }
    if (base.back() == '/') {
        return base + name;
    }
    return base + "/" + name;
}

} // anonymous namespace

PublishCache::PublishCache(std::shared_ptr<const PathResolver> resolver,
                           std::shared_ptr<FilesystemOps> filesystem,
                           PublisherConfig config)
    : m_resolver(std::move(resolver))
    , m_filesystem(std::move(filesystem))
    , m_config(std::move(config)) {
}

ferry_core::Result<PublishedBundle> PublishCache::publish(const PublishRequest& request) {
    if (request.source_path.empty()) {
        return ferry_core::Err<PublishedBundle>(PublishError::missing_configuration("sourcePath"));
    }

    auto source_result = m_resolver->resolve(request.source_path);
    if (!source_result) {
        return ferry_core::Err<PublishedBundle>(source_result.error());
    }
    const std::string source = std::move(*source_result);

    std::promise<ferry_core::Result<PublishedBundle>> promise;
    std::shared_future<ferry_core::Result<PublishedBundle>> pending;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_published.find(source);
        if (it != m_published.end()) {
            ferry_core::publish_logger()->debug("Already published: {} -> {}", source, it->second.path);
            return ferry_core::Ok(it->second);
        }

        auto flight = m_in_flight.find(source);
        if (flight != m_in_flight.end()) {
            pending = flight->second;
        } else {
            owner = true;
            pending = promise.get_future().share();
            m_in_flight.emplace(source, pending);
        }
    }

    if (!owner) {
        ferry_core::publish_logger()->debug("Waiting for concurrent publication of {}", source);
        return pending.get();
    }

    // Waiters share this flight, so it must be settled on every exit path
    auto result = [&]() -> ferry_core::Result<PublishedBundle> {
        try {
            return publish_directory(request, source);
        } catch (const std::exception& e) {
            ferry_core::publish_logger()->warn("Publication of {} threw: {}", source, e.what());
            return ferry_core::Err<PublishedBundle>(PublishError::io(source, {}, e.what()));
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_in_flight.erase(source);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (result) {
            m_published.emplace(source, *result);
        }
        m_in_flight.erase(source);
    }

    promise.set_value(result);
    return result;
}

std::optional<std::string> PublishCache::get_published_path(const std::string& source_path) const {
    auto published = lookup(source_path);
    if (!published) {
        return std::nullopt;
    }
    return published->path;
}

std::optional<std::string> PublishCache::get_published_url(const std::string& source_path) const {
    auto published = lookup(source_path);
    if (!published) {
        return std::nullopt;
    }
    return published->url;
}

std::size_t PublishCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published.size();
}

std::optional<PublishedBundle> PublishCache::lookup(const std::string& source_path) const {
    if (source_path.empty()) {
        return std::nullopt;
    }

    auto source = m_resolver->resolve(source_path);
    if (!source) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_published.find(*source);
    if (it == m_published.end()) {
        return std::nullopt;
    }
    return it->second;
}

ferry_core::Result<PublishedBundle> PublishCache::publish_directory(
    const PublishRequest& request,
    const std::string& source) {

    if (request.base_path.empty()) {
        return ferry_core::Err<PublishedBundle>(PublishError::missing_configuration("basePath"));
    }
    if (!request.base_url.has_value()) {
        return ferry_core::Err<PublishedBundle>(PublishError::missing_configuration("baseUrl"));
    }
    if (!m_filesystem->exists(source)) {
        return ferry_core::Err<PublishedBundle>(PublishError::file_not_found(source));
    }

    auto base_path = m_resolver->resolve(request.base_path);
    if (!base_path) {
        return ferry_core::Err<PublishedBundle>(base_path.error());
    }

    // URLs only go through the resolver when they name an alias
    std::string base_url = *request.base_url;
    if (!base_url.empty() && base_url.front() == '@') {
        auto resolved_url = m_resolver->resolve(base_url);
        if (!resolved_url) {
            return ferry_core::Err<PublishedBundle>(resolved_url.error());
        }
        base_url = std::move(*resolved_url);
    }

    auto dir = hash(source);
    if (!dir) {
        return ferry_core::Err<PublishedBundle>(dir.error());
    }

    PublishedBundle published;
    published.path = (std::filesystem::path(*base_path) / *dir).generic_string();
    published.url = join_url(base_url, *dir);

    if (m_config.link_assets()) {
        if (!m_filesystem->exists(published.path)) {
            auto link_result = link_directory(source, published.path);
            if (!link_result) {
                return ferry_core::Err<PublishedBundle>(link_result.error());
            }
        }
    } else {
        bool force = request.force_copy.value_or(m_config.force_copy());
        if (force || !m_filesystem->exists(published.path)) {
            auto copy_result = m_filesystem->copy_directory(
                source, published.path, m_config.dir_mode(), m_config.file_mode());
            if (!copy_result) {
                return ferry_core::Err<PublishedBundle>(
                    PublishError::io(source, published.path, copy_result.error().message()));
            }
            ferry_core::publish_logger()->info("Published {} -> {}", source, published.path);
        }
    }

    return ferry_core::Ok(std::move(published));
}

ferry_core::Result<void> PublishCache::link_directory(
    const std::string& source,
    const std::string& destination) {

    auto parent = std::filesystem::path(destination).parent_path();
    auto dir_result = m_filesystem->ensure_directory(parent, m_config.dir_mode());
    if (!dir_result) {
        return ferry_core::Err(PublishError::io(source, destination, dir_result.error().message()));
    }

    auto link_result = m_filesystem->create_symlink(source, destination);
    if (!link_result) {
        // Another process may have linked the same hash in between
        if (m_filesystem->exists(destination)) {
            ferry_core::publish_logger()->warn(
                "Symlink {} was created concurrently; reusing it", destination);
            return ferry_core::Ok();
        }
        return ferry_core::Err(PublishError::io(source, destination, link_result.error().message()));
    }

    ferry_core::publish_logger()->info("Linked {} -> {}", source, destination);
    return ferry_core::Ok();
}

ferry_core::Result<std::string> PublishCache::hash(const std::string& source) const {
    if (m_config.hash_callback()) {
        return ferry_core::Ok(m_config.hash_callback()(source));
    }

    auto mtime = m_filesystem->last_modified_time(source);
    if (!mtime) {
        return ferry_core::Err<std::string>(
            PublishError::io(source, {}, mtime.error().message()));
    }

    // A single file hashes through its directory so sibling assets stay reachable
    std::string input = m_filesystem->is_file(source)
        ? std::filesystem::path(source).parent_path().generic_string()
        : source;
    input += std::to_string(*mtime);
    input += m_config.link_assets() ? "|1" : "|";

    return ferry_core::Ok(ferry_core::short_hash_hex(input));
}

} // namespace ferry_publish
