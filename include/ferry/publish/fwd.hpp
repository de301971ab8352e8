#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ferry_publish module

#include <functional>
#include <string>

namespace ferry_publish {

// =============================================================================
// Collaborators
// =============================================================================

class PathResolver;
class AliasPathResolver;
class FilesystemOps;
class LocalFilesystem;

// =============================================================================
// Publishing
// =============================================================================

/// Produces the directory name a source path is published under
using HashCallback = std::function<std::string(const std::string&)>;

class PublisherConfig;
struct PublishRequest;
struct PublishedBundle;
class PublishCache;

} // namespace ferry_publish
