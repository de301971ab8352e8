#pragma once

/// @file bundle.hpp
/// @brief Main include file for ferry_bundle module
///
/// This header includes all public bundle headers.
///
/// # Overview
///
/// | Type | Purpose |
/// |------|---------|
/// | BundleDefinition | Files, dependencies and publish settings of one bundle |
/// | BundleLoader | Source of definitions (factories or `*.bundle.json` manifests) |
/// | BundleStore | Loads each bundle once and applies customizations |
/// | DependencyResolver | Registers a bundle's dependency closure in order |
/// | FileCollector | Builds the ordered script/style lists |
/// | AssetManager | Facade over all of the above |
///
/// # Basic Usage
///
/// ```cpp
/// #include <ferry/bundle/bundle.hpp>
///
/// auto aliases = std::make_shared<ferry_publish::AliasPathResolver>();
/// aliases->set_alias("@public", "/var/www/public");
/// auto filesystem = std::make_shared<ferry_publish::LocalFilesystem>();
/// auto publisher = std::make_shared<ferry_publish::PublishCache>(aliases, filesystem);
///
/// auto loader = std::make_shared<ferry_bundle::ManifestBundleLoader>("bundles");
/// if (auto scanned = loader->scan(); !scanned) { ... }
///
/// ferry_bundle::AssetManager manager(loader, publisher, filesystem);
/// if (auto result = manager.register_bundle("app"); !result) { ... }
///
/// auto scripts = manager.get_script_files();
/// for (const auto& [key, file] : *scripts) {
///     // file.url, file.position, file.options
/// }
/// ```

#include "fwd.hpp"
#include "definition.hpp"
#include "loader.hpp"
#include "store.hpp"
#include "resolver.hpp"
#include "collector.hpp"
#include "manager.hpp"
