// ferry_bundle FileCollector tests

#include <catch2/catch_test_macros.hpp>
#include <ferry/bundle/collector.hpp>
#include <ferry/bundle/loader.hpp>
#include <ferry/bundle/resolver.hpp>
#include <ferry/bundle/store.hpp>

#include "../support/fake_filesystem.hpp"

#include <memory>

using namespace ferry_bundle;
using namespace ferry_core;
using ferry_test::FakeFilesystem;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

constexpr const char* ASSET_DIR = "/var/www/assets";

/// A local bundle served from ASSET_DIR under /assets
BundleDefinition local_bundle(const std::string& name,
                              std::vector<nlohmann::json> scripts,
                              std::vector<std::string> deps = {}) {
    BundleDefinition def;
    def.name = name;
    def.dependencies = std::move(deps);
    def.script_entries = std::move(scripts);
    def.base_path = ASSET_DIR;
    def.base_url = "/assets";
    return def;
}

/// Registers bundles without publishing and collects their files
struct Fixture {
    std::shared_ptr<FactoryBundleLoader> loader = std::make_shared<FactoryBundleLoader>();
    std::shared_ptr<FakeFilesystem> filesystem = std::make_shared<FakeFilesystem>();
    BundleStore store{loader};
    DependencyResolver resolver{store, nullptr};
    RegistrationSession session;

    void add(BundleDefinition def) { loader->register_definition(std::move(def)); }

    void add_files(std::initializer_list<const char*> names) {
        for (const char* name : names) {
            filesystem->add_file(std::string(ASSET_DIR) + "/" + name);
        }
    }

    void register_bundle(const std::string& name, std::optional<int> script_position = std::nullopt) {
        auto r = resolver.register_bundle(session, name, script_position);
        REQUIRE(r.is_ok());
    }

    FileCollector collector(std::map<std::string, std::string> asset_map = {}) const {
        return FileCollector(filesystem, std::move(asset_map));
    }

    /// Collect one bundle and return the error, if any
    Result<void> collect(FileCollector& collector, const std::string& name) const {
        return collector.collect(session, name);
    }
};

bool is_bundle_error(const Result<void>& r, BundleError::Kind kind) {
    return r.is_err() && r.error().is_bundle_error(kind);
}

std::vector<std::string> keys_of(const FileCollection& files) {
    std::vector<std::string> keys;
    for (const auto& [key, entry] : files) {
        keys.push_back(key);
    }
    return keys;
}

} // anonymous namespace

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("FileCollector collects dependencies first", "[bundle][collector]") {
    Fixture f;
    f.add(local_bundle("base", {"base.js"}));
    f.add(local_bundle("widgets", {"widgets.js"}, {"base"}));
    f.add(local_bundle("app", {"app.js"}, {"widgets", "base"}));
    f.add_files({"base.js", "widgets.js", "app.js"});
    f.register_bundle("app");

    auto collector = f.collector();
    REQUIRE(f.collect(collector, "app").is_ok());

    REQUIRE(keys_of(collector.script_files()) ==
            std::vector<std::string>{"/assets/base.js", "/assets/widgets.js", "/assets/app.js"});
    REQUIRE(collector.script_files().at("/assets/app.js").url == "/assets/app.js");
    REQUIRE(collector.style_files().empty());

    SECTION("collecting again adds nothing") {
        REQUIRE(f.collect(collector, "widgets").is_ok());
        REQUIRE(collector.script_files().size() == 3);
    }

    SECTION("collect_all follows registration order") {
        FileCollector all = f.collector();
        REQUIRE(all.collect_all(f.session).is_ok());
        REQUIRE(keys_of(all.script_files()) == keys_of(collector.script_files()));
    }

    SECTION("clear") {
        collector.clear();
        REQUIRE(collector.script_files().empty());
        REQUIRE(f.collect(collector, "base").is_ok());
        REQUIRE(collector.script_files().size() == 1);
    }
}

TEST_CASE("FileCollector keys: last write wins in place", "[bundle][collector]") {
    Fixture f;
    f.add(local_bundle("A", {"a.js", {{"url", "shared-a.js"}, {"key", "shared"}}}));
    f.add(local_bundle("B", {{{"url", "shared-b.js"}, {"key", "shared"}}, "b.js"}, {"A"}));
    f.add_files({"a.js", "shared-a.js", "shared-b.js", "b.js"});
    f.register_bundle("B");

    auto collector = f.collector();
    REQUIRE(f.collect(collector, "B").is_ok());

    const auto& scripts = collector.script_files();
    REQUIRE(keys_of(scripts) == std::vector<std::string>{"/assets/a.js", "shared", "/assets/b.js"});
    REQUIRE(scripts.at("shared").url == "/assets/shared-b.js");
}

TEST_CASE("FileCollector rejects unregistered bundles", "[bundle][collector]") {
    Fixture f;
    auto collector = f.collector();
    REQUIRE(is_bundle_error(f.collect(collector, "ghost"), BundleError::Kind::InvalidConfiguration));
}

// =============================================================================
// Entries, Options and Positions
// =============================================================================

TEST_CASE("FileCollector entry forms and options", "[bundle][collector]") {
    Fixture f;
    auto def = local_bundle("app", {
        "plain.js",
        {{"url", "inline.js"}, {"defer", false}, {"id", "main"}},
        nlohmann::json::array({"array.js", 1, {{"async", true}}}),
        {{"url", "nested.js"}, {"options", {{"crossorigin", "anonymous"}}}, {"position", 4}},
    });
    def.script_options = {{"defer", true}};
    def.style_entries = {"site.css", {{"url", "print.css"}, {"media", "print"}}};
    def.style_options = {{"media", "screen"}};
    f.add(def);
    f.add_files({"plain.js", "inline.js", "array.js", "nested.js", "site.css", "print.css"});
    f.register_bundle("app");

    auto collector = f.collector();
    REQUIRE(f.collect(collector, "app").is_ok());
    const auto& scripts = collector.script_files();

    SECTION("defaults fill missing options") {
        REQUIRE(scripts.at("/assets/plain.js").options == nlohmann::json{{"defer", true}});
        REQUIRE(scripts.at("/assets/array.js").options == nlohmann::json{{"async", true}, {"defer", true}});
        REQUIRE(scripts.at("/assets/nested.js").options ==
                nlohmann::json{{"crossorigin", "anonymous"}, {"defer", true}});
    }

    SECTION("entry options win over defaults") {
        REQUIRE(scripts.at("/assets/inline.js").options == nlohmann::json{{"defer", false}, {"id", "main"}});
    }

    SECTION("positions") {
        REQUIRE(scripts.at("/assets/plain.js").position == position::end);
        REQUIRE(scripts.at("/assets/array.js").position == 1);
        REQUIRE(scripts.at("/assets/nested.js").position == 4);
    }

    SECTION("styles") {
        const auto& styles = collector.style_files();
        REQUIRE(styles.at("/assets/site.css").position == position::head);
        REQUIRE(styles.at("/assets/site.css").options == nlohmann::json{{"media", "screen"}});
        REQUIRE(styles.at("/assets/print.css").options == nlohmann::json{{"media", "print"}});
    }
}

TEST_CASE("FileCollector uses the bundle position as fallback", "[bundle][collector]") {
    Fixture f;
    f.add(local_bundle("app", {"app.js", nlohmann::json::array({"first.js", position::head})}));
    f.add_files({"app.js", "first.js"});
    f.register_bundle("app", position::ready);

    auto collector = f.collector();
    REQUIRE(f.collect(collector, "app").is_ok());
    REQUIRE(collector.script_files().at("/assets/app.js").position == position::ready);
    REQUIRE(collector.script_files().at("/assets/first.js").position == position::head);
}

TEST_CASE("FileCollector rejects malformed entries", "[bundle][collector]") {
    const std::vector<nlohmann::json> bad_entries = {
        "",
        5,
        nullptr,
        nlohmann::json::array(),
        nlohmann::json::array({"a.js", "not-a-position"}),
        nlohmann::json::array({3}),
        {{"path", "a.js"}},
        {{"url", 3}},
        {{"url", "a.js"}, {"key", ""}},
        {{"url", "a.js"}, {"key", 7}},
        {{"url", "a.js"}, {"position", "1"}},
        nlohmann::json::array({"a.js", 4294967301LL}),
        nlohmann::json::array({"a.js", -4294967296LL}),
        {{"url", "a.js"}, {"position", 4294967301LL}},
        {{"url", "a.js"}, {"options", nlohmann::json::array()}},
    };

    for (const auto& entry : bad_entries) {
        Fixture f;
        f.add(local_bundle("app", {entry}));
        f.add_files({"a.js"});
        f.register_bundle("app");

        auto collector = f.collector();
        INFO("entry: " << entry.dump());
        REQUIRE(is_bundle_error(f.collect(collector, "app"), BundleError::Kind::InvalidFileEntry));
    }
}

TEST_CASE("FileCollector validates default options", "[bundle][collector]") {
    Fixture f;
    f.add_files({"a.js"});

    SECTION("numeric keys") {
        auto def = local_bundle("app", {"a.js"});
        def.script_options = {{"0", "defer"}};
        f.add(def);
        f.register_bundle("app");
        auto collector = f.collector();
        REQUIRE(is_bundle_error(f.collect(collector, "app"), BundleError::Kind::InvalidFileEntry));
    }

    SECTION("not an object") {
        auto def = local_bundle("app", {"a.js"});
        def.script_options = nlohmann::json::array({"defer"});
        f.add(def);
        f.register_bundle("app");
        auto collector = f.collector();
        REQUIRE(is_bundle_error(f.collect(collector, "app"), BundleError::Kind::InvalidFileEntry));
    }

    SECTION("null means no defaults") {
        auto def = local_bundle("app", {"a.js"});
        def.script_options = nullptr;
        f.add(def);
        f.register_bundle("app");
        auto collector = f.collector();
        REQUIRE(f.collect(collector, "app").is_ok());
        REQUIRE(collector.script_files().at("/assets/a.js").options.empty());
    }
}

// =============================================================================
// URL Resolution
// =============================================================================

TEST_CASE("FileCollector resolves local URLs", "[bundle][collector]") {
    auto filesystem = std::make_shared<FakeFilesystem>();
    filesystem->add_file("/var/www/assets/js/app.js");
    FileCollector collector(filesystem);
    auto bundle = local_bundle("app", {});

    SECTION("existing file") {
        auto r = collector.resolve_url(bundle, "js/app.js");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/assets/js/app.js");
    }

    SECTION("trailing slash on the base URL") {
        bundle.base_url = "/assets/";
        REQUIRE(*collector.resolve_url(bundle, "js/app.js") == "/assets/js/app.js");
    }

    SECTION("missing file") {
        auto r = collector.resolve_url(bundle, "js/missing.js");
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::FileNotFound));
        REQUIRE(r.error().as<BundleError>()->path == "/var/www/assets/js/missing.js");
    }

    SECTION("absolute and external URLs skip the file check") {
        REQUIRE(*collector.resolve_url(bundle, "/js/site.js") == "/js/site.js");
        REQUIRE(*collector.resolve_url(bundle, "https://example.com/x.js") == "https://example.com/x.js");
        REQUIRE(*collector.resolve_url(bundle, "//example.com/x.js") == "//example.com/x.js");
    }

    SECTION("basePath and baseUrl are required") {
        auto no_path = bundle;
        no_path.base_path.reset();
        auto r = collector.resolve_url(no_path, "js/app.js");
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::MissingConfiguration));

        auto no_url = bundle;
        no_url.base_url.reset();
        REQUIRE(collector.resolve_url(no_url, "/js/site.js").error().is_bundle_error(
            BundleError::Kind::MissingConfiguration));
    }
}

TEST_CASE("FileCollector resolves remote URLs", "[bundle][collector]") {
    auto filesystem = std::make_shared<FakeFilesystem>();
    FileCollector collector(filesystem);

    BundleDefinition cdn;
    cdn.name = "cdn";
    cdn.is_remote = true;
    cdn.base_url = "https://cdn.example.com/lib";

    REQUIRE(*collector.resolve_url(cdn, "x.js") == "https://cdn.example.com/lib/x.js");
    REQUIRE(*collector.resolve_url(cdn, "https://other.example.com/y.js") == "https://other.example.com/y.js");
    REQUIRE(*collector.resolve_url(cdn, "//other.example.com/z.js") == "//other.example.com/z.js");

    SECTION("without a base URL") {
        cdn.base_url.reset();
        REQUIRE(*collector.resolve_url(cdn, "x.js") == "x.js");
    }
}

TEST_CASE("FileCollector remaps assets", "[bundle][collector]") {
    auto filesystem = std::make_shared<FakeFilesystem>();
    auto bundle = local_bundle("app", {});
    bundle.source_path = "@res/app";

    SECTION("suffix of the source path") {
        FileCollector collector(filesystem, {{"foo/bar.js", "foo/bar.min.js"}});
        auto r = collector.resolve_url(bundle, "lib/foo/bar.js");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "foo/bar.min.js");
        REQUIRE_FALSE(collector.resolve_remap(bundle, "lib/foo/baz.js").has_value());
    }

    SECTION("the bundle source path takes part in the match") {
        FileCollector collector(filesystem, {{"app/main.js", "/cdn/main.js"}});
        REQUIRE(collector.resolve_remap(bundle, "main.js") == "/cdn/main.js");
    }

    SECTION("exact key wins") {
        FileCollector collector(filesystem, {
            {"jquery.js", "https://cdn.example.com/jquery.min.js"},
            {"app/jquery.js", "/wrong.js"},
        });
        REQUIRE(collector.resolve_remap(bundle, "jquery.js") == "https://cdn.example.com/jquery.min.js");
    }

    SECTION("longest suffix wins") {
        FileCollector collector(filesystem, {
            {"bar.js", "/short.js"},
            {"foo/bar.js", "/long.js"},
        });
        REQUIRE(collector.resolve_remap(bundle, "lib/foo/bar.js") == "/long.js");
        REQUIRE(collector.resolve_remap(bundle, "lib/other/bar.js") == "/short.js");
    }

    SECTION("multi-byte paths") {
        FileCollector collector(filesystem, {{"\xC3\xBC" "ber/\xC3\xA9t\xC3\xA9.js", "/ete.js"}});
        REQUIRE(collector.resolve_remap(bundle, "lib/\xC3\xBC" "ber/\xC3\xA9t\xC3\xA9.js") == "/ete.js");
        REQUIRE_FALSE(collector.resolve_remap(bundle, "lib/uber/ete.js").has_value());
    }

    SECTION("remapped files skip the file check") {
        FileCollector collector(filesystem, {{"missing.js", "/elsewhere/missing.js"}});
        REQUIRE(*collector.resolve_url(bundle, "missing.js") == "/elsewhere/missing.js");
    }

    SECTION("empty map") {
        FileCollector collector(filesystem);
        REQUIRE_FALSE(collector.resolve_remap(bundle, "anything.js").has_value());
    }
}

TEST_CASE("FileCollector relative URL detection", "[bundle][collector]") {
    REQUIRE(FileCollector::is_relative_url("js/app.js"));
    REQUIRE(FileCollector::is_relative_url("/js/app.js"));
    REQUIRE_FALSE(FileCollector::is_relative_url("//cdn.example.com/app.js"));
    REQUIRE_FALSE(FileCollector::is_relative_url("https://cdn.example.com/app.js"));
}
