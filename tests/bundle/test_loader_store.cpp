// ferry_bundle loader and store tests

#include <catch2/catch_test_macros.hpp>
#include <ferry/bundle/loader.hpp>
#include <ferry/bundle/store.hpp>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ferry_bundle;
using namespace ferry_core;
namespace fs = std::filesystem;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

fs::path get_test_bundles_dir() {
    return fs::path(__FILE__).parent_path() / "test_bundles";
}

/// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        m_path = fs::temp_directory_path() /
            ("ferry_loader_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

BundleDefinition make_bundle(const std::string& name, std::vector<std::string> deps = {}) {
    BundleDefinition def;
    def.name = name;
    def.dependencies = std::move(deps);
    def.script_entries = {name + ".js"};
    return def;
}

/// Loader that counts calls and can be slowed down, made to fail or made to throw
class CountingLoader final : public BundleLoader {
public:
    Result<BundleDefinition> load(const std::string& name) const override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throws_left.load() > 0) {
            --throws_left;
            if (throw_int) {
                throw 42;
            }
            throw std::runtime_error("manifest read failed");
        }
        if (fail) {
            return Err<BundleDefinition>(BundleError::invalid_configuration(name, "loader failure"));
        }
        return Ok(make_bundle(name));
    }

    const char* name() const override { return "CountingLoader"; }

    mutable std::atomic<int> calls{0};
    mutable std::atomic<int> throws_left{0};
    bool throw_int = false;
    std::atomic<bool> fail{false};
    std::chrono::milliseconds delay{0};
};

} // anonymous namespace

// =============================================================================
// FactoryBundleLoader
// =============================================================================

TEST_CASE("FactoryBundleLoader", "[bundle][loader]") {
    FactoryBundleLoader loader;
    loader.register_definition(make_bundle("jquery"));
    loader.register_factory("app", [] { return make_bundle("app", {"jquery"}); });

    REQUIRE(loader.has_factory("jquery"));
    REQUIRE(loader.has_factory("app"));
    REQUIRE_FALSE(loader.has_factory("missing"));
    REQUIRE(std::string(loader.name()) == "FactoryBundleLoader");

    SECTION("load by name") {
        auto r = loader.load("app");
        REQUIRE(r.is_ok());
        REQUIRE(r->name == "app");
        REQUIRE(r->dependencies == std::vector<std::string>{"jquery"});
    }

    SECTION("each load builds a fresh definition") {
        int built = 0;
        loader.register_factory("counted", [&built] {
            ++built;
            return make_bundle("counted");
        });
        REQUIRE(loader.load("counted").is_ok());
        REQUIRE(loader.load("counted").is_ok());
        REQUIRE(built == 2);
    }

    SECTION("unnamed definitions take the registered name") {
        loader.register_factory("anonymous", [] { return BundleDefinition{}; });
        auto r = loader.load("anonymous");
        REQUIRE(r.is_ok());
        REQUIRE(r->name == "anonymous");
    }

    SECTION("unknown bundle") {
        auto r = loader.load("missing");
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
    }

    SECTION("empty factory is unknown") {
        loader.register_factory("hollow", nullptr);
        REQUIRE(loader.load("hollow").is_err());
    }
}

// =============================================================================
// ManifestBundleLoader
// =============================================================================

TEST_CASE("ManifestBundleLoader scans a directory", "[bundle][loader]") {
    ManifestBundleLoader loader(get_test_bundles_dir());

    auto scanned = loader.scan();
    REQUIRE(scanned.is_ok());
    REQUIRE(*scanned == 4);

    auto names = loader.names();
    REQUIRE(names == std::vector<std::string>{"app", "bootstrap", "jquery", "renamed"});

    SECTION("indexed bundles load") {
        auto r = loader.load("bootstrap");
        REQUIRE(r.is_ok());
        REQUIRE(r->dependencies == std::vector<std::string>{"jquery"});
    }

    SECTION("a manifest is indexed by the name it declares") {
        auto r = loader.load("renamed");
        REQUIRE(r.is_ok());
        REQUIRE(r->script_entries.size() == 1);
    }

    SECTION("file name and declared name must agree") {
        auto r = loader.load("misnamed");
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
    }

    SECTION("unknown bundle") {
        auto r = loader.load("nope");
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
    }
}

TEST_CASE("ManifestBundleLoader without a scan", "[bundle][loader]") {
    ManifestBundleLoader loader(get_test_bundles_dir());
    REQUIRE(loader.names().empty());

    auto r = loader.load("jquery");
    REQUIRE(r.is_ok());
    REQUIRE(r->is_remote);
    REQUIRE(r->base_url == "https://code.jquery.com");
    REQUIRE(r->script_position == 1);
}

TEST_CASE("ManifestBundleLoader scan errors", "[bundle][loader]") {
    TempDir tmp;

    SECTION("missing directory") {
        ManifestBundleLoader loader(tmp.path() / "missing");
        auto r = loader.scan();
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("not a directory") {
        write_file(tmp.path() / "file.txt", "x");
        ManifestBundleLoader loader(tmp.path() / "file.txt");
        auto r = loader.scan();
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("a broken manifest fails the scan") {
        write_file(tmp.path() / "good.bundle.json", R"({"js": ["good.js"]})");
        write_file(tmp.path() / "bad.bundle.json", R"({"js": )");
        ManifestBundleLoader loader(tmp.path());
        auto r = loader.scan();
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
    }

    SECTION("other files are ignored") {
        write_file(tmp.path() / "one.bundle.json", "{}");
        write_file(tmp.path() / "notes.json", "not json");
        write_file(tmp.path() / "nested" / "two.bundle.json", "{}");
        ManifestBundleLoader loader(tmp.path());
        auto r = loader.scan();
        REQUIRE(r.is_ok());
        REQUIRE(*r == 1);
        REQUIRE(loader.names() == std::vector<std::string>{"one"});

        SECTION("recursive scan") {
            auto deep = loader.scan(true);
            REQUIRE(deep.is_ok());
            REQUIRE(loader.names() == std::vector<std::string>{"one", "two"});
            REQUIRE(loader.load("two").is_ok());
        }
    }

    SECTION("duplicate names keep the first") {
        write_file(tmp.path() / "a" / "dup.bundle.json", R"({"js": ["a.js"]})");
        write_file(tmp.path() / "b" / "dup.bundle.json", R"({"js": ["b.js"]})");
        ManifestBundleLoader loader(tmp.path());
        auto r = loader.scan(true);
        REQUIRE(r.is_ok());
        REQUIRE(*r == 1);
    }
}

TEST_CASE("ManifestBundleLoader manifest paths", "[bundle][loader]") {
    REQUIRE(ManifestBundleLoader::is_manifest_path("dir/app.bundle.json"));
    REQUIRE_FALSE(ManifestBundleLoader::is_manifest_path("dir/app.json"));
    REQUIRE_FALSE(ManifestBundleLoader::is_manifest_path(".bundle.json"));
}

// =============================================================================
// BundleStore
// =============================================================================

TEST_CASE("BundleStore loads each bundle once", "[bundle][store]") {
    auto loader = std::make_shared<CountingLoader>();
    BundleStore store(loader);

    auto first = store.load("app");
    REQUIRE(first.is_ok());
    REQUIRE((*first)->name == "app");
    REQUIRE(store.is_loaded("app"));
    REQUIRE(store.size() == 1);

    auto second = store.load("app");
    REQUIRE(second.is_ok());
    REQUIRE(second->get() == first->get());
    REQUIRE(loader->calls.load() == 1);

    REQUIRE(store.load("other").is_ok());
    REQUIRE(loader->calls.load() == 2);
    REQUIRE(store.size() == 2);
}

TEST_CASE("BundleStore does not cache failures", "[bundle][store]") {
    auto loader = std::make_shared<CountingLoader>();
    loader->fail = true;
    BundleStore store(loader);

    auto failed = store.load("app");
    REQUIRE(failed.is_err());
    REQUIRE_FALSE(store.is_loaded("app"));

    loader->fail = false;
    auto retried = store.load("app");
    REQUIRE(retried.is_ok());
    REQUIRE(loader->calls.load() == 2);
}

TEST_CASE("BundleStore recovers from a throwing loader", "[bundle][store]") {
    auto loader = std::make_shared<CountingLoader>();
    BundleStore store(loader);

    SECTION("std::exception becomes an error") {
        loader->throws_left = 1;

        auto failed = store.load("app");
        REQUIRE(failed.is_err());
        REQUIRE(failed.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
        REQUIRE(failed.error().message().find("manifest read failed") != std::string::npos);
        REQUIRE_FALSE(store.is_loaded("app"));

        auto retried = store.load("app");
        REQUIRE(retried.is_ok());
        REQUIRE((*retried)->name == "app");
        REQUIRE(loader->calls.load() == 2);
    }

    SECTION("other exceptions propagate and the name stays loadable") {
        loader->throws_left = 1;
        loader->throw_int = true;

        REQUIRE_THROWS_AS((void)store.load("app"), int);

        auto retried = store.load("app");
        REQUIRE(retried.is_ok());
        REQUIRE(loader->calls.load() == 2);
    }

    SECTION("factory exceptions") {
        int attempts = 0;
        auto factories = std::make_shared<FactoryBundleLoader>();
        factories->register_factory("jquery", [&attempts] {
            if (++attempts == 1) {
                throw std::runtime_error("factory not ready");
            }
            return make_bundle("jquery");
        });
        BundleStore factory_store(factories);

        REQUIRE(factory_store.load("jquery").is_err());
        REQUIRE(factory_store.load("jquery").is_ok());
        REQUIRE(attempts == 2);
    }
}

TEST_CASE("BundleStore applies customizations", "[bundle][store]") {
    auto loader = std::make_shared<CountingLoader>();

    BundleCustomization disabled;
    disabled.disabled = true;

    BundleCustomization remote;
    remote.overrides = {{"cdn", true}, {"baseUrl", "https://cdn.example.com"}};

    BundleCustomization broken;
    broken.overrides = {{"js", "not-an-array"}};

    BundleStore store(loader, {{"legacy", disabled}, {"jquery", remote}, {"broken", broken}});
    REQUIRE(store.customizations().size() == 3);

    SECTION("disabled bundles skip the loader") {
        auto r = store.load("legacy");
        REQUIRE(r.is_ok());
        REQUIRE((*r)->name == "legacy");
        REQUIRE((*r)->script_entries.empty());
        REQUIRE(loader->calls.load() == 0);
    }

    SECTION("overrides are merged into the loaded definition") {
        auto r = store.load("jquery");
        REQUIRE(r.is_ok());
        REQUIRE((*r)->is_remote);
        REQUIRE((*r)->base_url == "https://cdn.example.com");
        REQUIRE((*r)->script_entries.size() == 1);
        REQUIRE(loader->calls.load() == 1);
    }

    SECTION("invalid overrides fail the load") {
        auto r = store.load("broken");
        REQUIRE(r.is_err());
        REQUIRE_FALSE(store.is_loaded("broken"));
    }
}

TEST_CASE("BundleStore without a loader", "[bundle][store]") {
    BundleCustomization disabled;
    disabled.disabled = true;
    BundleStore store(nullptr, {{"off", disabled}});

    REQUIRE(store.load("off").is_ok());

    auto r = store.load("app");
    REQUIRE(r.is_err());
    REQUIRE(r.error().is_bundle_error(BundleError::Kind::InvalidConfiguration));
}

TEST_CASE("BundleStore concurrent loads share one result", "[bundle][store]") {
    auto loader = std::make_shared<CountingLoader>();
    loader->delay = std::chrono::milliseconds(20);
    BundleStore store(loader);

    constexpr int THREADS = 8;
    std::vector<BundleStore::DefinitionPtr> results(THREADS);
    std::vector<std::thread> threads;
    threads.reserve(THREADS);

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&store, &results, i] {
            auto r = store.load("shared");
            if (r.is_ok()) {
                results[static_cast<std::size_t>(i)] = *r;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(loader->calls.load() == 1);
    REQUIRE(std::all_of(results.begin(), results.end(),
        [&](const BundleStore::DefinitionPtr& p) { return p && p == results[0]; }));
}
