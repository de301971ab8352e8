// ferry_publish path alias tests

#include <catch2/catch_test_macros.hpp>
#include <ferry/publish/path_resolver.hpp>

using namespace ferry_publish;
using namespace ferry_core;

TEST_CASE("AliasPathResolver plain paths", "[publish][alias]") {
    AliasPathResolver resolver("/srv/app");

    SECTION("absolute paths pass through") {
        auto r = resolver.resolve("/var/www/public");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/var/www/public");
    }

    SECTION("relative paths join the root") {
        auto r = resolver.resolve("resources/js");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/srv/app/resources/js");
    }

    SECTION("paths are normalized") {
        auto r = resolver.resolve("/var/www/../public/");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/var/public");
    }

    SECTION("empty path is rejected") {
        auto r = resolver.resolve("");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("AliasPathResolver aliases", "[publish][alias]") {
    AliasPathResolver resolver("/srv/app");
    resolver.set_alias("@public", "/var/www/public/");
    resolver.set_alias("res", "/srv/app/resources");

    SECTION("registration normalizes names") {
        REQUIRE(resolver.has_alias("@public"));
        REQUIRE(resolver.has_alias("@res"));
        REQUIRE(resolver.has_alias("res/"));
        REQUIRE_FALSE(resolver.has_alias("@web"));
    }

    SECTION("bare alias") {
        auto r = resolver.resolve("@public");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/var/www/public");
    }

    SECTION("alias with a tail") {
        auto r = resolver.resolve("@res/app/main.js");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/srv/app/resources/app/main.js");
    }

    SECTION("longest alias wins on a segment boundary") {
        resolver.set_alias("@res/vendor", "/opt/vendor");

        auto nested = resolver.resolve("@res/vendor/jquery");
        REQUIRE(nested.is_ok());
        REQUIRE(*nested == "/opt/vendor/jquery");

        auto sibling = resolver.resolve("@res/vendors");
        REQUIRE(sibling.is_ok());
        REQUIRE(*sibling == "/srv/app/resources/vendors");
    }

    SECTION("aliases may reference aliases") {
        resolver.set_alias("@assets", "@public/assets");
        auto r = resolver.resolve("@assets/app");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/var/www/public/assets/app");
    }

    SECTION("relative alias values join the root") {
        resolver.set_alias("@build", "build/out");
        auto r = resolver.resolve("@build");
        REQUIRE(r.is_ok());
        REQUIRE(*r == "/srv/app/build/out");
    }

    SECTION("unknown alias") {
        auto r = resolver.resolve("@web/app.js");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("self-referencing alias is cut off") {
        resolver.set_alias("@loop", "@loop/again");
        auto r = resolver.resolve("@loop");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidState);
    }

    SECTION("removal") {
        REQUIRE(resolver.remove_alias("public"));
        REQUIRE_FALSE(resolver.remove_alias("@public"));
        REQUIRE(resolver.resolve("@public").is_err());
    }
}
