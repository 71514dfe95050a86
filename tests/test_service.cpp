#include <catch2/catch_test_macros.hpp>
#include "engine/manifest.hpp"
#include "engine/service.hpp"
#include "test_support.hpp"

using namespace quire::engine;
using quire::test::TempDir;
using quire::test::write_file;
using nlohmann::json;

namespace {

    ProcessedAsset asset(const std::string& locale, const std::string& version, const std::string& name) {
        ProcessedAsset a;
        a.relative_path = locale + "/" + version + "/assets/" + name;
        a.locale = locale;
        a.version = version;
        a.content_hash = std::string(64, 'f');
        a.hashed_filename = name + ".ffffffff";
        a.public_path = "/public/assets/" + locale + "/" + version + "/images/" + a.hashed_filename;
        return a;
    }

    json call(ResolverService& service, const std::string& method, json params = json::array()) {
        return json::parse(service.handle(json{{"method", method}, {"params", params}}.dump()));
    }

}

TEST_CASE("Resolver service answers manifest queries", "[service]") {
    TempDir dir;
    auto path = dir / kManifestFileName;
    write_file(path, serialize_manifest(generate_manifest({asset("en", "v1", "logo.png"),
                                                           asset("es", "v2", "logo.png")})));

    ManifestCache cache(path);
    ResolverService service(cache, ContextResolver());

    REQUIRE(call(service, "ping")["result"] == "pong");

    auto status = call(service, "status")["result"];
    REQUIRE(status["loaded"] == true);
    REQUIRE(status["asset_count"] == 2);

    SECTION("Exact and fallback resolution") {
        auto exact = call(service, "resolve", {"logo.png", "es", "v2"})["result"];
        REQUIRE(exact["publicPath"] == "/public/assets/es/v2/images/logo.png.ffffffff");
        REQUIRE(exact["fallbackUsed"] == false);
        REQUIRE_FALSE(exact.contains("fallbackType"));
        REQUIRE(exact["entry"]["originalPath"] == "es/v2/assets/logo.png");

        auto fallback = call(service, "resolve", {"logo.png", "pt", "v1"})["result"];
        REQUIRE(fallback["publicPath"] == "/public/assets/en/v1/images/logo.png.ffffffff");
        REQUIRE(fallback["fallbackType"] == "locale");
    }

    SECTION("Misses degrade to the direct path") {
        auto miss = call(service, "resolve", {"missing.pdf", "es", "v2"})["result"];
        REQUIRE(miss["publicPath"] == "/public/assets/es/v2/files/missing.pdf");
        REQUIRE(miss["fallbackUsed"] == true);
        REQUIRE(miss["fallbackType"] == "direct");
    }

    SECTION("Existence, availability and contexts") {
        REQUIRE(call(service, "exists", {"logo.png", "en", "v1"})["result"] == true);
        REQUIRE(call(service, "exists", {"logo.png", "en", "v2"})["result"] == false);

        auto matrix = call(service, "availability", {"logo.png"})["result"];
        REQUIRE(matrix.size() == 4);
        REQUIRE(call(service, "contexts")["result"].size() == 4);
    }

    SECTION("Invalidate reloads on next request") {
        write_file(path, serialize_manifest(generate_manifest({asset("en", "v1", "logo.png")})));
        REQUIRE(call(service, "status")["result"]["asset_count"] == 2);
        REQUIRE(call(service, "invalidate")["result"] == "invalidated");
        REQUIRE(call(service, "status")["result"]["asset_count"] == 1);
    }

    SECTION("Errors") {
        REQUIRE(json::parse(service.handle("not json")).contains("error"));
        REQUIRE(call(service, "frobnicate").contains("error"));
        REQUIRE(call(service, "resolve").contains("error"));
    }

    SECTION("Shutdown is flagged") {
        REQUIRE_FALSE(service.shutdown_requested());
        call(service, "shutdown");
        REQUIRE(service.shutdown_requested());
    }
}

TEST_CASE("Resolver service without a manifest", "[service]") {
    TempDir dir;
    ManifestCache cache(dir / kManifestFileName);
    ResolverService service(cache, ContextResolver());

    REQUIRE(call(service, "status")["result"]["loaded"] == false);
    auto miss = call(service, "resolve", {"/logo.png"})["result"];
    REQUIRE(miss["publicPath"] == "/public/assets/en/v1/images/logo.png");
    REQUIRE(call(service, "contexts")["result"].empty());
}
