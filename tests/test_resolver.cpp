#include <catch2/catch_test_macros.hpp>
#include "engine/resolver.hpp"

using namespace quire::engine;

namespace {

    void add_entry(AssetManifest& manifest, const std::string& locale, const std::string& version,
                   const std::string& name) {
        ManifestEntry e;
        e.original_path = locale + "/" + version + "/assets/" + name;
        e.public_path = "/public/assets/" + locale + "/" + version + "/images/" + name + ".hashed";
        e.locale = locale;
        e.version = version;
        manifest.assets[e.original_path] = e;
    }

    AssetManifest sample_manifest() {
        AssetManifest m;
        add_entry(m, "en", "v1", "logo.png");
        add_entry(m, "en", "v2", "logo.png");
        add_entry(m, "en", "v1", "only-v1.png");
        add_entry(m, "es", "v1", "diagram.png");
        add_entry(m, "en", "v2", "images/chart.png");
        m.locales = {"en", "es"};
        m.versions = {"v1", "v2"};
        return m;
    }

}

TEST_CASE("Exact context wins", "[resolver]") {
    ContextResolver resolver;
    auto manifest = sample_manifest();

    auto result = resolver.resolve("logo.png", {"en", "v2"}, manifest);
    REQUIRE(result.has_value());
    REQUIRE(result->public_path == "/public/assets/en/v2/images/logo.png.hashed");
    REQUIRE_FALSE(result->fallback_used);
    REQUIRE_FALSE(result->fallback_type.has_value());

    SECTION("A leading slash is ignored") {
        auto slashed = resolver.resolve("/logo.png", {"en", "v2"}, manifest);
        REQUIRE(slashed.has_value());
        REQUIRE(slashed->public_path == result->public_path);
    }

    SECTION("Images subdirectory is probed") {
        auto chart = resolver.resolve("chart.png", {"en", "v2"}, manifest);
        REQUIRE(chart.has_value());
        REQUIRE(chart->entry.original_path == "en/v2/assets/images/chart.png");
    }
}

TEST_CASE("Version fallback before locale fallback", "[resolver]") {
    ContextResolver resolver;
    auto manifest = sample_manifest();

    auto diagram = resolver.resolve("diagram.png", {"es", "v2"}, manifest);
    REQUIRE(diagram.has_value());
    REQUIRE(diagram->entry.locale == "es");
    REQUIRE(diagram->entry.version == "v1");
    REQUIRE(diagram->fallback_used);
    REQUIRE(diagram->fallback_type == FallbackType::Version);

    auto logo = resolver.resolve("logo.png", {"es", "v2"}, manifest);
    REQUIRE(logo.has_value());
    REQUIRE(logo->entry.locale == "en");
    REQUIRE(logo->entry.version == "v2");
    REQUIRE(logo->fallback_type == FallbackType::Locale);

    auto old = resolver.resolve("only-v1.png", {"es", "v2"}, manifest);
    REQUIRE(old.has_value());
    REQUIRE(old->entry.locale == "en");
    REQUIRE(old->entry.version == "v1");
    REQUIRE(old->fallback_type == FallbackType::Locale);
}

TEST_CASE("Misses resolve to nothing", "[resolver]") {
    ContextResolver resolver;
    auto manifest = sample_manifest();
    REQUIRE_FALSE(resolver.resolve("nope.png", {"es", "v1"}, manifest).has_value());
    REQUIRE_FALSE(resolver.resolve("logo.png", {"en", "v1"}, AssetManifest{}).has_value());
}

TEST_CASE("Candidate list is ordered and unique", "[resolver]") {
    ContextResolver resolver;
    auto manifest = sample_manifest();

    auto list = resolver.candidates({"es", "v2"}, manifest);
    REQUIRE(list.size() == 4);
    REQUIRE(list[0].context == AssetContext{"es", "v2"});
    REQUIRE_FALSE(list[0].fallback.has_value());
    REQUIRE(list[1].context == AssetContext{"es", "v1"});
    REQUIRE(list[1].fallback == FallbackType::Version);
    REQUIRE(list[2].context == AssetContext{"en", "v2"});
    REQUIRE(list[2].fallback == FallbackType::Locale);
    REQUIRE(list[3].context == AssetContext{"en", "v1"});

    auto default_locale = resolver.candidates({"en", "v1"}, manifest);
    REQUIRE(default_locale.size() == 2);
    REQUIRE(default_locale[1].context == AssetContext{"en", "v2"});
    REQUIRE(default_locale[1].fallback == FallbackType::Version);
}

TEST_CASE("Candidate keys are probed in order", "[resolver]") {
    auto keys = ContextResolver::candidate_keys("logo.png", {"es", "v1"});
    REQUIRE(keys == std::vector<std::string>{
        "es/v1/assets/logo.png",
        "es/v1/assets/images/logo.png",
        "es/v1/assets/files/logo.png",
        "logo.png"
    });
}

TEST_CASE("Direct asset path", "[resolver]") {
    ContextResolver resolver;
    REQUIRE(resolver.generate_direct_asset_path("images/logo.PNG", {"es", "v2"}) ==
            "/public/assets/es/v2/images/logo.PNG");
    REQUIRE(resolver.generate_direct_asset_path("manual.pdf", {"en", "v1"}) == "/public/assets/en/v1/files/manual.pdf");
    REQUIRE(resolver.generate_direct_asset_path("unknown.xyz", {"en", "v1"}) ==
            "/public/assets/en/v1/files/unknown.xyz");
    REQUIRE(resolver.generate_direct_asset_path("dir/", {"en", "v1"}) == "/public/assets/en/v1/files/unknown");
}

TEST_CASE("Contexts and availability", "[resolver]") {
    ContextResolver resolver;
    auto manifest = sample_manifest();

    auto contexts = ContextResolver::all_contexts(manifest);
    REQUIRE(contexts.size() == 4);

    REQUIRE(resolver.exists_in_context("logo.png", {"en", "v1"}, manifest));
    REQUIRE(resolver.exists_in_context("/logo.png", {"en", "v2"}, manifest));
    REQUIRE_FALSE(resolver.exists_in_context("logo.png", {"es", "v1"}, manifest));

    auto matrix = resolver.availability("logo.png", manifest);
    REQUIRE(matrix.size() == 4);
    size_t available = 0;
    for (const auto& item : matrix) {
        if (item.available) ++available;
    }
    REQUIRE(available == 2);
}

TEST_CASE("Context from pathname", "[resolver]") {
    ContextResolver resolver;

    REQUIRE(resolver.version_from_pathname("/en/docs/v1/getting-started") == "v1");
    REQUIRE(resolver.version_from_pathname("/es/v2/docs/guide") == "v2");
    REQUIRE(resolver.version_from_pathname("/en") == "v1");

    REQUIRE(resolver.context_from_pathname("/es/v2/docs/guide") == AssetContext{"es", "v2"});
    REQUIRE(resolver.context_from_pathname("/fr/v3/intro") == AssetContext{"en", "v3"});
    REQUIRE(resolver.context_from_pathname("/") == AssetContext{"en", "v1"});
}
