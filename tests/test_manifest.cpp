#include <catch2/catch_test_macros.hpp>
#include "engine/manifest.hpp"
#include "quire/errors.hpp"
#include "test_support.hpp"

using namespace quire::engine;
using quire::test::TempDir;
using quire::test::write_file;

namespace {

    ProcessedAsset make_asset(const std::string& locale, const std::string& version, const std::string& name,
                              const std::string& hash) {
        ProcessedAsset a;
        a.relative_path = locale + "/" + version + "/assets/" + name;
        a.source_path = "content/" + a.relative_path;
        a.locale = locale;
        a.version = version;
        a.type = AssetType::Image;
        a.content_hash = hash;
        a.hashed_filename = "x." + hash.substr(0, 8) + ".png";
        a.public_path = "/public/assets/" + locale + "/" + version + "/images/" + a.hashed_filename;
        a.file_size = 2048;
        a.mime_type = "image/png";
        a.last_modified = "2024-05-01T12:00:00.000Z";
        return a;
    }

}

TEST_CASE("Manifest generation", "[manifest]") {
    std::vector<ProcessedAsset> assets = {
        make_asset("es", "v2", "logo.png", std::string(64, 'b')),
        make_asset("en", "v1", "logo.png", std::string(64, 'a')),
        make_asset("en", "v2", "logo.png", std::string(64, 'c'))
    };
    assets[1].dimensions = ImageDimensions{100, 50};
    AssetDerivative webp;
    webp.variant = "webp";
    webp.hashed_filename = "x.aaaaaaaa.webp";
    webp.public_path = "/public/assets/en/v1/images/x.aaaaaaaa.webp";
    assets[1].derivatives.push_back(webp);

    auto manifest = generate_manifest(assets);

    REQUIRE(manifest.version == kManifestSchemaVersion);
    REQUIRE_FALSE(manifest.generated_at.empty());
    REQUIRE(manifest.assets.size() == 3);
    REQUIRE(manifest.locales == std::vector<std::string>{"en", "es"});
    REQUIRE(manifest.versions == std::vector<std::string>{"v1", "v2"});

    const auto& entry = manifest.assets.at("en/v1/assets/logo.png");
    REQUIRE(entry.original_path == "en/v1/assets/logo.png");
    REQUIRE(entry.content_hash == std::string(64, 'a'));
    REQUIRE(entry.dimensions == ImageDimensions{100, 50});
    REQUIRE(entry.derivatives.count("webp") == 1);
    REQUIRE(entry.metadata.optimized);
    REQUIRE(entry.metadata.security_scanned);
    REQUIRE(entry.metadata.last_modified == "2024-05-01T12:00:00.000Z");

    REQUIRE_FALSE(manifest.assets.at("es/v2/assets/logo.png").metadata.optimized);

    SECTION("Security flag is recorded") {
        auto unscanned = generate_manifest(assets, false);
        REQUIRE_FALSE(unscanned.assets.at("en/v1/assets/logo.png").metadata.security_scanned);
    }
}

TEST_CASE("Manifest entries are stable across builds", "[manifest]") {
    std::vector<ProcessedAsset> assets = {make_asset("en", "v1", "logo.png", std::string(64, 'a'))};

    auto first = generate_manifest(assets);
    auto second = generate_manifest(assets);
    second.generated_at = first.generated_at;

    REQUIRE(serialize_manifest(first) == serialize_manifest(second));
}

TEST_CASE("Empty input yields an empty manifest", "[manifest]") {
    auto manifest = generate_manifest({});
    REQUIRE(manifest.assets.empty());
    REQUIRE(manifest.locales.empty());
    REQUIRE(manifest.versions.empty());

    auto j = nlohmann::json::parse(serialize_manifest(manifest));
    REQUIRE(j["assets"].is_object());
    REQUIRE(j["assets"].empty());
}

TEST_CASE("Manifest JSON uses the published key names", "[manifest]") {
    auto manifest = generate_manifest({make_asset("en", "v1", "logo.png", std::string(64, 'a'))});
    auto j = nlohmann::json::parse(serialize_manifest(manifest));

    REQUIRE(j.contains("generatedAt"));
    const auto& entry = j["assets"]["en/v1/assets/logo.png"];
    for (const char* key : {"publicPath", "hashedFilename", "contentHash", "originalPath", "fileSize",
                            "mimeType", "locale", "version", "derivatives", "metadata"}) {
        INFO(key);
        REQUIRE(entry.contains(key));
    }
    REQUIRE_FALSE(entry.contains("dimensions"));
    REQUIRE(entry["derivatives"].is_object());
    REQUIRE(entry["metadata"].contains("lastModified"));
    REQUIRE(entry["metadata"].contains("securityScanned"));
}

TEST_CASE("Manifest loads back from disk", "[manifest]") {
    TempDir dir;
    auto asset = make_asset("en", "v1", "logo.png", std::string(64, 'a'));
    asset.dimensions = ImageDimensions{8, 4};
    auto manifest = generate_manifest({asset});
    write_file(dir / kManifestFileName, serialize_manifest(manifest));

    auto loaded = load_manifest(dir / kManifestFileName);
    REQUIRE(loaded.generated_at == manifest.generated_at);
    REQUIRE(loaded.assets.size() == 1);
    REQUIRE(loaded.assets.at("en/v1/assets/logo.png").public_path == asset.public_path);
    REQUIRE(loaded.assets.at("en/v1/assets/logo.png").dimensions == ImageDimensions{8, 4});

    SECTION("Malformed or missing files raise ManifestError") {
        write_file(dir / "broken.json", "{\"version\": ");
        REQUIRE_THROWS_AS(load_manifest(dir / "broken.json"), ManifestError);
        REQUIRE_THROWS_AS(load_manifest(dir / "absent.json"), ManifestError);
    }
}

TEST_CASE("Manifest cache swaps snapshots on invalidate", "[manifest]") {
    TempDir dir;
    auto path = dir / kManifestFileName;
    ManifestCache cache(path);

    SECTION("Missing manifest yields a null snapshot") {
        REQUIRE(cache.get() == nullptr);
        REQUIRE_FALSE(cache.loaded());
    }

    SECTION("Old snapshots outlive invalidation") {
        write_file(path, serialize_manifest(generate_manifest({make_asset("en", "v1", "a.png", std::string(64, 'a'))})));
        auto before = cache.get();
        REQUIRE(before);
        REQUIRE(cache.loaded());
        REQUIRE(cache.get() == before);

        write_file(path, serialize_manifest(generate_manifest({
            make_asset("en", "v1", "a.png", std::string(64, 'a')),
            make_asset("es", "v1", "b.png", std::string(64, 'b'))
        })));
        REQUIRE(cache.get()->assets.size() == 1);

        cache.invalidate();
        REQUIRE_FALSE(cache.loaded());

        auto after = cache.get();
        REQUIRE(after->assets.size() == 2);
        REQUIRE(before->assets.size() == 1);
    }
}
