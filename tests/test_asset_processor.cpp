#include <catch2/catch_test_macros.hpp>
#include "engine/asset_processor.hpp"
#include "quire/errors.hpp"
#include "test_support.hpp"

using namespace quire::engine;
using quire::test::TempDir;
using quire::test::write_file;
using quire::test::png_bytes;

namespace {

    AssetReference make_ref(const TempDir& dir, const std::string& rel, AssetType type) {
        AssetReference ref;
        ref.source_path = dir / rel;
        ref.relative_path = rel;
        auto first = rel.find('/');
        auto second = rel.find('/', first + 1);
        ref.locale = rel.substr(0, first);
        ref.version = rel.substr(first + 1, second - first - 1);
        ref.type = type;
        return ref;
    }

    class FailingOptimizer : public ImageOptimizer {
    public:
        int calls = 0;

        ImageDimensions get_image_dimensions(const std::filesystem::path&) override {
            ++calls;
            throw std::runtime_error("decoder unavailable");
        }
        std::vector<AssetDerivative> generate_responsive_variants(const ProcessedAsset&,
                                                                  const ResponsiveVariantOptions&) override {
            ++calls;
            throw std::runtime_error("resize failed");
        }
        std::vector<AssetDerivative> convert_to_modern_formats(const ProcessedAsset&,
                                                               const ModernFormatOptions&) override {
            ++calls;
            throw std::runtime_error("encoder missing");
        }
    };

    class StubOptimizer : public ImageOptimizer {
    public:
        ImageDimensions get_image_dimensions(const std::filesystem::path&) override {
            return {64, 32};
        }
        std::vector<AssetDerivative> generate_responsive_variants(const ProcessedAsset& asset,
                                                                  const ResponsiveVariantOptions&) override {
            AssetDerivative retina;
            retina.variant = "@2x";
            retina.hashed_filename = "logo@2x.deadbeef.png";
            retina.public_path = derivative_public_path(asset, retina.hashed_filename);
            retina.file_size = 10;
            return {retina};
        }
        std::vector<AssetDerivative> convert_to_modern_formats(const ProcessedAsset& asset,
                                                               const ModernFormatOptions&) override {
            AssetDerivative webp;
            webp.variant = "webp";
            webp.hashed_filename = "logo.deadbeef.webp";
            webp.public_path = derivative_public_path(asset, webp.hashed_filename);
            webp.file_size = 8;
            return {webp};
        }
    };

}

TEST_CASE("Scoped asset paths", "[processor]") {
    AssetProcessor processor;

    REQUIRE(processor.generate_scoped_asset_path("en", "v1", AssetType::Image, "logo.a1b2c3d4.png") ==
            "/public/assets/en/v1/images/logo.a1b2c3d4.png");
    REQUIRE(processor.generate_scoped_asset_path("es", "v2", AssetType::Binary, "guide.0f0f0f0f.pdf") ==
            "/public/assets/es/v2/files/guide.0f0f0f0f.pdf");

    AssetProcessor custom("static/");
    REQUIRE(custom.generate_scoped_asset_path("pt", "v1", AssetType::Image, "a.png") == "/static/pt/v1/images/a.png");
}

TEST_CASE("Processing is idempotent", "[processor]") {
    TempDir dir;
    write_file(dir / "en/v1/assets/logo.png", png_bytes(16, 16, 2048));
    AssetProcessor processor;
    auto ref = make_ref(dir, "en/v1/assets/logo.png", AssetType::Image);

    auto first = processor.process_asset(ref);
    for (int i = 0; i < 3; ++i) {
        auto again = processor.process_asset(ref);
        REQUIRE(again.content_hash == first.content_hash);
        REQUIRE(again.hashed_filename == first.hashed_filename);
        REQUIRE(again.public_path == first.public_path);
        REQUIRE(again.last_modified == first.last_modified);
    }

    REQUIRE(first.file_size == 2048);
    REQUIRE(first.mime_type == "image/png");
    REQUIRE(first.hashed_filename == "logo." + first.content_hash.substr(0, 8) + ".png");
    REQUIRE(first.public_path == "/public/assets/en/v1/images/" + first.hashed_filename);
    REQUIRE(first.relative_path == "en/v1/assets/logo.png");
    REQUIRE(first.derivatives.empty());
}

TEST_CASE("Identical bytes in different contexts hash the same", "[processor]") {
    TempDir dir;
    write_file(dir / "en/v1/assets/manual.pdf", "%PDF-1.4 demo");
    write_file(dir / "es/v2/assets/manual.pdf", "%PDF-1.4 demo");
    AssetProcessor processor;

    auto en = processor.process_asset(make_ref(dir, "en/v1/assets/manual.pdf", AssetType::Binary));
    auto es = processor.process_asset(make_ref(dir, "es/v2/assets/manual.pdf", AssetType::Binary));

    REQUIRE(en.content_hash == es.content_hash);
    REQUIRE(en.hashed_filename == es.hashed_filename);
    REQUIRE(en.public_path != es.public_path);
    REQUIRE(es.public_path == "/public/assets/es/v2/files/" + es.hashed_filename);
}

TEST_CASE("Optimizer failures are best-effort", "[processor]") {
    TempDir dir;
    write_file(dir / "en/v1/assets/logo.png", png_bytes(16, 16, 256));
    auto optimizer = std::make_shared<FailingOptimizer>();
    AssetProcessor processor("public/assets", optimizer);

    auto processed = processor.process_asset(make_ref(dir, "en/v1/assets/logo.png", AssetType::Image));

    REQUIRE(optimizer->calls == 3);
    REQUIRE_FALSE(processed.dimensions.has_value());
    REQUIRE(processed.derivatives.empty());
    REQUIRE(processed.content_hash.size() == 64);
}

TEST_CASE("Optimizer results are attached to images only", "[processor]") {
    TempDir dir;
    write_file(dir / "en/v1/assets/logo.png", png_bytes(16, 16, 256));
    write_file(dir / "en/v1/assets/doc.pdf", "%PDF-1.4");
    AssetProcessor processor("public/assets", std::make_shared<StubOptimizer>());

    auto image = processor.process_asset(make_ref(dir, "en/v1/assets/logo.png", AssetType::Image));
    REQUIRE(image.dimensions == ImageDimensions{64, 32});
    REQUIRE(image.derivatives.size() == 2);
    REQUIRE(image.derivatives[0].public_path == "/public/assets/en/v1/images/logo@2x.deadbeef.png");

    SECTION("Options switch derivative generation off") {
        ProcessOptions options;
        options.generate_responsive_variants = false;
        options.generate_modern_formats = false;
        auto bare = processor.process_asset(make_ref(dir, "en/v1/assets/logo.png", AssetType::Image), options);
        REQUIRE(bare.dimensions.has_value());
        REQUIRE(bare.derivatives.empty());
    }

    auto binary = processor.process_asset(make_ref(dir, "en/v1/assets/doc.pdf", AssetType::Binary));
    REQUIRE_FALSE(binary.dimensions.has_value());
    REQUIRE(binary.derivatives.empty());
}

TEST_CASE("Unreadable source raises ProcessingError", "[processor]") {
    TempDir dir;
    AssetProcessor processor;
    auto ref = make_ref(dir, "en/v1/assets/gone.png", AssetType::Image);

    REQUIRE_THROWS_AS(processor.process_asset(ref), ProcessingError);

    SECTION("Batch processing propagates the failure") {
        write_file(dir / "en/v1/assets/ok.png", png_bytes(2, 2, 64));
        std::vector<AssetReference> refs = {make_ref(dir, "en/v1/assets/ok.png", AssetType::Image), ref};
        REQUIRE_THROWS_AS(processor.process_assets(refs, {}, 2), ProcessingError);
    }
}

TEST_CASE("Batch processing keeps input order", "[processor]") {
    TempDir dir;
    std::vector<AssetReference> refs;
    for (int i = 0; i < 12; ++i) {
        std::string rel = "en/v1/assets/file" + std::to_string(i) + ".txt";
        write_file(dir / rel, "payload " + std::to_string(i));
        refs.push_back(make_ref(dir, rel, AssetType::Binary));
    }

    AssetProcessor processor;
    auto results = processor.process_assets(refs, {}, 4);

    REQUIRE(results.size() == refs.size());
    for (size_t i = 0; i < refs.size(); ++i) {
        REQUIRE(results[i].relative_path == refs[i].relative_path);
    }
}

TEST_CASE("Asset URL resolution", "[processor]") {
    AssetProcessor processor;

    SECTION("Without a manifest the direct scoped path is returned") {
        REQUIRE(processor.resolve_asset_url("en/v1/assets/logo.png", "en", "v1") ==
                std::optional<std::string>("/public/assets/en/v1/images/logo.png"));
        REQUIRE(processor.resolve_asset_url("en/v1/assets/guide.pdf", "es", "v2") ==
                std::optional<std::string>("/public/assets/es/v2/files/guide.pdf"));
    }

    SECTION("With a manifest") {
        AssetManifest manifest;
        ManifestEntry entry;
        entry.public_path = "/public/assets/en/v1/images/logo.11111111.png";
        entry.original_path = "en/v1/assets/logo.png";
        entry.locale = "en";
        entry.version = "v1";
        manifest.assets["en/v1/assets/logo.png"] = entry;

        REQUIRE(processor.resolve_asset_url("en/v1/assets/logo.png", "en", "v1", &manifest) == entry.public_path);
        REQUIRE(processor.resolve_asset_url("en/v1/assets/logo.png", "en", "v2", &manifest) == entry.public_path);
        REQUIRE_FALSE(processor.resolve_asset_url("en/v1/assets/logo.png", "es", "v2", &manifest).has_value());
        REQUIRE_FALSE(processor.resolve_asset_url("en/v1/assets/other.png", "en", "v1", &manifest).has_value());
    }
}

TEST_CASE("SVG with a long opening tag still processes", "[processor][optimizer]") {
    TempDir dir;
    write_file(dir / "en/v1/assets/wide.svg",
               "<?xml version=\"1.0\"?>\n<svg width=\"10\" height=\"10\" data-x=\"" +
                   std::string(100 * 1024, 'x') + "\"></svg>");
    AssetProcessor processor("public/assets", create_probe_optimizer());

    auto processed = processor.process_asset(make_ref(dir, "en/v1/assets/wide.svg", AssetType::Image));

    REQUIRE(processed.dimensions.has_value());
    REQUIRE(*processed.dimensions == ImageDimensions{10, 10});
    REQUIRE(processed.content_hash.size() == 64);
}
