#include <catch2/catch_test_macros.hpp>
#include "engine/image_optimizer.hpp"
#include "test_support.hpp"

using namespace quire::engine;
using quire::test::TempDir;
using quire::test::write_file;

TEST_CASE("Header probing reads pixel dimensions", "[optimizer]") {
    TempDir dir;

    SECTION("PNG") {
        write_file(dir / "a.png", quire::test::png_bytes(640, 480, 128));
        REQUIRE(read_image_dimensions(dir / "a.png") == ImageDimensions{640, 480});
    }

    SECTION("GIF") {
        write_file(dir / "a.gif", quire::test::gif_bytes(300, 20));
        REQUIRE(read_image_dimensions(dir / "a.gif") == ImageDimensions{300, 20});
    }

    SECTION("JPEG") {
        write_file(dir / "a.jpg", quire::test::jpeg_bytes(1024, 768));
        REQUIRE(read_image_dimensions(dir / "a.jpg") == ImageDimensions{1024, 768});
    }

    SECTION("SVG with explicit size") {
        write_file(dir / "a.svg", "<?xml version=\"1.0\"?>\n<svg xmlns=\"http://www.w3.org/2000/svg\" "
                                  "width=\"120px\" height=\"48\"></svg>");
        REQUIRE(read_image_dimensions(dir / "a.svg") == ImageDimensions{120, 48});
    }

    SECTION("SVG with only a viewBox") {
        write_file(dir / "b.svg", "<svg viewBox=\"0 0 24 16\"><path d=\"M0 0h24v16H0z\"/></svg>");
        REQUIRE(read_image_dimensions(dir / "b.svg") == ImageDimensions{24, 16});
    }

    SECTION("SVG with a very long opening tag") {
        std::string svg = "<?xml version=\"1.0\"?>\n<svg width=\"10\" height=\"10\" data-x=\"" +
                          std::string(100 * 1024, 'x') + "\"></svg>";
        write_file(dir / "long.svg", svg);
        REQUIRE(read_image_dimensions(dir / "long.svg") == ImageDimensions{10, 10});
    }

    SECTION("SVG sizes beyond 32 bits are clamped") {
        write_file(dir / "huge.svg", "<svg width=\"1e300\" height=\"5\"></svg>");
        REQUIRE(read_image_dimensions(dir / "huge.svg") == ImageDimensions{4294967295u, 5});
    }

    SECTION("SVG percentage sizes fall back to the viewBox") {
        write_file(dir / "pct.svg", "<svg stroke-width=\"2\" width=\"100%\" height=\"100%\" viewBox=\"0,0,32,8\"></svg>");
        REQUIRE(read_image_dimensions(dir / "pct.svg") == ImageDimensions{32, 8});
    }

    SECTION("Unrecognised data throws") {
        write_file(dir / "c.png", "definitely not an image");
        REQUIRE_THROWS_AS(read_image_dimensions(dir / "c.png"), std::runtime_error);
        REQUIRE_THROWS_AS(read_image_dimensions(dir / "missing.png"), std::runtime_error);
    }
}

TEST_CASE("Header-only optimizer never produces derivatives", "[optimizer]") {
    TempDir dir;
    write_file(dir / "a.png", quire::test::png_bytes(10, 20, 64));

    auto optimizer = create_probe_optimizer();
    REQUIRE(optimizer->get_image_dimensions(dir / "a.png") == ImageDimensions{10, 20});

    ProcessedAsset asset;
    asset.source_path = dir / "a.png";
    asset.public_path = "/public/assets/en/v1/images/a.12345678.png";
    REQUIRE(optimizer->generate_responsive_variants(asset, {}).empty());
    REQUIRE(optimizer->convert_to_modern_formats(asset, {}).empty());
}

TEST_CASE("Derivatives live next to the primary asset", "[optimizer]") {
    ProcessedAsset asset;
    asset.public_path = "/public/assets/en/v1/images/logo.12345678.png";
    REQUIRE(derivative_public_path(asset, "logo.12345678.webp") == "/public/assets/en/v1/images/logo.12345678.webp");
}
