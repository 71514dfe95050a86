#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "quire/types.hpp"

namespace quire::engine {

    struct ResponsiveVariantOptions {
        bool generate_retina = true;  // @2x
        std::vector<uint32_t> sizes;  // extra widths, emitted as @<w>w
        int quality = 85;
    };

    struct FormatOptions {
        bool enabled = true;
        int quality = 85;
        int effort = 4;
    };

    struct ModernFormatOptions {
        FormatOptions webp{true, 85, 4};
        FormatOptions avif{true, 80, 4};
    };

    /**
     * @brief Abstract image optimizer collaborator.
     *
     * Every operation may throw; callers treat failures as best-effort.
     */
    class ImageOptimizer {
    public:
        virtual ~ImageOptimizer() = default;

        virtual ImageDimensions get_image_dimensions(const std::filesystem::path& path) = 0;

        virtual std::vector<AssetDerivative> generate_responsive_variants(const ProcessedAsset& asset,
                                                                          const ResponsiveVariantOptions& options) = 0;

        virtual std::vector<AssetDerivative> convert_to_modern_formats(const ProcessedAsset& asset,
                                                                       const ModernFormatOptions& options) = 0;
    };

    /**
     * @brief Reads pixel dimensions from PNG, GIF, JPEG, WebP, AVIF or SVG headers.
     * @throws std::runtime_error if the file cannot be read or the format is not recognised.
     */
    ImageDimensions read_image_dimensions(const std::filesystem::path& path);

    /**
     * @brief Public path for a derivative stored next to its primary asset.
     */
    std::string derivative_public_path(const ProcessedAsset& asset, const std::string& hashed_filename);

    std::unique_ptr<ImageOptimizer> create_probe_optimizer();
    std::unique_ptr<ImageOptimizer> create_http_optimizer(const std::string& endpoint);

}
