#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "image_optimizer.hpp"
#include "quire/types.hpp"

namespace quire::engine {

    struct ProcessOptions {
        bool generate_responsive_variants = true;
        bool generate_modern_formats = true;
        ResponsiveVariantOptions responsive;
        ModernFormatOptions modern;
    };

    /**
     * @brief Hashes assets and assigns them content-addressed public paths.
     */
    class AssetProcessor {
    public:
        /**
         * @param public_root Public directory the scoped paths are rooted at (e.g. "public/assets").
         * @param optimizer Optional image collaborator; null disables dimensions and derivatives.
         */
        explicit AssetProcessor(std::string public_root = "public/assets",
                                std::shared_ptr<ImageOptimizer> optimizer = nullptr);

        /**
         * @brief SHA-256 of the bytes as 64 lowercase hex characters.
         */
        static std::string generate_content_hash(const std::vector<uint8_t>& content);

        /**
         * @brief {basename}.{hash[0:8]}{ext}
         */
        static std::string make_hashed_filename(const std::filesystem::path& source, const std::string& content_hash);

        /**
         * @brief /{public_root}/{locale}/{version}/{images|files}/{filename}
         */
        std::string generate_scoped_asset_path(const std::string& locale,
                                               const std::string& version,
                                               AssetType type,
                                               const std::string& filename) const;

        /**
         * @brief Manifest lookup by relative path with a loose locale-or-version fallback.
         *
         * Without a manifest this returns the unhashed scoped path for the file name.
         */
        std::optional<std::string> resolve_asset_url(const std::string& relative_path,
                                                     const std::string& locale,
                                                     const std::string& version,
                                                     const AssetManifest* manifest = nullptr) const;

        /**
         * @brief Reads and hashes one asset. Image enhancement failures are logged, not thrown.
         * @throws ProcessingError if the file cannot be stat'ed or read.
         */
        ProcessedAsset process_asset(const AssetReference& asset, const ProcessOptions& options = {}) const;

        /**
         * @brief Processes assets on a worker pool, returning results in input order.
         * @throws ProcessingError (the first failure in input order) once every worker has finished.
         */
        std::vector<ProcessedAsset> process_assets(const std::vector<AssetReference>& assets,
                                                   const ProcessOptions& options = {},
                                                   size_t workers = 0) const;

        const std::string& public_root() const { return m_public_root; }

    private:
        std::string m_public_root;
        std::shared_ptr<ImageOptimizer> m_optimizer;

        void enhance_image(ProcessedAsset& processed, const ProcessOptions& options) const;
    };

}
