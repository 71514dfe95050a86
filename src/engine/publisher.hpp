#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "quire/types.hpp"

namespace quire::engine {

    /**
     * @brief Writes processed assets and the manifest into the public tree.
     */
    class Publisher {
    public:
        /**
         * @param site_root Directory that public paths ("/public/assets/...") are relative to.
         * @param manifest_path Where write_manifest() puts the manifest.
         * @param workers Copy concurrency; 0 selects the hardware concurrency.
         */
        Publisher(std::filesystem::path site_root, std::filesystem::path manifest_path, size_t workers = 0);

        /**
         * @brief Filesystem location of a public path.
         */
        std::filesystem::path destination_for(const std::string& public_path) const;

        /**
         * @brief Copies every asset to its public path, creating directories as needed.
         * @throws PublishError listing every asset that failed, after all copies have run.
         */
        void copy_assets_to_public_directory(const std::vector<ProcessedAsset>& assets) const;

        /**
         * @brief Writes the manifest through a temporary file and renames it into place.
         * @throws PublishError on any filesystem failure.
         */
        void write_manifest(const AssetManifest& manifest) const;

        const std::filesystem::path& manifest_path() const { return m_manifest_path; }

    private:
        std::filesystem::path m_site_root;
        std::filesystem::path m_manifest_path;
        size_t m_workers;

        void copy_one(const ProcessedAsset& asset) const;
    };

}
