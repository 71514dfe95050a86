#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "ignore.hpp"
#include "quire/types.hpp"

namespace quire::engine {

    /**
     * @brief Discovers assets laid out as {content}/{locale}/{version}/assets/**.
     */
    class Scanner {
    public:
        using AssetCallback = std::function<void(const AssetReference&)>;

        struct LocalesAndVersions {
            std::vector<std::string> locales;
            std::vector<std::string> versions;
        };

        /**
         * @param content_root Root of the per-locale content tree. A .quire_ignore
         *        file at this root is loaded on construction.
         */
        explicit Scanner(std::filesystem::path content_root);

        /**
         * @brief Walks every locale/version assets directory.
         * @param callback Called for every file whose type is Image or Binary.
         * @throws DiscoveryError if an existing assets directory cannot be read.
         */
        void scan(const AssetCallback& callback) const;

        /**
         * @brief Collects scan() results sorted by relative path.
         */
        std::vector<AssetReference> discover_assets() const;

        /**
         * @brief Locale directories and the union of their version directories, sorted.
         */
        LocalesAndVersions available_locales_and_versions() const;

        const std::filesystem::path& content_root() const { return m_root; }
        Ignore& ignore() { return m_ignore; }

    private:
        std::filesystem::path m_root;
        Ignore m_ignore;

        std::vector<std::string> subdirectories(const std::filesystem::path& dir) const;
        void scan_assets_directory(const std::filesystem::path& assets_dir,
                                   const std::string& locale,
                                   const std::string& version,
                                   const AssetCallback& callback) const;
    };

}
