#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "quire/types.hpp"

namespace quire::engine {

    constexpr const char* kManifestSchemaVersion = "1.0.0";
    constexpr const char* kManifestFileName = "assets-manifest.json";

    /**
     * @brief Builds a manifest keyed by each asset's original relative path.
     *
     * Only generated_at depends on the wall clock; every other field is a pure
     * function of the input list.
     */
    AssetManifest generate_manifest(const std::vector<ProcessedAsset>& assets, bool security_scanned = true);

    /**
     * @brief Parses a manifest file.
     * @throws ManifestError if the file is missing, unreadable or malformed.
     */
    AssetManifest load_manifest(const std::filesystem::path& path);

    /**
     * @brief Pretty-printed JSON with a 2-space indent.
     */
    std::string serialize_manifest(const AssetManifest& manifest);

    void to_json(nlohmann::json& j, const ImageDimensions& d);
    void from_json(const nlohmann::json& j, ImageDimensions& d);
    void to_json(nlohmann::json& j, const AssetDerivative& d);
    void from_json(const nlohmann::json& j, AssetDerivative& d);
    void to_json(nlohmann::json& j, const AssetMetadata& m);
    void from_json(const nlohmann::json& j, AssetMetadata& m);
    void to_json(nlohmann::json& j, const ManifestEntry& e);
    void from_json(const nlohmann::json& j, ManifestEntry& e);
    void to_json(nlohmann::json& j, const AssetManifest& m);
    void from_json(const nlohmann::json& j, AssetManifest& m);

    /**
     * @brief Render-side holder of the published manifest.
     *
     * get() loads the file on first use and hands out an immutable snapshot.
     * invalidate() drops it so the next get() reloads; snapshots already handed
     * out stay valid.
     */
    class ManifestCache {
    public:
        explicit ManifestCache(std::filesystem::path manifest_path);

        /**
         * @return The current snapshot, or null if the manifest is missing or malformed.
         */
        std::shared_ptr<const AssetManifest> get();

        void invalidate();

        bool loaded() const;

        const std::filesystem::path& manifest_path() const { return m_path; }

    private:
        std::filesystem::path m_path;
        mutable std::mutex m_mutex;
        std::shared_ptr<const AssetManifest> m_snapshot;
    };

}
