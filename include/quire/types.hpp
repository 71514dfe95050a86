#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quire::engine {

    enum class AssetType {
        Image,
        Binary,
        Unknown
    };

    const char* to_string(AssetType type);
    AssetType asset_type_from_string(const std::string& name);

    struct ImageDimensions {
        uint32_t width = 0;
        uint32_t height = 0;

        bool operator==(const ImageDimensions& other) const {
            return width == other.width && height == other.height;
        }
    };

    /**
     * @brief An asset file found under {content}/{locale}/{version}/assets.
     */
    struct AssetReference {
        std::filesystem::path source_path;
        std::string relative_path; // relative to the content root, '/' separated
        std::string locale;
        std::string version;
        AssetType type = AssetType::Unknown;
        std::vector<std::string> referenced_by;
    };

    struct AssetDerivative {
        std::string variant; // "@1x", "@2x", "@640w", "webp", "avif"
        std::string public_path;
        std::string hashed_filename;
        std::uintmax_t file_size = 0;
        std::optional<ImageDimensions> dimensions;
    };

    struct ProcessedAsset : AssetReference {
        std::string public_path;
        std::string hashed_filename;
        std::string content_hash;
        std::uintmax_t file_size = 0;
        std::string mime_type;
        std::string last_modified; // ISO-8601, from the file's mtime
        std::optional<ImageDimensions> dimensions;
        std::vector<AssetDerivative> derivatives;
    };

    struct AssetMetadata {
        std::string last_modified;
        std::vector<std::string> referenced_by;
        bool optimized = false;
        bool security_scanned = false;
    };

    struct ManifestEntry {
        std::string public_path;
        std::string hashed_filename;
        std::string content_hash;
        std::string original_path;
        std::uintmax_t file_size = 0;
        std::string mime_type;
        std::string locale;
        std::string version;
        std::optional<ImageDimensions> dimensions;
        std::map<std::string, AssetDerivative> derivatives;
        AssetMetadata metadata;
    };

    struct AssetManifest {
        std::string version;
        std::string generated_at;
        std::map<std::string, ManifestEntry> assets; // keyed by original relative path
        std::vector<std::string> locales;
        std::vector<std::string> versions;
    };

    struct ValidationResult {
        bool is_valid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        std::optional<std::string> sanitized_path;
    };

    struct AssetContext {
        std::string locale;
        std::string version;

        bool operator==(const AssetContext& other) const {
            return locale == other.locale && version == other.version;
        }
    };

    enum class FallbackType {
        Version,
        Locale,
        Direct
    };

    const char* to_string(FallbackType type);

    struct AssetResolutionResult {
        std::string public_path;
        ManifestEntry entry;
        bool fallback_used = false;
        std::optional<FallbackType> fallback_type;
    };

}
