#include "mime.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace quire::engine {

    const char* to_string(AssetType type) {
        switch (type) {
            case AssetType::Image: return "image";
            case AssetType::Binary: return "binary";
            case AssetType::Unknown: return "unknown";
        }
        return "unknown";
    }

    AssetType asset_type_from_string(const std::string& name) {
        if (name == "image") return AssetType::Image;
        if (name == "binary") return AssetType::Binary;
        return AssetType::Unknown;
    }

    const char* to_string(FallbackType type) {
        switch (type) {
            case FallbackType::Version: return "version";
            case FallbackType::Locale: return "locale";
            case FallbackType::Direct: return "direct";
        }
        return "direct";
    }

    const std::vector<std::string>& default_image_types() {
        static const std::vector<std::string> types = {
            "image/jpeg", "image/jpg", "image/png", "image/webp", "image/avif",
            "image/gif", "image/svg+xml"
        };
        return types;
    }

    const std::vector<std::string>& default_binary_types() {
        static const std::vector<std::string> types = {
            "application/pdf", "application/zip", "application/json",
            "text/plain", "text/csv", "application/vnd.ms-excel",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"
        };
        return types;
    }

    std::string lowercase_extension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    std::string mime_type_for(const std::filesystem::path& path) {
        static const std::unordered_map<std::string, std::string> table = {
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".webp", "image/webp"},
            {".avif", "image/avif"},
            {".gif", "image/gif"},
            {".svg", "image/svg+xml"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".json", "application/json"},
            {".txt", "text/plain"},
            {".csv", "text/csv"},
            {".xls", "application/vnd.ms-excel"},
            {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"}
        };
        auto it = table.find(lowercase_extension(path));
        return it != table.end() ? it->second : "application/octet-stream";
    }

    AssetType asset_type_for_mime(const std::string& mime) {
        const auto& images = default_image_types();
        if (std::find(images.begin(), images.end(), mime) != images.end()) return AssetType::Image;
        const auto& binaries = default_binary_types();
        if (std::find(binaries.begin(), binaries.end(), mime) != binaries.end()) return AssetType::Binary;
        return AssetType::Unknown;
    }

    AssetType asset_type_for_path(const std::filesystem::path& path) {
        return asset_type_for_mime(mime_type_for(path));
    }

    const char* type_directory(AssetType type) {
        return type == AssetType::Image ? "images" : "files";
    }

}
