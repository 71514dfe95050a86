#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "quire/types.hpp"

namespace quire::engine {

    const std::vector<std::string>& default_image_types();
    const std::vector<std::string>& default_binary_types();

    /**
     * @brief MIME type from the (case-insensitive) extension, or application/octet-stream.
     */
    std::string mime_type_for(const std::filesystem::path& path);

    AssetType asset_type_for_mime(const std::string& mime);
    AssetType asset_type_for_path(const std::filesystem::path& path);

    /**
     * @brief Output directory segment for a type: "images" or "files".
     */
    const char* type_directory(AssetType type);

    std::string lowercase_extension(const std::filesystem::path& path);

}
