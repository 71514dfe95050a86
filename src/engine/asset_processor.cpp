#include "asset_processor.hpp"
#include "job_queue.hpp"
#include "mime.hpp"
#include "timestamp.hpp"
#include "quire/errors.hpp"
#include "quire/sha256.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

namespace quire::engine {

    AssetProcessor::AssetProcessor(std::string public_root, std::shared_ptr<ImageOptimizer> optimizer)
        : m_public_root(std::move(public_root)), m_optimizer(std::move(optimizer)) {}

    std::string AssetProcessor::generate_content_hash(const std::vector<uint8_t>& content) {
        return crypto::SHA256::hash(content);
    }

    std::string AssetProcessor::make_hashed_filename(const std::filesystem::path& source,
                                                     const std::string& content_hash) {
        return source.stem().string() + "." + content_hash.substr(0, 8) + source.extension().string();
    }

    std::string AssetProcessor::generate_scoped_asset_path(const std::string& locale,
                                                           const std::string& version,
                                                           AssetType type,
                                                           const std::string& filename) const {
        std::string root = m_public_root;
        std::replace(root.begin(), root.end(), '\\', '/');
        auto path = std::filesystem::path("/") / root / locale / version / type_directory(type) / filename;
        return path.lexically_normal().generic_string();
    }

    std::optional<std::string> AssetProcessor::resolve_asset_url(const std::string& relative_path,
                                                                 const std::string& locale,
                                                                 const std::string& version,
                                                                 const AssetManifest* manifest) const {
        if (!manifest) {
            std::string normalized = relative_path;
            std::replace(normalized.begin(), normalized.end(), '\\', '/');
            auto filename = normalized.substr(normalized.rfind('/') + 1);
            return generate_scoped_asset_path(locale, version, asset_type_for_path(filename), filename);
        }

        auto it = manifest->assets.find(relative_path);
        if (it != manifest->assets.end() && it->second.locale == locale && it->second.version == version) {
            return it->second.public_path;
        }

        for (const auto& [key, entry] : manifest->assets) {
            if (entry.original_path == relative_path && (entry.locale == locale || entry.version == version)) {
                return entry.public_path;
            }
        }
        return std::nullopt;
    }

    ProcessedAsset AssetProcessor::process_asset(const AssetReference& asset, const ProcessOptions& options) const {
        ProcessedAsset processed;
        static_cast<AssetReference&>(processed) = asset;

        std::vector<uint8_t> content;
        try {
            processed.last_modified = file_mtime_iso8601(asset.source_path);

            std::ifstream file(asset.source_path, std::ios::binary | std::ios::ate);
            if (!file) throw std::runtime_error(std::strerror(errno));
            auto size = file.tellg();
            if (size < 0) throw std::runtime_error("cannot determine size");
            content.resize(static_cast<size_t>(size));
            file.seekg(0);
            if (!content.empty() && !file.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(size))) {
                throw std::runtime_error("short read");
            }
        } catch (const std::exception& e) {
            throw ProcessingError(asset.source_path, e.what());
        }

        processed.content_hash = generate_content_hash(content);
        processed.hashed_filename = make_hashed_filename(asset.source_path, processed.content_hash);
        processed.public_path = generate_scoped_asset_path(asset.locale, asset.version, asset.type,
                                                           processed.hashed_filename);
        processed.file_size = content.size();
        processed.mime_type = mime_type_for(asset.source_path);

        if (asset.type == AssetType::Image && m_optimizer) {
            enhance_image(processed, options);
        }
        return processed;
    }

    void AssetProcessor::enhance_image(ProcessedAsset& processed, const ProcessOptions& options) const {
        const auto& source = processed.source_path;

        try {
            processed.dimensions = m_optimizer->get_image_dimensions(source);
        } catch (const std::exception& e) {
            std::cerr << "[Processor] Warning: failed to get dimensions for " << source << ": " << e.what() << "\n";
        }

        if (options.generate_responsive_variants) {
            try {
                auto variants = m_optimizer->generate_responsive_variants(processed, options.responsive);
                processed.derivatives.insert(processed.derivatives.end(), variants.begin(), variants.end());
            } catch (const std::exception& e) {
                std::cerr << "[Processor] Warning: failed to generate responsive variants for " << source << ": "
                          << e.what() << "\n";
            }
        }

        if (options.generate_modern_formats) {
            try {
                auto variants = m_optimizer->convert_to_modern_formats(processed, options.modern);
                processed.derivatives.insert(processed.derivatives.end(), variants.begin(), variants.end());
            } catch (const std::exception& e) {
                std::cerr << "[Processor] Warning: failed to generate modern format variants for " << source << ": "
                          << e.what() << "\n";
            }
        }
    }

    std::vector<ProcessedAsset> AssetProcessor::process_assets(const std::vector<AssetReference>& assets,
                                                               const ProcessOptions& options,
                                                               size_t workers) const {
        std::vector<ProcessedAsset> results(assets.size());
        auto failures = run_parallel(assets.size(), workers, [&](size_t i) {
            results[i] = process_asset(assets[i], options);
        });

        std::exception_ptr first;
        for (const auto& failure : failures) {
            if (!failure) continue;
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                std::cerr << "[Processor] " << e.what() << "\n";
            }
            if (!first) first = failure;
        }
        if (first) std::rethrow_exception(first);
        return results;
    }

}
