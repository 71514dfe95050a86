#include "manifest.hpp"
#include "timestamp.hpp"
#include "quire/errors.hpp"
#include <fstream>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace quire::engine {

    AssetManifest generate_manifest(const std::vector<ProcessedAsset>& assets, bool security_scanned) {
        AssetManifest manifest;
        manifest.version = kManifestSchemaVersion;
        manifest.generated_at = iso8601_utc(std::chrono::system_clock::now());

        std::set<std::string> locales;
        std::set<std::string> versions;

        for (const auto& asset : assets) {
            locales.insert(asset.locale);
            versions.insert(asset.version);

            ManifestEntry entry;
            entry.public_path = asset.public_path;
            entry.hashed_filename = asset.hashed_filename;
            entry.content_hash = asset.content_hash;
            entry.original_path = asset.relative_path;
            entry.file_size = asset.file_size;
            entry.mime_type = asset.mime_type;
            entry.locale = asset.locale;
            entry.version = asset.version;
            entry.dimensions = asset.dimensions;
            for (const auto& derivative : asset.derivatives) {
                entry.derivatives[derivative.variant] = derivative;
            }
            entry.metadata.last_modified = asset.last_modified;
            entry.metadata.referenced_by = asset.referenced_by;
            entry.metadata.optimized = !asset.derivatives.empty();
            entry.metadata.security_scanned = security_scanned;

            manifest.assets[asset.relative_path] = std::move(entry);
        }

        manifest.locales.assign(locales.begin(), locales.end());
        manifest.versions.assign(versions.begin(), versions.end());
        return manifest;
    }

    AssetManifest load_manifest(const std::filesystem::path& path) {
        std::ifstream f(path);
        if (!f) throw ManifestError("Cannot open manifest " + path.string());
        try {
            return json::parse(f).get<AssetManifest>();
        } catch (const json::exception& e) {
            throw ManifestError("Malformed manifest " + path.string() + ": " + e.what());
        }
    }

    std::string serialize_manifest(const AssetManifest& manifest) {
        return json(manifest).dump(2);
    }

    void to_json(json& j, const ImageDimensions& d) {
        j = json{{"width", d.width}, {"height", d.height}};
    }

    void from_json(const json& j, ImageDimensions& d) {
        j.at("width").get_to(d.width);
        j.at("height").get_to(d.height);
    }

    void to_json(json& j, const AssetDerivative& d) {
        j = json{
            {"variant", d.variant},
            {"publicPath", d.public_path},
            {"hashedFilename", d.hashed_filename},
            {"fileSize", d.file_size}
        };
        if (d.dimensions) j["dimensions"] = *d.dimensions;
    }

    void from_json(const json& j, AssetDerivative& d) {
        j.at("variant").get_to(d.variant);
        j.at("publicPath").get_to(d.public_path);
        j.at("hashedFilename").get_to(d.hashed_filename);
        j.at("fileSize").get_to(d.file_size);
        if (j.contains("dimensions")) d.dimensions = j["dimensions"].get<ImageDimensions>();
    }

    void to_json(json& j, const AssetMetadata& m) {
        j = json{
            {"lastModified", m.last_modified},
            {"referencedBy", m.referenced_by},
            {"optimized", m.optimized},
            {"securityScanned", m.security_scanned}
        };
    }

    void from_json(const json& j, AssetMetadata& m) {
        m.last_modified = j.value("lastModified", std::string());
        m.referenced_by = j.value("referencedBy", std::vector<std::string>());
        m.optimized = j.value("optimized", false);
        m.security_scanned = j.value("securityScanned", false);
    }

    void to_json(json& j, const ManifestEntry& e) {
        j = json{
            {"publicPath", e.public_path},
            {"hashedFilename", e.hashed_filename},
            {"contentHash", e.content_hash},
            {"originalPath", e.original_path},
            {"fileSize", e.file_size},
            {"mimeType", e.mime_type},
            {"locale", e.locale},
            {"version", e.version},
            {"derivatives", json::object()},
            {"metadata", e.metadata}
        };
        if (e.dimensions) j["dimensions"] = *e.dimensions;
        for (const auto& [variant, derivative] : e.derivatives) {
            j["derivatives"][variant] = derivative;
        }
    }

    void from_json(const json& j, ManifestEntry& e) {
        j.at("publicPath").get_to(e.public_path);
        j.at("hashedFilename").get_to(e.hashed_filename);
        j.at("contentHash").get_to(e.content_hash);
        j.at("originalPath").get_to(e.original_path);
        j.at("fileSize").get_to(e.file_size);
        j.at("mimeType").get_to(e.mime_type);
        j.at("locale").get_to(e.locale);
        j.at("version").get_to(e.version);
        if (j.contains("dimensions")) e.dimensions = j["dimensions"].get<ImageDimensions>();
        if (j.contains("derivatives")) {
            for (const auto& [variant, derivative] : j["derivatives"].items()) {
                e.derivatives[variant] = derivative.get<AssetDerivative>();
            }
        }
        if (j.contains("metadata")) e.metadata = j["metadata"].get<AssetMetadata>();
    }

    void to_json(json& j, const AssetManifest& m) {
        j = json{
            {"version", m.version},
            {"generatedAt", m.generated_at},
            {"assets", json::object()},
            {"locales", m.locales},
            {"versions", m.versions}
        };
        for (const auto& [key, entry] : m.assets) {
            j["assets"][key] = entry;
        }
    }

    void from_json(const json& j, AssetManifest& m) {
        j.at("version").get_to(m.version);
        m.generated_at = j.value("generatedAt", std::string());
        for (const auto& [key, entry] : j.at("assets").items()) {
            m.assets[key] = entry.get<ManifestEntry>();
        }
        m.locales = j.value("locales", std::vector<std::string>());
        m.versions = j.value("versions", std::vector<std::string>());
    }

    ManifestCache::ManifestCache(std::filesystem::path manifest_path) : m_path(std::move(manifest_path)) {}

    std::shared_ptr<const AssetManifest> ManifestCache::get() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot) return m_snapshot;

        try {
            m_snapshot = std::make_shared<const AssetManifest>(load_manifest(m_path));
        } catch (const ManifestError& e) {
            std::cerr << "[ManifestCache] Warning: " << e.what() << "\n";
        }
        return m_snapshot;
    }

    void ManifestCache::invalidate() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot.reset();
    }

    bool ManifestCache::loaded() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_snapshot != nullptr;
    }

}
