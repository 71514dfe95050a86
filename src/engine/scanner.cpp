#include "scanner.hpp"
#include "mime.hpp"
#include "quire/errors.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace quire::engine {

    Scanner::Scanner(std::filesystem::path content_root) : m_root(std::move(content_root)) {
        m_ignore.add_defaults();
        m_ignore.load(m_root / ".quire_ignore");
    }

    std::vector<std::string> Scanner::subdirectories(const std::filesystem::path& dir) const {
        std::vector<std::string> names;
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) return names;

        for (const auto& entry : it) {
            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !m_ignore.check(entry.path())) {
                names.push_back(entry.path().filename().string());
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    void Scanner::scan(const AssetCallback& callback) const {
        std::error_code ec;
        if (!std::filesystem::is_directory(m_root, ec)) {
            std::cerr << "[Scanner] Content root not found: " << m_root << "\n";
            return;
        }

        for (const auto& locale : subdirectories(m_root)) {
            for (const auto& version : subdirectories(m_root / locale)) {
                auto assets_dir = m_root / locale / version / "assets";
                if (!std::filesystem::is_directory(assets_dir, ec)) continue;
                scan_assets_directory(assets_dir, locale, version, callback);
            }
        }
    }

    void Scanner::scan_assets_directory(const std::filesystem::path& assets_dir,
                                        const std::string& locale,
                                        const std::string& version,
                                        const AssetCallback& callback) const {
        std::vector<std::filesystem::path> pending{assets_dir};

        while (!pending.empty()) {
            auto dir = std::move(pending.back());
            pending.pop_back();

            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec) {
                throw DiscoveryError("Failed to scan assets directory " + dir.string() + ": " + ec.message());
            }

            for (const auto& entry : it) {
                const auto& path = entry.path();
                if (m_ignore.check(path, m_root)) continue;

                std::error_code type_ec;
                if (entry.is_directory(type_ec)) {
                    // Symlinked directories can form cycles.
                    if (!entry.is_symlink(type_ec)) pending.push_back(path);
                    continue;
                }
                if (!entry.is_regular_file(type_ec)) continue;

                AssetType type = asset_type_for_path(path);
                if (type == AssetType::Unknown) continue;

                AssetReference ref;
                ref.source_path = path;
                ref.relative_path = path.lexically_relative(m_root).generic_string();
                ref.locale = locale;
                ref.version = version;
                ref.type = type;
                if (callback) callback(ref);
            }
        }
    }

    std::vector<AssetReference> Scanner::discover_assets() const {
        std::vector<AssetReference> assets;
        scan([&](const AssetReference& ref) { assets.push_back(ref); });
        std::sort(assets.begin(), assets.end(), [](const AssetReference& a, const AssetReference& b) {
            return a.relative_path < b.relative_path;
        });
        return assets;
    }

    Scanner::LocalesAndVersions Scanner::available_locales_and_versions() const {
        LocalesAndVersions result;
        std::error_code ec;
        if (!std::filesystem::is_directory(m_root, ec)) {
            std::cerr << "[Scanner] Failed to list locales and versions: " << m_root << " is not a directory\n";
            return result;
        }

        std::set<std::string> versions;
        result.locales = subdirectories(m_root);
        for (const auto& locale : result.locales) {
            for (auto& version : subdirectories(m_root / locale)) versions.insert(std::move(version));
        }
        result.versions.assign(versions.begin(), versions.end());
        return result;
    }

}
