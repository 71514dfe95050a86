#include "publisher.hpp"
#include "job_queue.hpp"
#include "manifest.hpp"
#include "quire/errors.hpp"
#include <fstream>
#include <iostream>

namespace quire::engine {

    Publisher::Publisher(std::filesystem::path site_root, std::filesystem::path manifest_path, size_t workers)
        : m_site_root(std::move(site_root)), m_manifest_path(std::move(manifest_path)), m_workers(workers) {}

    std::filesystem::path Publisher::destination_for(const std::string& public_path) const {
        size_t start = public_path.find_first_not_of('/');
        std::string relative = (start == std::string::npos) ? std::string() : public_path.substr(start);
        return (m_site_root / relative).lexically_normal();
    }

    void Publisher::copy_one(const ProcessedAsset& asset) const {
        auto destination = destination_for(asset.public_path);
        std::error_code ec;

        std::filesystem::create_directories(destination.parent_path(), ec);
        if (!ec) {
            std::filesystem::copy_file(asset.source_path, destination,
                                       std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throw PublishError("Failed to copy asset " + asset.source_path.string() + " to " +
                               asset.public_path + ": " + ec.message());
        }
    }

    void Publisher::copy_assets_to_public_directory(const std::vector<ProcessedAsset>& assets) const {
        auto failures = run_parallel(assets.size(), m_workers, [&](size_t i) { copy_one(assets[i]); });

        std::vector<std::string> messages;
        for (const auto& failure : failures) {
            if (!failure) continue;
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                std::cerr << "[Publisher] " << e.what() << "\n";
                messages.emplace_back(e.what());
            }
        }
        if (!messages.empty()) throw PublishError(std::move(messages));
    }

    void Publisher::write_manifest(const AssetManifest& manifest) const {
        std::error_code ec;
        auto parent = m_manifest_path.parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw PublishError("Failed to write asset manifest " + m_manifest_path.string() + ": " + ec.message());
        }

        auto temp = m_manifest_path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            out << serialize_manifest(manifest);
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(temp, ec);
                throw PublishError("Failed to write asset manifest " + temp.string());
            }
        }

        std::filesystem::rename(temp, m_manifest_path, ec);
        if (ec) {
            std::string cause = ec.message();
            std::filesystem::remove(temp, ec);
            throw PublishError("Failed to write asset manifest " + m_manifest_path.string() + ": " + cause);
        }
    }

}
