#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quire::engine {

    struct Config {
        enum class OptimizerBackend {
            Probe, // Header parsing only, no re-encoding
            Http   // Remote optimizer service
        };

        std::filesystem::path content_root = "content";
        std::string public_root = "public/assets";
        std::filesystem::path site_root = ".";

        std::string default_locale = "en";
        std::vector<std::string> locales = {"en", "es", "pt"};
        std::string default_version = "v1";

        std::uintmax_t max_file_size = 10 * 1024 * 1024;
        bool content_scanning = true;
        bool strict_paths = true;

        bool responsive_variants = true;
        bool modern_formats = true;
        OptimizerBackend optimizer_backend = OptimizerBackend::Probe;
        std::string optimizer_endpoint = "http://localhost:8089/optimize";

        size_t workers = 0; // 0 = hardware concurrency
        std::filesystem::path ledger_path; // quire-build substitutes {data dir}/quire.db when empty
        std::string socket_name = "quire.sock";

        std::filesystem::path manifest_path() const {
            return site_root / public_root / "assets-manifest.json";
        }

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("content_root")) cfg.content_root = j["content_root"].get<std::string>();
                if (j.contains("public_root")) cfg.public_root = j["public_root"].get<std::string>();
                if (j.contains("site_root")) cfg.site_root = j["site_root"].get<std::string>();
                if (j.contains("default_locale")) cfg.default_locale = j["default_locale"];
                if (j.contains("locales")) cfg.locales = j["locales"].get<std::vector<std::string>>();
                if (j.contains("default_version")) cfg.default_version = j["default_version"];
                if (j.contains("max_file_size")) cfg.max_file_size = j["max_file_size"];
                if (j.contains("content_scanning")) cfg.content_scanning = j["content_scanning"];
                if (j.contains("strict_paths")) cfg.strict_paths = j["strict_paths"];
                if (j.contains("responsive_variants")) cfg.responsive_variants = j["responsive_variants"];
                if (j.contains("modern_formats")) cfg.modern_formats = j["modern_formats"];
                if (j.contains("optimizer_backend")) {
                    std::string backend = j["optimizer_backend"];
                    if (backend == "http") cfg.optimizer_backend = OptimizerBackend::Http;
                }
                if (j.contains("optimizer_endpoint")) cfg.optimizer_endpoint = j["optimizer_endpoint"];
                if (j.contains("workers")) cfg.workers = j["workers"];
                if (j.contains("ledger_path")) cfg.ledger_path = j["ledger_path"].get<std::string>();
                if (j.contains("socket_name")) cfg.socket_name = j["socket_name"];
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring malformed " << path << ": " << e.what() << "\n";
                return Config{};
            }
            return cfg;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["content_root"] = content_root.string();
            j["public_root"] = public_root;
            j["site_root"] = site_root.string();
            j["default_locale"] = default_locale;
            j["locales"] = locales;
            j["default_version"] = default_version;
            j["max_file_size"] = max_file_size;
            j["content_scanning"] = content_scanning;
            j["strict_paths"] = strict_paths;
            j["responsive_variants"] = responsive_variants;
            j["modern_formats"] = modern_formats;
            j["optimizer_backend"] = (optimizer_backend == OptimizerBackend::Http) ? "http" : "probe";
            j["optimizer_endpoint"] = optimizer_endpoint;
            j["workers"] = workers;
            if (!ledger_path.empty()) j["ledger_path"] = ledger_path.string();
            j["socket_name"] = socket_name;

            std::ofstream f(path);
            f << j.dump(4);
        }
    };

}
