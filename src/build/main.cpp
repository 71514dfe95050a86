#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/pipeline.hpp"
#include "quire/errors.hpp"

namespace {

    void print_usage() {
        std::cout << "Usage: quire-build [options]\n"
                  << "\nOptions:\n"
                  << "  --config=<file>        Config file (default: ~/.config/quire/config.json)\n"
                  << "  --content-dir=<path>   Content directory path (default: content)\n"
                  << "  --public-dir=<path>    Public assets directory path (default: public/assets)\n"
                  << "  --site-root=<path>     Directory public paths are rooted at (default: .)\n"
                  << "  --workers=<n>          Worker threads (default: hardware concurrency)\n"
                  << "  --skip-security        Skip security validation\n"
                  << "  --skip-responsive      Skip responsive variant generation\n"
                  << "  --skip-modern-formats  Skip modern format conversion (WebP, AVIF)\n"
                  << "  --no-ledger            Do not record the build in the change ledger\n"
                  << "  --verbose              Show detailed processing output\n"
                  << "  --dry-run              Process assets but don't copy files\n"
                  << "  --help                 Show this help message\n";
    }

    bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
        for (const auto& a : args) {
            if (a == flag) return true;
        }
        return false;
    }

    bool option_value(const std::vector<std::string>& args, const std::string& name, std::string& out) {
        const std::string prefix = name + "=";
        for (const auto& a : args) {
            if (a.compare(0, prefix.size(), prefix) == 0) {
                out = a.substr(prefix.size());
                return true;
            }
        }
        return false;
    }

}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (has_flag(args, "--help")) {
        print_usage();
        return 0;
    }

    std::string value;
    std::filesystem::path config_path = quire::platform::system::get_config_dir() / "config.json";
    if (option_value(args, "--config", value)) config_path = value;

    auto config = quire::engine::Config::load(config_path);

    if (option_value(args, "--content-dir", value)) config.content_root = value;
    if (option_value(args, "--public-dir", value)) config.public_root = value;
    if (option_value(args, "--site-root", value)) config.site_root = value;
    if (option_value(args, "--workers", value)) {
        try {
            config.workers = static_cast<size_t>(std::stoul(value));
        } catch (const std::exception&) {
            std::cerr << "[Build] Invalid --workers value: " << value << "\n";
            return 1;
        }
    }
    if (has_flag(args, "--skip-responsive")) config.responsive_variants = false;
    if (has_flag(args, "--skip-modern-formats")) config.modern_formats = false;

    quire::engine::PipelineOptions options;
    options.enable_security = !has_flag(args, "--skip-security");
    options.dry_run = has_flag(args, "--dry-run");
    options.verbose = has_flag(args, "--verbose");

    if (has_flag(args, "--no-ledger")) {
        config.ledger_path.clear();
    } else if (config.ledger_path.empty()) {
        auto data_dir = quire::platform::system::get_data_dir();
        if (!data_dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(data_dir, ec);
            if (ec) {
                std::cerr << "[Build] Cannot create " << data_dir << ": " << ec.message() << "\n";
            } else {
                config.ledger_path = data_dir / "quire.db";
            }
        }
    }

    std::cout << "[Build] Processing static assets...\n";
    if (options.verbose) std::cout << "[Build] Config path: " << config_path << "\n";

    try {
        quire::engine::Pipeline pipeline(config, options);
        auto report = pipeline.run();
        std::cout << "[Build] Asset processing completed successfully (" << report.processed << " assets)\n";
    } catch (const quire::engine::ValidationError& e) {
        std::cerr << "[Build] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Build] Asset processing failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
