#include "pipeline.hpp"
#include "manifest.hpp"
#include "publisher.hpp"
#include "scanner.hpp"
#include "security_validator.hpp"
#include "quire/errors.hpp"
#include <iostream>
#include <map>
#include <set>

namespace quire::engine {

    namespace {
        std::string join(const std::vector<std::string>& items) {
            std::string out;
            for (const auto& item : items) {
                if (!out.empty()) out += ", ";
                out += item;
            }
            return out;
        }
    }

    std::shared_ptr<ImageOptimizer> create_optimizer(const Config& config) {
        if (config.optimizer_backend == Config::OptimizerBackend::Http) {
            return create_http_optimizer(config.optimizer_endpoint);
        }
        return create_probe_optimizer();
    }

    ProcessOptions process_options_from(const Config& config) {
        ProcessOptions options;
        options.generate_responsive_variants = config.responsive_variants;
        options.generate_modern_formats = config.modern_formats;
        return options;
    }

    Pipeline::Pipeline(Config config, PipelineOptions options, std::shared_ptr<ImageOptimizer> optimizer)
        : m_config(std::move(config)), m_options(options), m_optimizer(std::move(optimizer)) {
        if (!m_optimizer) m_optimizer = create_optimizer(m_config);
    }

    BuildReport Pipeline::run() {
        BuildReport report;

        Scanner scanner(m_config.content_root);
        if (m_options.verbose) std::cout << "[Pipeline] Scanning content directory: " << m_config.content_root << "\n";
        auto assets = scanner.discover_assets();
        report.discovered = assets.size();

        std::set<std::string> locales;
        std::map<std::string, size_t> by_type;
        for (const auto& a : assets) {
            locales.insert(a.locale);
            ++by_type[to_string(a.type)];
        }
        std::cout << "[Pipeline] Found " << assets.size() << " assets across " << locales.size() << " locales\n";
        if (m_options.verbose) {
            for (const auto& [type, count] : by_type) std::cout << "[Pipeline]   " << type << ": " << count << "\n";
        }

        if (m_options.enable_security) validate(assets);

        std::cout << "[Pipeline] Processing " << assets.size() << " assets...\n";
        AssetProcessor processor(m_config.public_root, m_optimizer);
        auto processed = processor.process_assets(assets, process_options_from(m_config), m_config.workers);
        report.processed = processed.size();
        for (const auto& p : processed) {
            report.derivatives += p.derivatives.size();
            if (m_options.verbose) std::cout << "[Pipeline]   " << p.relative_path << " -> " << p.public_path << "\n";
        }

        report.manifest = generate_manifest(processed, m_options.enable_security);
        report.locales = report.manifest.locales;
        report.versions = report.manifest.versions;

        if (m_options.dry_run) {
            std::cout << "[Pipeline] Dry run: nothing copied, manifest not written\n";
        } else {
            Publisher publisher(m_config.site_root, m_config.manifest_path(), m_config.workers);
            std::cout << "[Pipeline] Copying assets to " << (m_config.site_root / m_config.public_root) << "\n";
            publisher.copy_assets_to_public_directory(processed);
            publisher.write_manifest(report.manifest);
            std::cout << "[Pipeline] Manifest written to " << publisher.manifest_path() << "\n";

            report.ledger = update_ledger(processed, report.manifest.generated_at);
        }

        std::cout << "[Pipeline] Processed " << report.processed << " assets";
        if (report.derivatives > 0) std::cout << " (" << report.derivatives << " derivatives)";
        std::cout << "\n[Pipeline] Locales: " << join(report.locales)
                  << "\n[Pipeline] Versions: " << join(report.versions) << "\n";
        return report;
    }

    void Pipeline::validate(const std::vector<AssetReference>& assets) const {
        std::cout << "[Pipeline] Validating " << assets.size() << " assets for security...\n";

        SecurityOptions security;
        security.max_file_size = m_config.max_file_size;
        security.enable_content_scanning = m_config.content_scanning;
        security.strict_path_validation = m_config.strict_paths;
        SecurityValidator validator(security);

        std::vector<std::filesystem::path> paths;
        paths.reserve(assets.size());
        for (const auto& a : assets) paths.push_back(a.source_path);

        std::map<std::string, std::vector<std::string>> rejected;
        for (auto& [path, result] : validator.validate_assets(paths, m_config.workers)) {
            for (const auto& warning : result.warnings) {
                if (m_options.verbose) std::cout << "[Validator] " << path << ": " << warning << "\n";
            }
            if (!result.is_valid) rejected.emplace(path, std::move(result.errors));
        }

        if (!rejected.empty()) {
            std::cerr << "[Validator] " << rejected.size() << " assets failed security validation:\n";
            for (const auto& [path, errors] : rejected) {
                std::cerr << "[Validator]   " << path << "\n";
                for (const auto& e : errors) std::cerr << "[Validator]     - " << e << "\n";
            }
            throw ValidationError(std::move(rejected));
        }
        std::cout << "[Validator] All assets passed security validation\n";
    }

    std::optional<LedgerDiff> Pipeline::update_ledger(const std::vector<ProcessedAsset>& assets,
                                                      const std::string& generated_at) const {
        if (m_config.ledger_path.empty()) return std::nullopt;

        Ledger ledger;
        if (!ledger.open(m_config.ledger_path)) {
            std::cerr << "[Ledger] Warning: change tracking disabled for this build\n";
            return std::nullopt;
        }

        LedgerDiff diff = ledger.diff(assets);
        if (ledger.record_build(assets, generated_at) < 0) {
            std::cerr << "[Ledger] Warning: failed to record build\n";
        }
        if (diff.previous_build > 0) std::cout << "[Ledger] Compared with build #" << diff.previous_build << "\n";
        std::cout << "[Ledger] Added: " << diff.added << ", Changed: " << diff.changed
                  << ", Unchanged: " << diff.unchanged << ", Removed: " << diff.removed.size() << "\n";
        return diff;
    }

}
