#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "asset_processor.hpp"
#include "config.hpp"
#include "image_optimizer.hpp"
#include "ledger.hpp"
#include "quire/types.hpp"

namespace quire::engine {

    struct PipelineOptions {
        bool enable_security = true;
        bool dry_run = false;
        bool verbose = false;
    };

    struct BuildReport {
        size_t discovered = 0;
        size_t processed = 0;
        size_t derivatives = 0;
        std::vector<std::string> locales;
        std::vector<std::string> versions;
        AssetManifest manifest;
        std::optional<LedgerDiff> ledger;
    };

    /**
     * @brief Optimizer backend selected by the configuration.
     */
    std::shared_ptr<ImageOptimizer> create_optimizer(const Config& config);

    ProcessOptions process_options_from(const Config& config);

    /**
     * @brief One batch build: discover, validate, process, build the manifest, publish.
     */
    class Pipeline {
    public:
        Pipeline(Config config, PipelineOptions options, std::shared_ptr<ImageOptimizer> optimizer = nullptr);

        /**
         * @throws ValidationError if any asset is rejected (after reporting all of them).
         * @throws DiscoveryError, ProcessingError or PublishError on I/O failures.
         */
        BuildReport run();

    private:
        Config m_config;
        PipelineOptions m_options;
        std::shared_ptr<ImageOptimizer> m_optimizer;

        void validate(const std::vector<AssetReference>& assets) const;
        std::optional<LedgerDiff> update_ledger(const std::vector<ProcessedAsset>& assets,
                                                const std::string& generated_at) const;
    };

}
