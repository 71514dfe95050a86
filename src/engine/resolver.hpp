#pragma once

#include <optional>
#include <string>
#include <vector>
#include "quire/types.hpp"

namespace quire::engine {

    struct ResolverOptions {
        std::string default_locale = "en";
        std::vector<std::string> locales = {"en", "es", "pt"};
        std::string default_version = "v1";
        std::string public_root = "public/assets";
    };

    struct ContextAvailability {
        AssetContext context;
        bool available = false;
    };

    /**
     * @brief Resolves logical asset references against a loaded manifest.
     *
     * Lookup order: exact context, same locale in every other known version,
     * default locale at the same version, default locale in every known version.
     * All operations are read-only over the manifest.
     */
    class ContextResolver {
    public:
        struct Candidate {
            AssetContext context;
            std::optional<FallbackType> fallback; // empty for the exact match
        };

        explicit ContextResolver(ResolverOptions options = {});

        /**
         * @brief Resolves src for the given context.
         * @return Empty when no tier matches; callers fall back to generate_direct_asset_path().
         */
        std::optional<AssetResolutionResult> resolve(const std::string& src,
                                                     const AssetContext& context,
                                                     const AssetManifest& manifest) const;

        /**
         * @brief The ordered (context, tier) list resolve() walks. Duplicates are dropped.
         */
        std::vector<Candidate> candidates(const AssetContext& context, const AssetManifest& manifest) const;

        /**
         * @brief Manifest keys probed for one context; the first listed key that matches wins.
         */
        static std::vector<std::string> candidate_keys(const std::string& normalized_src, const AssetContext& context);

        /**
         * @brief Every locale x version pair known to the manifest.
         */
        static std::vector<AssetContext> all_contexts(const AssetManifest& manifest);

        bool exists_in_context(const std::string& src, const AssetContext& context, const AssetManifest& manifest) const;

        /**
         * @brief Existence of src in every known context, for completeness audits.
         */
        std::vector<ContextAvailability> availability(const std::string& src, const AssetManifest& manifest) const;

        /**
         * @brief Unhashed best-effort path used when resolution misses.
         */
        std::string generate_direct_asset_path(const std::string& src, const AssetContext& context) const;

        /**
         * @brief First "/v<digits>" in the pathname, otherwise the default version.
         */
        std::string version_from_pathname(const std::string& pathname) const;

        /**
         * @brief Locale from the first path segment (if supported) plus version_from_pathname().
         */
        AssetContext context_from_pathname(const std::string& pathname) const;

        const ResolverOptions& options() const { return m_options; }

    private:
        ResolverOptions m_options;

        static std::string normalize(const std::string& src);
        static const ManifestEntry* try_exact(const std::string& normalized_src,
                                              const AssetContext& context,
                                              const AssetManifest& manifest);
    };

}
