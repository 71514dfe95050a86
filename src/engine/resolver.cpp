#include "resolver.hpp"
#include <algorithm>
#include <regex>

namespace quire::engine {

    ContextResolver::ContextResolver(ResolverOptions options) : m_options(std::move(options)) {}

    std::string ContextResolver::normalize(const std::string& src) {
        return (!src.empty() && src[0] == '/') ? src.substr(1) : src;
    }

    std::vector<std::string> ContextResolver::candidate_keys(const std::string& normalized_src,
                                                             const AssetContext& context) {
        const std::string base = context.locale + "/" + context.version + "/assets/";
        return {
            base + normalized_src,
            base + "images/" + normalized_src,
            base + "files/" + normalized_src,
            normalized_src
        };
    }

    const ManifestEntry* ContextResolver::try_exact(const std::string& normalized_src,
                                                    const AssetContext& context,
                                                    const AssetManifest& manifest) {
        for (const auto& key : candidate_keys(normalized_src, context)) {
            auto it = manifest.assets.find(key);
            if (it != manifest.assets.end() &&
                it->second.locale == context.locale && it->second.version == context.version) {
                return &it->second;
            }
        }
        return nullptr;
    }

    std::vector<ContextResolver::Candidate> ContextResolver::candidates(const AssetContext& context,
                                                                        const AssetManifest& manifest) const {
        std::vector<Candidate> list;
        auto add = [&list](AssetContext ctx, std::optional<FallbackType> tier) {
            bool seen = std::any_of(list.begin(), list.end(),
                                    [&](const Candidate& c) { return c.context == ctx; });
            if (!seen) list.push_back({std::move(ctx), tier});
        };

        add(context, std::nullopt);
        for (const auto& version : manifest.versions) {
            if (version != context.version) add({context.locale, version}, FallbackType::Version);
        }
        const auto& fallback_locale = m_options.default_locale;
        if (context.locale != fallback_locale) {
            add({fallback_locale, context.version}, FallbackType::Locale);
        }
        for (const auto& version : manifest.versions) {
            add({fallback_locale, version}, FallbackType::Locale);
        }
        return list;
    }

    std::optional<AssetResolutionResult> ContextResolver::resolve(const std::string& src,
                                                                  const AssetContext& context,
                                                                  const AssetManifest& manifest) const {
        const std::string normalized = normalize(src);

        for (const auto& candidate : candidates(context, manifest)) {
            if (const ManifestEntry* entry = try_exact(normalized, candidate.context, manifest)) {
                AssetResolutionResult result;
                result.public_path = entry->public_path;
                result.entry = *entry;
                result.fallback_used = candidate.fallback.has_value();
                result.fallback_type = candidate.fallback;
                return result;
            }
        }
        return std::nullopt;
    }

    std::vector<AssetContext> ContextResolver::all_contexts(const AssetManifest& manifest) {
        std::vector<AssetContext> contexts;
        contexts.reserve(manifest.locales.size() * manifest.versions.size());
        for (const auto& locale : manifest.locales) {
            for (const auto& version : manifest.versions) {
                contexts.push_back({locale, version});
            }
        }
        return contexts;
    }

    bool ContextResolver::exists_in_context(const std::string& src,
                                            const AssetContext& context,
                                            const AssetManifest& manifest) const {
        return try_exact(normalize(src), context, manifest) != nullptr;
    }

    std::vector<ContextAvailability> ContextResolver::availability(const std::string& src,
                                                                   const AssetManifest& manifest) const {
        std::vector<ContextAvailability> matrix;
        for (auto& context : all_contexts(manifest)) {
            bool available = exists_in_context(src, context, manifest);
            matrix.push_back({std::move(context), available});
        }
        return matrix;
    }

    std::string ContextResolver::generate_direct_asset_path(const std::string& src,
                                                            const AssetContext& context) const {
        std::string normalized = normalize(src);
        std::string filename = normalized.substr(normalized.rfind('/') + 1);
        if (filename.empty()) filename = "unknown";

        static const std::regex image_ext(R"(\.(jpg|jpeg|png|gif|webp|avif|svg)$)", std::regex::icase);
        const char* dir = std::regex_search(filename, image_ext) ? "images" : "files";

        std::string root = m_options.public_root;
        while (!root.empty() && root.front() == '/') root.erase(0, 1);
        while (!root.empty() && root.back() == '/') root.pop_back();

        return "/" + root + "/" + context.locale + "/" + context.version + "/" + dir + "/" + filename;
    }

    std::string ContextResolver::version_from_pathname(const std::string& pathname) const {
        static const std::regex version_re(R"(/v(\d+))");
        std::smatch match;
        if (std::regex_search(pathname, match, version_re)) {
            return "v" + match[1].str();
        }
        return m_options.default_version;
    }

    AssetContext ContextResolver::context_from_pathname(const std::string& pathname) const {
        AssetContext context{m_options.default_locale, version_from_pathname(pathname)};

        size_t start = (!pathname.empty() && pathname[0] == '/') ? 1 : 0;
        size_t end = pathname.find('/', start);
        std::string segment = pathname.substr(start, end == std::string::npos ? std::string::npos : end - start);

        const auto& locales = m_options.locales;
        if (std::find(locales.begin(), locales.end(), segment) != locales.end()) {
            context.locale = segment;
        }
        return context;
    }

}
