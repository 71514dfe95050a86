#include "service.hpp"
#include <stdexcept>

namespace quire::engine {

    namespace {
        std::string string_param(const nlohmann::json& params, size_t index, const char* name) {
            if (!params.is_array() || params.size() <= index || !params[index].is_string()) {
                throw std::invalid_argument(std::string("missing parameter: ") + name);
            }
            return params[index].get<std::string>();
        }

        nlohmann::json context_json(const AssetContext& context) {
            return {{"locale", context.locale}, {"version", context.version}};
        }
    }

    ResolverService::ResolverService(ManifestCache& cache, ContextResolver resolver)
        : m_cache(cache), m_resolver(std::move(resolver)) {}

    AssetContext ResolverService::context_param(const nlohmann::json& params) const {
        AssetContext context{m_resolver.options().default_locale, m_resolver.options().default_version};
        if (params.is_array() && params.size() > 1 && params[1].is_string()) context.locale = params[1];
        if (params.is_array() && params.size() > 2 && params[2].is_string()) context.version = params[2];
        return context;
    }

    std::string ResolverService::handle(const std::string& request) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(request);
        } catch (const nlohmann::json::parse_error&) {
            return nlohmann::json({{"error", "invalid json"}}).dump();
        }
        if (!j.is_object()) return nlohmann::json({{"error", "invalid request"}}).dump();

        try {
            std::string method = j.value("method", "");
            nlohmann::json params = j.contains("params") ? j["params"] : nlohmann::json::array();
            return nlohmann::json({{"result", dispatch(method, params)}}).dump();
        } catch (const std::invalid_argument& e) {
            return nlohmann::json({{"error", e.what()}}).dump();
        } catch (const nlohmann::json::exception& e) {
            return nlohmann::json({{"error", e.what()}}).dump();
        }
    }

    nlohmann::json ResolverService::dispatch(const std::string& method, const nlohmann::json& params) {
        if (method == "ping") return "pong";

        if (method == "shutdown") {
            m_shutdown = true;
            return "shutting down";
        }

        if (method == "invalidate") {
            m_cache.invalidate();
            return "invalidated";
        }

        auto manifest = m_cache.get();

        if (method == "status") {
            nlohmann::json res;
            res["manifest_path"] = m_cache.manifest_path().string();
            res["loaded"] = manifest != nullptr;
            res["asset_count"] = manifest ? manifest->assets.size() : 0;
            res["generated_at"] = manifest ? manifest->generated_at : "";
            res["locales"] = manifest ? manifest->locales : std::vector<std::string>{};
            res["versions"] = manifest ? manifest->versions : std::vector<std::string>{};
            return res;
        }

        if (method == "resolve") {
            std::string src = string_param(params, 0, "src");
            AssetContext context = context_param(params);

            std::optional<AssetResolutionResult> result;
            if (manifest) result = m_resolver.resolve(src, context, *manifest);

            if (!result) {
                return {{"publicPath", m_resolver.generate_direct_asset_path(src, context)},
                        {"fallbackUsed", true},
                        {"fallbackType", to_string(FallbackType::Direct)}};
            }

            nlohmann::json res;
            res["publicPath"] = result->public_path;
            res["fallbackUsed"] = result->fallback_used;
            if (result->fallback_type) res["fallbackType"] = to_string(*result->fallback_type);
            res["entry"] = result->entry;
            return res;
        }

        if (method == "exists") {
            std::string src = string_param(params, 0, "src");
            return manifest ? m_resolver.exists_in_context(src, context_param(params), *manifest) : false;
        }

        if (method == "availability") {
            std::string src = string_param(params, 0, "src");
            nlohmann::json res = nlohmann::json::array();
            if (manifest) {
                for (const auto& item : m_resolver.availability(src, *manifest)) {
                    nlohmann::json row = context_json(item.context);
                    row["available"] = item.available;
                    res.push_back(row);
                }
            }
            return res;
        }

        if (method == "contexts") {
            nlohmann::json res = nlohmann::json::array();
            if (manifest) {
                for (const auto& context : ContextResolver::all_contexts(*manifest)) {
                    res.push_back(context_json(context));
                }
            }
            return res;
        }

        throw std::invalid_argument("unknown method: " + method);
    }

}
