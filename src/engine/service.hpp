#pragma once

#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include "manifest.hpp"
#include "resolver.hpp"

namespace quire::engine {

    /**
     * @brief Request dispatcher behind quired's socket.
     *
     * Requests are {"method": m, "params": [...]}; replies are {"result": ...}
     * or {"error": "..."}. Every reply reads from one manifest snapshot.
     */
    class ResolverService {
    public:
        ResolverService(ManifestCache& cache, ContextResolver resolver);

        std::string handle(const std::string& request);

        nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

        bool shutdown_requested() const { return m_shutdown; }

        const ContextResolver& resolver() const { return m_resolver; }

    private:
        ManifestCache& m_cache;
        ContextResolver m_resolver;
        std::atomic<bool> m_shutdown{false};

        AssetContext context_param(const nlohmann::json& params) const;
    };

}
