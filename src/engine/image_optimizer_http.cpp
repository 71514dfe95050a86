#include "image_optimizer.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace quire::engine {

    /**
     * @brief Delegates image work to a remote optimizer service.
     *
     * The image bytes are POSTed to {endpoint}/{operation}; the service stores
     * any derivatives it produces under the directory given in X-Quire-Public-Dir
     * and replies with JSON describing them.
     */
    class HttpImageOptimizer : public ImageOptimizer {
    public:
        explicit HttpImageOptimizer(std::string endpoint) : m_endpoint(std::move(endpoint)) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~HttpImageOptimizer() override {
            curl_global_cleanup();
        }

        ImageDimensions get_image_dimensions(const std::filesystem::path& path) override {
            json reply = post("dimensions", path, "application/octet-stream", ProcessedAsset{}, "");
            return {reply.at("width").get<uint32_t>(), reply.at("height").get<uint32_t>()};
        }

        std::vector<AssetDerivative> generate_responsive_variants(const ProcessedAsset& asset,
                                                                  const ResponsiveVariantOptions& options) override {
            std::string query = "retina=" + std::string(options.generate_retina ? "1" : "0") +
                                "&quality=" + std::to_string(options.quality);
            if (!options.sizes.empty()) {
                query += "&sizes=";
                for (size_t i = 0; i < options.sizes.size(); ++i) {
                    if (i) query += ",";
                    query += std::to_string(options.sizes[i]);
                }
            }
            return parse_derivatives(asset, post("responsive", asset.source_path, asset.mime_type, asset, query));
        }

        std::vector<AssetDerivative> convert_to_modern_formats(const ProcessedAsset& asset,
                                                               const ModernFormatOptions& options) override {
            if (asset.mime_type == "image/svg+xml") return {};

            std::string query;
            if (options.webp.enabled) {
                query += "webp=" + std::to_string(options.webp.quality) + ":" + std::to_string(options.webp.effort);
            }
            if (options.avif.enabled) {
                if (!query.empty()) query += "&";
                query += "avif=" + std::to_string(options.avif.quality) + ":" + std::to_string(options.avif.effort);
            }
            if (query.empty()) return {};
            return parse_derivatives(asset, post("formats", asset.source_path, asset.mime_type, asset, query));
        }

    private:
        std::string m_endpoint;

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        static std::string public_dir_of(const ProcessedAsset& asset) {
            auto slash = asset.public_path.rfind('/');
            return slash == std::string::npos ? std::string() : asset.public_path.substr(0, slash);
        }

        json post(const std::string& operation, const std::filesystem::path& path, const std::string& mime,
                  const ProcessedAsset& asset, const std::string& query) {
            std::ifstream file(path, std::ios::binary);
            if (!file) throw std::runtime_error("cannot open " + path.string());
            std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

            CURL* curl = curl_easy_init();
            if (!curl) throw std::runtime_error("curl_easy_init failed");

            std::string url = m_endpoint + "/" + operation + (query.empty() ? "" : "?" + query);
            std::string content_type = "Content-Type: " + mime;
            std::string public_dir = "X-Quire-Public-Dir: " + public_dir_of(asset);
            std::string hash = "X-Quire-Content-Hash: " + asset.content_hash;

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, content_type.c_str());
            if (!asset.public_path.empty()) {
                headers = curl_slist_append(headers, public_dir.c_str());
                headers = curl_slist_append(headers, hash.c_str());
            }

            std::string response;
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
            curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

            CURLcode res = curl_easy_perform(curl);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw std::runtime_error(operation + " request failed: " + curl_easy_strerror(res));
            }
            return json::parse(response);
        }

        static std::vector<AssetDerivative> parse_derivatives(const ProcessedAsset& asset, const json& reply) {
            std::vector<AssetDerivative> derivatives;
            for (const auto& item : reply.at("derivatives")) {
                AssetDerivative d;
                d.variant = item.at("variant").get<std::string>();
                d.hashed_filename = item.at("hashedFilename").get<std::string>();
                d.public_path = derivative_public_path(asset, d.hashed_filename);
                d.file_size = item.value("fileSize", std::uintmax_t{0});
                if (item.contains("width") && item.contains("height")) {
                    d.dimensions = ImageDimensions{item["width"].get<uint32_t>(), item["height"].get<uint32_t>()};
                }
                derivatives.push_back(std::move(d));
            }
            return derivatives;
        }
    };

    std::unique_ptr<ImageOptimizer> create_http_optimizer(const std::string& endpoint) {
        return std::make_unique<HttpImageOptimizer>(endpoint);
    }

}
