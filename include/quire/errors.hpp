#pragma once
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace quire::engine {

    /**
     * @brief Thrown by strict path sanitization on traversal or injection attempts.
     */
    class PathSecurityError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief I/O failure while reading or hashing a single asset.
     */
    class ProcessingError : public std::runtime_error {
    public:
        ProcessingError(const std::filesystem::path& path, const std::string& cause)
            : std::runtime_error("Failed to process asset " + path.string() + ": " + cause), m_path(path) {}

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    /**
     * @brief Copy or manifest-write failure. May aggregate several failed assets.
     */
    class PublishError : public std::runtime_error {
    public:
        explicit PublishError(const std::string& message)
            : std::runtime_error(message), m_failures{message} {}

        explicit PublishError(std::vector<std::string> failures)
            : std::runtime_error(join(failures)), m_failures(std::move(failures)) {}

        const std::vector<std::string>& failures() const { return m_failures; }

    private:
        std::vector<std::string> m_failures;

        static std::string join(const std::vector<std::string>& failures) {
            std::string msg = "Publishing failed for " + std::to_string(failures.size()) + " asset(s)";
            for (const auto& f : failures) msg += "\n  " + f;
            return msg;
        }
    };

    /**
     * @brief An existing assets directory could not be read during discovery.
     */
    class DiscoveryError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ManifestError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Raised by the pipeline when one or more assets fail security validation.
     */
    class ValidationError : public std::runtime_error {
    public:
        explicit ValidationError(std::map<std::string, std::vector<std::string>> rejected)
            : std::runtime_error("Asset security validation failed for " + std::to_string(rejected.size()) + " files"),
              m_rejected(std::move(rejected)) {}

        const std::map<std::string, std::vector<std::string>>& rejected() const { return m_rejected; }

    private:
        std::map<std::string, std::vector<std::string>> m_rejected;
    };

}
