#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "mime.hpp"
#include "quire/types.hpp"

namespace quire::engine {

    constexpr std::uintmax_t kMaxFileSize = 10 * 1024 * 1024;

    struct SecurityOptions {
        std::uintmax_t max_file_size = kMaxFileSize;
        std::vector<std::string> allowed_image_types = default_image_types();
        std::vector<std::string> allowed_binary_types = default_binary_types();
        bool enable_content_scanning = true;
        bool strict_path_validation = true;
    };

    /**
     * @brief Read-only checks applied to asset files before they are published.
     *
     * Ordinary failures are reported through ValidationResult. The one exception
     * is strict sanitize_path(), which throws PathSecurityError.
     */
    class SecurityValidator {
    public:
        explicit SecurityValidator(SecurityOptions options = {});

        /**
         * @brief True if the extension maps to an allowed image or binary MIME type.
         */
        bool validate_file_type(const std::filesystem::path& path) const;

        /**
         * @brief Normalizes separators and strips leading "./", "/", "\" and drive letters.
         *
         * In strict mode, paths containing "..", a leading "~", a null byte, or a
         * sensitive system prefix (/etc/, /proc/, /sys/, /dev/, /var/log/, /root/,
         * hidden entries under /home/<user>/) are rejected. In lenient mode the
         * offending segments are removed instead.
         *
         * @throws PathSecurityError in strict mode.
         */
        std::string sanitize_path(const std::string& input, bool strict) const;
        std::string sanitize_path(const std::string& input) const {
            return sanitize_path(input, m_options.strict_path_validation);
        }

        /**
         * @brief False if the file exceeds max_file_size or cannot be stat'ed.
         */
        bool check_file_size(const std::filesystem::path& path) const;

        /**
         * @brief Inspects the first 1 KB for executables, scripts, injection markers
         *        and image signatures that disagree with the extension.
         * @return true if the content looks safe (or scanning is disabled).
         */
        bool scan_for_malicious_content(const std::filesystem::path& path) const;

        /**
         * @brief Runs existence, type, size, path and content checks. Never throws.
         */
        ValidationResult validate_asset(const std::filesystem::path& path) const;

        /**
         * @brief Validates each path independently on a worker pool. Never throws.
         * @param workers 0 selects the hardware concurrency.
         */
        std::map<std::string, ValidationResult> validate_assets(const std::vector<std::filesystem::path>& paths,
                                                                size_t workers = 0) const;

        const SecurityOptions& options() const { return m_options; }

    private:
        SecurityOptions m_options;

        bool is_allowed_image(const std::string& mime) const;
        bool analyze_content(const std::string& head, const std::filesystem::path& path) const;
    };

}
