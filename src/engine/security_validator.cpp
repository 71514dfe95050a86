#include "security_validator.hpp"
#include "job_queue.hpp"
#include "quire/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace quire::engine {

    namespace {

        constexpr size_t kScanBytes = 1024;
        constexpr size_t kTextScanBytes = 512;

        const std::vector<std::string>& executable_signatures() {
            static const std::vector<std::string> signatures = {
                std::string("\x4D\x5A", 2),             // PE/DOS (MZ)
                std::string("\x7F\x45\x4C\x46", 4),     // ELF
                std::string("\xFE\xED\xFA\xCE", 4),     // Mach-O 32-bit
                std::string("\xFE\xED\xFA\xCF", 4),     // Mach-O 64-bit
                std::string("\xCA\xFE\xBA\xBE", 4)      // Java class
            };
            return signatures;
        }

        const std::vector<std::regex>& script_patterns() {
            static const auto icase = std::regex::ECMAScript | std::regex::icase;
            static const std::vector<std::regex> patterns = {
                std::regex(R"(<script[^>]*>)", icase),
                std::regex(R"(javascript:)", icase),
                std::regex(R"(vbscript:)", icase),
                std::regex(R"(\bon[a-z]+\s*=)", icase),
                std::regex(R"(eval\s*\()", icase),
                std::regex(R"(document\.write)", icase),
                std::regex(R"(window\.location)", icase),
                std::regex(R"(\.innerHTML)", icase)
            };
            return patterns;
        }

        const std::vector<std::regex>& injection_patterns() {
            static const auto icase = std::regex::ECMAScript | std::regex::icase;
            static const std::vector<std::regex> patterns = {
                std::regex(R"(\$\{.*\})"),
                std::regex(R"(<\?php)", icase),
                std::regex(R"(<%.*%>)"),
                std::regex(R"(\{\{.*\}\})"),
                std::regex(R"(\bexec\s*\()", icase),
                std::regex(R"(\bsystem\s*\()", icase),
                std::regex(R"(\bshell_exec\s*\()", icase),
                std::regex(R"(\bpassthru\s*\()", icase),
                std::regex(R"(\bfile_get_contents\s*\()", icase),
                std::regex(R"(\bfopen\s*\()", icase),
                std::regex(R"(\binclude\s*\()", icase),
                std::regex(R"(\brequire\s*\()", icase)
            };
            return patterns;
        }

        const std::set<std::string>& script_extensions() {
            static const std::set<std::string> exts = {".js", ".ts", ".py", ".sh", ".bat", ".ps1"};
            return exts;
        }

        bool starts_with(const std::string& s, const std::string& prefix) {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }

        bool any_match(const std::vector<std::regex>& patterns, const std::string& text) {
            return std::any_of(patterns.begin(), patterns.end(),
                               [&](const std::regex& re) { return std::regex_search(text, re); });
        }

        bool has_executable_signature(const std::string& head) {
            const auto& sigs = executable_signatures();
            return std::any_of(sigs.begin(), sigs.end(), [&](const std::string& sig) { return starts_with(head, sig); });
        }

        bool matches_image_signature(const std::string& head, const std::string& ext) {
            if (ext == ".jpg" || ext == ".jpeg") return starts_with(head, std::string("\xFF\xD8\xFF", 3));
            if (ext == ".png") return starts_with(head, std::string("\x89PNG\r\n\x1A\n", 8));
            if (ext == ".gif") return starts_with(head, "GIF87a") || starts_with(head, "GIF89a");
            if (ext == ".webp") return starts_with(head, "RIFF");
            if (ext == ".svg") {
                std::string text = head.substr(0, 100);
                size_t first = text.find_first_not_of(" \t\r\n");
                if (first == std::string::npos) return false;
                text = text.substr(first);
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return starts_with(text, "<?xml") || starts_with(text, "<svg");
            }
            return true; // no known signature (e.g. avif)
        }

        const std::vector<std::string>& sensitive_prefixes() {
            static const std::vector<std::string> prefixes = {
                "/etc/", "/proc/", "/sys/", "/dev/", "/var/log/", "/root/"
            };
            return prefixes;
        }

        bool is_hidden_home_entry(const std::string& path) {
            static const std::regex hidden(R"(^/home/[^/]+/\.[^/]+)");
            return std::regex_search(path, hidden);
        }

        std::string lexically_normalize(std::string path) {
            std::replace(path.begin(), path.end(), '\\', '/');
            if (path.empty()) return path;
            return std::filesystem::path(path).lexically_normal().generic_string();
        }

        void check_path_security(const std::string& normalized) {
            if (normalized.find("..") != std::string::npos) {
                throw PathSecurityError("Path traversal attempt detected: " + normalized);
            }
            if (!normalized.empty() && normalized[0] == '~') {
                throw PathSecurityError("Home directory access attempt detected: " + normalized);
            }
            for (const auto& prefix : sensitive_prefixes()) {
                if (starts_with(normalized, prefix) || normalized + "/" == prefix) {
                    throw PathSecurityError("Suspicious path pattern detected: " + normalized);
                }
            }
            if (is_hidden_home_entry(normalized)) {
                throw PathSecurityError("Suspicious path pattern detected: " + normalized);
            }
        }

        std::string strip_dangerous_segments(const std::string& path) {
            std::string result;
            std::stringstream ss(path);
            std::string segment;
            bool absolute = !path.empty() && path[0] == '/';
            while (std::getline(ss, segment, '/')) {
                if (segment.empty() || segment == "." || segment == ".." || segment[0] == '~') continue;
                if (!result.empty()) result += '/';
                result += segment;
            }
            return absolute ? "/" + result : result;
        }

    }

    SecurityValidator::SecurityValidator(SecurityOptions options) : m_options(std::move(options)) {}

    bool SecurityValidator::is_allowed_image(const std::string& mime) const {
        const auto& images = m_options.allowed_image_types;
        return std::find(images.begin(), images.end(), mime) != images.end();
    }

    bool SecurityValidator::validate_file_type(const std::filesystem::path& path) const {
        std::string mime = mime_type_for(path);
        const auto& binaries = m_options.allowed_binary_types;
        return is_allowed_image(mime) || std::find(binaries.begin(), binaries.end(), mime) != binaries.end();
    }

    std::string SecurityValidator::sanitize_path(const std::string& input, bool strict) const {
        std::string normalized;
        if (strict) {
            if (input.find('\0') != std::string::npos) {
                throw PathSecurityError("Null byte in path detected");
            }
            normalized = lexically_normalize(input);
            check_path_security(normalized);
        } else {
            std::string cleaned = input;
            cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\0'), cleaned.end());
            std::replace(cleaned.begin(), cleaned.end(), '\\', '/');
            normalized = lexically_normalize(strip_dangerous_segments(cleaned));
        }

        size_t start = normalized.find_first_not_of("./\\");
        std::string sanitized = (start == std::string::npos) ? std::string() : normalized.substr(start);

        if (sanitized.size() >= 2 && std::isalpha(static_cast<unsigned char>(sanitized[0])) && sanitized[1] == ':') {
            sanitized.erase(0, 2);
            size_t rest = sanitized.find_first_not_of("/\\");
            sanitized.erase(0, rest == std::string::npos ? sanitized.size() : rest);
        }
        std::replace(sanitized.begin(), sanitized.end(), '\\', '/');
        return sanitized;
    }

    bool SecurityValidator::check_file_size(const std::filesystem::path& path) const {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return false;
        return size <= m_options.max_file_size;
    }

    bool SecurityValidator::scan_for_malicious_content(const std::filesystem::path& path) const {
        if (!m_options.enable_content_scanning) return true;

        std::ifstream file(path, std::ios::binary);
        if (!file) return false;

        std::string head(kScanBytes, '\0');
        file.read(&head[0], static_cast<std::streamsize>(head.size()));
        if (file.bad()) return false;
        head.resize(static_cast<size_t>(file.gcount()));

        return analyze_content(head, path);
    }

    bool SecurityValidator::analyze_content(const std::string& head, const std::filesystem::path& path) const {
        if (has_executable_signature(head)) return false;

        std::string ext = lowercase_extension(path);
        std::string text = head.substr(0, kTextScanBytes);

        if (script_extensions().count(ext) == 0 && any_match(script_patterns(), text)) return false;
        if (any_match(injection_patterns(), text)) return false;

        if (is_allowed_image(mime_type_for(path))) {
            return matches_image_signature(head, ext);
        }
        return true;
    }

    ValidationResult SecurityValidator::validate_asset(const std::filesystem::path& path) const {
        ValidationResult result;
        std::error_code ec;

        if (!std::filesystem::exists(path, ec)) {
            result.is_valid = false;
            result.errors.push_back("File does not exist: " + path.string());
            return result;
        }

        if (!validate_file_type(path)) {
            result.is_valid = false;
            result.errors.push_back("File type not allowed: " + mime_type_for(path));
        }

        if (!check_file_size(path)) {
            result.is_valid = false;
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                result.errors.push_back("Unable to determine file size: " + ec.message());
            } else {
                result.errors.push_back("File size exceeds maximum allowed size (" +
                                        std::to_string(m_options.max_file_size) + " bytes): " +
                                        std::to_string(size) + " bytes");
            }
        }

        const std::string original = path.string();
        try {
            std::string sanitized = sanitize_path(original);
            if (sanitized != original) {
                result.warnings.push_back("Path was sanitized from " + original + " to " + sanitized);
                result.sanitized_path = sanitized;
            }
        } catch (const PathSecurityError& e) {
            result.is_valid = false;
            result.errors.push_back(std::string("Path validation failed: ") + e.what());
        }

        if (result.is_valid && !scan_for_malicious_content(path)) {
            result.is_valid = false;
            result.errors.push_back("File content appears to be malicious or suspicious");
        }

        return result;
    }

    std::map<std::string, ValidationResult> SecurityValidator::validate_assets(
            const std::vector<std::filesystem::path>& paths, size_t workers) const {
        std::vector<std::string> keys;
        keys.reserve(paths.size());
        std::set<std::string> seen;
        for (const auto& p : paths) {
            if (seen.insert(p.string()).second) keys.push_back(p.string());
        }

        std::vector<ValidationResult> results(keys.size());
        auto failures = run_parallel(keys.size(), workers, [&](size_t i) {
            results[i] = validate_asset(keys[i]);
        });

        std::map<std::string, ValidationResult> out;
        for (size_t i = 0; i < keys.size(); ++i) {
            if (failures[i]) {
                ValidationResult failed;
                failed.is_valid = false;
                try {
                    std::rethrow_exception(failures[i]);
                } catch (const std::exception& e) {
                    failed.errors.push_back(std::string("Validation error: ") + e.what());
                }
                results[i] = std::move(failed);
            }
            out.emplace(keys[i], std::move(results[i]));
        }
        return out;
    }

}
