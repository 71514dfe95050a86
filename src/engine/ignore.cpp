#include "ignore.hpp"
#include <fstream>
#include <iostream>

namespace quire::engine {

    size_t Ignore::load(const std::filesystem::path& ignore_file) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ignore_file, ec)) return 0;

        std::ifstream file(ignore_file);
        std::string line;
        size_t count = 0;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line);
            ++count;
        }
        return count;
    }

    void Ignore::add(const std::string& glob) {
        try {
            m_patterns.push_back({std::regex(glob_to_regex(glob)), glob});
        } catch (const std::regex_error& e) {
            std::cerr << "[Ignore] Skipping bad pattern '" << glob << "': " << e.what() << "\n";
        }
    }

    void Ignore::add_defaults() {
        for (const char* p : {".git", ".svn", ".DS_Store", "Thumbs.db", "desktop.ini", "*.tmp", "*~", ".*.swp"}) {
            add(p);
        }
    }

    bool Ignore::check(const std::filesystem::path& path, const std::filesystem::path& root) const {
        std::string filename = path.filename().string();
        std::string relative;
        if (!root.empty()) relative = path.lexically_relative(root).generic_string();

        for (const auto& p : m_patterns) {
            if (std::regex_match(filename, p.regex)) return true;
            if (!relative.empty() && std::regex_match(relative, p.regex)) return true;
        }
        return false;
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string out = "^";
        for (size_t i = 0; i < glob.size(); ++i) {
            char c = glob[i];
            switch (c) {
                case '*':
                    if (i + 1 < glob.size() && glob[i + 1] == '*') {
                        out += ".*";
                        ++i;
                    } else {
                        out += "[^/\\\\]*";
                    }
                    break;
                case '?': out += "[^/\\\\]"; break;
                case '/': out += "[/\\\\]"; break;
                case '.': case '+': case '(': case ')': case '[': case ']':
                case '{': case '}': case '^': case '$': case '|': case '\\':
                    out += '\\';
                    out += c;
                    break;
                default: out += c;
            }
        }
        out += "$";
        return out;
    }

}
