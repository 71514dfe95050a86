#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace quire::engine {

    /**
     * @brief Glob-based exclusion list applied while walking asset directories.
     */
    class Ignore {
    public:
        /**
         * @brief Loads patterns from a .quire_ignore file. A missing file is not an error.
         * @return Number of patterns read.
         */
        size_t load(const std::filesystem::path& ignore_file);

        /**
         * @brief Adds one glob pattern ('*' and '?' wildcards, '/' matches either separator).
         */
        void add(const std::string& glob);

        /**
         * @brief Editor droppings and VCS folders that never belong in a published tree.
         */
        void add_defaults();

        /**
         * @brief True if the entry's name, or its path relative to the walk root, matches a pattern.
         */
        bool check(const std::filesystem::path& path, const std::filesystem::path& root = {}) const;

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
