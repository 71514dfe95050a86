#pragma once

#include <cstdint>
#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <vector>
#include "quire/types.hpp"

namespace quire::engine {

    struct LedgerRecord {
        std::string relative_path;
        std::string content_hash;
        std::string public_path;
        std::uintmax_t size = 0;
        std::string last_modified;
    };

    struct LedgerDiff {
        size_t added = 0;
        size_t changed = 0;
        size_t unchanged = 0;
        std::vector<std::string> removed;
        int64_t previous_build = 0; // 0 when nothing was recorded before
    };

    /**
     * @brief SQLite record of what the previous build published, for change reports.
     */
    class Ledger {
    public:
        Ledger();
        ~Ledger();

        Ledger(const Ledger&) = delete;
        Ledger& operator=(const Ledger&) = delete;

        bool open(const std::filesystem::path& path);
        void close();
        bool is_open() const { return m_db != nullptr; }

        /**
         * @brief Creates the tables if they don't exist.
         */
        bool initialize_schema();

        std::vector<LedgerRecord> records();

        /**
         * @brief Compares the current build against the stored records.
         */
        LedgerDiff diff(const std::vector<ProcessedAsset>& assets);

        /**
         * @brief Replaces all records with the given build in one transaction.
         * @return The new build id, or -1 on failure (nothing is changed).
         */
        int64_t record_build(const std::vector<ProcessedAsset>& assets, const std::string& generated_at);

        /**
         * @brief Id of the most recent recorded build, or 0 if none.
         */
        int64_t last_build_id();

    private:
        sqlite3* m_db = nullptr;

        bool exec(const char* sql);
    };

}
