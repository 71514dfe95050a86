#include "ledger.hpp"
#include <iostream>
#include <map>

namespace quire::engine {

    Ledger::Ledger() = default;
    Ledger::~Ledger() { close(); }

    bool Ledger::open(const std::filesystem::path& path) {
        close();
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::cerr << "[Ledger] Failed to open " << path << ": " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return initialize_schema();
    }

    void Ledger::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool Ledger::exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[Ledger] SQL error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool Ledger::initialize_schema() {
        return exec(
            "CREATE TABLE IF NOT EXISTS builds ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  generated_at TEXT NOT NULL,"
            "  asset_count INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS assets ("
            "  relative_path TEXT PRIMARY KEY,"
            "  content_hash TEXT NOT NULL,"
            "  public_path TEXT NOT NULL,"
            "  size INTEGER,"
            "  last_modified TEXT,"
            "  build_id INTEGER,"
            "  FOREIGN KEY(build_id) REFERENCES builds(id)"
            ");");
    }

    std::vector<LedgerRecord> Ledger::records() {
        std::vector<LedgerRecord> results;
        const char* sql =
            "SELECT relative_path, content_hash, public_path, size, last_modified FROM assets ORDER BY relative_path;";
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                LedgerRecord r;
                r.relative_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
                r.content_hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
                r.public_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
                r.size = static_cast<std::uintmax_t>(sqlite3_column_int64(stmt, 3));
                const unsigned char* modified = sqlite3_column_text(stmt, 4);
                if (modified) r.last_modified = reinterpret_cast<const char*>(modified);
                results.push_back(std::move(r));
            }
            sqlite3_finalize(stmt);
        }
        return results;
    }

    LedgerDiff Ledger::diff(const std::vector<ProcessedAsset>& assets) {
        std::map<std::string, std::string> previous;
        for (auto& r : records()) previous.emplace(std::move(r.relative_path), std::move(r.content_hash));

        LedgerDiff result;
        result.previous_build = last_build_id();
        for (const auto& asset : assets) {
            auto it = previous.find(asset.relative_path);
            if (it == previous.end()) {
                ++result.added;
                continue;
            }
            if (it->second == asset.content_hash) ++result.unchanged;
            else ++result.changed;
            previous.erase(it);
        }
        for (const auto& [path, hash] : previous) result.removed.push_back(path);
        return result;
    }

    int64_t Ledger::record_build(const std::vector<ProcessedAsset>& assets, const std::string& generated_at) {
        if (!exec("BEGIN TRANSACTION;")) return -1;

        auto rollback = [this]() {
            exec("ROLLBACK;");
            return int64_t{-1};
        };

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, "INSERT INTO builds (generated_at, asset_count) VALUES (?, ?);", -1, &stmt,
                               nullptr) != SQLITE_OK) {
            return rollback();
        }
        sqlite3_bind_text(stmt, 1, generated_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(assets.size()));
        bool ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        if (!ok) return rollback();

        int64_t build_id = sqlite3_last_insert_rowid(m_db);
        if (!exec("DELETE FROM assets;")) return rollback();

        const char* sql =
            "INSERT INTO assets (relative_path, content_hash, public_path, size, last_modified, build_id) "
            "VALUES (?, ?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return rollback();

        for (const auto& asset : assets) {
            sqlite3_bind_text(stmt, 1, asset.relative_path.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, asset.content_hash.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, asset.public_path.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(asset.file_size));
            sqlite3_bind_text(stmt, 5, asset.last_modified.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 6, build_id);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                std::cerr << "[Ledger] Insert failed for " << asset.relative_path << ": " << sqlite3_errmsg(m_db) << "\n";
                sqlite3_finalize(stmt);
                return rollback();
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        if (!exec("COMMIT;")) return rollback();
        return build_id;
    }

    int64_t Ledger::last_build_id() {
        sqlite3_stmt* stmt;
        int64_t id = 0;
        if (sqlite3_prepare_v2(m_db, "SELECT MAX(id) FROM builds;", -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
                id = sqlite3_column_int64(stmt, 0);
            }
            sqlite3_finalize(stmt);
        }
        return id;
    }

}
