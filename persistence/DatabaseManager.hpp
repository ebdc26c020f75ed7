#pragma once

#include "engine/DurabilityStore.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace securewatch {

// SQLite-backed durability store. Rules and windows are kept as JSON
// documents keyed by id; overflow alerts form a FIFO queue.
class DatabaseManager : public DurabilityStore {
public:
    DatabaseManager();
    ~DatabaseManager() override;

    bool Initialize(const std::string& db_path = "data/securewatch.db");
    void Shutdown();
    bool IsOpen();

    // Rules
    bool SaveRules(const std::vector<RulePtr>& rules) override;
    std::vector<Rule> LoadRules() override;
    size_t GetRuleCount();

    // Windows
    bool SaveWindows(const std::vector<Window>& windows) override;
    std::vector<Window> LoadWindows() override;
    size_t GetWindowCount();

    // Overflow queue
    bool EnqueueOverflowAlert(const Alert& alert) override;
    std::vector<Alert> DrainOverflowAlerts() override;
    size_t GetOverflowCount() override;

private:
    void CreateSchema();
    void PrepareStatements();
    void FinalizeStatements();

    bool Exec(const char* sql);
    bool ReplaceTable(const char* clear_sql, sqlite3_stmt* insert_stmt,
                      const std::vector<std::pair<std::string, std::string>>& rows,
                      const std::vector<std::string>& extra);
    size_t CountRows(sqlite3_stmt* stmt);
    static std::string ColumnText(sqlite3_stmt* stmt, int col);

    sqlite3* db_{nullptr};
    std::mutex mutex_;

    // Prepared statements
    sqlite3_stmt* stmt_insert_rule_{nullptr};
    sqlite3_stmt* stmt_load_rules_{nullptr};
    sqlite3_stmt* stmt_rule_count_{nullptr};
    sqlite3_stmt* stmt_insert_window_{nullptr};
    sqlite3_stmt* stmt_load_windows_{nullptr};
    sqlite3_stmt* stmt_window_count_{nullptr};
    sqlite3_stmt* stmt_insert_overflow_{nullptr};
    sqlite3_stmt* stmt_load_overflow_{nullptr};
    sqlite3_stmt* stmt_overflow_count_{nullptr};
};

} // namespace securewatch
