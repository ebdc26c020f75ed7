#include "persistence/DatabaseManager.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include "engine/RuleLoader.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>

namespace securewatch {

DatabaseManager::DatabaseManager() = default;

DatabaseManager::~DatabaseManager() {
    Shutdown();
}

bool DatabaseManager::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Create parent directory if needed (skip for :memory:)
    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("DatabaseManager: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");

    CreateSchema();
    PrepareStatements();

    LOG_INFO("DatabaseManager initialized (db_path={})", db_path);
    return true;
}

void DatabaseManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("DatabaseManager shutdown");
    }
}

bool DatabaseManager::IsOpen() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void DatabaseManager::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS rules (
            id          TEXT PRIMARY KEY,
            document    TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS windows (
            id          TEXT PRIMARY KEY,
            rule_id     TEXT NOT NULL,
            document    TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_windows_rule ON windows(rule_id);

        CREATE TABLE IF NOT EXISTS overflow_alerts (
            seq         INTEGER PRIMARY KEY AUTOINCREMENT,
            alert_id    TEXT NOT NULL,
            document    TEXT NOT NULL,
            created_at  TEXT NOT NULL
        );
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
    }
}

void DatabaseManager::PrepareStatements() {
    auto prepare = [this](const char* sql, sqlite3_stmt** stmt) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR("DatabaseManager: Failed to prepare '{}': {}", sql, sqlite3_errmsg(db_));
            *stmt = nullptr;
        }
    };

    prepare("INSERT OR REPLACE INTO rules (id, document) VALUES (?, ?)", &stmt_insert_rule_);
    prepare("SELECT id, document FROM rules ORDER BY id", &stmt_load_rules_);
    prepare("SELECT COUNT(*) FROM rules", &stmt_rule_count_);

    prepare("INSERT OR REPLACE INTO windows (id, document, rule_id) VALUES (?, ?, ?)", &stmt_insert_window_);
    prepare("SELECT id, document FROM windows ORDER BY id", &stmt_load_windows_);
    prepare("SELECT COUNT(*) FROM windows", &stmt_window_count_);

    prepare("INSERT INTO overflow_alerts (alert_id, document, created_at) VALUES (?, ?, ?)",
            &stmt_insert_overflow_);
    prepare("SELECT seq, document FROM overflow_alerts ORDER BY seq", &stmt_load_overflow_);
    prepare("SELECT COUNT(*) FROM overflow_alerts", &stmt_overflow_count_);
}

void DatabaseManager::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_insert_rule_);
    finalize(stmt_load_rules_);
    finalize(stmt_rule_count_);
    finalize(stmt_insert_window_);
    finalize(stmt_load_windows_);
    finalize(stmt_window_count_);
    finalize(stmt_insert_overflow_);
    finalize(stmt_load_overflow_);
    finalize(stmt_overflow_count_);
}

// --- Helpers ---

bool DatabaseManager::Exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: '{}' failed: {}", sql, err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

// Rewrites a table inside one transaction. Each row binds (id, document) and
// optionally one extra text column at index 3.
bool DatabaseManager::ReplaceTable(const char* clear_sql, sqlite3_stmt* insert_stmt,
                                   const std::vector<std::pair<std::string, std::string>>& rows,
                                   const std::vector<std::string>& extra) {
    if (!db_ || !insert_stmt) return false;

    if (!Exec("BEGIN IMMEDIATE;")) return false;
    if (!Exec(clear_sql)) {
        Exec("ROLLBACK;");
        return false;
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        sqlite3_reset(insert_stmt);
        sqlite3_bind_text(insert_stmt, 1, rows[i].first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_stmt, 2, rows[i].second.c_str(), -1, SQLITE_TRANSIENT);
        if (i < extra.size()) {
            sqlite3_bind_text(insert_stmt, 3, extra[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        if (sqlite3_step(insert_stmt) != SQLITE_DONE) {
            LOG_ERROR("DatabaseManager: Failed to write row {}: {}", rows[i].first, sqlite3_errmsg(db_));
            sqlite3_reset(insert_stmt);
            Exec("ROLLBACK;");
            return false;
        }
    }
    sqlite3_reset(insert_stmt);

    return Exec("COMMIT;");
}

size_t DatabaseManager::CountRows(sqlite3_stmt* stmt) {
    if (!db_ || !stmt) return 0;

    sqlite3_reset(stmt);
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_reset(stmt);
    return count;
}

std::string DatabaseManager::ColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// --- Rules ---

bool DatabaseManager::SaveRules(const std::vector<RulePtr>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, std::string>> rows;
    rows.reserve(rules.size());
    for (const auto& rule : rules) {
        rows.emplace_back(rule->id, RuleLoader::ToJson(*rule).dump());
    }

    bool ok = ReplaceTable("DELETE FROM rules;", stmt_insert_rule_, rows, {});
    if (ok) {
        LOG_DEBUG("DatabaseManager: saved {} rules", rows.size());
    }
    return ok;
}

std::vector<Rule> DatabaseManager::LoadRules() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Rule> rules;
    if (!db_ || !stmt_load_rules_) return rules;

    sqlite3_reset(stmt_load_rules_);
    while (sqlite3_step(stmt_load_rules_) == SQLITE_ROW) {
        std::string id = ColumnText(stmt_load_rules_, 0);
        try {
            rules.push_back(RuleLoader::FromJson(nlohmann::json::parse(ColumnText(stmt_load_rules_, 1))));
        } catch (const std::exception& ex) {
            LOG_WARN("DatabaseManager: skipping stored rule {}: {}", id, ex.what());
        }
    }
    sqlite3_reset(stmt_load_rules_);
    return rules;
}

size_t DatabaseManager::GetRuleCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountRows(stmt_rule_count_);
}

// --- Windows ---

bool DatabaseManager::SaveWindows(const std::vector<Window>& windows) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, std::string>> rows;
    std::vector<std::string> rule_ids;
    rows.reserve(windows.size());
    rule_ids.reserve(windows.size());
    for (const auto& window : windows) {
        rows.emplace_back(window.id, window.ToJson().dump());
        rule_ids.push_back(window.rule_id);
    }

    bool ok = ReplaceTable("DELETE FROM windows;", stmt_insert_window_, rows, rule_ids);
    if (ok) {
        LOG_DEBUG("DatabaseManager: saved {} windows", rows.size());
    }
    return ok;
}

std::vector<Window> DatabaseManager::LoadWindows() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Window> windows;
    if (!db_ || !stmt_load_windows_) return windows;

    sqlite3_reset(stmt_load_windows_);
    while (sqlite3_step(stmt_load_windows_) == SQLITE_ROW) {
        std::string id = ColumnText(stmt_load_windows_, 0);
        try {
            windows.push_back(Window::FromJson(nlohmann::json::parse(ColumnText(stmt_load_windows_, 1))));
        } catch (const std::exception& ex) {
            LOG_WARN("DatabaseManager: skipping stored window {}: {}", id, ex.what());
        }
    }
    sqlite3_reset(stmt_load_windows_);
    return windows;
}

size_t DatabaseManager::GetWindowCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountRows(stmt_window_count_);
}

// --- Overflow Queue ---

bool DatabaseManager::EnqueueOverflowAlert(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_overflow_) return false;

    std::string document;
    try {
        document = alert.ToJson().dump();
    } catch (const std::exception& ex) {
        LOG_ERROR("DatabaseManager: Failed to serialize alert {}: {}", alert.id, ex.what());
        return false;
    }

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string created = TimestampToISO8601(static_cast<uint64_t>(now_ms));

    sqlite3_reset(stmt_insert_overflow_);
    sqlite3_bind_text(stmt_insert_overflow_, 1, alert.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_overflow_, 2, document.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_overflow_, 3, created.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_overflow_);
    sqlite3_reset(stmt_insert_overflow_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DatabaseManager: Failed to enqueue alert {}: {}", alert.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<Alert> DatabaseManager::DrainOverflowAlerts() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> alerts;
    if (!db_ || !stmt_load_overflow_) return alerts;

    if (!Exec("BEGIN IMMEDIATE;")) return alerts;

    sqlite3_reset(stmt_load_overflow_);
    while (sqlite3_step(stmt_load_overflow_) == SQLITE_ROW) {
        int64_t seq = sqlite3_column_int64(stmt_load_overflow_, 0);
        try {
            alerts.push_back(Alert::FromJson(nlohmann::json::parse(ColumnText(stmt_load_overflow_, 1))));
        } catch (const std::exception& ex) {
            LOG_WARN("DatabaseManager: discarding unreadable overflow alert #{}: {}", seq, ex.what());
        }
    }
    sqlite3_reset(stmt_load_overflow_);

    if (!Exec("DELETE FROM overflow_alerts;") || !Exec("COMMIT;")) {
        Exec("ROLLBACK;");
        alerts.clear();
    }
    return alerts;
}

size_t DatabaseManager::GetOverflowCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountRows(stmt_overflow_count_);
}

} // namespace securewatch
