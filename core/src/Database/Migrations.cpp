#include "streamvault/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <array>

namespace StreamVault {

struct Migration {
    int version;
    const char* description;
    const char* sql;
};

// ═══════════════════════════════════════════════════════════
// МИГРАЦИИ СХЕМЫ АРХИВА КАНАЛА
// ═══════════════════════════════════════════════════════════

static const std::array MIGRATIONS = {
    Migration{1, "Channel archive schema", R"SQL(
-- Версионирование схемы
CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER PRIMARY KEY,
    applied_at INTEGER DEFAULT (strftime('%s', 'now')),
    description TEXT
);

-- Служебные значения архива (токен сессии и т.п.)
CREATE TABLE IF NOT EXISTS archive_settings (
    key TEXT PRIMARY KEY,
    value TEXT
);

-- Сообщения канала хранения.
-- AUTOINCREMENT: ID монотонны и никогда не переиспользуются
CREATE TABLE IF NOT EXISTS channel_messages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    filename TEXT,
    mime_type TEXT,
    size INTEGER NOT NULL DEFAULT 0,
    payload BLOB,
    checksum TEXT,
    created_at INTEGER DEFAULT (strftime('%s', 'now'))
);

CREATE INDEX IF NOT EXISTS idx_channel_messages_checksum ON channel_messages(checksum);
    )SQL"}
};

// ═══════════════════════════════════════════════════════════
// Реализация миграций
// ═══════════════════════════════════════════════════════════

int Database::getCurrentVersion() {
    // Проверяем существование таблицы schema_version
    auto result = queryOne<int>(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='schema_version'",
        [](sqlite3_stmt* stmt) { return getInt(stmt, 0); }
    );

    if (!result || *result == 0) {
        return 0; // Таблицы нет — версия 0
    }

    auto version = queryOne<int>(
        "SELECT MAX(version) FROM schema_version",
        [](sqlite3_stmt* stmt) {
            if (isNull(stmt, 0)) return 0;
            return getInt(stmt, 0);
        }
    );

    return version.value_or(0);
}

void Database::applyMigrations() {
    int currentVersion = getCurrentVersion();
    spdlog::debug("Database version: {}, latest: {}", currentVersion, MIGRATIONS.size());

    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= currentVersion) {
            continue;
        }

        spdlog::info("Applying migration {}: {}", migration.version, migration.description);

        execute("BEGIN EXCLUSIVE TRANSACTION");

        char* errMsg = nullptr;
        int rc = sqlite3_exec(m_db, migration.sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            execute("ROLLBACK");
            spdlog::error("Migration {} failed: {}", migration.version, error);
            throw DatabaseException("Migration failed: " + error);
        }

        execute(
            "INSERT INTO schema_version (version, description) VALUES (?, ?)",
            migration.version, migration.description
        );

        execute("COMMIT");
        spdlog::info("Migration {} completed", migration.version);
    }
}

} // namespace StreamVault
