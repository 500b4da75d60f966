#include "streamvault/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// BlobHandle
// ═══════════════════════════════════════════════════════════

BlobHandle::BlobHandle(sqlite3* db, const char* table, const char* column,
                       int64_t rowId, bool writable)
    : m_db(db) {
    int rc = sqlite3_blob_open(db, "main", table, column, rowId, writable ? 1 : 0, &m_blob);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db);
        if (m_blob) {
            sqlite3_blob_close(m_blob);
            m_blob = nullptr;
        }
        throw DatabaseException("Failed to open blob " + std::string(table) + "." +
                                column + "#" + std::to_string(rowId) + ": " + error, rc);
    }
}

BlobHandle::~BlobHandle() {
    if (m_blob) {
        sqlite3_blob_close(m_blob);
    }
}

int64_t BlobHandle::size() const {
    return sqlite3_blob_bytes(m_blob);
}

std::vector<uint8_t> BlobHandle::read(int64_t offset, size_t length) {
    int64_t total = size();
    if (offset >= total || length == 0) {
        return {};
    }
    int64_t available = total - offset;
    int n = static_cast<int>(std::min<int64_t>(available, static_cast<int64_t>(length)));

    std::vector<uint8_t> buffer(static_cast<size_t>(n));
    int rc = sqlite3_blob_read(m_blob, buffer.data(), n, static_cast<int>(offset));
    if (rc != SQLITE_OK) {
        throw DatabaseException("Failed to read blob: " + std::string(sqlite3_errmsg(m_db)), rc);
    }
    return buffer;
}

void BlobHandle::write(int64_t offset, const uint8_t* data, size_t length) {
    int rc = sqlite3_blob_write(m_blob, data, static_cast<int>(length), static_cast<int>(offset));
    if (rc != SQLITE_OK) {
        throw DatabaseException("Failed to write blob: " + std::string(sqlite3_errmsg(m_db)), rc);
    }
}

// ═══════════════════════════════════════════════════════════
// Database
// ═══════════════════════════════════════════════════════════

Database::Database(const std::string& dbPath, int busyTimeoutMs) : m_dbPath(dbPath) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr);

    if (rc != SQLITE_OK) {
        std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw DatabaseException("Failed to open database: " + error, rc);
    }

    // WAL: читатели не блокируют писателя ингеста
    execute("PRAGMA journal_mode = WAL");
    execute("PRAGMA busy_timeout = " + std::to_string(busyTimeoutMs));
    execute("PRAGMA synchronous = NORMAL");

    spdlog::debug("Database opened: {}", dbPath);
}

Database::~Database() {
    if (m_db) {
        sqlite3_close(m_db);
        spdlog::debug("Database closed: {}", m_dbPath);
    }
}

Database::Database(Database&& other) noexcept
    : m_db(other.m_db), m_dbPath(std::move(other.m_dbPath)) {
    other.m_db = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_dbPath = std::move(other.m_dbPath);
        other.m_db = nullptr;
    }
    return *this;
}

void Database::initialize() {
    applyMigrations();
}

void Database::execute(const std::string& sql) {
    char* errorMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMsg);

    if (rc != SQLITE_OK) {
        std::string error = errorMsg ? errorMsg : "Unknown error";
        sqlite3_free(errorMsg);
        throw DatabaseException("SQL execution failed: " + error + "\nSQL: " + sql, rc);
    }
}

sqlite3_stmt* Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        throw DatabaseException("Failed to prepare statement: " +
                                std::string(sqlite3_errmsg(m_db)) + "\nSQL: " + sql, rc);
    }
    return stmt;
}

void Database::step(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw DatabaseException("Failed to execute statement: " +
                                std::string(sqlite3_errmsg(m_db)), rc);
    }
}

bool Database::stepRow(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    } else if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseException("Failed to step statement: " +
                            std::string(sqlite3_errmsg(m_db)), rc);
}

void Database::finalize(sqlite3_stmt* stmt) {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

int64_t Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(m_db);
}

int Database::changesCount() const {
    return sqlite3_changes(m_db);
}

std::unique_ptr<BlobHandle> Database::openBlob(const char* table, const char* column,
                                               int64_t rowId, bool writable) {
    return std::make_unique<BlobHandle>(m_db, table, column, rowId, writable);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

// Привязка параметров
void Database::bindParameter(sqlite3_stmt* stmt, int index, int value) {
    sqlite3_bind_int(stmt, index, value);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const char* value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bindParameter(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, ZeroBlob value) {
    if (sqlite3_bind_zeroblob64(stmt, index, static_cast<sqlite3_uint64>(value.size)) != SQLITE_OK) {
        throw DatabaseException("Failed to bind zeroblob: " + std::string(sqlite3_errmsg(m_db)));
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, std::nullptr_t) {
    sqlite3_bind_null(stmt, index);
}

// Хелперы для чтения
int Database::getInt(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int(stmt, col);
}

int64_t Database::getInt64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

std::string Database::getString(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (text) {
        return std::string(reinterpret_cast<const char*>(text));
    }
    return "";
}

std::optional<std::string> Database::getStringOpt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return getString(stmt, col);
}

std::optional<int64_t> Database::getInt64Opt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return getInt64(stmt, col);
}

bool Database::isNull(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// Transaction RAII
Database::Transaction::Transaction(Database& db) : m_db(&db) {
    m_db->beginTransaction();
}

Database::Transaction::~Transaction() {
    if (!m_finished && m_db) {
        try {
            m_db->rollback();
        } catch (const std::exception& e) {
            spdlog::error("Database: Rollback failed: {}", e.what());
        }
    }
}

void Database::Transaction::commit() {
    if (!m_finished && m_db) {
        m_db->commit();
        m_finished = true;
    }
}

void Database::Transaction::rollback() {
    if (!m_finished && m_db) {
        m_db->rollback();
        m_finished = true;
    }
}

} // namespace StreamVault
