#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <stdexcept>
#include <type_traits>

#include <sqlite3.h>

struct sqlite3;
struct sqlite3_stmt;
struct sqlite3_blob;

namespace StreamVault {

/// Исключение базы данных
class DatabaseException : public std::runtime_error {
public:
    explicit DatabaseException(const std::string& message, int code = 0)
        : std::runtime_error(message), m_code(code) {}

    /// Код ошибки SQLite (SQLITE_BUSY и т.п.), 0 если неизвестен
    int code() const { return m_code; }

    /// Соединение не дождалось блокировки за busy_timeout
    bool isBusy() const { return m_code == SQLITE_BUSY || m_code == SQLITE_LOCKED; }

private:
    int m_code;
};

/// Заглушка под BLOB заданного размера (заполняется через BlobHandle::write)
struct ZeroBlob {
    int64_t size = 0;
};

/// RAII обёртка над инкрементальным BLOB I/O
class BlobHandle {
public:
    BlobHandle(sqlite3* db, const char* table, const char* column,
               int64_t rowId, bool writable);
    ~BlobHandle();

    BlobHandle(const BlobHandle&) = delete;
    BlobHandle& operator=(const BlobHandle&) = delete;

    int64_t size() const;

    /// Прочитать до length байт начиная с offset
    std::vector<uint8_t> read(int64_t offset, size_t length);

    void write(int64_t offset, const uint8_t* data, size_t length);

private:
    sqlite3* m_db;
    sqlite3_blob* m_blob = nullptr;
};

/// RAII обёртка над SQLite соединением
class Database {
public:
    /// @param busyTimeoutMs Сколько ждать блокировку, прежде чем вернуть SQLITE_BUSY
    explicit Database(const std::string& dbPath, int busyTimeoutMs = 30000);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    /// Инициализация БД: применяет миграции
    void initialize();

    /// Выполнение SQL без возврата данных
    void execute(const std::string& sql);

    /// Выполнение SQL с параметрами
    template<typename... Args>
    void execute(const std::string& sql, Args&&... args) {
        auto stmt = prepare(sql);
        try {
            bindAll(stmt, 1, std::forward<Args>(args)...);
            step(stmt);
        } catch (...) {
            finalize(stmt);
            throw;
        }
        finalize(stmt);
    }

    /// Запрос одной записи
    template<typename T, typename Mapper, typename... Args>
    std::optional<T> queryOne(const std::string& sql, Mapper mapper, Args&&... args) {
        auto stmt = prepare(sql);
        std::optional<T> result;
        try {
            bindAll(stmt, 1, std::forward<Args>(args)...);
            if (stepRow(stmt)) {
                result = mapper(stmt);
            }
        } catch (...) {
            finalize(stmt);
            throw;
        }
        finalize(stmt);
        return result;
    }

    /// Запрос скалярного значения (int64)
    template<typename... Args>
    int64_t queryScalar(const std::string& sql, Args&&... args) {
        auto result = queryOne<int64_t>(sql,
            [](sqlite3_stmt* stmt) { return getInt64(stmt, 0); },
            std::forward<Args>(args)...);
        return result.value_or(0);
    }

    /// ID последней вставленной записи
    int64_t lastInsertId() const;

    /// Количество изменённых строк
    int changesCount() const;

    /// Открыть BLOB для инкрементального чтения/записи
    std::unique_ptr<BlobHandle> openBlob(const char* table, const char* column,
                                         int64_t rowId, bool writable = false);

    /// Транзакции
    void beginTransaction();
    void commit();
    void rollback();

    /// RAII транзакция
    class Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();
        void commit();
        void rollback();

    private:
        Database* m_db;
        bool m_finished = false;
    };

    /// Хелперы для чтения из stmt
    static int getInt(sqlite3_stmt* stmt, int col);
    static int64_t getInt64(sqlite3_stmt* stmt, int col);
    static std::string getString(sqlite3_stmt* stmt, int col);
    static std::optional<std::string> getStringOpt(sqlite3_stmt* stmt, int col);
    static std::optional<int64_t> getInt64Opt(sqlite3_stmt* stmt, int col);
    static bool isNull(sqlite3_stmt* stmt, int col);

    const std::string& path() const { return m_dbPath; }

private:
    sqlite3* m_db = nullptr;
    std::string m_dbPath;

    // Миграции
    void applyMigrations();
    int getCurrentVersion();

    // Prepared statements
    sqlite3_stmt* prepare(const std::string& sql);
    void step(sqlite3_stmt* stmt);
    bool stepRow(sqlite3_stmt* stmt);
    void finalize(sqlite3_stmt* stmt);

    // Привязка параметров
    void bindParameter(sqlite3_stmt* stmt, int index, int value);
    void bindParameter(sqlite3_stmt* stmt, int index, int64_t value);
    // Явная перегрузка для long long если int64_t != long long
    // (на Windows int64_t = long long, на Linux ARM64 int64_t = long)
    template<typename T>
    std::enable_if_t<
        std::is_same_v<T, long long> && !std::is_same_v<int64_t, long long>,
        void
    > bindParameter(sqlite3_stmt* stmt, int index, T value) {
        sqlite3_bind_int64(stmt, index, static_cast<int64_t>(value));
    }
    void bindParameter(sqlite3_stmt* stmt, int index, const std::string& value);
    void bindParameter(sqlite3_stmt* stmt, int index, const char* value);
    void bindParameter(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value);
    void bindParameter(sqlite3_stmt* stmt, int index, ZeroBlob value);
    void bindParameter(sqlite3_stmt* stmt, int index, std::nullptr_t);

    // Рекурсивная привязка всех параметров
    template<typename T, typename... Rest>
    void bindAll(sqlite3_stmt* stmt, int index, T&& first, Rest&&... rest) {
        bindParameter(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindAll(sqlite3_stmt*, int) {} // База рекурсии
};

} // namespace StreamVault
