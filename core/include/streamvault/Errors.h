// Errors.h — Типизированные ошибки StreamVault
// Каждый вид отказа — отдельное исключение; перевод в HTTP-статус
// выполняется только на границе (StreamingRelay / HttpServer)

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace StreamVault {

/// Публичный токен не является корректной hex-строкой (HTTP 400)
class InvalidTokenException : public std::runtime_error {
public:
    explicit InvalidTokenException(const std::string& token)
        : std::runtime_error("Invalid ID format: " + token), m_token(token) {}

    const std::string& token() const { return m_token; }

private:
    std::string m_token;
};

/// Запрошенный диапазон лежит за пределами объекта (HTTP 416)
class RangeNotSatisfiableException : public std::runtime_error {
public:
    RangeNotSatisfiableException(const std::string& header, uint64_t totalSize)
        : std::runtime_error("Range '" + header + "' not satisfiable for size " +
                             std::to_string(totalSize)),
          m_totalSize(totalSize) {}

    uint64_t totalSize() const { return m_totalSize; }

private:
    uint64_t m_totalSize;
};

/// Базовая ошибка удалённого хранилища (HTTP 500)
class RemoteStoreException : public std::runtime_error {
public:
    explicit RemoteStoreException(const std::string& message)
        : std::runtime_error(message) {}
};

/// Удалённое хранилище требует паузы (HTTP 503).
/// retryAfterSeconds — структурированное поле, не разбор текста ошибки
class RateLimitedException : public RemoteStoreException {
public:
    explicit RateLimitedException(int64_t retryAfterSeconds)
        : RemoteStoreException("Rate limited, retry after " +
                               std::to_string(retryAfterSeconds) + " seconds"),
          m_retryAfterSeconds(retryAfterSeconds) {}

    int64_t retryAfterSeconds() const { return m_retryAfterSeconds; }

private:
    int64_t m_retryAfterSeconds;
};

/// Ошибка аутентификации или конфигурации доступа (HTTP 500, нужен оператор)
class RemoteAuthException : public RemoteStoreException {
public:
    explicit RemoteAuthException(const std::string& message)
        : RemoteStoreException(message) {}
};

/// Сетевой вызов не уложился в таймаут (повторяемо вызывающей стороной)
class TransportTimeoutException : public RemoteStoreException {
public:
    explicit TransportTimeoutException(const std::string& message)
        : RemoteStoreException(message) {}
};

/// Некорректная конфигурация
class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace StreamVault
