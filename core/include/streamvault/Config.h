// Config.h — Конфигурация сервиса
// Порядок: значения по умолчанию -> JSON-файл -> переменные окружения

#pragma once

#include "export.h"
#include "Types.h"
#include "IdentifierCodec.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace StreamVault {

struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 9090;
    size_t workerThreads = 64;
    size_t maxPendingConnections = 1024;
    int ioTimeoutMs = 30000;
    std::string baseUrl;                // Пусто — из заголовков запроса / localhost
};

struct RemoteConfig {
    std::string botToken;
    std::string sessionString;          // Сохранённая сессия
    int timeoutMs = 30000;
};

struct SessionConfig {
    SessionMode mode = SessionMode::Stateless;
    bool transportThreadSafe = false;
};

struct RelayConfig {
    size_t chunkSize = 512 * 1024;
};

struct CodecConfig {
    uint64_t secret = IdentifierCodec::DEFAULT_SECRET;
};

struct LogConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

struct ArchiveConfig {
    std::string path = "streamvault_archive.db";
};

struct CredentialsConfig {
    std::string directory;              // Пусто — CredentialStore::defaultDirectory()
};

struct SV_API Config {
    static constexpr size_t MAX_CHUNK_SIZE = 8 * 1024 * 1024;

    ServerConfig server;
    RemoteConfig remote;
    SessionConfig session;
    RelayConfig relay;
    CodecConfig codec;
    LogConfig log;
    ArchiveConfig archive;
    CredentialsConfig credentials;

    /// Поиск переменной окружения (подменяется в тестах)
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static EnvLookup systemEnvironment();

    /// Загрузить конфигурацию и проверить её
    /// @param path JSON-файл; пусто — только defaults + окружение
    /// @throws ConfigException
    static Config load(const std::string& path = "", const EnvLookup& env = systemEnvironment());

    /// Наложить JSON (известные секции, неизвестные ключи игнорируются)
    /// @throws ConfigException при неверных типах значений
    void applyJson(const nlohmann::json& json);

    /// Наложить переменные окружения: API_ID, API_HASH, BOT_TOKEN, BIN_CHANNEL,
    /// SESSION_STRING, SECRET_KEY, BASE_URL, VERCEL_URL, PORT, LOG_LEVEL,
    /// ARCHIVE_PATH, SESSION_MODE
    /// @throws ConfigException если значение не разбирается
    void applyEnvironment(const EnvLookup& env);

    /// @throws ConfigException
    void validate() const;

    /// Есть ли хоть какие-то учётные данные хранилища
    bool hasRemoteCredentials() const {
        return !remote.sessionString.empty() || !remote.botToken.empty();
    }

    /// JSON без секретов (для логов и отладки)
    nlohmann::json toJson() const;
};

/// Публичный базовый URL: настроенный -> <X-Forwarded-Proto|http>://<Host> -> http://localhost:<port>
SV_API std::string resolveBaseUrl(const Config& config,
                                  const std::optional<std::string>& host = std::nullopt,
                                  const std::optional<std::string>& forwardedProto = std::nullopt);

} // namespace StreamVault
