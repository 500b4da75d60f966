// RemoteStore.h — Контракт удалённого хранилища (канал с документами)
// Реализации: ChannelArchiveStore (SQLite), клиенты мессенджеров, моки в тестах

#pragma once

#include "../export.h"
#include "../Types.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// ChunkStream — ленивая последовательность чанков объекта
// ═══════════════════════════════════════════════════════════

class SV_API ChunkStream {
public:
    virtual ~ChunkStream() = default;

    /// Следующий чанк (по возрастанию смещения); nullopt — данные закончились.
    /// Может блокироваться на сетевом I/O.
    /// @throws RemoteStoreException и наследники
    virtual std::optional<std::vector<uint8_t>> next() = 0;

    /// Прекратить чтение; повторный вызов безопасен
    virtual void close() = 0;
};

// ═══════════════════════════════════════════════════════════
// RemoteSession — открытое соединение с хранилищем
// ═══════════════════════════════════════════════════════════

class SV_API RemoteSession {
public:
    virtual ~RemoteSession() = default;

    /// Транспорт жив и может выполнять запросы
    virtual bool isConnected() const = 0;

    /// Метаданные объекта; nullopt если объекта нет
    virtual std::optional<ObjectMetadata> fetchMetadata(ObjectId id) = 0;

    /// Открыть поток чанков [offset, offset + limit)
    virtual std::unique_ptr<ChunkStream> openChunkStream(
        ObjectId id, uint64_t offset, uint64_t limit, size_t chunkSize) = 0;

    /// Переложить входящий объект в канал хранения, вернуть новый ID.
    /// Стратегия (полная загрузка или copy) — на усмотрение реализации
    virtual ObjectId relayInbound(const InboundObjectRef& ref) = 0;

    /// Токен сессии для повторного входа без логина (пусто если не поддерживается)
    virtual std::string exportSessionToken() const = 0;

    /// Закрыть соединение; повторный вызов безопасен
    virtual void disconnect() = 0;
};

// ═══════════════════════════════════════════════════════════
// RemoteStoreConnector — фабрика сессий
// ═══════════════════════════════════════════════════════════

class SV_API RemoteStoreConnector {
public:
    virtual ~RemoteStoreConnector() = default;

    /// Восстановить сессию по сохранённому токену
    /// @throws RateLimitedException, RemoteAuthException, TransportTimeoutException
    virtual std::shared_ptr<RemoteSession> resumeSession(
        const std::string& sessionToken, std::chrono::milliseconds timeout) = 0;

    /// Новый вход по токену бота
    /// @throws RateLimitedException, RemoteAuthException, TransportTimeoutException
    virtual std::shared_ptr<RemoteSession> loginBot(
        const std::string& botToken, std::chrono::milliseconds timeout) = 0;

    /// Можно ли одну сессию использовать из нескольких потоков без блокировки
    virtual bool isThreadSafe() const { return false; }
};

} // namespace StreamVault
