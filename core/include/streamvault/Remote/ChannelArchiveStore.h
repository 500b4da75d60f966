// ChannelArchiveStore.h — Канал хранения в локальной SQLite базе
// Реализация RemoteStoreConnector: сообщения канала с документами в BLOB,
// последовательные неповторяющиеся ID, чтение чанками через incremental blob I/O

#pragma once

#include "../export.h"
#include "../Types.h"
#include "RemoteStore.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StreamVault {

/// Запись канала (для отладки и CLI)
struct ChannelMessage {
    ObjectId id = 0;
    std::optional<std::string> filename;
    std::optional<std::string> mimeType;
    uint64_t size = 0;
    bool hasPayload = false;
    std::optional<std::string> checksum;    // "sha256:<hex>"
    int64_t createdAt = 0;
};

class SV_API ChannelArchiveStore : public RemoteStoreConnector {
public:
    /// Открывает (или создаёт) архив и применяет миграции
    /// @throws RemoteStoreException если базу открыть нельзя
    explicit ChannelArchiveStore(const std::string& archivePath);
    ~ChannelArchiveStore() override;

    ChannelArchiveStore(const ChannelArchiveStore&) = delete;
    ChannelArchiveStore& operator=(const ChannelArchiveStore&) = delete;

    /// Токен сессии должен совпадать с выданным при последнем входе бота
    std::shared_ptr<RemoteSession> resumeSession(
        const std::string& sessionToken, std::chrono::milliseconds timeout) override;

    /// Любой непустой токен бота принимается; выдаёт (или повторно использует) токен сессии
    std::shared_ptr<RemoteSession> loginBot(
        const std::string& botToken, std::chrono::milliseconds timeout) override;

    /// Служебное сообщение без документа (fetchMetadata вернёт hasPayload = false)
    ObjectId postMessageWithoutPayload();

    /// Запись канала по ID
    std::optional<ChannelMessage> getMessage(ObjectId id) const;

    /// Количество сообщений в канале
    int64_t countMessages() const;

    const std::string& path() const;

    /// SHA-256 файла в формате "sha256:<hex>"
    static std::string computeChecksum(const std::string& filePath);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace StreamVault
