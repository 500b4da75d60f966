// IngestionPipeline.h — Помещение входящего объекта в канал хранения
// и выдача публичных ссылок на него

#pragma once

#include "../export.h"
#include "../Types.h"
#include "../IdentifierCodec.h"
#include <optional>
#include <string>

namespace StreamVault {

class SessionManager;

struct IngestionResult {
    ObjectId objectId = 0;
    PublicToken token;
    std::string downloadUrl;                // <base>/download/<token>
    std::optional<std::string> streamUrl;   // <base>/stream/<token>, только для видео
};

class SV_API IngestionPipeline {
public:
    /// @param sessions Должен пережить pipeline
    /// @param baseUrl Публичный адрес сервиса без завершающего '/'
    IngestionPipeline(SessionManager& sessions, IdentifierCodec codec, std::string baseUrl);

    /// Переложить объект в канал хранения.
    /// Стратегию (загрузка файла или copy сообщения) выбирает сессия хранилища.
    /// @throws RateLimitedException, RemoteAuthException, TransportTimeoutException, RemoteStoreException
    IngestionResult relayInboundObject(const InboundObjectRef& ref);

    /// Ссылки для уже сохранённого объекта
    IngestionResult linksFor(ObjectId id, bool isVideo) const;

    const std::string& baseUrl() const { return m_baseUrl; }

private:
    SessionManager& m_sessions;
    IdentifierCodec m_codec;
    std::string m_baseUrl;
};

} // namespace StreamVault
