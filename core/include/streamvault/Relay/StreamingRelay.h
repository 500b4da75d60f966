// StreamingRelay.h — Отдача объекта удалённого хранилища как HTTP-ресурса
// Один вызов handle() обслуживает один запрос от начала до конца

#pragma once

#include "../export.h"
#include "../Types.h"
#include "../IdentifierCodec.h"
#include "../Http/HttpMessage.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace StreamVault {

class SessionManager;

struct RelayOptions {
    size_t chunkSize = 512 * 1024;
};

/// Запрос к relay (уже разобранный роутером)
struct RelayRequest {
    PublicToken token;
    DeliveryMode mode = DeliveryMode::Attachment;
    std::optional<std::string> rangeHeader;
    bool headOnly = false;
};

/// Результат обслуживания запроса (для логов и тестов)
struct RelayOutcome {
    int status = 0;                     // Отправленный статус (0 — ничего не отправлено)
    uint64_t bytesSent = 0;             // Байт тела объекта
    bool completed = false;             // Ответ отправлен целиком
    bool clientDisconnected = false;    // Клиент ушёл до конца ответа
    bool streamFailed = false;          // Ошибка хранилища после заголовков
};

class SV_API StreamingRelay {
public:
    /// @param sessions Должен пережить relay
    StreamingRelay(SessionManager& sessions, IdentifierCodec codec, RelayOptions options = {});

    /// Обслужить запрос. Исключения не выбрасывает: все ошибки
    /// становятся HTTP-статусом или обрывом соединения
    RelayOutcome handle(const RelayRequest& request, ResponseSink& sink);

    const RelayOptions& options() const { return m_options; }

    /// Имя файла для Content-Disposition: без кавычек, '\' и управляющих символов
    static std::string sanitizeFilename(const std::optional<std::string>& filename, ObjectId id);

private:
    SessionManager& m_sessions;
    IdentifierCodec m_codec;
    RelayOptions m_options;
};

} // namespace StreamVault
