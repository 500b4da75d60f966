// Router.h — Маршрутизация HTTP-запросов StreamVault
//   GET/HEAD /stream/{token}    -> StreamingRelay (inline)
//   GET/HEAD /download/{token}  -> StreamingRelay (attachment)
//   GET /                       -> описание сервиса
//   GET /health                 -> состояние + статистика сессий

#pragma once

#include "../export.h"
#include "HttpMessage.h"

namespace StreamVault {

class SessionManager;
class StreamingRelay;

class SV_API Router {
public:
    /// @param relay, sessions Должны пережить роутер
    Router(StreamingRelay& relay, SessionManager& sessions);

    /// Обработать запрос; ответ (или обрыв) всегда уходит в sink
    void handle(const HttpRequest& request, ResponseSink& sink);

    /// JSON для GET /
    static nlohmann::json serviceDescriptor();

    /// JSON для GET /health
    nlohmann::json healthReport() const;

private:
    StreamingRelay& m_relay;
    SessionManager& m_sessions;
};

} // namespace StreamVault
