// HttpMessage.h — Минимальная модель HTTP/1.1 для relay
// Разбор заголовка запроса, сериализация заголовка ответа, JSON-ошибки

#pragma once

#include "../export.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace StreamVault {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// Максимальный размер заголовка запроса
constexpr size_t MAX_REQUEST_HEAD_SIZE = 16 * 1024;

// ═══════════════════════════════════════════════════════════
// HttpRequest
// ═══════════════════════════════════════════════════════════

struct SV_API HttpRequest {
    std::string method;         // "GET", "HEAD", ...
    std::string target;         // Как пришло: "/stream/abc?x=1"
    std::string path;           // Без query: "/stream/abc"
    std::string query;          // Без '?'
    std::string version;        // "HTTP/1.1"
    HttpHeaders headers;

    /// Значение заголовка (регистр имени не важен); первое вхождение
    std::optional<std::string> header(const std::string& name) const;

    bool isHead() const { return method == "HEAD"; }

    /// Разобрать заголовок запроса (до пустой строки включительно).
    /// @return nullopt если запрос некорректен
    static std::optional<HttpRequest> parse(const std::string& raw);
};

/// Позиция сразу после "\r\n\r\n" или npos
SV_API size_t findHeadEnd(const std::string& buffer);

// ═══════════════════════════════════════════════════════════
// HttpResponseHead
// ═══════════════════════════════════════════════════════════

struct SV_API HttpResponseHead {
    int status = 200;
    HttpHeaders headers;

    /// Установить заголовок, заменив существующий
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    /// "HTTP/1.1 <status> <text>\r\n<headers>\r\n\r\n"
    std::string serialize() const;
};

SV_API const char* statusText(int status);

// ═══════════════════════════════════════════════════════════
// ResponseSink — куда relay пишет ответ
// ═══════════════════════════════════════════════════════════

class SV_API ResponseSink {
public:
    virtual ~ResponseSink() = default;

    /// Отправить статус и заголовки; false если клиент отключился
    virtual bool sendHead(const HttpResponseHead& head) = 0;

    /// Отправить часть тела; false если клиент отключился
    virtual bool sendBody(const uint8_t* data, size_t size) = 0;

    /// Оборвать ответ (ошибка после отправки заголовков)
    virtual void abort() = 0;
};

/// Тело ошибки: {"error": ..., "details": ..., "hint"?: ..., "retry_after"?: ...}
SV_API nlohmann::json errorBody(const std::string& error,
                                const std::string& details,
                                const std::optional<std::string>& hint = std::nullopt,
                                std::optional<int64_t> retryAfterSeconds = std::nullopt);

/// Отправить JSON-ответ целиком. Для HEAD отправляется только заголовок
SV_API bool sendJson(ResponseSink& sink, int status, const nlohmann::json& body,
                     const HttpHeaders& extraHeaders = {}, bool headOnly = false);

} // namespace StreamVault
