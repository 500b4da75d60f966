#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// Идентификаторы объектов
// ═══════════════════════════════════════════════════════════

/// Внутренний ID объекта в канале хранения (последовательный, не переиспользуется)
using ObjectId = uint64_t;

/// Обфусцированное публичное представление ObjectId (hex-строка)
using PublicToken = std::string;

// ═══════════════════════════════════════════════════════════
// Типы контента
// ═══════════════════════════════════════════════════════════

enum class ContentType : int32_t {
    Unknown = 0,
    Image = 1,
    Video = 2,
    Audio = 3,
    Document = 4,
    Archive = 5,
    Other = 99
};

const char* contentTypeToString(ContentType type);
ContentType contentTypeFromMime(const std::string& mimeType);

// ═══════════════════════════════════════════════════════════
// Метаданные объекта (всегда запрашиваются у удалённого хранилища)
// ═══════════════════════════════════════════════════════════

struct ObjectMetadata {
    uint64_t size = 0;
    std::optional<std::string> mimeHint;
    std::optional<std::string> filename;
    bool hasPayload = true;     // false — сообщение есть, но документа нет
};

// ═══════════════════════════════════════════════════════════
// Ссылка на входящий объект для Ingestion
// ═══════════════════════════════════════════════════════════

struct InboundObjectRef {
    std::optional<int64_t> sourceChatId;     // Чат-источник (для copy-стратегии)
    std::optional<int64_t> sourceMessageId;  // Сообщение-источник
    std::optional<std::string> localPath;    // Локальный файл (для upload-стратегии)
    std::optional<std::string> filename;
    std::optional<std::string> mimeHint;
    bool isVideo = false;
};

// ═══════════════════════════════════════════════════════════
// Режим отдачи: stream (inline) или download (attachment)
// ═══════════════════════════════════════════════════════════

enum class DeliveryMode : int32_t {
    Inline = 0,
    Attachment = 1
};

const char* deliveryModeToString(DeliveryMode mode);

// ═══════════════════════════════════════════════════════════
// Режим работы с сессией удалённого хранилища
// ═══════════════════════════════════════════════════════════

enum class SessionMode : int32_t {
    Stateless = 0,  // Новая сессия на каждый запрос
    Pooled = 1      // Одна "тёплая" сессия на процесс
};

const char* sessionModeToString(SessionMode mode);
std::optional<SessionMode> sessionModeFromString(const std::string& str);

} // namespace StreamVault
