#include "streamvault/Types.h"
#include <algorithm>
#include <cctype>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// ContentType
// ═══════════════════════════════════════════════════════════

const char* contentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::Unknown:  return "unknown";
        case ContentType::Image:    return "image";
        case ContentType::Video:    return "video";
        case ContentType::Audio:    return "audio";
        case ContentType::Document: return "document";
        case ContentType::Archive:  return "archive";
        case ContentType::Other:    return "other";
        default:                    return "unknown";
    }
}

ContentType contentTypeFromMime(const std::string& mimeType) {
    if (mimeType.empty()) return ContentType::Unknown;

    // Извлекаем категорию (часть до /)
    auto slashPos = mimeType.find('/');
    std::string category = (slashPos != std::string::npos)
                               ? mimeType.substr(0, slashPos)
                               : mimeType;

    std::transform(category.begin(), category.end(), category.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (category == "image") return ContentType::Image;
    if (category == "video") return ContentType::Video;
    if (category == "audio") return ContentType::Audio;

    if (category == "text") return ContentType::Document;
    if (mimeType.find("pdf") != std::string::npos) return ContentType::Document;
    if (mimeType.find("document") != std::string::npos) return ContentType::Document;
    if (mimeType.find("msword") != std::string::npos) return ContentType::Document;

    if (mimeType.find("zip") != std::string::npos) return ContentType::Archive;
    if (mimeType.find("rar") != std::string::npos) return ContentType::Archive;
    if (mimeType.find("tar") != std::string::npos) return ContentType::Archive;
    if (mimeType.find("7z") != std::string::npos) return ContentType::Archive;
    if (mimeType.find("gzip") != std::string::npos) return ContentType::Archive;

    if (mimeType == "application/octet-stream") return ContentType::Unknown;
    return ContentType::Other;
}

// ═══════════════════════════════════════════════════════════
// DeliveryMode / SessionMode
// ═══════════════════════════════════════════════════════════

const char* deliveryModeToString(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::Inline:     return "stream";
        case DeliveryMode::Attachment: return "download";
        default:                       return "stream";
    }
}

const char* sessionModeToString(SessionMode mode) {
    switch (mode) {
        case SessionMode::Stateless: return "stateless";
        case SessionMode::Pooled:    return "pooled";
        default:                     return "stateless";
    }
}

std::optional<SessionMode> sessionModeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "stateless") return SessionMode::Stateless;
    if (lower == "pooled")    return SessionMode::Pooled;
    return std::nullopt;
}

} // namespace StreamVault
