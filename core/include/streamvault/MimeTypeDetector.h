#pragma once

#include "Types.h"
#include <optional>
#include <string>

namespace StreamVault {

/// Определение Content-Type для отдаваемых объектов
class MimeTypeDetector {
public:
    static constexpr const char* OCTET_STREAM = "application/octet-stream";
    static constexpr const char* PLAYBACK_FALLBACK = "video/mp4";

    /// Определение по расширению; OCTET_STREAM если неизвестно
    static std::string detectByExtension(const std::string& extension);

    /// Определение по содержимому файла (magic bytes)
    static std::string detectByContent(const std::string& filePath);

    /// Получить расширение из имени файла (lowercase, без точки)
    static std::string extractExtension(const std::string& filename);

    /// Content-Type ответа: расширение имени -> MIME от хранилища -> OCTET_STREAM.
    /// Для Inline неоднозначный тип заменяется на PLAYBACK_FALLBACK
    static std::string resolveContentType(const std::optional<std::string>& filename,
                                          const std::optional<std::string>& mimeHint,
                                          DeliveryMode mode);

    /// Видео по MIME или расширению
    static bool isVideo(const std::optional<std::string>& filename,
                        const std::optional<std::string>& mimeHint);
};

} // namespace StreamVault
