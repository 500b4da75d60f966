#include "streamvault/MimeTypeDetector.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// Таблица расширений -> MIME
// ═══════════════════════════════════════════════════════════

static const std::unordered_map<std::string, std::string> EXTENSION_TO_MIME = {
    // Video
    {"mp4", "video/mp4"},
    {"m4v", "video/x-m4v"},
    {"mkv", "video/x-matroska"},
    {"webm", "video/webm"},
    {"mov", "video/quicktime"},
    {"avi", "video/x-msvideo"},
    {"wmv", "video/x-ms-wmv"},
    {"flv", "video/x-flv"},
    {"3gp", "video/3gpp"},
    {"ogv", "video/ogg"},
    {"ts", "video/mp2t"},
    {"mpg", "video/mpeg"},
    {"mpeg", "video/mpeg"},

    // Audio
    {"mp3", "audio/mpeg"},
    {"m4a", "audio/mp4"},
    {"aac", "audio/aac"},
    {"ogg", "audio/ogg"},
    {"oga", "audio/ogg"},
    {"opus", "audio/opus"},
    {"flac", "audio/flac"},
    {"wav", "audio/wav"},
    {"mka", "audio/x-matroska"},

    // Subtitles / playlists
    {"srt", "application/x-subrip"},
    {"vtt", "text/vtt"},
    {"m3u8", "application/vnd.apple.mpegurl"},
    {"mpd", "application/dash+xml"},

    // Images
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"heic", "image/heic"},

    // Documents
    {"pdf", "application/pdf"},
    {"txt", "text/plain"},
    {"json", "application/json"},
    {"epub", "application/epub+zip"},

    // Archives / packages
    {"zip", "application/zip"},
    {"rar", "application/vnd.rar"},
    {"7z", "application/x-7z-compressed"},
    {"tar", "application/x-tar"},
    {"gz", "application/gzip"},
    {"apk", "application/vnd.android.package-archive"},
    {"iso", "application/x-iso9660-image"},
};

// ═══════════════════════════════════════════════════════════
// Magic bytes (для ingestion локальных файлов без расширения)
// ═══════════════════════════════════════════════════════════

struct MagicSignature {
    std::array<uint8_t, 8> bytes;
    size_t length;
    size_t offset;
    const char* mimeType;
};

static const std::array<MagicSignature, 9> MAGIC_SIGNATURES = {{
    {{0x66, 0x74, 0x79, 0x70}, 4, 4, "video/mp4"},                  // "ftyp"
    {{0x1A, 0x45, 0xDF, 0xA3}, 4, 0, "video/x-matroska"},           // EBML
    {{0x4F, 0x67, 0x67, 0x53}, 4, 0, "audio/ogg"},                  // OggS
    {{0x49, 0x44, 0x33}, 3, 0, "audio/mpeg"},                       // ID3
    {{0x66, 0x4C, 0x61, 0x43}, 4, 0, "audio/flac"},                 // fLaC
    {{0xFF, 0xD8, 0xFF}, 3, 0, "image/jpeg"},
    {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 8, 0, "image/png"},
    {{0x25, 0x50, 0x44, 0x46}, 4, 0, "application/pdf"},
    {{0x50, 0x4B, 0x03, 0x04}, 4, 0, "application/zip"},
}};

// ═══════════════════════════════════════════════════════════
// Реализация
// ═══════════════════════════════════════════════════════════

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string MimeTypeDetector::extractExtension(const std::string& filename) {
    auto dotPos = filename.rfind('.');
    if (dotPos == std::string::npos || dotPos == filename.length() - 1) {
        return "";
    }
    return toLower(filename.substr(dotPos + 1));
}

std::string MimeTypeDetector::detectByExtension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }

    auto it = EXTENSION_TO_MIME.find(toLower(ext));
    if (it != EXTENSION_TO_MIME.end()) {
        return it->second;
    }
    return OCTET_STREAM;
}

std::string MimeTypeDetector::detectByContent(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return OCTET_STREAM;
    }

    std::array<uint8_t, 16> header{};
    file.read(reinterpret_cast<char*>(header.data()), header.size());
    auto bytesRead = static_cast<size_t>(file.gcount());

    for (const auto& sig : MAGIC_SIGNATURES) {
        if (sig.offset + sig.length > bytesRead) {
            continue;
        }
        if (std::equal(sig.bytes.begin(), sig.bytes.begin() + sig.length,
                       header.begin() + sig.offset)) {
            return sig.mimeType;
        }
    }

    return OCTET_STREAM;
}

std::string MimeTypeDetector::resolveContentType(const std::optional<std::string>& filename,
                                                 const std::optional<std::string>& mimeHint,
                                                 DeliveryMode mode) {
    std::string mime = OCTET_STREAM;

    if (filename) {
        mime = detectByExtension(extractExtension(*filename));
    }
    if (mime == OCTET_STREAM && mimeHint && !mimeHint->empty()) {
        mime = *mimeHint;
    }

    // Плееру браузера нужен конкретный тип
    if (mode == DeliveryMode::Inline && mime == OCTET_STREAM) {
        mime = PLAYBACK_FALLBACK;
    }
    return mime;
}

bool MimeTypeDetector::isVideo(const std::optional<std::string>& filename,
                               const std::optional<std::string>& mimeHint) {
    if (mimeHint && contentTypeFromMime(*mimeHint) == ContentType::Video) {
        return true;
    }
    if (filename) {
        return contentTypeFromMime(detectByExtension(extractExtension(*filename))) ==
               ContentType::Video;
    }
    return false;
}

} // namespace StreamVault
