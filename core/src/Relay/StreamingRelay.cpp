// StreamingRelay.cpp — Relay: decode -> session -> metadata -> range -> stream

#include "streamvault/Relay/StreamingRelay.h"
#include "streamvault/Errors.h"
#include "streamvault/Http/RangeResolver.h"
#include "streamvault/MimeTypeDetector.h"
#include "streamvault/Remote/SessionManager.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>

namespace StreamVault {

namespace {

constexpr const char* CONFIG_HINT = "Check BOT_TOKEN / SESSION_STRING in the server configuration";

HttpHeaders retryAfterHeaders(int64_t seconds) {
    return {{"Retry-After", std::to_string(std::max<int64_t>(1, seconds))}};
}

} // namespace

StreamingRelay::StreamingRelay(SessionManager& sessions, IdentifierCodec codec, RelayOptions options)
    : m_sessions(sessions), m_codec(codec), m_options(options) {
    if (m_options.chunkSize == 0) {
        throw std::invalid_argument("Relay chunk size must be positive");
    }
}

std::string StreamingRelay::sanitizeFilename(const std::optional<std::string>& filename, ObjectId id) {
    std::string result;
    if (filename) {
        result.reserve(filename->size());
        for (char c : *filename) {
            auto u = static_cast<unsigned char>(c);
            if (c == '"' || c == '\\' || u < 0x20 || u == 0x7f) {
                continue;
            }
            result += c;
        }
    }
    if (result.empty()) {
        result = "file_" + std::to_string(id);
    }
    return result;
}

RelayOutcome StreamingRelay::handle(const RelayRequest& request, ResponseSink& sink) {
    RelayOutcome outcome;
    const bool headOnly = request.headOnly;

    auto reply = [&](int status, const nlohmann::json& body, const HttpHeaders& extra = {}) {
        outcome.status = status;
        outcome.completed = sendJson(sink, status, body, extra, headOnly);
        outcome.clientDisconnected = !outcome.completed;
        return outcome;
    };

    // 1. Токен -> ObjectId
    ObjectId id = 0;
    try {
        id = m_codec.decode(request.token);
    } catch (const InvalidTokenException& e) {
        spdlog::warn("StreamingRelay: {}", e.what());
        return reply(400, errorBody("Invalid ID", e.what()));
    }

    // 2. Сессия
    SessionLease lease;
    try {
        lease = m_sessions.acquire();
    } catch (const RateLimitedException& e) {
        spdlog::warn("StreamingRelay: Object {} rejected, rate limited for {}s", id, e.retryAfterSeconds());
        return reply(503, errorBody("Rate Limited", e.what(), std::nullopt, e.retryAfterSeconds()),
                     retryAfterHeaders(e.retryAfterSeconds()));
    } catch (const TransportTimeoutException& e) {
        spdlog::warn("StreamingRelay: Session acquire timed out: {}", e.what());
        return reply(503, errorBody("Service Unavailable", e.what()));
    } catch (const RemoteAuthException& e) {
        spdlog::error("StreamingRelay: Remote store authentication failed: {}", e.what());
        return reply(500, errorBody("Configuration Error", e.what(), std::string(CONFIG_HINT)));
    } catch (const std::exception& e) {
        spdlog::error("StreamingRelay: Session acquire failed: {}", e.what());
        return reply(500, errorBody("Internal Server Error", e.what()));
    }

    // 3. Метаданные (каждый раз у хранилища, без кэша)
    std::optional<ObjectMetadata> meta;
    try {
        meta = lease->fetchMetadata(id);
    } catch (const RateLimitedException& e) {
        m_sessions.noteRateLimited(e.retryAfterSeconds());
        return reply(503, errorBody("Rate Limited", e.what(), std::nullopt, e.retryAfterSeconds()),
                     retryAfterHeaders(e.retryAfterSeconds()));
    } catch (const std::exception& e) {
        lease.markBroken();
        spdlog::error("StreamingRelay: Metadata fetch for {} failed: {}", id, e.what());
        return reply(500, errorBody("Internal Server Error", e.what()));
    }

    if (!meta) {
        lease.release();
        spdlog::info("StreamingRelay: Object {} not found", id);
        return reply(404, errorBody("Message Not Found",
                                    "Message ID " + std::to_string(id) + " not found in storage channel",
                                    std::string("Make sure the file was uploaded through the bot first")));
    }
    if (!meta->hasPayload) {
        lease.release();
        spdlog::info("StreamingRelay: Object {} has no document", id);
        return reply(404, errorBody("Not a Document",
                                    "Message ID " + std::to_string(id) + " has no document attached"));
    }

    // 4. Диапазон
    RangeSpec range;
    try {
        range = resolveRange(meta->size, request.rangeHeader);
    } catch (const RangeNotSatisfiableException& e) {
        lease.release();
        spdlog::info("StreamingRelay: {}", e.what());
        return reply(416, errorBody("Range Not Satisfiable", e.what()),
                     {{"Content-Range", formatUnsatisfiedContentRange(meta->size)}});
    }

    const uint64_t length = meta->size == 0 ? 0 : range.length();

    // 5. Заголовки
    const std::string contentType =
        MimeTypeDetector::resolveContentType(meta->filename, meta->mimeHint, request.mode);
    HttpResponseHead head;
    head.status = range.httpStatus();
    head.set("Content-Type", contentType);
    head.set("Content-Length", std::to_string(length));
    head.set("Accept-Ranges", "bytes");
    if (request.mode == DeliveryMode::Attachment) {
        head.set("Content-Disposition",
                 "attachment; filename=\"" + sanitizeFilename(meta->filename, id) + "\"");
    } else {
        head.set("Content-Disposition", "inline");
    }
    if (range.isPartial) {
        head.set("Content-Range", formatContentRange(range, meta->size));
    }

    if (headOnly || length == 0) {
        lease.release();
        outcome.status = head.status;
        outcome.completed = sink.sendHead(head);
        outcome.clientDisconnected = !outcome.completed;
        return outcome;
    }

    // 6. Поток чанков [start, end]
    std::unique_ptr<ChunkStream> stream;
    try {
        stream = lease->openChunkStream(id, range.start, length, m_options.chunkSize);
    } catch (const RateLimitedException& e) {
        m_sessions.noteRateLimited(e.retryAfterSeconds());
        return reply(503, errorBody("Rate Limited", e.what(), std::nullopt, e.retryAfterSeconds()),
                     retryAfterHeaders(e.retryAfterSeconds()));
    } catch (const std::exception& e) {
        lease.markBroken();
        spdlog::error("StreamingRelay: Cannot open stream for {}: {}", id, e.what());
        return reply(500, errorBody("Internal Server Error", e.what()));
    }
    if (!stream) {
        spdlog::error("StreamingRelay: Remote session returned no stream for {}", id);
        return reply(500, errorBody("Internal Server Error", "Remote store returned no stream"));
    }

    outcome.status = head.status;
    if (!sink.sendHead(head)) {
        stream->close();
        outcome.clientDisconnected = true;
        spdlog::debug("StreamingRelay: Client left before headers for {}", id);
        return outcome;
    }

    // 7. Чанки по возрастанию смещения, каждый ровно один раз
    uint64_t remaining = length;
    while (remaining > 0) {
        std::optional<std::vector<uint8_t>> chunk;
        try {
            chunk = stream->next();
        } catch (const RateLimitedException& e) {
            m_sessions.noteRateLimited(e.retryAfterSeconds());
            spdlog::warn("StreamingRelay: Rate limited mid-stream for {} after {} bytes",
                         id, outcome.bytesSent);
            outcome.streamFailed = true;
            break;
        } catch (const std::exception& e) {
            lease.markBroken();
            spdlog::error("StreamingRelay: Stream for {} failed after {} bytes: {}",
                          id, outcome.bytesSent, e.what());
            outcome.streamFailed = true;
            break;
        }

        if (!chunk || chunk->empty()) {
            spdlog::error("StreamingRelay: Stream for {} ended short: {} of {} bytes",
                          id, outcome.bytesSent, length);
            outcome.streamFailed = true;
            break;
        }

        // Лишнее сверх бюджета не отправляем
        size_t n = static_cast<size_t>(std::min<uint64_t>(chunk->size(), remaining));
        if (!sink.sendBody(chunk->data(), n)) {
            outcome.clientDisconnected = true;
            spdlog::info("StreamingRelay: Client disconnected from {} after {} bytes",
                         id, outcome.bytesSent);
            break;
        }
        remaining -= n;
        outcome.bytesSent += n;
    }

    // 8. Закрыть поток, затем вернуть сессию
    stream->close();
    stream.reset();
    lease.release();

    if (outcome.streamFailed) {
        sink.abort();
    } else if (remaining == 0) {
        outcome.completed = true;
        spdlog::debug("StreamingRelay: Served {} bytes of {} ({} {}, {})",
                      outcome.bytesSent, id, deliveryModeToString(request.mode),
                      contentTypeToString(contentTypeFromMime(contentType)), head.status);
    }
    return outcome;
}

} // namespace StreamVault
