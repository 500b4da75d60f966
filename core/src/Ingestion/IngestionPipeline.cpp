#include "streamvault/Ingestion/IngestionPipeline.h"
#include "streamvault/Errors.h"
#include "streamvault/MimeTypeDetector.h"
#include "streamvault/Remote/SessionManager.h"
#include <spdlog/spdlog.h>

namespace StreamVault {

IngestionPipeline::IngestionPipeline(SessionManager& sessions, IdentifierCodec codec, std::string baseUrl)
    : m_sessions(sessions), m_codec(codec), m_baseUrl(std::move(baseUrl)) {
    while (!m_baseUrl.empty() && m_baseUrl.back() == '/') {
        m_baseUrl.pop_back();
    }
}

IngestionResult IngestionPipeline::linksFor(ObjectId id, bool isVideo) const {
    IngestionResult result;
    result.objectId = id;
    result.token = m_codec.encode(id);
    result.downloadUrl = m_baseUrl + "/download/" + result.token;
    if (isVideo) {
        result.streamUrl = m_baseUrl + "/stream/" + result.token;
    }
    return result;
}

IngestionResult IngestionPipeline::relayInboundObject(const InboundObjectRef& ref) {
    SessionLease lease = m_sessions.acquire();

    ObjectId id = 0;
    try {
        id = lease->relayInbound(ref);
    } catch (const RateLimitedException& e) {
        m_sessions.noteRateLimited(e.retryAfterSeconds());
        throw;
    } catch (const RemoteStoreException&) {
        lease.markBroken();
        throw;
    }

    bool isVideo = ref.isVideo || MimeTypeDetector::isVideo(ref.filename, ref.mimeHint);
    if (!isVideo) {
        // Тип мог определить сам канал (по содержимому)
        try {
            auto meta = lease->fetchMetadata(id);
            if (meta) {
                isVideo = MimeTypeDetector::isVideo(meta->filename, meta->mimeHint);
            }
        } catch (const RemoteStoreException& e) {
            // Объект уже сохранён; без метаданных отдаём только download-ссылку
            spdlog::warn("IngestionPipeline: Metadata for {} unavailable: {}", id, e.what());
        }
    }
    lease.release();

    IngestionResult result = linksFor(id, isVideo);
    spdlog::info("IngestionPipeline: Stored object {} as {}{}", id, result.token,
                 isVideo ? " (video)" : "");
    return result;
}

} // namespace StreamVault
