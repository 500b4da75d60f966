// SessionManager.cpp — Rate-limited remote session management

#include "streamvault/Remote/SessionManager.h"
#include "streamvault/CredentialStore.h"
#include "streamvault/Errors.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace StreamVault {

namespace {

// ═══════════════════════════════════════════════════════════
// Serialized wrappers for transports that are not thread-safe
// ═══════════════════════════════════════════════════════════

class SerializedChunkStream : public ChunkStream {
public:
    SerializedChunkStream(std::unique_ptr<ChunkStream> inner, std::shared_ptr<std::mutex> mutex)
        : m_inner(std::move(inner)), m_mutex(std::move(mutex)) {}

    ~SerializedChunkStream() override {
        close();
    }

    std::optional<std::vector<uint8_t>> next() override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        return m_inner->next();
    }

    void close() override {
        if (!m_inner) return;
        std::lock_guard<std::mutex> lock(*m_mutex);
        m_inner->close();
    }

private:
    std::unique_ptr<ChunkStream> m_inner;
    std::shared_ptr<std::mutex> m_mutex;
};

class SerializedSession : public RemoteSession {
public:
    explicit SerializedSession(std::shared_ptr<RemoteSession> inner)
        : m_inner(std::move(inner)), m_mutex(std::make_shared<std::mutex>()) {}

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        return m_inner->isConnected();
    }

    std::optional<ObjectMetadata> fetchMetadata(ObjectId id) override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        return m_inner->fetchMetadata(id);
    }

    std::unique_ptr<ChunkStream> openChunkStream(
        ObjectId id, uint64_t offset, uint64_t limit, size_t chunkSize) override {
        std::unique_ptr<ChunkStream> stream;
        {
            std::lock_guard<std::mutex> lock(*m_mutex);
            stream = m_inner->openChunkStream(id, offset, limit, chunkSize);
        }
        return std::make_unique<SerializedChunkStream>(std::move(stream), m_mutex);
    }

    ObjectId relayInbound(const InboundObjectRef& ref) override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        return m_inner->relayInbound(ref);
    }

    std::string exportSessionToken() const override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        return m_inner->exportSessionToken();
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(*m_mutex);
        m_inner->disconnect();
    }

private:
    std::shared_ptr<RemoteSession> m_inner;
    std::shared_ptr<std::mutex> m_mutex;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// SessionManager::Impl
// ═══════════════════════════════════════════════════════════

class SessionManager::Impl {
public:
    Impl(std::shared_ptr<RemoteStoreConnector> connector,
         SessionManagerOptions options,
         std::shared_ptr<CooldownWindow> cooldown,
         std::shared_ptr<CredentialStore> credentials)
        : m_connector(std::move(connector))
        , m_options(std::move(options))
        , m_cooldown(std::move(cooldown))
        , m_credentials(std::move(credentials)) {
        if (!m_connector) {
            throw std::invalid_argument("RemoteStoreConnector instance is required");
        }
        if (!m_cooldown) {
            throw std::invalid_argument("CooldownWindow instance is required");
        }
        m_serialize = !(m_options.transportThreadSafe || m_connector->isThreadSafe());
    }

    ~Impl() {
        shutdown();
    }

    std::shared_ptr<RemoteSession> acquire() {
        rejectDuringCooldown();

        if (m_options.mode == SessionMode::Stateless) {
            auto session = connect();
            m_connects.fetch_add(1, std::memory_order_relaxed);
            return session;
        }

        std::lock_guard<std::mutex> lock(m_poolMutex);
        if (m_warm && m_warm->isConnected()) {
            m_reuses.fetch_add(1, std::memory_order_relaxed);
            return m_warm;
        }

        if (m_warm) {
            spdlog::info("SessionManager: Warm session closed by transport, reconnecting");
            m_warm->disconnect();
            m_warm.reset();
        }

        // Другой поток мог получить rate limit, пока мы ждали блокировку
        rejectDuringCooldown();

        auto session = connect();
        m_warm = m_serialize ? std::make_shared<SerializedSession>(std::move(session))
                             : std::move(session);
        m_connects.fetch_add(1, std::memory_order_relaxed);
        return m_warm;
    }

    void release(std::shared_ptr<RemoteSession> session, bool broken) {
        if (!session) return;
        m_releases.fetch_add(1, std::memory_order_relaxed);

        if (m_options.mode == SessionMode::Stateless) {
            session->disconnect();
            return;
        }

        std::lock_guard<std::mutex> lock(m_poolMutex);
        const bool pooled = (m_warm == session);
        if (pooled && !broken && session->isConnected()) {
            return;
        }

        if (pooled) {
            spdlog::info("SessionManager: Dropping {} warm session",
                         broken ? "broken" : "disconnected");
            m_warm.reset();
        }
        // Сессия вне пула: её закрывает последний вернувший lease
        if (session.use_count() == 1) {
            session->disconnect();
        }
    }

    void noteRateLimited(int64_t retryAfterSeconds) {
        m_rateLimitSignals.fetch_add(1, std::memory_order_relaxed);
        m_cooldown->extend(retryAfterSeconds);
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(m_poolMutex);
        if (m_warm) {
            m_warm->disconnect();
            m_warm.reset();
            spdlog::info("SessionManager: Warm session closed");
        }
    }

    SessionStats stats() const {
        SessionStats s;
        s.connects = m_connects.load(std::memory_order_relaxed);
        s.reuses = m_reuses.load(std::memory_order_relaxed);
        s.releases = m_releases.load(std::memory_order_relaxed);
        s.cooldownRejections = m_cooldownRejections.load(std::memory_order_relaxed);
        s.rateLimitSignals = m_rateLimitSignals.load(std::memory_order_relaxed);
        return s;
    }

    SessionMode mode() const { return m_options.mode; }
    const CooldownWindow& cooldown() const { return *m_cooldown; }

private:
    std::shared_ptr<RemoteStoreConnector> m_connector;
    SessionManagerOptions m_options;
    std::shared_ptr<CooldownWindow> m_cooldown;
    std::shared_ptr<CredentialStore> m_credentials;
    bool m_serialize = true;

    std::mutex m_poolMutex;
    std::shared_ptr<RemoteSession> m_warm;

    std::atomic<uint64_t> m_connects{0};
    std::atomic<uint64_t> m_reuses{0};
    std::atomic<uint64_t> m_releases{0};
    std::atomic<uint64_t> m_cooldownRejections{0};
    std::atomic<uint64_t> m_rateLimitSignals{0};

    void rejectDuringCooldown() {
        int64_t remaining = m_cooldown->remainingSeconds();
        if (remaining > 0) {
            m_cooldownRejections.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("SessionManager: Cooldown active, {}s remaining", remaining);
            throw RateLimitedException(remaining);
        }
    }

    std::string persistedSessionToken() const {
        if (!m_options.sessionToken.empty()) {
            return m_options.sessionToken;
        }
        if (m_credentials) {
            return m_credentials->retrieveString(CredentialStore::KEY_SESSION_TOKEN).value_or("");
        }
        return "";
    }

    std::shared_ptr<RemoteSession> connect() {
        try {
            std::string sessionToken = persistedSessionToken();
            if (!sessionToken.empty()) {
                try {
                    auto session = m_connector->resumeSession(sessionToken, m_options.timeout);
                    spdlog::debug("SessionManager: Resumed persisted session");
                    return requireSession(std::move(session));
                } catch (const RemoteAuthException& e) {
                    if (m_options.botToken.empty()) {
                        throw;
                    }
                    spdlog::warn("SessionManager: Persisted session rejected ({}), "
                                 "falling back to bot login", e.what());
                }
            }

            if (m_options.botToken.empty()) {
                throw RemoteAuthException("No session token or bot token configured");
            }

            auto session = requireSession(m_connector->loginBot(m_options.botToken, m_options.timeout));
            spdlog::info("SessionManager: Logged in with bot credential");
            persistSessionToken(*session);
            return session;
        } catch (const RateLimitedException& e) {
            spdlog::warn("SessionManager: Remote store rate limit on connect, retry after {}s",
                         e.retryAfterSeconds());
            noteRateLimited(e.retryAfterSeconds());
            throw;
        }
    }

    static std::shared_ptr<RemoteSession> requireSession(std::shared_ptr<RemoteSession> session) {
        if (!session) {
            throw RemoteStoreException("Remote store connector returned no session");
        }
        return session;
    }

    void persistSessionToken(const RemoteSession& session) {
        if (!m_credentials) return;

        std::string token = session.exportSessionToken();
        if (token.empty()) return;

        if (!m_credentials->storeString(CredentialStore::KEY_SESSION_TOKEN, token)) {
            spdlog::warn("SessionManager: Failed to persist session token");
        }
    }
};

// ═══════════════════════════════════════════════════════════
// SessionLease
// ═══════════════════════════════════════════════════════════

SessionLease::SessionLease(SessionManager* owner, std::shared_ptr<RemoteSession> session)
    : m_owner(owner), m_session(std::move(session)) {}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : m_owner(other.m_owner)
    , m_session(std::move(other.m_session))
    , m_broken(other.m_broken) {
    other.m_owner = nullptr;
    other.m_broken = false;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        m_owner = other.m_owner;
        m_session = std::move(other.m_session);
        m_broken = other.m_broken;
        other.m_owner = nullptr;
        other.m_broken = false;
    }
    return *this;
}

void SessionLease::release() {
    if (m_owner && m_session) {
        m_owner->release(*this);
    }
}

// ═══════════════════════════════════════════════════════════
// SessionManager Public Interface
// ═══════════════════════════════════════════════════════════

SessionManager::SessionManager(std::shared_ptr<RemoteStoreConnector> connector,
                               SessionManagerOptions options,
                               std::shared_ptr<CooldownWindow> cooldown,
                               std::shared_ptr<CredentialStore> credentials)
    : m_impl(std::make_unique<Impl>(std::move(connector), std::move(options),
                                    std::move(cooldown), std::move(credentials))) {}

SessionManager::~SessionManager() = default;

SessionLease SessionManager::acquire() {
    return SessionLease(this, m_impl->acquire());
}

void SessionManager::release(SessionLease& lease) {
    auto session = std::move(lease.m_session);
    lease.m_session.reset();
    if (!session) return;

    try {
        m_impl->release(std::move(session), lease.m_broken);
    } catch (const std::exception& e) {
        // Вызывается из деструктора SessionLease — не пропускаем исключения
        spdlog::error("SessionManager: Error while releasing session: {}", e.what());
    }
}

void SessionManager::noteRateLimited(int64_t retryAfterSeconds) {
    m_impl->noteRateLimited(retryAfterSeconds);
}

void SessionManager::shutdown() {
    m_impl->shutdown();
}

SessionStats SessionManager::stats() const {
    return m_impl->stats();
}

SessionMode SessionManager::mode() const {
    return m_impl->mode();
}

const CooldownWindow& SessionManager::cooldown() const {
    return m_impl->cooldown();
}

} // namespace StreamVault
