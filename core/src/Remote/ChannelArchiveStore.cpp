#include "streamvault/Remote/ChannelArchiveStore.h"
#include "streamvault/Database.h"
#include "streamvault/Errors.h"
#include "streamvault/MimeTypeDetector.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <climits>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace StreamVault {

namespace fs = std::filesystem;

namespace {

constexpr const char* KEY_SESSION_TOKEN = "session_token";
constexpr size_t UPLOAD_BUFFER_SIZE = 64 * 1024;

// ═══════════════════════════════════════════════════════════
// SHA-256 (OpenSSL EVP)
// ═══════════════════════════════════════════════════════════

class Sha256 {
public:
    Sha256() : m_ctx(EVP_MD_CTX_new()) {
        if (!m_ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        if (EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(m_ctx);
            throw std::runtime_error("Failed to init SHA256");
        }
    }

    ~Sha256() {
        EVP_MD_CTX_free(m_ctx);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t size) {
        if (EVP_DigestUpdate(m_ctx, data, size) != 1) {
            throw std::runtime_error("Failed to update SHA256");
        }
    }

    /// "sha256:<hex>"
    std::string finish() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(m_ctx, hash, &length) != 1) {
            throw std::runtime_error("Failed to finalize SHA256");
        }

        std::ostringstream oss;
        oss << "sha256:";
        for (unsigned int i = 0; i < length; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* m_ctx;
};

std::string generateSessionToken() {
    std::vector<uint8_t> bytes(32);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        spdlog::error("ChannelArchiveStore: RAND_bytes failed");
        throw RemoteStoreException("Failed to generate session token");
    }

    std::ostringstream oss;
    for (uint8_t b : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

int busyTimeoutFor(std::chrono::milliseconds timeout) {
    auto ms = timeout.count();
    if (ms <= 0) return 0;
    return static_cast<int>(std::min<int64_t>(ms, INT_MAX));
}

/// Ошибку SQLite переводим в ошибку удалённого хранилища
[[noreturn]] void rethrowAsRemote(const DatabaseException& e) {
    if (e.isBusy()) {
        throw TransportTimeoutException(std::string("Channel archive busy: ") + e.what());
    }
    throw RemoteStoreException(std::string("Channel archive error: ") + e.what());
}

bool isAddressable(ObjectId id) {
    return id > 0 && id <= static_cast<ObjectId>(std::numeric_limits<int64_t>::max());
}

// ═══════════════════════════════════════════════════════════
// BlobChunkStream — чтение BLOB по чанкам, в памяти только текущий чанк
// ═══════════════════════════════════════════════════════════

class BlobChunkStream : public ChunkStream {
public:
    BlobChunkStream(std::shared_ptr<Database> db, std::unique_ptr<BlobHandle> blob,
                    uint64_t offset, uint64_t limit, size_t chunkSize)
        : m_db(std::move(db))
        , m_blob(std::move(blob))
        , m_offset(offset)
        , m_remaining(limit)
        , m_chunkSize(chunkSize) {}

    ~BlobChunkStream() override {
        close();
    }

    std::optional<std::vector<uint8_t>> next() override {
        if (!m_blob || m_remaining == 0) {
            return std::nullopt;
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(m_remaining, m_chunkSize));
        std::vector<uint8_t> chunk;
        try {
            chunk = m_blob->read(static_cast<int64_t>(m_offset), want);
        } catch (const DatabaseException& e) {
            close();
            rethrowAsRemote(e);
        }

        if (chunk.empty()) {
            // BLOB короче заявленного — конец данных
            close();
            return std::nullopt;
        }

        m_offset += chunk.size();
        m_remaining -= chunk.size();
        return chunk;
    }

    void close() override {
        m_blob.reset();
    }

private:
    std::shared_ptr<Database> m_db;         // Соединение живёт, пока открыт BLOB
    std::unique_ptr<BlobHandle> m_blob;
    uint64_t m_offset;
    uint64_t m_remaining;
    size_t m_chunkSize;
};

// ═══════════════════════════════════════════════════════════
// ArchiveSession — одно соединение с архивом
// ═══════════════════════════════════════════════════════════

class ArchiveSession : public RemoteSession {
public:
    ArchiveSession(std::shared_ptr<Database> db, std::string sessionToken)
        : m_db(std::move(db)), m_sessionToken(std::move(sessionToken)) {}

    ~ArchiveSession() override {
        disconnect();
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    std::optional<ObjectMetadata> fetchMetadata(ObjectId id) override {
        auto db = connection();
        if (!isAddressable(id)) {
            return std::nullopt;
        }

        try {
            return db->queryOne<ObjectMetadata>(
                "SELECT size, mime_type, filename, payload IS NOT NULL "
                "FROM channel_messages WHERE id = ?",
                [](sqlite3_stmt* stmt) {
                    ObjectMetadata meta;
                    meta.size = static_cast<uint64_t>(std::max<int64_t>(0, Database::getInt64(stmt, 0)));
                    meta.mimeHint = Database::getStringOpt(stmt, 1);
                    meta.filename = Database::getStringOpt(stmt, 2);
                    meta.hasPayload = Database::getInt(stmt, 3) != 0;
                    return meta;
                },
                static_cast<int64_t>(id));
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }

    std::unique_ptr<ChunkStream> openChunkStream(
        ObjectId id, uint64_t offset, uint64_t limit, size_t chunkSize) override {
        if (chunkSize == 0) {
            throw std::invalid_argument("chunkSize must be positive");
        }
        auto db = connection();
        if (!isAddressable(id)) {
            throw RemoteStoreException("Message " + std::to_string(id) + " not found");
        }

        std::unique_ptr<BlobHandle> blob;
        try {
            blob = db->openBlob("channel_messages", "payload", static_cast<int64_t>(id));
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }

        uint64_t size = static_cast<uint64_t>(blob->size());
        if (offset > size) {
            throw RemoteStoreException("Offset " + std::to_string(offset) +
                                       " beyond payload of message " + std::to_string(id));
        }
        uint64_t bounded = std::min<uint64_t>(limit, size - offset);

        spdlog::debug("ChannelArchiveStore: Stream message {} [{}, +{}) chunk={}",
                      id, offset, bounded, chunkSize);
        return std::make_unique<BlobChunkStream>(db, std::move(blob), offset, bounded, chunkSize);
    }

    ObjectId relayInbound(const InboundObjectRef& ref) override {
        auto db = connection();
        try {
            if (ref.localPath) {
                return uploadFile(*db, ref);
            }
            if (ref.sourceMessageId) {
                return copyMessage(*db, ref);
            }
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
        throw RemoteStoreException("Inbound object has neither a local file nor a source message");
    }

    std::string exportSessionToken() const override {
        return m_sessionToken;
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_db.reset();
    }

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<Database> m_db;
    std::string m_sessionToken;

    std::shared_ptr<Database> connection() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) {
            throw RemoteStoreException("Session is disconnected");
        }
        return m_db;
    }

    static ObjectId uploadFile(Database& db, const InboundObjectRef& ref) {
        const std::string& path = *ref.localPath;

        std::error_code ec;
        auto fileSize = fs::file_size(path, ec);
        if (ec) {
            throw RemoteStoreException("Cannot read inbound file " + path + ": " + ec.message());
        }
        if (fileSize > static_cast<uintmax_t>(INT_MAX)) {
            throw RemoteStoreException("Inbound file too large for channel archive: " + path);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw RemoteStoreException("Cannot open inbound file " + path);
        }

        std::string filename = ref.filename.value_or(fs::path(path).filename().string());
        std::string mimeType = ref.mimeHint.value_or(
            MimeTypeDetector::detectByExtension(MimeTypeDetector::extractExtension(filename)));
        if (mimeType == MimeTypeDetector::OCTET_STREAM) {
            mimeType = MimeTypeDetector::detectByContent(path);
        }

        Database::Transaction tx(db);
        db.execute(
            "INSERT INTO channel_messages (filename, mime_type, size, payload) VALUES (?, ?, ?, ?)",
            filename, mimeType, static_cast<int64_t>(fileSize),
            ZeroBlob{static_cast<int64_t>(fileSize)});
        int64_t id = db.lastInsertId();

        Sha256 digest;
        {
            auto blob = db.openBlob("channel_messages", "payload", id, true);
            std::vector<char> buffer(UPLOAD_BUFFER_SIZE);
            int64_t written = 0;
            while (file) {
                file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                auto n = static_cast<size_t>(file.gcount());
                if (n == 0) break;
                if (written + static_cast<int64_t>(n) > static_cast<int64_t>(fileSize)) {
                    throw RemoteStoreException("Inbound file grew during upload: " + path);
                }
                blob->write(written, reinterpret_cast<const uint8_t*>(buffer.data()), n);
                digest.update(buffer.data(), n);
                written += static_cast<int64_t>(n);
            }
            if (written != static_cast<int64_t>(fileSize)) {
                throw RemoteStoreException("Inbound file shrank during upload: " + path);
            }
        }

        std::string checksum = digest.finish();
        db.execute("UPDATE channel_messages SET checksum = ? WHERE id = ?", checksum, id);
        tx.commit();

        spdlog::info("ChannelArchiveStore: Stored {} as message {} ({} bytes, {})",
                     filename, id, fileSize, mimeType);
        return static_cast<ObjectId>(id);
    }

    static ObjectId copyMessage(Database& db, const InboundObjectRef& ref) {
        int64_t sourceId = *ref.sourceMessageId;

        Database::Transaction tx(db);
        db.execute(
            "INSERT INTO channel_messages (filename, mime_type, size, payload, checksum) "
            "SELECT COALESCE(?, filename), COALESCE(?, mime_type), size, payload, checksum "
            "FROM channel_messages WHERE id = ? AND payload IS NOT NULL",
            ref.filename, ref.mimeHint, sourceId);
        if (db.changesCount() == 0) {
            throw RemoteStoreException("Source message " + std::to_string(sourceId) +
                                       " not found or has no document");
        }
        int64_t id = db.lastInsertId();
        tx.commit();

        spdlog::info("ChannelArchiveStore: Copied message {} as {}", sourceId, id);
        return static_cast<ObjectId>(id);
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════
// ChannelArchiveStore::Impl
// ═══════════════════════════════════════════════════════════

class ChannelArchiveStore::Impl {
public:
    explicit Impl(const std::string& archivePath) : m_path(archivePath) {
        try {
            fs::path parent = fs::path(archivePath).parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                fs::create_directories(parent, ec);
            }
            m_db = std::make_unique<Database>(archivePath);
            m_db->initialize();
        } catch (const DatabaseException& e) {
            throw RemoteStoreException("Cannot open channel archive " + archivePath + ": " + e.what());
        }
        spdlog::info("ChannelArchiveStore: Archive {} ready ({} messages)",
                     archivePath, countMessages());
    }

    std::shared_ptr<RemoteSession> resume(const std::string& sessionToken,
                                          std::chrono::milliseconds timeout) {
        auto issued = storedSessionToken();
        if (sessionToken.empty() || !issued || *issued != sessionToken) {
            throw RemoteAuthException("Session token rejected by channel archive");
        }
        return std::make_shared<ArchiveSession>(openConnection(timeout), sessionToken);
    }

    std::shared_ptr<RemoteSession> login(const std::string& botToken,
                                         std::chrono::milliseconds timeout) {
        if (botToken.empty()) {
            throw RemoteAuthException("Bot token is empty");
        }

        std::string sessionToken;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            try {
                auto issued = m_db->queryOne<std::string>(
                    "SELECT value FROM archive_settings WHERE key = ?",
                    [](sqlite3_stmt* stmt) { return Database::getString(stmt, 0); },
                    KEY_SESSION_TOKEN);
                if (issued && !issued->empty()) {
                    sessionToken = *issued;
                } else {
                    sessionToken = generateSessionToken();
                    m_db->execute(
                        "INSERT OR REPLACE INTO archive_settings (key, value) VALUES (?, ?)",
                        KEY_SESSION_TOKEN, sessionToken);
                    spdlog::info("ChannelArchiveStore: Issued new session token");
                }
            } catch (const DatabaseException& e) {
                rethrowAsRemote(e);
            }
        }

        return std::make_shared<ArchiveSession>(openConnection(timeout), sessionToken);
    }

    ObjectId postMessageWithoutPayload() {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_db->execute("INSERT INTO channel_messages (size) VALUES (0)");
            return static_cast<ObjectId>(m_db->lastInsertId());
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }

    std::optional<ChannelMessage> getMessage(ObjectId id) const {
        if (!isAddressable(id)) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            return m_db->queryOne<ChannelMessage>(
                "SELECT id, filename, mime_type, size, payload IS NOT NULL, checksum, created_at "
                "FROM channel_messages WHERE id = ?",
                [](sqlite3_stmt* stmt) {
                    ChannelMessage msg;
                    msg.id = static_cast<ObjectId>(Database::getInt64(stmt, 0));
                    msg.filename = Database::getStringOpt(stmt, 1);
                    msg.mimeType = Database::getStringOpt(stmt, 2);
                    msg.size = static_cast<uint64_t>(std::max<int64_t>(0, Database::getInt64(stmt, 3)));
                    msg.hasPayload = Database::getInt(stmt, 4) != 0;
                    msg.checksum = Database::getStringOpt(stmt, 5);
                    msg.createdAt = Database::getInt64Opt(stmt, 6).value_or(0);
                    return msg;
                },
                static_cast<int64_t>(id));
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }

    int64_t countMessages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            return m_db->queryScalar("SELECT COUNT(*) FROM channel_messages");
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    mutable std::mutex m_mutex;
    std::unique_ptr<Database> m_db;     // Служебное соединение (миграции, токены)

    std::optional<std::string> storedSessionToken() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            return m_db->queryOne<std::string>(
                "SELECT value FROM archive_settings WHERE key = ?",
                [](sqlite3_stmt* stmt) { return Database::getString(stmt, 0); },
                KEY_SESSION_TOKEN);
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }

    std::shared_ptr<Database> openConnection(std::chrono::milliseconds timeout) const {
        try {
            return std::make_shared<Database>(m_path, busyTimeoutFor(timeout));
        } catch (const DatabaseException& e) {
            rethrowAsRemote(e);
        }
    }
};

// ═══════════════════════════════════════════════════════════
// ChannelArchiveStore Public Interface
// ═══════════════════════════════════════════════════════════

ChannelArchiveStore::ChannelArchiveStore(const std::string& archivePath)
    : m_impl(std::make_unique<Impl>(archivePath)) {}

ChannelArchiveStore::~ChannelArchiveStore() = default;

std::shared_ptr<RemoteSession> ChannelArchiveStore::resumeSession(
    const std::string& sessionToken, std::chrono::milliseconds timeout) {
    return m_impl->resume(sessionToken, timeout);
}

std::shared_ptr<RemoteSession> ChannelArchiveStore::loginBot(
    const std::string& botToken, std::chrono::milliseconds timeout) {
    return m_impl->login(botToken, timeout);
}

ObjectId ChannelArchiveStore::postMessageWithoutPayload() {
    return m_impl->postMessageWithoutPayload();
}

std::optional<ChannelMessage> ChannelArchiveStore::getMessage(ObjectId id) const {
    return m_impl->getMessage(id);
}

int64_t ChannelArchiveStore::countMessages() const {
    return m_impl->countMessages();
}

const std::string& ChannelArchiveStore::path() const {
    return m_impl->path();
}

std::string ChannelArchiveStore::computeChecksum(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file for checksum: " + filePath);
    }

    Sha256 digest;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        digest.update(buffer, static_cast<size_t>(file.gcount()));
    }
    return digest.finish();
}

} // namespace StreamVault
