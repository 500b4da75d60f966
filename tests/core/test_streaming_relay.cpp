// test_streaming_relay.cpp — тесты StreamingRelay

#include <gtest/gtest.h>
#include "MockRemoteStore.h"
#include "RecordingSink.h"
#include "streamvault/Relay/StreamingRelay.h"
#include "streamvault/Remote/SessionManager.h"
#include <thread>
#include <vector>

using namespace StreamVault;
using namespace StreamVault::Testing;

class StreamingRelayTest : public ::testing::Test {
protected:
    static constexpr size_t CHUNK = 64 * 1024;
    static constexpr ObjectId MOVIE_ID = 42;
    static constexpr uint64_t MOVIE_SIZE = 5000000;

    std::shared_ptr<MockStoreState> state = std::make_shared<MockStoreState>();
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::shared_ptr<CooldownWindow> cooldown = std::make_shared<CooldownWindow>(clock);
    IdentifierCodec codec;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<StreamingRelay> relay;

    void SetUp() override {
        state->addObject(MOVIE_ID, MOVIE_SIZE, std::string("movie.mkv"), std::string("video/x-matroska"));
        useSessions(SessionMode::Stateless, "session-ok", "");
    }

    void useSessions(SessionMode mode, const std::string& sessionToken, const std::string& botToken) {
        relay.reset();
        sessions.reset();
        SessionManagerOptions options;
        options.mode = mode;
        options.sessionToken = sessionToken;
        options.botToken = botToken;
        sessions = std::make_unique<SessionManager>(std::make_shared<MockConnector>(state), options, cooldown);
        relay = std::make_unique<StreamingRelay>(*sessions, codec, RelayOptions{CHUNK});
    }

    RelayOutcome get(ObjectId id, RecordingSink& sink,
                     std::optional<std::string> range = std::nullopt,
                     DeliveryMode mode = DeliveryMode::Attachment) {
        RelayRequest request;
        request.token = codec.encode(id);
        request.mode = mode;
        request.rangeHeader = std::move(range);
        return relay->handle(request, sink);
    }
};

// ═══════════════════════════════════════════════════════════
// Успешная отдача
// ═══════════════════════════════════════════════════════════

TEST_F(StreamingRelayTest, PartialRangeStreamsExactBytes) {
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink, std::string("bytes=1000000-1999999"));

    EXPECT_EQ(outcome.status, 206);
    EXPECT_TRUE(outcome.completed);
    EXPECT_EQ(outcome.bytesSent, 1000000u);

    EXPECT_EQ(sink.status(), 206);
    EXPECT_EQ(sink.header("Content-Length"), "1000000");
    EXPECT_EQ(sink.header("Content-Range"), "bytes 1000000-1999999/5000000");
    EXPECT_EQ(sink.header("Accept-Ranges"), "bytes");
    EXPECT_EQ(sink.header("Content-Type"), "video/x-matroska");
    EXPECT_EQ(sink.header("Content-Disposition"), "attachment; filename=\"movie.mkv\"");

    ASSERT_EQ(sink.body.size(), 1000000u);
    EXPECT_TRUE(sink.body == patternBytes(1000000, 1000000));
    EXPECT_FALSE(sink.aborted);

    EXPECT_EQ(state->lastOffset, 1000000u);
    EXPECT_EQ(state->lastLimit, 1000000u);
    EXPECT_EQ(state->lastChunkSize, CHUNK);
}

TEST_F(StreamingRelayTest, ResourcesReleasedOnceAfterSuccess) {
    RecordingSink sink;
    get(MOVIE_ID, sink, std::string("bytes=0-99"));

    EXPECT_EQ(state->metadataCalls.load(), 1);
    EXPECT_EQ(state->openCalls.load(), 1);
    EXPECT_EQ(state->streamsClosed.load(), 1);
    EXPECT_EQ(state->disconnects.load(), 1);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, NoRangeServesWholeObject) {
    state->addObject(7, 300000, std::string("song.mp3"));
    RecordingSink sink;
    RelayOutcome outcome = get(7, sink);

    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(sink.header("Content-Length"), "300000");
    EXPECT_EQ(sink.header("Content-Range"), "");
    EXPECT_EQ(sink.header("Content-Type"), "audio/mpeg");
    EXPECT_TRUE(sink.body == patternBytes(0, 300000));
}

TEST_F(StreamingRelayTest, OpenEndedRangeRunsToEnd) {
    RecordingSink sink;
    get(MOVIE_ID, sink, std::string("bytes=4999000-"));

    EXPECT_EQ(sink.status(), 206);
    EXPECT_EQ(sink.header("Content-Range"), "bytes 4999000-4999999/5000000");
    EXPECT_TRUE(sink.body == patternBytes(4999000, 1000));
}

TEST_F(StreamingRelayTest, MultiRangeServedAsFullContent) {
    state->addObject(8, 1000, std::string("a.txt"));
    RecordingSink sink;
    get(8, sink, std::string("bytes=0-10,20-30"));

    EXPECT_EQ(sink.status(), 200);
    EXPECT_EQ(sink.body.size(), 1000u);
}

TEST_F(StreamingRelayTest, InlineModeUsesInlineDisposition) {
    RecordingSink sink;
    get(MOVIE_ID, sink, std::string("bytes=0-9"), DeliveryMode::Inline);

    EXPECT_EQ(sink.header("Content-Disposition"), "inline");
    EXPECT_EQ(sink.header("Content-Type"), "video/x-matroska");
}

TEST_F(StreamingRelayTest, InlineUnknownTypeFallsBackToPlayableType) {
    state->addObject(9, 10, std::string("blob.bin"));
    RecordingSink inlineSink;
    get(9, inlineSink, std::nullopt, DeliveryMode::Inline);
    EXPECT_EQ(inlineSink.header("Content-Type"), "video/mp4");

    RecordingSink downloadSink;
    get(9, downloadSink, std::nullopt, DeliveryMode::Attachment);
    EXPECT_EQ(downloadSink.header("Content-Type"), "application/octet-stream");
}

TEST_F(StreamingRelayTest, MissingFilenameUsesGeneratedName) {
    state->addObject(10, 10, std::nullopt, std::string("application/pdf"));
    RecordingSink sink;
    get(10, sink);

    EXPECT_EQ(sink.header("Content-Disposition"), "attachment; filename=\"file_10\"");
    EXPECT_EQ(sink.header("Content-Type"), "application/pdf");
}

TEST_F(StreamingRelayTest, OversizedChunksAreTruncatedToRange) {
    state->extraBytesPerChunk = 100;
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink, std::string("bytes=0-99999"));

    EXPECT_TRUE(outcome.completed);
    EXPECT_EQ(sink.body.size(), 100000u);
    EXPECT_EQ(outcome.bytesSent, 100000u);
}

// ═══════════════════════════════════════════════════════════
// HEAD и пустые объекты
// ═══════════════════════════════════════════════════════════

TEST_F(StreamingRelayTest, HeadSendsHeadersWithoutStreaming) {
    RelayRequest request;
    request.token = codec.encode(MOVIE_ID);
    request.rangeHeader = std::string("bytes=100-199");
    request.headOnly = true;

    RecordingSink sink;
    RelayOutcome outcome = relay->handle(request, sink);

    EXPECT_EQ(outcome.status, 206);
    EXPECT_TRUE(outcome.completed);
    EXPECT_EQ(sink.header("Content-Length"), "100");
    EXPECT_EQ(sink.header("Content-Range"), "bytes 100-199/5000000");
    EXPECT_TRUE(sink.body.empty());
    EXPECT_EQ(state->openCalls.load(), 0);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, EmptyObjectWithoutRange) {
    state->addObject(11, 0, std::string("empty.txt"));
    RecordingSink sink;
    RelayOutcome outcome = get(11, sink);

    EXPECT_EQ(outcome.status, 200);
    EXPECT_TRUE(outcome.completed);
    EXPECT_EQ(sink.header("Content-Length"), "0");
    EXPECT_TRUE(sink.body.empty());
    EXPECT_EQ(state->openCalls.load(), 0);
}

TEST_F(StreamingRelayTest, EmptyObjectWithRangeIsUnsatisfiable) {
    state->addObject(11, 0, std::string("empty.txt"));
    RecordingSink sink;
    get(11, sink, std::string("bytes=0-"));

    EXPECT_EQ(sink.status(), 416);
    EXPECT_EQ(sink.header("Content-Range"), "bytes */0");
}

// ═══════════════════════════════════════════════════════════
// Ошибки до заголовков
// ═══════════════════════════════════════════════════════════

TEST_F(StreamingRelayTest, InvalidTokenIs400WithoutContactingStore) {
    RelayRequest request;
    request.token = "xyz";
    RecordingSink sink;
    RelayOutcome outcome = relay->handle(request, sink);

    EXPECT_EQ(outcome.status, 400);
    EXPECT_EQ(sink.header("Content-Type"), "application/json");
    EXPECT_EQ(sink.json()["error"], "Invalid ID");
    EXPECT_EQ(state->totalConnects(), 0);
}

TEST_F(StreamingRelayTest, MissingObjectIs404) {
    RecordingSink sink;
    RelayOutcome outcome = get(999, sink);

    EXPECT_EQ(outcome.status, 404);
    auto body = sink.json();
    EXPECT_EQ(body["error"], "Message Not Found");
    EXPECT_TRUE(body.contains("hint"));
    EXPECT_EQ(state->metadataCalls.load(), 1);
    EXPECT_EQ(state->openCalls.load(), 0);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, MessageWithoutDocumentIs404) {
    state->addMessageWithoutDocument(12);
    RecordingSink sink;
    get(12, sink);

    EXPECT_EQ(sink.status(), 404);
    EXPECT_EQ(sink.json()["error"], "Not a Document");
    EXPECT_EQ(state->openCalls.load(), 0);
}

TEST_F(StreamingRelayTest, RangeBeyondObjectIs416) {
    state->addObject(13, 1000, std::string("a.bin"));
    RecordingSink sink;
    RelayOutcome outcome = get(13, sink, std::string("bytes=1000-1005"));

    EXPECT_EQ(outcome.status, 416);
    EXPECT_EQ(sink.header("Content-Range"), "bytes */1000");
    EXPECT_EQ(sink.json()["error"], "Range Not Satisfiable");
    EXPECT_EQ(state->openCalls.load(), 0);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, ActiveCooldownIs503WithoutContactingStore) {
    sessions->noteRateLimited(30);
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink);

    EXPECT_EQ(outcome.status, 503);
    EXPECT_EQ(sink.header("Retry-After"), "30");
    auto body = sink.json();
    EXPECT_EQ(body["error"], "Rate Limited");
    EXPECT_EQ(body["retry_after"], 30);
    EXPECT_EQ(state->totalConnects(), 0);
    EXPECT_EQ(state->metadataCalls.load(), 0);
}

TEST_F(StreamingRelayTest, RateLimitOnConnectIs503AndOpensCooldown) {
    state->connectRateLimit = 12;
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 503);
    EXPECT_EQ(sink.header("Retry-After"), "12");
    EXPECT_EQ(cooldown->remainingSeconds(), 12);

    // Второй запрос не доходит до хранилища
    RecordingSink second;
    get(MOVIE_ID, second);
    EXPECT_EQ(second.status(), 503);
    EXPECT_EQ(state->totalConnects(), 1);
}

TEST_F(StreamingRelayTest, RateLimitOnMetadataIs503AndOpensCooldown) {
    state->metadataRateLimit = 20;
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 503);
    EXPECT_EQ(sink.header("Retry-After"), "20");
    EXPECT_EQ(cooldown->remainingSeconds(), 20);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, ZeroRetryAfterAdvertisesOneSecond) {
    state->metadataRateLimit = 0;
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 503);
    EXPECT_EQ(sink.header("Retry-After"), "1");
}

TEST_F(StreamingRelayTest, MissingCredentialsIsConfigurationError) {
    useSessions(SessionMode::Stateless, "", "");
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 500);
    auto body = sink.json();
    EXPECT_EQ(body["error"], "Configuration Error");
    EXPECT_TRUE(body.contains("hint"));
}

TEST_F(StreamingRelayTest, ConnectTimeoutIs503) {
    state->connectTimeout = true;
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 503);
    EXPECT_EQ(sink.json()["error"], "Service Unavailable");
    EXPECT_FALSE(cooldown->isActive());
}

TEST_F(StreamingRelayTest, MetadataFailureIs500) {
    state->metadataFails = true;
    RecordingSink sink;
    get(MOVIE_ID, sink);

    EXPECT_EQ(sink.status(), 500);
    EXPECT_EQ(sink.json()["error"], "Internal Server Error");
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, StreamOpenFailureIs500) {
    state->openFails = true;
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink, std::string("bytes=0-99"));

    EXPECT_EQ(outcome.status, 500);
    EXPECT_EQ(state->streamsClosed.load(), 0);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, StreamOpenRateLimitIs503) {
    state->openRateLimit = 45;
    RecordingSink sink;
    get(MOVIE_ID, sink, std::string("bytes=0-99"));

    EXPECT_EQ(sink.status(), 503);
    EXPECT_EQ(sink.header("Retry-After"), "45");
    EXPECT_EQ(cooldown->remainingSeconds(), 45);
}

// ═══════════════════════════════════════════════════════════
// Обрывы после заголовков
// ═══════════════════════════════════════════════════════════

TEST_F(StreamingRelayTest, ClientDisconnectStopsStreaming) {
    RecordingSink sink;
    sink.disconnectAfterBytes = 100000;
    RelayOutcome outcome = get(MOVIE_ID, sink);

    EXPECT_TRUE(outcome.clientDisconnected);
    EXPECT_FALSE(outcome.completed);
    EXPECT_FALSE(outcome.streamFailed);
    EXPECT_EQ(outcome.bytesSent, CHUNK);
    EXPECT_EQ(sink.bodyCalls, 2);
    EXPECT_FALSE(sink.aborted);

    EXPECT_EQ(state->streamsClosed.load(), 1);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, ClientGoneBeforeHeadersClosesStream) {
    RecordingSink sink;
    sink.rejectHead = true;
    RelayOutcome outcome = get(MOVIE_ID, sink, std::string("bytes=0-99"));

    EXPECT_TRUE(outcome.clientDisconnected);
    EXPECT_EQ(sink.bodyCalls, 0);
    EXPECT_EQ(state->streamsClosed.load(), 1);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, MidStreamFailureAbortsResponse) {
    state->failAfterBytes = 200000;
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink);

    EXPECT_EQ(outcome.status, 200);
    EXPECT_TRUE(outcome.streamFailed);
    EXPECT_FALSE(outcome.completed);
    EXPECT_TRUE(sink.aborted);
    EXPECT_EQ(outcome.bytesSent, 4 * CHUNK);
    EXPECT_TRUE(sink.body == patternBytes(0, 4 * CHUNK));

    EXPECT_EQ(state->streamsClosed.load(), 1);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(StreamingRelayTest, ShortStreamAbortsResponse) {
    state->endAfterBytes = 100000;
    RecordingSink sink;
    RelayOutcome outcome = get(MOVIE_ID, sink);

    EXPECT_TRUE(outcome.streamFailed);
    EXPECT_TRUE(sink.aborted);
    EXPECT_LT(outcome.bytesSent, MOVIE_SIZE);
}

TEST_F(StreamingRelayTest, PooledSessionSurvivesClientDisconnect) {
    useSessions(SessionMode::Pooled, "session-ok", "");

    RecordingSink first;
    first.disconnectAfterBytes = 10;
    get(MOVIE_ID, first);

    RecordingSink second;
    get(MOVIE_ID, second, std::string("bytes=0-9"));

    EXPECT_EQ(second.status(), 206);
    EXPECT_EQ(state->resumeCalls.load(), 1);
    EXPECT_EQ(sessions->stats().reuses, 1u);
}

TEST_F(StreamingRelayTest, PooledConcurrentRangesAreIndependent) {
    useSessions(SessionMode::Pooled, "session-ok", "");

    constexpr int THREADS = 16;
    std::vector<std::thread> threads;
    std::vector<int> ok(THREADS, 0);
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            uint64_t start = static_cast<uint64_t>(i) * 200000;
            RecordingSink sink;
            get(MOVIE_ID, sink, "bytes=" + std::to_string(start) + "-" + std::to_string(start + 99999));
            ok[i] = sink.status() == 206 && sink.body == patternBytes(start, 100000) ? 1 : 0;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < THREADS; ++i) {
        EXPECT_EQ(ok[i], 1) << "range " << i;
    }
    EXPECT_EQ(state->resumeCalls.load(), 1);
    EXPECT_EQ(sessions->stats().releases, static_cast<uint64_t>(THREADS));
}

// ═══════════════════════════════════════════════════════════
// Утилиты
// ═══════════════════════════════════════════════════════════

TEST(StreamingRelayUtilTest, SanitizeFilename) {
    EXPECT_EQ(StreamingRelay::sanitizeFilename(std::string("movie.mkv"), 1), "movie.mkv");
    EXPECT_EQ(StreamingRelay::sanitizeFilename(std::string("a\"b\\c.txt"), 1), "abc.txt");
    EXPECT_EQ(StreamingRelay::sanitizeFilename(std::string("x\r\ny.txt"), 1), "xy.txt");
    EXPECT_EQ(StreamingRelay::sanitizeFilename(std::nullopt, 77), "file_77");
    EXPECT_EQ(StreamingRelay::sanitizeFilename(std::string("\"\""), 5), "file_5");
}

TEST(StreamingRelayUtilTest, ZeroChunkSizeRejected) {
    auto state = std::make_shared<MockStoreState>();
    SessionManager sessions(std::make_shared<MockConnector>(state), SessionManagerOptions{});
    EXPECT_THROW({ StreamingRelay relay(sessions, IdentifierCodec(), RelayOptions{0}); },
                 std::invalid_argument);
}
