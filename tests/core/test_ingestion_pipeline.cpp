// test_ingestion_pipeline.cpp — тесты IngestionPipeline

#include <gtest/gtest.h>
#include "MockRemoteStore.h"
#include "streamvault/Errors.h"
#include "streamvault/Ingestion/IngestionPipeline.h"
#include "streamvault/Remote/ChannelArchiveStore.h"
#include "streamvault/Remote/SessionManager.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace StreamVault;
using namespace StreamVault::Testing;

class IngestionPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<MockStoreState> state = std::make_shared<MockStoreState>();
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    IdentifierCodec codec;
    std::unique_ptr<SessionManager> sessions;

    void SetUp() override {
        SessionManagerOptions options;
        options.mode = SessionMode::Pooled;
        options.sessionToken = "session-ok";
        sessions = std::make_unique<SessionManager>(std::make_shared<MockConnector>(state), options,
                                                    std::make_shared<CooldownWindow>(clock));
    }

    static InboundObjectRef ref(std::optional<std::string> filename,
                                std::optional<std::string> mimeHint = std::nullopt) {
        InboundObjectRef r;
        r.sourceChatId = -1001;
        r.sourceMessageId = 77;
        r.filename = std::move(filename);
        r.mimeHint = std::move(mimeHint);
        return r;
    }
};

TEST_F(IngestionPipelineTest, VideoGetsStreamAndDownloadLinks) {
    IngestionPipeline pipeline(*sessions, codec, "https://relay.example");

    auto result = pipeline.relayInboundObject(ref(std::string("movie.mkv")));

    EXPECT_EQ(result.objectId, 5000u);
    EXPECT_EQ(result.token, codec.encode(5000));
    EXPECT_EQ(result.downloadUrl, "https://relay.example/download/" + result.token);
    ASSERT_TRUE(result.streamUrl.has_value());
    EXPECT_EQ(*result.streamUrl, "https://relay.example/stream/" + result.token);

    ASSERT_EQ(state->relayed.size(), 1u);
    EXPECT_EQ(state->relayed[0].sourceMessageId.value_or(0), 77);
}

TEST_F(IngestionPipelineTest, DocumentGetsDownloadLinkOnly) {
    IngestionPipeline pipeline(*sessions, codec, "https://relay.example");

    auto result = pipeline.relayInboundObject(ref(std::string("notes.pdf"), std::string("application/pdf")));

    EXPECT_FALSE(result.streamUrl.has_value());
    EXPECT_EQ(result.downloadUrl, "https://relay.example/download/" + codec.encode(5000));
}

TEST_F(IngestionPipelineTest, VideoDetectedByMimeOrFlag) {
    IngestionPipeline pipeline(*sessions, codec, "https://relay.example");

    auto byMime = pipeline.relayInboundObject(ref(std::nullopt, std::string("video/quicktime")));
    EXPECT_TRUE(byMime.streamUrl.has_value());

    auto flagged = ref(std::string("clip.bin"));
    flagged.isVideo = true;
    EXPECT_TRUE(pipeline.relayInboundObject(flagged).streamUrl.has_value());

    auto unnamed = pipeline.relayInboundObject(ref(std::nullopt));
    EXPECT_FALSE(unnamed.streamUrl.has_value());
}

TEST_F(IngestionPipelineTest, TrailingSlashTrimmedFromBaseUrl) {
    IngestionPipeline pipeline(*sessions, codec, "https://relay.example//");
    EXPECT_EQ(pipeline.baseUrl(), "https://relay.example");

    auto links = pipeline.linksFor(42, false);
    EXPECT_EQ(links.downloadUrl, "https://relay.example/download/2c441359");
}

TEST_F(IngestionPipelineTest, LinksForKnownObject) {
    IngestionPipeline pipeline(*sessions, codec, "http://localhost:9090");

    auto links = pipeline.linksFor(42, true);
    EXPECT_EQ(links.objectId, 42u);
    EXPECT_EQ(links.token, "2c441359");
    EXPECT_EQ(links.streamUrl.value_or(""), "http://localhost:9090/stream/2c441359");
    EXPECT_EQ(state->totalConnects(), 0);
}

TEST_F(IngestionPipelineTest, LinksUseConfiguredSecret) {
    IdentifierCodec custom(12345);
    IngestionPipeline pipeline(*sessions, custom, "http://x");

    auto links = pipeline.linksFor(42, false);
    EXPECT_EQ(custom.decode(links.token), 42u);
    EXPECT_NE(links.token, codec.encode(42));
}

TEST_F(IngestionPipelineTest, RateLimitOpensCooldown) {
    IngestionPipeline pipeline(*sessions, codec, "http://x");
    state->relayRateLimit = 40;

    EXPECT_THROW(pipeline.relayInboundObject(ref(std::string("a.mp4"))), RateLimitedException);
    EXPECT_EQ(sessions->cooldown().remainingSeconds(), 40);

    // Пока окно активно — без обращения к хранилищу
    state->relayRateLimit.reset();
    EXPECT_THROW(pipeline.relayInboundObject(ref(std::string("a.mp4"))), RateLimitedException);
    EXPECT_EQ(state->relayCalls.load(), 1);

    clock->advance(41);
    EXPECT_NO_THROW(pipeline.relayInboundObject(ref(std::string("a.mp4"))));
    EXPECT_EQ(state->relayCalls.load(), 2);
}

TEST_F(IngestionPipelineTest, StoreFailureDiscardsSession) {
    IngestionPipeline pipeline(*sessions, codec, "http://x");
    state->relayFails = true;

    EXPECT_THROW(pipeline.relayInboundObject(ref(std::string("a.mp4"))), RemoteStoreException);
    EXPECT_EQ(state->disconnects.load(), 1);

    state->relayFails = false;
    EXPECT_NO_THROW(pipeline.relayInboundObject(ref(std::string("a.mp4"))));
    EXPECT_EQ(state->totalConnects(), 2);
}

TEST_F(IngestionPipelineTest, MetadataFailureStillReturnsLinks) {
    IngestionPipeline pipeline(*sessions, codec, "http://x");
    state->metadataFails = true;

    auto result = pipeline.relayInboundObject(ref(std::string("archive.zip")));
    EXPECT_FALSE(result.streamUrl.has_value());
    EXPECT_EQ(result.downloadUrl, "http://x/download/" + codec.encode(5000));
}

TEST(IngestionArchiveTest, ChannelDetectsVideoByContent) {
    fs::path dir = fs::temp_directory_path() /
                   ("sv_ingest_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);

    {
        // Контейнер MP4: "ftyp" по смещению 4, расширения нет
        std::ofstream file(dir / "upload", std::ios::binary);
        const char header[] = {0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm', 0, 0, 0, 0};
        file.write(header, sizeof(header));
    }

    {
        auto archive = std::make_shared<ChannelArchiveStore>((dir / "archive.db").string());
        SessionManagerOptions options;
        options.botToken = "bot";
        SessionManager sessions(archive, options);
        IdentifierCodec codec;
        IngestionPipeline pipeline(sessions, codec, "https://relay.example/");

        InboundObjectRef inbound;
        inbound.localPath = (dir / "upload").string();
        auto result = pipeline.relayInboundObject(inbound);

        EXPECT_EQ(result.objectId, 1u);
        EXPECT_TRUE(result.streamUrl.has_value());
        EXPECT_EQ(archive->getMessage(1)->mimeType.value_or(""), "video/mp4");
    }

    fs::remove_all(dir);
}
