// test_http_server.cpp — интеграционные тесты HttpServer через loopback

#include <gtest/gtest.h>
#include "MockRemoteStore.h"
#include "streamvault/Http/HttpServer.h"
#include "streamvault/Http/Router.h"
#include "streamvault/Relay/StreamingRelay.h"
#include "streamvault/Remote/SessionManager.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace StreamVault;
using namespace StreamVault::Testing;

namespace {

struct ClientResponse {
    int status = 0;
    std::string head;
    std::string body;
    bool complete = false;  // Соединение закрыто сервером штатно
};

int connectLoopback(uint16_t port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return -1;

    struct timeval tv{};
    tv.tv_sec = 10;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(sock);
        return -1;
    }
    return sock;
}

bool sendAll(int sock, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

ClientResponse roundTrip(uint16_t port, const std::string& rawRequest) {
    ClientResponse response;
    int sock = connectLoopback(port);
    if (sock < 0) return response;

    if (!sendAll(sock, rawRequest)) {
        close(sock);
        return response;
    }

    std::string data;
    char buffer[16384];
    while (true) {
        auto n = recv(sock, buffer, sizeof(buffer), 0);
        if (n < 0) break;
        if (n == 0) {
            response.complete = true;
            break;
        }
        data.append(buffer, static_cast<size_t>(n));
    }
    close(sock);

    size_t headEnd = data.find("\r\n\r\n");
    if (headEnd == std::string::npos) return response;
    response.head = data.substr(0, headEnd + 2);
    response.body = data.substr(headEnd + 4);
    if (data.rfind("HTTP/1.1 ", 0) == 0) {
        response.status = std::stoi(data.substr(9, 3));
    }
    return response;
}

std::string get(const std::string& target, const std::string& extra = "") {
    return "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\n" + extra + "\r\n";
}

bool headContains(const ClientResponse& response, const std::string& line) {
    return response.head.find(line + "\r\n") != std::string::npos;
}

std::string asString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ═══════════════════════════════════════════════════════════
// HttpServer с простым обработчиком
// ═══════════════════════════════════════════════════════════

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerOptions options;
    std::unique_ptr<HttpServer> server;

    void SetUp() override {
        options.bindAddress = "127.0.0.1";
        options.workerThreads = 4;
        options.ioTimeoutMs = 5000;
        server = std::make_unique<HttpServer>(options);
    }

    void TearDown() override {
        server->stop();
    }
};

TEST_F(HttpServerTest, StartsOnEphemeralPort) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink& sink) {
        sendJson(sink, 200, {{"status", "ok"}});
    }));
    EXPECT_TRUE(server->isRunning());
    EXPECT_GT(server->getPort(), 0);
}

TEST_F(HttpServerTest, ServesHandlerResponse) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest& request, ResponseSink& sink) {
        sendJson(sink, 200, {{"path", request.path}});
    }));

    auto response = roundTrip(server->getPort(), get("/hello?x=1"));
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.complete);
    EXPECT_TRUE(headContains(response, "Connection: close"));
    EXPECT_TRUE(headContains(response, "Content-Type: application/json"));
    EXPECT_EQ(nlohmann::json::parse(response.body)["path"], "/hello");
}

TEST_F(HttpServerTest, MalformedRequestIs400) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink& sink) {
        sendJson(sink, 200, {{"status", "ok"}});
    }));

    auto response = roundTrip(server->getPort(), "NONSENSE\r\n\r\n");
    EXPECT_EQ(response.status, 400);
}

TEST_F(HttpServerTest, HandlerExceptionBeforeHeadIs500) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink&) {
        throw std::runtime_error("boom");
    }));

    auto response = roundTrip(server->getPort(), get("/"));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "Internal Server Error");
}

TEST_F(HttpServerTest, AbortResetsConnection) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink& sink) {
        HttpResponseHead head;
        head.set("Content-Length", "1000");
        sink.sendHead(head);
        const uint8_t partial[10] = {};
        sink.sendBody(partial, sizeof(partial));
        sink.abort();
    }));

    auto response = roundTrip(server->getPort(), get("/"));
    EXPECT_FALSE(response.complete);
    EXPECT_LT(response.body.size(), 1000u);
}

TEST_F(HttpServerTest, SecondStartFails) {
    auto handler = [](const HttpRequest&, ResponseSink& sink) { sendJson(sink, 200, {{"a", 1}}); };
    ASSERT_TRUE(server->start(0, handler));
    EXPECT_FALSE(server->start(0, handler));
    EXPECT_FALSE(server->getLastError().empty());
}

TEST_F(HttpServerTest, InvalidBindAddressFails) {
    HttpServerOptions bad = options;
    bad.bindAddress = "not-an-address";
    HttpServer other(bad);
    EXPECT_FALSE(other.start(0, [](const HttpRequest&, ResponseSink&) {}));
    EXPECT_FALSE(other.getLastError().empty());
}

TEST_F(HttpServerTest, FullQueueAnswers503WithoutStallingAccept) {
    options.maxPendingConnections = 0;
    options.overloadSendTimeoutMs = 100;
    server = std::make_unique<HttpServer>(options);
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink& sink) {
        sendJson(sink, 200, {{"a", 1}});
    }));

    // Клиенты, которые ничего не читают
    std::vector<int> idle;
    for (int i = 0; i < 10; ++i) {
        int sock = connectLoopback(server->getPort());
        ASSERT_GE(sock, 0);
        idle.push_back(sock);
    }

    auto started = std::chrono::steady_clock::now();
    auto response = roundTrip(server->getPort(), get("/"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(response.status, 503);
    EXPECT_TRUE(headContains(response, "Retry-After: 1"));
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "Service Unavailable");
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    for (int sock : idle) close(sock);
}

TEST_F(HttpServerTest, StopIsIdempotent) {
    ASSERT_TRUE(server->start(0, [](const HttpRequest&, ResponseSink& sink) {
        sendJson(sink, 200, {{"a", 1}});
    }));
    server->stop();
    EXPECT_FALSE(server->isRunning());
    server->stop();
}

// ═══════════════════════════════════════════════════════════
// Полный стек: HttpServer -> Router -> StreamingRelay -> SessionManager
// ═══════════════════════════════════════════════════════════

class RelayServerTest : public ::testing::Test {
protected:
    static constexpr ObjectId OBJECT_ID = 42;
    static constexpr uint64_t OBJECT_SIZE = 5000000;

    std::shared_ptr<MockStoreState> state = std::make_shared<MockStoreState>();
    IdentifierCodec codec;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<StreamingRelay> relay;
    std::unique_ptr<Router> router;
    std::unique_ptr<HttpServer> server;

    void SetUp() override {
        state->addObject(OBJECT_ID, OBJECT_SIZE, std::string("movie.mp4"));
        state->addObject(7, 64 * 1024 * 1024, std::string("big.mkv"));
        startStack(SessionMode::Pooled, true);
    }

    void TearDown() override {
        server->stop();
    }

    /// Поднять стек заново с другим режимом сессий
    void startStack(SessionMode mode, bool threadSafeTransport) {
        if (server) {
            server->stop();
        }
        server.reset();
        router.reset();
        relay.reset();
        sessions.reset();

        SessionManagerOptions sessionOptions;
        sessionOptions.mode = mode;
        sessionOptions.sessionToken = "session-ok";
        sessions = std::make_unique<SessionManager>(
            std::make_shared<MockConnector>(state, threadSafeTransport), sessionOptions);
        relay = std::make_unique<StreamingRelay>(*sessions, codec, RelayOptions{64 * 1024});
        router = std::make_unique<Router>(*relay, *sessions);

        HttpServerOptions options;
        options.bindAddress = "127.0.0.1";
        options.workerThreads = 16;
        options.ioTimeoutMs = 5000;
        server = std::make_unique<HttpServer>(options);
        ASSERT_TRUE(server->start(0, [this](const HttpRequest& request, ResponseSink& sink) {
            router->handle(request, sink);
        }));
    }

    /// 50 клиентов одновременно качают 50 разных объектов целиком
    void fetchDistinctObjectsConcurrently() {
        constexpr int CLIENTS = 50;
        constexpr ObjectId FIRST_ID = 100;
        for (int i = 0; i < CLIENTS; ++i) {
            state->addObject(FIRST_ID + i, 20000 + static_cast<uint64_t>(i) * 7919,
                             "file" + std::to_string(i) + ".bin");
        }

        std::vector<std::thread> clients;
        std::vector<int> ok(CLIENTS, 0);
        for (int i = 0; i < CLIENTS; ++i) {
            clients.emplace_back([&, i] {
                uint64_t size = 20000 + static_cast<uint64_t>(i) * 7919;
                auto response = roundTrip(server->getPort(),
                                          get("/download/" + codec.encode(FIRST_ID + i)));
                ok[i] = response.status == 200 && response.complete &&
                                headContains(response, "Content-Length: " + std::to_string(size)) &&
                                response.body.size() == size &&
                                response.body == asString(patternBytes(0, size))
                            ? 1
                            : 0;
            });
        }
        for (auto& c : clients) c.join();

        for (int i = 0; i < CLIENTS; ++i) {
            EXPECT_EQ(ok[i], 1) << "client " << i;
        }
        EXPECT_TRUE(waitForReleases(CLIENTS));
        EXPECT_EQ(state->openCalls.load(), CLIENTS);
        EXPECT_EQ(state->streamsClosed.load(), CLIENTS);
    }

    bool waitForReleases(uint64_t expected) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline) {
            if (sessions->stats().releases >= expected) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

TEST_F(RelayServerTest, PartialContentOverSocket) {
    auto response = roundTrip(server->getPort(),
                              get("/download/" + codec.encode(OBJECT_ID), "Range: bytes=1000000-1999999\r\n"));

    EXPECT_EQ(response.status, 206);
    EXPECT_TRUE(headContains(response, "Content-Length: 1000000"));
    EXPECT_TRUE(headContains(response, "Content-Range: bytes 1000000-1999999/5000000"));
    EXPECT_TRUE(headContains(response, "Accept-Ranges: bytes"));
    EXPECT_TRUE(headContains(response, "Connection: close"));
    ASSERT_EQ(response.body.size(), 1000000u);
    EXPECT_TRUE(response.body == asString(patternBytes(1000000, 1000000)));
}

TEST_F(RelayServerTest, HeadOverSocketHasNoBody) {
    auto response = roundTrip(server->getPort(),
                              "HEAD /stream/" + codec.encode(OBJECT_ID) + " HTTP/1.1\r\nHost: a\r\n\r\n");

    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(headContains(response, "Content-Length: 5000000"));
    EXPECT_TRUE(response.body.empty());
}

TEST_F(RelayServerTest, ErrorsOverSocket) {
    EXPECT_EQ(roundTrip(server->getPort(), get("/stream/zzz")).status, 400);
    EXPECT_EQ(roundTrip(server->getPort(), get("/stream/" + codec.encode(999))).status, 404);
    EXPECT_EQ(roundTrip(server->getPort(),
                        get("/stream/" + codec.encode(OBJECT_ID), "Range: bytes=5000000-\r\n")).status, 416);

    sessions->noteRateLimited(30);
    auto limited = roundTrip(server->getPort(), get("/stream/" + codec.encode(OBJECT_ID)));
    EXPECT_EQ(limited.status, 503);
    EXPECT_TRUE(headContains(limited, "Retry-After: 30"));
}

TEST_F(RelayServerTest, ConcurrentClientsReceiveExactBytes) {
    constexpr int CLIENTS = 50;
    constexpr uint64_t LENGTH = 100000;

    std::vector<std::thread> clients;
    std::vector<int> ok(CLIENTS, 0);
    for (int i = 0; i < CLIENTS; ++i) {
        clients.emplace_back([&, i] {
            uint64_t start = static_cast<uint64_t>(i) * 90000;
            std::string range = "Range: bytes=" + std::to_string(start) + "-" +
                                std::to_string(start + LENGTH - 1) + "\r\n";
            auto response = roundTrip(server->getPort(),
                                      get("/stream/" + codec.encode(OBJECT_ID), range));
            ok[i] = response.status == 206 && response.body == asString(patternBytes(start, LENGTH)) ? 1 : 0;
        });
    }
    for (auto& c : clients) c.join();

    for (int i = 0; i < CLIENTS; ++i) {
        EXPECT_EQ(ok[i], 1) << "client " << i;
    }
    EXPECT_TRUE(waitForReleases(CLIENTS));
    EXPECT_EQ(state->resumeCalls.load(), 1);
    EXPECT_EQ(state->openCalls.load(), CLIENTS);
    EXPECT_EQ(state->streamsClosed.load(), CLIENTS);
}

TEST_F(RelayServerTest, ConcurrentFullDownloadsStateless) {
    startStack(SessionMode::Stateless, true);
    fetchDistinctObjectsConcurrently();

    // Своя сессия на каждый запрос, каждая закрыта
    EXPECT_EQ(state->resumeCalls.load(), 50);
    EXPECT_EQ(state->disconnects.load(), 50);
}

TEST_F(RelayServerTest, ConcurrentFullDownloadsPooledSerializedTransport) {
    startStack(SessionMode::Pooled, false);
    fetchDistinctObjectsConcurrently();

    EXPECT_EQ(state->resumeCalls.load(), 1);
    EXPECT_EQ(state->disconnects.load(), 0);
}

TEST_F(RelayServerTest, ClientDisconnectReleasesSession) {
    int sock = connectLoopback(server->getPort());
    ASSERT_GE(sock, 0);
    ASSERT_TRUE(sendAll(sock, get("/download/" + codec.encode(7))));

    // Прочитать только начало ответа и уйти
    char buffer[4096];
    ASSERT_GT(recv(sock, buffer, sizeof(buffer), 0), 0);
    close(sock);

    EXPECT_TRUE(waitForReleases(1));
    EXPECT_EQ(state->streamsClosed.load(), 1);
    EXPECT_EQ(sessions->stats().releases, 1u);
}

TEST_F(RelayServerTest, HealthOverSocket) {
    auto response = roundTrip(server->getPort(), get("/health"));
    EXPECT_EQ(response.status, 200);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["session_mode"], "pooled");
}
