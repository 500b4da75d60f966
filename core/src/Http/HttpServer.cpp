// HttpServer.cpp — HTTP/1.1 сервер на BSD-сокетах

#include "streamvault/Http/HttpServer.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <thread>
#include <vector>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define SHUTDOWN_BOTH SD_BOTH
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET close
    #define SOCKET_ERROR_CODE errno
    #define SHUTDOWN_BOTH SHUT_RDWR
#endif

#ifdef MSG_NOSIGNAL
    #define SEND_FLAGS MSG_NOSIGNAL
#else
    #define SEND_FLAGS 0
#endif

namespace StreamVault {

namespace {

void setSocketTimeouts(socket_t sock, int timeoutMs) {
#ifdef _WIN32
    DWORD timeout = static_cast<DWORD>(timeoutMs);
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}

// ═══════════════════════════════════════════════════════════
// SocketResponseSink — ответ прямо в клиентский сокет
// ═══════════════════════════════════════════════════════════

class SocketResponseSink : public ResponseSink {
public:
    explicit SocketResponseSink(socket_t sock) : m_sock(sock) {}

    bool sendHead(const HttpResponseHead& head) override {
        if (m_headSent) {
            spdlog::warn("HttpServer: Response head already sent");
            return !m_broken;
        }
        HttpResponseHead full = head;
        full.set("Connection", "close");
        std::string data = full.serialize();
        m_headSent = true;
        return sendAll(data.data(), data.size());
    }

    bool sendBody(const uint8_t* data, size_t size) override {
        if (!m_headSent) {
            spdlog::error("HttpServer: Body before response head");
            return false;
        }
        return sendAll(reinterpret_cast<const char*>(data), size);
    }

    void abort() override {
        if (m_aborted) return;
        m_aborted = true;
        m_broken = true;
        // close() отправит RST вместо FIN: клиент не примет обрезанное тело за целое
        struct linger lg;
        lg.l_onoff = 1;
        lg.l_linger = 0;
        setsockopt(m_sock, SOL_SOCKET, SO_LINGER, reinterpret_cast<const char*>(&lg), sizeof(lg));
    }

    bool headSent() const { return m_headSent; }

private:
    socket_t m_sock;
    bool m_headSent = false;
    bool m_broken = false;
    bool m_aborted = false;

    bool sendAll(const char* data, size_t size) {
        if (m_broken) return false;

        size_t sent = 0;
        while (sent < size) {
            auto n = send(m_sock, data + sent, static_cast<int>(size - sent), SEND_FLAGS);
            if (n <= 0) {
#ifndef _WIN32
                if (n < 0 && errno == EINTR) continue;
#endif
                // EPIPE / ECONNRESET / таймаут отправки — клиент недоступен
                spdlog::debug("HttpServer: send() failed: {}", SOCKET_ERROR_CODE);
                m_broken = true;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════
// HttpServer::Impl
// ═══════════════════════════════════════════════════════════

class HttpServer::Impl {
public:
    explicit Impl(HttpServerOptions options) : m_options(std::move(options)) {
#ifdef _WIN32
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            spdlog::error("HttpServer: WSAStartup failed");
        }
#endif
    }

    ~Impl() {
        stop();
#ifdef _WIN32
        WSACleanup();
#endif
    }

    bool start(uint16_t port, HttpServer::Handler handler) {
        if (m_running) {
            m_lastError = "Server already running";
            return false;
        }
        if (!handler) {
            m_lastError = "Request handler is required";
            return false;
        }
        if (m_options.workerThreads == 0) {
            m_lastError = "At least one worker thread is required";
            return false;
        }

        m_handler = std::move(handler);

        m_serverSocket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_serverSocket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket";
            spdlog::error("HttpServer: {}", m_lastError);
            return false;
        }

        int opt = 1;
        setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, m_options.bindAddress.c_str(), &addr.sin_addr) != 1) {
            m_lastError = "Invalid bind address: " + m_options.bindAddress;
            spdlog::error("HttpServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        if (bind(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            m_lastError = "Failed to bind port " + std::to_string(port) + ": " +
                          std::to_string(SOCKET_ERROR_CODE);
            spdlog::error("HttpServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        // Фактический порт (если port == 0)
        socklen_t addrLen = sizeof(addr);
        getsockname(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), &addrLen);
        m_port = ntohs(addr.sin_port);

        if (listen(m_serverSocket, SOMAXCONN) < 0) {
            m_lastError = "Failed to listen: " + std::to_string(SOCKET_ERROR_CODE);
            spdlog::error("HttpServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_workersRunning = true;
        }
        m_running = true;

        m_workers.reserve(m_options.workerThreads);
        for (size_t i = 0; i < m_options.workerThreads; ++i) {
            m_workers.emplace_back([this]() { workerLoop(); });
        }
        m_acceptThread = std::thread([this]() { acceptLoop(); });

        spdlog::info("HttpServer: Listening on {}:{} ({} workers)",
                     m_options.bindAddress, m_port, m_options.workerThreads);
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) return;

        // Разблокировать accept()
        if (m_serverSocket != SOCKET_INVALID) {
            shutdown(m_serverSocket, SHUTDOWN_BOTH);
        }
        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }
        closeServerSocket();

        // Оборвать активные ответы: send() вернёт ошибку, relay освободит сессию
        {
            std::lock_guard<std::mutex> lock(m_activeMutex);
            for (socket_t sock : m_active) {
                shutdown(sock, SHUTDOWN_BOTH);
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_workersRunning = false;
            while (!m_pending.empty()) {
                CLOSE_SOCKET(m_pending.front());
                m_pending.pop();
            }
        }
        m_queueCv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();

        spdlog::info("HttpServer: Stopped");
    }

    bool isRunning() const { return m_running; }
    uint16_t getPort() const { return m_port; }
    std::string getLastError() const { return m_lastError; }

private:
    HttpServerOptions m_options;
    HttpServer::Handler m_handler;

    socket_t m_serverSocket = SOCKET_INVALID;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
    std::string m_lastError;

    // Пул рабочих потоков
    std::vector<std::thread> m_workers;
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::queue<socket_t> m_pending;
    bool m_workersRunning = false;

    // Сокеты, которые сейчас обслуживаются
    std::mutex m_activeMutex;
    std::set<socket_t> m_active;

    void closeServerSocket() {
        if (m_serverSocket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_serverSocket);
            m_serverSocket = SOCKET_INVALID;
        }
    }

    void acceptLoop() {
        while (m_running) {
            sockaddr_in clientAddr{};
            socklen_t clientAddrLen = sizeof(clientAddr);

            socket_t clientSocket = accept(m_serverSocket,
                reinterpret_cast<sockaddr*>(&clientAddr), &clientAddrLen);

            if (clientSocket == SOCKET_INVALID) {
                if (m_running) {
                    spdlog::debug("HttpServer: accept() failed: {}", SOCKET_ERROR_CODE);
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                continue;
            }

            setSocketTimeouts(clientSocket, m_options.ioTimeoutMs);
            int nodelay = 1;
            setsockopt(clientSocket, IPPROTO_TCP, TCP_NODELAY,
                       reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));

            bool queued = false;
            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                if (m_pending.size() < m_options.maxPendingConnections) {
                    m_pending.push(clientSocket);
                    queued = true;
                }
            }

            if (queued) {
                m_queueCv.notify_one();
            } else {
                spdlog::warn("HttpServer: Connection queue full, rejecting client");
                // Медленный клиент не должен держать поток accept
                setSocketTimeouts(clientSocket, m_options.overloadSendTimeoutMs);
                SocketResponseSink sink(clientSocket);
                sendJson(sink, 503, errorBody("Service Unavailable", "Server is overloaded"),
                         {{"Retry-After", "1"}});
                CLOSE_SOCKET(clientSocket);
            }
        }
    }

    void workerLoop() {
        while (true) {
            socket_t clientSocket = SOCKET_INVALID;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_queueCv.wait(lock, [this]() {
                    return !m_pending.empty() || !m_workersRunning;
                });

                if (!m_workersRunning && m_pending.empty()) {
                    break;
                }

                if (m_pending.empty()) continue;

                clientSocket = m_pending.front();
                m_pending.pop();
            }

            {
                std::lock_guard<std::mutex> lock(m_activeMutex);
                m_active.insert(clientSocket);
            }

            handleClient(clientSocket);

            {
                std::lock_guard<std::mutex> lock(m_activeMutex);
                m_active.erase(clientSocket);
            }
            CLOSE_SOCKET(clientSocket);
        }
    }

    /// Прочитать заголовок запроса; nullopt при обрыве или таймауте
    std::optional<std::string> receiveHead(socket_t sock, bool& tooLarge) {
        std::string buffer;
        char chunk[4096];
        tooLarge = false;

        while (true) {
            auto n = recv(sock, chunk, sizeof(chunk), 0);
            if (n < 0) {
#ifndef _WIN32
                if (errno == EINTR) continue;
#endif
                return std::nullopt;
            }
            if (n == 0) {
                return std::nullopt;
            }
            buffer.append(chunk, static_cast<size_t>(n));

            if (findHeadEnd(buffer) != std::string::npos) {
                return buffer;
            }
            if (buffer.size() > MAX_REQUEST_HEAD_SIZE) {
                tooLarge = true;
                return std::nullopt;
            }
        }
    }

    void handleClient(socket_t clientSocket) {
        SocketResponseSink sink(clientSocket);

        bool tooLarge = false;
        auto raw = receiveHead(clientSocket, tooLarge);
        if (!raw) {
            if (tooLarge) {
                sendJson(sink, 431, errorBody("Request Header Fields Too Large",
                                              "Request head exceeds " +
                                              std::to_string(MAX_REQUEST_HEAD_SIZE) + " bytes"));
            }
            return;
        }

        auto request = HttpRequest::parse(*raw);
        if (!request) {
            spdlog::warn("HttpServer: Malformed request");
            sendJson(sink, 400, errorBody("Bad Request", "Malformed HTTP request"));
            return;
        }

        try {
            m_handler(*request, sink);
        } catch (const std::exception& e) {
            spdlog::error("HttpServer: Handler failed for {} {}: {}",
                          request->method, request->path, e.what());
            if (sink.headSent()) {
                sink.abort();
            } else {
                sendJson(sink, 500, errorBody("Internal Server Error", e.what()));
            }
        }
    }
};

// ═══════════════════════════════════════════════════════════
// HttpServer Public Interface
// ═══════════════════════════════════════════════════════════

HttpServer::HttpServer(HttpServerOptions options)
    : m_impl(std::make_unique<Impl>(std::move(options))) {}

HttpServer::~HttpServer() = default;

bool HttpServer::start(uint16_t port, Handler handler) {
    return m_impl->start(port, std::move(handler));
}

void HttpServer::stop() {
    m_impl->stop();
}

bool HttpServer::isRunning() const {
    return m_impl->isRunning();
}

uint16_t HttpServer::getPort() const {
    return m_impl->getPort();
}

std::string HttpServer::getLastError() const {
    return m_impl->getLastError();
}

} // namespace StreamVault
