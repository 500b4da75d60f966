// HttpServer.h — HTTP/1.1 сервер: поток accept + пул рабочих потоков
// Одно соединение = один запрос (Connection: close)

#pragma once

#include "../export.h"
#include "HttpMessage.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace StreamVault {

struct HttpServerOptions {
    std::string bindAddress = "0.0.0.0";
    size_t workerThreads = 64;          // Одновременно обслуживаемых запросов
    size_t maxPendingConnections = 1024; // Очередь сверх этого получает 503
    int ioTimeoutMs = 30000;            // SO_RCVTIMEO / SO_SNDTIMEO клиентских сокетов
    int overloadSendTimeoutMs = 250;    // Лимит записи 503 из потока accept
};

class SV_API HttpServer {
public:
    /// Обработчик запроса; вызывается в рабочем потоке
    using Handler = std::function<void(const HttpRequest&, ResponseSink&)>;

    explicit HttpServer(HttpServerOptions options = {});
    ~HttpServer();

    // Запрет копирования
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Запустить сервер
    /// @param port Порт (0 — выбрать свободный)
    /// @return true если успешно
    bool start(uint16_t port, Handler handler);

    /// Остановить сервер: закрыть listen-сокет, оборвать активные соединения, дождаться потоков
    void stop();

    bool isRunning() const;

    /// Фактический порт (после start)
    uint16_t getPort() const;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace StreamVault
