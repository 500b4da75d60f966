#include "streamvault/Http/Router.h"
#include "streamvault/Relay/StreamingRelay.h"
#include "streamvault/Remote/SessionManager.h"
#include "streamvault/core.h"
#include <spdlog/spdlog.h>

namespace StreamVault {

namespace {

constexpr const char* STREAM_PREFIX = "/stream/";
constexpr const char* DOWNLOAD_PREFIX = "/download/";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool isReadMethod(const HttpRequest& request) {
    return request.method == "GET" || request.method == "HEAD";
}

void methodNotAllowed(const HttpRequest& request, ResponseSink& sink, const char* allow) {
    sendJson(sink, 405,
             errorBody("Method Not Allowed", request.method + " is not supported on " + request.path),
             {{"Allow", allow}});
}

} // namespace

Router::Router(StreamingRelay& relay, SessionManager& sessions)
    : m_relay(relay), m_sessions(sessions) {}

nlohmann::json Router::serviceDescriptor() {
    return {
        {"status", "ok"},
        {"message", std::string(NAME) + " - file streaming relay"},
        {"version", VERSION},
        {"endpoints", {
            {"stream", std::string(STREAM_PREFIX) + "{id}"},
            {"download", std::string(DOWNLOAD_PREFIX) + "{id}"},
            {"health", "/health"}
        }}
    };
}

nlohmann::json Router::healthReport() const {
    SessionStats stats = m_sessions.stats();
    int64_t cooldown = m_sessions.cooldown().remainingSeconds();
    return {
        {"status", "healthy"},
        {"session_mode", sessionModeToString(m_sessions.mode())},
        {"cooldown_remaining", cooldown},
        {"sessions", {
            {"connects", stats.connects},
            {"reuses", stats.reuses},
            {"releases", stats.releases},
            {"cooldown_rejections", stats.cooldownRejections},
            {"rate_limit_signals", stats.rateLimitSignals}
        }}
    };
}

void Router::handle(const HttpRequest& request, ResponseSink& sink) {
    const std::string& path = request.path;

    bool isStream = startsWith(path, STREAM_PREFIX);
    bool isDownload = startsWith(path, DOWNLOAD_PREFIX);

    if (isStream || isDownload) {
        std::string token = path.substr(isStream ? std::string(STREAM_PREFIX).size()
                                                 : std::string(DOWNLOAD_PREFIX).size());
        if (token.find('/') != std::string::npos) {
            sendJson(sink, 404, errorBody("Not Found", "No route for " + path));
            return;
        }
        if (!isReadMethod(request)) {
            methodNotAllowed(request, sink, "GET, HEAD");
            return;
        }

        RelayRequest relayRequest;
        relayRequest.token = token;
        relayRequest.mode = isStream ? DeliveryMode::Inline : DeliveryMode::Attachment;
        relayRequest.rangeHeader = request.header("Range");
        relayRequest.headOnly = request.isHead();

        RelayOutcome outcome = m_relay.handle(relayRequest, sink);
        spdlog::info("Router: {} {} -> {} ({} bytes{})", request.method, path, outcome.status,
                     outcome.bytesSent,
                     outcome.streamFailed ? ", aborted"
                                          : (outcome.clientDisconnected ? ", client left" : ""));
        return;
    }

    if (path == "/" || path == "/health") {
        if (!isReadMethod(request)) {
            methodNotAllowed(request, sink, "GET, HEAD");
            return;
        }
        nlohmann::json body = path == "/" ? serviceDescriptor() : healthReport();
        sendJson(sink, 200, body, {}, request.isHead());
        return;
    }

    spdlog::debug("Router: No route for {} {}", request.method, path);
    sendJson(sink, 404, errorBody("Not Found", "No route for " + path), {}, request.isHead());
}

} // namespace StreamVault
