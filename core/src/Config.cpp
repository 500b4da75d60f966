#include "streamvault/Config.h"
#include "streamvault/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace StreamVault {

using json = nlohmann::json;

namespace {

template<typename T>
void readValue(const json& section, const char* sectionName, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigException(std::string("Invalid value for ") + sectionName + "." + key +
                              ": " + e.what());
    }
}

const json* findSection(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigException(std::string("Config section '") + name + "' must be an object");
    }
    return &*it;
}

uint64_t parseUnsigned(const std::string& name, const std::string& value) {
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        throw ConfigException(name + " is not a non-negative integer: " + value);
    }
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos, 10);
        if (pos != value.size()) {
            throw ConfigException(name + " is not a non-negative integer: " + value);
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigException(name + " is not a non-negative integer: " + value);
    }
}

SessionMode parseSessionMode(const std::string& value) {
    auto mode = sessionModeFromString(value);
    if (!mode) {
        throw ConfigException("Unknown session mode '" + value + "' (expected stateless or pooled)");
    }
    return *mode;
}

bool isKnownLogLevel(const std::string& level) {
    static const std::array<const char*, 9> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"
    };
    return std::any_of(levels.begin(), levels.end(),
                       [&](const char* known) { return level == known; });
}

} // namespace

Config::EnvLookup Config::systemEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Config Config::load(const std::string& path, const EnvLookup& env) {
    Config config;

    if (!path.empty()) {
        std::ifstream file(path);
        if (!file) {
            throw ConfigException("Cannot open config file: " + path);
        }
        json root;
        try {
            root = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ConfigException("Cannot parse config file " + path + ": " + e.what());
        }
        if (!root.is_object()) {
            throw ConfigException("Config file " + path + " must contain a JSON object");
        }
        config.applyJson(root);
        spdlog::debug("Config: Loaded {}", path);
    }

    if (env) {
        config.applyEnvironment(env);
    }
    config.validate();
    return config;
}

void Config::applyJson(const json& root) {
    if (const json* s = findSection(root, "server")) {
        readValue(*s, "server", "bind_address", server.bindAddress);
        readValue(*s, "server", "port", server.port);
        readValue(*s, "server", "worker_threads", server.workerThreads);
        readValue(*s, "server", "max_pending_connections", server.maxPendingConnections);
        readValue(*s, "server", "io_timeout_ms", server.ioTimeoutMs);
        readValue(*s, "server", "base_url", server.baseUrl);
    }
    if (const json* s = findSection(root, "remote")) {
        readValue(*s, "remote", "bot_token", remote.botToken);
        readValue(*s, "remote", "session_string", remote.sessionString);
        readValue(*s, "remote", "timeout_ms", remote.timeoutMs);
    }
    if (const json* s = findSection(root, "session")) {
        std::string mode;
        readValue(*s, "session", "mode", mode);
        if (!mode.empty()) {
            session.mode = parseSessionMode(mode);
        }
        readValue(*s, "session", "transport_thread_safe", session.transportThreadSafe);
    }
    if (const json* s = findSection(root, "relay")) {
        readValue(*s, "relay", "chunk_size", relay.chunkSize);
    }
    if (const json* s = findSection(root, "codec")) {
        readValue(*s, "codec", "secret", codec.secret);
    }
    if (const json* s = findSection(root, "log")) {
        readValue(*s, "log", "level", log.level);
        readValue(*s, "log", "pattern", log.pattern);
    }
    if (const json* s = findSection(root, "archive")) {
        readValue(*s, "archive", "path", archive.path);
    }
    if (const json* s = findSection(root, "credentials")) {
        readValue(*s, "credentials", "directory", credentials.directory);
    }
}

void Config::applyEnvironment(const EnvLookup& env) {
    auto get = [&](const char* name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto v = get("BOT_TOKEN")) remote.botToken = *v;
    if (auto v = get("SESSION_STRING")) remote.sessionString = *v;
    if (auto v = get("SECRET_KEY")) codec.secret = parseUnsigned("SECRET_KEY", *v);
    if (auto v = get("LOG_LEVEL")) log.level = *v;
    if (auto v = get("ARCHIVE_PATH")) archive.path = *v;
    if (auto v = get("SESSION_MODE")) session.mode = parseSessionMode(*v);

    if (auto v = get("PORT")) {
        uint64_t port = parseUnsigned("PORT", *v);
        if (port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigException("PORT out of range: " + *v);
        }
        server.port = static_cast<uint16_t>(port);
    }

    // VERCEL_URL приоритетнее BASE_URL
    if (auto v = get("VERCEL_URL")) {
        server.baseUrl = "https://" + *v;
    } else if (auto b = get("BASE_URL")) {
        server.baseUrl = *b;
    }
}

void Config::validate() const {
    if (relay.chunkSize == 0 || relay.chunkSize > MAX_CHUNK_SIZE) {
        throw ConfigException("relay.chunk_size must be in 1.." + std::to_string(MAX_CHUNK_SIZE) +
                              ", got " + std::to_string(relay.chunkSize));
    }
    if (server.workerThreads == 0) {
        throw ConfigException("server.worker_threads must be positive");
    }
    if (server.maxPendingConnections == 0) {
        throw ConfigException("server.max_pending_connections must be positive");
    }
    if (server.ioTimeoutMs <= 0) {
        throw ConfigException("server.io_timeout_ms must be positive");
    }
    if (remote.timeoutMs <= 0) {
        throw ConfigException("remote.timeout_ms must be positive");
    }
    if (!isKnownLogLevel(log.level)) {
        throw ConfigException("Unknown log level: " + log.level);
    }
    if (archive.path.empty()) {
        throw ConfigException("archive.path must not be empty");
    }
    if (!server.baseUrl.empty() &&
        server.baseUrl.rfind("http://", 0) != 0 && server.baseUrl.rfind("https://", 0) != 0) {
        throw ConfigException("server.base_url must start with http:// or https://");
    }
}

json Config::toJson() const {
    auto mask = [](const std::string& secret) {
        return secret.empty() ? std::string() : std::string("***");
    };
    return {
        {"server", {
            {"bind_address", server.bindAddress},
            {"port", server.port},
            {"worker_threads", server.workerThreads},
            {"max_pending_connections", server.maxPendingConnections},
            {"io_timeout_ms", server.ioTimeoutMs},
            {"base_url", server.baseUrl}
        }},
        {"remote", {
            {"bot_token", mask(remote.botToken)},
            {"session_string", mask(remote.sessionString)},
            {"timeout_ms", remote.timeoutMs}
        }},
        {"session", {
            {"mode", sessionModeToString(session.mode)},
            {"transport_thread_safe", session.transportThreadSafe}
        }},
        {"relay", {{"chunk_size", relay.chunkSize}}},
        {"log", {{"level", log.level}}},
        {"archive", {{"path", archive.path}}},
        {"credentials", {{"directory", credentials.directory}}}
    };
}

std::string resolveBaseUrl(const Config& config,
                           const std::optional<std::string>& host,
                           const std::optional<std::string>& forwardedProto) {
    std::string base;
    if (!config.server.baseUrl.empty()) {
        base = config.server.baseUrl;
    } else if (host && !host->empty()) {
        std::string proto = forwardedProto && !forwardedProto->empty() ? *forwardedProto : "http";
        // "https, http" от цепочки прокси — берём первый
        proto = proto.substr(0, proto.find(','));
        base = proto + "://" + *host;
    } else {
        base = "http://localhost:" + std::to_string(config.server.port);
    }

    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base;
}

} // namespace StreamVault
