// main.cpp — streamvault: HTTP relay над каналом хранения

#include "streamvault/Config.h"
#include "streamvault/CredentialStore.h"
#include "streamvault/Errors.h"
#include "streamvault/Http/HttpServer.h"
#include "streamvault/Http/Router.h"
#include "streamvault/IdentifierCodec.h"
#include "streamvault/Ingestion/IngestionPipeline.h"
#include "streamvault/Logging.h"
#include "streamvault/Relay/StreamingRelay.h"
#include "streamvault/Remote/ChannelArchiveStore.h"
#include "streamvault/Remote/SessionManager.h"
#include "streamvault/core.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace StreamVault;

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

void printUsage() {
    std::cout
        << NAME << " " << VERSION << "\n\n"
        << "Usage:\n"
        << "  streamvault serve [--config <file>] [--verbose]\n"
        << "  streamvault ingest <file> [--video] [--config <file>] [--verbose]\n"
        << "  streamvault token encode <id> [--config <file>]\n"
        << "  streamvault token decode <token> [--config <file>]\n"
        << "  streamvault version\n";
}

struct CommandLine {
    std::vector<std::string> positional;
    std::string configPath;
    bool video = false;
    bool verbose = false;   // Переопределяет log.level
};

CommandLine parseArgs(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw ConfigException("--config requires a file path");
            }
            cmd.configPath = argv[++i];
        } else if (arg == "--video") {
            cmd.video = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else {
            cmd.positional.push_back(std::move(arg));
        }
    }
    return cmd;
}

SessionManagerOptions sessionOptions(const Config& config) {
    SessionManagerOptions options;
    options.mode = config.session.mode;
    options.sessionToken = config.remote.sessionString;
    options.botToken = config.remote.botToken;
    options.timeout = std::chrono::milliseconds(config.remote.timeoutMs);
    options.transportThreadSafe = config.session.transportThreadSafe;
    return options;
}

int runServe(const Config& config) {
    if (!config.hasRemoteCredentials()) {
        spdlog::warn("main: Neither SESSION_STRING nor BOT_TOKEN is set; "
                     "relay requests will fail with a configuration error");
    }

    auto archive = std::make_shared<ChannelArchiveStore>(config.archive.path);
    auto credentials = std::make_shared<CredentialStore>(config.credentials.directory);
    SessionManager sessions(archive, sessionOptions(config),
                            std::make_shared<CooldownWindow>(), credentials);

    RelayOptions relayOptions;
    relayOptions.chunkSize = config.relay.chunkSize;
    StreamingRelay relay(sessions, IdentifierCodec(config.codec.secret), relayOptions);
    Router router(relay, sessions);

    HttpServerOptions serverOptions;
    serverOptions.bindAddress = config.server.bindAddress;
    serverOptions.workerThreads = config.server.workerThreads;
    serverOptions.maxPendingConnections = config.server.maxPendingConnections;
    serverOptions.ioTimeoutMs = config.server.ioTimeoutMs;

    HttpServer server(serverOptions);
    bool started = server.start(config.server.port, [&router](const HttpRequest& request, ResponseSink& sink) {
        router.handle(request, sink);
    });
    if (!started) {
        spdlog::critical("main: Cannot start HTTP server: {}", server.getLastError());
        return 1;
    }

    spdlog::info("main: {} {} serving {} (session mode: {})", NAME, VERSION,
                 config.archive.path, sessionModeToString(config.session.mode));

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("main: Shutting down");
    server.stop();
    sessions.shutdown();
    return 0;
}

int runIngest(const Config& config, const CommandLine& cmd) {
    if (cmd.positional.size() < 2) {
        printUsage();
        return 2;
    }

    auto archive = std::make_shared<ChannelArchiveStore>(config.archive.path);
    auto credentials = std::make_shared<CredentialStore>(config.credentials.directory);
    SessionManager sessions(archive, sessionOptions(config),
                            std::make_shared<CooldownWindow>(), credentials);
    IngestionPipeline pipeline(sessions, IdentifierCodec(config.codec.secret), resolveBaseUrl(config));

    InboundObjectRef ref;
    ref.localPath = cmd.positional[1];
    ref.isVideo = cmd.video;

    IngestionResult result = pipeline.relayInboundObject(ref);
    sessions.shutdown();

    // Копия в канале должна совпасть с исходным файлом
    std::string localChecksum = ChannelArchiveStore::computeChecksum(*ref.localPath);
    auto stored = archive->getMessage(result.objectId);
    if (!stored || stored->checksum.value_or("") != localChecksum) {
        spdlog::error("main: Checksum mismatch for message {}: local {}, stored {}",
                      result.objectId, localChecksum,
                      stored ? stored->checksum.value_or("none") : std::string("missing"));
        return 1;
    }

    std::cout << "id:       " << result.objectId << "\n"
              << "token:    " << result.token << "\n"
              << "checksum: " << localChecksum << "\n"
              << "download: " << result.downloadUrl << "\n";
    if (result.streamUrl) {
        std::cout << "stream:   " << *result.streamUrl << "\n";
    }
    return 0;
}

int runToken(const Config& config, const CommandLine& cmd) {
    if (cmd.positional.size() < 3) {
        printUsage();
        return 2;
    }

    IdentifierCodec codec(config.codec.secret);
    const std::string& action = cmd.positional[1];
    const std::string& value = cmd.positional[2];

    if (action == "encode") {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            std::cerr << "Not a message id: " << value << "\n";
            return 2;
        }
        try {
            std::cout << codec.encode(std::stoull(value)) << "\n";
        } catch (const std::out_of_range&) {
            std::cerr << "Message id out of range: " << value << "\n";
            return 2;
        }
        return 0;
    }
    if (action == "decode") {
        std::cout << codec.decode(value) << "\n";
        return 0;
    }

    printUsage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    try {
        CommandLine cmd = parseArgs(argc, argv);
        if (cmd.positional.empty()) {
            printUsage();
            return 2;
        }

        const std::string& command = cmd.positional[0];
        if (command == "version" || command == "--version") {
            std::cout << NAME << " " << VERSION << "\n";
            return 0;
        }
        if (command == "help" || command == "--help" || command == "-h") {
            printUsage();
            return 0;
        }

        Config config = Config::load(cmd.configPath);
        Logging::initialize(config.log.level, config.log.pattern);
        if (cmd.verbose) {
            Logging::setLevel("debug");
        }
        spdlog::debug("main: Effective configuration: {}", config.toJson().dump());

        if (command == "serve") {
            return runServe(config);
        }
        if (command == "ingest") {
            return runIngest(config, cmd);
        }
        if (command == "token") {
            return runToken(config, cmd);
        }

        printUsage();
        return 2;
    } catch (const ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const InvalidTokenException& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("main: {}", e.what());
        return 1;
    }
}
