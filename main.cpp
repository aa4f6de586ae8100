#include "server/Config.hpp"
#include "server/HttpServer.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "server/RequestRouter.hpp"
#include "auth/AuthMiddleware.hpp"
#include "auth/JwtStrategy.hpp"
#include "mcp/BuiltinTools.hpp"
#include "mcp/McpServer.hpp"
#include "mcp/ToolRegistry.hpp"
#include "transport/McpEndpoint.hpp"
#include "transport/SessionManager.hpp"
#include "transport/StatefulTransportManager.hpp"
#include "transport/StatelessTransportManager.hpp"
#include "transport/StdioTransport.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace gitmcp;
using namespace gitmcp::server;

namespace {
    // Set from the stdio signal handler; a lock-free store is all it may do
    std::atomic<bool> stdio_stop_requested{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "stdio stop flag must be lock-free");

    void signal_handler(int) {
        stdio_stop_requested.store(true);
    }

    int runStdio(const ServerConfig& config, std::shared_ptr<const mcp::ToolRegistry> tools,
                 const mcp::ServerInfo& info) {
        auto handler = std::make_shared<mcp::McpServer>(tools, info, mcp::McpServerOptions{});
        transport::StdioTransport stdio(handler, std::cin, std::cout, &stdio_stop_requested);

        // The flag is only checked between lines: shutdown waits for the
        // next line on stdin or EOF, since the blocking read is not interrupted.
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        LOG_INFO(config.serverName + " " + config.serverVersion + " running on stdio");
        size_t processed = stdio.run();
        LOG_INFO("stdio transport closed after " + std::to_string(processed) + " messages");
        return 0;
    }

    int runHttp(const ServerConfig& config, std::shared_ptr<const mcp::ToolRegistry> tools,
                const mcp::ServerInfo& info) {
        net::io_context ioc{static_cast<int>(config.httpThreads)};

        transport::SessionManagerOptions sessionOptions;
        sessionOptions.staleTimeoutMs = config.staleSessionTimeoutMs;
        sessionOptions.cleanupIntervalMs = config.sessionCleanupIntervalMs;
        transport::SessionManager sessions(ioc, sessionOptions);

        mcp::McpServerOptions statefulOptions;
        statefulOptions.requireInitialize = true;
        mcp::McpServerOptions statelessOptions;
        statelessOptions.requireInitialize = false;

        transport::StatefulTransportManager stateful(
            mcp::McpServer::factory(tools, info, statefulOptions), sessions);
        transport::StatelessTransportManager stateless(
            mcp::McpServer::factory(tools, info, statelessOptions));
        stateful.setSseResponses(config.sseResponses);
        stateless.setSseResponses(config.sseResponses);

        std::shared_ptr<const auth::AuthMiddleware> authMiddleware;
        if (config.authMode == auth::AuthMode::Jwt) {
            auth::JwtStrategyOptions jwtOptions;
            jwtOptions.secretKey = config.authSecretKey;
            jwtOptions.environment = config.environment;
            jwtOptions.devClientId = config.devMcpClientId;
            jwtOptions.devScopes = config.devMcpScopes;
            auto strategy = std::make_shared<const auth::JwtStrategy>(std::move(jwtOptions));
            LOG_INFO("JWT auth enabled");
            authMiddleware = std::make_shared<const auth::AuthMiddleware>(strategy);
        }

        transport::McpEndpointOptions endpointOptions;
        endpointOptions.endpointPath = config.endpointPath;
        endpointOptions.sessionMode = config.sessionMode;
        endpointOptions.allowedOrigins = config.allowedOrigins;
        transport::McpEndpoint endpoint(endpointOptions, sessions, stateful, stateless, authMiddleware);

        ServerStatusInfo statusInfo;
        statusInfo.name = config.serverName;
        statusInfo.version = config.serverVersion;
        statusInfo.description = config.serverDescription;
        statusInfo.environment = config.environment;
        RequestRouter router(endpoint, stateful, statusInfo);

        HttpServerOptions serverOptions;
        serverOptions.host = config.httpHost;
        serverOptions.port = config.httpPort;
        serverOptions.maxPortRetries = config.maxPortRetries;
        serverOptions.portRetryDelayMs = config.portRetryDelayMs;
        HttpServer server(ioc, serverOptions, router);

        sessions.start();
        server.run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const beast::error_code& ec, int /*signal*/) {
            if (ec) return;
            LOG_INFO("Shutting down...");

            server.stop();
            stateful.shutdown();
            stateless.shutdown();
            sessions.stop();

            if (Profiler::instance().isEnabled()) {
                std::cerr << Profiler::instance().formatStats() << std::endl;
            }

            ioc.stop();
        });

        std::cout << std::endl;
        std::cout << "Listening on http://" << server.host() << ":" << server.boundPort() << std::endl;
        std::cout << "Session mode: " << transport::sessionModeName(config.sessionMode) << std::endl;
        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET    /healthz                 - Liveness check" << std::endl;
        std::cout << "  GET    " << config.endpointPath << "                     - Server status" << std::endl;
        std::cout << "  POST   " << config.endpointPath << "                     - JSON-RPC messages" << std::endl;
        std::cout << "  DELETE " << config.endpointPath << "                     - Terminate session" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        std::vector<std::thread> workers;
        workers.reserve(config.httpThreads - 1);
        for (unsigned i = 1; i < config.httpThreads; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
        for (auto& worker : workers) {
            worker.join();
        }

        return 0;
    }
}

int main(int argc, char* argv[]) {
    try {
        ServerConfig config = ConfigLoader::load(argc, argv);

        if (config.showHelp) {
            std::cout << ConfigLoader::usage(argv[0]);
            return 0;
        }

        // Configure Logger; stdout belongs to the protocol in stdio mode
        auto& logger = Logger::instance();
        logger.setLevel(config.logLevel);
        if (config.transport == TransportType::Stdio) {
            logger.setOutputStream(&std::cerr);
        }
        if (!config.logFile.empty()) {
            logger.enableFileLogging(config.logFile);
        }

        // Configure Profiler
        Profiler::instance().setEnabled(config.enableProfiler);

        LOG_INFO("=== " + config.serverName + " " + config.serverVersion + " (" +
                 transportTypeName(config.transport) + ", " + config.environment + ") ===");

        auto registry = std::make_shared<mcp::ToolRegistry>();
        mcp::BuiltinToolSettings toolSettings;
        toolSettings.gitBaseDir = config.gitBaseDir;
        mcp::registerBuiltinTools(*registry, toolSettings);
        LOG_INFO("Registered " + std::to_string(registry->size()) + " tools");

        mcp::ServerInfo info;
        info.name = config.serverName;
        info.version = config.serverVersion;
        info.description = config.serverDescription;

        std::shared_ptr<const mcp::ToolRegistry> tools = registry;
        if (config.transport == TransportType::Stdio) {
            return runStdio(config, tools, info);
        }
        return runHttp(config, tools, info);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
