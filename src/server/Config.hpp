#pragma once

#include "auth/AuthTypes.hpp"
#include "server/Logger.hpp"
#include "transport/RequestRouting.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace server {

enum class TransportType {
    Stdio,
    Http
};

std::string transportTypeName(TransportType type);

/**
 * Effective server configuration.
 * Sources, later wins: defaults, key=value file, environment, command line.
 */
struct ServerConfig {
    // Identity reported by initialize and GET <endpoint>
    std::string serverName = "git-mcp-server";
    std::string serverVersion = "1.0.0";
    std::string serverDescription = "Git operations exposed as MCP tools";
    std::string environment = "development";

    TransportType transport = TransportType::Stdio;
    transport::SessionMode sessionMode = transport::SessionMode::Auto;

    // HTTP
    std::string httpHost = "127.0.0.1";
    unsigned short httpPort = 3015;
    unsigned maxPortRetries = 15;
    unsigned portRetryDelayMs = 50;
    std::string endpointPath = "/mcp";
    std::vector<std::string> allowedOrigins;
    unsigned httpThreads = 1;
    bool sseResponses = false;

    // Sessions
    int64_t staleSessionTimeoutMs = 30 * 60 * 1000;
    int64_t sessionCleanupIntervalMs = 5 * 60 * 1000;

    // Auth
    auth::AuthMode authMode = auth::AuthMode::None;
    std::optional<std::string> authSecretKey;
    std::string devMcpClientId = "dev-client-id";
    std::vector<std::string> devMcpScopes = {"dev-scope"};

    // Tools
    std::optional<std::string> gitBaseDir;

    // Diagnostics
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    bool enableProfiler = true;

    bool showHelp = false;
};

/**
 * Builds a ServerConfig. Invalid values throw std::invalid_argument,
 * an unreadable config file throws std::runtime_error.
 */
class ConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static ServerConfig load(int argc, char* argv[], const EnvLookup& env = processEnv());

    // Parse "key=value" lines; '#' starts a comment line, a leading '@' on the path is ignored
    static std::map<std::string, std::string> parseKeyValueFile(const std::string& path);

    // Apply one option by its environment variable name
    static void applyOption(ServerConfig& config, const std::string& key, const std::string& value);

    static void applyEnvironment(ServerConfig& config, const EnvLookup& env);

    static EnvLookup processEnv();

    static std::string usage(const std::string& program);

    // Names recognised in files and in the environment
    static const std::vector<std::string>& optionNames();
};

} // namespace server
} // namespace gitmcp
