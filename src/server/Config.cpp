#include "server/Config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gitmcp {
namespace server {

std::string transportTypeName(TransportType type) {
    return type == TransportType::Http ? "http" : "stdio";
}

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

unsigned long parseUnsigned(const std::string& key, const std::string& value, unsigned long maxValue) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument(key + " must be a non-negative integer, got '" + value + "'");
    }
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(key + " is out of range: " + value);
    }
    if (parsed > maxValue) {
        throw std::invalid_argument(key + " is out of range: " + value);
    }
    return parsed;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = toLower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(key + " must be a boolean, got '" + value + "'");
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // anonymous namespace

const std::vector<std::string>& ConfigLoader::optionNames() {
    static const std::vector<std::string> names = {
        "MCP_TRANSPORT_TYPE",
        "MCP_SESSION_MODE",
        "MCP_HTTP_HOST",
        "MCP_HTTP_PORT",
        "MCP_HTTP_MAX_PORT_RETRIES",
        "MCP_HTTP_PORT_RETRY_DELAY_MS",
        "MCP_HTTP_ENDPOINT_PATH",
        "MCP_ALLOWED_ORIGINS",
        "MCP_STATEFUL_SESSION_STALE_TIMEOUT_MS",
        "MCP_SESSION_CLEANUP_INTERVAL_MS",
        "MCP_LOG_LEVEL",
        "MCP_LOG_FILE",
        "MCP_AUTH_MODE",
        "MCP_AUTH_SECRET_KEY",
        "DEV_MCP_CLIENT_ID",
        "DEV_MCP_SCOPES",
        "MCP_HTTP_THREADS",
        "MCP_SSE_RESPONSES",
        "MCP_SERVER_NAME",
        "MCP_SERVER_VERSION",
        "NODE_ENV",
        "GIT_BASE_DIR"
    };
    return names;
}

void ConfigLoader::applyOption(ServerConfig& config, const std::string& key, const std::string& rawValue) {
    std::string value = trim(rawValue);

    if (key == "MCP_TRANSPORT_TYPE") {
        std::string v = toLower(value);
        if (v == "stdio") config.transport = TransportType::Stdio;
        else if (v == "http") config.transport = TransportType::Http;
        else throw std::invalid_argument("MCP_TRANSPORT_TYPE must be 'stdio' or 'http', got '" + value + "'");
    } else if (key == "MCP_SESSION_MODE") {
        auto mode = transport::parseSessionMode(value);
        if (!mode) {
            throw std::invalid_argument("MCP_SESSION_MODE must be stateful, stateless or auto, got '" + value + "'");
        }
        config.sessionMode = *mode;
    } else if (key == "MCP_HTTP_HOST") {
        config.httpHost = value;
    } else if (key == "MCP_HTTP_PORT") {
        config.httpPort = static_cast<unsigned short>(parseUnsigned(key, value, 65535));
    } else if (key == "MCP_HTTP_MAX_PORT_RETRIES") {
        config.maxPortRetries = static_cast<unsigned>(parseUnsigned(key, value, 1000));
    } else if (key == "MCP_HTTP_PORT_RETRY_DELAY_MS") {
        config.portRetryDelayMs = static_cast<unsigned>(parseUnsigned(key, value, 60000));
    } else if (key == "MCP_HTTP_ENDPOINT_PATH") {
        if (value.empty() || value[0] != '/') {
            throw std::invalid_argument("MCP_HTTP_ENDPOINT_PATH must start with '/'");
        }
        config.endpointPath = value;
    } else if (key == "MCP_ALLOWED_ORIGINS") {
        config.allowedOrigins = splitList(value);
    } else if (key == "MCP_STATEFUL_SESSION_STALE_TIMEOUT_MS") {
        config.staleSessionTimeoutMs = static_cast<int64_t>(parseUnsigned(key, value, 365UL * 24 * 3600 * 1000));
    } else if (key == "MCP_SESSION_CLEANUP_INTERVAL_MS") {
        auto interval = parseUnsigned(key, value, 24UL * 3600 * 1000);
        if (interval == 0) {
            throw std::invalid_argument("MCP_SESSION_CLEANUP_INTERVAL_MS must be positive");
        }
        config.sessionCleanupIntervalMs = static_cast<int64_t>(interval);
    } else if (key == "MCP_LOG_LEVEL") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            throw std::invalid_argument("Unknown log level '" + value + "'");
        }
        config.logLevel = *level;
    } else if (key == "MCP_LOG_FILE") {
        config.logFile = value;
    } else if (key == "MCP_AUTH_MODE") {
        auto mode = auth::parseAuthMode(value);
        if (!mode) {
            throw std::invalid_argument("MCP_AUTH_MODE must be 'none' or 'jwt', got '" + value + "'");
        }
        config.authMode = *mode;
    } else if (key == "MCP_AUTH_SECRET_KEY") {
        if (value.empty()) config.authSecretKey.reset();
        else config.authSecretKey = value;
    } else if (key == "DEV_MCP_CLIENT_ID") {
        config.devMcpClientId = value;
    } else if (key == "DEV_MCP_SCOPES") {
        config.devMcpScopes = splitList(value);
    } else if (key == "MCP_HTTP_THREADS") {
        auto threads = parseUnsigned(key, value, 256);
        if (threads == 0) {
            throw std::invalid_argument("MCP_HTTP_THREADS must be at least 1");
        }
        config.httpThreads = static_cast<unsigned>(threads);
    } else if (key == "MCP_SSE_RESPONSES") {
        config.sseResponses = parseBool(key, value);
    } else if (key == "MCP_SERVER_NAME") {
        config.serverName = value;
    } else if (key == "MCP_SERVER_VERSION") {
        config.serverVersion = value;
    } else if (key == "NODE_ENV") {
        config.environment = value;
    } else if (key == "GIT_BASE_DIR") {
        if (value.empty()) config.gitBaseDir.reset();
        else config.gitBaseDir = value;
    } else {
        LOG_WARN("Ignoring unknown configuration key: " + key);
    }
}

std::map<std::string, std::string> ConfigLoader::parseKeyValueFile(const std::string& rawPath) {
    std::string path = rawPath;
    if (!path.empty() && path[0] == '@') path = path.substr(1);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        values[key] = val;
    }
    return values;
}

ConfigLoader::EnvLookup ConfigLoader::processEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

void ConfigLoader::applyEnvironment(ServerConfig& config, const EnvLookup& env) {
    for (const auto& name : optionNames()) {
        if (auto value = env(name)) {
            applyOption(config, name, *value);
        }
    }
}

std::string ConfigLoader::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -t, --transport TYPE     stdio or http (default: stdio)\n"
        << "  -m, --session-mode MODE  stateful, stateless or auto (default: auto)\n"
        << "  -p, --port PORT          HTTP port (default: 3015)\n"
        << "  -a, --address ADDR       HTTP bind address (default: 127.0.0.1)\n"
        << "  --config FILE            key=value config file (@file accepted)\n"
        << "  -l, --log-level LVL      debug, info, warn, error (default: info)\n"
        << "  --no-profiler            Disable profiler\n"
        << "  -h, --help               Show this help\n"
        << "\n"
        << "Config file keys and environment variables:\n";
    for (const auto& name : optionNames()) {
        oss << "  " << name << "\n";
    }
    return oss.str();
}

ServerConfig ConfigLoader::load(int argc, char* argv[], const EnvLookup& env) {
    ServerConfig config;

    // First pass: find the config file so it can be applied before env and flags
    std::string configFile;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    if (!configFile.empty()) {
        for (const auto& [key, value] : parseKeyValueFile(configFile)) {
            applyOption(config, key, value);
        }
    }

    applyEnvironment(config, env);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-p" || arg == "--port") {
            applyOption(config, "MCP_HTTP_PORT", next(arg));
        } else if (arg == "-a" || arg == "--address") {
            applyOption(config, "MCP_HTTP_HOST", next(arg));
        } else if (arg == "-t" || arg == "--transport") {
            applyOption(config, "MCP_TRANSPORT_TYPE", next(arg));
        } else if (arg == "-m" || arg == "--session-mode") {
            applyOption(config, "MCP_SESSION_MODE", next(arg));
        } else if (arg == "-l" || arg == "--log-level") {
            applyOption(config, "MCP_LOG_LEVEL", next(arg));
        } else if (arg == "--config") {
            next(arg);
        } else if (arg == "--no-profiler") {
            config.enableProfiler = false;
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return config;
}

} // namespace server
} // namespace gitmcp
