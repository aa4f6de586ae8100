#pragma once

#include "core/RequestContext.hpp"
#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <optional>
#include <unordered_map>

namespace gitmcp {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized, mutex-guarded log output
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }
    void setLogResponses(bool enabled) { m_logResponses = enabled; }

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /**
     * Log with the request context appended as compact JSON,
     * e.g. `Session created {"requestId":"AB12C-...","sessionId":"..."}`
     */
    void log(LogLevel level, const std::string& message, const core::RequestContext& ctx);

    // Request/Response logging with request ID correlation
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void logResponse(uint64_t requestId, int statusCode, const std::string& body, size_t bodySize = 0);

    // Helpers
    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string formatSize(size_t bytes);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();
    std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    std::atomic<bool> m_logRequests{true};
    std::atomic<bool> m_logResponses{true};

    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) gitmcp::server::Logger::instance().debug(msg)
#define LOG_INFO(msg) gitmcp::server::Logger::instance().info(msg)
#define LOG_WARN(msg) gitmcp::server::Logger::instance().warn(msg)
#define LOG_ERROR(msg) gitmcp::server::Logger::instance().error(msg)

#define LOG_DEBUG_CTX(msg, ctx) gitmcp::server::Logger::instance().log(gitmcp::server::LogLevel::DEBUG, msg, ctx)
#define LOG_INFO_CTX(msg, ctx) gitmcp::server::Logger::instance().log(gitmcp::server::LogLevel::INFO, msg, ctx)
#define LOG_WARN_CTX(msg, ctx) gitmcp::server::Logger::instance().log(gitmcp::server::LogLevel::WARN, msg, ctx)
#define LOG_ERROR_CTX(msg, ctx) gitmcp::server::Logger::instance().log(gitmcp::server::LogLevel::ERROR, msg, ctx)

} // namespace server
} // namespace gitmcp
