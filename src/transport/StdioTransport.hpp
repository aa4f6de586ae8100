#pragma once

#include "mcp/ProtocolHandler.hpp"
#include <atomic>
#include <istream>
#include <ostream>

namespace gitmcp {
namespace transport {

/**
 * Newline-delimited JSON-RPC over a pair of streams (stdin/stdout in
 * production). One long-lived protocol handler serves the whole process.
 * Logging must not go to the output stream.
 */
class StdioTransport {
public:
    /**
     * @param stopFlag  optional flag owned by the caller, checked before each
     *                  line like stop(); lets a signal handler request
     *                  shutdown with a single atomic store
     */
    StdioTransport(mcp::ProtocolHandlerPtr handler, std::istream& in, std::ostream& out,
                   const std::atomic<bool>* stopFlag = nullptr);

    /**
     * Read until EOF or stop(). Returns the number of messages processed.
     * The handler is closed before returning.
     */
    size_t run();

    // Takes effect before the next line is read
    void stop() { m_stopped = true; }

    // Process one line; returns the serialized response, empty if none
    std::string processLine(const std::string& line);

private:
    bool stopRequested() const;

    mcp::ProtocolHandlerPtr m_handler;
    std::istream& m_in;
    std::ostream& m_out;
    std::atomic<bool> m_stopped{false};
    const std::atomic<bool>* m_externalStop;
};

} // namespace transport
} // namespace gitmcp
