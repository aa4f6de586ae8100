#pragma once

#include "mcp/ProtocolHandler.hpp"
#include "mcp/ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace gitmcp {
namespace mcp {

struct ServerInfo {
    std::string name = "git-mcp-server";
    std::string version = "1.0.0";
    std::string description = "Git operations exposed as MCP tools";
};

struct McpServerOptions {
    // Session handlers reject calls (other than ping) until initialize.
    // One-shot stateless handlers accept any call.
    bool requireInitialize = true;
};

/**
 * Minimal MCP protocol handler: JSON-RPC 2.0 single messages and batches,
 * methods initialize, ping, tools/list, tools/call and notifications.
 *
 * handle() is serialized by an internal mutex; close() only flags the
 * handler, later calls throw HandlerClosedError.
 */
class McpServer : public ProtocolHandler {
public:
    McpServer(std::shared_ptr<const ToolRegistry> tools,
              ServerInfo info = {},
              McpServerOptions options = {});

    json handle(const json& message, const core::RequestContext& ctx) override;
    void close() override;
    bool isClosed() const override { return m_closed; }

    bool isInitialized() const;
    std::string negotiatedProtocolVersion() const;

    // Builds a fresh handler per call, sharing the registry
    static ProtocolHandlerFactory factory(std::shared_ptr<const ToolRegistry> tools,
                                          ServerInfo info,
                                          McpServerOptions options);

private:
    // One message; null for notifications
    json handleMessage(const json& message, const core::RequestContext& ctx);
    json dispatch(const std::string& method, const json& params, const core::RequestContext& ctx);

    json onInitialize(const json& params);
    json onToolsCall(const json& params, const core::RequestContext& ctx);

    std::shared_ptr<const ToolRegistry> m_tools;
    ServerInfo m_info;
    McpServerOptions m_options;

    mutable std::mutex m_mutex;
    std::atomic<bool> m_closed{false};
    bool m_initialized = false;
    std::string m_protocolVersion;
    SessionWorkspace m_workspace;
};

} // namespace mcp
} // namespace gitmcp
