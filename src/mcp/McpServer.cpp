#include "mcp/McpServer.hpp"
#include "core/McpError.hpp"
#include "transport/ProtocolVersion.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"

namespace gitmcp {
namespace mcp {

using core::JsonRpcErrorCode;
using core::McpError;

namespace {

json successResponse(const json& id, json result) {
    return json{
        {"jsonrpc", "2.0"},
        {"result", std::move(result)},
        {"id", id}
    };
}

json textContent(const std::string& text) {
    json item = {{"type", "text"}, {"text", text}};
    json content = json::array();
    content.push_back(std::move(item));
    return content;
}

json toolErrorResult(const std::string& message) {
    return json{
        {"content", textContent(message)},
        {"isError", true}
    };
}

} // anonymous namespace

McpServer::McpServer(std::shared_ptr<const ToolRegistry> tools,
                     ServerInfo info,
                     McpServerOptions options)
    : m_tools(std::move(tools))
    , m_info(std::move(info))
    , m_options(options)
{
    if (!m_tools) {
        throw std::invalid_argument("McpServer requires a tool registry");
    }
}

ProtocolHandlerFactory McpServer::factory(std::shared_ptr<const ToolRegistry> tools,
                                          ServerInfo info,
                                          McpServerOptions options) {
    return [tools, info, options]() -> ProtocolHandlerPtr {
        return std::make_shared<McpServer>(tools, info, options);
    };
}

void McpServer::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workspace.clearWorkingDirectory();
}

bool McpServer::isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

std::string McpServer::negotiatedProtocolVersion() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_protocolVersion;
}

json McpServer::handle(const json& message, const core::RequestContext& ctx) {
    if (m_closed) {
        throw HandlerClosedError();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        throw HandlerClosedError();
    }

    if (message.is_array()) {
        if (message.empty()) {
            return core::makeJsonRpcError(JsonRpcErrorCode::InvalidRequest, "Empty batch");
        }
        json responses = json::array();
        for (const auto& item : message) {
            json res = handleMessage(item, ctx);
            if (!res.is_null()) {
                responses.push_back(std::move(res));
            }
        }
        return responses.empty() ? json(nullptr) : responses;
    }

    return handleMessage(message, ctx);
}

json McpServer::handleMessage(const json& message, const core::RequestContext& ctx) {
    if (!message.is_object()
        || !message.contains("jsonrpc")
        || message["jsonrpc"] != "2.0"
        || !message.contains("method")
        || !message["method"].is_string()) {
        json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
        return core::makeJsonRpcError(JsonRpcErrorCode::InvalidRequest, "Invalid JSON-RPC request", id);
    }

    const std::string method = message["method"].get<std::string>();
    const json params = message.contains("params") ? message["params"] : json::object();

    // Notifications carry no id and get no response
    if (!message.contains("id")) {
        if (method == "notifications/initialized") {
            LOG_DEBUG_CTX("Client initialized notification", ctx);
        } else {
            LOG_DEBUG_CTX("Notification ignored: " + method, ctx);
        }
        return nullptr;
    }

    const json id = message["id"];
    auto callCtx = ctx.withField("method", method);

    try {
        return successResponse(id, dispatch(method, params, callCtx));
    } catch (const McpError& e) {
        LOG_DEBUG_CTX(std::string("JSON-RPC error: ") + e.what(), callCtx);
        return core::makeJsonRpcError(e.code(), e.what(), id, e.data());
    }
}

json McpServer::dispatch(const std::string& method, const json& params, const core::RequestContext& ctx) {
    if (method == "initialize") {
        return onInitialize(params);
    }
    if (method == "ping") {
        return json::object();
    }

    if (m_options.requireInitialize && !m_initialized) {
        throw McpError(JsonRpcErrorCode::InvalidRequest, "Server not initialized");
    }

    if (method == "tools/list") {
        return json{{"tools", m_tools->listTools()}};
    }
    if (method == "tools/call") {
        return onToolsCall(params, ctx);
    }

    throw McpError(JsonRpcErrorCode::MethodNotFound, "Method not found: " + method);
}

json McpServer::onInitialize(const json& params) {
    if (m_initialized && m_options.requireInitialize) {
        throw McpError(JsonRpcErrorCode::InvalidRequest, "Server already initialized");
    }

    std::string requested;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    m_protocolVersion = transport::isSupportedProtocolVersion(requested)
        ? requested
        : transport::latestProtocolVersion();
    m_initialized = true;

    return json{
        {"protocolVersion", m_protocolVersion},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"logging", json::object()}
        }},
        {"serverInfo", {
            {"name", m_info.name},
            {"version", m_info.version}
        }},
        {"instructions", m_info.description}
    };
}

json McpServer::onToolsCall(const json& params, const core::RequestContext& ctx) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw McpError(JsonRpcErrorCode::InvalidParams, "tools/call requires a tool name");
    }

    const std::string name = params["name"].get<std::string>();
    ToolDefinitionPtr tool = m_tools->getTool(name);
    if (!tool) {
        throw McpError(JsonRpcErrorCode::InvalidParams, "Unknown tool: " + name);
    }

    json args = params.contains("arguments") ? params["arguments"] : json::object();
    auto toolCtx = ctx.withOperation("tool:" + name);
    ToolContext context{toolCtx, m_workspace};

    server::ScopedTimer timer("tool." + name);
    try {
        json result = tool->execute(args, context);
        return json{
            {"content", textContent(result.dump())},
            {"structuredContent", result},
            {"isError", false}
        };
    } catch (const McpError& e) {
        timer.markFailed();
        LOG_WARN_CTX("Tool failed: " + std::string(e.what()),
                     toolCtx.withField("errorCode", e.numericCode()));
        return toolErrorResult(e.what());
    } catch (const std::exception& e) {
        timer.markFailed();
        LOG_ERROR_CTX("Tool raised an unexpected error", toolCtx.withField("error", e.what()));
        return toolErrorResult("Tool execution failed");
    }
}

} // namespace mcp
} // namespace gitmcp
