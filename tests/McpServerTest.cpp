#include <catch2/catch.hpp>
#include "mcp/McpServer.hpp"
#include "mcp/BuiltinTools.hpp"
#include "core/McpError.hpp"
#include "support/FakeProtocolHandler.hpp"

using namespace gitmcp;
using namespace gitmcp::mcp;
using gitmcp::testing::initializeRequest;
using gitmcp::testing::rpcNotification;
using gitmcp::testing::rpcRequest;

namespace {

std::shared_ptr<const ToolRegistry> builtinRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    registerBuiltinTools(*registry);

    ToolDefinition boom;
    boom.name = "boom";
    boom.description = "Always fails";
    boom.inputSchema = {{"type", "object"}};
    boom.execute = [](const json&, ToolContext&) -> json {
        throw std::runtime_error("secret internals");
    };
    registry->registerTool(boom);
    return registry;
}

json callTool(McpServer& server, const std::string& name, json args, json id = 10) {
    return server.handle(rpcRequest("tools/call", std::move(id),
                                    json{{"name", name}, {"arguments", std::move(args)}}),
                         core::RequestContext::create("test"));
}

} // anonymous namespace

// =============================================================================
// Initialize
// =============================================================================

TEST_CASE("McpServer initialize", "[McpServer]") {
    ServerInfo info;
    info.version = "2.0.0";
    McpServer server(builtinRegistry(), info);

    json res = server.handle(initializeRequest(1, "2025-06-18"), core::RequestContext::create("test"));

    REQUIRE(res["id"] == 1);
    REQUIRE(res["result"]["protocolVersion"] == "2025-06-18");
    REQUIRE(res["result"]["serverInfo"]["name"] == "git-mcp-server");
    REQUIRE(res["result"]["serverInfo"]["version"] == "2.0.0");
    REQUIRE(res["result"]["capabilities"].contains("tools"));
    REQUIRE(server.isInitialized());
    REQUIRE(server.negotiatedProtocolVersion() == "2025-06-18");
}

TEST_CASE("McpServer unknown client version negotiates the latest", "[McpServer]") {
    McpServer server(builtinRegistry());

    json res = server.handle(initializeRequest(1, "2024-11-05"), core::RequestContext::create("test"));

    REQUIRE(res["result"]["protocolVersion"] == "2025-06-18");
}

TEST_CASE("McpServer session handler rejects a second initialize", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");

    server.handle(initializeRequest(1), ctx);
    json again = server.handle(initializeRequest(2), ctx);

    REQUIRE(again["error"]["code"] == -32600);
}

TEST_CASE("McpServer requires initialize before tools", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");

    json early = server.handle(rpcRequest("tools/list", 1), ctx);
    REQUIRE(early["error"]["code"] == -32600);
    REQUIRE(early["error"]["message"] == "Server not initialized");

    // ping is always allowed
    json ping = server.handle(rpcRequest("ping", 2), ctx);
    REQUIRE(ping["result"] == json::object());
}

TEST_CASE("McpServer one-shot handler accepts calls without initialize", "[McpServer]") {
    McpServerOptions options;
    options.requireInitialize = false;
    McpServer server(builtinRegistry(), ServerInfo{}, options);

    json res = server.handle(rpcRequest("tools/list", 1), core::RequestContext::create("test"));

    REQUIRE(res["result"]["tools"].is_array());
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("McpServer tools/list", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");
    server.handle(initializeRequest(), ctx);

    json res = server.handle(rpcRequest("tools/list", 2), ctx);

    const json& tools = res["result"]["tools"];
    REQUIRE(tools.size() == 5);
    REQUIRE(tools[0]["name"] == "boom");
    REQUIRE(tools[1]["name"] == "echo_message");
    REQUIRE(tools[1].contains("inputSchema"));
}

TEST_CASE("McpServer tools/call echo", "[McpServer]") {
    McpServer server(builtinRegistry());
    server.handle(initializeRequest(), core::RequestContext::create("test"));

    json res = callTool(server, "echo_message", json{{"message", "hi"}, {"repeat", 3}});

    REQUIRE(res["result"]["isError"] == false);
    REQUIRE(res["result"]["structuredContent"]["repeatedMessage"] == "hi hi hi");
    REQUIRE(res["result"]["content"][0]["type"] == "text");
}

TEST_CASE("McpServer tool errors are reported in the result", "[McpServer]") {
    McpServer server(builtinRegistry());
    server.handle(initializeRequest(), core::RequestContext::create("test"));

    SECTION("validation failure keeps its message") {
        json res = callTool(server, "echo_message", json{{"repeat", 2}});
        REQUIRE(res["result"]["isError"] == true);
        REQUIRE(res["result"]["content"][0]["text"] == "'message' must be a string");
    }
    SECTION("unexpected failure is masked") {
        json res = callTool(server, "boom", json::object());
        REQUIRE(res["result"]["isError"] == true);
        REQUIRE(res["result"]["content"][0]["text"] == "Tool execution failed");
    }
}

TEST_CASE("McpServer unknown tool and method", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");
    server.handle(initializeRequest(), ctx);

    REQUIRE(callTool(server, "nope", json::object())["error"]["code"] == -32602);
    REQUIRE(server.handle(rpcRequest("resources/list", 3), ctx)["error"]["code"] == -32601);
}

TEST_CASE("McpServer invalid messages", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");

    json noVersion = {{"method", "ping"}, {"id", 1}};
    REQUIRE(server.handle(noVersion, ctx)["error"]["code"] == -32600);

    json badVersion = {{"jsonrpc", 2}, {"method", "ping"}, {"id", 2}};
    REQUIRE(server.handle(badVersion, ctx)["error"]["code"] == -32600);

    REQUIRE(server.handle(json::array(), ctx)["error"]["code"] == -32600);
}

TEST_CASE("McpServer notifications get no response", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");

    REQUIRE(server.handle(rpcNotification("notifications/initialized"), ctx).is_null());

    json batch = json::array({rpcNotification("a"), rpcNotification("b")});
    REQUIRE(server.handle(batch, ctx).is_null());
}

TEST_CASE("McpServer batch responses", "[McpServer]") {
    McpServer server(builtinRegistry());
    auto ctx = core::RequestContext::create("test");

    json batch = json::array({initializeRequest(1), rpcNotification("notifications/initialized"),
                              rpcRequest("ping", 2)});
    json res = server.handle(batch, ctx);

    REQUIRE(res.is_array());
    REQUIRE(res.size() == 2);
    REQUIRE(res[0]["id"] == 1);
    REQUIRE(res[1]["id"] == 2);
}

// =============================================================================
// Workspace and close
// =============================================================================

TEST_CASE("McpServer working directory is per handler", "[McpServer]") {
    auto registry = builtinRegistry();
    McpServer a(registry);
    McpServer b(registry);
    auto ctx = core::RequestContext::create("test");
    a.handle(initializeRequest(), ctx);
    b.handle(initializeRequest(), ctx);

    json set = callTool(a, "git_set_working_dir", json{{"path", "."}, {"validateGitRepo", false}});
    REQUIRE(set["result"]["isError"] == false);

    REQUIRE(callTool(a, "git_working_dir", json::object())["result"]["structuredContent"]["workingDirectory"].is_string());
    REQUIRE(callTool(b, "git_working_dir", json::object())["result"]["structuredContent"]["workingDirectory"].is_null());
}

TEST_CASE("McpServer closed handler throws HandlerClosedError", "[McpServer]") {
    McpServer server(builtinRegistry());
    server.close();
    server.close();

    REQUIRE(server.isClosed());
    REQUIRE_THROWS_AS(server.handle(rpcRequest("ping"), core::RequestContext::create("test")),
                      HandlerClosedError);
}

TEST_CASE("McpServer factory builds independent handlers", "[McpServer]") {
    auto factory = McpServer::factory(builtinRegistry(), ServerInfo{}, McpServerOptions{});

    auto first = factory();
    auto second = factory();
    REQUIRE(first != second);

    first->close();
    REQUIRE_FALSE(second->isClosed());
}
