#include <catch2/catch.hpp>
#include "transport/StatefulTransportManager.hpp"
#include "core/McpError.hpp"
#include "mcp/McpServer.hpp"
#include "support/FakeProtocolHandler.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace gitmcp;
using namespace gitmcp::transport;
using namespace gitmcp::testing;

namespace {

struct StatefulFixture {
    boost::asio::io_context ioc;
    ManualClock clock;
    std::shared_ptr<FakeHandlerStats> stats = std::make_shared<FakeHandlerStats>();
    SessionManager sessions;
    StatefulTransportManager manager;

    StatefulFixture()
        : sessions(ioc, options(), clock.fn())
        , manager(makeFakeFactory(stats), sessions)
    {
    }

    static SessionManagerOptions options() {
        SessionManagerOptions opts;
        opts.staleTimeoutMs = 1000;
        return opts;
    }

    core::RequestContext ctx() const {
        return core::RequestContext::create("test");
    }

    std::string initialize() {
        auto res = manager.initializeAndHandle(Headers{}, initializeRequest(), ctx());
        REQUIRE(res.statusCode == 200);
        REQUIRE(res.sessionId.has_value());
        return *res.sessionId;
    }

    TransportResponse call(const std::string& sessionId, const std::string& method = "tools/list", json id = 2) {
        return manager.handleRequest(Headers{}, rpcRequest(method, id), ctx(), sessionId);
    }
};

} // anonymous namespace

// =============================================================================
// Initialize
// =============================================================================

TEST_CASE("Stateful initialize registers session and handler", "[StatefulTransportManager]") {
    StatefulFixture f;

    auto res = f.manager.initializeAndHandle(Headers{}, initializeRequest(), f.ctx());

    REQUIRE(res.statusCode == 200);
    REQUIRE(res.sessionId.has_value());
    REQUIRE(res.headers.get(kSessionIdHeader) == res.sessionId);
    REQUIRE(f.sessions.isSessionValid(*res.sessionId));
    REQUIRE(f.manager.activeHandlerCount() == 1);
    REQUIRE(f.stats->created == 1);

    const json* body = res.body();
    REQUIRE(body != nullptr);
    REQUIRE((*body)["result"]["sessionId"] == *res.sessionId);
}

TEST_CASE("Stateful initialize records client identity in metadata", "[StatefulTransportManager]") {
    StatefulFixture f;
    auto authCtx = f.ctx().withAuth("ci-bot", std::string("acme"), std::nullopt, {});

    auto res = f.manager.initializeAndHandle(Headers{}, initializeRequest(), authCtx);
    auto meta = f.manager.getSession(*res.sessionId);

    REQUIRE(meta.has_value());
    REQUIRE(meta->clientId == std::optional<std::string>("ci-bot"));
    REQUIRE(meta->tenantId == std::optional<std::string>("acme"));
}

TEST_CASE("Stateful initialize mints distinct session ids", "[StatefulTransportManager]") {
    StatefulFixture f;

    std::set<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        ids.insert(f.initialize());
    }
    REQUIRE(ids.size() == 20);
    REQUIRE(f.manager.activeHandlerCount() == 20);
}

TEST_CASE("Stateful initialize rejected by handler registers nothing", "[StatefulTransportManager]") {
    StatefulFixture f;
    json body = rpcRequest("initialize", 1, json{{"reject", true}});

    auto res = f.manager.initializeAndHandle(Headers{}, body, f.ctx());

    REQUIRE(res.statusCode == 400);
    REQUIRE_FALSE(res.sessionId.has_value());
    REQUIRE_FALSE(res.headers.has(kSessionIdHeader));
    REQUIRE((*res.body())["error"]["code"] == -32602);
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.sessions.getActiveSessionCount() == 0);
    REQUIRE(f.stats->closed == 1);
}

TEST_CASE("Stateful initialize sent as notification is rejected", "[StatefulTransportManager]") {
    StatefulFixture f;

    auto res = f.manager.initializeAndHandle(Headers{}, rpcNotification("initialize"), f.ctx());

    REQUIRE(res.statusCode == 400);
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.sessions.getActiveSessionCount() == 0);
}

TEST_CASE("Stateful initialize failure surfaces InitializationFailed", "[StatefulTransportManager]") {
    StatefulFixture f;
    f.stats->failFactory = true;

    try {
        f.manager.initializeAndHandle(Headers{}, initializeRequest(), f.ctx());
        FAIL("expected McpError");
    } catch (const core::McpError& e) {
        REQUIRE(e.code() == core::JsonRpcErrorCode::InitializationFailed);
    }
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.sessions.getActiveSessionCount() == 0);
}

// =============================================================================
// Session requests
// =============================================================================

TEST_CASE("Stateful requests reuse the session handler", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    auto first = f.call(id);
    auto second = f.call(id);

    REQUIRE(first.statusCode == 200);
    REQUIRE(second.statusCode == 200);
    REQUIRE((*first.body())["result"]["instance"] == (*second.body())["result"]["instance"]);
    REQUIRE((*second.body())["result"]["callIndex"] == 3);   // initialize was call 1
    REQUIRE(second.headers.get(kSessionIdHeader) == std::optional<std::string>(id));
    REQUIRE(f.stats->created == 1);
}

TEST_CASE("Stateful request bumps session activity", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    f.clock.advance(900);
    REQUIRE(f.call(id).statusCode == 200);
    f.clock.advance(900);
    REQUIRE(f.call(id).statusCode == 200);
}

TEST_CASE("Stateful request for unknown session is 404", "[StatefulTransportManager]") {
    StatefulFixture f;

    auto res = f.call("not-a-session");

    REQUIRE(res.statusCode == 404);
    REQUIRE((*res.body())["error"]["code"] == -32001);
    REQUIRE((*res.body())["error"]["message"] == "Session expired or invalid. Please reinitialize.");
    REQUIRE(f.stats->created == 0);
    REQUIRE(f.sessions.getActiveSessionCount() == 0);
}

TEST_CASE("Stateful request without session id is 400", "[StatefulTransportManager]") {
    StatefulFixture f;

    auto res = f.manager.handleRequest(Headers{}, rpcRequest("tools/list"), f.ctx(), std::nullopt);
    REQUIRE(res.statusCode == 400);
}

TEST_CASE("Stateful expired session is 404 and its handler closed", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    f.clock.advance(1001);
    auto res = f.call(id);

    REQUIRE(res.statusCode == 404);
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.stats->closed == 1);

    // Never resurrected
    f.clock.advance(-5000);
    REQUIRE(f.call(id).statusCode == 404);
    REQUIRE(f.stats->created == 1);
}

TEST_CASE("Stateful sweep disposes expired handlers", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string a = f.initialize();
    f.clock.advance(600);
    std::string b = f.initialize();
    f.clock.advance(600);

    REQUIRE(f.sessions.sweepStaleSessions() == 1);
    REQUIRE(f.manager.activeHandlerCount() == 1);
    REQUIRE(f.stats->closed == 1);
    REQUIRE(f.call(a).statusCode == 404);
    REQUIRE(f.call(b).statusCode == 200);
}

TEST_CASE("Stateful handler failure closes the session and rethrows", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    REQUIRE_THROWS_AS(f.call(id, "fail"), std::runtime_error);
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE_FALSE(f.sessions.isSessionValid(id));
    REQUIRE(f.call(id).statusCode == 404);
}

TEST_CASE("Stateful notification-only request is 204", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    auto res = f.manager.handleRequest(Headers{}, rpcNotification("notifications/initialized"),
                                       f.ctx(), id);
    REQUIRE(res.statusCode == 204);
    REQUIRE(res.body()->is_null());
}

TEST_CASE("Stateful responses use SSE framing when enabled and accepted", "[StatefulTransportManager]") {
    StatefulFixture f;
    f.manager.setSseResponses(true);
    std::string id = f.initialize();

    Headers headers;
    headers.set("Accept", "application/json, text/event-stream");
    auto res = f.manager.handleRequest(headers, rpcRequest("tools/list", 7), f.ctx(), id);

    REQUIRE(res.statusCode == 200);
    REQUIRE(res.hasStream());
    REQUIRE(res.headers.get("Content-Type") == std::optional<std::string>("text/event-stream"));

    auto chunk = res.stream()->nextChunk();
    REQUIRE(chunk.has_value());
    REQUIRE(chunk->rfind("event: message\ndata: ", 0) == 0);
    REQUIRE(chunk->substr(chunk->size() - 2) == "\n\n");
    REQUIRE_FALSE(res.stream()->nextChunk().has_value());

    // Plain JSON when the client does not accept SSE
    auto plain = f.call(id);
    REQUIRE_FALSE(plain.hasStream());
}

// =============================================================================
// Delete and shutdown
// =============================================================================

TEST_CASE("Stateful delete then 404", "[StatefulTransportManager]") {
    StatefulFixture f;
    std::string id = f.initialize();

    auto del = f.manager.handleDeleteRequest(id, f.ctx());
    REQUIRE(del.statusCode == 204);
    REQUIRE(f.stats->closed == 1);

    REQUIRE(f.call(id).statusCode == 404);
    REQUIRE(f.manager.handleDeleteRequest(id, f.ctx()).statusCode == 404);
}

TEST_CASE("Stateful shutdown closes every session", "[StatefulTransportManager]") {
    StatefulFixture f;
    f.initialize();
    f.initialize();
    f.initialize();

    f.manager.shutdown();

    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.sessions.getActiveSessionCount() == 0);
    REQUIRE(f.stats->closed == 3);

    try {
        f.manager.initializeAndHandle(Headers{}, initializeRequest(), f.ctx());
        FAIL("expected McpError");
    } catch (const core::McpError& e) {
        REQUIRE(e.code() == core::JsonRpcErrorCode::ServiceUnavailable);
    }
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Stateful concurrent requests share one handler", "[StatefulTransportManager][concurrency]") {
    StatefulFixture f;
    std::string id = f.initialize();

    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 25;
    std::atomic<int> ok{0};
    std::set<int> instances;
    std::mutex instancesMutex;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kCallsPerThread; ++i) {
                auto res = f.call(id, "tools/list", t * 1000 + i);
                if (res.statusCode == 200) {
                    ok++;
                    std::lock_guard<std::mutex> lock(instancesMutex);
                    instances.insert((*res.body())["result"]["instance"].get<int>());
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(ok == kThreads * kCallsPerThread);
    REQUIRE(instances.size() == 1);
    REQUIRE(f.stats->created == 1);
}

TEST_CASE("Stateful concurrent delete and requests never reach a closed handler",
          "[StatefulTransportManager][concurrency]") {
    StatefulFixture f;
    std::string id = f.initialize();

    std::atomic<int> unexpected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                auto res = f.call(id);
                if (res.statusCode != 200 && res.statusCode != 404) {
                    unexpected++;
                }
            }
        });
    }
    threads.emplace_back([&]() {
        f.manager.handleDeleteRequest(id, f.ctx());
    });
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(unexpected == 0);
    REQUIRE(f.manager.activeHandlerCount() == 0);
    REQUIRE(f.call(id).statusCode == 404);
}

namespace {

// Tool that blocks until released (or a timeout), so a call can be held in flight
struct HeldTool {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;

    mcp::ToolDefinition definition() {
        mcp::ToolDefinition def;
        def.name = "hold";
        def.description = "Blocks until released";
        def.execute = [this](const json&, mcp::ToolContext&) {
            std::unique_lock<std::mutex> lock(mutex);
            entered = true;
            cv.notify_all();
            cv.wait_for(lock, std::chrono::milliseconds(1500), [this] { return released; });
            return json{{"held", true}};
        };
        return def;
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(5), [this] { return entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }
};

} // anonymous namespace

TEST_CASE("Stateful delete of a busy session does not stall other sessions",
          "[StatefulTransportManager][concurrency]") {
    HeldTool hold;
    auto registry = std::make_shared<mcp::ToolRegistry>();
    registry->registerTool(hold.definition());

    boost::asio::io_context ioc;
    SessionManager sessions(ioc, SessionManagerOptions{});
    StatefulTransportManager manager(mcp::McpServer::factory(registry, mcp::ServerInfo{}, mcp::McpServerOptions{}),
                                     sessions);
    auto ctx = core::RequestContext::create("test");

    auto busy = manager.initializeAndHandle(Headers{}, initializeRequest(), ctx).sessionId;
    auto idle = manager.initializeAndHandle(Headers{}, initializeRequest(), ctx).sessionId;
    REQUIRE(busy.has_value());
    REQUIRE(idle.has_value());

    auto inFlight = std::async(std::launch::async, [&] {
        return manager.handleRequest(Headers{}, rpcRequest("tools/call", 5, json{{"name", "hold"}}),
                                     ctx, busy).statusCode;
    });
    hold.waitEntered();

    // DELETE waits for the held call before the handler finishes closing
    auto deletion = std::async(std::launch::async, [&] {
        return manager.handleDeleteRequest(*busy, ctx).statusCode;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    auto ping = manager.handleRequest(Headers{}, rpcRequest("ping", 6), ctx, idle);
    auto elapsed = std::chrono::steady_clock::now() - start;

    hold.release();

    REQUIRE(ping.statusCode == 200);
    REQUIRE(elapsed < std::chrono::milliseconds(500));
    REQUIRE(deletion.get() == 204);
    REQUIRE(inFlight.get() == 200);
    REQUIRE(manager.activeHandlerCount() == 1);
    REQUIRE(manager.handleRequest(Headers{}, rpcRequest("ping", 7), ctx, busy).statusCode == 404);
}
