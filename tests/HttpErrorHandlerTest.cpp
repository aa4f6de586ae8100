#include <catch2/catch.hpp>
#include "transport/HttpErrorHandler.hpp"
#include "mcp/ProtocolHandler.hpp"

using namespace gitmcp;
using namespace gitmcp::transport;
using core::JsonRpcErrorCode;
using core::McpError;

TEST_CASE("HttpErrorHandler status mapping", "[HttpErrorHandler]") {
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::NotFound) == 404);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::Unauthorized) == 401);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::Forbidden) == 403);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::ParseError) == 400);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::InvalidRequest) == 400);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::InvalidParams) == 400);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::ValidationError) == 400);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::Conflict) == 409);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::RateLimited) == 429);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::ServiceUnavailable) == 503);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::InternalError) == 500);
    REQUIRE(HttpErrorHandler::statusFor(JsonRpcErrorCode::InitializationFailed) == 500);
}

TEST_CASE("HttpErrorHandler McpError keeps code, message and data", "[HttpErrorHandler]") {
    auto ctx = core::RequestContext::create("test");
    McpError error(JsonRpcErrorCode::Forbidden, "Not allowed", json{{"reason", "tenant"}});

    auto res = HttpErrorHandler::handle(error, ctx, 12);

    REQUIRE(res.statusCode == 403);
    const json& body = *res.body();
    REQUIRE(body["jsonrpc"] == "2.0");
    REQUIRE(body["error"]["code"] == -32005);
    REQUIRE(body["error"]["message"] == "Not allowed");
    REQUIRE(body["error"]["data"]["reason"] == "tenant");
    REQUIRE(body["id"] == 12);
}

TEST_CASE("HttpErrorHandler hides unexpected exception detail", "[HttpErrorHandler]") {
    auto ctx = core::RequestContext::create("test");
    std::runtime_error error("database password is hunter2");

    auto res = HttpErrorHandler::handle(error, ctx);

    REQUIRE(res.statusCode == 500);
    const json& body = *res.body();
    REQUIRE(body["error"]["code"] == -32603);
    REQUIRE(body["error"]["message"] == "Internal error");
    REQUIRE(body["id"].is_null());
    REQUIRE(body.dump().find("hunter2") == std::string::npos);
}

TEST_CASE("HttpErrorHandler closed handler maps to session expired", "[HttpErrorHandler]") {
    auto ctx = core::RequestContext::create("test");

    auto res = HttpErrorHandler::handle(mcp::HandlerClosedError(), ctx, "req-1");

    REQUIRE(res.statusCode == 404);
    REQUIRE((*res.body())["error"]["code"] == -32001);
    REQUIRE((*res.body())["id"] == "req-1");
}

TEST_CASE("HttpErrorHandler extractRequestId", "[HttpErrorHandler]") {
    REQUIRE(HttpErrorHandler::extractRequestId(json{{"id", 5}}) == 5);
    REQUIRE(HttpErrorHandler::extractRequestId(json{{"id", "abc"}}) == "abc");
    REQUIRE(HttpErrorHandler::extractRequestId(json{{"id", json::object()}}).is_null());
    REQUIRE(HttpErrorHandler::extractRequestId(json::array({json{{"id", 1}}})).is_null());
    REQUIRE(HttpErrorHandler::extractRequestId(json()).is_null());
}
