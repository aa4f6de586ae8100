#include <catch2/catch.hpp>
#include "auth/AuthMiddleware.hpp"
#include "auth/JwtCodec.hpp"
#include "auth/JwtStrategy.hpp"
#include "core/McpError.hpp"
#include <functional>

using namespace gitmcp;
using namespace gitmcp::auth;
using json = nlohmann::json;

namespace {

const std::string kSecret = "unit-test-secret";
const int64_t kNow = 1700000000;

JwtStrategy::Clock fixedClock() {
    return []() { return kNow; };
}

std::shared_ptr<JwtStrategy> signedStrategy() {
    JwtStrategyOptions options;
    options.secretKey = kSecret;
    return std::make_shared<JwtStrategy>(options, fixedClock());
}

json ciClaims() {
    return json{{"cid", "ci"}, {"tid", "acme"}, {"sub", "bot"}, {"scp", {"git:read", "git:write"}},
                {"exp", kNow + 600}};
}

std::string failureMessage(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const core::McpError& e) {
        REQUIRE(e.code() == core::JsonRpcErrorCode::Unauthorized);
        return e.what();
    }
    FAIL("expected McpError");
    return {};
}

} // anonymous namespace

// =============================================================================
// JwtCodec
// =============================================================================

TEST_CASE("base64url uses the URL alphabet without padding", "[Auth][Jwt]") {
    REQUIRE(jwt::base64UrlEncode("") == "");
    REQUIRE(jwt::base64UrlEncode("f") == "Zg");
    REQUIRE(jwt::base64UrlEncode("\xfb\xff") == "-_8");

    REQUIRE(jwt::base64UrlDecode("Zm9vYg") == std::optional<std::string>("foob"));
    REQUIRE(jwt::base64UrlDecode("Zm9vYg==") == std::optional<std::string>("foob"));
    REQUIRE(jwt::base64UrlDecode("-_8") == std::optional<std::string>("\xfb\xff"));
    REQUIRE_FALSE(jwt::base64UrlDecode("a+b/").has_value());
    REQUIRE_FALSE(jwt::base64UrlDecode("abcde").has_value());
}

TEST_CASE("hmacSha256 matches RFC 4231 test case 2", "[Auth][Jwt]") {
    std::string mac = jwt::hmacSha256("Jefe", "what do ya want for nothing?");
    REQUIRE(mac.size() == 32);

    static const char* hex = "0123456789abcdef";
    std::string digest;
    for (unsigned char c : mac) {
        digest += hex[c >> 4];
        digest += hex[c & 0x0f];
    }
    REQUIRE(digest == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("jwt decode of a signed token", "[Auth][Jwt]") {
    std::string token = jwt::encodeHs256(json{{"cid", "x"}}, kSecret);

    auto decoded = jwt::decode(token);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->header["alg"] == "HS256");
    REQUIRE(decoded->payload["cid"] == "x");
    REQUIRE(jwt::verifyHs256(*decoded, kSecret));
    REQUIRE_FALSE(jwt::verifyHs256(*decoded, "other-secret"));

    REQUIRE_FALSE(jwt::decode("only.two").has_value());
    REQUIRE_FALSE(jwt::decode("a.b.c.d").has_value());
    REQUIRE_FALSE(jwt::decode(jwt::base64UrlEncode("[1]") + ".e30.").has_value());
}

// =============================================================================
// JwtStrategy
// =============================================================================

TEST_CASE("JwtStrategy maps claims into AuthInfo", "[Auth][Jwt]") {
    auto strategy = signedStrategy();
    std::string token = jwt::encodeHs256(ciClaims(), kSecret);

    AuthInfo info = strategy->verify(token);
    REQUIRE(info.token == token);
    REQUIRE(info.clientId == "ci");
    REQUIRE(info.tenantId == std::optional<std::string>("acme"));
    REQUIRE(info.subject == std::optional<std::string>("bot"));
    REQUIRE(info.scopes == std::vector<std::string>{"git:read", "git:write"});
    REQUIRE_FALSE(strategy->verificationBypassed());
}

TEST_CASE("JwtStrategy claim fallbacks", "[Auth][Jwt]") {
    auto strategy = signedStrategy();

    AuthInfo info = strategy->verify(jwt::encodeHs256(
        json{{"client_id", "legacy"}, {"scope", " git:read  git:admin "}}, kSecret));

    REQUIRE(info.clientId == "legacy");
    REQUIRE(info.scopes == std::vector<std::string>{"git:read", "git:admin"});
    REQUIRE_FALSE(info.tenantId.has_value());
    REQUIRE_FALSE(info.subject.has_value());
}

TEST_CASE("JwtStrategy rejections", "[Auth][Jwt]") {
    auto strategy = signedStrategy();
    auto verify = [&](const std::string& token) { return [strategy, token] { strategy->verify(token); }; };

    SECTION("signature from another secret") {
        REQUIRE(failureMessage(verify(jwt::encodeHs256(ciClaims(), "wrong"))) == "Token verification failed.");
    }
    SECTION("tampered payload") {
        std::string token = jwt::encodeHs256(ciClaims(), kSecret);
        auto first = token.find('.');
        auto second = token.find('.', first + 1);
        json forged = ciClaims();
        forged["cid"] = "admin";
        std::string tampered = token.substr(0, first + 1) + jwt::base64UrlEncode(forged.dump()) + token.substr(second);
        REQUIRE(failureMessage(verify(tampered)) == "Token verification failed.");
    }
    SECTION("alg none") {
        std::string unsigned_ = jwt::base64UrlEncode(R"({"alg":"none"})") + "."
                              + jwt::base64UrlEncode(ciClaims().dump()) + ".";
        REQUIRE(failureMessage(verify(unsigned_)) == "Token verification failed.");
    }
    SECTION("malformed") {
        REQUIRE(failureMessage(verify("not-a-jwt")) == "Token verification failed.");
    }
    SECTION("expired") {
        json claims = ciClaims();
        claims["exp"] = kNow;
        REQUIRE(failureMessage(verify(jwt::encodeHs256(claims, kSecret))) == "Token has expired.");
    }
    SECTION("not yet valid") {
        json claims = ciClaims();
        claims["nbf"] = kNow + 60;
        REQUIRE(failureMessage(verify(jwt::encodeHs256(claims, kSecret))) == "Token verification failed.");
    }
    SECTION("missing client id") {
        json claims = ciClaims();
        claims.erase("cid");
        REQUIRE(failureMessage(verify(jwt::encodeHs256(claims, kSecret)))
                == "Invalid token: missing 'cid' or 'client_id' claim.");
    }
    SECTION("empty scopes") {
        json claims = ciClaims();
        claims["scp"] = json::array();
        REQUIRE(failureMessage(verify(jwt::encodeHs256(claims, kSecret)))
                == "Token must contain valid, non-empty scopes.");

        claims.erase("scp");
        claims["scope"] = "   ";
        REQUIRE(failureMessage(verify(jwt::encodeHs256(claims, kSecret)))
                == "Token must contain valid, non-empty scopes.");
    }
}

TEST_CASE("JwtStrategy without a secret", "[Auth][Jwt]") {
    SECTION("development bypasses verification with the dev identity") {
        JwtStrategyOptions options;
        options.devClientId = "local";
        JwtStrategy strategy(options);

        REQUIRE(strategy.verificationBypassed());
        AuthInfo info = strategy.verify("anything");
        REQUIRE(info.token == "dev-mode-placeholder-token");
        REQUIRE(info.clientId == "local");
        REQUIRE(info.scopes == std::vector<std::string>{"dev-scope"});
    }
    SECTION("production refuses to start") {
        JwtStrategyOptions options;
        options.environment = "production";
        options.secretKey = "";
        try {
            JwtStrategy strategy(options);
            FAIL("expected McpError");
        } catch (const core::McpError& e) {
            REQUIRE(e.code() == core::JsonRpcErrorCode::ConfigurationError);
            REQUIRE(std::string(e.what()) == "MCP_AUTH_SECRET_KEY must be set for JWT auth in production.");
        }
    }
}

// =============================================================================
// AuthMiddleware
// =============================================================================

TEST_CASE("extractBearerToken", "[Auth]") {
    REQUIRE(AuthMiddleware::extractBearerToken(std::string("Bearer abc")) == std::optional<std::string>("abc"));
    REQUIRE_FALSE(AuthMiddleware::extractBearerToken(std::nullopt).has_value());
    REQUIRE_FALSE(AuthMiddleware::extractBearerToken(std::string("Basic abc")).has_value());
    REQUIRE_FALSE(AuthMiddleware::extractBearerToken(std::string("Bearer ")).has_value());
}

TEST_CASE("AuthMiddleware enriches the request context", "[Auth]") {
    AuthMiddleware middleware(signedStrategy());
    transport::Headers headers;
    headers.set("Authorization", "Bearer " + jwt::encodeHs256(ciClaims(), kSecret));

    auto root = core::RequestContext::create("test");
    auto ctx = middleware.authenticate(headers, root);

    REQUIRE(ctx.isAuthenticated());
    REQUIRE(ctx.clientId() == std::optional<std::string>("ci"));
    REQUIRE(ctx.tenantId() == std::optional<std::string>("acme"));
    REQUIRE(ctx.requestId() == root.requestId());
    REQUIRE(ctx.operation() == "test");
}

TEST_CASE("AuthMiddleware rejects missing or bad credentials", "[Auth]") {
    AuthMiddleware middleware(signedStrategy());
    auto ctx = core::RequestContext::create("test");

    auto codeFor = [&](const transport::Headers& headers) {
        try {
            middleware.authenticate(headers, ctx);
        } catch (const core::McpError& e) {
            return e.code();
        }
        return core::JsonRpcErrorCode::UnknownError;
    };

    REQUIRE(codeFor(transport::Headers{}) == core::JsonRpcErrorCode::Unauthorized);

    transport::Headers bad;
    bad.set("Authorization", "Bearer wrong");
    REQUIRE(codeFor(bad) == core::JsonRpcErrorCode::Unauthorized);
}

TEST_CASE("AuthMiddleware requires a strategy", "[Auth]") {
    REQUIRE_THROWS_AS(AuthMiddleware(nullptr), std::invalid_argument);
}

TEST_CASE("parseAuthMode", "[Auth]") {
    REQUIRE(parseAuthMode("none") == AuthMode::None);
    REQUIRE(parseAuthMode("") == AuthMode::None);
    REQUIRE(parseAuthMode("JWT") == AuthMode::Jwt);
    REQUIRE(authModeName(AuthMode::Jwt) == "jwt");
    REQUIRE_FALSE(parseAuthMode("token").has_value());
}
