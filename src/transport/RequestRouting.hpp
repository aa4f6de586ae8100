#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace gitmcp {
namespace transport {

using json = nlohmann::json;

enum class SessionMode {
    Stateful,
    Stateless,
    Auto
};

std::string sessionModeName(SessionMode mode);

// Accepts "stateful", "stateless", "auto" (case-insensitive)
std::optional<SessionMode> parseSessionMode(const std::string& name);

// =============================================================================
// Inbound request classification
// =============================================================================

// Body carries an "initialize" call
struct InitializeRequest {
    std::optional<std::string> suppliedSessionId;
};

// Non-initialize request bearing an Mcp-Session-Id header
struct SessionedRequest {
    std::string sessionId;
};

// Non-initialize request without a session id
struct AnonymousRequest {
};

using InboundRequest = std::variant<InitializeRequest, SessionedRequest, AnonymousRequest>;

/**
 * True if the message (or any element of a batch) is an "initialize" call
 */
bool isInitializeMessage(const json& body);

InboundRequest classifyRequest(const json& body, const std::optional<std::string>& sessionIdHeader);

// =============================================================================
// Routing
// =============================================================================

enum class RouteKind {
    StatefulInitialize,   // StatefulTransportManager::initializeAndHandle
    StatefulRequest,      // StatefulTransportManager::handleRequest
    Stateless,            // StatelessTransportManager::handleRequest
    MissingSessionId      // 400, stateful mode without a session id
};

struct RouteDecision {
    RouteKind kind;
    std::optional<std::string> sessionId;
};

/**
 * Pure mapping from request class and configured mode to the manager call.
 *
 *   mode       | initialize         | with session id   | without
 *   -----------+--------------------+-------------------+-----------------
 *   stateful   | StatefulInitialize | StatefulRequest   | MissingSessionId
 *   auto       | StatefulInitialize | StatefulRequest   | Stateless
 *   stateless  | Stateless          | Stateless         | Stateless
 */
RouteDecision decideRoute(const InboundRequest& request, SessionMode mode);

} // namespace transport
} // namespace gitmcp
