#include "transport/RequestRouting.hpp"
#include <algorithm>
#include <cctype>

namespace gitmcp {
namespace transport {

std::string sessionModeName(SessionMode mode) {
    switch (mode) {
        case SessionMode::Stateful:  return "stateful";
        case SessionMode::Stateless: return "stateless";
        case SessionMode::Auto:      return "auto";
    }
    return "auto";
}

std::optional<SessionMode> parseSessionMode(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "stateful") return SessionMode::Stateful;
    if (lower == "stateless") return SessionMode::Stateless;
    if (lower == "auto") return SessionMode::Auto;
    return std::nullopt;
}

namespace {

bool isInitializeCall(const json& message) {
    return message.is_object()
        && message.contains("method")
        && message["method"].is_string()
        && message["method"].get<std::string>() == "initialize";
}

} // anonymous namespace

bool isInitializeMessage(const json& body) {
    if (body.is_array()) {
        return std::any_of(body.begin(), body.end(), isInitializeCall);
    }
    return isInitializeCall(body);
}

InboundRequest classifyRequest(const json& body, const std::optional<std::string>& sessionIdHeader) {
    std::optional<std::string> sessionId;
    if (sessionIdHeader && !sessionIdHeader->empty()) {
        sessionId = sessionIdHeader;
    }

    if (isInitializeMessage(body)) {
        return InitializeRequest{sessionId};
    }
    if (sessionId) {
        return SessionedRequest{*sessionId};
    }
    return AnonymousRequest{};
}

namespace {

struct RouteVisitor {
    SessionMode mode;

    RouteDecision operator()(const InitializeRequest& req) const {
        if (mode == SessionMode::Stateless) {
            return {RouteKind::Stateless, req.suppliedSessionId};
        }
        return {RouteKind::StatefulInitialize, std::nullopt};
    }

    RouteDecision operator()(const SessionedRequest& req) const {
        if (mode == SessionMode::Stateless) {
            return {RouteKind::Stateless, req.sessionId};
        }
        return {RouteKind::StatefulRequest, req.sessionId};
    }

    RouteDecision operator()(const AnonymousRequest&) const {
        if (mode == SessionMode::Stateful) {
            return {RouteKind::MissingSessionId, std::nullopt};
        }
        return {RouteKind::Stateless, std::nullopt};
    }
};

} // anonymous namespace

RouteDecision decideRoute(const InboundRequest& request, SessionMode mode) {
    return std::visit(RouteVisitor{mode}, request);
}

} // namespace transport
} // namespace gitmcp
