#pragma once

#include "transport/McpEndpoint.hpp"
#include "transport/StatefulTransportManager.hpp"
#include "transport/TransportTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace gitmcp {
namespace server {

using json = nlohmann::json;

struct ServerStatusInfo {
    std::string name;
    std::string version;
    std::string description;
    std::string environment;
    std::string transport = "http";
};

/**
 * Top-level HTTP routing:
 *   GET /healthz        liveness check
 *   GET <mcp path>      server status
 *   *   <mcp path>      McpEndpoint (POST, DELETE, OPTIONS)
 * Everything else is 404.
 */
class RequestRouter {
public:
    RequestRouter(transport::McpEndpoint& endpoint,
                  const transport::StatefulTransportManager& stateful,
                  ServerStatusInfo info);

    transport::TransportResponse route(const transport::HttpRequest& request);

    json statusJson() const;

private:
    transport::TransportResponse withCors(const transport::HttpRequest& request,
                                          transport::TransportResponse response) const;

    transport::McpEndpoint& m_endpoint;
    const transport::StatefulTransportManager& m_stateful;
    ServerStatusInfo m_info;
};

} // namespace server
} // namespace gitmcp
