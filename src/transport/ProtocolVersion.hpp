#pragma once

#include "transport/TransportTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace transport {

// Assumed when the client sends no MCP-Protocol-Version header
constexpr const char* kDefaultProtocolVersion = "2025-03-26";

// Oldest first
const std::vector<std::string>& supportedProtocolVersions();

bool isSupportedProtocolVersion(const std::string& version);

const std::string& latestProtocolVersion();

struct ProtocolVersionCheck {
    std::string version;                     // resolved version
    std::optional<TransportResponse> error;  // set when the request must be rejected
};

/**
 * Resolve the MCP-Protocol-Version header. Absent -> the default (oldest)
 * version; present but unknown -> 400 with data {requested, supported}.
 */
ProtocolVersionCheck negotiateProtocolVersion(const Headers& headers);

} // namespace transport
} // namespace gitmcp
