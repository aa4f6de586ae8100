#include "transport/ProtocolVersion.hpp"
#include "core/McpError.hpp"
#include "server/Logger.hpp"
#include <algorithm>

namespace gitmcp {
namespace transport {

const std::vector<std::string>& supportedProtocolVersions() {
    static const std::vector<std::string> versions = {"2025-03-26", "2025-06-18"};
    return versions;
}

bool isSupportedProtocolVersion(const std::string& version) {
    const auto& versions = supportedProtocolVersions();
    return std::find(versions.begin(), versions.end(), version) != versions.end();
}

const std::string& latestProtocolVersion() {
    return supportedProtocolVersions().back();
}

ProtocolVersionCheck negotiateProtocolVersion(const Headers& headers) {
    ProtocolVersionCheck check;

    auto requested = headers.get(kProtocolVersionHeader);
    if (!requested || requested->empty()) {
        check.version = kDefaultProtocolVersion;
        return check;
    }

    check.version = *requested;
    if (isSupportedProtocolVersion(*requested)) {
        return check;
    }

    LOG_WARN("Unsupported MCP protocol version requested: " + *requested);
    json data = {
        {"requested", *requested},
        {"supported", supportedProtocolVersions()}
    };
    check.error = TransportResponse::withBody(
        400,
        core::makeJsonRpcError(core::JsonRpcErrorCode::InvalidRequest,
                               "Unsupported MCP protocol version: " + *requested,
                               nullptr, data));
    return check;
}

} // namespace transport
} // namespace gitmcp
