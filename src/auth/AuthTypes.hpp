#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gitmcp {
namespace auth {

/**
 * Identity established from a verified bearer token
 */
struct AuthInfo {
    std::string token;
    std::string clientId;
    std::optional<std::string> tenantId;
    std::optional<std::string> subject;
    std::vector<std::string> scopes;
};

enum class AuthMode {
    None,
    Jwt
};

std::string authModeName(AuthMode mode);
std::optional<AuthMode> parseAuthMode(const std::string& name);

} // namespace auth
} // namespace gitmcp
