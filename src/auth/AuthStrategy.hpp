#pragma once

#include "auth/AuthTypes.hpp"
#include <memory>
#include <string>

namespace gitmcp {
namespace auth {

/**
 * Verifies a bearer token. Implementations throw core::McpError
 * (Unauthorized) when the token is not acceptable.
 */
class AuthStrategy {
public:
    virtual ~AuthStrategy() = default;

    virtual AuthInfo verify(const std::string& token) const = 0;
};

using AuthStrategyPtr = std::shared_ptr<const AuthStrategy>;

} // namespace auth
} // namespace gitmcp
