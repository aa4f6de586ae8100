#include "auth/AuthTypes.hpp"
#include <algorithm>
#include <cctype>

namespace gitmcp {
namespace auth {

std::string authModeName(AuthMode mode) {
    return mode == AuthMode::Jwt ? "jwt" : "none";
}

std::optional<AuthMode> parseAuthMode(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower.empty()) return AuthMode::None;
    if (lower == "jwt") return AuthMode::Jwt;
    return std::nullopt;
}

} // namespace auth
} // namespace gitmcp
