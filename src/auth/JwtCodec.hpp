#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace gitmcp {
namespace auth {

/**
 * Compact JWS serialization (header.payload.signature) for HS256 tokens.
 * Only the pieces the JWT strategy needs: no JWK, no other algorithms.
 */
namespace jwt {

// RFC 4648 section 5 alphabet, no padding
std::string base64UrlEncode(const std::string& data);

// Accepts input with or without '=' padding; nullopt on any invalid character
std::optional<std::string> base64UrlDecode(const std::string& text);

// Raw 32-byte HMAC-SHA256 digest
std::string hmacSha256(const std::string& key, const std::string& data);

struct DecodedToken {
    nlohmann::json header;
    nlohmann::json payload;
    std::string signingInput;   // "<header>.<payload>" as it appeared on the wire
    std::string signature;      // decoded signature bytes
};

// Splits and decodes a token without checking the signature.
// nullopt when it is not three base64url parts with JSON object header and payload.
std::optional<DecodedToken> decode(const std::string& token);

// True when the signature is a valid HS256 MAC of the signing input
bool verifyHs256(const DecodedToken& token, const std::string& secret);

// Signed token with header {"alg":"HS256","typ":"JWT"}
std::string encodeHs256(const nlohmann::json& claims, const std::string& secret);

} // namespace jwt
} // namespace auth
} // namespace gitmcp
