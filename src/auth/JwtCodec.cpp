#include "auth/JwtCodec.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace gitmcp {
namespace auth {
namespace jwt {

using json = nlohmann::json;

namespace {

bool isBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '-' || c == '_';
}

std::optional<json> parseObject(const std::string& text) {
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded() || !value.is_object()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::string base64UrlEncode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));

    std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (auto& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return encoded;
}

std::optional<std::string> base64UrlDecode(const std::string& text) {
    std::string input = text;
    while (!input.empty() && input.back() == '=') {
        input.pop_back();
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    for (auto& c : input) {
        if (!isBase64UrlChar(c)) {
            return std::nullopt;
        }
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }

    size_t padding = (4 - input.size() % 4) % 4;
    input.append(padding, '=');
    if (input.empty()) {
        return std::string();
    }

    std::vector<unsigned char> out(input.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the zero bytes produced by padding
    size_t length = static_cast<size_t>(written) - padding;
    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              out.data(), &len)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::optional<DecodedToken> decode(const std::string& token) {
    auto first = token.find('.');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto headerText = base64UrlDecode(token.substr(0, first));
    auto payloadText = base64UrlDecode(token.substr(first + 1, second - first - 1));
    auto signature = base64UrlDecode(token.substr(second + 1));
    if (!headerText || !payloadText || !signature) {
        return std::nullopt;
    }

    auto header = parseObject(*headerText);
    auto payload = parseObject(*payloadText);
    if (!header || !payload) {
        return std::nullopt;
    }

    DecodedToken decoded;
    decoded.header = std::move(*header);
    decoded.payload = std::move(*payload);
    decoded.signingInput = token.substr(0, second);
    decoded.signature = std::move(*signature);
    return decoded;
}

bool verifyHs256(const DecodedToken& token, const std::string& secret) {
    std::string expected = hmacSha256(secret, token.signingInput);
    if (token.signature.size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(token.signature.data(), expected.data(), expected.size()) == 0;
}

std::string encodeHs256(const json& claims, const std::string& secret) {
    static const json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    std::string signingInput = base64UrlEncode(header.dump()) + "." + base64UrlEncode(claims.dump());
    return signingInput + "." + base64UrlEncode(hmacSha256(secret, signingInput));
}

} // namespace jwt
} // namespace auth
} // namespace gitmcp
