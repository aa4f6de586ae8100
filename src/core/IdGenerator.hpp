#pragma once

#include <string>

namespace gitmcp {
namespace core {

/**
 * Random identifiers drawn from the operating system entropy source
 * (boost::uuids::random_generator).
 */
class IdGenerator {
public:
    // RFC 4122 version 4 UUID, used for session ids
    static std::string generateUuid();

    // Short "ABCDE-FGHIJ" id for request contexts and log correlation
    static std::string generateRequestId();
};

} // namespace core
} // namespace gitmcp
