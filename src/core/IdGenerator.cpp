#include "core/IdGenerator.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace gitmcp {
namespace core {

namespace {

// random_generator is not safe to share between threads
boost::uuids::random_generator& threadGenerator() {
    thread_local boost::uuids::random_generator gen;
    return gen;
}

} // anonymous namespace

std::string IdGenerator::generateUuid() {
    return boost::uuids::to_string(threadGenerator()());
}

std::string IdGenerator::generateRequestId() {
    static const char charset[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr size_t charsetSize = sizeof(charset) - 1;

    boost::uuids::uuid raw = threadGenerator()();
    std::string id;
    id.reserve(11);
    for (size_t i = 0; i < 10; ++i) {
        if (i == 5) id.push_back('-');
        id.push_back(charset[raw.data[i] % charsetSize]);
    }
    return id;
}

} // namespace core
} // namespace gitmcp
