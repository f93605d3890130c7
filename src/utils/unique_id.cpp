#include "utils/unique_id.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace loradeck {

std::string generate_unique_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hi
        << std::setw(16) << lo;
    return oss.str();
}

}  // namespace loradeck
