#include "../../include/random_utils.hpp"
#include <iomanip>
#include <sstream>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

namespace optipack {

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix() {
    return std::to_string(next_u64());
}

std::string RandomUtils::random_hex_id() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << next_u64()
        << std::setw(16) << next_u64();
    return oss.str();
}

} // namespace optipack
