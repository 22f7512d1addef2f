#ifndef OPTIPACK_RANDOM_UTILS_HPP
#define OPTIPACK_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers for identifiers and temp names.
 *
 * The underlying std::mt19937_64 is thread_local, seeded from
 * std::random_device once per thread.
 */
namespace optipack::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Decimal suffix for temporary file and directory names.
     */
    std::string random_suffix();

    /**
     * @brief 128 random bits as 32 lowercase hex characters.
     *
     * Used for job and artifact identifiers.
     */
    std::string random_hex_id();

} // namespace optipack::RandomUtils

#endif // OPTIPACK_RANDOM_UTILS_HPP
