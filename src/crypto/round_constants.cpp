/**
 * @file round_constants.cpp
 * @brief Вывод H и K из дробных частей корней простых чисел
 */

#include "round_constants.hpp"
#include "primes.hpp"

#include <cmath>
#include <cstdint>

namespace stepsha::crypto {

namespace {

/// @brief 128-битное целое для точной проверки x^3 <= p * 2^96
using uint128_t = unsigned __int128;

/// @brief Разрядность простых: 311 < 2^9
constexpr unsigned PRIME_BITS = 9;

/// @brief Разрядность cbrt(p) * 2^32 < 2^(32 + 3)
constexpr unsigned SCALED_CUBE_BITS = 32 + PRIME_BITS / 3;

// (scaled + 1)^3 < 2^105 и p * 2^96 < 2^105
static_assert(3 * SCALED_CUBE_BITS < 128, "куб оценки не помещается в 128 бит");
static_assert(PRIME_BITS + 32 * 3 < 128, "p * 2^96 не помещается в 128 бит");

/// @brief 2^32 в long double
constexpr long double TWO_POW_32 = 4294967296.0L;

uint128_t power(uint64_t base, unsigned exponent) noexcept {
    uint128_t result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= base;
    }
    return result;
}

} // anonymous namespace

Word fractional_root_bits(uint32_t prime, RootDegree degree) noexcept {
    const auto exponent = static_cast<unsigned>(degree);

    // === Шаг 1: оценка root * 2^32 с усечением к нулю ===
    const long double value = static_cast<long double>(prime);
    const long double root = degree == RootDegree::Square ? std::sqrt(value) : std::cbrt(value);
    uint64_t scaled = static_cast<uint64_t>(root * TWO_POW_32);

    // === Шаг 2: точное уточнение ===
    // scaled = floor(root * 2^32)  <=>  scaled^e <= prime * 2^(32e) < (scaled + 1)^e
    const uint128_t target = static_cast<uint128_t>(prime) << (32 * exponent);
    while (scaled > 0 && power(scaled, exponent) > target) {
        --scaled;
    }
    while (power(scaled + 1, exponent) <= target) {
        ++scaled;
    }

    // === Шаг 3: младшие 32 бита = дробная часть * 2^32 ===
    return static_cast<Word>(scaled & constants::WORD_MASK);
}

InitialHash derive_h() noexcept {
    const auto primes = first_primes();

    InitialHash h{};
    for (std::size_t i = 0; i < h.size(); ++i) {
        h[i] = fractional_root_bits(primes[i], RootDegree::Square);
    }
    return h;
}

RoundConstants derive_k() noexcept {
    const auto primes = first_primes();

    RoundConstants k{};
    for (std::size_t i = 0; i < k.size(); ++i) {
        k[i] = fractional_root_bits(primes[i], RootDegree::Cube);
    }
    return k;
}

const ConstantSet& constant_set() noexcept {
    static const ConstantSet set{derive_h(), derive_k()};
    return set;
}

} // namespace stepsha::crypto
