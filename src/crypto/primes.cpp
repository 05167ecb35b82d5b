/**
 * @file primes.cpp
 * @brief Пробное деление для поиска простых чисел
 */

#include "primes.hpp"

namespace stepsha::crypto {

bool is_prime(uint32_t n) noexcept {
    if (n < 2) {
        return false;
    }

    // Полный перебор [2, n), без остановки на sqrt(n)
    for (uint32_t divisor = 2; divisor < n; ++divisor) {
        if (n % divisor == 0) {
            return false;
        }
    }
    return true;
}

PrimeTable first_primes() noexcept {
    PrimeTable primes{};

    std::size_t found = 0;
    for (uint32_t candidate = 2; found < primes.size(); ++candidate) {
        if (is_prime(candidate)) {
            primes[found++] = candidate;
        }
    }

    return primes;
}

} // namespace stepsha::crypto
