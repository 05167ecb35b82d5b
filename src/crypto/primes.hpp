/**
 * @file primes.hpp
 * @brief Генерация первых простых чисел
 *
 * Простые числа - источник констант SHA256: квадратные корни первых 8
 * дают начальные значения H, кубические корни первых 64 - константы K.
 */

#pragma once

#include "../core/constants.hpp"

#include <array>
#include <cstdint>

namespace stepsha::crypto {

/// @brief Первые 64 простых числа (2..311)
using PrimeTable = std::array<uint32_t, constants::PRIME_COUNT>;

/**
 * @brief Проверить число на простоту перебором делителей
 *
 * Число n >= 2 простое, если не делится ни на одно целое из [2, n).
 */
[[nodiscard]] bool is_prime(uint32_t n) noexcept;

/**
 * @brief Получить первые 64 простых числа, начиная с 2
 */
[[nodiscard]] PrimeTable first_primes() noexcept;

} // namespace stepsha::crypto
