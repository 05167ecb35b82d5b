/**
 * @file bit_ops.hpp
 * @brief Битовые функции SHA256 (FIPS 180-4, секция 4.1.2)
 *
 * Все функции работают строго с 32-битными словами: сдвиги и
 * повороты не расширяют разрядность, сложения переполняются по модулю 2^32.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <bit>

namespace stepsha::crypto {

/// @brief Циклический сдвиг вправо на n бит
[[nodiscard]] constexpr Word rotr(Word x, int n) noexcept {
    return std::rotr(x, n);
}

/// @brief Логический сдвиг вправо (слева заполняется нулями)
[[nodiscard]] constexpr Word shr(Word x, int n) noexcept {
    return x >> n;
}

/**
 * @brief 32-битное дополнение (NOT)
 *
 * Маскируется явно: дополнение в более широком типе даёт
 * неверный результат в ch().
 */
[[nodiscard]] constexpr Word complement(Word x) noexcept {
    return x ^ constants::WORD_MASK;
}

/// @brief Ch(e, f, g): бит e выбирает между f и g
[[nodiscard]] constexpr Word ch(Word e, Word f, Word g) noexcept {
    return (e & f) ^ (complement(e) & g);
}

/// @brief Maj(a, b, c): побитовое большинство
[[nodiscard]] constexpr Word maj(Word a, Word b, Word c) noexcept {
    return (a & b) ^ (a & c) ^ (b & c);
}

/// @brief Σ0(a), используется в раунде сжатия
[[nodiscard]] constexpr Word big_sigma0(Word a) noexcept {
    return rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
}

/// @brief Σ1(e), используется в раунде сжатия
[[nodiscard]] constexpr Word big_sigma1(Word e) noexcept {
    return rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
}

/// @brief σ0(w), используется при расширении расписания
[[nodiscard]] constexpr Word small_sigma0(Word w) noexcept {
    return rotr(w, 7) ^ rotr(w, 18) ^ shr(w, 3);
}

/// @brief σ1(w), используется при расширении расписания
[[nodiscard]] constexpr Word small_sigma1(Word w) noexcept {
    return rotr(w, 17) ^ rotr(w, 19) ^ shr(w, 10);
}

} // namespace stepsha::crypto
