/**
 * @file round_constants.hpp
 * @brief Вычисление констант SHA256 из простых чисел
 *
 * Вместо таблиц, скопированных из FIPS 180-4, константы выводятся:
 * - H0..H7: первые 32 бита дробной части квадратных корней первых 8 простых
 * - K0..K63: первые 32 бита дробной части кубических корней первых 64 простых
 *
 * Результат вычисляется один раз и дальше используется только для чтения.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>

namespace stepsha::crypto {

/// @brief Начальные значения хеша (и начальное состояние регистров a..h)
using InitialHash = std::array<Word, constants::STATE_WORDS>;

/// @brief Константы раундов K
using RoundConstants = std::array<Word, constants::ROUNDS>;

/**
 * @brief Полный набор констант SHA256
 */
struct ConstantSet {
    InitialHash h;
    RoundConstants k;
};

/**
 * @brief Степень корня
 */
enum class RootDegree : unsigned {
    Square = 2,
    Cube = 3
};

/**
 * @brief Первые 32 бита дробной части корня из простого числа
 *
 * Вычисляет floor(frac(prime^(1/degree)) * 2^32). Оценка в long double
 * уточняется точной целочисленной проверкой, поэтому результат
 * совпадает с опубликованными константами бит в бит.
 *
 * @param prime Положительное простое число (не больше 311)
 * @param degree Степень корня
 * @return Word Усечённая (не округлённая) дробная часть
 */
[[nodiscard]] Word fractional_root_bits(uint32_t prime, RootDegree degree) noexcept;

/**
 * @brief Вычислить начальные значения H0..H7
 */
[[nodiscard]] InitialHash derive_h() noexcept;

/**
 * @brief Вычислить константы раундов K0..K63
 */
[[nodiscard]] RoundConstants derive_k() noexcept;

/**
 * @brief Получить набор констант процесса
 *
 * Вычисляется при первом вызове (потокобезопасная инициализация
 * локальной static переменной), затем только читается.
 */
[[nodiscard]] const ConstantSet& constant_set() noexcept;

} // namespace stepsha::crypto
