/**
 * @file compressor.hpp
 * @brief Функция сжатия SHA256: 64 раунда над регистрами a..h
 *
 * Один раунд:
 * @code
 * temp1 = h + Σ1(e) + Ch(e, f, g) + K[i] + W[i]
 * temp2 = Σ0(a) + Maj(a, b, c)
 * h, g, f = g, f, e
 * e       = d + temp1
 * d, c, b = c, b, a
 * a       = temp1 + temp2
 * @endcode
 * Все сложения по модулю 2^32.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "message_schedule.hpp"
#include "round_constants.hpp"

#include <array>
#include <functional>

namespace stepsha::crypto {

/// @brief Значения регистров a..h в порядке a, b, ..., h
using Registers = std::array<Word, constants::STATE_WORDS>;

/**
 * @brief Рабочее состояние: восемь 32-битных регистров
 *
 * Существует только на время сжатия одного сообщения.
 */
struct WorkingState {
    Word a = 0;
    Word b = 0;
    Word c = 0;
    Word d = 0;
    Word e = 0;
    Word f = 0;
    Word g = 0;
    Word h = 0;

    /**
     * @brief Начальное состояние: a..h = H0..H7
     */
    [[nodiscard]] static WorkingState from_initial(const InitialHash& initial) noexcept;

    /**
     * @brief Регистры в виде массива (a первым)
     */
    [[nodiscard]] Registers registers() const noexcept;

    [[nodiscard]] bool operator==(const WorkingState&) const noexcept = default;
};

/**
 * @brief Наблюдатель за раундами
 *
 * Вызывается после каждого раунда с номером раунда (0..63)
 * и состоянием после него.
 */
using RoundObserver = std::function<void(std::size_t round, const WorkingState& state)>;

/**
 * @brief Выполнить один раунд сжатия
 *
 * @param state Состояние регистров (будет модифицировано)
 * @param k Константа раунда K[i]
 * @param w Слово расписания W[i]
 */
void compress_round(WorkingState& state, Word k, Word w) noexcept;

/**
 * @brief Выполнить все 64 раунда
 *
 * @param schedule Расписание сообщения
 * @param set Набор констант (H задаёт начальное состояние, K - раунды)
 * @param observer Опциональный наблюдатель за раундами
 * @return WorkingState Состояние после раунда 63
 */
[[nodiscard]] WorkingState compress(
    const MessageSchedule& schedule,
    const ConstantSet& set,
    const RoundObserver& observer = {}
);

} // namespace stepsha::crypto
