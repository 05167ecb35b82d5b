/**
 * @file message_schedule.hpp
 * @brief Расширение расписания сообщения W[0..63]
 *
 * W[0..15]  = слова блока (big-endian)
 * W[16..63] = W[i-16] + σ0(W[i-15]) + W[i-7] + σ1(W[i-2])  (mod 2^32)
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>

namespace stepsha::crypto {

/// @brief Расписание сообщения: 64 слова, по одному на раунд
using MessageSchedule = std::array<Word, constants::ROUNDS>;

/**
 * @brief Вычислить одно слово расписания по рекуррентной формуле
 *
 * @param schedule Расписание, в котором заполнены позиции [0, i)
 * @param i Индекс вычисляемого слова, 16 <= i < 64
 */
[[nodiscard]] Word schedule_word(const MessageSchedule& schedule, std::size_t i) noexcept;

/**
 * @brief Расширить блок до полного расписания
 *
 * @param block 512-битный блок
 * @return MessageSchedule 64 слова
 */
[[nodiscard]] MessageSchedule expand_schedule(const Block& block);

} // namespace stepsha::crypto
