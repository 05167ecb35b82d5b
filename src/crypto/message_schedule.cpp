/**
 * @file message_schedule.cpp
 * @brief Реализация расширения расписания сообщения
 */

#include "message_schedule.hpp"
#include "bit_ops.hpp"
#include "block_builder.hpp"
#include "../log/logger.hpp"

namespace stepsha::crypto {

Word schedule_word(const MessageSchedule& schedule, std::size_t i) noexcept {
    return schedule[i - 16] + small_sigma0(schedule[i - 15]) +
           schedule[i - 7] + small_sigma1(schedule[i - 2]);
}

MessageSchedule expand_schedule(const Block& block) {
    MessageSchedule schedule{};

    // W[0..15] = слова из блока
    const auto words = block_words(block);
    for (std::size_t i = 0; i < words.size(); ++i) {
        schedule[i] = words[i];
    }

    // W[16..63] = расширение
    for (std::size_t i = constants::BLOCK_WORDS; i < constants::ROUNDS; ++i) {
        schedule[i] = schedule_word(schedule, i);
    }

    log::debug("Расписание расширено: W[63] = {:08x}", schedule[constants::ROUNDS - 1]);

    return schedule;
}

} // namespace stepsha::crypto
