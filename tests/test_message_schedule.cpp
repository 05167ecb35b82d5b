/**
 * @file test_message_schedule.cpp
 * @brief Тесты битовых функций и расширения расписания
 */

#include <gtest/gtest.h>
#include <string>

#include "crypto/bit_ops.hpp"
#include "crypto/block_builder.hpp"
#include "crypto/message_schedule.hpp"

namespace stepsha::tests {

/**
 * @brief Класс тестов для расписания сообщения
 */
class MessageScheduleTest : public ::testing::Test {
protected:
    crypto::MessageSchedule expand(std::string_view msg) {
        auto block = crypto::build_block(msg);
        EXPECT_TRUE(block.has_value());
        return crypto::expand_schedule(block.value_or(Block{}));
    }
};

/**
 * @brief Тест: rotr циклический, shr теряет биты
 */
TEST_F(MessageScheduleTest, RotateAndShift) {
    EXPECT_EQ(crypto::rotr(0x00000001u, 1), 0x80000000u);
    EXPECT_EQ(crypto::rotr(0x12345678u, 8), 0x78123456u);
    EXPECT_EQ(crypto::rotr(crypto::rotr(0xdeadbeefu, 7), 25), 0xdeadbeefu);

    EXPECT_EQ(crypto::shr(0x00000001u, 1), 0u);
    EXPECT_EQ(crypto::shr(0x80000000u, 31), 1u);
    EXPECT_EQ(crypto::shr(0xffffffffu, 10), 0x003fffffu);
}

/**
 * @brief Тест: дополнение остаётся 32-битным
 */
TEST_F(MessageScheduleTest, ComplementIs32Bit) {
    EXPECT_EQ(crypto::complement(0u), 0xffffffffu);
    EXPECT_EQ(crypto::complement(0xffffffffu), 0u);
    EXPECT_EQ(crypto::complement(0x0f0f0f0fu), 0xf0f0f0f0u);
}

/**
 * @brief Тест: Ch выбирает f там, где e = 1, и g там, где e = 0
 */
TEST_F(MessageScheduleTest, ChooseAndMajority) {
    EXPECT_EQ(crypto::ch(0xffffffffu, 0x12345678u, 0x9abcdef0u), 0x12345678u);
    EXPECT_EQ(crypto::ch(0x00000000u, 0x12345678u, 0x9abcdef0u), 0x9abcdef0u);
    EXPECT_EQ(crypto::ch(0xffff0000u, 0xaaaaaaaau, 0x55555555u), 0xaaaa5555u);

    EXPECT_EQ(crypto::maj(0xffffffffu, 0xffffffffu, 0u), 0xffffffffu);
    EXPECT_EQ(crypto::maj(0xf0f0f0f0u, 0x0ff00ff0u, 0u), 0x00f000f0u);
}

/**
 * @brief Тест: W[0..15] - слова блока в big-endian
 */
TEST_F(MessageScheduleTest, LeadingWordsFromBlock) {
    auto block = crypto::build_block("The quick brown fox");
    ASSERT_TRUE(block.has_value());

    const auto schedule = crypto::expand_schedule(*block);
    for (std::size_t i = 0; i < 16; ++i) {
        const Word expected = (static_cast<Word>((*block)[i * 4]) << 24) |
                              (static_cast<Word>((*block)[i * 4 + 1]) << 16) |
                              (static_cast<Word>((*block)[i * 4 + 2]) << 8) |
                              static_cast<Word>((*block)[i * 4 + 3]);
        EXPECT_EQ(schedule[i], expected) << "W[" << i << "]";
    }
}

/**
 * @brief Тест: известные слова расписания для "abc" (FIPS 180-2, приложение B.1)
 */
TEST_F(MessageScheduleTest, AbcSchedule) {
    const auto schedule = expand("abc");

    EXPECT_EQ(schedule[0], 0x61626380u);
    EXPECT_EQ(schedule[15], 0x00000018u);
    EXPECT_EQ(schedule[16], 0x61626380u);
    EXPECT_EQ(schedule[17], 0x000f0000u);
    EXPECT_EQ(schedule[18], 0x7da86405u);
    EXPECT_EQ(schedule[19], 0x600003c6u);
    EXPECT_EQ(schedule[63], 0x12b1edebu);
}

/**
 * @brief Тест: W[16..63] удовлетворяют рекуррентной формуле
 */
TEST_F(MessageScheduleTest, RecurrenceHolds) {
    for (std::string_view msg : {"", "a", "88484", "hello, world",
                                 "0123456789012345678901234567890123456789012345678901234"}) {
        const auto w = expand(msg);
        for (std::size_t i = 16; i < 64; ++i) {
            const Word s0 = crypto::rotr(w[i - 15], 7) ^ crypto::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            const Word s1 = crypto::rotr(w[i - 2], 17) ^ crypto::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            const Word expected = static_cast<Word>(w[i - 16] + s0 + w[i - 7] + s1);
            EXPECT_EQ(w[i], expected) << "\"" << msg << "\" W[" << i << "]";
            EXPECT_EQ(w[i], crypto::schedule_word(w, i));
        }
    }
}

} // namespace stepsha::tests
