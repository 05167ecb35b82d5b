/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 одного блока
 *
 * Проверяет известные тестовые векторы и совпадение с OpenSSL
 * для всех длин сообщения от 0 до 55 байт. OpenSSL используется
 * только здесь, как эталон.
 */

#include <gtest/gtest.h>
#include <array>
#include <format>
#include <memory>
#include <random>
#include <string>

#include <openssl/evp.h>

#include "crypto/sha256.hpp"
#include "core/types.hpp"

namespace stepsha::tests {

namespace {

using EVP_MD_CTX_unique_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

/**
 * @brief SHA256 через OpenSSL в hex
 */
std::string reference_sha256(ByteSpan data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;

    EVP_MD_CTX_unique_ptr const mdctx{EVP_MD_CTX_new(), ::EVP_MD_CTX_free};
    EXPECT_NE(mdctx.get(), nullptr);
    EXPECT_EQ(EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr), 1);
    EXPECT_EQ(EVP_DigestUpdate(mdctx.get(), data.data(), data.size()), 1);
    EXPECT_EQ(EVP_DigestFinal_ex(mdctx.get(), md.data(), &md_len), 1);

    std::string hex;
    for (unsigned int i = 0; i < md_len; ++i) {
        hex += std::format("{:02x}", md[i]);
    }
    return hex;
}

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // anonymous namespace

/**
 * @brief Класс тестов для SHA256
 */
class SHA256Test : public ::testing::Test {
protected:
    /// @brief Детерминированный генератор для случайных сообщений
    std::mt19937 rng_{20210701};

    Bytes random_message(std::size_t len) {
        std::uniform_int_distribution<int> dist(0, 255);
        Bytes msg(len);
        for (auto& byte : msg) {
            byte = static_cast<uint8_t>(dist(rng_));
        }
        return msg;
    }
};

/**
 * @brief Тест: "abc"
 *
 * SHA256("abc") = ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad
 */
TEST_F(SHA256Test, SimpleMessage) {
    auto digest = crypto::hash("abc");
    ASSERT_TRUE(digest.has_value()) << digest.error().message;

    EXPECT_EQ(*digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @brief Тест: пустое сообщение
 */
TEST_F(SHA256Test, EmptyMessage) {
    auto digest = crypto::hash("");
    ASSERT_TRUE(digest.has_value());

    EXPECT_EQ(*digest, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @brief Тест: демонстрационное сообщение, дайджест начинается с нулей
 */
TEST_F(SHA256Test, LeadingZeroDigest) {
    auto digest = crypto::hash("88484");
    ASSERT_TRUE(digest.has_value());

    EXPECT_EQ(*digest, "0000a456e7b5a5eb059e721fb431436883143101275c4077f83fe70298f5623d");
    EXPECT_EQ(digest->size(), 64u);
}

/**
 * @brief Тест: совпадение с OpenSSL для всех длин 0..55
 */
TEST_F(SHA256Test, MatchesReferenceForAllLengths) {
    for (std::size_t len = 0; len <= 55; ++len) {
        const auto msg = random_message(len);
        const ByteSpan span{msg.data(), msg.size()};

        auto digest = crypto::hash(span);
        ASSERT_TRUE(digest.has_value()) << len << " байт";
        EXPECT_EQ(*digest, reference_sha256(span)) << len << " байт";
    }
}

/**
 * @brief Тест: совпадение с OpenSSL для текстовых сообщений
 */
TEST_F(SHA256Test, MatchesReferenceForText) {
    for (std::string_view msg : {"a", "hello", "The quick brown fox jumps over the lazy dog",
                                 "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnop"}) {
        auto digest = crypto::hash(msg);
        ASSERT_TRUE(digest.has_value()) << msg;
        EXPECT_EQ(*digest, reference_sha256(as_bytes(msg))) << msg;
    }
}

/**
 * @brief Тест: 55 байт проходят, 56 и больше - MessageTooLong
 */
TEST_F(SHA256Test, SingleBlockBoundary) {
    const std::string max_msg(55, 'a');
    auto ok = crypto::hash(max_msg);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");

    for (std::size_t len : {56u, 64u, 1000u}) {
        const std::string msg(len, 'a');
        auto digest = crypto::hash(msg);
        ASSERT_FALSE(digest.has_value()) << len << " байт";
        EXPECT_EQ(digest.error().code, ErrorCode::MessageTooLong);

        auto traced = crypto::hash_traced(msg);
        ASSERT_FALSE(traced.has_value());
        EXPECT_EQ(traced.error().code, ErrorCode::MessageTooLong);
    }
}

/**
 * @brief Тест: повторное вычисление даёт тот же результат
 */
TEST_F(SHA256Test, Deterministic) {
    const auto msg = random_message(40);
    const ByteSpan span{msg.data(), msg.size()};

    auto first = crypto::hash(span);
    auto second = crypto::hash(span);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

/**
 * @brief Тест: инверсия любого бита меняет дайджест
 */
TEST_F(SHA256Test, Avalanche) {
    for (std::size_t len : {1u, 3u, 20u, 55u}) {
        const auto msg = random_message(len);
        auto original = crypto::hash(ByteSpan{msg.data(), msg.size()});
        ASSERT_TRUE(original.has_value());

        for (std::size_t bit = 0; bit < len * 8; ++bit) {
            auto flipped = msg;
            flipped[bit / 8] ^= static_cast<uint8_t>(0x80 >> (bit % 8));

            auto digest = crypto::hash(ByteSpan{flipped.data(), flipped.size()});
            ASSERT_TRUE(digest.has_value());
            EXPECT_NE(*digest, *original) << "len = " << len << ", бит " << bit;
        }
    }
}

/**
 * @brief Тест: code point'ы до 0xFF хешируются как байты
 */
TEST_F(SHA256Test, CodePointMessage) {
    auto digest = crypto::hash(std::u32string_view{U"abc"});
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto latin = crypto::hash(std::u32string_view{U"ÿ"});
    ASSERT_TRUE(latin.has_value());
    EXPECT_EQ(*latin, "a8100ae6aa1940d0b663bb31cd466142ebbdbd5187131b92d93818987832eb89");
}

/**
 * @brief Тест: широкий code point отклоняется до построения блока
 */
TEST_F(SHA256Test, InvalidCharacter) {
    auto digest = crypto::hash(std::u32string_view{U"жук"});
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code, ErrorCode::InvalidCharacter);
}

/**
 * @brief Тест: трассировка содержит согласованные промежуточные значения
 */
TEST_F(SHA256Test, TraceMatchesHash) {
    auto trace = crypto::hash_traced("abc");
    ASSERT_TRUE(trace.has_value());

    EXPECT_EQ(trace->hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(trace->message, (Bytes{'a', 'b', 'c'}));
    EXPECT_EQ(trace->block[3], 0x80);
    EXPECT_EQ(trace->schedule[0], 0x61626380u);
    EXPECT_EQ(trace->rounds[0].a, 0x5d6aebcdu);
    EXPECT_EQ(trace->rounds[63].a, 0x506e3058u);
    EXPECT_EQ(crypto::to_hex(trace->digest), trace->hex);
}

/**
 * @brief Тест: hash и hash_traced дают один дайджест для любой длины
 */
TEST_F(SHA256Test, HashEqualsTracedHex) {
    for (std::size_t len = 0; len <= 55; len += 5) {
        const auto msg = random_message(len);
        const ByteSpan span{msg.data(), msg.size()};

        auto digest = crypto::hash(span);
        auto trace = crypto::hash_traced(span);
        ASSERT_TRUE(digest.has_value());
        ASSERT_TRUE(trace.has_value());
        EXPECT_EQ(*digest, trace->hex) << len << " байт";
        EXPECT_EQ(trace->message, msg);
    }
}

} // namespace stepsha::tests
