/**
 * @file block_builder.hpp
 * @brief Построение единственного 512-битного блока сообщения
 *
 * Структура блока:
 * @code
 * | сообщение (8 бит на символ) | 1 | 0 ... 0 | длина в битах (64 бит, BE) |
 * |<------------------------- 448 бит ------>|<---------- 64 бит -------->|
 * @endcode
 *
 * Поддерживается только один блок: сообщение длиннее 447 бит
 * (55 байт) отклоняется с ErrorCode::MessageTooLong до того,
 * как будет записан хотя бы один бит блока.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <string_view>

namespace stepsha::crypto {

/// @brief Первые 16 слов блока (big-endian)
using BlockWords = std::array<Word, constants::BLOCK_WORDS>;

/**
 * @brief Представить символы как байты
 *
 * Каждый code point должен помещаться в 8 бит. Значения больше 0xFF
 * не усекаются, а отклоняются с ErrorCode::InvalidCharacter.
 *
 * @param text Последовательность code point'ов
 * @return Result<Bytes> Байты сообщения или ошибка
 */
[[nodiscard]] Result<Bytes> encode_code_points(std::u32string_view text);

/**
 * @brief Проверить, что все байты сообщения - ASCII (< 0x80)
 *
 * @return Result<void> Успех или ErrorCode::InvalidCharacter с позицией
 */
[[nodiscard]] Result<void> check_ascii(std::string_view text);

/**
 * @brief Построить блок из байт сообщения
 *
 * @param message Байты сообщения (не более 55)
 * @return Result<Block> Блок ровно из 512 бит или ErrorCode::MessageTooLong
 */
[[nodiscard]] Result<Block> build_block(ByteSpan message);

/**
 * @brief Построить блок из текста (один байт на символ)
 */
[[nodiscard]] Result<Block> build_block(std::string_view message);

/**
 * @brief Разбить блок на 16 слов big-endian
 */
[[nodiscard]] BlockWords block_words(const Block& block) noexcept;

/**
 * @brief Прочитать длину сообщения в битах из последних 64 бит блока
 */
[[nodiscard]] uint64_t block_message_bits(const Block& block) noexcept;

} // namespace stepsha::crypto
