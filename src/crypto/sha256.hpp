/**
 * @file sha256.hpp
 * @brief SHA256 одного блока: публичный интерфейс
 *
 * Демонстрационная реализация, показывающая внутреннее устройство
 * функции сжатия. Этапы:
 * 1. Константы H и K выводятся из простых чисел (round_constants)
 * 2. Сообщение дополняется до одного 512-битного блока (block_builder)
 * 3. Блок расширяется до 64 слов расписания (message_schedule)
 * 4. 64 раунда сжатия над регистрами a..h (compressor)
 * 5. Сложение с H и вывод в hex (digest)
 *
 * Ограничения:
 * - Только один блок: сообщение не длиннее 55 байт
 * - Один байт на символ
 * - Не constant-time, не для production
 *
 * @note Ни одна функция не возвращает частичный дайджест: любая
 *       ошибка прерывает вычисление целиком.
 */

#pragma once

#include "../core/types.hpp"
#include "block_builder.hpp"
#include "compressor.hpp"
#include "digest.hpp"
#include "message_schedule.hpp"
#include "round_constants.hpp"

#include <array>
#include <string>
#include <string_view>

namespace stepsha::crypto {

/**
 * @brief Все промежуточные значения одного вычисления
 *
 * Используется для пошагового вывода (log::WalkthroughReporter).
 */
struct Trace {
    /// @brief Байты сообщения
    Bytes message;

    /// @brief Блок после дополнения
    Block block{};

    /// @brief Расписание W[0..63]
    MessageSchedule schedule{};

    /// @brief Состояние регистров после каждого раунда
    std::array<WorkingState, constants::ROUNDS> rounds{};

    /// @brief Итоговый дайджест
    Digest digest{};

    /// @brief Дайджест в hex (64 символа)
    std::string hex;
};

/**
 * @brief Вычислить SHA256 байт сообщения
 *
 * @param message Не более 55 байт
 * @return Result<std::string> 64 строчных hex-символа или MessageTooLong
 */
[[nodiscard]] Result<std::string> hash(ByteSpan message);

/**
 * @brief Вычислить SHA256 текста (один байт на символ)
 *
 * @code
 * auto digest = crypto::hash("abc");
 * // ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad
 * @endcode
 */
[[nodiscard]] Result<std::string> hash(std::string_view message);

/**
 * @brief Вычислить SHA256 последовательности code point'ов
 *
 * @return Result<std::string> Дайджест, InvalidCharacter (code point > 0xFF)
 *         или MessageTooLong
 */
[[nodiscard]] Result<std::string> hash(std::u32string_view message);

/**
 * @brief Вычислить SHA256 и сохранить все промежуточные значения
 */
[[nodiscard]] Result<Trace> hash_traced(ByteSpan message);

/**
 * @brief Вычислить SHA256 текста с сохранением промежуточных значений
 */
[[nodiscard]] Result<Trace> hash_traced(std::string_view message);

} // namespace stepsha::crypto
