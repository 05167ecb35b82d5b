/**
 * @file constants.hpp
 * @brief Размеры и параметры алгоритма SHA256
 *
 * Только структурные параметры. Начальные значения H и константы
 * раундов K здесь намеренно отсутствуют: они вычисляются из простых
 * чисел в crypto/round_constants.cpp.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace stepsha::constants {

// =============================================================================
// Размеры блока SHA256
// =============================================================================

/// @brief Размер блока SHA256 в битах
inline constexpr std::size_t BLOCK_BITS = 512;

/// @brief Размер блока SHA256 в байтах
inline constexpr std::size_t BLOCK_SIZE = BLOCK_BITS / 8;

/// @brief Размер поля длины сообщения (big-endian) в битах
inline constexpr std::size_t LENGTH_FIELD_BITS = 64;

/// @brief Позиция, до которой дополняется сообщение нулями (в битах)
inline constexpr std::size_t PADDED_CONTENT_BITS = BLOCK_BITS - LENGTH_FIELD_BITS;
static_assert(PADDED_CONTENT_BITS == 448, "Граница дополнения должна быть 448 бит");

/// @brief Максимальная длина сообщения в битах (448 - 1 терминальный бит)
inline constexpr std::size_t MAX_MESSAGE_BITS = PADDED_CONTENT_BITS - 1;

/// @brief Максимальная длина сообщения в байтах (целых 8-битных символов)
inline constexpr std::size_t MAX_MESSAGE_BYTES = MAX_MESSAGE_BITS / 8;
static_assert(MAX_MESSAGE_BYTES == 55, "В один блок помещается не более 55 байт");

/// @brief Размер SHA256 дайджеста в байтах
inline constexpr std::size_t DIGEST_SIZE = 32;

/// @brief Длина hex-представления дайджеста
inline constexpr std::size_t DIGEST_HEX_LENGTH = DIGEST_SIZE * 2;

// =============================================================================
// Параметры сжатия
// =============================================================================

/// @brief Количество слов, копируемых из блока в расписание
inline constexpr std::size_t BLOCK_WORDS = 16;

/// @brief Количество раундов сжатия (и слов расписания)
inline constexpr std::size_t ROUNDS = 64;

/// @brief Количество рабочих регистров (a..h) и начальных значений H
inline constexpr std::size_t STATE_WORDS = 8;

/// @brief Количество простых чисел для констант раундов
inline constexpr std::size_t PRIME_COUNT = ROUNDS;

/// @brief Маска 32-битного слова
inline constexpr uint32_t WORD_MASK = 0xFFFFFFFF;

/// @brief Байт-терминатор: бит "1" и семь нулевых битов
inline constexpr uint8_t TERMINATOR_BYTE = 0x80;

// =============================================================================
// Константы программы
// =============================================================================

/// @brief Сообщение по умолчанию (демонстрационное)
inline constexpr const char* DEFAULT_MESSAGE = "88484";

/// @brief Имя файла конфигурации
inline constexpr const char* CONFIG_FILE_NAME = "stepsha.toml";

} // namespace stepsha::constants
