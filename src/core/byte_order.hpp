/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * SHA256 целиком big-endian: слова блока, поле длины сообщения
 * и байты дайджеста записываются старшим байтом вперёд.
 *
 * @note Все функции помечены noexcept так как не выбрасывают исключений.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <bit>
#include <concepts>

namespace stepsha {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Проверка: система big-endian?
 */
[[nodiscard]] consteval bool is_big_endian() noexcept {
    return std::endian::native == std::endian::big;
}

/**
 * @brief Поменять порядок байт (byte swap)
 *
 * @tparam T uint32_t или uint64_t
 * @param value Значение для преобразования
 * @return Значение с обратным порядком байт
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    if constexpr (sizeof(T) == 4) {
        return static_cast<T>(((value & 0x000000FF) << 24) |
                              ((value & 0x0000FF00) << 8)  |
                              ((value & 0x00FF0000) >> 8)  |
                              ((value & 0xFF000000) >> 24));
    } else { // sizeof(T) == 8
        return static_cast<T>(((value & 0x00000000000000FFULL) << 56) |
                              ((value & 0x000000000000FF00ULL) << 40) |
                              ((value & 0x0000000000FF0000ULL) << 24) |
                              ((value & 0x00000000FF000000ULL) << 8)  |
                              ((value & 0x000000FF00000000ULL) >> 8)  |
                              ((value & 0x0000FF0000000000ULL) >> 24) |
                              ((value & 0x00FF000000000000ULL) >> 40) |
                              ((value & 0xFF00000000000000ULL) >> 56));
    }
}

/**
 * @brief Преобразовать число из формата хоста в big-endian
 *
 * На little-endian системах (x86) меняет порядок байт.
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (is_big_endian()) {
        return value;
    } else {
        return byte_swap(value);
    }
}

/**
 * @brief Преобразовать число из big-endian в формат хоста
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T from_big_endian(T value) noexcept {
    return to_big_endian(value); // Симметричная операция
}

// =============================================================================
// Чтение/запись из/в байтовый массив
// =============================================================================

/**
 * @brief Записать uint32_t в big-endian формате
 *
 * @param dest Указатель на буфер (минимум 4 байта)
 * @param value Значение для записи
 */
inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Записать uint64_t в big-endian формате
 *
 * Используется для поля длины сообщения в конце блока.
 *
 * @param dest Указатель на буфер (минимум 8 байт)
 * @param value Значение для записи
 */
inline void write_be64(uint8_t* dest, uint64_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать uint32_t из big-endian буфера
 *
 * @param src Указатель на буфер (минимум 4 байта)
 * @return Значение в формате хоста
 */
[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_big_endian(value);
}

/**
 * @brief Прочитать uint64_t из big-endian буфера
 */
[[nodiscard]] inline uint64_t read_be64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_big_endian(value);
}

} // namespace stepsha
