/**
 * @file types.hpp
 * @brief Базовые типы StepSHA
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Word: 32-битное слово SHA256
 * - Block: единственный 512-битный блок сообщения
 * - Hash256: 32-байтный дайджест
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stepsha {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 32-битное слово SHA256
 *
 * Все сложения выполняются по модулю 2^32 (переполнение uint32_t),
 * все побитовые операции затрагивают ровно 32 бита.
 */
using Word = uint32_t;

/**
 * @brief 512-битный блок сообщения (64 байта)
 */
using Block = std::array<uint8_t, 64>;

/**
 * @brief 256-битный хеш (32 байта, big-endian)
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок StepSHA
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Используется вместо исключений: хеширование никогда не бросает.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки входного сообщения (200-299)
    MessageTooLong = 200,
    InvalidCharacter = 201,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::MessageTooLong: return "Сообщение не помещается в один блок";
        case ErrorCode::InvalidCharacter: return "Символ не помещается в 8 бит";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto digest = crypto::hash("abc");
 * if (digest) {
 *     std::cout << *digest << std::endl;
 * } else {
 *     std::cerr << digest.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace stepsha
