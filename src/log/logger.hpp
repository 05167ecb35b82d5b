/**
 * @file logger.hpp
 * @brief Консольный логгер StepSHA
 *
 * Формат строки: "[YYYY-mm-dd HH:MM:SS] [LEVEL] сообщение".
 * Цвет зависит от уровня, ошибки выводятся в stderr.
 *
 * Пример:
 * @code
 * log::set_level(log::LogLevel::Debug);
 * log::debug("Блок построен: {} бит сообщения", bits);
 * @endcode
 */

#pragma once

#include "../core/types.hpp"

#include <format>
#include <string_view>
#include <utility>

namespace stepsha::log {

/**
 * @brief Уровень логирования
 */
enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Преобразование уровня в строку
 */
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Debug:   return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать имя уровня из конфигурации
 *
 * @param name "error", "warn", "info" или "debug"
 * @return Result<LogLevel> Уровень или ConfigInvalidValue
 */
[[nodiscard]] Result<LogLevel> parse_level(std::string_view name);

/// @brief Установить минимальный выводимый уровень
void set_level(LogLevel level) noexcept;

/// @brief Текущий уровень
[[nodiscard]] LogLevel level() noexcept;

/// @brief Включить/выключить ANSI цвета
void set_color(bool enabled) noexcept;

/// @brief Будет ли выведено сообщение данного уровня
[[nodiscard]] bool enabled(LogLevel level) noexcept;

/**
 * @brief Вывести готовое сообщение
 */
void write(LogLevel level, std::string_view message);

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(LogLevel::Error)) {
        write(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(LogLevel::Warning)) {
        write(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(LogLevel::Info)) {
        write(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(LogLevel::Debug)) {
        write(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace stepsha::log
