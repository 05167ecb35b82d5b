/**
 * @file config.hpp
 * @brief Конфигурация StepSHA
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (stepsha.toml):
 * @code
 * [input]
 * message = "88484"
 * ascii_only = true
 *
 * [trace]
 * enabled = false
 * show_constants = true
 * show_block = true
 * show_schedule = true
 * show_rounds = true
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace stepsha {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Входное сообщение
 */
struct InputConfig {
    /// @brief Сообщение, если оно не передано в командной строке
    std::string message = constants::DEFAULT_MESSAGE;

    /// @brief Отклонять байты >= 0x80
    bool ascii_only = true;
};

/**
 * @brief Пошаговый вывод промежуточных значений
 */
struct TraceConfig {
    /// @brief Выводить пошаговый разбор
    bool enabled = false;

    /// @brief Таблицы простых чисел, H и K
    bool show_constants = true;

    /// @brief Блок в двоичном виде
    bool show_block = true;

    /// @brief Расписание W[0..63] в двоичном виде
    bool show_schedule = true;

    /// @brief Регистры a..h после каждого раунда
    bool show_rounds = true;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Полная конфигурация StepSHA
 */
struct Config {
    InputConfig input;
    TraceConfig trace;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     *
     * Отсутствующие ключи получают значения по умолчанию.
     */
    [[nodiscard]] static Result<Config> parse(std::string_view text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./stepsha.toml
     * 3. /etc/stepsha/stepsha.toml
     * 4. ~/.config/stepsha/stepsha.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ConfigNotFound
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет уровень логирования. input.message проверяется
     * только если оно будет хешировано (cli::select_message).
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace stepsha
