/**
 * @file cli.hpp
 * @brief Аргументы командной строки stepsha
 *
 * Разбор argv, выбор сообщения и режима вывода, коды завершения.
 * main.cpp только связывает эти шаги с выводом в терминал.
 */

#pragma once

#include "types.hpp"
#include "config.hpp"

#include <optional>
#include <string>

namespace stepsha::cli {

/// @brief Коды завершения
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_CONFIG_ERROR = 1;
inline constexpr int EXIT_HASH_ERROR = 2;

/**
 * @brief Разобранные аргументы
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> message;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool trace = false;
    bool quiet = false;
};

/**
 * @brief Что печатать в stdout
 */
enum class OutputMode {
    Digest,       ///< Только дайджест
    Walkthrough   ///< Пошаговый разбор всех этапов
};

/**
 * @brief Разобрать аргументы командной строки
 *
 * Первое слово без '-' считается сообщением, после "--" следующий
 * аргумент берётся как сообщение даже если начинается с '-'.
 *
 * @return Result<Args> Аргументы или ConfigInvalidValue
 */
[[nodiscard]] Result<Args> parse_args(int argc, const char* const argv[]);

/**
 * @brief Загрузить конфигурацию
 *
 * Явно указанный файл обязан существовать. Если файл не указан
 * и не найден в стандартных путях, используются значения по умолчанию.
 */
[[nodiscard]] Result<Config> load_config(const Args& args);

/**
 * @brief Выбрать и проверить сообщение для хеширования
 *
 * Сообщение из командной строки имеет приоритет над input.message.
 * Проверяется только выбранное сообщение: длина (один блок) и,
 * при input.ascii_only, отсутствие байт >= 0x80.
 *
 * @return Result<std::string> Сообщение, MessageTooLong или InvalidCharacter
 */
[[nodiscard]] Result<std::string> select_message(const Args& args, const Config& config);

/**
 * @brief Режим вывода: -q отменяет -t и trace.enabled
 */
[[nodiscard]] OutputMode output_mode(const Args& args, const Config& config) noexcept;

/**
 * @brief Код завершения для ошибки
 *
 * Ошибки конфигурации и аргументов - 1, ошибки сообщения - 2.
 */
[[nodiscard]] int exit_code(ErrorCode code) noexcept;

} // namespace stepsha::cli
