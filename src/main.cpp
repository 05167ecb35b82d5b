/**
 * @file main.cpp
 * @brief Точка входа StepSHA
 *
 * StepSHA - демонстрационный SHA256 для одного 512-битного блока.
 * Константы выводятся из простых чисел, каждый этап можно
 * вывести в терминал.
 *
 * Использование:
 *   stepsha [options] [MESSAGE]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -t, --trace          Пошаговый вывод
 *   -q, --quiet          Только дайджест
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 *   --test-config        Проверить конфигурацию
 */

#include "core/types.hpp"
#include "core/cli.hpp"
#include "core/config.hpp"
#include "crypto/sha256.hpp"
#include "log/logger.hpp"
#include "log/walkthrough_reporter.hpp"

#include <iostream>
#include <string_view>
#include <utility>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
StepSHA v)" << VERSION << R"(
SHA-256 одного блока с выводом всех промежуточных значений

ИСПОЛЬЗОВАНИЕ:
    stepsha [ОПЦИИ] [СООБЩЕНИЕ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (stepsha.toml)
    -t, --trace          Пошаговый вывод: константы, блок, расписание, раунды
    -q, --quiet          Вывести только дайджест
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти

ОГРАНИЧЕНИЯ:
    Сообщение не длиннее 55 байт (один блок), один байт на символ.

ПРИМЕРЫ:
    stepsha abc
    stepsha --trace 88484
    stepsha -c /etc/stepsha/stepsha.toml

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "StepSHA v" << VERSION << std::endl;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace stepsha;

    // Парсим аргументы
    auto args_result = cli::parse_args(argc, argv);
    if (!args_result) {
        log::error("{}", args_result.error().message);
        return cli::exit_code(args_result.error().code);
    }
    const cli::Args& args = *args_result;

    if (args.show_help) {
        print_help();
        return cli::EXIT_OK;
    }

    if (args.show_version) {
        print_version();
        return cli::EXIT_OK;
    }

    // Загружаем конфигурацию
    auto config_result = cli::load_config(args);
    if (!config_result) {
        log::error("{}", config_result.error().message);
        return cli::exit_code(config_result.error().code);
    }

    const Config config = std::move(*config_result);

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        log::error("Ошибка валидации конфигурации: {}", validation.error().message);
        return cli::exit_code(validation.error().code);
    }

    log::set_color(config.logging.color);
    if (auto level = log::parse_level(config.logging.level)) {
        log::set_level(*level);
    }
    if (args.quiet) {
        log::set_level(log::LogLevel::Error);
    }

    // Проверяется только то сообщение, которое будет хешировано
    auto message = cli::select_message(args, config);

    if (args.test_config) {
        if (!message) {
            log::error("Ошибка валидации конфигурации: {}", message.error().message);
            return cli::EXIT_CONFIG_ERROR;
        }
        log::info("Конфигурация валидна");
        return cli::EXIT_OK;
    }

    if (!message) {
        log::error("{}", message.error().message);
        return cli::exit_code(message.error().code);
    }

    if (cli::output_mode(args, config) == cli::OutputMode::Digest) {
        auto digest = crypto::hash(*message);
        if (!digest) {
            log::error("{}", digest.error().message);
            return cli::exit_code(digest.error().code);
        }
        std::cout << *digest << std::endl;
        return cli::EXIT_OK;
    }

    auto trace_result = crypto::hash_traced(*message);
    if (!trace_result) {
        log::error("{}", trace_result.error().message);
        return cli::exit_code(trace_result.error().code);
    }

    log::WalkthroughConfig walkthrough_config;
    walkthrough_config.show_constants = config.trace.show_constants;
    walkthrough_config.show_block = config.trace.show_block;
    walkthrough_config.show_schedule = config.trace.show_schedule;
    walkthrough_config.show_rounds = config.trace.show_rounds;
    walkthrough_config.color = config.logging.color;

    log::WalkthroughReporter reporter(walkthrough_config);
    reporter.print(*trace_result);

    return cli::EXIT_OK;
}
