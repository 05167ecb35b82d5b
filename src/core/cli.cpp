/**
 * @file cli.cpp
 * @brief Реализация разбора командной строки
 */

#include "cli.hpp"
#include "constants.hpp"
#include "../crypto/block_builder.hpp"
#include "../log/logger.hpp"

#include <format>
#include <string_view>

namespace stepsha::cli {

Result<Args> parse_args(int argc, const char* const argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "-t" || arg == "--trace") {
            args.trace = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Err<Args>(
                    ErrorCode::ConfigInvalidValue,
                    std::format("{} требует путь к файлу", arg)
                );
            }
            args.config_path = argv[++i];
        } else if (arg == "--") {
            if (i + 1 >= argc) {
                return Err<Args>(ErrorCode::ConfigInvalidValue, "После -- ожидается сообщение");
            }
            if (args.message) {
                return Err<Args>(ErrorCode::ConfigInvalidValue, "Допускается только одно сообщение");
            }
            args.message = argv[++i];
            if (i + 1 < argc) {
                return Err<Args>(ErrorCode::ConfigInvalidValue, "Допускается только одно сообщение");
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return Err<Args>(
                ErrorCode::ConfigInvalidValue,
                std::format("Неизвестная опция: {}", arg)
            );
        } else if (!args.message) {
            args.message = std::string(arg);
        } else {
            return Err<Args>(ErrorCode::ConfigInvalidValue, "Допускается только одно сообщение");
        }
    }

    return args;
}

Result<Config> load_config(const Args& args) {
    if (args.config_path) {
        return Config::load(*args.config_path);
    }

    auto config = Config::load_with_search();
    if (!config && config.error().code == ErrorCode::ConfigNotFound) {
        log::debug("Файл конфигурации не найден, используются значения по умолчанию");
        return Config{};
    }
    return config;
}

Result<std::string> select_message(const Args& args, const Config& config) {
    std::string message = args.message.value_or(config.input.message);

    if (message.size() > constants::MAX_MESSAGE_BYTES) {
        return Err<std::string>(
            ErrorCode::MessageTooLong,
            std::format("Сообщение длиной {} байт не помещается в один блок (максимум {} байт)",
                        message.size(), constants::MAX_MESSAGE_BYTES)
        );
    }

    if (config.input.ascii_only) {
        if (auto ascii = crypto::check_ascii(message); !ascii) {
            return std::unexpected(ascii.error());
        }
    }

    return message;
}

OutputMode output_mode(const Args& args, const Config& config) noexcept {
    if (args.quiet) {
        return OutputMode::Digest;
    }
    return (args.trace || config.trace.enabled) ? OutputMode::Walkthrough : OutputMode::Digest;
}

int exit_code(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return EXIT_OK;
        case ErrorCode::MessageTooLong:
        case ErrorCode::InvalidCharacter:
            return EXIT_HASH_ERROR;
        default:
            return EXIT_CONFIG_ERROR;
    }
}

} // namespace stepsha::cli
