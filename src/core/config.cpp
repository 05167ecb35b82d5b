/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace stepsha {

namespace {

/**
 * @brief Заполнить Config из разобранной TOML таблицы
 */
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [input] ===
    if (auto input = table["input"].as_table()) {
        if (auto val = (*input)["message"].value<std::string>()) {
            config.input.message = *val;
        }
        if (auto val = (*input)["ascii_only"].value<bool>()) {
            config.input.ascii_only = *val;
        }
    }

    // === Секция [trace] ===
    if (auto trace = table["trace"].as_table()) {
        if (auto val = (*trace)["enabled"].value<bool>()) {
            config.trace.enabled = *val;
        }
        if (auto val = (*trace)["show_constants"].value<bool>()) {
            config.trace.show_constants = *val;
        }
        if (auto val = (*trace)["show_block"].value<bool>()) {
            config.trace.show_block = *val;
        }
        if (auto val = (*trace)["show_schedule"].value<bool>()) {
            config.trace.show_schedule = *val;
        }
        if (auto val = (*trace)["show_rounds"].value<bool>()) {
            config.trace.show_rounds = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        log::debug("Конфигурация прочитана: {}", path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view text) {
    try {
        auto table = toml::parse(text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Список путей для поиска
    std::vector<std::filesystem::path> search_paths;

    if (path.has_value()) {
        search_paths.push_back(path.value());
    }

    // Стандартные пути
    search_paths.push_back(constants::CONFIG_FILE_NAME);
    search_paths.push_back(std::filesystem::path("/etc/stepsha") / constants::CONFIG_FILE_NAME);

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "stepsha" / constants::CONFIG_FILE_NAME
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Проверка уровня логирования
    if (auto parsed = log::parse_level(logging.level); !parsed) {
        return std::unexpected(parsed.error());
    }

    return {};
}

} // namespace stepsha
