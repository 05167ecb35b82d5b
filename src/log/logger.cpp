/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stepsha::log {

namespace {

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* DIM = "\033[2m";
}

std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<bool> g_color{true};

const char* color_for(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return ansi::RED;
        case LogLevel::Warning: return ansi::YELLOW;
        case LogLevel::Info:    return ansi::GREEN;
        case LogLevel::Debug:   return ansi::DIM;
    }
    return ansi::RESET;
}

} // anonymous namespace

Result<LogLevel> parse_level(std::string_view name) {
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warning;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    return Err<LogLevel>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: '{}' "
                    "(допустимо: error, warn, info, debug)", name)
    );
}

void set_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void set_color(bool enabled) noexcept {
    g_color.store(enabled, std::memory_order_relaxed);
}

bool enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void write(LogLevel level, std::string_view message) {
    // Получаем текущее время
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    // Формируем вывод
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << to_string(level) << "] ";
    ss << message;

    std::ostream& out = level == LogLevel::Error ? std::cerr : std::clog;
    if (g_color.load(std::memory_order_relaxed)) {
        out << color_for(level) << ss.str() << ansi::RESET << std::endl;
    } else {
        out << ss.str() << std::endl;
    }
}

} // namespace stepsha::log
