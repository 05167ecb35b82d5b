/**
 * @file walkthrough_reporter.cpp
 * @brief Реализация пошагового вывода SHA256
 */

#include "walkthrough_reporter.hpp"
#include "../crypto/primes.hpp"
#include "../crypto/round_constants.hpp"

#include <format>
#include <iostream>
#include <sstream>

namespace stepsha::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace {

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/// @brief Бит в блоке: часть сообщения, терминатор, дополнение или длина
enum class BitRegion {
    Message,
    Terminator,
    Padding,
    Length
};

BitRegion region_of(std::size_t bit, std::size_t message_bits) noexcept {
    if (bit < message_bits) {
        return BitRegion::Message;
    }
    if (bit == message_bits) {
        return BitRegion::Terminator;
    }
    if (bit < constants::PADDED_CONTENT_BITS) {
        return BitRegion::Padding;
    }
    return BitRegion::Length;
}

const char* color_of(BitRegion region) noexcept {
    switch (region) {
        case BitRegion::Message:    return ansi::GREEN;
        case BitRegion::Terminator: return ansi::RED;
        case BitRegion::Padding:    return ansi::DIM;
        case BitRegion::Length:     return ansi::YELLOW;
    }
    return ansi::RESET;
}

void section_title(std::ostringstream& out, std::string_view title, bool use_color) {
    const char* bold = use_color ? ansi::BOLD : "";
    const char* reset = use_color ? ansi::RESET : "";

    out << bold << "─── " << title << " ───" << reset << "\n";
}

} // anonymous namespace

// =============================================================================
// Двоичное представление
// =============================================================================

std::string to_binary(Word word) {
    std::string bits(32, '0');
    for (std::size_t i = 0; i < 32; ++i) {
        if ((word >> (31 - i)) & 1U) {
            bits[i] = '1';
        }
    }
    return bits;
}

std::string to_binary(const Block& block) {
    std::string bits;
    bits.reserve(constants::BLOCK_BITS);
    for (auto byte : block) {
        for (int i = 7; i >= 0; --i) {
            bits += ((byte >> i) & 1U) ? '1' : '0';
        }
    }
    return bits;
}

// =============================================================================
// WalkthroughReporter
// =============================================================================

WalkthroughReporter::WalkthroughReporter(const WalkthroughConfig& config)
    : config_(config) {}

std::string WalkthroughReporter::render(const crypto::Trace& trace) const {
    std::ostringstream out;

    const char* bold = config_.color ? ansi::BOLD : "";
    const char* reset = config_.color ? ansi::RESET : "";

    // === Заголовок ===
    out << bold << "═══════════════════════════════════════════════════════════════════\n"
        << "                    SHA-256, ОДИН БЛОК, ПО ШАГАМ\n"
        << "═══════════════════════════════════════════════════════════════════" << reset << "\n\n";

    std::string text(trace.message.begin(), trace.message.end());
    out << "Сообщение: \"" << text << "\" (" << trace.message.size() << " байт, "
        << trace.message.size() * 8 << " бит)\n\n";

    if (config_.show_constants) {
        out << render_constants() << "\n";
    }
    if (config_.show_block) {
        out << render_block(trace) << "\n";
    }
    if (config_.show_schedule) {
        out << render_schedule(trace) << "\n";
    }
    if (config_.show_rounds) {
        out << render_rounds(trace) << "\n";
    }
    out << render_digest(trace);

    return out.str();
}

void WalkthroughReporter::print(const crypto::Trace& trace) const {
    std::cout << render(trace) << std::flush;
}

std::string WalkthroughReporter::render_constants() const {
    std::ostringstream out;
    const auto primes = crypto::first_primes();
    const auto& set = crypto::constant_set();

    section_title(out, "Простые числа (пробное деление)", config_.color);
    for (std::size_t i = 0; i < primes.size(); ++i) {
        out << std::format("{:4}", primes[i]) << ((i % 16 == 15) ? "\n" : "");
    }
    out << "\n";

    section_title(out, "H0..H7 = frac(sqrt(p)) * 2^32", config_.color);
    for (std::size_t i = 0; i < set.h.size(); ++i) {
        out << std::format("H{} = {:08x}  (p = {})\n", i, set.h[i], primes[i]);
    }
    out << "\n";

    section_title(out, "K0..K63 = frac(cbrt(p)) * 2^32", config_.color);
    for (std::size_t i = 0; i < set.k.size(); ++i) {
        out << std::format("{:08x}", set.k[i]) << ((i % 8 == 7) ? "\n" : " ");
    }

    return out.str();
}

std::string WalkthroughReporter::render_block(const crypto::Trace& trace) const {
    std::ostringstream out;
    const auto bits = to_binary(trace.block);
    const std::size_t message_bits = trace.message.size() * 8;

    section_title(out, "Блок (512 бит)", config_.color);

    // 8 строк по 64 бита, байты через пробел
    for (std::size_t row = 0; row < constants::BLOCK_BITS / 64; ++row) {
        for (std::size_t col = 0; col < 64; ++col) {
            const std::size_t bit = row * 64 + col;
            if (col > 0 && col % 8 == 0) {
                out << ' ';
            }
            if (config_.color) {
                out << color_of(region_of(bit, message_bits)) << bits[bit] << ansi::RESET;
            } else {
                out << bits[bit];
            }
        }
        out << "\n";
    }

    out << std::format("сообщение: {} бит, терминатор: 1 бит, нули: {} бит, длина: {} бит\n",
                       message_bits,
                       constants::PADDED_CONTENT_BITS - message_bits - 1,
                       constants::LENGTH_FIELD_BITS);

    return out.str();
}

std::string WalkthroughReporter::render_schedule(const crypto::Trace& trace) const {
    std::ostringstream out;
    const char* cyan = config_.color ? ansi::CYAN : "";
    const char* reset = config_.color ? ansi::RESET : "";

    section_title(out, "Расписание W[0..63]", config_.color);
    for (std::size_t i = 0; i < trace.schedule.size(); ++i) {
        // Слова из блока выделяются цветом, остальные вычислены
        const char* color = i < constants::BLOCK_WORDS ? cyan : "";
        out << std::format("W[{:2}] ", i) << color << to_binary(trace.schedule[i]) << reset
            << std::format("  {:08x}\n", trace.schedule[i]);
    }

    return out.str();
}

std::string WalkthroughReporter::render_rounds(const crypto::Trace& trace) const {
    std::ostringstream out;

    section_title(out, "Раунды сжатия", config_.color);
    out << "  i         a        b        c        d        e        f        g        h\n";
    for (std::size_t i = 0; i < trace.rounds.size(); ++i) {
        out << std::format("{:3}  ", i);
        for (auto reg : trace.rounds[i].registers()) {
            out << std::format(" {:08x}", reg);
        }
        out << "\n";
    }

    return out.str();
}

std::string WalkthroughReporter::render_digest(const crypto::Trace& trace) const {
    std::ostringstream out;
    const char* green = config_.color ? ansi::GREEN : "";
    const char* bold = config_.color ? ansi::BOLD : "";
    const char* reset = config_.color ? ansi::RESET : "";

    section_title(out, "Дайджест = H + a..h", config_.color);
    out << bold << green << trace.hex << reset << "\n";

    return out.str();
}

} // namespace stepsha::log
