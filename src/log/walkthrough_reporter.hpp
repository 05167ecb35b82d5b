/**
 * @file walkthrough_reporter.hpp
 * @brief Пошаговый вывод вычисления SHA256
 *
 * Показывает все промежуточные значения одного вычисления:
 * - Простые числа и выведенные из них константы H и K
 * - 512-битный блок в двоичном виде (сообщение, терминатор, нули, длина)
 * - Расписание W[0..63] (двоичное и hex)
 * - Регистры a..h после каждого раунда
 * - Итоговый дайджест
 *
 * Все секции рендерятся в строку, вывод в терминал отдельно.
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/sha256.hpp"

#include <string>

namespace stepsha::log {

/**
 * @brief Какие секции выводить
 */
struct WalkthroughConfig {
    bool show_constants = true;
    bool show_block = true;
    bool show_schedule = true;
    bool show_rounds = true;

    /// @brief Использовать цветной вывод
    bool color = true;
};

/**
 * @brief Слово в виде 32 символов '0'/'1'
 */
[[nodiscard]] std::string to_binary(Word word);

/**
 * @brief Блок в виде 512 символов '0'/'1'
 */
[[nodiscard]] std::string to_binary(const Block& block);

/**
 * @brief Репортёр пошагового вычисления
 */
class WalkthroughReporter {
public:
    explicit WalkthroughReporter(const WalkthroughConfig& config);

    /**
     * @brief Отрендерить все включённые секции
     */
    [[nodiscard]] std::string render(const crypto::Trace& trace) const;

    /**
     * @brief Вывести render() в stdout
     */
    void print(const crypto::Trace& trace) const;

    [[nodiscard]] std::string render_constants() const;
    [[nodiscard]] std::string render_block(const crypto::Trace& trace) const;
    [[nodiscard]] std::string render_schedule(const crypto::Trace& trace) const;
    [[nodiscard]] std::string render_rounds(const crypto::Trace& trace) const;
    [[nodiscard]] std::string render_digest(const crypto::Trace& trace) const;

private:
    WalkthroughConfig config_;
};

} // namespace stepsha::log
