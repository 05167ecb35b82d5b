/**
 * @file digest.hpp
 * @brief Сборка итогового дайджеста SHA256
 *
 * digest[i] = H[i] + регистр[i] (mod 2^32), слова идут старшим первым.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "compressor.hpp"
#include "round_constants.hpp"

#include <array>
#include <string>

namespace stepsha::crypto {

/// @brief Дайджест как 8 слов (H0' старшее)
using Digest = std::array<Word, constants::STATE_WORDS>;

/**
 * @brief Сложить начальные значения с состоянием после сжатия
 *
 * @param initial Начальные значения H0..H7
 * @param state Состояние регистров после раунда 63
 */
[[nodiscard]] Digest assemble_digest(const InitialHash& initial, const WorkingState& state) noexcept;

/**
 * @brief 64 строчных hex-символа, каждое слово дополнено нулями до 8 знаков
 */
[[nodiscard]] std::string to_hex(const Digest& digest);

/**
 * @brief 32 байта дайджеста (big-endian)
 */
[[nodiscard]] Hash256 to_bytes(const Digest& digest) noexcept;

} // namespace stepsha::crypto
