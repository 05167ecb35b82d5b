/**
 * @file digest.cpp
 * @brief Реализация сборки дайджеста
 */

#include "digest.hpp"
#include "../core/byte_order.hpp"

#include <format>

namespace stepsha::crypto {

Digest assemble_digest(const InitialHash& initial, const WorkingState& state) noexcept {
    const auto registers = state.registers();

    Digest digest{};
    for (std::size_t i = 0; i < digest.size(); ++i) {
        digest[i] = initial[i] + registers[i];
    }
    return digest;
}

std::string to_hex(const Digest& digest) {
    std::string hex;
    hex.reserve(constants::DIGEST_HEX_LENGTH);

    for (auto word : digest) {
        hex += std::format("{:08x}", word);
    }
    return hex;
}

Hash256 to_bytes(const Digest& digest) noexcept {
    Hash256 result{};
    for (std::size_t i = 0; i < digest.size(); ++i) {
        write_be32(result.data() + i * 4, digest[i]);
    }
    return result;
}

} // namespace stepsha::crypto
