/**
 * @file block_builder.cpp
 * @brief Дополнение сообщения до одного блока SHA256
 */

#include "block_builder.hpp"
#include "../core/byte_order.hpp"
#include "../log/logger.hpp"

#include <cstring>
#include <format>

namespace stepsha::crypto {

Result<Bytes> encode_code_points(std::u32string_view text) {
    Bytes bytes;
    bytes.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto code_point = static_cast<uint32_t>(text[i]);
        if (code_point > 0xFF) {
            return Err<Bytes>(
                ErrorCode::InvalidCharacter,
                std::format("Символ U+{:04X} в позиции {} не помещается в 8 бит", code_point, i)
            );
        }
        bytes.push_back(static_cast<uint8_t>(code_point));
    }

    return bytes;
}

Result<void> check_ascii(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<uint8_t>(text[i]);
        if (byte >= 0x80) {
            return Err<void>(
                ErrorCode::InvalidCharacter,
                std::format("Байт 0x{:02x} в позиции {} не является ASCII", byte, i)
            );
        }
    }
    return {};
}

Result<Block> build_block(ByteSpan message) {
    // Сообщение + терминальный бит должны уложиться в 448 бит
    const uint64_t message_bits = static_cast<uint64_t>(message.size()) * 8;
    if (message_bits > constants::MAX_MESSAGE_BITS) {
        return Err<Block>(
            ErrorCode::MessageTooLong,
            std::format("Сообщение {} бит ({} байт) не помещается в один блок, "
                        "максимум {} бит ({} байт)",
                        message_bits, message.size(),
                        constants::MAX_MESSAGE_BITS, constants::MAX_MESSAGE_BYTES)
        );
    }

    Block block{};

    // === Шаг 1: байты сообщения ===
    if (!message.empty()) {
        std::memcpy(block.data(), message.data(), message.size());
    }

    // === Шаг 2: бит "1" (старший бит следующего байта) ===
    block[message.size()] = constants::TERMINATOR_BYTE;

    // === Шаг 3: нули до 448 бит уже на месте (Block{}) ===

    // === Шаг 4: длина сообщения в битах, 64 бит big-endian ===
    write_be64(block.data() + constants::PADDED_CONTENT_BITS / 8, message_bits);

    log::debug("Блок построен: {} бит сообщения, {} бит дополнения",
               message_bits, constants::PADDED_CONTENT_BITS - message_bits);

    return block;
}

Result<Block> build_block(std::string_view message) {
    return build_block(ByteSpan{reinterpret_cast<const uint8_t*>(message.data()), message.size()});
}

BlockWords block_words(const Block& block) noexcept {
    BlockWords words{};
    for (std::size_t i = 0; i < words.size(); ++i) {
        words[i] = read_be32(block.data() + i * 4);
    }
    return words;
}

uint64_t block_message_bits(const Block& block) noexcept {
    return read_be64(block.data() + constants::PADDED_CONTENT_BITS / 8);
}

} // namespace stepsha::crypto
