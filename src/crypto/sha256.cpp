/**
 * @file sha256.cpp
 * @brief Связывание этапов SHA256 в одно вычисление
 */

#include "sha256.hpp"
#include "../log/logger.hpp"

#include <utility>

namespace stepsha::crypto {

namespace {

ByteSpan as_bytes(std::string_view text) noexcept {
    return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // anonymous namespace

// =============================================================================
// Полное вычисление
// =============================================================================

Result<Trace> hash_traced(ByteSpan message) {
    // Проверка длины происходит до построения блока
    auto block = build_block(message);
    if (!block) {
        log::debug("Сообщение отклонено: {}", block.error().message);
        return std::unexpected(block.error());
    }

    const auto& set = constant_set();

    Trace trace;
    trace.message.assign(message.begin(), message.end());
    trace.block = *block;
    trace.schedule = expand_schedule(trace.block);

    const auto final_state = compress(trace.schedule, set,
        [&trace](std::size_t round, const WorkingState& state) {
            trace.rounds[round] = state;
        });

    trace.digest = assemble_digest(set.h, final_state);
    trace.hex = to_hex(trace.digest);

    return trace;
}

Result<Trace> hash_traced(std::string_view message) {
    return hash_traced(as_bytes(message));
}

// =============================================================================
// Только дайджест
// =============================================================================

Result<std::string> hash(ByteSpan message) {
    auto trace = hash_traced(message);
    if (!trace) {
        return std::unexpected(trace.error());
    }
    return std::move(trace->hex);
}

Result<std::string> hash(std::string_view message) {
    return hash(as_bytes(message));
}

Result<std::string> hash(std::u32string_view message) {
    auto bytes = encode_code_points(message);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return hash(ByteSpan{bytes->data(), bytes->size()});
}

} // namespace stepsha::crypto
