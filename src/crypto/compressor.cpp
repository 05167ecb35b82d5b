/**
 * @file compressor.cpp
 * @brief Реализация раундов сжатия SHA256
 *
 * Раунды не развёрнуты: каждый шаг выполняется явно, чтобы
 * наблюдатель видел состояние после каждого раунда.
 */

#include "compressor.hpp"
#include "bit_ops.hpp"
#include "../log/logger.hpp"

namespace stepsha::crypto {

WorkingState WorkingState::from_initial(const InitialHash& initial) noexcept {
    WorkingState state;
    state.a = initial[0];
    state.b = initial[1];
    state.c = initial[2];
    state.d = initial[3];
    state.e = initial[4];
    state.f = initial[5];
    state.g = initial[6];
    state.h = initial[7];
    return state;
}

Registers WorkingState::registers() const noexcept {
    return {a, b, c, d, e, f, g, h};
}

void compress_round(WorkingState& state, Word k, Word w) noexcept {
    const Word temp1 = state.h + big_sigma1(state.e) + ch(state.e, state.f, state.g) + k + w;
    const Word temp2 = big_sigma0(state.a) + maj(state.a, state.b, state.c);

    state.h = state.g;
    state.g = state.f;
    state.f = state.e;
    state.e = state.d + temp1;
    state.d = state.c;
    state.c = state.b;
    state.b = state.a;
    state.a = temp1 + temp2;
}

WorkingState compress(
    const MessageSchedule& schedule,
    const ConstantSet& set,
    const RoundObserver& observer
) {
    auto state = WorkingState::from_initial(set.h);

    for (std::size_t i = 0; i < schedule.size(); ++i) {
        compress_round(state, set.k[i], schedule[i]);
        if (observer) {
            observer(i, state);
        }
    }

    log::debug("Сжатие завершено: a = {:08x}, e = {:08x}", state.a, state.e);

    return state;
}

} // namespace stepsha::crypto
