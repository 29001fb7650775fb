// ============================================================================
// oscillator.cpp — Two-state toggling sequence
// ============================================================================

#include "xi/oscillator.hpp"
#include "xi/errors.hpp"

#include <algorithm>
#include <string>

namespace xi {

bool Oscillator::at(int index) const {
    if (index < 0) {
        throw InvalidArgumentError("oscillator index must be non-negative, got " +
                                   std::to_string(index));
    }
    return (index % 2 == 0) ? initial_ : !initial_;
}

std::vector<bool> Oscillator::iterate(int steps) const {
    if (steps < 0) {
        throw InvalidArgumentError("steps must be non-negative, got " +
                                   std::to_string(steps));
    }
    std::vector<bool> seq;
    seq.reserve(static_cast<std::size_t>(steps));
    bool state = initial_;
    for (int i = 0; i < steps; ++i) {
        seq.push_back(state);
        state = !state;
    }
    return seq;
}

bool Oscillator::is_stable(int steps) const {
    std::vector<bool> seq = iterate(std::max(steps, 4));
    for (std::size_t i = 2; i < seq.size(); ++i) {
        if (seq[i] != seq[i - 2]) return false;
    }
    return true;
}

std::vector<bool> iterate(bool initial, int steps) {
    return Oscillator(initial).iterate(steps);
}

}  // namespace xi
