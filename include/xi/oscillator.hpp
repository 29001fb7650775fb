// ============================================================================
// xi/oscillator.hpp — Two-state toggling sequence
// ============================================================================
//
// The oscillator alternates strictly between a value and its negation:
//
//   s[i] = initial      if i is even
//   s[i] = !initial     if i is odd
//
// It is the boolean counterpart of the closure: one predicate, one
// negation, period 2.
//
// ============================================================================

#ifndef XI_OSCILLATOR_HPP
#define XI_OSCILLATOR_HPP

#include <vector>

namespace xi {

class Oscillator {
public:
    explicit Oscillator(bool initial) : initial_(initial) {}

    bool initial() const noexcept { return initial_; }

    /// Value at position `index` (index >= 0).
    bool at(int index) const;

    /// First `steps` values.  Throws InvalidArgumentError if steps < 0.
    std::vector<bool> iterate(int steps) const;

    static constexpr int period() noexcept { return 2; }

    /// True if the first max(steps, 4) values satisfy s[i] == s[i-2].
    bool is_stable(int steps = 10) const;

private:
    bool initial_;
};

/// Shorthand for Oscillator(initial).iterate(steps).
std::vector<bool> iterate(bool initial, int steps);

}  // namespace xi

#endif  // XI_OSCILLATOR_HPP
