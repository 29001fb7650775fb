// ============================================================================
// xi/errors.hpp — Exception hierarchy
// ============================================================================
//
// All failures that abort an operation are reported as exceptions derived
// from XiError (itself a std::runtime_error, so a single catch at the CLI
// boundary handles everything).  Invariant violations found by the
// validator are NOT exceptions; they are recorded as CheckEntry items in
// the report (see validator.hpp).
//
//   XiError
//     ├── InvalidPredicateError   bad predicate name
//     ├── InvalidArgumentError    negative counts, empty attractor, ...
//     └── DepthLimitError         closure would exceed max_set_size
//
// ============================================================================

#ifndef XI_ERRORS_HPP
#define XI_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace xi {

class XiError : public std::runtime_error {
public:
    explicit XiError(const std::string& what) : std::runtime_error(what) {}
};

// ── InvalidPredicateError ───────────────────────────────────────────────────

class InvalidPredicateError : public XiError {
public:
    InvalidPredicateError(std::string name, std::string reason)
        : XiError("invalid predicate '" + name + "': " + reason),
          name_(std::move(name)), reason_(std::move(reason)) {}

    /// Same error, positioned on `line` of a text input.
    InvalidPredicateError(std::string name, std::string reason, std::size_t line)
        : XiError(std::to_string(line) + ": ERROR: invalid predicate '" + name +
                  "': " + reason + " at column 1"),
          name_(std::move(name)), reason_(std::move(reason)), line_(line) {}

    const std::string& name() const noexcept { return name_; }
    const std::string& reason() const noexcept { return reason_; }

    /// Input line, or 0 when the name did not come from a file.
    std::size_t line() const noexcept { return line_; }

private:
    std::string name_;
    std::string reason_;
    std::size_t line_ = 0;
};

// ── InvalidArgumentError ────────────────────────────────────────────────────

class InvalidArgumentError : public XiError {
public:
    explicit InvalidArgumentError(const std::string& what) : XiError(what) {}
};

// ── DepthLimitError ─────────────────────────────────────────────────────────
// Resource-exhaustion guard.  Carries everything needed to reproduce the
// failure: the seed, the generation being built, the size the set would
// have reached, and the bound that was exceeded.

class DepthLimitError : public XiError {
public:
    DepthLimitError(std::string seed, std::uint32_t generation,
                    std::size_t attempted_size, std::size_t bound)
        : XiError("closure of '" + seed + "' exceeds max_set_size " +
                  std::to_string(bound) + " at generation " +
                  std::to_string(generation) + " (attempted size " +
                  std::to_string(attempted_size) + ")"),
          seed_(std::move(seed)),
          generation_(generation),
          attempted_size_(attempted_size),
          bound_(bound) {}

    const std::string& seed() const noexcept { return seed_; }
    std::uint32_t generation() const noexcept { return generation_; }
    std::size_t attempted_size() const noexcept { return attempted_size_; }
    std::size_t bound() const noexcept { return bound_; }

private:
    std::string   seed_;
    std::uint32_t generation_;
    std::size_t   attempted_size_;
    std::size_t   bound_;
};

}  // namespace xi

#endif  // XI_ERRORS_HPP
