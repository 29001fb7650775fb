// ============================================================================
// xi/predicate.hpp — Named atomic proposition with polarity
// ============================================================================
//
// A Predicate is an immutable value: an identifier plus a polarity flag.
// The name is validated once, at construction, so every Predicate that
// exists is well-formed.  Negation is structural: negation() returns a new
// value with the polarity flipped.
//
// ============================================================================

#ifndef XI_PREDICATE_HPP
#define XI_PREDICATE_HPP

#include <string>

namespace xi {

class Predicate {
public:
    /// Construct the asserted predicate `name`.
    /// Throws InvalidPredicateError if the name is empty, not an
    /// identifier ([A-Za-z_][A-Za-z0-9_]*), or reserved.
    explicit Predicate(std::string name);

    const std::string& name() const noexcept { return name_; }
    bool negated() const noexcept { return negated_; }

    /// The same proposition with opposite polarity.
    Predicate negation() const;

    /// "X" or "!X".
    std::string to_string() const;

    bool operator==(const Predicate& o) const noexcept {
        return negated_ == o.negated_ && name_ == o.name_;
    }
    bool operator!=(const Predicate& o) const noexcept { return !(*this == o); }

private:
    Predicate(std::string name, bool negated) noexcept;

    std::string name_;
    bool        negated_ = false;
};

/// True if `name` matches the identifier grammar.
bool is_identifier(const std::string& name) noexcept;

/// True if `name` is one of the reserved words (true, false, and, or, not).
bool is_reserved_name(const std::string& name) noexcept;

}  // namespace xi

#endif  // XI_PREDICATE_HPP
