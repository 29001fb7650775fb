// ============================================================================
// predicate.cpp — Predicate validation and negation
// ============================================================================

#include "xi/predicate.hpp"
#include "xi/errors.hpp"

#include <array>
#include <cctype>

namespace xi {

// ── identifier grammar ──────────────────────────────────────────────────────

bool is_identifier(const std::string& name) noexcept {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return true;
}

bool is_reserved_name(const std::string& name) noexcept {
    static const std::array<const char*, 5> kReserved = {
        "true", "false", "and", "or", "not"
    };
    for (const char* r : kReserved) {
        if (name == r) return true;
    }
    return false;
}

// ── Predicate ───────────────────────────────────────────────────────────────

Predicate::Predicate(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        throw InvalidPredicateError(name_, "name cannot be empty");
    }
    if (!is_identifier(name_)) {
        throw InvalidPredicateError(name_, "not a valid identifier");
    }
    if (is_reserved_name(name_)) {
        throw InvalidPredicateError(name_, "reserved name");
    }
}

Predicate::Predicate(std::string name, bool negated) noexcept
    : name_(std::move(name)), negated_(negated) {}

Predicate Predicate::negation() const {
    return Predicate(name_, !negated_);
}

std::string Predicate::to_string() const {
    return negated_ ? "!" + name_ : name_;
}

}  // namespace xi
