#pragma once

#include <cstddef>
#include <string_view>

// Helpers over the restricted expression grammar produced by the solver:
// literals, [...] classes, (...) groups, '|', and postfix '*', '+', '?'.

constexpr std::string_view OPERATORS = "()[]|*+?";

// Characters that may not appear in an automaton alphabet.
constexpr std::string_view METACHARACTERS = "()[]{}|*+?.^$\\-";

inline bool isQuantifier(char c) {
    return c == '*' || c == '+' || c == '?';
}

inline bool endsWithQuantifier(std::string_view expr) {
    return !expr.empty() && isQuantifier(expr.back());
}

inline std::string_view stripQuantifier(std::string_view expr) {
    return endsWithQuantifier(expr) ? expr.substr(0, expr.size() - 1) : expr;
}

// R is atomic if (R)Q is equivalent to RQ for a quantifier Q: a single
// non-operator character, or one [...]/(...) pair spanning the whole string.
bool isAtomic(std::string_view expr);

// Length of the character, class or group starting at pos.
std::size_t atomLength(std::string_view expr, std::size_t pos);

// Same as atomLength, including a directly following quantifier.
std::size_t unitLength(std::string_view expr, std::size_t pos);

// Start index of the (quantified) unit ending right before end.
std::size_t unitStart(std::string_view expr, std::size_t end);
