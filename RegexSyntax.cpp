#include "RegexSyntax.h"

#include <stdexcept>
#include <string>

bool isAtomic(std::string_view expr) {
    if (expr.size() == 1) {
        return OPERATORS.find(expr[0]) == std::string_view::npos;
    }
    if (expr.empty()) {
        return false;
    }

    int depth = 0;
    for (std::size_t i = 0; i != expr.size(); ++i) {
        switch (expr[i]) {
            case '(':
            case '[':
                ++depth;
                break;
            case ')':
            case ']':
                --depth;
                break;
            default:
                break;
        }
        // the top-level pair closed early, or the first character opened none
        if (depth == 0 && i + 1 != expr.size()) {
            return false;
        }
    }

    return depth == 0;
}

std::size_t atomLength(std::string_view expr, std::size_t pos) {
    if (pos >= expr.size()) {
        throw std::runtime_error("Unit out of range: " + std::to_string(pos));
    }

    if (expr[pos] == '[') {
        // alphabets never contain ']', so the next one closes the class
        auto close = expr.find(']', pos);
        if (close == std::string_view::npos) {
            throw std::runtime_error("Unclosed class in " + std::string{expr});
        }
        return close - pos + 1;
    }

    if (expr[pos] == '(') {
        int depth = 0;
        for (auto i = pos; i != expr.size(); ++i) {
            if (expr[i] == '(') {
                ++depth;
            } else if (expr[i] == ')' && --depth == 0) {
                return i - pos + 1;
            }
        }
        throw std::runtime_error("Unclosed group in " + std::string{expr});
    }

    return 1;
}

std::size_t unitLength(std::string_view expr, std::size_t pos) {
    auto length = atomLength(expr, pos);
    if (pos + length < expr.size() && isQuantifier(expr[pos + length])) {
        ++length;
    }
    return length;
}

std::size_t unitStart(std::string_view expr, std::size_t end) {
    if (end == 0 || end > expr.size()) {
        throw std::runtime_error("Unit out of range: " + std::to_string(end));
    }

    auto i = end - 1;
    if (isQuantifier(expr[i])) {
        if (i == 0) {
            throw std::runtime_error("Dangling quantifier in " + std::string{expr});
        }
        --i;
    }

    if (expr[i] == ']') {
        auto open = expr.rfind('[', i);
        if (open == std::string_view::npos) {
            throw std::runtime_error("Unopened class in " + std::string{expr});
        }
        return open;
    }

    if (expr[i] == ')') {
        int depth = 0;
        for (auto j = i + 1; j-- != 0;) {
            if (expr[j] == ')') {
                ++depth;
            } else if (expr[j] == '(' && --depth == 0) {
                return j;
            }
        }
        throw std::runtime_error("Unopened group in " + std::string{expr});
    }

    return i;
}
