#include "ExpressionOptimizer.h"

#include <algorithm>
#include <set>
#include <string_view>
#include <utility>

#include "RegexSyntax.h"
#include "Transformer.h"
#include "utils.h"

namespace {

using Terms = Transformer<std::string>;

std::size_t findPrefixLength(std::string_view minimal, std::vector<std::string> const& terms) {
    std::size_t prefixLength = 0;
    while (prefixLength < minimal.size()) {
        // minimal[0, prefixLength) is shared by all terms
        auto const length = prefixLength + unitLength(minimal, prefixLength);
        auto const prefix = minimal.substr(0, length);
        auto const shared = std::all_of(terms.begin(), terms.end(), [&](std::string const& term) {
            // a term that quantifies the unit does not share it
            return term.starts_with(prefix) && !(term.size() > length && isQuantifier(term[length]));
        });
        if (!shared) {
            break;
        }
        prefixLength = length;
    }
    return prefixLength;
}

std::size_t findSuffixLength(std::string_view minimal, std::size_t prefixLength,
                             std::vector<std::string> const& terms) {
    std::size_t suffixLength = 0;
    while (prefixLength + suffixLength < minimal.size()) {
        auto const length = minimal.size() - unitStart(minimal, minimal.size() - suffixLength);
        if (prefixLength + length > minimal.size()) {
            break;
        }
        auto const suffix = minimal.substr(minimal.size() - length);
        auto const shared = std::all_of(terms.begin(), terms.end(), [&](std::string const& term) {
            return term.ends_with(suffix);
        });
        if (!shared) {
            break;
        }
        suffixLength = length;
    }
    return suffixLength;
}

// Only R* and R? with atomic R are recognized; R*Q* is not.
bool allowsEmptyWord(std::string const& center) {
    return (center.ends_with('*') || center.ends_with('?')) && isAtomic(stripQuantifier(center));
}

std::string makeOptional(std::string const& term) {
    if (isAtomic(term)) {
        return term + "?";
    }
    if (term.ends_with('+') && isAtomic(stripQuantifier(term))) {
        return std::string{stripQuantifier(term)} + "*";
    }
    return "(" + term + ")?";
}

std::optional<std::string> mergeAdjacent(std::string const& last, std::string const& term) {
    auto const lastBase = stripQuantifier(last);
    if (endsWithQuantifier(last) && endsWithQuantifier(term) && lastBase == stripQuantifier(term)
        && isAtomic(lastBase)) {
        auto const p = last.back();
        auto const q = term.back();
        if (p == q) {
            // R+ R+ and R? R? can not be combined
            return p == '*' ? std::optional{last} : std::nullopt;
        }
        if (p == '+' || (p == '*' && q == '?')) {
            return last;
        }
        return term;
    }

    if (term.size() == last.size() + 1 && term.ends_with('*') && term.starts_with(last) && isAtomic(last)) {
        return last + "+";
    }
    if (last.size() == term.size() + 1 && last.ends_with('*') && last.starts_with(term) && isAtomic(term)) {
        return term + "+";
    }
    return std::nullopt;
}

}

std::string ExpressionOptimizer::Extraction::combine() const {
    auto centerPart = join(centers, "|");
    if (centers.size() > 1) {
        centerPart = "(" + centerPart + ")";
    }
    return prefix + centerPart + suffix;
}

ExpressionOptimizer::ExpressionOptimizer(std::string t_expression, std::ostream* t_trace)
    : m_expression(std::move(t_expression))
    , m_trace(t_trace) {

}

std::string ExpressionOptimizer::optimize() {
    auto current = optimizeOnce();
    // an extraction can leave R R* for the enclosing concatenation, so passes
    // repeat until the text is stable
    for (std::set<std::string> seen{m_expression}; seen.insert(current).second;) {
        auto next = ExpressionOptimizer{current, m_trace}.optimizeOnce();
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

std::string ExpressionOptimizer::optimizeOnce() {
    classify();
    split();
    optimizeTerms();
    optimizeExpression();
    return recombine();
}

std::optional<ExpressionOptimizer::Extraction> ExpressionOptimizer::extractPrefixAndSuffix(
        std::vector<std::string> const& terms, std::ostream* trace) {
    if (terms.empty()) {
        return std::nullopt;
    }

    auto const& minimal = *std::min_element(terms.begin(), terms.end(), [](auto const& lhs, auto const& rhs) {
        return lhs.size() < rhs.size();
    });
    auto const prefixLength = findPrefixLength(minimal, terms);
    auto const suffixLength = findSuffixLength(minimal, prefixLength, terms);
    if (prefixLength == 0 && suffixLength == 0) {
        return std::nullopt;
    }

    auto const sharedLength = prefixLength + suffixLength;
    Extraction extraction{minimal.substr(0, prefixLength), {}, minimal.substr(minimal.size() - suffixLength)};
    extraction.centers = Terms{terms}
        .filter([sharedLength](std::string const& term) {
            return term.size() != sharedLength;
        }).transform([&](std::string const& term) {
            return term.substr(prefixLength, term.size() - sharedLength);
        }).get();

    // a term consisting of prefix and suffix only needs an empty center
    auto& centers = extraction.centers;
    auto const needsEmptyWord = centers.size() < terms.size();
    if (needsEmptyWord && !centers.empty() && std::none_of(centers.begin(), centers.end(), allowsEmptyWord)) {
        std::stable_sort(centers.begin(), centers.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.size() < rhs.size();
        });
        auto modify = std::move(centers.front());
        centers.erase(centers.begin());
        centers.push_back(makeOptional(modify));
    }

    if (trace) {
        *trace << "OPT prefix/suffix: " << join(terms, "|") << " -> " << extraction.combine() << std::endl;
    }
    return extraction;
}

std::vector<std::string> ExpressionOptimizer::reduceTerms(std::vector<std::string> const& terms,
                                                          std::ostream* trace) {
    std::vector<std::string> reduced;
    for (auto const& term : terms) {
        if (!reduced.empty()) {
            if (auto merged = mergeAdjacent(reduced.back(), term); merged) {
                if (trace) {
                    *trace << "OPT concat: " << reduced.back() << " " << term << " -> " << *merged << std::endl;
                }
                reduced.back() = std::move(*merged);
                continue;
            }
        }
        reduced.push_back(term);
    }
    return reduced;
}

void ExpressionOptimizer::classify() {
    int depth = 0;
    m_isDisjunction = false;
    for (auto c : m_expression) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }

        if (depth == 0 && c == '|') {
            m_isDisjunction = true;
            break;
        }
    }
}

void ExpressionOptimizer::split() {
    m_terms.clear();
    if (m_isDisjunction) {
        splitDisjunction();
    } else {
        splitConcatenation();
    }
}

void ExpressionOptimizer::splitDisjunction() {
    int depth = 0;
    std::string part;
    for (auto c : m_expression) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }

        if (depth == 0 && c == '|') {
            m_terms.push_back(std::exchange(part, {}));
        } else {
            part.push_back(c);
        }
    }
    m_terms.push_back(std::move(part));
}

void ExpressionOptimizer::splitConcatenation() {
    std::string_view const expression = m_expression;
    for (std::size_t pos = 0; pos < expression.size();) {
        auto const length = unitLength(expression, pos);
        m_terms.emplace_back(expression.substr(pos, length));
        pos += length;
    }
}

void ExpressionOptimizer::optimizeTerms() {
    if (m_isDisjunction) {
        m_terms = Terms{std::move(m_terms)}
            .transform([this](std::string const& term) {
                return ExpressionOptimizer{term, m_trace}.optimize();
            }).removeDuplicates(m_trace)
            .get();
    } else {
        m_terms = Terms{std::move(m_terms)}
            .transform([this](std::string const& term) {
                return optimizeGroup(term);
            }).get();
    }
}

std::string ExpressionOptimizer::optimizeGroup(std::string const& term) const {
    if (!term.starts_with('(')) {
        // characters and classes are already minimal
        return term;
    }

    auto const quantifier = endsWithQuantifier(term) ? std::string(1, term.back()) : std::string{};
    ExpressionOptimizer subProblem{term.substr(1, term.size() - quantifier.size() - 2), m_trace};
    auto optimized = subProblem.optimize();

    if (!isAtomic(optimized)) {
        if (!quantifier.empty() || subProblem.hasDisjunctionPrecedenceProblems()) {
            optimized = "(" + optimized + ")" + quantifier;
        }
    } else {
        optimized += quantifier;
    }
    return optimized;
}

void ExpressionOptimizer::optimizeExpression() {
    if (m_isDisjunction) {
        if (m_terms.size() > 1) {
            if (auto extraction = extractPrefixAndSuffix(m_terms, m_trace); extraction) {
                m_terms = {extraction->combine()};
            }
        }
    } else if (m_terms.size() > 1) {
        m_terms = reduceTerms(m_terms, m_trace);
    }
}

std::string ExpressionOptimizer::recombine() const {
    return join(m_terms, m_isDisjunction ? "|" : "");
}
