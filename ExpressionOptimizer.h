#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Rewrites an expression produced by EquationSystem::solve into a shorter
// equivalent one. Works on the restricted grammar only: literals, [...],
// (...), '|', implicit concatenation and postfix '*', '+', '?'.
class ExpressionOptimizer {
public:
    struct Extraction {
        std::string prefix;
        std::vector<std::string> centers;
        std::string suffix;

        std::string combine() const;
    };

    explicit ExpressionOptimizer(std::string t_expression, std::ostream* t_trace = nullptr);

    // Repeats optimization passes until the result no longer changes, so the
    // output is a fixpoint: optimizing it again returns it unchanged.
    std::string optimize();

    bool isDisjunction() const {
        return m_isDisjunction;
    }

    // terms after the first pass
    std::vector<std::string> const& terms() const {
        return m_terms;
    }

    // abcd|aefd|aghd -> a, {bc, ef, gh}, d; nullopt if nothing is shared
    static std::optional<Extraction> extractPrefixAndSuffix(std::vector<std::string> const& terms,
                                                            std::ostream* trace = nullptr);

    // R R* -> R+, R* R* -> R*, R+ R* -> R+, ...
    static std::vector<std::string> reduceTerms(std::vector<std::string> const& terms,
                                                std::ostream* trace = nullptr);

private:
    std::string optimizeOnce();
    void classify();
    void split();
    void splitDisjunction();
    void splitConcatenation();
    void optimizeTerms();
    std::string optimizeGroup(std::string const& term) const;
    void optimizeExpression();
    std::string recombine() const;

    // true for a disjunction of more than one term, which needs parentheses
    // inside a concatenation
    bool hasDisjunctionPrecedenceProblems() const {
        return m_isDisjunction && m_terms.size() > 1;
    }

    std::string const m_expression;
    std::ostream* const m_trace;
    std::vector<std::string> m_terms;
    bool m_isDisjunction = false;
};
