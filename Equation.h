#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "Dfa.h"
#include "Term.h"

// X_id = prefix_1.X_1 | ... | prefix_k.X_k | accepting prefix
//
// Invariant: at most one term per reference value. substitute() breaks it and
// marks the equation as pending; only mergeTerms() may be called until the
// invariant is restored.
class Equation {
public:
    Equation(UnknownId t_id, Dfa::State const& state, std::string_view alphabet);
    Equation(UnknownId t_id, std::vector<Term> t_terms);

    UnknownId id() const {
        return m_id;
    }

    std::vector<Term> const& terms() const {
        return m_terms;
    }

    bool pendingMerge() const {
        return m_pendingMerge;
    }

    // X = AX | B  =>  X = A*B
    void applyArdensLemma();

    void substitute(Equation const& value);

    void mergeTerms();

    std::string toExpression() const;

    std::ostream& print(std::ostream& os) const;

private:
    std::vector<Term>::iterator findTerm(UnknownId reference);
    void requireMerged(std::string_view operation) const;

    UnknownId m_id;
    std::vector<Term> m_terms;
    bool m_pendingMerge = false;
};
