#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "Dfa.h"
#include "Equation.h"

// One equation per automaton state; solving eliminates the unknowns from the
// highest id down to 0 and yields the expression of the start state.
class EquationSystem {
public:
    explicit EquationSystem(Dfa const& dfa);
    explicit EquationSystem(std::vector<Equation> t_equations);

    void setTrace(std::ostream* trace) {
        m_trace = trace;
    }

    std::size_t size() const {
        return m_equations.size();
    }

    Equation const& equation(UnknownId id) const {
        return m_equations.at(id);
    }

    // Consumes the system; a second call throws.
    std::string solve();

    std::ostream& print(std::ostream& os) const;

private:
    void applyArdensLemma(UnknownId upperLimit);
    void performSubstitution(Equation const& value);
    void mergeTerms(UnknownId upperLimit);

    std::vector<Equation> m_equations;
    std::ostream* m_trace = nullptr;
    bool m_solved = false;
};
