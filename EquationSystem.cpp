#include "EquationSystem.h"

#include <stdexcept>
#include <utility>

EquationSystem::EquationSystem(Dfa const& dfa) {
    m_equations.reserve(dfa.stateCount());
    for (auto const& state : dfa.states()) {
        m_equations.emplace_back(state.name, state, dfa.alphabet());
    }
}

EquationSystem::EquationSystem(std::vector<Equation> t_equations)
    : m_equations(std::move(t_equations)) {
    if (m_equations.empty()) {
        throw std::runtime_error("Empty equation system");
    }
    for (UnknownId i = 0; i != m_equations.size(); ++i) {
        if (m_equations[i].id() != i) {
            throw std::runtime_error("Equation " + std::to_string(m_equations[i].id()) + " at position "
                                     + std::to_string(i));
        }
    }
}

std::string EquationSystem::solve() {
    if (std::exchange(m_solved, true)) {
        throw std::runtime_error("Equation system already solved");
    }

    for (auto eliminate = m_equations.size() - 1; eliminate != static_cast<UnknownId>(-1); --eliminate) {
        // the eliminated equation itself may still reference itself
        applyArdensLemma(eliminate);
        // no equation >= eliminate references eliminate any more
        performSubstitution(m_equations[eliminate]);
        mergeTerms(eliminate);

        if (m_trace) {
            *m_trace << "Step " << eliminate << ":\n";
            print(*m_trace);
        }
    }

    m_equations[0].mergeTerms();
    return m_equations[0].toExpression();
}

std::ostream& EquationSystem::print(std::ostream& os) const {
    for (auto const& equation : m_equations) {
        equation.print(os << "  ") << "\n";
    }
    return os;
}

void EquationSystem::applyArdensLemma(UnknownId upperLimit) {
    for (UnknownId i = 0; i <= upperLimit; ++i) {
        m_equations[i].applyArdensLemma();
    }
}

void EquationSystem::performSubstitution(Equation const& value) {
    for (UnknownId i = 0; i < value.id(); ++i) {
        m_equations[i].substitute(value);
    }
}

void EquationSystem::mergeTerms(UnknownId upperLimit) {
    for (UnknownId i = 0; i < upperLimit; ++i) {
        m_equations[i].mergeTerms();
    }
}
