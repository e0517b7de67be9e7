#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using StateName = std::size_t;

class DfaFormatError : public std::runtime_error {
public:
    DfaFormatError(std::string const& message, std::size_t t_line);

    std::size_t line() const {
        return m_line;
    }

private:
    std::size_t m_line;
};

// Deterministic automaton over a character alphabet; state 0 is the start state.
class Dfa {
public:
    static constexpr std::string_view FULL_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    struct State {
        StateName name;
        std::vector<std::optional<StateName>> links; // indexed by symbol
        bool isFinal = false;
    };

    Dfa(std::size_t stateCount, std::string t_alphabet);

    // Accepts the numbers divisible by divisor written in the given base.
    static Dfa divisibility(unsigned base, unsigned divisor);

    static Dfa readText(std::istream& is);

    void makeFinal(StateName q);
    void addTransition(StateName from, std::size_t symbol, StateName to);

    bool hasTransition(StateName q, std::size_t symbol) const;
    std::optional<StateName> transition(StateName q, std::size_t symbol) const;
    bool isFinal(StateName q) const;

    State const& state(StateName q) const;
    std::vector<State> const& states() const {
        return m_states;
    }
    std::size_t stateCount() const {
        return m_states.size();
    }
    std::string const& alphabet() const {
        return m_alphabet;
    }

    bool isComplete() const;
    bool accepts(std::string_view word) const;

    std::ostream& printScheme(std::ostream& os) const;
    std::ostream& printText(std::ostream& os) const;

private:
    void checkState(StateName q) const;
    void checkSymbol(std::size_t symbol) const;

    std::vector<State> m_states;
    std::string m_alphabet;
};
