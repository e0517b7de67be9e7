#include "Dfa.h"

#include <map>
#include <set>
#include <utility>

#include "RegexSyntax.h"
#include "utils.h"

namespace {

enum class Section {
    None,
    States,
    Initial,
    Accepting,
    Alphabet,
    Transitions
};

std::optional<Section> sectionOf(std::string const& header) {
    static std::map<std::string, Section> const sections{
        {"#states", Section::States},
        {"#initial", Section::Initial},
        {"#accepting", Section::Accepting},
        {"#alphabet", Section::Alphabet},
        {"#transitions", Section::Transitions},
    };
    if (auto it = sections.find(header); it != sections.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string trim(std::string const& line) {
    auto const whitespace = " \t\r\n";
    auto begin = line.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = line.find_last_not_of(whitespace);
    return line.substr(begin, end - begin + 1);
}

std::string stateLabel(StateName q) {
    return "s" + std::to_string(q);
}

}

DfaFormatError::DfaFormatError(std::string const& message, std::size_t t_line)
    : std::runtime_error("line " + std::to_string(t_line) + ": " + message)
    , m_line(t_line) {

}

Dfa::Dfa(std::size_t stateCount, std::string t_alphabet)
    : m_alphabet(std::move(t_alphabet)) {
    if (stateCount == 0) {
        throw std::runtime_error("An automaton needs at least one state");
    }
    if (m_alphabet.empty()) {
        throw std::runtime_error("Empty alphabet");
    }
    for (std::size_t i = 0; i != m_alphabet.size(); ++i) {
        auto symbol = m_alphabet[i];
        if (METACHARACTERS.find(symbol) != std::string_view::npos) {
            throw std::runtime_error(std::string{"Symbol '"} + symbol + "' is an operator");
        }
        if (m_alphabet.find(symbol) != i) {
            throw std::runtime_error(std::string{"Duplicate symbol '"} + symbol + "'");
        }
    }

    m_states.reserve(stateCount);
    for (StateName q = 0; q != stateCount; ++q) {
        m_states.push_back(State{q, std::vector<std::optional<StateName>>(m_alphabet.size()), false});
    }
}

Dfa Dfa::divisibility(unsigned base, unsigned divisor) {
    if (base < 2 || base > FULL_ALPHABET.size()) {
        throw std::runtime_error("Invalid base " + std::to_string(base) + ", allowed values are [2.."
                                 + std::to_string(FULL_ALPHABET.size()) + "]");
    }
    if (divisor < 1) {
        throw std::runtime_error("Invalid divisor " + std::to_string(divisor) + ", allowed values are [1..]");
    }

    // state r is the remainder of the digits read so far
    Dfa dfa{divisor, std::string{FULL_ALPHABET.substr(0, base)}};
    dfa.makeFinal(0);
    for (StateName remainder = 0; remainder != divisor; ++remainder) {
        for (std::size_t digit = 0; digit != base; ++digit) {
            dfa.addTransition(remainder, digit, (remainder * base + digit) % divisor);
        }
    }
    return dfa;
}

Dfa Dfa::readText(std::istream& is) {
    struct Entry {
        std::string name;
        std::size_t line;
    };
    struct Link {
        Entry from;
        char symbol;
        Entry to;
    };

    std::vector<std::string> names;
    std::set<std::string> declared;
    std::optional<Entry> initial;
    std::vector<Entry> accepting;
    std::string alphabet;
    std::vector<Link> links;

    auto section = Section::None;
    std::size_t lineNo = 0;
    std::string raw;
    while (std::getline(is, raw)) {
        ++lineNo;
        auto line = trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '#') {
            auto next = sectionOf(line);
            if (!next) {
                throw DfaFormatError("Unknown section " + line, lineNo);
            }
            section = *next;
            continue;
        }

        switch (section) {
            case Section::None:
                throw DfaFormatError("Entry outside of a section: " + line, lineNo);
            case Section::States:
                if (!declared.insert(line).second) {
                    throw DfaFormatError("Duplicate state " + line, lineNo);
                }
                names.push_back(line);
                break;
            case Section::Initial:
                if (initial) {
                    throw DfaFormatError("Second initial state " + line, lineNo);
                }
                initial = Entry{line, lineNo};
                break;
            case Section::Accepting:
                accepting.push_back(Entry{line, lineNo});
                break;
            case Section::Alphabet:
                if (line.size() != 1) {
                    throw DfaFormatError("Symbol must be a single character: " + line, lineNo);
                }
                if (METACHARACTERS.find(line[0]) != std::string_view::npos) {
                    throw DfaFormatError("Symbol '" + line + "' is an operator", lineNo);
                }
                if (alphabet.find(line[0]) != std::string::npos) {
                    throw DfaFormatError("Duplicate symbol '" + line + "'", lineNo);
                }
                alphabet.push_back(line[0]);
                break;
            case Section::Transitions: {
                // <from>:<symbol>><to>
                auto colon = line.find(':');
                if (colon == std::string::npos || colon == 0 || colon + 3 >= line.size() || line[colon + 2] != '>') {
                    throw DfaFormatError("Expected <from>:<symbol>><to>, got " + line, lineNo);
                }
                links.push_back(Link{Entry{line.substr(0, colon), lineNo}, line[colon + 1],
                                     Entry{line.substr(colon + 3), lineNo}});
                break;
            }
        }
    }

    if (names.empty()) {
        throw DfaFormatError("No states declared", lineNo);
    }
    if (!initial) {
        throw DfaFormatError("No initial state declared", lineNo);
    }
    if (!declared.count(initial->name)) {
        throw DfaFormatError("Unknown state " + initial->name, initial->line);
    }
    if (alphabet.empty()) {
        throw DfaFormatError("Empty alphabet", lineNo);
    }

    // the initial state becomes state 0, the others keep their order
    std::map<std::string, StateName> index{{initial->name, 0}};
    StateName next = 1;
    for (auto const& name : names) {
        if (name != initial->name) {
            index.emplace(name, next++);
        }
    }
    auto const resolve = [&](Entry const& entry) {
        auto it = index.find(entry.name);
        if (it == index.end()) {
            throw DfaFormatError("Unknown state " + entry.name, entry.line);
        }
        return it->second;
    };

    Dfa dfa{names.size(), alphabet};
    for (auto const& entry : accepting) {
        dfa.makeFinal(resolve(entry));
    }
    for (auto const& link : links) {
        auto symbol = alphabet.find(link.symbol);
        if (symbol == std::string::npos) {
            throw DfaFormatError(std::string{"Unknown symbol '"} + link.symbol + "'", link.from.line);
        }
        auto from = resolve(link.from);
        if (dfa.hasTransition(from, symbol)) {
            throw DfaFormatError("Duplicate transition " + link.from.name + ":" + link.symbol, link.from.line);
        }
        dfa.addTransition(from, symbol, resolve(link.to));
    }
    return dfa;
}

void Dfa::makeFinal(StateName q) {
    checkState(q);
    m_states[q].isFinal = true;
}

void Dfa::addTransition(StateName from, std::size_t symbol, StateName to) {
    checkState(from);
    checkState(to);
    checkSymbol(symbol);

    auto& link = m_states[from].links[symbol];
    if (link) {
        throw std::runtime_error("Can not override successor of " + stateLabel(from) + " for symbol "
                                 + m_alphabet[symbol]);
    }
    link = to;
}

bool Dfa::hasTransition(StateName q, std::size_t symbol) const {
    return transition(q, symbol).has_value();
}

std::optional<StateName> Dfa::transition(StateName q, std::size_t symbol) const {
    checkState(q);
    checkSymbol(symbol);
    return m_states[q].links[symbol];
}

bool Dfa::isFinal(StateName q) const {
    checkState(q);
    return m_states[q].isFinal;
}

Dfa::State const& Dfa::state(StateName q) const {
    checkState(q);
    return m_states[q];
}

bool Dfa::isComplete() const {
    for (auto const& state : m_states) {
        for (auto const& link : state.links) {
            if (!link) {
                return false;
            }
        }
    }
    return true;
}

bool Dfa::accepts(std::string_view word) const {
    StateName current = 0;
    for (auto c : word) {
        auto symbol = m_alphabet.find(c);
        if (symbol == std::string::npos) {
            return false;
        }
        auto next = m_states[current].links[symbol];
        if (!next) {
            return false;
        }
        current = *next;
    }
    return m_states[current].isFinal;
}

std::ostream& Dfa::printScheme(std::ostream& os) const {
    {
        os << "digraph finite_state_machine {\n\trankdir=LR;\n\tsize=\"8,5\";\n\n";
    }
    {
        std::vector<std::string> finalStates;
        std::vector<std::string> otherStates;
        for (auto const& state : m_states) {
            (state.isFinal ? finalStates : otherStates).push_back(stateLabel(state.name));
        }
        if (!finalStates.empty()) {
            os << "\tnode [shape = doublecircle]; ";
            join(os, finalStates, " ") << ";\n";
        }
        if (!otherStates.empty()) {
            os << "\tnode [shape = circle]; ";
            join(os, otherStates, " ") << ";\n";
        }
        os << "\n";
    }
    {
        for (auto const& state : m_states) {
            std::map<StateName, std::vector<char>> labels;
            for (std::size_t symbol = 0; symbol != state.links.size(); ++symbol) {
                if (auto const& link = state.links[symbol]; link) {
                    labels[*link].push_back(m_alphabet[symbol]);
                }
            }
            for (auto const& [to, symbols] : labels) {
                os << "\t" << stateLabel(state.name) << " -> " << stateLabel(to) << " [label = \"";
                join(os, symbols, ",") << "\"];\n";
            }
        }
    }
    {
        os << "}\n";
    }
    return os.flush();
}

std::ostream& Dfa::printText(std::ostream& os) const {
    os << "#states\n";
    for (auto const& state : m_states) {
        os << stateLabel(state.name) << "\n";
    }
    os << "#initial\n" << stateLabel(0) << "\n#accepting\n";
    for (auto const& state : m_states) {
        if (state.isFinal) {
            os << stateLabel(state.name) << "\n";
        }
    }
    os << "#alphabet\n";
    for (auto symbol : m_alphabet) {
        os << symbol << "\n";
    }
    os << "#transitions\n";
    for (auto const& state : m_states) {
        for (std::size_t symbol = 0; symbol != state.links.size(); ++symbol) {
            if (auto const& link = state.links[symbol]; link) {
                os << stateLabel(state.name) << ":" << m_alphabet[symbol] << ">" << stateLabel(*link) << "\n";
            }
        }
    }

    return os.flush();
}

void Dfa::checkState(StateName q) const {
    if (q >= m_states.size()) {
        throw std::runtime_error("Bad state index " + std::to_string(q));
    }
}

void Dfa::checkSymbol(std::size_t symbol) const {
    if (symbol >= m_alphabet.size()) {
        throw std::runtime_error("Bad symbol index " + std::to_string(symbol));
    }
}
