#include "Equation.h"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "RegexSyntax.h"
#include "utils.h"

namespace {

std::string combine(std::set<std::string> const& prefixes) {
    if (prefixes.size() == 1) {
        return *prefixes.begin();
    }
    if (std::all_of(prefixes.begin(), prefixes.end(), [](std::string const& prefix) {
            return prefix.size() == 1;
        })) {
        return "[" + join(prefixes, "") + "]";
    }
    return "(" + join(prefixes, "|") + ")";
}

}

Equation::Equation(UnknownId t_id, Dfa::State const& state, std::string_view alphabet)
    : m_id(t_id) {
    if (state.links.size() != alphabet.size()) {
        throw std::runtime_error("Alphabet of size " + std::to_string(alphabet.size()) + " for a state with "
                                 + std::to_string(state.links.size()) + " symbols");
    }

    for (std::size_t symbol = 0; symbol != state.links.size(); ++symbol) {
        if (auto const& link = state.links[symbol]; link) {
            m_terms.push_back(Term{std::string(1, alphabet[symbol]), *link});
        }
    }
    if (state.isFinal) {
        m_terms.push_back(Term{"", std::nullopt});
    }

    mergeTerms();
}

Equation::Equation(UnknownId t_id, std::vector<Term> t_terms)
    : m_id(t_id)
    , m_terms(std::move(t_terms)) {
    mergeTerms();
}

void Equation::applyArdensLemma() {
    requireMerged("Arden's Lemma");

    auto recursive = findTerm(m_id);
    if (recursive == m_terms.end()) {
        return;
    }

    auto star = isAtomic(recursive->prefix) ? recursive->prefix : "(" + recursive->prefix + ")";
    star += '*';

    std::vector<Term> terms;
    terms.reserve(m_terms.size() - 1);
    for (auto const& term : m_terms) {
        if (term.reference != m_id) {
            terms.push_back(Term{star + term.prefix, term.reference});
        }
    }
    m_terms = std::move(terms);
}

void Equation::substitute(Equation const& value) {
    requireMerged("substitution");
    value.requireMerged("substitution");
    if (value.m_id == m_id) {
        std::ostringstream os;
        os << "Substitution of " << Unknown{m_id} << " into itself";
        throw std::runtime_error(os.str());
    }

    auto target = findTerm(value.m_id);
    if (target == m_terms.end()) {
        return;
    }

    auto prefix = std::move(target->prefix);
    m_terms.erase(target);
    for (auto const& term : value.m_terms) {
        m_terms.push_back(Term{prefix + term.prefix, term.reference});
    }
    m_pendingMerge = true;
}

void Equation::mergeTerms() {
    std::map<std::optional<UnknownId>, std::set<std::string>> groups;
    for (auto& term : m_terms) {
        groups[term.reference].insert(std::move(term.prefix));
    }

    std::vector<Term> terms;
    terms.reserve(groups.size());
    for (auto const& [reference, prefixes] : groups) {
        terms.push_back(Term{combine(prefixes), reference});
    }
    m_terms = std::move(terms);
    m_pendingMerge = false;
}

std::string Equation::toExpression() const {
    requireMerged("expression extraction");

    if (m_terms.size() != 1 || !m_terms.front().accepting()) {
        std::ostringstream os;
        os << "Variables left in result: ";
        print(os);
        throw std::runtime_error(os.str());
    }
    return m_terms.front().prefix;
}

std::ostream& Equation::print(std::ostream& os) const {
    os << Unknown{m_id} << " = ";
    if (m_terms.empty()) {
        return os << "<NONE>";
    }
    return join(os, m_terms, " | ");
}

std::vector<Term>::iterator Equation::findTerm(UnknownId reference) {
    return std::find_if(m_terms.begin(), m_terms.end(), [reference](Term const& term) {
        return term.reference == reference;
    });
}

void Equation::requireMerged(std::string_view operation) const {
    if (m_pendingMerge) {
        std::ostringstream os;
        os << "Merge pending on " << Unknown{m_id} << " before " << operation;
        throw std::runtime_error(os.str());
    }
}
