#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

using UnknownId = std::size_t;

struct Unknown {
    UnknownId const id;

    friend std::ostream& operator<<(std::ostream& os, Unknown const& unknown) {
        return os << "<S_" << unknown.id << ">";
    }
};

// prefix followed by an optional unknown; no unknown means the word ends here
struct Term {
    std::string prefix;
    std::optional<UnknownId> reference;

    bool accepting() const {
        return !reference.has_value();
    }

    friend bool operator==(Term const& lhs, Term const& rhs) = default;

    friend std::ostream& operator<<(std::ostream& os, Term const& term) {
        if (term.prefix.empty() && term.accepting()) {
            return os << "<eps>";
        }
        os << term.prefix;
        if (term.reference) {
            if (!term.prefix.empty()) {
                os << ".";
            }
            os << Unknown{*term.reference};
        }
        return os;
    }
};
