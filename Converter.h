#pragma once

#include <ostream>
#include <string>

#include "Dfa.h"

struct ConvertOptions {
    bool optimize = true;
    std::ostream* trace = nullptr;
};

// Expression accepting exactly the language of dfa.
std::string toRegex(Dfa const& dfa, ConvertOptions const& options = {});
