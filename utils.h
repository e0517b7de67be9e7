#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

template <typename List>
std::ostream& join(std::ostream& os, List const& list, std::string_view delim) {
    bool isFirst = true;
    for (auto const& el : list) {
        if (!std::exchange(isFirst, false)) {
            os << delim;
        }
        os << el;
    }

    return os;
}

template <typename List>
std::string join(List const& list, std::string_view delim) {
    std::ostringstream os;
    join(os, list, delim);
    return os.str();
}
