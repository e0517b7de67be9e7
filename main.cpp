#include <cctype>
#include <climits>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "Converter.h"
#include "Dfa.h"

namespace {

struct Options {
    std::optional<std::string> file;
    std::vector<std::string> numbers;
    bool raw = false;
    bool verbose = false;
    bool dot = false;
    bool text = false;
};

void usage(std::ostream& os) {
    os << "Usage: dfa2regex <base> <divisor> [--raw] [--verbose] [--dot] [--text]\n"
       << "       dfa2regex --file <path> [--raw] [--verbose] [--dot] [--text]\n";
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string_view const arg = argv[i];
        if (arg == "--raw") {
            options.raw = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--dot") {
            options.dot = true;
        } else if (arg == "--text") {
            options.text = true;
        } else if (arg == "--file") {
            if (++i == argc) {
                return std::nullopt;
            }
            options.file = argv[i];
        } else if (arg.starts_with("--")) {
            return std::nullopt;
        } else {
            options.numbers.emplace_back(arg);
        }
    }

    if (options.file ? !options.numbers.empty() : options.numbers.size() != 2) {
        return std::nullopt;
    }
    return options;
}

std::optional<unsigned> parseNumber(std::string const& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        auto const value = std::stoul(text, &pos);
        if (pos != text.size() || value > UINT_MAX) {
            return std::nullopt;
        }
        return static_cast<unsigned>(value);
    } catch (std::out_of_range const&) {
        return std::nullopt;
    }
}

Dfa readFile(std::string const& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open file " + path);
    }
    return Dfa::readText(file);
}

}

int main(int argc, char* argv[]) {
    auto const options = parseArguments(argc, argv);
    if (!options) {
        usage(std::cerr);
        return 1;
    }

    std::optional<unsigned> base;
    std::optional<unsigned> divisor;
    if (!options->file) {
        base = parseNumber(options->numbers[0]);
        divisor = parseNumber(options->numbers[1]);
        if (!base || !divisor) {
            std::cerr << "Please input numbers for base and divisor" << std::endl;
            return 1;
        }
    }

    try {
        auto const dfa = options->file ? readFile(*options->file) : Dfa::divisibility(*base, *divisor);

        if (options->dot) {
            dfa.printScheme(std::cout);
            return 0;
        }
        if (options->text) {
            dfa.printText(std::cout);
            return 0;
        }

        ConvertOptions const convert{!options->raw, options->verbose ? &std::cerr : nullptr};
        std::cout << toRegex(dfa, convert) << std::endl;
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
