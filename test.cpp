#include <functional>
#include <iostream>
#include <random>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Converter.h"
#include "Dfa.h"
#include "Equation.h"
#include "EquationSystem.h"
#include "ExpressionOptimizer.h"
#include "RegexSyntax.h"
#include "Transformer.h"
#include "utils.h"

template <typename T>
std::string show(T const& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

#define EXPECT(x) \
{                 \
    if (!(x)) throw std::runtime_error("Error: "  __FILE__  ":" + std::to_string(__LINE__) + ": " #x); \
}

#define EXPECT_EQ(x, y) \
{                       \
    auto const& lhs = (x); \
    auto const& rhs = (y); \
    if (!(lhs == rhs)) throw std::runtime_error("Error: "  __FILE__  ":" + std::to_string(__LINE__) + ": " + show(lhs) + "?" + show(rhs)); \
}

#define EXPECT_THROW(x) \
{                       \
    bool thrown = false; \
    try { x; } catch (std::runtime_error const&) { thrown = true; } \
    if (!thrown) throw std::runtime_error("Error: "  __FILE__  ":" + std::to_string(__LINE__) + ": no exception from " #x); \
}

std::string optimize(std::string const& expression) {
    return ExpressionOptimizer{expression}.optimize();
}

std::string toBase(unsigned value, unsigned base) {
    std::string digits;
    do {
        digits.insert(digits.begin(), Dfa::FULL_ALPHABET[value % base]);
        value /= base;
    } while (value != 0);
    return digits;
}

// every word over the alphabet up to maxLength, shortest first
std::vector<std::string> words(std::string const& alphabet, std::size_t maxLength) {
    std::vector<std::string> result{""};
    for (std::size_t begin = 0; begin != result.size(); ++begin) {
        if (result[begin].size() == maxLength) {
            continue;
        }
        for (auto symbol : alphabet) {
            result.push_back(result[begin] + symbol);
        }
    }
    return result;
}

void expectEquivalent(Dfa const& dfa, std::string const& expression, std::size_t maxLength) {
    std::regex const re{expression};
    for (auto const& word : words(dfa.alphabet(), maxLength)) {
        if (dfa.accepts(word) != std::regex_match(word, re)) {
            throw std::runtime_error("Error: " + expression + " disagrees with the automaton on \"" + word + "\"");
        }
    }
}

bool hasOneTermPerReference(Equation const& equation) {
    auto const& terms = equation.terms();
    for (std::size_t i = 0; i != terms.size(); ++i) {
        for (std::size_t j = i + 1; j != terms.size(); ++j) {
            if (terms[i].reference == terms[j].reference) {
                return false;
            }
        }
    }
    return true;
}

bool referencesItself(Equation const& equation) {
    for (auto const& term : equation.terms()) {
        if (term.reference == equation.id()) {
            return true;
        }
    }
    return false;
}

Dfa endsInZero() {
    Dfa dfa{2, "01"};
    dfa.makeFinal(0);
    dfa.addTransition(0, 0, 0);
    dfa.addTransition(0, 1, 1);
    dfa.addTransition(1, 1, 1);
    dfa.addTransition(1, 0, 0);
    return dfa;
}

void testAtomic() {
    EXPECT(isAtomic("a"));
    EXPECT(isAtomic("[01]"));
    EXPECT(isAtomic("(ab)"));
    EXPECT(isAtomic("(a|b)"));
    EXPECT(isAtomic("((a)b)"));
    EXPECT(!isAtomic(""));
    EXPECT(!isAtomic("*"));
    EXPECT(!isAtomic("|"));
    EXPECT(!isAtomic("ab"));
    EXPECT(!isAtomic("a*"));
    EXPECT(!isAtomic("(a)(b)"));
    EXPECT(!isAtomic("(a)*"));
    EXPECT(!isAtomic("[01][23]"));
}

void testUnits() {
    std::string_view const expr = "[01]*a(b(c)d)+e";
    EXPECT_EQ(atomLength(expr, 0), 4u);
    EXPECT_EQ(unitLength(expr, 0), 5u);
    EXPECT_EQ(unitLength(expr, 5), 1u);
    EXPECT_EQ(atomLength(expr, 6), 7u);
    EXPECT_EQ(unitLength(expr, 6), 8u);
    EXPECT_EQ(unitStart(expr, expr.size()), 14u);
    EXPECT_EQ(unitStart(expr, 14), 6u);
    EXPECT_EQ(unitStart(expr, 6), 5u);
    EXPECT_EQ(unitStart(expr, 5), 0u);
    EXPECT_THROW(atomLength("(ab", 0));
    EXPECT_THROW(atomLength("[ab", 0));
    EXPECT_THROW(unitStart("ab)", 3));
}

void testTransformer() {
    Transformer<std::string> t{{"a", "bb", "a", "ccc", "bb"}};
    EXPECT_EQ(join(t.removeDuplicates().get(), ","), std::string{"a,bb,ccc"});
    EXPECT_EQ(join(t.filter([](std::string const& s) { return s.size() > 1; }).get(), ","), std::string{"bb,ccc,bb"});
    EXPECT_EQ(join(t.transform([](std::string const& s) { return s + "*"; }).get(), ""), std::string{"a*bb*a*ccc*bb*"});
}

void testEquationFromState() {
    auto const dfa = endsInZero();
    Equation equation{0, dfa.state(0), dfa.alphabet()};
    std::ostringstream os;
    equation.print(os);
    EXPECT_EQ(os.str(), std::string{"<S_0> = <eps> | 0.<S_0> | 1.<S_1>"});

    Dfa classes{1, "abc"};
    classes.addTransition(0, 0, 0);
    classes.addTransition(0, 2, 0);
    Equation merged{0, classes.state(0), classes.alphabet()};
    EXPECT_EQ(merged.terms().size(), 1u);
    EXPECT_EQ(merged.terms()[0], (Term{"[ac]", 0}));

    EXPECT_THROW((Equation{0, dfa.state(0), "012"}));
}

void testMergeTerms() {
    Equation equation{0, {Term{"b", 1}, Term{"a", 1}, Term{"c", 0}, Term{"(xy)", 0}, Term{"", std::nullopt},
                          Term{"a", 1}}};
    EXPECT(hasOneTermPerReference(equation));
    EXPECT_EQ(equation.terms().size(), 3u);
    EXPECT_EQ(equation.terms()[0], (Term{"", std::nullopt}));
    EXPECT_EQ(equation.terms()[1], (Term{"((xy)|c)", 0}));
    EXPECT_EQ(equation.terms()[2], (Term{"[ab]", 1}));
}

void testArdensLemma() {
    Equation atomic{2, {Term{"a", 2}, Term{"b", 0}, Term{"", std::nullopt}}};
    atomic.applyArdensLemma();
    EXPECT(!referencesItself(atomic));
    EXPECT_EQ(atomic.terms().size(), 2u);
    EXPECT_EQ(atomic.terms()[0], (Term{"a*", std::nullopt}));
    EXPECT_EQ(atomic.terms()[1], (Term{"a*b", 0}));

    Equation grouped{1, {Term{"ab", 1}, Term{"c", 0}}};
    grouped.applyArdensLemma();
    EXPECT(!referencesItself(grouped));
    EXPECT_EQ(grouped.terms()[0], (Term{"(ab)*c", 0}));

    // no self reference: nothing to do
    Equation plain{1, {Term{"ab", 0}, Term{"c", std::nullopt}}};
    auto const before = plain.terms();
    plain.applyArdensLemma();
    EXPECT(plain.terms() == before);

    // X = aX has the empty language as solution
    Equation dead{0, {Term{"a", 0}}};
    dead.applyArdensLemma();
    EXPECT(dead.terms().empty());
    EXPECT_THROW(dead.toExpression());
}

void testSubstitute() {
    Equation x0{0, {Term{"a", 0}, Term{"b", 1}, Term{"", std::nullopt}}};
    Equation x1{1, {Term{"c", 0}, Term{"d", std::nullopt}}};

    x0.substitute(x1);
    EXPECT(x0.pendingMerge());
    EXPECT(!hasOneTermPerReference(x0));
    EXPECT_THROW(x0.toExpression());
    EXPECT_THROW(x0.applyArdensLemma());
    EXPECT_THROW(x0.substitute(x1));
    EXPECT_THROW(x1.substitute(x0));

    x0.mergeTerms();
    EXPECT(!x0.pendingMerge());
    EXPECT(hasOneTermPerReference(x0));
    EXPECT_EQ(x0.terms().size(), 2u);
    EXPECT_EQ(x0.terms()[0], (Term{"(|bd)", std::nullopt}));
    EXPECT_EQ(x0.terms()[1], (Term{"(a|bc)", 0}));

    // nothing references X_0 in X_1 any more
    Equation y1{1, {Term{"e", std::nullopt}}};
    y1.substitute(x0);
    EXPECT(!y1.pendingMerge());
    EXPECT_THROW(x0.substitute(x0));
}

void testToExpression() {
    Equation solved{0, {Term{"ab*", std::nullopt}}};
    EXPECT_EQ(solved.toExpression(), std::string{"ab*"});

    Equation unsolved{0, {Term{"a", 1}, Term{"b", std::nullopt}}};
    EXPECT_THROW(unsolved.toExpression());
}

void testSolveEndsInZero() {
    auto const dfa = endsInZero();
    EquationSystem system{dfa};
    EXPECT_EQ(system.size(), 2u);
    EXPECT_EQ(system.equation(1).terms().size(), 2u);
    auto const raw = system.solve();
    EXPECT_EQ(raw, std::string{"(0*11*0)*0*"});
    EXPECT_THROW(system.solve());

    auto const expression = toRegex(dfa);
    EXPECT_EQ(expression, std::string{"(0*1+0)*0*"});
    EXPECT_EQ(optimize(expression), expression);

    std::regex const re{expression};
    EXPECT(std::regex_match("1010", re));
    EXPECT(std::regex_match("0000", re));
    EXPECT(std::regex_match("", re));
    EXPECT(!std::regex_match("1", re));
    EXPECT(!std::regex_match("101", re));
    expectEquivalent(dfa, expression, 10);
}

void testSolveTrace() {
    std::ostringstream trace;
    auto const expression = toRegex(endsInZero(), ConvertOptions{true, &trace});
    EXPECT_EQ(expression, std::string{"(0*1+0)*0*"});
    EXPECT(trace.str().find("Step 0:") != std::string::npos);
    EXPECT(trace.str().find("OPT concat: 1 1* -> 1+") != std::string::npos);
}

void testEquationSystemValidation() {
    EXPECT_THROW(EquationSystem{std::vector<Equation>{}});
    EXPECT_THROW((EquationSystem{std::vector<Equation>{Equation{1, {Term{"a", std::nullopt}}}}}));

    // the empty language has no expression
    Dfa empty{2, "a"};
    empty.addTransition(0, 0, 1);
    EXPECT_THROW(toRegex(empty));
}

void testExtraction() {
    auto const extraction = ExpressionOptimizer::extractPrefixAndSuffix({"abcd", "aefd", "aghd"});
    EXPECT(extraction.has_value());
    EXPECT_EQ(extraction->prefix, std::string{"a"});
    EXPECT_EQ(extraction->suffix, std::string{"d"});
    EXPECT_EQ(join(extraction->centers, ","), std::string{"bc,ef,gh"});
    EXPECT_EQ(extraction->combine(), std::string{"a(bc|ef|gh)d"});

    EXPECT(!ExpressionOptimizer::extractPrefixAndSuffix({"ab", "cd"}).has_value());

    // units are never split
    auto const quantified = ExpressionOptimizer::extractPrefixAndSuffix({"a*b", "ab"});
    EXPECT(quantified.has_value());
    EXPECT(quantified->prefix.empty());
    EXPECT_EQ(quantified->combine(), std::string{"(a*|a)b"});
    auto const classes = ExpressionOptimizer::extractPrefixAndSuffix({"[01]x", "[01]y"});
    EXPECT(classes.has_value());
    EXPECT_EQ(classes->prefix, std::string{"[01]"});

    // the center has to accept the empty word
    EXPECT_EQ(ExpressionOptimizer::extractPrefixAndSuffix({"ab", "a"})->combine(), std::string{"ab?"});
    EXPECT_EQ(ExpressionOptimizer::extractPrefixAndSuffix({"ab+", "a"})->combine(), std::string{"ab*"});
    EXPECT_EQ(ExpressionOptimizer::extractPrefixAndSuffix({"abc", "a"})->combine(), std::string{"a(bc)?"});
    EXPECT_EQ(ExpressionOptimizer::extractPrefixAndSuffix({"ab*", "a"})->combine(), std::string{"ab*"});
    EXPECT_EQ(ExpressionOptimizer::extractPrefixAndSuffix({"xcy", "xddy", "xy"})->combine(),
              std::string{"x(dd|c?)y"});
}

void testReduceTerms() {
    using Vec = std::vector<std::string>;
    EXPECT(ExpressionOptimizer::reduceTerms({"a", "a*"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a*", "a*"}) == Vec{"a*"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a+", "a*"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a*", "a"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a*", "a+"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a?", "a*"}) == Vec{"a*"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a*", "a?"}) == Vec{"a*"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a?", "a+"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a+", "a?"}) == Vec{"a+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"a+", "a+"}) == (Vec{"a+", "a+"}));
    EXPECT(ExpressionOptimizer::reduceTerms({"a?", "a?"}) == (Vec{"a?", "a?"}));
    EXPECT(ExpressionOptimizer::reduceTerms({"a", "a"}) == (Vec{"a", "a"}));
    EXPECT(ExpressionOptimizer::reduceTerms({"a", "b*"}) == (Vec{"a", "b*"}));
    EXPECT(ExpressionOptimizer::reduceTerms({"(ab)", "(ab)*", "(ab)*"}) == Vec{"(ab)+"});
    EXPECT(ExpressionOptimizer::reduceTerms({"[01]", "[01]*"}) == Vec{"[01]+"});
    // bases that are not atomic stay apart
    EXPECT(ExpressionOptimizer::reduceTerms({"ba", "ba*"}) == (Vec{"ba", "ba*"}));
    EXPECT(ExpressionOptimizer::reduceTerms({"ba*", "ba+"}) == (Vec{"ba*", "ba+"}));
}

void testOptimize() {
    std::vector<std::pair<std::string, std::string>> const cases{
        {"abcd|aefd|aghd", "a(bc|ef|gh)d"},
        {"aa*", "a+"},
        {"a*a*", "a*"},
        {"a+a*", "a+"},
        {"ab|a", "ab?"},
        {"ba|a", "b?a"},
        {"a*a|a", "a+|a"},
        {"(ab)c", "abc"},
        {"((a))", "a"},
        {"(a|a)", "a"},
        {"(a|b)", "(a|b)"},
        {"(a|b)(a|b)*", "(a|b)+"},
        {"(ab)*(ab)*", "(ab)*"},
        {"a(bc|bd)", "ab(c|d)"},
        {"a(b|c)d|a(b|c)e", "a(b|c)(d|e)"},
        {"x(a|b)*y|xy", "x(a|b)*y"},
        {"a|b", "a|b"},
        {"a?a?", "a?a?"},
        {"(a|aaa*)", "a+"},
        {"(a|aaa*)b", "a+b"},
        {"c(a|aaa*)", "ca+"},
        {"", ""},
    };
    for (auto const& [expression, expected] : cases) {
        auto const optimized = optimize(expression);
        if (optimized != expected) {
            throw std::runtime_error("Error: " + expression + " -> " + optimized + "?" + expected);
        }
        EXPECT_EQ(optimize(optimized), optimized);
    }

    ExpressionOptimizer disjunction{"a|b"};
    disjunction.optimize();
    EXPECT(disjunction.isDisjunction());
    EXPECT_EQ(disjunction.terms().size(), 2u);
}

void testOptimizeToFixpoint() {
    // the extraction a(|a+) -> aa* only merges into a+ on a second pass
    Dfa dfa{4, "ab"};
    dfa.addTransition(0, 0, 1);
    dfa.addTransition(1, 0, 1);
    dfa.addTransition(1, 1, 3);
    dfa.addTransition(2, 0, 0);
    dfa.addTransition(2, 1, 2);
    dfa.addTransition(3, 0, 3);
    dfa.addTransition(3, 1, 0);
    dfa.makeFinal(1);
    dfa.makeFinal(2);
    dfa.makeFinal(3);

    auto const raw = toRegex(dfa, ConvertOptions{false, nullptr});
    EXPECT_EQ(raw, std::string{"(aa*ba*b)*a(a*|a*ba*)"});
    auto const expression = toRegex(dfa);
    EXPECT_EQ(expression, std::string{"(a+ba*b)*a+(ba*)?"});
    EXPECT_EQ(optimize(expression), expression);
    expectEquivalent(dfa, expression, 8);
}

void testDivisibleByThree() {
    auto const dfa = Dfa::divisibility(10, 3);
    EXPECT(dfa.isComplete());
    EXPECT_EQ(dfa.stateCount(), 3u);

    auto const expression = toRegex(dfa);
    EXPECT_EQ(expression, std::string{
        "(([0369]*[258][0369]*[147])*[0369]*([147]|[258][0369]*[258])([0369]*[147][0369]*[258])*[0369]*"
        "([147][0369]*[147]|[258]))*([0369]*[258][0369]*[147])*[0369]*"});
    EXPECT_EQ(optimize(expression), expression);

    std::regex const re{expression};
    std::mt19937 rng{3};
    std::uniform_int_distribution<unsigned> numbers{0, 9999};
    for (auto i = 0; i != 200; ++i) {
        auto const number = numbers(rng);
        if ((number % 3 == 0) != std::regex_match(std::to_string(number), re)) {
            throw std::runtime_error("Error: " + expression + " is wrong for " + std::to_string(number));
        }
    }
}

void testDivisionAutomata() {
    std::mt19937 rng{17};
    std::uniform_int_distribution<unsigned> numbers{0, 9999};
    for (unsigned base = 2; base <= 10; ++base) {
        for (unsigned divisor = 1; divisor <= 5; ++divisor) {
            auto const dfa = Dfa::divisibility(base, divisor);
            EXPECT(dfa.isComplete());

            std::regex const raw{toRegex(dfa, ConvertOptions{false, nullptr})};
            std::regex const optimized{toRegex(dfa)};
            for (auto i = 0; i != 50; ++i) {
                auto const number = numbers(rng);
                auto const digits = toBase(number, base);
                auto const expected = number % divisor == 0;
                if (expected != std::regex_match(digits, raw) || expected != std::regex_match(digits, optimized)) {
                    throw std::runtime_error("Error: (BASE, DIV) = (" + std::to_string(base) + ", "
                                             + std::to_string(divisor) + ") wrong for " + digits);
                }
            }
        }
    }
}

void testRandomAutomata() {
    std::mt19937 rng{2024};
    std::uniform_int_distribution<std::size_t> stateCounts{1, 4};
    std::uniform_int_distribution<std::size_t> alphabetSizes{1, 3};
    std::bernoulli_distribution hasLink{0.8};
    std::bernoulli_distribution accepting{0.4};

    for (auto trial = 0; trial != 300; ++trial) {
        auto const n = stateCounts(rng);
        Dfa dfa{n, std::string{"abc"}.substr(0, alphabetSizes(rng))};
        std::uniform_int_distribution<StateName> targets{0, n - 1};
        for (StateName q = 0; q != n; ++q) {
            for (std::size_t symbol = 0; symbol != dfa.alphabet().size(); ++symbol) {
                if (hasLink(rng)) {
                    dfa.addTransition(q, symbol, targets(rng));
                }
            }
            if (accepting(rng)) {
                dfa.makeFinal(q);
            }
        }

        // a non-empty language has a word shorter than the number of states
        auto nonEmpty = false;
        for (auto const& word : words(dfa.alphabet(), n - 1)) {
            nonEmpty = nonEmpty || dfa.accepts(word);
        }
        if (!nonEmpty) {
            EXPECT_THROW(toRegex(dfa));
            continue;
        }

        auto const raw = toRegex(dfa, ConvertOptions{false, nullptr});
        auto const optimized = toRegex(dfa);
        expectEquivalent(dfa, raw, 6);
        expectEquivalent(dfa, optimized, 6);
        EXPECT_EQ(optimize(optimized), optimized);
    }
}

void testDfa() {
    Dfa dfa{2, "ab"};
    EXPECT(!dfa.isComplete());
    dfa.addTransition(0, 0, 1);
    EXPECT(dfa.hasTransition(0, 0));
    EXPECT(!dfa.hasTransition(0, 1));
    EXPECT(dfa.transition(0, 0) == 1u);
    EXPECT_THROW(dfa.addTransition(0, 0, 0));
    EXPECT_THROW(dfa.addTransition(0, 2, 0));
    EXPECT_THROW(dfa.addTransition(0, 1, 2));
    EXPECT_THROW(dfa.makeFinal(5));

    dfa.makeFinal(1);
    EXPECT(dfa.accepts("a"));
    EXPECT(!dfa.accepts(""));
    EXPECT(!dfa.accepts("b"));
    EXPECT(!dfa.accepts("ax"));

    EXPECT_THROW((Dfa{0, "ab"}));
    EXPECT_THROW((Dfa{1, ""}));
    EXPECT_THROW((Dfa{1, "a*"}));
    EXPECT_THROW((Dfa{1, "aba"}));
    EXPECT_THROW(Dfa::divisibility(1, 3));
    EXPECT_THROW(Dfa::divisibility(37, 3));
    EXPECT_THROW(Dfa::divisibility(10, 0));

    auto const hex = Dfa::divisibility(16, 5);
    EXPECT_EQ(hex.alphabet(), std::string{"0123456789ABCDEF"});
    EXPECT(hex.accepts("F"));
    EXPECT(hex.accepts("00A"));
    EXPECT(!hex.accepts("B"));
}

void testTextFormat() {
    std::istringstream input{
        "#states\n"
        "odd\n"
        "even\n"
        "\n"
        "#initial\n"
        "even\n"
        "#accepting\n"
        "even\n"
        "#alphabet\n"
        "0\n"
        "1\n"
        "#transitions\n"
        "even:0>even\n"
        "even:1>odd\n"
        "odd:1>odd\n"
        "odd:0>even\n"};
    auto const dfa = Dfa::readText(input);
    EXPECT_EQ(dfa.stateCount(), 2u);
    EXPECT(dfa.isFinal(0));
    EXPECT(!dfa.isFinal(1));
    EXPECT(dfa.transition(0, 1) == 1u);
    EXPECT_EQ(toRegex(dfa), std::string{"(0*1+0)*0*"});

    std::ostringstream text;
    dfa.printText(text);
    std::istringstream again{text.str()};
    auto const copy = Dfa::readText(again);
    std::ostringstream textAgain;
    copy.printText(textAgain);
    EXPECT_EQ(textAgain.str(), text.str());

    std::ostringstream dot;
    dfa.printScheme(dot);
    EXPECT(dot.str().find("node [shape = doublecircle]; s0;") != std::string::npos);
    EXPECT(dot.str().find("s1 -> s0 [label = \"0\"];") != std::string::npos);
}

void testTextFormatErrors() {
    auto const lineOf = [](std::string const& text) -> std::size_t {
        std::istringstream input{text};
        try {
            Dfa::readText(input);
        } catch (DfaFormatError const& e) {
            return e.line();
        }
        return 0;
    };
    EXPECT_EQ(lineOf("s0\n"), 1u);
    EXPECT_EQ(lineOf("#states\ns0\n#bogus\n"), 3u);
    EXPECT_EQ(lineOf("#states\ns0\ns0\n"), 3u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns1\n#alphabet\na\n"), 4u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\nab\n"), 6u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\n(\n"), 6u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\na\n#transitions\ns0:b>s0\n"), 8u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\na\n#transitions\ns0:a>s9\n"), 8u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\na\n#transitions\ns0:a>s0\ns0:a>s0\n"), 9u);
    EXPECT_EQ(lineOf("#states\ns0\n#initial\ns0\n#alphabet\na\n#transitions\ns0-a>s0\n"), 8u);
    EXPECT_EQ(lineOf("#states\ns0\n#alphabet\na\n"), 4u);
}

int main() {
    std::vector<std::pair<std::string, std::function<void()>>> const tests{
        {"atomic", testAtomic},
        {"units", testUnits},
        {"transformer", testTransformer},
        {"equation from state", testEquationFromState},
        {"merge terms", testMergeTerms},
        {"arden's lemma", testArdensLemma},
        {"substitute", testSubstitute},
        {"to expression", testToExpression},
        {"solve ends in zero", testSolveEndsInZero},
        {"solve trace", testSolveTrace},
        {"equation system validation", testEquationSystemValidation},
        {"extraction", testExtraction},
        {"reduce terms", testReduceTerms},
        {"optimize", testOptimize},
        {"optimize to fixpoint", testOptimizeToFixpoint},
        {"divisible by three", testDivisibleByThree},
        {"division automata", testDivisionAutomata},
        {"random automata", testRandomAutomata},
        {"dfa", testDfa},
        {"text format", testTextFormat},
        {"text format errors", testTextFormatErrors},
    };

    auto failures = 0;
    for (auto const& [name, test] : tests) {
        try {
            test();
            std::cout << "PASS: " << name << std::endl;
        } catch (std::exception const& e) {
            ++failures;
            std::cout << "F: " << name << ": " << e.what() << std::endl;
        }
    }
    return failures == 0 ? 0 : 1;
}
