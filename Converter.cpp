#include "Converter.h"

#include "EquationSystem.h"
#include "ExpressionOptimizer.h"

std::string toRegex(Dfa const& dfa, ConvertOptions const& options) {
    EquationSystem system{dfa};
    system.setTrace(options.trace);
    if (options.trace) {
        *options.trace << "Start:\n";
        system.print(*options.trace);
    }

    auto expression = system.solve();
    if (!options.optimize) {
        return expression;
    }

    auto optimized = ExpressionOptimizer{expression, options.trace}.optimize();
    if (options.trace) {
        *options.trace << "Optimized " << expression.size() << " -> " << optimized.size() << " characters"
                       << std::endl;
    }
    return optimized;
}
