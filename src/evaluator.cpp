#include "evaluator.hpp"

#include "errors.hpp"
#include "reducer.hpp"
#include "tokenizer.hpp"

namespace ratcalc {

// Полный цикл обработки выражения:
// 1. Токенизация (Tokenizer)
// 2. Свёртка по уровням приоритета (Reducer)
Rational ExpressionEvaluator::evaluate(const std::string& expression) const {
    Tokenizer tokenizer(expression);
    auto tokens = tokenizer.tokenize();

    Reducer reducer(std::move(tokens));
    return reducer.reduce();
}

std::string ExpressionEvaluator::report(const std::string& expression) const {
    try {
        return "Ok(" + evaluate(expression).toString() + ")";
    }
    catch (const EvaluationError& ex) {
        return "Err(" + ex.describe() + ")";
    }
}

} // namespace ratcalc
