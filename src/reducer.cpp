#include "reducer.hpp"

#include <algorithm>

#include "errors.hpp"

namespace ratcalc {

Reducer::Reducer(TokenStream tokens)
    : operands(std::move(tokens.operands)), operators(std::move(tokens.operators)) {}

Rational Reducer::reduce() {
    for (const auto& tier : precedenceTiers()) {
        reduceTier(tier);
    }

    if (operands.empty()) {
        throw InvalidExpressionError();
    }
    return operands.front();
}

void Reducer::reduceTier(const std::vector<Op>& tier) {
    std::size_t index = 0;
    while (index < operators.size()) {
        if (std::find(tier.begin(), tier.end(), operators[index]) != tier.end()) {
            // Индекс не сдвигается: на его место пришла следующая операция
            apply(index);
        } else {
            ++index;
        }
    }
}

void Reducer::apply(std::size_t index) {
    // Операция без правого операнда, например "+5" или "1++2"
    if (index + 1 >= operands.size()) {
        throw InvalidExpressionError();
    }

    Op op = operators[index];
    operators.erase(operators.begin() + index);

    Rational left = operands[index];
    operands.erase(operands.begin() + index);
    operands[index] = compute(op, left, operands[index]);
}

} // namespace ratcalc
