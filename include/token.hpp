#pragma once

#include <vector>

#include "op.hpp"
#include "rational.hpp"

namespace ratcalc {

// Результат токенизации одной строки: операнды и операции в порядке появления.
// В корректном выражении операндов на один больше, чем операций.
struct TokenStream {
    std::vector<Rational> operands;
    std::vector<Op> operators;
};

} // namespace ratcalc
