#pragma once

#include <vector>

#include "token.hpp"

namespace ratcalc {

// Вычисляет поток токенов по уровням приоритета.
// Для каждого уровня операции просматриваются слева направо; операция своего уровня
// вместе с двумя соседними операндами заменяется результатом на месте левого операнда.
class Reducer {
public:
    explicit Reducer(TokenStream tokens);

    // Выполняет свёртку и возвращает единственный оставшийся операнд.
    // Бросает DivisionByZeroError при делении на ноль
    // и InvalidExpressionError, если операндов не хватает операциям.
    Rational reduce();

private:
    std::vector<Rational> operands;
    std::vector<Op> operators;

    // Один проход по операциям заданного уровня
    void reduceTier(const std::vector<Op>& tier);

    // Заменяет операнды index и index + 1 результатом операции index
    void apply(std::size_t index);
};

} // namespace ratcalc
