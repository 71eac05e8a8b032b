#pragma once

#include <vector>

#include "rational.hpp"

namespace ratcalc {

// Бинарная арифметическая операция
enum class Op {
    Multiply,
    Add,
    Subtract,
    Divide
};

// Проверяет, является ли символ знаком операции (+, -, *, /)
bool isOperatorChar(char ch);

// Отображает символ операции в Op.
// Любой другой символ - нарушение предусловия (std::logic_error).
Op opFromChar(char ch);

char toChar(Op op);

// Вычисляет a op b. Деление выполняется с проверкой (checkedDivide)
// и бросает DivisionByZeroError при нулевом делителе.
Rational compute(Op op, const Rational& a, const Rational& b);

// Уровни приоритета: сначала деление и умножение, затем сложение и вычитание.
// Внутри уровня операции выполняются слева направо.
const std::vector<std::vector<Op>>& precedenceTiers();

} // namespace ratcalc
