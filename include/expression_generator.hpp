// Генератор выражений для пакетного режима.
// Выражения состоят из цифр, знаков + - * / и пробелов.
// Небольшая доля выражений содержит ошибки (деление на 0, лишний символ, висящая операция),
// чтобы пакетная обработка проверяла все виды ошибок.
//

#pragma once

#include <cstddef>
#include <random>
#include <string>

namespace ratcalc {

// Вероятность внести ошибку в выражение (5%)
constexpr double kErrorProbability = 0.05;

class ExpressionGenerator {
public:
    ExpressionGenerator();
    explicit ExpressionGenerator(std::mt19937::result_type seed);

    // Выражение из operandCount операндов (минимум один)
    std::string generate(std::size_t operandCount);

private:
    std::mt19937 gen;
    std::uniform_int_distribution<> digit_dist;
    std::uniform_int_distribution<> digits_per_operand_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_int_distribution<> bool_dist;
    std::uniform_real_distribution<> error_dist;
    std::uniform_int_distribution<> error_type_dist;
    std::uniform_int_distribution<> char_dist;

    // Операнд из одной-двух цифр; avoidZero исключает нулевое значение
    std::string generateOperand(bool avoidZero);

    // Вносит ошибку с вероятностью kErrorProbability
    std::string introduceError(const std::string& expr);
};

} // namespace ratcalc
