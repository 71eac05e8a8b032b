#include "expression_generator.hpp"

#include <array>

namespace ratcalc {

namespace {
constexpr std::array<char, 4> kOperations = {'+', '-', '*', '/'};

// Символы, которых токенизатор не принимает
constexpr std::array<char, 8> kStrayChars = {'x', '(', ')', '.', '%', '^', 'a', '\t'};
}

ExpressionGenerator::ExpressionGenerator() : ExpressionGenerator(std::random_device{}()) {}

ExpressionGenerator::ExpressionGenerator(std::mt19937::result_type seed)
    : gen(seed),
      digit_dist(0, 9),
      digits_per_operand_dist(1, 2),
      op_dist(0, static_cast<int>(kOperations.size()) - 1),
      bool_dist(0, 1),
      error_dist(0.0, 1.0),
      error_type_dist(0, 2),
      char_dist(0, static_cast<int>(kStrayChars.size()) - 1) {}

std::string ExpressionGenerator::generate(std::size_t operandCount) {
    if (operandCount == 0) {
        operandCount = 1;
    }

    std::string result = generateOperand(false);
    result.reserve(operandCount * 6);
    for (std::size_t i = 1; i < operandCount; ++i) {
        char op = kOperations[op_dist(gen)];
        bool spaced = bool_dist(gen) == 1;

        if (spaced) result.push_back(' ');
        result.push_back(op);
        if (spaced) result.push_back(' ');

        // Делитель обычно ненулевой, но изредка деление на ноль остаётся намеренно
        if (op == '/' && error_dist(gen) < kErrorProbability * 0.3) {
            result.push_back('0');
        } else {
            result.append(generateOperand(op == '/'));
        }
    }
    return introduceError(result);
}

std::string ExpressionGenerator::generateOperand(bool avoidZero) {
    std::string operand;
    int digits = digits_per_operand_dist(gen);
    for (int i = 0; i < digits; ++i) {
        int digit = digit_dist(gen);
        // Цифры складываются, поэтому ненулевая первая цифра гарантирует ненулевой операнд
        if (avoidZero && i == 0 && digit == 0) {
            digit = 1;
        }
        operand.push_back(static_cast<char>('0' + digit));
    }
    return operand;
}

std::string ExpressionGenerator::introduceError(const std::string& expr) {
    if (error_dist(gen) >= kErrorProbability) {
        return expr;
    }

    std::string result = expr;
    switch (error_type_dist(gen)) {
    case 0: // Лишний символ посередине
        result.insert(result.length() / 2, 1, kStrayChars[char_dist(gen)]);
        break;
    case 1: // Висящая операция в конце
        result.push_back(kOperations[op_dist(gen)]);
        break;
    case 2: // Пустая строка из пробелов
        result.assign(expr.length() % 4, ' ');
        break;
    default:
        break;
    }
    return result;
}

} // namespace ratcalc
