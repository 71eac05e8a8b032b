#include "errors.hpp"

namespace ratcalc {

std::string EvaluationError::describe() const {
    switch (errorKind) {
    case ErrorKind::DivisionByZero:
        return "DivisionByZero";
    case ErrorKind::InvalidSyntax:
        return "InvalidSyntax";
    case ErrorKind::InvalidExpr:
        return "InvalidExpr";
    }
    return "Unknown";
}

DivisionByZeroError::DivisionByZeroError()
    : EvaluationError(ErrorKind::DivisionByZero, "Деление на ноль") {}

InvalidSyntaxError::InvalidSyntaxError(std::size_t index)
    : EvaluationError(ErrorKind::InvalidSyntax,
                      "Недопустимый символ в позиции " + std::to_string(index)),
      position(index) {}

std::string InvalidSyntaxError::describe() const {
    return "InvalidSyntax(" + std::to_string(position) + ")";
}

InvalidExpressionError::InvalidExpressionError()
    : EvaluationError(ErrorKind::InvalidExpr, "Некорректное выражение") {}

ArithmeticOverflowError::ArithmeticOverflowError(const std::string& operation)
    : std::logic_error("Переполнение int64 в операции " + operation) {}

} // namespace ratcalc
