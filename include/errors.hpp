#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ratcalc {

// Вид восстанавливаемой ошибки вычисления
enum class ErrorKind {
    DivisionByZero,
    InvalidSyntax,
    InvalidExpr
};

// Базовое исключение для ошибок, после которых можно продолжить
// обработку следующей строки. Фатальные нарушения предусловий
// сообщаются через std::logic_error и сюда не относятся.
class EvaluationError : public std::runtime_error {
public:
    EvaluationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }

    // Текстовое имя варианта для вывода: DivisionByZero, InvalidSyntax(2), InvalidExpr
    virtual std::string describe() const;

private:
    ErrorKind errorKind;
};

// Деление на рациональное число с нулевым числителем
class DivisionByZeroError final : public EvaluationError {
public:
    DivisionByZeroError();
};

// Недопустимый символ во входной строке
class InvalidSyntaxError final : public EvaluationError {
public:
    explicit InvalidSyntaxError(std::size_t index);

    // Позиция символа (с нуля)
    std::size_t index() const noexcept { return position; }

    std::string describe() const override;

private:
    std::size_t position;
};

// В выражении нет операндов или их не хватает операторам
class InvalidExpressionError final : public EvaluationError {
public:
    InvalidExpressionError();
};

// Результат арифметики не помещается в int64.
// Фатальная ошибка, как и другие нарушения предусловий: драйверы её не перехватывают.
class ArithmeticOverflowError final : public std::logic_error {
public:
    explicit ArithmeticOverflowError(const std::string& operation);
};

} // namespace ratcalc
