#pragma once

#include <string>

#include "rational.hpp"

namespace ratcalc {

// Класс-фасад для вычисления выражений над рациональными числами.
// Объединяет этапы токенизации и свёртки по приоритетам.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;

    // Вычисляет значение выражения, заданного строкой.
    // Пример: "6/3*2" -> 4
    // Бросает EvaluationError (DivisionByZeroError, InvalidSyntaxError,
    // InvalidExpressionError). Вызовы независимы друг от друга.
    Rational evaluate(const std::string& expression) const;

    // Вычисляет выражение и возвращает строку отчёта:
    // "Ok(<значение>)" или "Err(<вариант ошибки>)"
    std::string report(const std::string& expression) const;
};

} // namespace ratcalc
