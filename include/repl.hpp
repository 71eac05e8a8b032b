#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

#include "evaluator.hpp"

namespace ratcalc {

// Построчный режим: читает input до конца потока, ошибки чтения
// или первой строки, не являющейся корректным UTF-8;
// для каждой строки печатает в output отчёт вида "Ok(...)" / "Err(...)".
// Восстанавливаемые ошибки не прерывают цикл.
// Возвращает количество обработанных строк.
std::size_t runLines(std::istream& input, std::ostream& output, const ExpressionEvaluator& evaluator);

} // namespace ratcalc
