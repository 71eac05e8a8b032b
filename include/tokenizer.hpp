#pragma once

#include <optional>
#include <string>

#include "token.hpp"

namespace ratcalc {

// Лексический анализатор выражения.
// Цифры накапливаются в текущий операнд, знаки операций закрывают его,
// пробелы пропускаются.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Разбирает строку целиком.
    // Бросает InvalidSyntaxError на недопустимом символе
    // и InvalidExpressionError, если в конце строки нет операнда.
    TokenStream tokenize();

private:
    const std::string source;
    std::size_t index = 0;

    // Операнд, который сейчас набирается из цифр
    std::optional<Rational> pending;

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Цифра прибавляется к операнду (не сдвигом разряда): "23" даёт 2 + 3 = 5
    void addDigit(char digit);

    // Переносит набранный операнд в поток, если он есть
    void flushOperand(TokenStream& stream);
};

} // namespace ratcalc
