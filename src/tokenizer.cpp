#include "tokenizer.hpp"

#include <cctype>

#include "errors.hpp"

namespace ratcalc {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: один проход слева направо
TokenStream Tokenizer::tokenize() {
    TokenStream stream;
    pending.reset();
    index = 0;

    while (!isAtEnd()) {
        char ch = peek();
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            addDigit(ch);
        } else if (isOperatorChar(ch)) {
            flushOperand(stream);
            stream.operators.push_back(opFromChar(ch));
        } else if (ch != ' ') {
            throw InvalidSyntaxError(index);
        }
        advance();
    }

    // Выражение должно заканчиваться операндом
    if (!pending.has_value()) {
        throw InvalidExpressionError();
    }
    flushOperand(stream);
    return stream;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

void Tokenizer::addDigit(char digit) {
    if (!pending.has_value()) {
        pending.emplace();
    }
    *pending += static_cast<std::uint64_t>(digit - '0');
}

void Tokenizer::flushOperand(TokenStream& stream) {
    if (pending.has_value()) {
        stream.operands.push_back(*pending);
        pending.reset();
    }
}

} // namespace ratcalc
