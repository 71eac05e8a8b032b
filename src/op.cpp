#include "op.hpp"

#include <stdexcept>
#include <string>

namespace ratcalc {

bool isOperatorChar(char ch) {
    return ch == '+' || ch == '-' || ch == '*' || ch == '/';
}

Op opFromChar(char ch) {
    switch (ch) {
    case '+':
        return Op::Add;
    case '-':
        return Op::Subtract;
    case '*':
        return Op::Multiply;
    case '/':
        return Op::Divide;
    default:
        throw std::logic_error(std::string("Символ не является операцией: ") + ch);
    }
}

char toChar(Op op) {
    switch (op) {
    case Op::Multiply:
        return '*';
    case Op::Add:
        return '+';
    case Op::Subtract:
        return '-';
    case Op::Divide:
        return '/';
    }
    throw std::logic_error("Неизвестная операция");
}

Rational compute(Op op, const Rational& a, const Rational& b) {
    switch (op) {
    case Op::Multiply:
        return a * b;
    case Op::Add:
        return a + b;
    case Op::Subtract:
        return a - b;
    case Op::Divide:
        return a.checkedDivide(b);
    }
    throw std::logic_error("Неизвестная бинарная операция");
}

const std::vector<std::vector<Op>>& precedenceTiers() {
    static const std::vector<std::vector<Op>> tiers = {
        {Op::Divide, Op::Multiply},
        {Op::Add, Op::Subtract},
    };
    return tiers;
}

} // namespace ratcalc
