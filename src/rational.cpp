#include "rational.hpp"

#include <algorithm>
#include <ostream>

#include "errors.hpp"

namespace ratcalc {

namespace {
// Модуль числа без переполнения на INT64_MIN
std::uint64_t unsignedAbs(std::int64_t value) {
    return value < 0 ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
}
}

namespace detail {

std::int64_t checkedAdd(std::int64_t lhs, std::int64_t rhs) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        throw ArithmeticOverflowError(std::to_string(lhs) + " + " + std::to_string(rhs));
    }
    return result;
}

std::int64_t checkedSubtract(std::int64_t lhs, std::int64_t rhs) {
    std::int64_t result = 0;
    if (__builtin_sub_overflow(lhs, rhs, &result)) {
        throw ArithmeticOverflowError(std::to_string(lhs) + " - " + std::to_string(rhs));
    }
    return result;
}

std::int64_t checkedMultiply(std::int64_t lhs, std::int64_t rhs) {
    std::int64_t result = 0;
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
        throw ArithmeticOverflowError(std::to_string(lhs) + " * " + std::to_string(rhs));
    }
    return result;
}

} // namespace detail

std::uint64_t gcd(std::uint64_t a, std::uint64_t b, PrimeCache& cache) {
    std::uint64_t lowest = std::min(a, b);
    std::uint64_t highest = std::max(a, b);
    std::uint64_t result = 1;

    for (std::size_t index = 0;; ++index) {
        std::uint64_t prime = cache.at(index);
        if (lowest / prime < 1) {
            break;
        }

        // Выносим все общие множители prime
        while (lowest % prime == 0 && highest % prime == 0) {
            highest /= prime;
            lowest /= prime;
            result *= prime;
        }
    }

    return result;
}

std::uint64_t gcd(std::uint64_t a, std::uint64_t b) {
    return gcd(a, b, PrimeCache::instance());
}

Rational::Rational(std::int64_t numerator, std::int64_t denominator)
    : num(numerator), den(denominator) {
    if (denominator == 0) {
        throw std::invalid_argument("Знаменатель дроби не может быть нулём");
    }
    *this = normalized();
}

Rational Rational::normalized() const {
    auto divisor = static_cast<std::int64_t>(gcd(unsignedAbs(num), unsignedAbs(den)));
    return fromParts(num / divisor, den / divisor);
}

Rational Rational::operator+(const Rational& rhs) const {
    return reduced(detail::checkedAdd(detail::checkedMultiply(num, rhs.den), detail::checkedMultiply(rhs.num, den)),
                   detail::checkedMultiply(den, rhs.den));
}

Rational Rational::operator-(const Rational& rhs) const {
    return reduced(detail::checkedSubtract(detail::checkedMultiply(num, rhs.den), detail::checkedMultiply(rhs.num, den)),
                   detail::checkedMultiply(den, rhs.den));
}

Rational Rational::operator*(const Rational& rhs) const {
    return reduced(detail::checkedMultiply(num, rhs.num), detail::checkedMultiply(den, rhs.den));
}

Rational Rational::operator/(const Rational& rhs) const {
    if (rhs.den == 0) {
        throw std::logic_error("Деление на дробь с нулевым знаменателем");
    }
    return reduced(detail::checkedMultiply(num, rhs.den), detail::checkedMultiply(den, rhs.num));
}

Rational Rational::checkedDivide(const Rational& rhs) const {
    if (rhs.num == 0) {
        throw DivisionByZeroError();
    }
    return *this / rhs;
}

std::string Rational::toString() const {
    if (den == 1) {
        return std::to_string(num);
    }
    if (den == -1) {
        return std::to_string(detail::checkedSubtract(0, num));
    }
    if (den == 0) {
        throw std::logic_error("Нельзя вывести дробь с нулевым знаменателем");
    }
    // Целая часть и остаток с отбрасыванием дробной части, как в C++
    return std::to_string(num / den) + std::to_string(num % den) + "/" + std::to_string(den);
}

bool equivalent(const Rational& lhs, const Rational& rhs) {
    return detail::checkedMultiply(lhs.numerator(), rhs.denominator()) ==
        detail::checkedMultiply(rhs.numerator(), lhs.denominator());
}

std::ostream& operator<<(std::ostream& stream, const Rational& value) {
    return stream << value.toString();
}

} // namespace ratcalc
