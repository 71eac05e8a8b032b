#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <numeric>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "prime_cache.hpp"

namespace ratcalc {

namespace detail {
// Арифметика int64 с проверкой переполнения.
// При переполнении бросает ArithmeticOverflowError (std::logic_error).
std::int64_t checkedAdd(std::int64_t lhs, std::int64_t rhs);
std::int64_t checkedSubtract(std::int64_t lhs, std::int64_t rhs);
std::int64_t checkedMultiply(std::int64_t lhs, std::int64_t rhs);
}

// НОД модулей a и b пробным делением на простые числа из кэша.
// Перебор останавливается, как только очередное простое больше меньшего из чисел,
// поэтому gcd(0, n) == 1 и gcd(1, n) == 1.
std::uint64_t gcd(std::uint64_t a, std::uint64_t b, PrimeCache& cache);
std::uint64_t gcd(std::uint64_t a, std::uint64_t b);

// Точная рациональная дробь: числитель и знаменатель (int64).
// После каждой операции дробь сокращается на НОД. Переполнение int64
// в промежуточных произведениях фатально (ArithmeticOverflowError). Знак знаменателя
// не приводится к положительному: отрицательный знаменатель сохраняется.
class Rational {
public:
    // 0/1
    Rational() = default;

    // n/1
    explicit Rational(std::int64_t value) : num(value), den(1) {}

    // numerator/denominator, сокращённая.
    // Нулевой знаменатель - нарушение предусловия (std::invalid_argument).
    Rational(std::int64_t numerator, std::int64_t denominator);

    static Rational fromInteger(std::int64_t value) { return Rational(value); }

    std::int64_t numerator() const { return num; }
    std::int64_t denominator() const { return den; }

    // Дробь, сокращённая на НОД числителя и знаменателя
    Rational normalized() const;

    Rational operator+(const Rational& rhs) const;
    Rational operator-(const Rational& rhs) const;
    Rational operator*(const Rational& rhs) const;

    // Делитель с нулевым знаменателем - фатальная ошибка (std::logic_error).
    // Нулевой числитель делителя здесь НЕ проверяется, для этого есть checkedDivide.
    Rational operator/(const Rational& rhs) const;

    // Меняет знак числителя
    Rational operator-() const { return fromParts(detail::checkedSubtract(0, num), den); }

    Rational& operator+=(const Rational& rhs) { return *this = *this + rhs; }
    Rational& operator-=(const Rational& rhs) { return *this = *this - rhs; }
    Rational& operator*=(const Rational& rhs) { return *this = *this * rhs; }
    Rational& operator/=(const Rational& rhs) { return *this = *this / rhs; }

    // Деление с проверкой: бросает DivisionByZeroError, если числитель делителя равен нулю
    Rational checkedDivide(const Rational& rhs) const;

    // --- Операции с целым правым операндом (знаменатель 1) ---

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational operator+(Integer rhs) const {
        return reduced(detail::checkedAdd(num, detail::checkedMultiply(static_cast<std::int64_t>(rhs), den)), den);
    }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational operator-(Integer rhs) const {
        return reduced(detail::checkedSubtract(num, detail::checkedMultiply(static_cast<std::int64_t>(rhs), den)), den);
    }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational operator*(Integer rhs) const {
        return reduced(detail::checkedMultiply(num, static_cast<std::int64_t>(rhs)), den);
    }

    // Целое умножается прямо в знаменатель. Деление на целый ноль фатально.
    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational operator/(Integer rhs) const {
        if (rhs == 0) {
            throw std::logic_error("Деление рационального числа на целый ноль");
        }
        return reduced(num, detail::checkedMultiply(den, static_cast<std::int64_t>(rhs)));
    }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational& operator+=(Integer rhs) { return *this = *this + rhs; }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational& operator-=(Integer rhs) { return *this = *this - rhs; }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational& operator*=(Integer rhs) { return *this = *this * rhs; }

    template <class Integer, class = std::enable_if_t<std::is_integral_v<Integer>>>
    Rational& operator/=(Integer rhs) { return *this = *this / rhs; }

    // Строковое представление:
    //   знаменатель 1  -> "числитель"
    //   знаменатель -1 -> "-числитель"
    //   иначе          -> "{num / den}{num % den}/{den}" (деление с отбрасыванием дробной части),
    //                     например 7/2 -> "31/2", -7/2 -> "-3-1/2"
    std::string toString() const;

    // Точное совпадение пары (числитель, знаменатель)
    friend bool operator==(const Rational& lhs, const Rational& rhs) {
        return lhs.num == rhs.num && lhs.den == rhs.den;
    }
    friend bool operator!=(const Rational& lhs, const Rational& rhs) { return !(lhs == rhs); }

private:
    std::int64_t num = 0;
    std::int64_t den = 1;

    struct Unchecked {};
    Rational(std::int64_t numerator, std::int64_t denominator, Unchecked)
        : num(numerator), den(denominator) {}

    // Пара без проверки знаменателя и без сокращения
    static Rational fromParts(std::int64_t numerator, std::int64_t denominator) {
        return Rational(numerator, denominator, Unchecked{});
    }

    // Пара без проверки знаменателя, сокращённая на НОД
    static Rational reduced(std::int64_t numerator, std::int64_t denominator) {
        return fromParts(numerator, denominator).normalized();
    }
};

// Равенство значений через перекрёстное умножение (знак знаменателя не важен)
bool equivalent(const Rational& lhs, const Rational& rhs);

// Произведение диапазона, начиная с 1/1
template <class Iterator>
Rational product(Iterator first, Iterator last) {
    return std::accumulate(first, last, Rational(1), std::multiplies<>());
}

std::ostream& operator<<(std::ostream& stream, const Rational& value);

} // namespace ratcalc
