#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "rational.hpp"

using ratcalc::Rational;

namespace {
void expectParts(const Rational& value, std::int64_t numerator, std::int64_t denominator) {
    EXPECT_EQ(value.numerator(), numerator);
    EXPECT_EQ(value.denominator(), denominator);
}
}

TEST(RationalTest, DefaultIsZeroOverOne) {
    expectParts(Rational(), 0, 1);
}

TEST(RationalTest, FromIntegerHasDenominatorOne) {
    expectParts(Rational::fromInteger(-12), -12, 1);
    expectParts(Rational(7), 7, 1);
}

TEST(RationalTest, ConstructorReducesToLowestTerms) {
    expectParts(Rational(6, 4), 3, 2);
    expectParts(Rational(-6, 4), -3, 2);
    expectParts(Rational(10, 5), 2, 1);
}

TEST(RationalTest, NegativeDenominatorIsKept) {
    expectParts(Rational(6, -4), 3, -2);
    expectParts(Rational(-6, -4), -3, -2);
}

TEST(RationalTest, ConstructorRejectsZeroDenominator) {
    EXPECT_THROW(Rational(1, 0), std::invalid_argument);
}

TEST(RationalTest, ZeroNumeratorDoesNotReduceDenominator) {
    expectParts(Rational(0, 5), 0, 5);
    expectParts(Rational(1, 2) - Rational(1, 2), 0, 4);
}

TEST(RationalTest, Arithmetic) {
    expectParts(Rational(1, 2) + Rational(1, 3), 5, 6);
    expectParts(Rational(1, 2) + Rational(1, 2), 1, 1);
    expectParts(Rational(1, 2) - Rational(1, 3), 1, 6);
    expectParts(Rational(2, 3) * Rational(3, 4), 1, 2);
    expectParts(Rational(1, 2) / Rational(3, 4), 2, 3);
}

TEST(RationalTest, CompoundAssignment) {
    Rational value(1, 2);
    value += Rational(1, 4);
    expectParts(value, 3, 4);
    value *= Rational(4, 3);
    expectParts(value, 1, 1);
    value -= Rational(1, 3);
    expectParts(value, 2, 3);
    value /= Rational(2, 1);
    expectParts(value, 1, 3);
}

TEST(RationalTest, NegationFlipsNumeratorOnly) {
    expectParts(-Rational(3, 4), -3, 4);
    expectParts(-Rational(3, -4), -3, -4);
}

TEST(RationalTest, IntegerRightHandSide) {
    expectParts(Rational(1, 2) + 1, 3, 2);
    expectParts(Rational(1, 2) - 1, -1, 2);
    expectParts(Rational(2, 3) * 3, 2, 1);
    expectParts(Rational(1, 2) * -3, -3, 2);
    expectParts(Rational(2, 3) / 2, 1, 3);
    expectParts(Rational(2, 3) / std::uint32_t{4}, 1, 6);

    Rational accumulator;
    accumulator += std::uint64_t{2};
    accumulator += std::int64_t{3};
    expectParts(accumulator, 5, 1);
}

TEST(RationalTest, DivisionByIntegerZeroIsFatal) {
    EXPECT_THROW(Rational(1, 2) / 0, std::logic_error);
    Rational value(3);
    EXPECT_THROW(value /= 0u, std::logic_error);
}

TEST(RationalTest, UncheckedDivisionByZeroNumeratorLeavesZeroDenominator) {
    Rational broken = Rational(1, 2) / Rational(0);
    expectParts(broken, 1, 0);
    EXPECT_THROW(broken.toString(), std::logic_error);
}

TEST(RationalTest, DivisionByZeroDenominatorIsFatal) {
    Rational broken = Rational(1, 2) / Rational(0);
    EXPECT_THROW(Rational(1) / broken, std::logic_error);
}

TEST(RationalTest, CheckedDivideRejectsZeroNumerator) {
    EXPECT_THROW(Rational(1, 2).checkedDivide(Rational(0)), ratcalc::DivisionByZeroError);
    EXPECT_THROW(Rational(5).checkedDivide(Rational(0, 7)), ratcalc::DivisionByZeroError);
    EXPECT_THROW(Rational().checkedDivide(Rational()), ratcalc::DivisionByZeroError);
    expectParts(Rational(1, 2).checkedDivide(Rational(3, 4)), 2, 3);
}

TEST(RationalTest, OverflowIsFatal) {
    const auto max = std::numeric_limits<std::int64_t>::max();
    const auto min = std::numeric_limits<std::int64_t>::min();

    EXPECT_THROW(Rational(max) + Rational(1), ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(min) - Rational(1), ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(max) * Rational(2), ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(1, 3) * Rational(1, max), ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(1, max) / Rational(2), std::logic_error);
    EXPECT_THROW(Rational(max) + 1, ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(1, max) / 3, ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(-Rational(min), ratcalc::ArithmeticOverflowError);
    EXPECT_THROW(Rational(min, -1).toString(), ratcalc::ArithmeticOverflowError);

    expectParts(Rational(max - 1) + Rational(1), max, 1);
    expectParts(Rational(min) * Rational(1), min, 1);
}

TEST(RationalTest, HalvingNeverWrapsToZeroDenominator) {
    Rational value(1);
    for (int i = 0; i < 62; ++i) {
        value = value.checkedDivide(Rational(2));
    }
    expectParts(value, 1, std::int64_t{1} << 62);
    EXPECT_THROW(value.checkedDivide(Rational(2)), ratcalc::ArithmeticOverflowError);
}

TEST(RationalTest, DisplayForm) {
    EXPECT_EQ(Rational(4).toString(), "4");
    EXPECT_EQ(Rational(-4).toString(), "-4");
    EXPECT_EQ(Rational(5, -1).toString(), "-5");
    EXPECT_EQ(Rational(-5, -1).toString(), "5");
    EXPECT_EQ(Rational(7, 2).toString(), "31/2");
    EXPECT_EQ(Rational(-7, 2).toString(), "-3-1/2");
    EXPECT_EQ(Rational(7, -2).toString(), "-31/-2");
    EXPECT_EQ(Rational(1, 3).toString(), "01/3");
    EXPECT_EQ(Rational(0, 4).toString(), "00/4");
}

TEST(RationalTest, StreamOutputMatchesDisplayForm) {
    std::ostringstream stream;
    stream << Rational(7, 2) << ' ' << Rational(9, 3);
    EXPECT_EQ(stream.str(), "31/2 3");
}

TEST(RationalTest, EqualityIsExactButEquivalenceIsNot) {
    EXPECT_EQ(Rational(2, 4), Rational(1, 2));
    EXPECT_NE(Rational(1, -2), Rational(-1, 2));
    EXPECT_TRUE(ratcalc::equivalent(Rational(1, -2), Rational(-1, 2)));
    EXPECT_FALSE(ratcalc::equivalent(Rational(1, 2), Rational(1, 3)));
}

TEST(RationalTest, ProductOfRange) {
    std::vector<Rational> factors = {Rational(1, 2), Rational(2, 3), Rational(3, 4)};
    expectParts(ratcalc::product(factors.begin(), factors.end()), 1, 4);

    std::vector<Rational> empty;
    expectParts(ratcalc::product(empty.begin(), empty.end()), 1, 1);
}

TEST(RationalTest, AdditionAgreesWithCrossMultipliedSum) {
    for (std::int64_t a = -6; a <= 6; ++a) {
        for (std::int64_t b = -6; b <= 6; ++b) {
            if (b == 0) continue;
            for (std::int64_t c = -6; c <= 6; ++c) {
                for (std::int64_t d = -6; d <= 6; ++d) {
                    if (d == 0) continue;
                    Rational sum = Rational(a, b) + Rational(c, d);
                    EXPECT_TRUE(ratcalc::equivalent(sum, Rational(a * d + c * b, b * d)))
                        << a << "/" << b << " + " << c << "/" << d;
                }
            }
        }
    }
}

TEST(RationalTest, NormalizationIsIdempotent) {
    for (std::int64_t n = -40; n <= 40; ++n) {
        for (std::int64_t d = -40; d <= 40; ++d) {
            if (d == 0) continue;
            Rational once = Rational(n, d).normalized();
            EXPECT_EQ(once.normalized(), once) << n << "/" << d;
        }
    }
}
