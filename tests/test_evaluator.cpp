#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "evaluator.hpp"
#include "reducer.hpp"

using ratcalc::ExpressionEvaluator;
using ratcalc::Op;
using ratcalc::Rational;

class EvaluatorTest : public ::testing::Test {
protected:
    ExpressionEvaluator evaluator;
};

TEST_F(EvaluatorTest, MultiDigitRunsAreSummed) {
    EXPECT_EQ(evaluator.report("23+4"), "Ok(9)");
    EXPECT_EQ(evaluator.evaluate("12"), Rational(3));
}

TEST_F(EvaluatorTest, FirstTierLeftToRight) {
    EXPECT_EQ(evaluator.report("6/3*2"), "Ok(4)");
    EXPECT_EQ(evaluator.report("8/2/2"), "Ok(2)");
    EXPECT_EQ(evaluator.report("2*3/4"), "Ok(11/2)");
}

TEST_F(EvaluatorTest, MultiplicationBeforeAddition) {
    EXPECT_EQ(evaluator.report("2+3*4"), "Ok(14)");
    EXPECT_EQ(evaluator.report("2*3+4"), "Ok(10)");
    EXPECT_EQ(evaluator.report("1-7/2"), "Ok(-2-1/2)");
}

TEST_F(EvaluatorTest, SecondTierLeftToRight) {
    EXPECT_EQ(evaluator.report("8-2-1"), "Ok(5)");
    EXPECT_EQ(evaluator.report("1-1"), "Ok(0)");
}

TEST_F(EvaluatorTest, FractionResultUsesDisplayForm) {
    EXPECT_EQ(evaluator.report("7/2"), "Ok(31/2)");
    EXPECT_EQ(evaluator.report("1/2-1/2"), "Ok(00/4)");
}

TEST_F(EvaluatorTest, DivisionByZero) {
    EXPECT_EQ(evaluator.report("1/0"), "Err(DivisionByZero)");
    EXPECT_EQ(evaluator.report("5/0*3"), "Err(DivisionByZero)");
    EXPECT_EQ(evaluator.report("2*0/0"), "Err(DivisionByZero)");
    EXPECT_EQ(evaluator.report("1/1-1"), "Ok(0)");
    EXPECT_THROW(evaluator.evaluate("1/0"), ratcalc::DivisionByZeroError);
}

TEST_F(EvaluatorTest, InvalidSyntax) {
    EXPECT_EQ(evaluator.report("1+x"), "Err(InvalidSyntax(2))");
    EXPECT_EQ(evaluator.report("1/(0)"), "Err(InvalidSyntax(2))");
    EXPECT_EQ(evaluator.report("1 + x/0"), "Err(InvalidSyntax(4))");
}

TEST_F(EvaluatorTest, InvalidExpression) {
    EXPECT_EQ(evaluator.report(""), "Err(InvalidExpr)");
    EXPECT_EQ(evaluator.report("   "), "Err(InvalidExpr)");
    EXPECT_EQ(evaluator.report("3*"), "Err(InvalidExpr)");
    EXPECT_EQ(evaluator.report("+5"), "Err(InvalidExpr)");
    EXPECT_EQ(evaluator.report("1++2"), "Err(InvalidExpr)");
}

TEST_F(EvaluatorTest, OverflowingLineIsFatal) {
    std::string power = "9";
    for (int i = 0; i < 18; ++i) {
        power += "*9";
    }
    EXPECT_EQ(evaluator.report(power), "Ok(1350851717672992089)");
    EXPECT_THROW(evaluator.report(power + "*9"), ratcalc::ArithmeticOverflowError);

    std::string sevenths = "1";
    for (int i = 0; i < 22; ++i) {
        sevenths += "/7";
    }
    EXPECT_EQ(evaluator.report(sevenths), "Ok(01/3909821048582988049)");
    EXPECT_THROW(evaluator.report(sevenths + "/7"), std::logic_error);
}

TEST_F(EvaluatorTest, CallsAreIndependent) {
    EXPECT_EQ(evaluator.report("1/0"), "Err(DivisionByZero)");
    EXPECT_EQ(evaluator.report("4+4"), "Ok(8)");
    EXPECT_EQ(evaluator.report("4+4"), "Ok(8)");
}

TEST(ReducerTest, ReducesPreparedTokens) {
    ratcalc::TokenStream tokens;
    tokens.operands = {Rational(1), Rational(2), Rational(3)};
    tokens.operators = {Op::Subtract, Op::Multiply};
    EXPECT_EQ(ratcalc::Reducer(tokens).reduce(), Rational(-5));
}

TEST(ReducerTest, SingleOperand) {
    ratcalc::TokenStream tokens;
    tokens.operands = {Rational(7, 2)};
    EXPECT_EQ(ratcalc::Reducer(tokens).reduce(), Rational(7, 2));
}

TEST(ReducerTest, MissingOperandIsInvalidExpression) {
    ratcalc::TokenStream tokens;
    tokens.operands = {Rational(1)};
    tokens.operators = {Op::Multiply};
    EXPECT_THROW(ratcalc::Reducer(tokens).reduce(), ratcalc::InvalidExpressionError);
}

TEST(ErrorTest, DescribeNamesVariant) {
    EXPECT_EQ(ratcalc::DivisionByZeroError().describe(), "DivisionByZero");
    EXPECT_EQ(ratcalc::InvalidSyntaxError(7).describe(), "InvalidSyntax(7)");
    EXPECT_EQ(ratcalc::InvalidExpressionError().describe(), "InvalidExpr");
    EXPECT_EQ(ratcalc::InvalidSyntaxError(7).kind(), ratcalc::ErrorKind::InvalidSyntax);
}
