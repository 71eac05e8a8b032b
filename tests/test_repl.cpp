#include <gtest/gtest.h>

#include <sstream>

#include "repl.hpp"

TEST(ReplTest, PrintsOneReportPerLine) {
    std::istringstream input("23+4\n6/3*2\n1/0\n1+x\n\n7/2\r\n3*3");
    std::ostringstream output;
    ratcalc::ExpressionEvaluator evaluator;

    std::size_t processed = ratcalc::runLines(input, output, evaluator);

    EXPECT_EQ(processed, 7u);
    EXPECT_EQ(output.str(),
              "Ok(9)\n"
              "Ok(4)\n"
              "Err(DivisionByZero)\n"
              "Err(InvalidSyntax(2))\n"
              "Err(InvalidExpr)\n"
              "Ok(31/2)\n"
              "Ok(9)\n");
}

TEST(ReplTest, EmptyInputPrintsNothing) {
    std::istringstream input("");
    std::ostringstream output;
    ratcalc::ExpressionEvaluator evaluator;

    EXPECT_EQ(ratcalc::runLines(input, output, evaluator), 0u);
    EXPECT_TRUE(output.str().empty());
}

TEST(ReplTest, AllSpaceLineIsInvalidExpression) {
    std::istringstream input("   \n");
    std::ostringstream output;
    ratcalc::ExpressionEvaluator evaluator;

    ratcalc::runLines(input, output, evaluator);
    EXPECT_EQ(output.str(), "Err(InvalidExpr)\n");
}

TEST(ReplTest, StopsAtFirstLineThatIsNotUtf8) {
    std::istringstream input("1+1\n2\xff+3\n4*4\n");
    std::ostringstream output;
    ratcalc::ExpressionEvaluator evaluator;

    EXPECT_EQ(ratcalc::runLines(input, output, evaluator), 1u);
    EXPECT_EQ(output.str(), "Ok(2)\n");
}

TEST(ReplTest, WellFormedMultibyteLineIsStillEvaluated) {
    // "é" в UTF-8 занимает два байта, ошибка указывает на первый из них
    std::istringstream input("1+\xc3\xa9\n\xed\xa0\x80\n7\n");
    std::ostringstream output;
    ratcalc::ExpressionEvaluator evaluator;

    EXPECT_EQ(ratcalc::runLines(input, output, evaluator), 1u);
    EXPECT_EQ(output.str(), "Err(InvalidSyntax(2))\n");
}
