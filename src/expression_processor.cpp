#include "expression_processor.hpp"

#include "errors.hpp"

namespace ratcalc {

EvaluationRecord evaluateLine(const ExpressionEvaluator& evaluator, const ExpressionLine& line) {
    EvaluationRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        record.value = evaluator.evaluate(line.text);
        record.status = "success";
    }
    catch (const EvaluationError& ex) {
        record.value.reset();
        record.status = "error";
        record.message = "Err(" + ex.describe() + ")";
    }
    return record;
}

} // namespace ratcalc
