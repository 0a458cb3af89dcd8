// tests/test_expression_evaluator.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/utils/expression_evaluator.h"
#include "core/types/errors.h"

using namespace agentflow;

namespace {

Value sample_data() {
    return Value{{"state", {{"score", 5}, {"done", false}, {"title", "draft"}, {"ratio", 0.75}}}};
}

} // namespace

TEST_CASE("Comparisons over state evaluate to booleans", "[expression]") {
    InjaExpressionEvaluator evaluator;
    Value data = sample_data();

    CHECK_FALSE(evaluator.evaluate("state.score >= 8", data));
    CHECK(evaluator.evaluate("state.score < 8", data));
    CHECK(evaluator.evaluate("state.ratio > 0.5", data));
    CHECK(evaluator.evaluate("state.title == 'draft'", data));
    CHECK_FALSE(evaluator.evaluate("state.done", data));
}

TEST_CASE("C-style and Python-style operators are normalized", "[expression]") {
    CHECK(InjaExpressionEvaluator::normalize("a && b || !c") == "a  and  b  or   not c");
    CHECK(InjaExpressionEvaluator::normalize("state.done == True") == "state.done == true");
    CHECK(InjaExpressionEvaluator::normalize("x != None") == "x != null");
    CHECK(InjaExpressionEvaluator::normalize("t == 'say \"hi\"'") == "t == \"say \\\"hi\\\"\"");

    InjaExpressionEvaluator evaluator;
    Value data = sample_data();
    CHECK(evaluator.evaluate("state.score > 3 && !state.done", data));
    CHECK(evaluator.evaluate("state.done == False || state.score == 0", data));
}

TEST_CASE("Non-boolean or failing expressions raise ControlFlowError", "[expression]") {
    InjaExpressionEvaluator evaluator;
    Value data = sample_data();
    REQUIRE_THROWS_AS(evaluator.evaluate("state.title", data), ControlFlowError);
    REQUIRE_THROWS_AS(evaluator.evaluate("state.missing > 1", data), ControlFlowError);
}

TEST_CASE("Referenced state fields are listed outside string literals", "[expression]") {
    auto fields = InjaExpressionEvaluator::referenced_state_fields(
        "state.score >= 8 and state.title != 'state.fake' and other.x");
    CHECK(fields == std::vector<std::string>{"score", "title"});
}
