// tests/test_output_schema.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/schema/output_schema.h"
#include "support/fixtures.h"

using namespace agentflow;
using agentflow::testing::schema_of;

namespace {

auto review_state() {
    return StateRecordType::build(schema_of({{"draft", "str"}, {"score", "int"}, {"notes", "list[str]"}}));
}

NodeConfig node_with_outputs(std::vector<std::string> outputs) {
    NodeConfig node;
    node.id = "review";
    node.prompt = "Review {state.draft}";
    node.outputs = std::move(outputs);
    return node;
}

OutputSchemaConfig object_schema(std::vector<std::pair<std::string, std::string>> fields) {
    OutputSchemaConfig schema;
    schema.type_name = "object";
    schema.type = FieldType(FieldKind::OBJECT);
    schema.declared = true;
    for (const auto& [name, type] : fields) {
        schema.fields.push_back({name, type, FieldType::parse(type), ""});
    }
    return schema;
}

} // namespace

TEST_CASE("A single output is exchanged under the result key", "[schema]") {
    auto state = review_state();
    auto contract = OutputContract::build(node_with_outputs({"draft"}), *state);

    REQUIRE(contract.is_wrapped());
    CHECK(contract.json_schema()["required"] == Value::array({"result"}));
    CHECK(contract.json_schema()["properties"]["result"]["type"] == "string");

    auto ok = contract.validate(Value{{"result", "A post"}});
    REQUIRE(ok.ok);
    CHECK(ok.delta == Value{{"draft", "A post"}});

    // a bare string is accepted for a string output
    CHECK(contract.validate(Value("A post")).delta["draft"] == "A post");
}

TEST_CASE("Object schemas validate every declared field", "[schema]") {
    auto state = review_state();
    NodeConfig node = node_with_outputs({"score", "notes"});
    node.output_schema = object_schema({{"score", "int"}, {"notes", "list[str]"}});
    auto contract = OutputContract::build(node, *state);

    CHECK_FALSE(contract.is_wrapped());
    CHECK(contract.fields().size() == 2);

    SECTION("valid response") {
        auto v = contract.validate(Value{{"score", 8.0}, {"notes", {"tighten intro"}}});
        REQUIRE(v.ok);
        CHECK(v.delta["score"].is_number_integer());
        CHECK(v.delta["notes"].size() == 1);
    }
    SECTION("JSON text is parsed") {
        auto v = contract.validate(Value(R"({"score": 3, "notes": []})"));
        CHECK(v.ok);
    }
    SECTION("errors are collected per field") {
        auto v = contract.validate(Value{{"score", "eight"}});
        CHECK_FALSE(v.ok);
        CHECK(v.errors.size() == 2);
        CHECK(v.delta.empty());
    }
    SECTION("non-object response") {
        auto v = contract.validate(Value::array({1}));
        CHECK_FALSE(v.ok);
        CHECK(v.errors.size() == 1);
    }
}

TEST_CASE("Undeclared multi-output schemas take state field types", "[schema]") {
    auto state = review_state();
    auto contract = OutputContract::build(node_with_outputs({"draft", "score"}), *state);

    CHECK(contract.json_schema()["properties"]["score"]["type"] == "integer");
    CHECK_FALSE(contract.validate(Value{{"draft", "x"}, {"score", 1.5}}).ok);
    CHECK(contract.validate(Value{{"draft", "x"}, {"score", 2}}).ok);
}

TEST_CASE("Out-of-range integers from the model are rejected", "[schema]") {
    auto state = review_state();
    auto contract = OutputContract::build(node_with_outputs({"score"}), *state);

    auto rejected = contract.validate(Value{{"result", 1e20}});
    CHECK_FALSE(rejected.ok);
    CHECK_FALSE(rejected.errors.empty());

    auto accepted = contract.validate(Value{{"result", 8.0}});
    REQUIRE(accepted.ok);
    CHECK(accepted.delta["score"] == 8);
}
