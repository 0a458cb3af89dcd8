// tests/test_template_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/template/template_resolver.h"
#include "support/fixtures.h"

using namespace agentflow;
using agentflow::testing::schema_of;

namespace {

StateRecord sample_state() {
    auto type = StateRecordType::build(schema_of({{"topic", "str"}, {"score", "int"}, {"tags", "list[str]"},
                                                  {"meta", "dict"}, {"summary", "str"}}));
    return StateRecord::create(type, Value{{"topic", "coffee"}, {"score", 7}, {"tags", {"a", "b"}},
                                           {"meta", {{"author", {{"name", "Ana"}}}}}});
}

} // namespace

TEST_CASE("Placeholders are extracted with and without the state prefix", "[template]") {
    auto ps = TemplateResolver::placeholders("Write {state.topic} for {audience} ({state.meta.author.name})");
    REQUIRE(ps.size() == 3);
    CHECK(ps[0].field == "topic");
    CHECK(ps[1].field == "audience");
    CHECK(ps[2].field == "meta");
    CHECK(ps[2].path == std::vector<std::string>{"author", "name"});
    CHECK(TemplateResolver::placeholders("JSON like {\"a\": 1} is left alone").empty());
}

TEST_CASE("Values are rendered by type", "[template]") {
    auto state = sample_state();
    CHECK(TemplateResolver::resolve("About {state.topic}, score {score}", state) == "About coffee, score 7");
    CHECK(TemplateResolver::resolve("{tags}", state) == R"(["a","b"])");
    CHECK(TemplateResolver::resolve("by {state.meta.author.name}", state) == "by Ana");
    CHECK(TemplateResolver::resolve("[{summary}]", state) == "[]");
}

TEST_CASE("Substituted text is not rescanned", "[template]") {
    auto type = StateRecordType::build(schema_of({{"a", "str"}, {"b", "str"}}));
    auto state = StateRecord::create(type, Value{{"a", "{b}"}, {"b", "x"}});
    CHECK(TemplateResolver::resolve("{a}/{b}", state) == "{b}/x");
}

TEST_CASE("Unresolvable placeholders raise TemplateError naming the field", "[template]") {
    auto state = sample_state();
    try {
        TemplateResolver::resolve("About {state.topik}", state);
        FAIL("expected TemplateError");
    } catch (const TemplateError& e) {
        CHECK(e.field() == "topik");
        CHECK(std::string(e.what()).find("Did you mean 'topic'?") != std::string::npos);
    }
    REQUIRE_THROWS_AS(TemplateResolver::resolve("{meta.editor}", state), TemplateError);
}
