// tests/test_config_validator.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include "modules/parser/config_parser.h"
#include "modules/validator/config_validator.h"
#include <algorithm>

using namespace agentflow;

namespace {

std::vector<Violation> violations_of(const std::string& yaml, const ToolInvoker* tools = nullptr) {
    try {
        ConfigValidator(tools).validate(ConfigParser::parse_text(yaml));
    } catch (const ConfigValidationError& e) {
        return e.violations();
    }
    return {};
}

const Violation* find_code(const std::vector<Violation>& vs, const std::string& code) {
    auto it = std::find_if(vs.begin(), vs.end(), [&](const Violation& v) { return v.code == code; });
    return it == vs.end() ? nullptr : &*it;
}

const char* kReviewFlow = R"(
flow: {name: review_flow, version: "1.0"}
state:
  fields:
    - {name: topic, type: str, required: true}
    - {name: draft, type: str}
    - {name: score, type: int, default: 0}
    - {name: done, type: bool, default: false}
nodes:
  - id: draft
    prompt: "Write about {state.topic}"
    outputs: [draft]
  - id: review
    prompt: "Score {draft}"
    outputs: [score]
  - id: rewrite
    prompt: "Improve {state.draft}"
    outputs: [draft]
edges:
  - {from: START, to: draft}
  - {from: draft, to: review}
  - from: review
    routes:
      - {condition: {logic: default}, to: rewrite}
      - {condition: {logic: "state.score >= 8"}, to: END}
  - {from: rewrite, to: review}
)";

} // namespace

TEST_CASE("A well-formed workflow validates", "[validator]") {
    WorkflowConfig config = ConfigValidator().validate(ConfigParser::parse_text(kReviewFlow));
    CHECK(config.flow.name == "review_flow");
    CHECK(config.nodes.size() == 3);
    REQUIRE(config.edges.size() == 4);
    CHECK(config.edges[2].kind() == EdgeKind::CONDITIONAL);
    CHECK(config.state.find("score")->default_value == Value(0));
    CHECK(config.config.execution.max_retries == 2);
}

TEST_CASE("Unknown edge references name the edge and suggest a node", "[validator]") {
    auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: topic, type: str}, {name: draft, type: str}]}
nodes:
  - {id: draft, prompt: "x", outputs: [draft]}
  - {id: review, prompt: "y", outputs: [topic]}
edges:
  - {from: START, to: draft}
  - {from: draft, to: reviw}
  - {from: review, to: END}
)");
    const Violation* v = find_code(vs, "unknown_reference");
    REQUIRE(v != nullptr);
    CHECK(v->location.find("edges[1]") != std::string::npos);
    CHECK(v->location.find("'draft'") != std::string::npos);
    CHECK(v->message.find("'reviw'") != std::string::npos);
    CHECK(v->suggestion == "Did you mean 'review'?");
    // graph checks are skipped while references dangle
    CHECK(find_code(vs, "unreachable_node") == nullptr);
}

TEST_CASE("Conditional edges need exactly one default route", "[validator]") {
    std::string yaml = kReviewFlow;
    auto pos = yaml.find("      - {condition: {logic: default}, to: rewrite}\n");
    REQUIRE(pos != std::string::npos);
    std::string without_default = yaml;
    without_default.replace(pos, std::string("      - {condition: {logic: default}, to: rewrite}\n").size(),
                            "      - {condition: \"state.score < 8\", to: rewrite}\n");

    auto vs = violations_of(without_default);
    const Violation* v = find_code(vs, "missing_default_route");
    REQUIRE(v != nullptr);
    CHECK(v->location.find("edges[2]") != std::string::npos);
}

TEST_CASE("Structural violations are reported before business rules", "[validator]") {
    auto vs = violations_of(R"(
flow: {name: f}
state:
  fields:
    - {name: topic, type: str, required: true, default: "x"}
    - {name: draft, type: strng}
nodes:
  - {id: draft, prompt: "x", outputs: [draft]}
edges:
  - {from: START, to: drafft}
  - {from: draft, to: END}
config:
  llm: {provider: openia, temperature: 1.5}
  execution: {max_retries: -1}
)");
    REQUIRE(vs.size() == 5);
    CHECK(find_code(vs, "required_with_default") != nullptr);
    CHECK(find_code(vs, "invalid_type_string") != nullptr);
    CHECK(find_code(vs, "invalid_enum")->suggestion == "Did you mean 'openai'?");
    CHECK(find_code(vs, "out_of_range") != nullptr);
    CHECK(find_code(vs, "unknown_reference") == nullptr);
}

TEST_CASE("All business violations are collected in one pass", "[validator]") {
    ToolRegistry tools;
    auto vs = violations_of(R"(
flow: {name: f}
state:
  fields:
    - {name: topic, type: str}
    - {name: count, type: int}
    - {name: flag, type: str}
nodes:
  - id: a
    prompt: "About {state.topc}"
    outputs: [count, missing]
    tools: [calculat]
  - id: b
    prompt: "x"
    outputs: [topic]
  - id: c
    prompt: "y"
    outputs: [topic]
    output_schema: {type: int}
edges:
  - {from: START, to: a}
  - {from: a, loop: {max_iterations: 3, condition_field: flag}}
  - {from: b, to: END}
)", &tools);

    CHECK(find_code(vs, "unknown_placeholder")->suggestion == "Did you mean 'topic'?");
    CHECK(find_code(vs, "unknown_output") != nullptr);
    CHECK(find_code(vs, "unknown_tool")->suggestion == "Did you mean 'calculate'?");
    CHECK(find_code(vs, "loop_condition_type") != nullptr);
    CHECK(find_code(vs, "type_mismatch") != nullptr);
    CHECK(find_code(vs, "missing_edge") != nullptr);
    CHECK(vs.size() >= 6);
}

TEST_CASE("Graph rules: reachability, forks and loop producers", "[validator]") {
    SECTION("unreachable node and missing path to END") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: str}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
  - {id: orphan, prompt: p, outputs: [x]}
  - {id: spin, prompt: p, outputs: [x]}
edges:
  - {from: START, to: a}
  - {from: a, to: END}
  - {from: orphan, to: spin}
  - {from: spin, to: orphan}
)");
        const Violation* v = find_code(vs, "unreachable_node");
        REQUIRE(v != nullptr);
        CHECK(find_code(vs, "no_path_to_end") != nullptr);
    }

    SECTION("fork branches must be independent") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: "list[str]"}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
  - {id: b, prompt: p, outputs: [x]}
edges:
  - {from: START, to: [a, b]}
  - {from: a, to: b}
  - {from: b, to: END}
)");
        CHECK(find_code(vs, "fork_not_independent") != nullptr);
    }

    SECTION("a fork inside a retry cycle is still independent") {
        auto vs = violations_of(R"(
flow: {name: f}
state:
  fields:
    - {name: text, type: str}
    - {name: pro, type: str}
    - {name: con, type: str}
    - {name: approved, type: bool, default: false}
nodes:
  - {id: draft, prompt: p, outputs: [text]}
  - {id: pros, prompt: p, outputs: [pro]}
  - {id: cons, prompt: p, outputs: [con]}
  - {id: review, prompt: p, outputs: [approved]}
edges:
  - {from: START, to: draft}
  - {from: draft, to: [pros, cons]}
  - {from: pros, to: review}
  - {from: cons, to: review}
  - from: review
    routes:
      - {condition: {logic: "state.approved"}, to: END}
      - {condition: {logic: default}, to: draft}
)");
        CHECK(find_code(vs, "fork_not_independent") == nullptr);
        CHECK(vs.empty());
    }

    SECTION("fork branches that never finish have no join") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: str}, {name: y, type: str}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
  - {id: b, prompt: p, outputs: [y]}
edges:
  - {from: START, to: [a, b]}
  - from: a
    routes:
      - {condition: {logic: default}, to: a}
  - from: b
    routes:
      - {condition: {logic: default}, to: b}
)");
        CHECK(find_code(vs, "fork_without_join") != nullptr);
        CHECK(find_code(vs, "no_path_to_end") != nullptr);
        CHECK(find_code(vs, "fork_not_independent") == nullptr);
    }

    SECTION("fork needs two distinct targets") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: str}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
edges:
  - {from: START, to: [a, a]}
  - {from: a, to: END}
)");
        CHECK(find_code(vs, "fork_targets") != nullptr);
    }

    SECTION("loop condition must be produced upstream") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: str}, {name: done, type: bool}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
edges:
  - {from: START, to: a}
  - {from: a, loop: {condition_field: done}}
)");
        CHECK(find_code(vs, "loop_condition_not_produced") != nullptr);
    }

    SECTION("START needs exactly one edge") {
        auto vs = violations_of(R"(
flow: {name: f}
state: {fields: [{name: x, type: str}]}
nodes:
  - {id: a, prompt: p, outputs: [x]}
edges:
  - {from: a, to: END}
)");
        CHECK(find_code(vs, "missing_start") != nullptr);
    }
}

TEST_CASE("Node loop blocks become loop edges", "[validator]") {
    const char* yaml = R"(
flow: {name: f}
state: {fields: [{name: x, type: str}, {name: done, type: bool}]}
nodes:
  - id: a
    prompt: p
    outputs: [x, done]
    loop: {max_iterations: 4, condition_field: done}
edges:
  - {from: START, to: a}
)";
    WorkflowConfig config = ConfigValidator().validate(ConfigParser::parse_text(yaml));
    REQUIRE(config.edges.size() == 2);
    CHECK(config.edges[1].kind() == EdgeKind::LOOP);
    CHECK(config.edges[1].loop->max_iterations == 4);
    CHECK(config.edges[1].loop->exit_to == END_NODE);
    CHECK(config.edges[1].location == "nodes[0].loop");

    std::string clash = std::string(yaml) + "  - {from: a, to: END}\n";
    auto vs = violations_of(clash);
    CHECK(find_code(vs, "conflicting_loop") != nullptr);
}

TEST_CASE("Unparseable documents raise ConfigLoadError", "[validator]") {
    REQUIRE_THROWS_AS(ConfigParser::parse_text("flow: [unclosed"), ConfigLoadError);
    REQUIRE_THROWS_AS(ConfigParser::parse_text("- just\n- a list\n"), ConfigLoadError);
    REQUIRE_THROWS_AS(ConfigParser::parse_file("/nonexistent/workflow.yaml"), ConfigLoadError);
}
