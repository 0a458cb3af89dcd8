// tests/test_run_orchestrator.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/parser/config_parser.h"
#include "modules/scheduler/run_orchestrator.h"
#include "modules/storage/memory_run_repository.h"
#include "modules/trace/trace_exporter.h"
#include "support/fixtures.h"
#include "support/scripted_llm.h"
#include <chrono>
#include <thread>

using namespace agentflow;
using agentflow::testing::ScriptedLlm;
using namespace std::chrono_literals;

namespace {

const char* kLinearFlow = R"(
flow: {name: summarize}
state:
  fields:
    - {name: text, type: str, required: true}
    - {name: outline, type: str}
    - {name: output, type: str}
nodes:
  - {id: plan, prompt: "Outline: {state.text}", outputs: [outline]}
  - {id: write, prompt: "Write from {outline}", outputs: [output]}
edges:
  - {from: START, to: plan}
  - {from: plan, to: write}
  - {from: write, to: END}
)";

const char* kReviewFlow = R"(
flow: {name: review}
state:
  fields:
    - {name: draft, type: str, required: true}
    - {name: score, type: int}
    - {name: final, type: str}
nodes:
  - {id: review, prompt: "Score {draft}", outputs: [score]}
  - {id: rewrite, prompt: "Rewrite {draft}", outputs: [final]}
  - {id: publish, prompt: "Publish {draft}", outputs: [final]}
edges:
  - {from: START, to: review}
  - from: review
    routes:
      - {condition: {logic: default}, to: publish}
      - {condition: {logic: "state.score < 7"}, to: rewrite}
  - {from: rewrite, to: END}
  - {from: publish, to: END}
)";

const char* kLoopFlow = R"(
flow: {name: refine}
state:
  fields:
    - {name: draft, type: str, default: ""}
    - {name: done, type: bool, default: false}
nodes:
  - {id: refine, prompt: "Improve: {draft}", outputs: [draft, done]}
edges:
  - {from: START, to: refine}
  - {from: refine, loop: {max_iterations: 3, condition_field: done, exit_to: END}}
)";

const char* kDebateFlow = R"(
flow: {name: debate}
state:
  fields:
    - {name: question, type: str, required: true}
    - {name: pros, type: str}
    - {name: cons, type: str}
    - {name: verdict, type: str}
nodes:
  - {id: argue_for, prompt: "Pros of {question}. Known cons: {cons}", outputs: [pros]}
  - {id: argue_against, prompt: "Cons of {question}. Known pros: {pros}", outputs: [cons]}
  - {id: decide, prompt: "Weigh {pros} against {cons}", outputs: [verdict]}
edges:
  - {from: START, to: [argue_for, argue_against]}
  - {from: argue_for, to: decide}
  - {from: argue_against, to: decide}
  - {from: decide, to: END}
)";

const char* kNotesFlow = R"(
flow: {name: notes}
state:
  fields:
    - {name: notes, type: "list[str]"}
    - {name: winner, type: str}
nodes:
  - {id: slow, prompt: "slow", outputs: [notes, winner]}
  - {id: fast, prompt: "fast", outputs: [notes, winner]}
  - {id: gather, prompt: "Gather {notes}", outputs: [winner]}
edges:
  - {from: START, to: [slow, fast]}
  - {from: slow, to: gather}
  - {from: fast, to: gather}
  - {from: gather, to: END}
)";

Value parse(const std::string& yaml) {
    return ConfigParser::parse_text(yaml);
}

// Replaces the first occurrence of `from` in a workflow fixture.
std::string patched(std::string yaml, const std::string& from, const std::string& to) {
    auto pos = yaml.find(from);
    REQUIRE(pos != std::string::npos);
    yaml.replace(pos, from.size(), to);
    return yaml;
}

struct Harness {
    ToolRegistry tools;
    ScriptedLlm llm;
    InMemoryRunRepository repository;
    TraceExporter tracer;

    RunOutcome run(const std::string& yaml, const Value& inputs) {
        RunOrchestrator orchestrator(llm, tools, {&repository, &tracer});
        return orchestrator.run(parse(yaml), inputs);
    }
};

class BrokenRepository : public RunRepository {
public:
    std::string create(const RunRecord&) override { throw std::runtime_error("database unavailable"); }
    void update(const std::string&, const RunOutcome&) override { throw std::runtime_error("database unavailable"); }
};

} // namespace

TEST_CASE("Linear workflow fills the state and records the run", "[orchestrator]") {
    Harness h;
    h.llm.on_structured("plan", {Value{{"result", "1. intro 2. body"}}});
    h.llm.on_structured("write", {Value{{"result", "Final summary"}}});

    RunOutcome outcome = h.run(kLinearFlow, {{"text", "A long article"}});
    REQUIRE(outcome.succeeded());
    CHECK(outcome.phase == RunPhase::COMPLETED);
    CHECK(outcome.state["output"] == "Final summary");
    CHECK(outcome.state["text"] == "A long article");
    CHECK(outcome.metrics.llm_calls == 2);
    CHECK(outcome.metrics.node_executions == 2);
    CHECK(outcome.metrics.input_tokens == 20);

    auto requests = h.llm.requests("write");
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].messages.front().content == "Write from 1. intro 2. body");

    auto stored = h.repository.get(outcome.run_id);
    REQUIRE(stored.has_value());
    CHECK(stored->status == "completed");
    CHECK(stored->record.workflow_name == "summarize");

    auto traces = h.tracer.get_traces(outcome.run_id);
    REQUIRE(traces.size() == 2);
    CHECK(traces[0].node_id == "plan");
    CHECK(traces[1].status == "success");
}

TEST_CASE("Conditional routes evaluate non-default conditions first", "[orchestrator]") {
    Harness h;
    h.llm.on_structured("rewrite", {Value{{"result", "rewritten"}}});
    h.llm.on_structured("publish", {Value{{"result", "published"}}});

    SECTION("low score takes the matching route") {
        h.llm.on_structured("review", {Value{{"result", 5}}});
        RunOutcome outcome = h.run(kReviewFlow, {{"draft", "first try"}});
        REQUIRE(outcome.succeeded());
        CHECK(outcome.state["final"] == "rewritten");
        CHECK(h.llm.structured_calls("publish") == 0);
    }

    SECTION("no match falls back to the default route") {
        h.llm.on_structured("review", {Value{{"result", 9}}});
        RunOutcome outcome = h.run(kReviewFlow, {{"draft", "first try"}});
        REQUIRE(outcome.succeeded());
        CHECK(outcome.state["final"] == "published");
        CHECK(h.llm.structured_calls("rewrite") == 0);
    }
}

TEST_CASE("Loop edges stop at the flag or at max_iterations", "[orchestrator][loop]") {
    Harness h;

    SECTION("flag never set: the cap ends the loop without failing the run") {
        h.llm.on_structured("refine", {Value{{"draft", "v"}, {"done", false}}});
        RunOutcome outcome = h.run(kLoopFlow, Value::object());
        REQUIRE(outcome.succeeded());
        CHECK(h.llm.structured_calls("refine") == 3);
        CHECK(outcome.loop_cap_hit("refine"));
        REQUIRE(outcome.loops.size() == 1);
        CHECK(outcome.loops[0].iterations == 3);
    }

    SECTION("flag set on the second pass") {
        h.llm.on_structured("refine", {Value{{"draft", "v1"}, {"done", false}},
                                       Value{{"draft", "v2"}, {"done", true}}});
        RunOutcome outcome = h.run(kLoopFlow, Value::object());
        REQUIRE(outcome.succeeded());
        CHECK(h.llm.structured_calls("refine") == 2);
        CHECK_FALSE(outcome.loop_cap_hit("refine"));
        CHECK(outcome.state["draft"] == "v2");
        CHECK(outcome.state["done"] == true);
    }
}

TEST_CASE("Fork branches run on isolated snapshots and merge at the join", "[orchestrator][fork]") {
    Harness h;
    h.llm.on_structured("argue_for", {Value{{"result", "cheap to run"}}});
    h.llm.on_structured("argue_against", {Value{{"result", "hard to debug"}}});
    h.llm.on_structured("decide", {Value{{"result", "go"}}});
    h.llm.delay("argue_for", 50ms);

    RunOutcome outcome = h.run(kDebateFlow, {{"question", "Adopt microservices?"}});
    REQUIRE(outcome.succeeded());
    CHECK(outcome.state["verdict"] == "go");

    // neither branch sees the other's output, even after it finished
    auto for_prompt = h.llm.requests("argue_for").front().messages.front().content;
    auto against_prompt = h.llm.requests("argue_against").front().messages.front().content;
    CHECK(for_prompt.find("hard to debug") == std::string::npos);
    CHECK(against_prompt.find("cheap to run") == std::string::npos);

    auto decide_prompt = h.llm.requests("decide").front().messages.front().content;
    CHECK(decide_prompt == "Weigh cheap to run against hard to debug");
    CHECK(outcome.metrics.node_executions == 3);
}

TEST_CASE("Fork merge follows declaration order, not completion order", "[orchestrator][fork]") {
    Harness h;
    h.llm.on_structured("slow", {Value{{"notes", Value::array({"from slow"})}, {"winner", "slow"}}});
    h.llm.on_structured("fast", {Value{{"notes", Value::array({"from fast"})}, {"winner", "fast"}}});
    h.llm.on_structured("gather", [](const LlmRequest& request) {
        return Value{{"result", request.messages.front().content}};
    });
    h.llm.delay("slow", 60ms);

    RunOutcome outcome = h.run(kNotesFlow, Value::object());
    REQUIRE(outcome.succeeded());
    CHECK(outcome.state["notes"] == Value{"from slow", "from fast"});
    CHECK(outcome.state["winner"] == R"(Gather ["from slow","from fast"])");
}

TEST_CASE("Conflicting scalar writes keep the later-declared branch", "[orchestrator][fork]") {
    Harness h;
    h.llm.on_structured("slow", {Value{{"notes", Value::array()}, {"winner", "slow"}}});
    h.llm.on_structured("fast", {Value{{"notes", Value::array()}, {"winner", "fast"}}});
    h.llm.delay("fast", 40ms);

    std::string yaml = patched(kNotesFlow, "  - {from: gather, to: END}\n", "");
    yaml = patched(yaml, "  - {id: gather, prompt: \"Gather {notes}\", outputs: [winner]}\n", "");
    yaml = patched(yaml, "  - {from: slow, to: gather}\n  - {from: fast, to: gather}\n",
                   "  - {from: slow, to: END}\n  - {from: fast, to: END}\n");

    RunOutcome outcome = h.run(yaml, Value::object());
    REQUIRE(outcome.succeeded());
    CHECK(outcome.state["winner"] == "fast");
}

TEST_CASE("Timeout ends the run with partial state", "[orchestrator][timeout]") {
    Harness h;
    h.llm.on_structured("plan", {Value{{"result", "outline"}}});
    h.llm.on_structured("write", {Value{{"result", "never used"}}});
    h.llm.delay("write", 3000ms);

    std::string yaml = std::string(kLinearFlow) + "config:\n  execution: {timeout: 0.2}\n";
    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome = h.run(yaml, {{"text", "article"}});
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(outcome.succeeded());
    CHECK(outcome.phase == RunPhase::FAILED);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == "TimeoutError");
    CHECK(outcome.error->node_id == "write");
    CHECK(outcome.state["outline"] == "outline");
    CHECK(outcome.state["output"].is_null());
    CHECK(elapsed < 2000ms);
    CHECK(h.repository.get(outcome.run_id)->status == "failed");
}

TEST_CASE("Node failures are fatal unless the edge continues", "[orchestrator][errors]") {
    Harness h;
    h.llm.fail("plan", "model overloaded");
    h.llm.on_structured("write", {Value{{"result", "written anyway"}}});

    SECTION("fatal by default") {
        RunOutcome outcome = h.run(kLinearFlow, {{"text", "article"}});
        REQUIRE_FALSE(outcome.succeeded());
        CHECK(outcome.error->code == "NodeExecutionError");
        CHECK(outcome.error->node_id == "plan");
        CHECK(h.llm.structured_calls("write") == 0);
    }

    SECTION("on_error: continue records the failure and moves on") {
        std::string yaml = patched(kLinearFlow, "{from: plan, to: write}", "{from: plan, to: write, on_error: continue}");
        RunOutcome outcome = h.run(yaml, {{"text", "article"}});
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.node_errors.size() == 1);
        CHECK(outcome.node_errors[0].node_id == "plan");
        CHECK(outcome.state["outline"].is_null());
        CHECK(outcome.state["output"] == "written anyway");
        // the failed attempt is still an execution
        CHECK(outcome.metrics.node_executions == 2);
        CHECK(outcome.node_results.size() == 1);
    }
}

TEST_CASE("A failing branch fails the run after every branch has finished", "[orchestrator][fork][errors]") {
    Harness h;
    h.llm.fail("argue_against", "refused");
    h.llm.on_structured("argue_for", {Value{{"result", "cheap"}}});
    h.llm.on_structured("decide", {Value{{"result", "go"}}});
    h.llm.delay("argue_for", 30ms);

    RunOutcome outcome = h.run(kDebateFlow, {{"question", "Q"}});
    REQUIRE_FALSE(outcome.succeeded());
    CHECK(outcome.error->node_id == "argue_against");
    CHECK(h.llm.structured_calls("decide") == 0);
    CHECK(outcome.metrics.node_executions == 2);
}

TEST_CASE("Timeout interrupts a branch blocked in a tool", "[orchestrator][fork][timeout]") {
    Harness h;
    h.tools.register_tool("slow_search", [](const Value&) -> Value {
        std::this_thread::sleep_for(3000ms);
        return Value{{"hits", Value::array()}};
    });
    h.llm.on_tools("argue_for", {agentflow::testing::tool_turn({ToolCall{"c1", "slow_search", Value::object()}})});
    h.llm.on_structured("argue_for", {Value{{"result", "never used"}}});
    h.llm.on_structured("argue_against", {Value{{"result", "hard to debug"}}});
    h.llm.on_structured("decide", {Value{{"result", "never used"}}});

    std::string yaml = patched(kDebateFlow, "outputs: [pros]}", "outputs: [pros], tools: [slow_search]}");
    yaml += "config:\n  execution: {timeout: 0.2}\n";
    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome = h.run(yaml, {{"question", "Q"}});
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(outcome.succeeded());
    CHECK(outcome.error->code == "TimeoutError");
    CHECK(outcome.error->node_id == "argue_for");
    CHECK(elapsed < 2000ms);
    CHECK(h.llm.structured_calls("argue_for") == 0);
    CHECK(h.llm.structured_calls("decide") == 0);
}

TEST_CASE("A fork can sit inside a review cycle", "[orchestrator][fork][loop]") {
    const char* kRevisionFlow = R"(
flow: {name: revision}
state:
  fields:
    - {name: topic, type: str, required: true}
    - {name: text, type: str}
    - {name: pro, type: str}
    - {name: con, type: str}
    - {name: approved, type: bool, default: false}
nodes:
  - {id: draft, prompt: "Draft {state.topic}", outputs: [text]}
  - {id: pros, prompt: "Praise {text}", outputs: [pro]}
  - {id: cons, prompt: "Criticise {text}", outputs: [con]}
  - {id: review, prompt: "Weigh {pro} and {con}", outputs: [approved]}
edges:
  - {from: START, to: draft}
  - {from: draft, to: [pros, cons]}
  - {from: pros, to: review}
  - {from: cons, to: review}
  - from: review
    routes:
      - {condition: {logic: "state.approved"}, to: END}
      - {condition: {logic: default}, to: draft}
)";
    Harness h;
    h.llm.on_structured("draft", {Value{{"result", "v1"}}, Value{{"result", "v2"}}});
    h.llm.on_structured("pros", {Value{{"result", "clear"}}});
    h.llm.on_structured("cons", {Value{{"result", "long"}}});
    h.llm.on_structured("review", {Value{{"result", false}}, Value{{"result", true}}});

    RunOutcome outcome = h.run(kRevisionFlow, {{"topic", "caching"}});
    REQUIRE(outcome.succeeded());
    CHECK(outcome.state["text"] == "v2");
    CHECK(outcome.state["approved"] == true);
    CHECK(h.llm.structured_calls("draft") == 2);
    CHECK(h.llm.structured_calls("pros") == 2);
    CHECK(h.llm.structured_calls("cons") == 2);
    CHECK(h.llm.structured_calls("review") == 2);
    CHECK(outcome.metrics.node_executions == 8);
}

TEST_CASE("Quality gates act on run metrics", "[orchestrator][gates]") {
    Harness h;
    h.llm.on_structured("plan", {Value{{"result", "o"}}});
    h.llm.on_structured("write", {Value{{"result", "w"}}});

    auto with_gates = [](const std::string& action) {
        return std::string(kLinearFlow) +
               "config:\n  gates:\n    on_fail: " + action + "\n    gates:\n      - {metric: llm_calls, max: 1}\n";
    };

    SECTION("warn") {
        RunOutcome outcome = h.run(with_gates("warn"), {{"text", "t"}});
        CHECK(outcome.succeeded());
        REQUIRE(outcome.gate_results.size() == 1);
        CHECK_FALSE(outcome.gate_results[0].passed);
    }

    SECTION("fail") {
        RunOutcome outcome = h.run(with_gates("fail"), {{"text", "t"}});
        REQUIRE_FALSE(outcome.succeeded());
        CHECK(outcome.error->code == "QualityGateError");
        CHECK(outcome.phase == RunPhase::FAILED);
        CHECK(outcome.state["output"] == "w");
    }

    SECTION("block_deploy") {
        RunOutcome outcome = h.run(with_gates("block_deploy"), {{"text", "t"}});
        CHECK(outcome.succeeded());
        CHECK(outcome.deploy_blocked);
    }
}

TEST_CASE("Collaborator failures never affect the run", "[orchestrator]") {
    ToolRegistry tools;
    ScriptedLlm llm;
    llm.on_structured("plan", {Value{{"result", "o"}}});
    llm.on_structured("write", {Value{{"result", "w"}}});
    BrokenRepository repository;

    RunOrchestrator orchestrator(llm, tools, {&repository, nullptr});
    RunOutcome outcome = orchestrator.run(parse(kLinearFlow), {{"text", "t"}});
    REQUIRE(outcome.succeeded());
    CHECK(outcome.run_id.rfind("local-", 0) == 0);
}

TEST_CASE("Invalid workflows fail before any model call", "[orchestrator][errors]") {
    Harness h;

    SECTION("validation errors") {
        std::string yaml = patched(kReviewFlow, "{condition: {logic: default}, to: publish}",
                                   "{condition: {logic: \"state.scor > 1\"}, to: publish}");
        RunOutcome outcome = h.run(yaml, {{"draft", "d"}});
        REQUIRE_FALSE(outcome.succeeded());
        CHECK(outcome.phase == RunPhase::LOADED);
        CHECK(outcome.error->code == "ConfigValidationError");
        CHECK(outcome.error->details["violations"].size() >= 2);
        CHECK(h.repository.list_runs().empty());
    }

    SECTION("missing required input") {
        RunOutcome outcome = h.run(kLinearFlow, Value::object());
        REQUIRE_FALSE(outcome.succeeded());
        CHECK(outcome.error->code == "StateInitializationError");
        CHECK(outcome.phase == RunPhase::VALIDATED);
    }

    SECTION("unknown input field") {
        RunOutcome outcome = h.run(kLinearFlow, {{"text", "t"}, {"txt", "typo"}});
        REQUIRE_FALSE(outcome.succeeded());
        CHECK(outcome.error->code == "StateInitializationError");
    }

    CHECK(h.llm.calls() == 0);
}

TEST_CASE("Conditional cycles are bounded by max_node_executions", "[orchestrator][loop]") {
    const char* kCycle = R"(
flow: {name: cycle}
state:
  fields:
    - {name: done, type: bool, default: false}
nodes:
  - {id: again, prompt: "again", outputs: [done]}
edges:
  - {from: START, to: again}
  - from: again
    routes:
      - {condition: {logic: "state.done"}, to: END}
      - {condition: {logic: default}, to: again}
config:
  execution: {max_node_executions: 4}
)";
    Harness h;
    h.llm.on_structured("again", {Value{{"result", false}}});

    RunOutcome outcome = h.run(kCycle, Value::object());
    REQUIRE_FALSE(outcome.succeeded());
    CHECK(outcome.error->code == "ControlFlowError");
    CHECK(h.llm.structured_calls("again") == 4);
    CHECK(outcome.metrics.node_executions == 4);
}

TEST_CASE("Prebuilt configs are re-checked before running", "[orchestrator]") {
    Harness h;
    h.llm.on_structured("plan", {Value{{"result", "o"}}});
    h.llm.on_structured("write", {Value{{"result", "w"}}});

    WorkflowConfig config = agentflow::testing::load_workflow(kLinearFlow);
    RunOrchestrator orchestrator(h.llm, h.tools);
    CHECK(orchestrator.run(config, {{"text", "t"}}).succeeded());

    config.nodes[1].outputs = {"outptu"};
    RunOutcome outcome = orchestrator.run(config, {{"text", "t"}});
    REQUIRE_FALSE(outcome.succeeded());
    CHECK(outcome.error->code == "ConfigValidationError");
    CHECK(h.llm.calls() == 2);
}
