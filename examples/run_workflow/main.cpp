// examples/run_workflow/main.cpp
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/llm/llama_adapter.h"
#include "core/engine.h"
#include "modules/graph/graph_compiler.h"
#include "modules/parser/config_parser.h"
#include "modules/state/state_record.h"
#include "modules/validator/config_validator.h"

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <workflow.yaml> [inputs.json] [--llm-config path] [--trace out.json]\n"
              << "       " << prog << " <workflow.yaml> --describe\n";
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw agentflow::ConfigLoadError("cannot open inputs file: " + path);
    }
    return nlohmann::json::parse(file);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string workflow_path = argv[1];
    std::string inputs_path;
    std::string llm_config_path = "llm_config.json";
    std::string trace_path;
    bool describe = false;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--llm-config") == 0 && i + 1 < argc) {
            llm_config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--trace") == 0 && i + 1 < argc) {
            trace_path = argv[++i];
        } else if (std::strcmp(argv[i], "--describe") == 0) {
            describe = true;
        } else if (argv[i][0] != '-' && inputs_path.empty()) {
            inputs_path = argv[i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        // 1. 只校验并编译，不加载模型
        if (describe) {
            agentflow::ToolRegistry tools;
            auto document = agentflow::ConfigParser::parse_file(workflow_path);
            auto config = agentflow::ConfigValidator(&tools).validate(document);
            auto plan = agentflow::GraphCompiler(&tools).compile(config, agentflow::StateRecordType::build(config.state));
            std::cout << plan.describe().dump(2) << "\n";
            return 0;
        }

        // 2. 创建引擎
        auto llm = std::make_unique<agentflow::LlamaAdapter>(agentflow::LlamaAdapter::load_config(llm_config_path));
        auto engine = agentflow::WorkflowEngine::from_file(workflow_path, std::move(llm));

        // 3. 执行
        nlohmann::json inputs = inputs_path.empty() ? nlohmann::json::object() : read_json_file(inputs_path);
        auto outcome = engine->run(inputs);

        // 4. 输出结果
        std::cout << outcome.to_json().dump(2) << "\n";

        // 5. 导出 Trace 到文件
        if (!trace_path.empty()) {
            std::ofstream trace_file(trace_path);
            trace_file << engine->tracer().export_json().dump(2) << std::endl;
            std::cerr << "Trace exported to " << trace_path << " (" << engine->get_last_traces().size()
                      << " records)\n";
        }
        return outcome.succeeded() ? 0 : 1;
    } catch (const agentflow::ConfigValidationError& e) {
        std::cerr << "[ERROR] workflow is invalid:\n";
        for (const auto& v : e.violations()) {
            std::cerr << "  - " << v.to_string() << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
