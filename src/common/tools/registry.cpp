// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace agentflow {

namespace {

double number_arg(const Value& args, const char* key) {
    if (!args.is_object() || !args.contains(key)) {
        throw std::invalid_argument(std::string("missing argument '") + key + "'");
    }
    const Value& v = args.at(key);
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        size_t consumed = 0;
        const std::string& s = v.get_ref<const std::string&>();
        double d = std::stod(s, &consumed);
        if (consumed == s.size()) return d;
    }
    throw std::invalid_argument(std::string("argument '") + key + "' is not a number");
}

} // anonymous namespace

ToolRegistry::ToolRegistry() {
    register_default_tools();
}

void ToolRegistry::register_default_tools() {
    register_tool(
        ToolSpec{
            "calculate",
            "Apply a binary arithmetic operator (+, -, *, /) to two numbers.",
            {
                {"type", "object"},
                {"properties", {
                    {"a", {{"type", "number"}}},
                    {"b", {{"type", "number"}}},
                    {"op", {{"type", "string"}, {"enum", {"+", "-", "*", "/"}}}}
                }},
                {"required", {"a", "b", "op"}}
            }
        },
        [](const Value& args) -> Value {
            double a = number_arg(args, "a");
            double b = number_arg(args, "b");
            if (!args.contains("op") || !args.at("op").is_string()) {
                throw std::invalid_argument("missing argument 'op'");
            }
            const std::string op = args.at("op").get<std::string>();

            if (op == "/" && b == 0.0) {
                throw std::domain_error("division by zero");
            }
            double result = 0.0;
            if (op == "+") result = a + b;
            else if (op == "-") result = a - b;
            else if (op == "*") result = a * b;
            else if (op == "/") result = a / b;
            else throw std::invalid_argument("unsupported operator: " + op);

            return Value{{"result", result}};
        });

    register_tool(
        ToolSpec{
            "read_file",
            "Read a UTF-8 text file, truncated to max_bytes (default 65536).",
            {
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}}},
                    {"max_bytes", {{"type", "integer"}}}
                }},
                {"required", Value::array({"path"})}
            }
        },
        [](const Value& args) -> Value {
            if (!args.is_object() || !args.contains("path") || !args.at("path").is_string()) {
                throw std::invalid_argument("missing argument 'path'");
            }
            const std::string path = args.at("path").get<std::string>();
            size_t max_bytes = 65536;
            if (args.contains("max_bytes") && args.at("max_bytes").is_number_integer()) {
                max_bytes = static_cast<size_t>(std::max<int64_t>(0, args.at("max_bytes").get<int64_t>()));
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                throw std::runtime_error("cannot open file: " + path);
            }
            std::string content(max_bytes, '\0');
            file.read(content.data(), static_cast<std::streamsize>(max_bytes));
            content.resize(static_cast<size_t>(file.gcount()));
            bool truncated = file.peek() != std::char_traits<char>::eof();

            return Value{{"path", path}, {"content", content}, {"truncated", truncated}};
        });
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::optional<ToolSpec> ToolRegistry::spec(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) return std::nullopt;
    return it->second.spec;
}

Value ToolRegistry::invoke(const std::string& name, const Value& args) const {
    return bind(name)(args);
}

ToolFunction ToolRegistry::bind(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw ToolExecutionError(name, "tool not registered");
    }

    ToolFunction fn = it->second.fn;
    return [name, fn](const Value& args) -> Value {
        try {
            return fn(args);
        } catch (const ToolExecutionError&) {
            throw;
        } catch (const std::exception& e) {
            throw ToolExecutionError(name, e.what());
        }
    };
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace agentflow
