// common/tools/registry.h
#ifndef AGENTFLOW_COMMON_TOOLS_REGISTRY_H
#define AGENTFLOW_COMMON_TOOLS_REGISTRY_H

#include "core/types/context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// Tool description handed to the model when tools are bound to a node.
struct ToolSpec {
    std::string name;
    std::string description;
    Value parameters = Value::object(); // JSON schema of the argument object
};

using ToolFunction = std::function<Value(const Value& args)>;

class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual bool has_tool(const std::string& name) const = 0;
    virtual std::optional<ToolSpec> spec(const std::string& name) const = 0;
    // Throws ToolExecutionError when the tool is unknown or fails.
    virtual Value invoke(const std::string& name, const Value& args) const = 0;
    // Owned copy of the tool, usable after the invoker is gone. Failures surface as
    // ToolExecutionError when it is called; unknown names throw right away.
    virtual ToolFunction bind(const std::string& name) const = 0;
    virtual std::vector<std::string> list_tools() const = 0;
};

// Populated at process start, then shared read-only by every run.
class ToolRegistry : public ToolInvoker {
public:
    ToolRegistry(); // 构造时注册默认工具

    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        ToolSpec spec;
        spec.name = name;
        tools_[std::move(name)] = Entry{std::move(spec), ToolFunction(std::forward<Func>(func))};
    }

    template<typename Func>
    void register_tool(ToolSpec spec, Func&& func) {
        std::string name = spec.name;
        tools_[std::move(name)] = Entry{std::move(spec), ToolFunction(std::forward<Func>(func))};
    }

    bool has_tool(const std::string& name) const override;
    std::optional<ToolSpec> spec(const std::string& name) const override;
    Value invoke(const std::string& name, const Value& args) const override;
    ToolFunction bind(const std::string& name) const override;
    std::vector<std::string> list_tools() const override;

private:
    struct Entry {
        ToolSpec spec;
        ToolFunction fn;
    };

    void register_default_tools();
    std::unordered_map<std::string, Entry> tools_;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_TOOLS_REGISTRY_H
