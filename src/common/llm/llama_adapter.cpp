#include "common/llm/llama_adapter.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace agentflow {

namespace {

constexpr const char* kToolInstructions =
    "You may call tools. To call tools, reply with only a JSON object of the form "
    "{\"tool_calls\": [{\"name\": \"<tool>\", \"arguments\": {...}}]}. "
    "When no tool is needed, reply with your answer as plain text.";

int default_threads() {
    unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<int>(n) : 4;
}

} // namespace

LlamaAdapter::Config LlamaAdapter::load_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    Config config;
    config.model_path = "models/qwen-0.6b.gguf";
    config.n_threads = default_threads();

    std::ifstream file(config_path);
    if (!file.is_open()) {
        log_debug("no llm config at '" + config_path + "', using defaults");
        return config;
    }

    Value j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigLoadError("invalid llm config '" + config_path + "': " + e.what());
    }

    if (j.contains("model_path") && j["model_path"].is_string()) {
        fs::path config_dir = fs::path(config_path).parent_path();
        if (config_dir.empty()) config_dir = ".";
        config.model_path = fs::absolute(config_dir / j["model_path"].get<std::string>()).string();
    }
    if (j.contains("n_ctx") && j["n_ctx"].is_number_integer()) {
        config.n_ctx = j["n_ctx"].get<int>();
    }
    if (j.contains("n_threads") && j["n_threads"].is_number_integer()) {
        int threads = j["n_threads"].get<int>();
        config.n_threads = threads > 0 ? threads : default_threads();
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        config.temperature = static_cast<float>(j["temperature"].get<double>());
    }
    if (j.contains("min_p") && j["min_p"].is_number()) {
        config.min_p = static_cast<float>(j["min_p"].get<double>());
    }
    if (j.contains("n_predict") && j["n_predict"].is_number_integer()) {
        config.n_predict = j["n_predict"].get<int>();
    }
    return config;
}

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw LlmError("failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw LlmError("failed to create llama context");
    }
    ctx_.reset(raw_ctx);
    log_info("llama model loaded: " + config_.model_path);
}

LlamaAdapter::~LlamaAdapter() = default;

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr;
}

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::render_messages(const std::vector<ChatMessage>& messages) const {
    std::ostringstream out;
    for (const auto& msg : messages) {
        if (msg.role == "tool") {
            out << "[tool result: " << msg.name << "]\n" << msg.content << "\n\n";
            continue;
        }
        out << "[" << msg.role << "]\n" << msg.content << "\n";
        for (const auto& call : msg.tool_calls) {
            out << "(called " << call.name << " with " << call.arguments.dump() << ")\n";
        }
        out << "\n";
    }
    out << "[assistant]\n";
    return out.str();
}

LlamaAdapter::Generation LlamaAdapter::generate(const std::string& prompt, const LlmRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_loaded()) {
        throw LlmError("model not loaded");
    }

    // 每次请求都携带完整历史，先清空 KV 缓存
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw LlmError("tokenization failed for node '" + request.node_id + "'");
    }

    float temperature = request.settings.temperature
        ? static_cast<float>(*request.settings.temperature) : config_.temperature;
    int n_predict = request.settings.max_tokens ? *request.settings.max_tokens : config_.n_predict;

    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler(
        llama_sampler_chain_init(llama_sampler_chain_default_params()), llama_sampler_free);
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(temperature));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw LlmError("prompt evaluation failed for node '" + request.node_id + "'");
    }

    Generation gen;
    gen.usage.input_tokens = static_cast<int>(tokens.size());
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    for (int i = 0; i < n_predict; ++i) {
        if (request.budget) {
            request.budget->check("generation for node '" + request.node_id + "'");
        }
        llama_token new_token = llama_sampler_sample(sampler.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        gen.text += detokenize(new_token);
        ++gen.usage.output_tokens;

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            log_warning("decode failed after " + std::to_string(i + 1) + " tokens, truncating output");
            break;
        }
    }
    return gen;
}

LlmResponse LlamaAdapter::invoke_with_tools(const LlmRequest& request, const std::vector<ToolSpec>& tools) {
    std::string prompt;
    if (!tools.empty()) {
        Value specs = Value::array();
        for (const auto& t : tools) {
            specs.push_back({{"name", t.name}, {"description", t.description}, {"parameters", t.parameters}});
        }
        prompt = "[system]\n" + std::string(kToolInstructions) + "\nTools: " + specs.dump() + "\n\n";
    }
    prompt += render_messages(request.messages);

    Generation gen = generate(prompt, request);
    LlmResponse response;
    response.content = gen.text;
    response.usage = gen.usage;

    Value parsed = extract_json_object(gen.text);
    if (!tools.empty() && parsed.is_object() && parsed.contains("tool_calls") && parsed["tool_calls"].is_array()) {
        int index = 0;
        for (const auto& item : parsed["tool_calls"]) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) continue;
            ToolCall call;
            call.id = request.node_id + "-call-" + std::to_string(index++);
            call.name = item["name"].get<std::string>();
            if (item.contains("arguments") && item["arguments"].is_object()) {
                call.arguments = item["arguments"];
            }
            response.tool_calls.push_back(std::move(call));
        }
    }
    return response;
}

StructuredResponse LlamaAdapter::invoke_structured(const LlmRequest& request, const Value& output_schema) {
    std::string prompt = "[system]\nRespond with only a JSON value matching this JSON schema:\n" +
                         output_schema.dump(2) + "\n\n" + render_messages(request.messages);

    Generation gen = generate(prompt, request);
    StructuredResponse response;
    response.usage = gen.usage;
    Value parsed = extract_json_object(gen.text);
    // 解析失败时原样返回文本，由输出契约校验并触发重试
    response.raw = parsed.is_null() ? Value(gen.text) : parsed;
    return response;
}

Value extract_json_object(const std::string& text) {
    size_t start = text.find('{');
    while (start != std::string::npos) {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == '{') ++depth;
            else if (c == '}' && --depth == 0) {
                Value parsed = Value::parse(text.substr(start, i - start + 1), nullptr, false);
                if (!parsed.is_discarded()) return parsed;
                break;
            }
        }
        start = text.find('{', start + 1);
    }
    return nullptr;
}

} // namespace agentflow
