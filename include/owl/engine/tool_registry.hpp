#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "../search/knowledge_resolver.hpp"
#include "tool_call_parser.hpp"
#include "weather.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace owl {
namespace engine {

// ============================================================================
// Tool Kinds
// ============================================================================

/**
 * @brief Closed set of capabilities the agent can call.
 *
 * Adding a kind means adding a case here and an entry in
 * ToolRegistry::create_builtin(); the set is not extensible at runtime.
 */
enum class ToolKind {
    Weather,     ///< get_current_weather(location)
    WebSearch    ///< search_web(query, sentences = 3)
};

[[nodiscard]] inline const char* tool_kind_name(ToolKind kind) {
    switch (kind) {
        case ToolKind::Weather: return "get_current_weather";
        case ToolKind::WebSearch: return "search_web";
    }
    return "unknown";
}

/** @brief Callable type for tool execution; takes JSON arguments and returns content or Error. */
using ToolHandler = std::function<Expected<std::string>(const nlohmann::json&)>;

// ============================================================================
// Tool Registration Entry
// ============================================================================

/** @brief Holds metadata and handler for a single tool. */
struct ToolEntry {
    ToolKind kind;                       ///< Capability implemented by this entry
    std::string name;                    ///< Unique tool name used in directives
    std::string signature;               ///< Call shape shown to the model, e.g. "search_web(query: str)"
    std::string description;             ///< When to use the tool (may be empty)
    nlohmann::json parameters_schema;    ///< JSON Schema describing expected parameters
    ToolHandler handler;                 ///< Callable that executes the tool logic
};

/**
 * @brief Outcome of one tool dispatch.
 *
 * Always produced, even for unknown tools or failing capabilities: the
 * content then carries the error text for the model to read.
 */
struct ToolResult {
    std::string name;
    std::string tool_call_id;
    std::string content;

    bool operator==(const ToolResult& other) const {
        return name == other.name && tool_call_id == other.tool_call_id && content == other.content;
    }
    bool operator!=(const ToolResult& other) const { return !(*this == other); }
};

/**
 * @brief Render a resolver answer as tool content.
 *
 * Answer text, then a "Sources:" block with one citation per line when
 * there are citations.
 */
inline std::string format_search_content(const search::SearchAnswer& answer) {
    if (answer.citations.empty()) {
        return answer.text;
    }
    std::string content = answer.text + "\n\nSources:";
    for (const auto& citation : answer.citations) {
        content += "\n" + citation;
    }
    return content;
}

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief Fixed table of tools with schema validation and never-throwing dispatch.
 *
 * Built once through create() or create_builtin(); construction validates
 * the table (unique names, object schemas, every ToolKind covered). After
 * that the registry is immutable.
 *
 * @threadsafety All public methods are const and safe to call concurrently.
 */
class ToolRegistry {
public:
    /**
     * @brief Validate and freeze a tool table.
     *
     * @return ErrorCode::InvalidConfig on duplicate names, a missing handler,
     *         a non-object schema or a ToolKind with no entry
     */
    static Expected<ToolRegistry> create(std::vector<ToolEntry> entries) {
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            if (entry.name.empty()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tool name cannot be empty"});
            }
            if (!entry.handler) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tool has no handler", entry.name});
            }
            if (!entry.parameters_schema.is_object()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tool schema must be a JSON object", entry.name});
            }
            for (size_t j = 0; j < i; ++j) {
                if (entries[j].name == entry.name) {
                    return tl::unexpected(Error{ErrorCode::InvalidConfig, "Duplicate tool name", entry.name});
                }
                if (entries[j].kind == entry.kind) {
                    return tl::unexpected(Error{ErrorCode::InvalidConfig, "Duplicate tool kind", entry.name});
                }
            }
        }
        for (ToolKind kind : {ToolKind::Weather, ToolKind::WebSearch}) {
            bool present = false;
            for (const auto& entry : entries) {
                present = present || entry.kind == kind;
            }
            if (!present) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Missing required tool", tool_kind_name(kind)});
            }
        }
        return ToolRegistry(std::move(entries));
    }

    /**
     * @brief The production tool table: canned weather plus web lookup
     * through the given resolver.
     */
    static Expected<ToolRegistry> create_builtin(std::shared_ptr<const search::KnowledgeResolver> resolver) {
        if (!resolver) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "search_web requires a knowledge resolver"});
        }

        std::vector<ToolEntry> entries;

        entries.push_back(ToolEntry{
            ToolKind::Weather,
            tool_kind_name(ToolKind::Weather),
            "get_current_weather(location: str)",
            "allows you to get the current weather of a given location",
            nlohmann::json{
                {"type", "object"},
                {"properties", {{"location", {{"type", "string"}}}}},
                {"required", nlohmann::json::array({"location"})}
            },
            [](const nlohmann::json& args) -> Expected<std::string> {
                return current_weather(args.at("location").get<std::string>());
            }
        });

        entries.push_back(ToolEntry{
            ToolKind::WebSearch,
            tool_kind_name(ToolKind::WebSearch),
            "search_web(query: str)",
            "use this tool whenever you need current information, recent events, real-time data, "
            "or when your knowledge might be outdated. This includes questions about people's current "
            "status, recent news, current events, or any information that changes frequently.",
            nlohmann::json{
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}}},
                    {"sentences", {{"type", "integer"}}}
                }},
                {"required", nlohmann::json::array({"query"})}
            },
            [resolver](const nlohmann::json& args) -> Expected<std::string> {
                const std::string query = args.at("query").get<std::string>();
                const int sentences = args.value("sentences", 3);
                return format_search_content(resolver->resolve(query, sentences));
            }
        });

        return create(std::move(entries));
    }

    /** @brief Check whether a tool with the given name exists. */
    bool has_tool(const std::string& name) const {
        return find(name) != nullptr;
    }

    /** @brief Entry for a tool name, or nullptr. */
    const ToolEntry* find(const std::string& name) const {
        for (const auto& entry : entries_) {
            if (entry.name == name) return &entry;
        }
        return nullptr;
    }

    const ToolEntry* find(ToolKind kind) const {
        for (const auto& entry : entries_) {
            if (entry.kind == kind) return &entry;
        }
        return nullptr;
    }

    /**
     * @brief Validate tool call arguments against the tool's schema.
     *
     * Checks that arguments is an object, that every required key is
     * present, and that provided keys have the declared primitive type.
     *
     * @return Empty string if valid, otherwise a description of the problem
     */
    std::string validate_args(const ToolCall& tool_call) const {
        const ToolEntry* entry = find(tool_call.name);
        if (entry == nullptr) {
            return "Tool " + tool_call.name + " not found";
        }
        if (!tool_call.arguments.is_object()) {
            return "Arguments must be a JSON object";
        }
        const nlohmann::json& params = entry->parameters_schema;

        if (auto req_it = params.find("required"); req_it != params.end()) {
            for (const auto& req : *req_it) {
                const auto& field = req.get_ref<const std::string&>();
                if (!tool_call.arguments.contains(field)) {
                    return "Missing required argument: " + field;
                }
            }
        }

        if (auto props_it = params.find("properties"); props_it != params.end()) {
            for (const auto& [key, prop] : props_it->items()) {
                auto arg_it = tool_call.arguments.find(key);
                if (arg_it == tool_call.arguments.end()) continue;
                auto type_it = prop.find("type");
                if (type_it == prop.end() || !type_it->is_string()) continue;
                const auto& expected_type = type_it->get_ref<const std::string&>();
                if (!type_matches(*arg_it, expected_type)) {
                    return "Argument '" + key + "' has wrong type: expected " +
                           expected_type + ", got " + json_type_name(*arg_it);
                }
            }
        }
        return "";
    }

    /**
     * @brief Run a tool. Never throws.
     *
     * Errors carry ToolNotFound for unknown names, InvalidToolArguments for
     * schema violations and JSON access errors inside the handler, and
     * ToolExecutionFailed for capability errors and other exceptions.
     */
    Expected<std::string> execute(const std::string& name, const nlohmann::json& args) const {
        const ToolEntry* entry = find(name);
        if (entry == nullptr) {
            OWL_LOG_WARN("model requested unknown tool '%s'", name.c_str());
            return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool " + name + " not found", name});
        }

        const std::string problem = validate_args(ToolCall{name, args});
        if (!problem.empty()) {
            OWL_LOG_WARN("invalid arguments for %s: %s", name.c_str(), problem.c_str());
            return tl::unexpected(Error{
                ErrorCode::InvalidToolArguments, "invalid arguments for " + name + ": " + problem, name});
        }

        try {
            auto result = entry->handler(args);
            if (!result) {
                OWL_LOG_WARN("tool %s failed: %s", name.c_str(), result.error().to_string().c_str());
                return tl::unexpected(Error{ErrorCode::ToolExecutionFailed, result.error().message, name});
            }
            OWL_LOG_INFO("tool %s succeeded", name.c_str());
            return std::move(*result);
        } catch (const nlohmann::json::exception& e) {
            OWL_LOG_WARN("tool %s argument error: %s", name.c_str(), e.what());
            return tl::unexpected(Error{
                ErrorCode::InvalidToolArguments, std::string("JSON argument error: ") + e.what(), name});
        } catch (const std::exception& e) {
            OWL_LOG_WARN("tool %s threw: %s", name.c_str(), e.what());
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed, std::string("Tool execution failed: ") + e.what(), name});
        }
    }

    /**
     * @brief Run a tool and return its content as the model sees it.
     *
     * Unknown tools yield "Tool <name> not found"; every other failure
     * yields "Error: <description>".
     */
    std::string invoke(const std::string& name, const nlohmann::json& args) const {
        auto result = execute(name, args);
        if (result) {
            return std::move(*result);
        }
        if (result.error().code == ErrorCode::ToolNotFound) {
            return result.error().message;
        }
        return "Error: " + result.error().message;
    }

    /** @brief Invoke a parsed directive and wrap the content with its correlation token. */
    ToolResult dispatch(const ToolCall& call, std::string tool_call_id) const {
        return ToolResult{call.name, std::move(tool_call_id), invoke(call.name, call.arguments)};
    }

    /**
     * @brief Bullet lines for the system instruction, one per enabled tool.
     *
     * Weather is always listed; web lookup only when search is enabled.
     */
    std::string describe(bool search_enabled) const {
        std::string out;
        for (ToolKind kind : enabled_kinds(search_enabled)) {
            const ToolEntry* entry = find(kind);
            if (entry == nullptr) continue;
            if (!out.empty()) out += "\n";
            out += "            \xE2\x80\xA2 " + entry->signature;
            if (!entry->description.empty()) {
                out += " - " + entry->description;
            }
        }
        return out;
    }

    static std::vector<ToolKind> enabled_kinds(bool search_enabled) {
        if (search_enabled) {
            return {ToolKind::Weather, ToolKind::WebSearch};
        }
        return {ToolKind::Weather};
    }

    /** @brief Get the JSON function-calling schema for a single tool, or empty JSON if not found. */
    nlohmann::json get_tool_schema(const std::string& name) const {
        const ToolEntry* entry = find(name);
        if (entry == nullptr) {
            return nlohmann::json{};
        }
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", entry->name},
                {"description", entry->description},
                {"parameters", entry->parameters_schema}
            }}
        };
    }

    std::vector<std::string> get_tool_names() const {
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& entry : entries_) {
            names.push_back(entry.name);
        }
        return names;
    }

    size_t size() const { return entries_.size(); }

private:
    explicit ToolRegistry(std::vector<ToolEntry> entries) : entries_(std::move(entries)) {}

    static bool type_matches(const nlohmann::json& val, std::string_view expected) {
        if (expected == "integer") return val.is_number_integer();
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        return false;
    }

    static const char* json_type_name(const nlohmann::json& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }

    std::vector<ToolEntry> entries_;
};

} // namespace engine
} // namespace owl
