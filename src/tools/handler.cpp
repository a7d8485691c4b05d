#include "../internal/log.hpp"

#include <toolbridge/client.hpp>
#include <toolbridge/errors.hpp>
#include <toolbridge/tools/argument_extractor.hpp>
#include <toolbridge/tools/handler.hpp>

namespace toolbridge
{
namespace tools
{

namespace
{
constexpr const char* PURPOSE_SUFFIX = " Use this tool ONLY for its intended purpose as described.";

json drop_nulls(const json& arguments)
{
    json filtered = json::object();
    for (auto it = arguments.begin(); it != arguments.end(); ++it)
        if (!it.value().is_null())
            filtered[it.key()] = it.value();
    return filtered;
}

std::string normalize_result(const std::string& name, const json& result)
{
    if (!result.is_object() || !result.contains("content"))
        return "Tool " + name + " returned no results";

    const json& content = result["content"];
    if (content.is_array() && !content.empty())
    {
        const json& first = content[0];
        if (first.is_object())
        {
            auto text = first.find("text");
            if (text != first.end() && text->is_string())
                return text->get<std::string>();
        }
    }
    return result.dump();
}
} // namespace

// ============================================================================
// Dispatcher
// ============================================================================

class ToolHandler::Dispatcher
{
  public:
    explicit Dispatcher(ProtocolClient& client) : client_(client) {}

    internal::Logger logger() const
    {
        return internal::Logger::from_options(client_.options());
    }

    std::string invoke(const std::string& name, const std::string& input)
    {
        try
        {
            internal::Logger log = logger();
            log.debug("Tool call " + name + " with input: " + input);

            ToolSchema schema = registry_.require(name);
            if (!schema.has_parameters())
                return dispatch(schema, json::object());

            json parsed = json::parse(input, nullptr, /*allow_exceptions=*/false);
            if (!parsed.is_discarded() && parsed.is_object())
                return validate_and_dispatch(schema, coerce_types(parsed, schema), "");

            log.debug("Input for " + name + " is not an argument object; extracting from text");
            json extracted = extract_arguments(input, schema);
            return validate_and_dispatch(schema, extracted, ". Please provide valid parameters.");
        }
        catch (const ToolNotFoundError& e)
        {
            return std::string("Error: ") + e.what();
        }
        catch (const std::exception& e)
        {
            return "Error executing " + name + ": " + e.what();
        }
    }

    std::string invoke_with_arguments(const std::string& name, const json& arguments)
    {
        try
        {
            ToolSchema schema = registry_.require(name);

            if (!arguments.is_null() && !arguments.is_object())
            {
                return "Parameter validation error for " + name +
                       ": arguments must be an object, got " + arguments.type_name();
            }

            json args = arguments.is_null() ? json::object() : arguments;
            return validate_and_dispatch(schema, coerce_types(args, schema), "");
        }
        catch (const ToolNotFoundError& e)
        {
            return std::string("Error: ") + e.what();
        }
        catch (const std::exception& e)
        {
            return "Error executing " + name + ": " + e.what();
        }
    }

    ProtocolClient& client_;
    ToolRegistry registry_;

  private:
    std::string validate_and_dispatch(const ToolSchema& schema, const json& arguments,
                                      const std::string& retry_hint)
    {
        json validated;
        try
        {
            validated = validate_arguments(drop_nulls(arguments), schema);
        }
        catch (const ValidationError& e)
        {
            return "Parameter validation error for " + schema.name + ": " + e.what() + retry_hint;
        }

        return dispatch(schema, validated);
    }

    std::string dispatch(const ToolSchema& schema, const json& arguments)
    {
        internal::Logger log = logger();
        json filtered = drop_nulls(arguments);

        try
        {
            if (log.enabled(LogLevel::Debug))
                log.debug("tools/call " + schema.name + " " + filtered.dump());

            json result = client_.call_tool(schema.name, filtered);
            return normalize_result(schema.name, result);
        }
        catch (const std::exception& e)
        {
            log.warning("Tool " + schema.name + " failed: " + e.what());
            return "Error executing " + schema.name + ": " + e.what();
        }
    }
};

// ============================================================================
// ToolHandler
// ============================================================================

ToolHandler::ToolHandler(ProtocolClient& client)
    : dispatcher_(std::make_shared<Dispatcher>(client))
{
}

ToolHandler::~ToolHandler() = default;

bool ToolHandler::discover_and_build_tools()
{
    std::shared_ptr<const ToolSet> set;
    try
    {
        set = dispatcher_->registry_.discover(dispatcher_->client_);
    }
    catch (const ToolbridgeError& e)
    {
        dispatcher_->logger().error(std::string("Failed to discover tools: ") + e.what());
        return false;
    }

    std::vector<InvocableTool> built;
    built.reserve(set->size());
    for (const auto& schema : set->tools())
        built.push_back(build_invocable(schema));

    std::lock_guard<std::mutex> lock(tools_mutex_);
    tools_ = std::move(built);
    return true;
}

InvocableTool ToolHandler::build_invocable(const ToolSchema& schema)
{
    std::weak_ptr<Dispatcher> weak = dispatcher_;
    std::string name = schema.name;
    return InvocableTool(schema, describe(schema),
                         [weak, name](const json& arguments) -> std::string
                         {
                             std::shared_ptr<Dispatcher> dispatcher = weak.lock();
                             if (!dispatcher)
                                 return "Error executing " + name + ": tool handler was destroyed";
                             return dispatcher->invoke_with_arguments(name, arguments);
                         });
}

std::string ToolHandler::describe(const ToolSchema& schema)
{
    std::string description = schema.description.empty() ? "Tool: " + schema.name
                                                          : schema.description;
    std::string out = "- " + schema.name + ": " + description + PURPOSE_SUFFIX;

    for (const auto& param : schema.parameters)
    {
        out += "\n  - " + param.name + " (" + param.type + "): " + param.description +
               (param.required ? " (required)" : " (optional)");
    }
    return out;
}

std::string ToolHandler::invoke(const std::string& name, const std::string& input)
{
    return dispatcher_->invoke(name, input);
}

std::string ToolHandler::invoke_with_arguments(const std::string& name, const json& arguments)
{
    return dispatcher_->invoke_with_arguments(name, arguments);
}

std::vector<InvocableTool> ToolHandler::tools() const
{
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_;
}

std::vector<std::string> ToolHandler::available_tools() const
{
    return dispatcher_->registry_.available_tools();
}

std::optional<ToolSchema> ToolHandler::get_tool_schema(const std::string& name) const
{
    return dispatcher_->registry_.get_tool_schema(name);
}

std::vector<std::string> ToolHandler::tool_descriptions() const
{
    std::vector<std::string> out;
    for (const auto& schema : dispatcher_->registry_.snapshot()->tools())
        out.push_back(describe(schema));
    return out;
}

ToolRegistry& ToolHandler::registry()
{
    return dispatcher_->registry_;
}

const ToolRegistry& ToolHandler::registry() const
{
    return dispatcher_->registry_;
}

} // namespace tools
} // namespace toolbridge
