#ifndef TOOLBRIDGE_TOOLS_HANDLER_HPP
#define TOOLBRIDGE_TOOLS_HANDLER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <toolbridge/tools/registry.hpp>
#include <toolbridge/tools/schema.hpp>
#include <vector>

namespace toolbridge
{

class ProtocolClient;

namespace tools
{

// ============================================================================
// Type-erased invocable tool
// ============================================================================

/// A discovered tool bound to a dispatch function. Invoking it never throws;
/// the outcome (result or error) is always text. Tools built by a
/// ToolHandler may outlive it: once the handler is gone they answer with an
/// error text.
class InvocableTool
{
  public:
    using Invoker = std::function<std::string(const json&)>;

    InvocableTool(ToolSchema schema, std::string description, Invoker invoker)
        : schema_(std::move(schema)), description_(std::move(description)),
          invoker_(std::move(invoker))
    {
    }

    const std::string& name() const
    {
        return schema_.name;
    }
    const ToolSchema& schema() const
    {
        return schema_;
    }

    // Rendered describe() block
    const std::string& description() const
    {
        return description_;
    }

    std::vector<std::string> required_parameters() const
    {
        return schema_.required_parameters();
    }

    std::string invoke(const json& arguments) const
    {
        return invoker_(arguments);
    }

    std::string operator()(const json& arguments) const
    {
        return invoker_(arguments);
    }

  private:
    ToolSchema schema_;
    std::string description_;
    Invoker invoker_;
};

// ============================================================================
// ToolHandler
// ============================================================================

/**
 * Bridges loosely-typed caller input to the registry's schemas and executes
 * tools through a ProtocolClient.
 *
 * invoke() and invoke_with_arguments() are the boundary of the library:
 * every failure (unknown tool, validation, transport, server error) comes
 * back as text and no exception escapes them.
 *
 * The client must outlive the handler and every tool it built.
 */
class ToolHandler
{
  public:
    explicit ToolHandler(ProtocolClient& client);
    ~ToolHandler();

    ToolHandler(const ToolHandler&) = delete;
    ToolHandler& operator=(const ToolHandler&) = delete;

    /// Discover tools via `tools/list` and build an invocable for each.
    /// Returns false (and logs) when discovery fails; the previous set stays.
    bool discover_and_build_tools();

    /// Bind a schema to this handler's dispatch path. Never fails.
    InvocableTool build_invocable(const ToolSchema& schema);

    /// Deterministic human-readable block for one tool.
    static std::string describe(const ToolSchema& schema);

    /// Unified entry point. `input` is either a JSON object of arguments or
    /// free text, which goes through the natural-language fallback.
    std::string invoke(const std::string& name, const std::string& input);

    /// Structured entry point: coerce, validate and dispatch.
    std::string invoke_with_arguments(const std::string& name, const json& arguments);

    std::vector<InvocableTool> tools() const;
    std::vector<std::string> available_tools() const;
    std::optional<ToolSchema> get_tool_schema(const std::string& name) const;
    std::vector<std::string> tool_descriptions() const;

    ToolRegistry& registry();
    const ToolRegistry& registry() const;

  private:
    // Registry plus dispatch path, shared weakly with built tools
    class Dispatcher;
    std::shared_ptr<Dispatcher> dispatcher_;

    mutable std::mutex tools_mutex_;
    std::vector<InvocableTool> tools_;
};

} // namespace tools
} // namespace toolbridge

#endif // TOOLBRIDGE_TOOLS_HANDLER_HPP
