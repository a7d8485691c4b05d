#ifndef TOOLBRIDGE_TOOLS_REGISTRY_HPP
#define TOOLBRIDGE_TOOLS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <toolbridge/tools/schema.hpp>
#include <vector>

namespace toolbridge
{

class ProtocolClient;

namespace tools
{

/// Immutable set of discovered tools, in server order, indexed by name.
class ToolSet
{
  public:
    ToolSet() = default;

    /// Later duplicates of a name are ignored.
    explicit ToolSet(std::vector<ToolSchema> tools);

    const ToolSchema* find(const std::string& name) const;
    bool contains(const std::string& name) const
    {
        return find(name) != nullptr;
    }

    const std::vector<ToolSchema>& tools() const
    {
        return tools_;
    }

    std::vector<std::string> names() const;

    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

  private:
    std::vector<ToolSchema> tools_;
    std::map<std::string, size_t> index_;
};

struct ToolListing
{
    std::vector<ToolSchema> tools;
    std::vector<std::string> rejected; // Descriptors skipped, with the reason
};

/// Parse a `tools/list` result. Throws MalformedResponseError when the result
/// has no `tools` array. Individual bad descriptors are reported in
/// `rejected` rather than failing the whole listing.
ToolListing parse_tools_list(const json& result);

/**
 * Holds the current snapshot of server-advertised tools.
 *
 * Each discovery replaces the snapshot wholesale. Readers hold a
 * shared_ptr to the snapshot they obtained, so a concurrent discovery never
 * changes a set someone is iterating.
 */
class ToolRegistry
{
  public:
    ToolRegistry();

    /// Issue `tools/list` and replace the snapshot. On failure the previous
    /// snapshot is kept and the error propagates.
    std::shared_ptr<const ToolSet> discover(ProtocolClient& client);

    void replace(std::vector<ToolSchema> tools);

    std::shared_ptr<const ToolSet> snapshot() const;

    std::optional<ToolSchema> get_tool_schema(const std::string& name) const;

    /// Like get_tool_schema(), but throws ToolNotFoundError naming the
    /// available tools.
    ToolSchema require(const std::string& name) const;

    std::vector<std::string> available_tools() const;
    bool has_tool(const std::string& name) const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ToolSet> current_;
};

} // namespace tools
} // namespace toolbridge

#endif // TOOLBRIDGE_TOOLS_REGISTRY_HPP
