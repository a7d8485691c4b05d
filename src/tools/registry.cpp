#include "../internal/log.hpp"

#include <toolbridge/client.hpp>
#include <toolbridge/errors.hpp>
#include <toolbridge/tools/registry.hpp>

namespace toolbridge
{
namespace tools
{

// ============================================================================
// ToolSet
// ============================================================================

ToolSet::ToolSet(std::vector<ToolSchema> tools)
{
    tools_.reserve(tools.size());
    for (auto& tool : tools)
    {
        if (index_.count(tool.name))
            continue;
        index_[tool.name] = tools_.size();
        tools_.push_back(std::move(tool));
    }
}

const ToolSchema* ToolSet::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

std::vector<std::string> ToolSet::names() const
{
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_)
        out.push_back(tool.name);
    return out;
}

// ============================================================================
// tools/list parsing
// ============================================================================

ToolListing parse_tools_list(const json& result)
{
    if (!result.is_object())
        throw MalformedResponseError("tools/list result is not an object", result);

    auto tools_it = result.find("tools");
    if (tools_it == result.end() || !tools_it->is_array())
        throw MalformedResponseError("tools/list result has no 'tools' array", result);

    ToolListing listing;
    std::map<std::string, bool> seen;
    for (size_t position = 0; position < tools_it->size(); ++position)
    {
        try
        {
            ToolSchema schema = ToolSchema::from_json((*tools_it)[position]);
            if (seen.count(schema.name))
            {
                listing.rejected.push_back("duplicate tool name '" + schema.name + "'");
                continue;
            }
            seen[schema.name] = true;
            listing.tools.push_back(std::move(schema));
        }
        catch (const MalformedResponseError& e)
        {
            listing.rejected.push_back("descriptor #" + std::to_string(position) + ": " +
                                       e.what());
        }
    }

    return listing;
}

// ============================================================================
// ToolRegistry
// ============================================================================

ToolRegistry::ToolRegistry() : current_(std::make_shared<const ToolSet>()) {}

std::shared_ptr<const ToolSet> ToolRegistry::discover(ProtocolClient& client)
{
    internal::Logger logger = internal::Logger::from_options(client.options());

    json result = client.list_tools();
    ToolListing listing = parse_tools_list(result);

    for (const auto& reason : listing.rejected)
        logger.warning("Skipping tool: " + reason);

    auto next = std::make_shared<const ToolSet>(std::move(listing.tools));
    logger.info("Discovered " + std::to_string(next->size()) + " tool(s)");

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = next;
    return next;
}

void ToolRegistry::replace(std::vector<ToolSchema> tools)
{
    auto next = std::make_shared<const ToolSet>(std::move(tools));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

std::shared_ptr<const ToolSet> ToolRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::optional<ToolSchema> ToolRegistry::get_tool_schema(const std::string& name) const
{
    auto set = snapshot();
    if (const ToolSchema* schema = set->find(name))
        return *schema;
    return std::nullopt;
}

ToolSchema ToolRegistry::require(const std::string& name) const
{
    auto set = snapshot();
    if (const ToolSchema* schema = set->find(name))
        return *schema;

    std::string listing = "[";
    std::vector<std::string> names = set->names();
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            listing += ", ";
        listing += "'" + names[i] + "'";
    }
    listing += "]";

    throw ToolNotFoundError("Tool '" + name + "' not found. Available tools: " + listing);
}

std::vector<std::string> ToolRegistry::available_tools() const
{
    return snapshot()->names();
}

bool ToolRegistry::has_tool(const std::string& name) const
{
    return snapshot()->contains(name);
}

size_t ToolRegistry::size() const
{
    return snapshot()->size();
}

} // namespace tools
} // namespace toolbridge
