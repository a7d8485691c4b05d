#ifndef TOOLBRIDGE_TOOLS_SCHEMA_HPP
#define TOOLBRIDGE_TOOLS_SCHEMA_HPP

#include <memory>
#include <optional>
#include <string>
#include <toolbridge/types.hpp>
#include <vector>

namespace toolbridge
{
namespace tools
{

// ============================================================================
// Runtime parameter types
// ============================================================================

/// Runtime type a declared JSON Schema type resolves to.
/// Sequence carries its element type; everything unsupported is Any.
struct ParamType
{
    enum class Kind
    {
        String,
        Integer,
        Float,
        Boolean,
        Sequence,
        Mapping,
        Any,
    };

    Kind kind = Kind::Any;
    std::shared_ptr<const ParamType> element; // Sequence only

    static ParamType of(Kind kind)
    {
        ParamType type;
        type.kind = kind;
        return type;
    }

    static ParamType sequence_of(ParamType element_type)
    {
        ParamType type;
        type.kind = Kind::Sequence;
        type.element = std::make_shared<const ParamType>(std::move(element_type));
        return type;
    }

    // e.g. "string", "float", "sequence<integer>", "mapping", "any"
    std::string to_string() const;
};

bool operator==(const ParamType& lhs, const ParamType& rhs);
inline bool operator!=(const ParamType& lhs, const ParamType& rhs)
{
    return !(lhs == rhs);
}

/// Map a property schema to its runtime type:
/// string -> String, integer -> Integer, number -> Float, boolean -> Boolean,
/// array -> Sequence(resolve(items)) (Any when items is absent or empty),
/// object -> Mapping, anything else -> Any. Never fails.
ParamType resolve_type(const json& property_schema);

// ============================================================================
// Tool schemas
// ============================================================================

struct ParameterSchema
{
    std::string name;
    std::string type = "string"; // Declared type as advertised
    std::string description;
    bool required = false;
    std::optional<json> default_value;
    std::optional<std::vector<json>> allowed_values; // `enum`, when declared
    ParamType resolved;
    json raw; // Property schema as received
};

struct ToolSchema
{
    std::string name;
    std::string description;
    std::vector<ParameterSchema> parameters; // Server order
    json input_schema;                       // As received (inputSchema / input_schema)

    bool has_parameters() const
    {
        return !parameters.empty();
    }

    const ParameterSchema* find_parameter(const std::string& parameter) const;
    std::vector<std::string> required_parameters() const;

    /// Build from a tools/list descriptor. Accepts both `inputSchema` and
    /// `input_schema`. Throws MalformedResponseError if `name` is missing.
    static ToolSchema from_json(const json& descriptor);
};

// ============================================================================
// Validation
// ============================================================================

/// Check `arguments` against the schema and return the validated mapping:
/// - required parameters must be present (a declared default satisfies them),
///   absent optional parameters receive their default when one is declared;
/// - a parameter with allowed values accepts only those literal values;
/// - other values are converted to the resolved runtime type (numeric
///   strings to numbers, integral floats to integers, boolean words to
///   booleans, sequences element-wise);
/// - undeclared keys are dropped.
/// Throws ValidationError describing every violation found.
json validate_arguments(const json& arguments, const ToolSchema& schema);

} // namespace tools
} // namespace toolbridge

#endif // TOOLBRIDGE_TOOLS_SCHEMA_HPP
