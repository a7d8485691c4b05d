#ifndef TOOLBRIDGE_TOOLS_ARGUMENT_EXTRACTOR_HPP
#define TOOLBRIDGE_TOOLS_ARGUMENT_EXTRACTOR_HPP

#include <optional>
#include <string>
#include <toolbridge/tools/schema.hpp>

namespace toolbridge
{
namespace tools
{

// ============================================================================
// Coercion
// ============================================================================

/// For each argument declared as array or object whose value is a string,
/// replace the string with its parsed JSON value when it parses to the
/// declared shape. Anything else is left untouched. Never throws.
json coerce_types(const json& arguments, const ToolSchema& schema);

/// Convert free text to a declared type ("number", "integer", "boolean").
/// Text that does not convert is returned as a string.
json convert_to_type(const std::string& text, const std::string& declared_type);

// ============================================================================
// Natural-language fallback
// ============================================================================

/// Heuristic extraction of one parameter from free text. Looks at the
/// declared type and at keywords in the parameter name and description:
/// - number/integer: first numeric token
/// - boolean: affirmative or negative keywords
/// - string mentioning url/link/website: first http(s) URL
/// - string mentioning location/city/place: first capitalized phrase
/// - string mentioning email: first e-mail address
/// - any other string: the whole input
/// Returns nullopt when nothing applies.
std::optional<json> extract_parameter_value(const std::string& input,
                                            const ParameterSchema& parameter);

/// Build an argument mapping from free text. Every parameter is offered to
/// extract_parameter_value(); if that yields nothing and the schema has
/// exactly one required parameter, the whole input is assigned to it.
json extract_arguments(const std::string& input, const ToolSchema& schema);

} // namespace tools
} // namespace toolbridge

#endif // TOOLBRIDGE_TOOLS_ARGUMENT_EXTRACTOR_HPP
