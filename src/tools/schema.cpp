#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <toolbridge/errors.hpp>
#include <toolbridge/tools/schema.hpp>

namespace toolbridge
{
namespace tools
{

namespace
{
std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::optional<std::int64_t> parse_integer(const std::string& text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;
    try
    {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size())
            return std::nullopt;
        return static_cast<std::int64_t>(parsed);
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

std::optional<double> parse_float(const std::string& text)
{
    std::string value = trim(text);
    if (value.empty())
        return std::nullopt;
    try
    {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
            return std::nullopt;
        return parsed;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

std::optional<bool> parse_boolean(const std::string& text)
{
    std::string value = lowercase(trim(text));
    if (value == "true" || value == "yes" || value == "on" || value == "1")
        return true;
    if (value == "false" || value == "no" || value == "off" || value == "0")
        return false;
    return std::nullopt;
}

std::string type_name_of(const json& value)
{
    if (value.is_number_integer())
        return "integer";
    if (value.is_number_float())
        return "number";
    return value.type_name();
}

[[noreturn]] void reject(const std::string& path, const std::string& expected, const json& value)
{
    throw ValidationError("'" + path + "' expected " + expected + ", got " + type_name_of(value) +
                              " " + value.dump(),
                          path);
}

json conform(const json& value, const ParamType& type, const std::string& path)
{
    switch (type.kind)
    {
    case ParamType::Kind::String:
        if (value.is_string())
            return value;
        reject(path, "string", value);

    case ParamType::Kind::Integer:
        if (value.is_number_integer())
            return value;
        if (value.is_number_float())
        {
            double d = value.get<double>();
            if (std::floor(d) == d && std::fabs(d) < 9.0e15)
                return static_cast<std::int64_t>(d);
        }
        if (value.is_string())
            if (auto parsed = parse_integer(value.get<std::string>()))
                return *parsed;
        reject(path, "integer", value);

    case ParamType::Kind::Float:
        if (value.is_number())
            return value.get<double>();
        if (value.is_string())
            if (auto parsed = parse_float(value.get<std::string>()))
                return *parsed;
        reject(path, "number", value);

    case ParamType::Kind::Boolean:
        if (value.is_boolean())
            return value;
        if (value.is_number_integer() && (value.get<std::int64_t>() == 0 || value.get<std::int64_t>() == 1))
            return value.get<std::int64_t>() == 1;
        if (value.is_string())
            if (auto parsed = parse_boolean(value.get<std::string>()))
                return *parsed;
        reject(path, "boolean", value);

    case ParamType::Kind::Sequence:
    {
        if (!value.is_array())
            reject(path, "array", value);

        json out = json::array();
        const ParamType& element = type.element ? *type.element : ParamType::of(ParamType::Kind::Any);
        for (size_t i = 0; i < value.size(); ++i)
            out.push_back(conform(value[i], element, path + "[" + std::to_string(i) + "]"));
        return out;
    }

    case ParamType::Kind::Mapping:
        if (value.is_object())
            return value;
        reject(path, "object", value);

    case ParamType::Kind::Any:
        return value;
    }

    return value;
}

std::string render_allowed(const std::vector<json>& allowed)
{
    std::string out = "[";
    for (size_t i = 0; i < allowed.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += allowed[i].dump();
    }
    return out + "]";
}
} // namespace

// ============================================================================
// ParamType
// ============================================================================

std::string ParamType::to_string() const
{
    switch (kind)
    {
    case Kind::String:
        return "string";
    case Kind::Integer:
        return "integer";
    case Kind::Float:
        return "float";
    case Kind::Boolean:
        return "boolean";
    case Kind::Sequence:
        return "sequence<" + (element ? element->to_string() : std::string("any")) + ">";
    case Kind::Mapping:
        return "mapping";
    case Kind::Any:
        return "any";
    }
    return "any";
}

bool operator==(const ParamType& lhs, const ParamType& rhs)
{
    if (lhs.kind != rhs.kind)
        return false;
    if (lhs.kind != ParamType::Kind::Sequence)
        return true;

    ParamType any = ParamType::of(ParamType::Kind::Any);
    const ParamType& l = lhs.element ? *lhs.element : any;
    const ParamType& r = rhs.element ? *rhs.element : any;
    return l == r;
}

ParamType resolve_type(const json& property_schema)
{
    if (!property_schema.is_object())
        return ParamType::of(ParamType::Kind::Any);

    auto type_it = property_schema.find("type");
    if (type_it == property_schema.end())
        return ParamType::of(ParamType::Kind::String);
    if (!type_it->is_string())
        return ParamType::of(ParamType::Kind::Any);

    const std::string type = type_it->get<std::string>();
    if (type == "string")
        return ParamType::of(ParamType::Kind::String);
    if (type == "integer")
        return ParamType::of(ParamType::Kind::Integer);
    if (type == "number")
        return ParamType::of(ParamType::Kind::Float);
    if (type == "boolean")
        return ParamType::of(ParamType::Kind::Boolean);
    if (type == "object")
        return ParamType::of(ParamType::Kind::Mapping);
    if (type == "array")
    {
        auto items = property_schema.find("items");
        if (items != property_schema.end() && items->is_object() && !items->empty())
            return ParamType::sequence_of(resolve_type(*items));
        return ParamType::sequence_of(ParamType::of(ParamType::Kind::Any));
    }

    return ParamType::of(ParamType::Kind::Any);
}

// ============================================================================
// ToolSchema
// ============================================================================

const ParameterSchema* ToolSchema::find_parameter(const std::string& parameter) const
{
    for (const auto& p : parameters)
        if (p.name == parameter)
            return &p;
    return nullptr;
}

std::vector<std::string> ToolSchema::required_parameters() const
{
    std::vector<std::string> names;
    for (const auto& p : parameters)
        if (p.required)
            names.push_back(p.name);
    return names;
}

ToolSchema ToolSchema::from_json(const json& descriptor)
{
    if (!descriptor.is_object())
        throw MalformedResponseError("Tool descriptor is not an object", descriptor);

    auto name_it = descriptor.find("name");
    if (name_it == descriptor.end() || !name_it->is_string() || name_it->get<std::string>().empty())
        throw MalformedResponseError("Tool descriptor has no name", descriptor);

    ToolSchema schema;
    schema.name = name_it->get<std::string>();

    auto desc_it = descriptor.find("description");
    if (desc_it != descriptor.end() && desc_it->is_string())
        schema.description = desc_it->get<std::string>();

    if (descriptor.contains("inputSchema"))
        schema.input_schema = descriptor["inputSchema"];
    else if (descriptor.contains("input_schema"))
        schema.input_schema = descriptor["input_schema"];
    else
        schema.input_schema = json::object();

    if (!schema.input_schema.is_object())
        return schema;

    std::vector<std::string> required_list;
    auto required_it = schema.input_schema.find("required");
    if (required_it != schema.input_schema.end() && required_it->is_array())
        for (const auto& entry : *required_it)
            if (entry.is_string())
                required_list.push_back(entry.get<std::string>());

    auto props_it = schema.input_schema.find("properties");
    if (props_it == schema.input_schema.end() || !props_it->is_object())
        return schema;

    for (auto it = props_it->begin(); it != props_it->end(); ++it)
    {
        const json& prop = it.value();

        ParameterSchema param;
        param.name = it.key();
        param.raw = prop;
        param.resolved = resolve_type(prop);

        if (prop.is_object())
        {
            auto type_it = prop.find("type");
            if (type_it != prop.end())
                param.type = type_it->is_string() ? type_it->get<std::string>() : type_it->dump();

            auto pdesc_it = prop.find("description");
            if (pdesc_it != prop.end() && pdesc_it->is_string())
                param.description = pdesc_it->get<std::string>();

            auto default_it = prop.find("default");
            if (default_it != prop.end() && !default_it->is_null())
                param.default_value = *default_it;

            auto enum_it = prop.find("enum");
            if (enum_it != prop.end() && enum_it->is_array() && !enum_it->empty())
                param.allowed_values = std::vector<json>(enum_it->begin(), enum_it->end());

            auto flag_it = prop.find("required");
            if (flag_it != prop.end() && flag_it->is_boolean() && flag_it->get<bool>())
                param.required = true;
        }

        if (std::find(required_list.begin(), required_list.end(), param.name) !=
            required_list.end())
            param.required = true;

        schema.parameters.push_back(std::move(param));
    }

    return schema;
}

// ============================================================================
// Validation
// ============================================================================

json validate_arguments(const json& arguments, const ToolSchema& schema)
{
    if (!arguments.is_object())
        throw ValidationError("Arguments for " + schema.name + " must be an object, got " +
                              type_name_of(arguments));

    json validated = json::object();
    std::string problems;
    std::string first_parameter;

    auto record = [&](const std::string& message, const std::string& parameter)
    {
        if (!problems.empty())
            problems += "; ";
        problems += message;
        if (first_parameter.empty())
            first_parameter = parameter;
    };

    for (const auto& param : schema.parameters)
    {
        auto it = arguments.find(param.name);
        if (it == arguments.end() || it->is_null())
        {
            if (param.default_value)
                validated[param.name] = *param.default_value;
            else if (param.required)
                record("missing required parameter '" + param.name + "'", param.name);
            continue;
        }

        if (param.allowed_values)
        {
            const auto& allowed = *param.allowed_values;
            if (std::find(allowed.begin(), allowed.end(), *it) == allowed.end())
            {
                record("'" + param.name + "' must be one of " + render_allowed(allowed) +
                           ", got " + it->dump(),
                       param.name);
                continue;
            }
            validated[param.name] = *it;
            continue;
        }

        try
        {
            validated[param.name] = conform(*it, param.resolved, param.name);
        }
        catch (const ValidationError& e)
        {
            record(e.what(), param.name);
        }
    }

    if (!problems.empty())
        throw ValidationError(problems, first_parameter);

    return validated;
}

} // namespace tools
} // namespace toolbridge
