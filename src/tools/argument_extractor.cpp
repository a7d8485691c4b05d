#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <regex>
#include <stdexcept>
#include <toolbridge/tools/argument_extractor.hpp>

namespace toolbridge
{
namespace tools
{

namespace
{
const std::regex& number_pattern()
{
    static const std::regex pattern(R"(-?\d+\.?\d*)");
    return pattern;
}

const std::regex& url_pattern()
{
    static const std::regex pattern(R"(https?://[^\s]+)");
    return pattern;
}

const std::regex& phrase_pattern()
{
    static const std::regex pattern(R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*\b)");
    return pattern;
}

const std::regex& email_pattern()
{
    static const std::regex pattern(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)");
    return pattern;
}

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool mentions_any(const std::string& haystack, std::initializer_list<const char*> keywords)
{
    for (const char* keyword : keywords)
        if (haystack.find(keyword) != std::string::npos)
            return true;
    return false;
}

std::optional<std::string> first_match(const std::string& input, const std::regex& pattern)
{
    std::smatch match;
    if (std::regex_search(input, match, pattern))
        return match.str();
    return std::nullopt;
}

bool parses_as(const json& value, const std::string& declared_type)
{
    if (declared_type == "array")
        return value.is_array();
    return value.is_object();
}
} // namespace

json coerce_types(const json& arguments, const ToolSchema& schema)
{
    if (!arguments.is_object())
        return arguments;

    json coerced = arguments;
    for (auto it = coerced.begin(); it != coerced.end(); ++it)
    {
        const ParameterSchema* param = schema.find_parameter(it.key());
        if (!param || !it.value().is_string())
            continue;
        if (param->type != "array" && param->type != "object")
            continue;

        json parsed = json::parse(it.value().get<std::string>(), nullptr,
                                  /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && parses_as(parsed, param->type))
            it.value() = std::move(parsed);
    }
    return coerced;
}

json convert_to_type(const std::string& text, const std::string& declared_type)
{
    if (declared_type == "number")
    {
        try
        {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed == text.size())
                return value;
        }
        catch (const std::logic_error&)
        {
        }
        return text;
    }

    if (declared_type == "integer")
    {
        try
        {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed);
            if (consumed == text.size())
                return static_cast<std::int64_t>(value);
        }
        catch (const std::logic_error&)
        {
        }
        return text;
    }

    if (declared_type == "boolean")
    {
        std::string word = lowercase(text);
        return word == "true" || word == "1" || word == "yes" || word == "on";
    }

    return text;
}

std::optional<json> extract_parameter_value(const std::string& input,
                                            const ParameterSchema& parameter)
{
    const std::string& type = parameter.type;
    const std::string keywords = lowercase(parameter.name + " " + parameter.description);

    if (type == "number" || type == "integer")
    {
        auto token = first_match(input, number_pattern());
        if (!token)
            return std::nullopt;
        // "3." and "3.0" are whole numbers; "3.7" stays text for validation to reject
        std::string cleaned = *token;
        size_t dot = cleaned.find('.');
        if (type == "integer" && dot != std::string::npos &&
            cleaned.find_first_not_of('0', dot + 1) == std::string::npos)
            cleaned = cleaned.substr(0, dot);
        return convert_to_type(cleaned, type);
    }

    if (type == "string")
    {
        if (mentions_any(keywords, {"url", "link", "website"}))
        {
            if (auto url = first_match(input, url_pattern()))
                return json(*url);
        }
        else if (mentions_any(keywords, {"location", "city", "place"}))
        {
            if (auto phrase = first_match(input, phrase_pattern()))
                return json(*phrase);
        }
        else if (mentions_any(keywords, {"email"}))
        {
            if (auto address = first_match(input, email_pattern()))
                return json(*address);
        }
        return json(input);
    }

    if (type == "boolean")
    {
        std::string text = lowercase(input);
        if (mentions_any(text, {"true", "yes", "on", "enable"}))
            return json(true);
        if (mentions_any(text, {"false", "no", "off", "disable"}))
            return json(false);
    }

    return std::nullopt;
}

json extract_arguments(const std::string& input, const ToolSchema& schema)
{
    json extracted = json::object();
    for (const auto& param : schema.parameters)
    {
        if (auto value = extract_parameter_value(input, param))
            extracted[param.name] = std::move(*value);
    }

    if (extracted.empty())
    {
        std::vector<std::string> required = schema.required_parameters();
        if (required.size() == 1)
        {
            const ParameterSchema* param = schema.find_parameter(required.front());
            extracted[param->name] = convert_to_type(input, param->type);
        }
    }

    return extracted;
}

} // namespace tools
} // namespace toolbridge
