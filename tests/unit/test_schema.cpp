#include <gtest/gtest.h>
#include <toolbridge/errors.hpp>
#include <toolbridge/tools/schema.hpp>

using namespace toolbridge;
using namespace toolbridge::tools;

namespace
{
ToolSchema weather_schema()
{
    return ToolSchema::from_json(json::parse(R"({
        "name": "get_forecast",
        "description": "Get the weather forecast",
        "inputSchema": {
            "type": "object",
            "properties": {
                "location": {"type": "string", "description": "City name"},
                "days": {"type": "integer", "description": "Number of days", "default": 3},
                "units": {"type": "string", "enum": ["metric", "imperial"]},
                "detailed": {"type": "boolean"}
            },
            "required": ["location"]
        }
    })"));
}
} // namespace

// ============================================================================
// Type resolution
// ============================================================================

TEST(ResolveTypeTest, ScalarTypes)
{
    EXPECT_EQ(resolve_type(json{{"type", "string"}}).kind, ParamType::Kind::String);
    EXPECT_EQ(resolve_type(json{{"type", "integer"}}).kind, ParamType::Kind::Integer);
    EXPECT_EQ(resolve_type(json{{"type", "number"}}).kind, ParamType::Kind::Float);
    EXPECT_EQ(resolve_type(json{{"type", "boolean"}}).kind, ParamType::Kind::Boolean);
    EXPECT_EQ(resolve_type(json{{"type", "object"}}).kind, ParamType::Kind::Mapping);
}

TEST(ResolveTypeTest, MissingTypeMeansString)
{
    EXPECT_EQ(resolve_type(json{{"description", "anything"}}).kind, ParamType::Kind::String);
}

TEST(ResolveTypeTest, UnsupportedTypesDegradeToAny)
{
    EXPECT_EQ(resolve_type(json{{"type", "null"}}).kind, ParamType::Kind::Any);
    EXPECT_EQ(resolve_type(json{{"type", "date"}}).kind, ParamType::Kind::Any);
    EXPECT_EQ(resolve_type(json{{"type", {"string", "null"}}}).kind, ParamType::Kind::Any);
    EXPECT_EQ(resolve_type(json("string")).kind, ParamType::Kind::Any);
}

TEST(ResolveTypeTest, ArraysResolveElementsRecursively)
{
    ParamType nested = resolve_type(json::parse(
        R"({"type": "array", "items": {"type": "array", "items": {"type": "integer"}}})"));

    EXPECT_EQ(nested, ParamType::sequence_of(
                          ParamType::sequence_of(ParamType::of(ParamType::Kind::Integer))));
    EXPECT_EQ(nested.to_string(), "sequence<sequence<integer>>");
}

TEST(ResolveTypeTest, ArrayWithoutItemsHoldsAny)
{
    EXPECT_EQ(resolve_type(json{{"type", "array"}}).to_string(), "sequence<any>");
    EXPECT_EQ(resolve_type(json{{"type", "array"}, {"items", json::object()}}).to_string(),
              "sequence<any>");
}

// ============================================================================
// Parsing descriptors
// ============================================================================

TEST(ToolSchemaTest, ParsesParametersInServerOrder)
{
    ToolSchema schema = weather_schema();

    EXPECT_EQ(schema.name, "get_forecast");
    EXPECT_EQ(schema.description, "Get the weather forecast");
    ASSERT_EQ(schema.parameters.size(), 4u);
    EXPECT_EQ(schema.parameters[0].name, "location");
    EXPECT_EQ(schema.parameters[1].name, "days");
    EXPECT_EQ(schema.parameters[2].name, "units");
    EXPECT_EQ(schema.parameters[3].name, "detailed");

    const ParameterSchema* days = schema.find_parameter("days");
    ASSERT_NE(days, nullptr);
    EXPECT_EQ(days->type, "integer");
    EXPECT_FALSE(days->required);
    ASSERT_TRUE(days->default_value.has_value());
    EXPECT_EQ(*days->default_value, 3);

    const ParameterSchema* units = schema.find_parameter("units");
    ASSERT_NE(units, nullptr);
    ASSERT_TRUE(units->allowed_values.has_value());
    EXPECT_EQ(units->allowed_values->size(), 2u);

    EXPECT_EQ(schema.required_parameters(), std::vector<std::string>{"location"});
}

TEST(ToolSchemaTest, AcceptsSnakeCaseSchemaField)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "echo",
        "input_schema": {"properties": {"text": {"type": "string"}}, "required": ["text"]}
    })"));

    ASSERT_EQ(schema.parameters.size(), 1u);
    EXPECT_TRUE(schema.parameters[0].required);
}

TEST(ToolSchemaTest, PerPropertyRequiredFlag)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "get_weather",
        "inputSchema": {"properties": {"location": {"type": "string", "required": true}}}
    })"));

    EXPECT_EQ(schema.required_parameters(), std::vector<std::string>{"location"});
}

TEST(ToolSchemaTest, NoSchemaMeansNoParameters)
{
    ToolSchema schema = ToolSchema::from_json(json{{"name", "list_alerts"}});
    EXPECT_FALSE(schema.has_parameters());
    EXPECT_TRUE(schema.description.empty());
}

TEST(ToolSchemaTest, MissingNameIsMalformed)
{
    EXPECT_THROW(ToolSchema::from_json(json{{"description", "anonymous"}}),
                 MalformedResponseError);
    EXPECT_THROW(ToolSchema::from_json(json{{"name", ""}}), MalformedResponseError);
    EXPECT_THROW(ToolSchema::from_json(json("get_weather")), MalformedResponseError);
}

// ============================================================================
// Validation
// ============================================================================

TEST(ValidateArgumentsTest, AppliesDefaults)
{
    json validated = validate_arguments(json{{"location", "Austin"}}, weather_schema());

    EXPECT_EQ(validated["location"], "Austin");
    EXPECT_EQ(validated["days"], 3);
    EXPECT_FALSE(validated.contains("units"));
}

TEST(ValidateArgumentsTest, MissingRequiredParameter)
{
    try
    {
        validate_arguments(json{{"days", 2}}, weather_schema());
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        EXPECT_EQ(e.parameter(), "location");
        EXPECT_NE(std::string(e.what()).find("location"), std::string::npos);
    }
}

TEST(ValidateArgumentsTest, EnumViolationRejected)
{
    EXPECT_THROW(validate_arguments(json{{"location", "Austin"}, {"units", "kelvin"}},
                                    weather_schema()),
                 ValidationError);

    json ok = validate_arguments(json{{"location", "Austin"}, {"units", "metric"}},
                                 weather_schema());
    EXPECT_EQ(ok["units"], "metric");
}

TEST(ValidateArgumentsTest, EnumComparesLiterally)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "set_level",
        "inputSchema": {"properties": {"level": {"type": "integer", "enum": [1, 2, 3]}},
                        "required": ["level"]}
    })"));

    EXPECT_NO_THROW(validate_arguments(json{{"level", 2}}, schema));
    EXPECT_THROW(validate_arguments(json{{"level", "2"}}, schema), ValidationError);
    EXPECT_THROW(validate_arguments(json{{"level", 4}}, schema), ValidationError);
}

TEST(ValidateArgumentsTest, ConvertsLooseScalars)
{
    json validated = validate_arguments(
        json{{"location", "Austin"}, {"days", "5"}, {"detailed", "yes"}}, weather_schema());

    EXPECT_EQ(validated["days"], 5);
    EXPECT_TRUE(validated["days"].is_number_integer());
    EXPECT_EQ(validated["detailed"], true);
}

TEST(ValidateArgumentsTest, NumberBecomesFloat)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "convert",
        "inputSchema": {"properties": {"celsius": {"type": "number"}}, "required": ["celsius"]}
    })"));

    json from_int = validate_arguments(json{{"celsius", 25}}, schema);
    EXPECT_TRUE(from_int["celsius"].is_number_float());
    EXPECT_DOUBLE_EQ(from_int["celsius"].get<double>(), 25.0);

    json from_text = validate_arguments(json{{"celsius", "-3.5"}}, schema);
    EXPECT_DOUBLE_EQ(from_text["celsius"].get<double>(), -3.5);

    EXPECT_THROW(validate_arguments(json{{"celsius", "warm"}}, schema), ValidationError);
}

TEST(ValidateArgumentsTest, SequencesCheckedElementWise)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "sum",
        "inputSchema": {"properties": {"values": {"type": "array", "items": {"type": "integer"}}},
                        "required": ["values"]}
    })"));

    json validated = validate_arguments(json{{"values", {1, "2", 3.0}}}, schema);
    EXPECT_EQ(validated["values"], json({1, 2, 3}));

    try
    {
        validate_arguments(json{{"values", {1, "two"}}}, schema);
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        EXPECT_NE(std::string(e.what()).find("values[1]"), std::string::npos);
    }

    EXPECT_THROW(validate_arguments(json{{"values", "1,2"}}, schema), ValidationError);
}

TEST(ValidateArgumentsTest, DropsUndeclaredKeys)
{
    json validated =
        validate_arguments(json{{"location", "Austin"}, {"verbose", true}}, weather_schema());
    EXPECT_FALSE(validated.contains("verbose"));
}

TEST(ValidateArgumentsTest, NullCountsAsAbsent)
{
    EXPECT_THROW(validate_arguments(json{{"location", nullptr}}, weather_schema()),
                 ValidationError);
}

TEST(ValidateArgumentsTest, ReportsEveryProblem)
{
    try
    {
        validate_arguments(json{{"units", "kelvin"}, {"days", "soon"}}, weather_schema());
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError& e)
    {
        std::string message = e.what();
        EXPECT_NE(message.find("location"), std::string::npos);
        EXPECT_NE(message.find("days"), std::string::npos);
        EXPECT_NE(message.find("kelvin"), std::string::npos);
    }
}

TEST(ValidateArgumentsTest, AnyAcceptsEverything)
{
    ToolSchema schema = ToolSchema::from_json(json::parse(R"({
        "name": "store",
        "inputSchema": {"properties": {"payload": {"type": "null"}}}
    })"));

    json validated = validate_arguments(json{{"payload", {{"nested", true}}}}, schema);
    EXPECT_EQ(validated["payload"]["nested"], true);
}
