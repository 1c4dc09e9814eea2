#include <gtest/gtest.h>
#include "gurgeh/engine/argument_validator.hpp"
#include <limits>

using namespace gurgeh;
using namespace gurgeh::engine;
using json = nlohmann::json;

namespace {

json opening_schema() {
    return json::parse(R"({
        "type": "object",
        "properties": {
            "openingName": {"type": "string", "description": "Name of the opening"},
            "limit": {"type": "integer"},
            "ratio": {"type": "number"},
            "flag": {"type": "boolean"}
        },
        "required": ["openingName"]
    })");
}

} // namespace

TEST(ArgumentValidatorTest, AcceptsValidArguments) {
    EXPECT_TRUE(ArgumentValidator::validate(json{{"openingName", "Sicilian"}}, opening_schema()).has_value());
    EXPECT_TRUE(ArgumentValidator::validate(
        json{{"openingName", "French"}, {"limit", 3}, {"ratio", 0.5}, {"flag", true}},
        opening_schema()).has_value());
}

TEST(ArgumentValidatorTest, UndeclaredArgumentsAllowed) {
    EXPECT_TRUE(ArgumentValidator::validate(
        json{{"openingName", "x"}, {"unexpected", 1}}, opening_schema()).has_value());
}

TEST(ArgumentValidatorTest, MissingRequired) {
    auto result = ArgumentValidator::validate(json::object(), opening_schema());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolArgumentParseFailed);
    EXPECT_EQ(result.error().message, "Missing required argument: openingName");
}

TEST(ArgumentValidatorTest, WrongType) {
    auto result = ArgumentValidator::validate(json{{"openingName", 42}}, opening_schema());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message,
              "Argument 'openingName' has wrong type: expected string, got integer");
}

TEST(ArgumentValidatorTest, NonObjectArgumentsRejected) {
    auto result = ArgumentValidator::validate(json::array({1, 2}), opening_schema());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolArgumentParseFailed);
}

TEST(ArgumentValidatorTest, IntegerAcceptsIntegralFloatOnly) {
    EXPECT_TRUE(ArgumentValidator::type_matches(json(5), "integer"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json(5.0), "integer"));
    EXPECT_FALSE(ArgumentValidator::type_matches(json(5.5), "integer"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json(5), "number"));
    EXPECT_FALSE(ArgumentValidator::type_matches(json("5"), "number"));
}

TEST(ArgumentValidatorTest, NonFiniteNeverMatchesInteger) {
    EXPECT_FALSE(ArgumentValidator::type_matches(json(std::numeric_limits<double>::infinity()), "integer"));
    EXPECT_FALSE(ArgumentValidator::type_matches(json(std::numeric_limits<double>::quiet_NaN()), "integer"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json(1e300), "integer"));
}

TEST(ArgumentValidatorTest, MinimumAndMaximumEnforced) {
    auto schema = json::parse(R"({
        "type": "object",
        "properties": {"n": {"type": "integer", "minimum": -5, "maximum": 2147483647}}
    })");

    EXPECT_TRUE(ArgumentValidator::validate(json{{"n", -5}}, schema).has_value());
    EXPECT_TRUE(ArgumentValidator::validate(json{{"n", 2147483647}}, schema).has_value());

    auto low = ArgumentValidator::validate(json{{"n", -6}}, schema);
    ASSERT_FALSE(low.has_value());
    EXPECT_EQ(low.error().code, ErrorCode::ToolArgumentParseFailed);
    EXPECT_EQ(low.error().message, "Argument 'n' is below the minimum of -5");

    auto huge = ArgumentValidator::validate(json{{"n", 1e300}}, schema);
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().message, "Argument 'n' is above the maximum of 2147483647");

    EXPECT_FALSE(ArgumentValidator::validate(json{{"n", 2147483648LL}}, schema).has_value());
}

TEST(ArgumentValidatorTest, SchemaWithoutPropertiesAcceptsAnyObject) {
    EXPECT_TRUE(ArgumentValidator::validate(json{{"a", 1}}, json{{"type", "object"}}).has_value());
}
