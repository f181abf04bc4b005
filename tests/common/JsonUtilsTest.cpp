#include "common/JsonUtils.h"
#include <gtest/gtest.h>

using namespace FCE;

TEST(JsonUtilsTest, ParsesValidDocument) {
    auto document = JsonUtils::parseJson(R"({"default_state": "start"})");

    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["default_state"], "start");
}

TEST(JsonUtilsTest, ReportsParseErrors) {
    std::string error;

    EXPECT_FALSE(JsonUtils::parseJson("{broken", &error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(JsonUtils::parseJson("", &error).has_value());
    EXPECT_EQ(error, "Empty JSON string");

    EXPECT_FALSE(JsonUtils::parseJson("[").has_value()) << "Error output is optional";
}

TEST(JsonUtilsTest, HasKeyIgnoresNullValues) {
    json object = {{"present", "x"}, {"missing", nullptr}};

    EXPECT_TRUE(JsonUtils::hasKey(object, "present"));
    EXPECT_FALSE(JsonUtils::hasKey(object, "missing"));
    EXPECT_FALSE(JsonUtils::hasKey(object, "absent"));
    EXPECT_FALSE(JsonUtils::hasKey(json::array(), "present"));
}

TEST(JsonUtilsTest, SerializesAndNamesTypes) {
    json object = {{"a", json::array({"b"})}};

    EXPECT_EQ(JsonUtils::toCompactString(object), R"({"a":["b"]})");
    EXPECT_NE(JsonUtils::toPrettyString(object).find('\n'), std::string::npos);
    EXPECT_EQ(JsonUtils::typeName(object), "object");
    EXPECT_EQ(JsonUtils::typeName(json(nullptr)), "null");
    EXPECT_EQ(JsonUtils::typeName(json("x")), "string");
}
