#include "AxonExceptions.h"
#include "JsonValue.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

TEST(JsonValueTest, ParsesNestedDocument) {
    const JsonValue doc = parseJsonText(R"( {"a": [1, -2.5e1, true, null], "b": {"c": "x\ty\u00e9"}} )");
    ASSERT_TRUE(doc.isObject());

    const JsonValue* a = doc.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->arrayValue.size(), 4u);
    EXPECT_DOUBLE_EQ(a->arrayValue[1].numberValue, -25.0);
    EXPECT_EQ(a->arrayValue[2].type, JsonValue::Type::Bool);
    EXPECT_TRUE(a->arrayValue[2].booleanValue);
    EXPECT_EQ(a->arrayValue[3].type, JsonValue::Type::Null);

    EXPECT_EQ(doc.find("b")->find("c")->stringValue, "x\ty\xC3\xA9");
    EXPECT_EQ(doc.find("missing"), nullptr);
    EXPECT_EQ(a->find("a"), nullptr);
}

TEST(JsonValueTest, RejectsMalformedText) {
    for (const std::string text : {"", "{", "[1,]", "{\"a\" 1}", "{a: 1}", "01x", "1.", "-", "tru",
                                   "\"open", "\"bad \\q\"", "[1] [2]", "nan", "+1", "01", "-01", ".5",
                                   "[.5]", "1e", "1e+", "-.5", "\"\\uD83D\"", "\"\\uDE00\"",
                                   "\"\\uD83Dx\"", "\"\\uD83D\\u0041\""}) {
        EXPECT_THROW(parseJsonText(text), Axon::SerializationException) << text;
    }
    EXPECT_THROW(parseJsonText(std::string(300, '[') + std::string(300, ']')), Axon::SerializationException);
}

TEST(JsonValueTest, AcceptsStrictNumberForms) {
    const JsonValue doc = parseJsonText("[0, -0.5, 10, 1e3, 2E-2, 3.25e+1]");
    ASSERT_EQ(doc.arrayValue.size(), 6u);
    EXPECT_DOUBLE_EQ(doc.arrayValue[1].numberValue, -0.5);
    EXPECT_DOUBLE_EQ(doc.arrayValue[3].numberValue, 1000.0);
    EXPECT_DOUBLE_EQ(doc.arrayValue[4].numberValue, 0.02);
    EXPECT_DOUBLE_EQ(doc.arrayValue[5].numberValue, 32.5);
}

TEST(JsonValueTest, JoinsSurrogatePairs) {
    EXPECT_EQ(parseJsonText(R"("\uD83D\uDE00")").stringValue, "\xF0\x9F\x98\x80");
    EXPECT_EQ(parseJsonText(R"("a\u20ACb")").stringValue, "a\xE2\x82\xAC" "b");
}

TEST(JsonValueTest, EscapesControlCharacters) {
    const std::string raw = std::string("id") + '\x01' + '\x1f' + "\n";
    const std::string text = JsonValue::string(raw).dump();
    EXPECT_EQ(text, R"("id\u0001\u001f\n")");
    EXPECT_EQ(parseJsonText(text).stringValue, raw);
}

TEST(JsonValueTest, NumbersSurviveDumpAndParse) {
    const double values[] = {0.1, 1.0 / 3.0, -2.2250738585072014e-308, 6.02214076e23};
    for (double v : values) {
        const JsonValue back = parseJsonText(JsonValue::number(v).dump());
        EXPECT_EQ(back.numberValue, v);
    }
    EXPECT_EQ(JsonValue::number(std::nan("")).dump(), "null");
}

TEST(JsonValueTest, DumpsCompactAndIndented) {
    JsonValue doc = JsonValue::object();
    doc.set("name", JsonValue::string("a\"b"));
    doc.set("values", JsonValue::numberArray({1.0, 2.0}));

    EXPECT_EQ(doc.dump(), R"({"name":"a\"b","values":[1,2]})");
    EXPECT_EQ(doc.dump(2), "{\n  \"name\": \"a\\\"b\",\n  \"values\": [1, 2]\n}");
}

TEST(JsonValueTest, NumberVectorRequiresFiniteNumbers) {
    EXPECT_EQ(jsonToNumberVector(parseJsonText("[1, 2.5]"), "v"), (std::vector<double>{1.0, 2.5}));
    EXPECT_THROW(jsonToNumberVector(parseJsonText("[1, \"2\"]"), "v"), Axon::SerializationException);
    EXPECT_THROW(jsonToNumberVector(parseJsonText("{}"), "v"), Axon::SerializationException);
}
