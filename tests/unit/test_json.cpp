#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "io/json.hpp"

using namespace combopanel;

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(JsonParse, Scalars)
{
    EXPECT_TRUE(json::parse("null")->is_null());
    EXPECT_TRUE(json::parse(" true ")->as_bool());
    EXPECT_FALSE(json::parse("false")->as_bool(true));
    EXPECT_DOUBLE_EQ(json::parse("-12.5e1")->as_number(), -125.0);
    EXPECT_EQ(json::parse("\"hi\"")->as_string(), "hi");
}

TEST(JsonParse, NestedDocument)
{
    auto doc = json::parse(R"({
        "name": "cpu",
        "weights": [1, 2.5, 3],
        "nested": {"flag": true, "empty": {}},
        "list": []
    })");
    ASSERT_TRUE(doc.has_value());
    ASSERT_TRUE(doc->is_object());

    EXPECT_EQ(doc->get_string("name", ""), "cpu");
    const json::Value* weights = doc->find("weights");
    ASSERT_NE(weights, nullptr);
    ASSERT_EQ(weights->size(), 3u);
    EXPECT_FLOAT_EQ(weights->at(1).as_float(), 2.5f);

    const json::Value* nested = doc->find("nested");
    ASSERT_NE(nested, nullptr);
    EXPECT_TRUE(nested->get_bool("flag", false));
    EXPECT_TRUE(nested->find("empty")->is_object());
    EXPECT_EQ(doc->find("list")->size(), 0u);

    EXPECT_EQ(doc->keys().size(), 4u);
    EXPECT_EQ(doc->keys()[0], "name");
}

TEST(JsonParse, StringEscapes)
{
    auto v = json::parse(R"("a\"b\\c\/d\nA\u00e9")");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->as_string(), "a\"b\\c/d\nA\xC3\xA9");
}

TEST(JsonParse, DuplicateKeysKeepFirst)
{
    auto v = json::parse(R"({"k": 1, "k": 2})");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->get_number("k", 0.0), 1.0);
    EXPECT_EQ(v->keys().size(), 1u);
}

TEST(JsonParse, MalformedInputRejected)
{
    for (const char* text : {"",
                             "{",
                             "[1, 2",
                             "{\"a\" 1}",
                             "{\"a\": }",
                             "[1,]",
                             "\"unterminated",
                             "\"bad \\q escape\"",
                             "tru",
                             "nan",
                             "{} extra",
                             "{'single': 1}"})
    {
        EXPECT_FALSE(json::parse(text).has_value()) << text;
    }
}

TEST(JsonParse, ErrorCarriesOffset)
{
    json::ParseError error;
    EXPECT_FALSE(json::parse("[1, 2] x", &error).has_value());
    EXPECT_EQ(error.offset, 7u);
    EXPECT_EQ(error.message, "trailing characters");
}

TEST(JsonParse, DepthLimited)
{
    std::string deep(200, '[');
    deep += std::string(200, ']');
    json::ParseError error;
    EXPECT_FALSE(json::parse(deep, &error).has_value());
    EXPECT_EQ(error.message, "nesting too deep");

    std::string shallow(10, '[');
    shallow += std::string(10, ']');
    EXPECT_TRUE(json::parse(shallow).has_value());
}

// ─── Value access ────────────────────────────────────────────────────────────

TEST(JsonValue, MistypedReadsUseFallback)
{
    json::Value v("text");
    EXPECT_DOUBLE_EQ(v.as_number(7.0), 7.0);
    EXPECT_TRUE(v.as_bool(true));
    EXPECT_EQ(json::Value(1.0).as_string("none"), "none");
    EXPECT_TRUE(json::Value().at(3).is_null());
    EXPECT_EQ(json::Value(2.0).find("x"), nullptr);
}

TEST(JsonValue, FloatReadOutsideRangeUsesFallback)
{
    EXPECT_FLOAT_EQ(json::Value(1e300).as_float(2.0f), 2.0f);
    EXPECT_FLOAT_EQ(json::Value(-1e300).as_float(2.0f), 2.0f);
    EXPECT_FLOAT_EQ(json::Value(1e30).as_float(2.0f), 1e30f);
}

TEST(JsonValue, SetReplacesExistingKey)
{
    json::Value obj = json::Value::object();
    obj.set("a", 1);
    obj.set("b", true);
    obj.set("a", "changed");

    ASSERT_EQ(obj.keys().size(), 2u);
    EXPECT_EQ(obj.get_string("a", ""), "changed");
    EXPECT_TRUE(obj.get_bool("b", false));
}

// ─── Writing ─────────────────────────────────────────────────────────────────

TEST(JsonWrite, CompactOutput)
{
    json::Value obj = json::Value::object();
    obj.set("name", "panel");
    json::Value& arr = obj.set("values", json::Value::array());
    arr.push_back(1);
    arr.push_back(0.5);
    obj.set("on", false);
    obj.set("none", json::Value());

    EXPECT_EQ(json::write(obj, 0), R"({"name":"panel","values":[1, 0.5],"on":false,"none":null})");
}

TEST(JsonWrite, IndentedOutputReparses)
{
    json::Value obj = json::Value::object();
    obj.set("title", "line\nbreak \"quoted\"");
    json::Value& nested = obj.set("nested", json::Value::object());
    nested.set("x", 0.25);

    std::string text = json::write(obj);
    EXPECT_NE(text.find("\n  \"nested\": {"), std::string::npos);

    auto back = json::parse(text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->get_string("title", ""), "line\nbreak \"quoted\"");
    EXPECT_DOUBLE_EQ(back->find("nested")->get_number("x", 0.0), 0.25);
}

TEST(JsonWrite, NonFiniteNumbersWrittenAsZero)
{
    EXPECT_EQ(json::write(json::Value(std::numeric_limits<double>::infinity())), "0");
}

TEST(JsonEscape, ControlCharacters)
{
    EXPECT_EQ(json::escape("a\tb"), "a\\tb");
    EXPECT_EQ(json::escape(std::string_view("\x01", 1)), "\\u0001");
}
