#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "marshal/literal_parser.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;

TEST(LiteralParserTest, ScalarTest) {
    EXPECT_JSON_EQ(json(42), parse_python_literal("42"));
    EXPECT_JSON_EQ(json(-7), parse_python_literal("-7"));
    EXPECT_JSON_EQ(json(255), parse_python_literal("0xff"));
    EXPECT_JSON_EQ(json(8), parse_python_literal("0o10"));
    EXPECT_JSON_EQ(json(5), parse_python_literal("0b101"));
    EXPECT_JSON_EQ(json(1000000), parse_python_literal("1_000_000"));
    EXPECT_JSON_EQ(json(2.5), parse_python_literal("2.5"));
    EXPECT_JSON_EQ(json(-0.001), parse_python_literal("-1e-3"));
    EXPECT_JSON_EQ(json(true), parse_python_literal("True"));
    EXPECT_JSON_EQ(json(false), parse_python_literal(" False "));
    EXPECT_JSON_EQ(json(nullptr), parse_python_literal("None"));
}

TEST(LiteralParserTest, StringTest) {
    EXPECT_JSON_EQ(json("abc"), parse_python_literal("'abc'"));
    EXPECT_JSON_EQ(json("it's"), parse_python_literal(R"("it's")"));
    EXPECT_JSON_EQ(json("a\nb"), parse_python_literal(R"('a\nb')"));
    EXPECT_JSON_EQ(json("a\\nb"), parse_python_literal(R"(r'a\nb')"));
    EXPECT_JSON_EQ(json("ab"), parse_python_literal("'a' 'b'"));
    EXPECT_JSON_EQ(json("\xc3\xa9"), parse_python_literal(R"('\xe9')"));
    EXPECT_JSON_EQ(json("\xe4\xb8\xad"), parse_python_literal(R"('中')"));
    EXPECT_JSON_EQ(json("x\ny"), parse_python_literal("'''x\ny'''"));
}

TEST(LiteralParserTest, ContainerTest) {
    EXPECT_JSON_EQ(R"([1, 2, 3])"_json, parse_python_literal("[1, 2, 3]"));
    EXPECT_JSON_EQ(R"([1, 2])"_json, parse_python_literal("[1, 2,]"));
    EXPECT_JSON_EQ(json::array(), parse_python_literal("[]"));
    EXPECT_JSON_EQ(R"([[1, "a"], [2, "b"]])"_json, parse_python_literal("[(1, 'a'), (2, 'b')]"));
    EXPECT_JSON_EQ(R"([1])"_json, parse_python_literal("(1,)"));
    EXPECT_JSON_EQ(json(1), parse_python_literal("(1)"));
    EXPECT_JSON_EQ(json::array(), parse_python_literal("()"));
    EXPECT_JSON_EQ(R"({"a": 1, "b": [2, 3]})"_json, parse_python_literal("{'a': 1, 'b': [2, 3]}"));
    EXPECT_JSON_EQ(json::object(), parse_python_literal("{}"));
    EXPECT_JSON_EQ(R"([1, 2])"_json, parse_python_literal("{1, 2, 1}"));
    EXPECT_JSON_EQ(json::array(), parse_python_literal("set()"));
}

TEST(LiteralParserTest, DictKeyTest) {
    // 与 json.dumps 的行为一致
    EXPECT_JSON_EQ(R"({"1": "one", "2.5": "x", "true": 1, "null": 0})"_json,
                   parse_python_literal("{1: 'one', 2.5: 'x', True: 1, None: 0}"));
    EXPECT_THROW(parse_python_literal("{(1, 2): 3}"), marshaling_error);
}

TEST(LiteralParserTest, RejectTest) {
    EXPECT_THROW(parse_python_literal("__import__('os').system('ls')"), marshaling_error);
    EXPECT_THROW(parse_python_literal("1 + 2"), marshaling_error);
    EXPECT_THROW(parse_python_literal("[1, 2"), marshaling_error);
    EXPECT_THROW(parse_python_literal("'abc"), marshaling_error);
    EXPECT_THROW(parse_python_literal("x"), marshaling_error);
    EXPECT_THROW(parse_python_literal("012"), marshaling_error);
    EXPECT_THROW(parse_python_literal("--1"), marshaling_error);
    EXPECT_THROW(parse_python_literal("1j"), marshaling_error);
    EXPECT_THROW(parse_python_literal(""), marshaling_error);
}

TEST(LiteralParserTest, NestingDepthTest) {
    json nested = parse_python_literal(string(200, '[') + string(200, ']'));
    for (int i = 0; i < 199; ++i) nested = nested[0];
    EXPECT_JSON_EQ(json::array(), nested);

    EXPECT_THROW(parse_python_literal(string(201, '(') + "1" + string(201, ')')), marshaling_error);
    // 过深的嵌套不能耗尽栈空间
    EXPECT_THROW(parse_python_literal(string(50000, '[') + string(50000, ']')), marshaling_error);
    EXPECT_THROW(parse_python_literal(string(50000, '{')), marshaling_error);
}

TEST(LiteralParserTest, PythonEqualTest) {
    EXPECT_TRUE(python_equal(json(true), json(1)));
    EXPECT_TRUE(python_equal(json(0), json(false)));
    EXPECT_TRUE(python_equal(json(true), json(1.0)));
    EXPECT_TRUE(python_equal(json(5), json(5.0)));
    EXPECT_TRUE(python_equal(R"([true, {"a": [0]}])"_json, R"([1, {"a": [false]}])"_json));
    EXPECT_FALSE(python_equal(json(true), json(2)));
    EXPECT_FALSE(python_equal(json(true), json("1")));
    EXPECT_FALSE(python_equal(json(nullptr), json(false)));
    EXPECT_FALSE(python_equal(R"([1, 2])"_json, R"([1])"_json));
    EXPECT_FALSE(python_equal(R"({"a": 1})"_json, R"({"b": 1})"_json));
}

TEST(LiteralParserTest, DecodeStringEscapesTest) {
    EXPECT_EQ("hello", decode_string_escapes("hello"));
    EXPECT_EQ("a\tb", decode_string_escapes(R"(a\tb)"));
    EXPECT_EQ("it's", decode_string_escapes("it's"));
    EXPECT_EQ("q\"q", decode_string_escapes(R"(q\"q)"));
    EXPECT_EQ("\\d", decode_string_escapes(R"(\d)"));
    EXPECT_THROW(decode_string_escapes(R"(say "hi")"), marshaling_error);
    EXPECT_THROW(decode_string_escapes("trailing\\"), marshaling_error);
}

TEST(LiteralParserTest, ToLiteralTest) {
    EXPECT_EQ("None", to_literal(json()));
    EXPECT_EQ("True", to_literal(json(true)));
    EXPECT_EQ("1.0", to_literal(json(1.0)));
    EXPECT_EQ("0.5", to_literal(json(0.5)));
    EXPECT_EQ("'a'", to_literal(json("a")));
    EXPECT_EQ("\"it's\"", to_literal(json("it's")));
    EXPECT_EQ("['a', 1, None]", to_literal(R"(["a", 1, null])"_json));
    EXPECT_EQ("{'k': [1, 2]}", to_literal(R"({"k": [1, 2]})"_json));
    EXPECT_EQ("a", to_display(json("a")));
    EXPECT_EQ("5", to_display(json(5)));
}

TEST(LiteralParserTest, RenderThenParseTest) {
    json value = R"({"name": "x\ny", "values": [1, 2.5, null, true], "nested": {"k": "it's"}})"_json;
    EXPECT_JSON_EQ(value, parse_python_literal(to_literal(value)));
}
