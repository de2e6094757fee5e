#include <cmath>
#include <limits>
#include "common/value.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(ValueTest, IntegerEqualsFloat) {
    EXPECT_TRUE(values_equal(value(1), value(1.0)));
    EXPECT_TRUE(values_equal(value(-3), value(-3.0)));
    EXPECT_FALSE(values_equal(value(1), value(1.5)));
    EXPECT_TRUE(values_equal(value(5u), value(5)));
    EXPECT_FALSE(values_equal(value(-1), value(numeric_limits<uint64_t>::max())));
}

TEST(ValueTest, BooleanEqualsZeroOrOne) {
    EXPECT_TRUE(values_equal(value(true), value(true)));
    EXPECT_FALSE(values_equal(value(true), value(false)));
    EXPECT_TRUE(values_equal(value(true), value(1)));
    EXPECT_TRUE(values_equal(value(false), value(0)));
    EXPECT_TRUE(values_equal(value(1.0), value(true)));
    EXPECT_FALSE(values_equal(value(true), value(2)));
    EXPECT_FALSE(values_equal(value(true), value("True")));
    EXPECT_TRUE(values_equal(value::parse("[1, 0]"), value::parse("[true, false]")));
}

TEST(ValueTest, ListsCompareInOrder) {
    EXPECT_TRUE(values_equal(value::parse("[1, 2.0, \"a\"]"), value::parse("[1.0, 2, \"a\"]")));
    EXPECT_FALSE(values_equal(value::parse("[1, 2]"), value::parse("[2, 1]")));
    EXPECT_FALSE(values_equal(value::parse("[1, 2]"), value::parse("[1, 2, 3]")));
}

TEST(ValueTest, MappingsIgnoreKeyOrder) {
    EXPECT_TRUE(values_equal(value::parse(R"({"a": 1, "b": [2]})"), value::parse(R"({"b": [2.0], "a": 1})")));
    EXPECT_FALSE(values_equal(value::parse(R"({"a": 1})"), value::parse(R"({"a": 1, "b": 2})")));
    EXPECT_FALSE(values_equal(value::parse(R"({"a": 1})"), value::parse(R"({"b": 1})")));
}

TEST(ValueTest, DisplayString) {
    EXPECT_EQ("abc", display_string("abc"));
    EXPECT_EQ("55", display_string(55));
    EXPECT_EQ("2.5", display_string(2.5));
    EXPECT_EQ("3.0", display_string(3.0));
    EXPECT_EQ("True", display_string(true));
    EXPECT_EQ("False", display_string(false));
    EXPECT_EQ("None", display_string(nullptr));
    EXPECT_EQ("[1, 'a', True]", display_string(value::parse(R"([1, "a", true])")));
    EXPECT_EQ("{'nums': [1, 2, 3, 4], 'target': 5}", display_string(value::parse(R"({"nums": [1, 2, 3, 4], "target": 5})")));
}

TEST(ValueTest, MappingDisplayKeepsInsertionOrder) {
    EXPECT_EQ("{'z': 1, 'a': 2}", display_string(value::parse(R"({"z": 1, "a": 2})")));
}

TEST(ValueTest, PythonStringLiteral) {
    EXPECT_EQ("'abc'", python_string_literal("abc"));
    EXPECT_EQ("\"it's\"", python_string_literal("it's"));
    EXPECT_EQ("'say \"hi\" it\\'s'", python_string_literal("say \"hi\" it's"));
    EXPECT_EQ("'a\\nb\\\\c'", python_string_literal("a\nb\\c"));
    EXPECT_EQ("'\\x00'", python_string_literal(string(1, '\0')));
}

TEST(ValueTest, PythonLiteral) {
    EXPECT_EQ("'hello world'", python_literal("hello world"));
    EXPECT_EQ("None", python_literal(nullptr));
    EXPECT_EQ("[1, 2.5, 'x']", python_literal(value::parse(R"([1, 2.5, "x"])")));
    EXPECT_EQ("{'nums': [2, 7], 'target': 9}", python_literal(value::parse(R"({"nums": [2, 7], "target": 9})")));
    EXPECT_EQ("float('inf')", python_literal(numeric_limits<double>::infinity()));
    EXPECT_EQ("float('-inf')", python_literal(-numeric_limits<double>::infinity()));
    EXPECT_EQ("float('nan')", python_literal(numeric_limits<double>::quiet_NaN()));
}

TEST(ValueTest, FormatFloat) {
    EXPECT_EQ("0.1", format_float(0.1));
    EXPECT_EQ("100.0", format_float(100));
    EXPECT_EQ("-2.0", format_float(-2));
    EXPECT_EQ("inf", format_float(numeric_limits<double>::infinity()));
    EXPECT_EQ("nan", format_float(numeric_limits<double>::quiet_NaN()));
}

TEST(ValueTest, NumericValue) {
    EXPECT_EQ(55.0, numeric_value(55));
    EXPECT_EQ(2.5, numeric_value(2.5));
    EXPECT_EQ(55.0, numeric_value(" 55 "));
    EXPECT_EQ(-1.5, numeric_value("-1.5"));
    EXPECT_FALSE(numeric_value("55abc").has_value());
    EXPECT_FALSE(numeric_value("").has_value());
    EXPECT_EQ(1.0, numeric_value(true));
    EXPECT_EQ(0.0, numeric_value(false));
    EXPECT_FALSE(numeric_value(nullptr).has_value());
    EXPECT_FALSE(numeric_value(value::parse("[1]")).has_value());
}
