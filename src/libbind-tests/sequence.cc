#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "envbind/bind/bind.hh"
#include "envbind/bind/tests/mock-environment.hh"
#include "envbind/bind/tests/records.hh"

namespace envbind {

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using testing::MockEnvironment;
using testing::Struct;
using testing::SubStruct;

/* ----------------------------------------------------------------------------
 * sequences of scalars
 * --------------------------------------------------------------------------*/

TEST(sequence, underscoreForm)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY__0", "1"}, {"TEST_PREFIX_ARRAY__1", "2"}, {"TEST_PREFIX_ARRAY__2", "3"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1, 2, 3}));
}

TEST(sequence, colonForm)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY_STRINGS:0", "a"}, {"TEST_PREFIX_ARRAY_STRINGS:1", "b c"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.arrayStrings, (std::vector<std::string>{"a", "b c"}));
    ASSERT_TRUE(s.array.empty());
}

TEST(sequence, formsMayAlternate)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY:0", "1"}, {"TEST_PREFIX_ARRAY__1", "2"}, {"TEST_PREFIX_ARRAY:2", "3"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1, 2, 3}));
}

TEST(sequence, colonFormWinsPerIndex)
{
    MockEnvironment env;
    EXPECT_CALL(env, get(_)).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(env, get("TEST_PREFIX_ARRAY:0")).WillOnce(Return(std::string("1")));
    EXPECT_CALL(env, get("TEST_PREFIX_ARRAY__0")).Times(0);

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1}));
}

TEST(sequence, gapTruncates)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY__0", "1"}, {"TEST_PREFIX_ARRAY__2", "3"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1}));
}

TEST(sequence, missingFirstIndexMeansNoSequence)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY__1", "2"}, {"TEST_PREFIX_ARRAY", "1"}});

    Struct s;
    s.array = {9};
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{9}));
}

TEST(sequence, replacesPreviousContents)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_ARRAY__0", "1"}});

    Struct s;
    s.array = {7, 8, 9};
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1}));
}

TEST(sequence, probesUntilFirstMiss)
{
    MockEnvironment env;
    {
        InSequence seq;
        EXPECT_CALL(env, get("A:0")).WillOnce(Return(std::nullopt));
        EXPECT_CALL(env, get("A__0")).WillOnce(Return(std::string("x")));
        EXPECT_CALL(env, get("A:1")).WillOnce(Return(std::string("y")));
        EXPECT_CALL(env, get("A:2")).WillOnce(Return(std::nullopt));
        EXPECT_CALL(env, get("A__2")).WillOnce(Return(std::nullopt));
    }

    std::vector<std::string> values;
    auto found = expandSequence(
        "A",
        [&](const std::string & name) {
            std::string value;
            if (!bindScalar(value, env, name))
                return false;
            values.push_back(value);
            return true;
        },
        [&]() { keepLastElement(values); });

    ASSERT_TRUE(found);
    ASSERT_EQ(values, (std::vector<std::string>{"x", "y"}));
}

TEST(sequence, longSequence)
{
    StringMap vars;
    for (uint32_t i = 0; i < 250; ++i)
        vars.emplace("TEST_PREFIX_ARRAY__" + std::to_string(i), std::to_string(i * 2));
    MapEnvironment env(vars);

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.array.size(), 250u);
    for (uint32_t i = 0; i < 250; ++i)
        ASSERT_EQ(s.array[i], i * 2);
}

TEST(sequence, errorAbortsEverything)
{
    MapEnvironment env({
        {"TEST_PREFIX_ARRAY__0", "1"},
        {"TEST_PREFIX_ARRAY__1", "-1"},
        {"TEST_PREFIX_ARRAY__2", "3"},
        {"TEST_PREFIX_OPTIONAL", "later"},
    });

    Struct s;
    try {
        bind(s, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "TEST_PREFIX_ARRAY__1");
        ASSERT_EQ(e.message(), "TEST_PREFIX_ARRAY__1: '-1' is not a valid 32-bit unsigned integer");
    }

    ASSERT_EQ(s.array, (std::vector<uint32_t>{1}));
    ASSERT_EQ(s.optional, std::nullopt);
}

TEST(sequence, errorInUnderscoreForm)
{
    MapEnvironment env({{"TEST_PREFIX_ARRAY:0", "1"}, {"TEST_PREFIX_ARRAY__1", "x"}});

    Struct s;
    ASSERT_THROW(bind(s, env), EnvParseError);
}

/* ----------------------------------------------------------------------------
 * sequences of records
 * --------------------------------------------------------------------------*/

TEST(nestedSequence, rollsBackSpeculativeElement)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_SUB_STRUCTS__0__PORT", "10"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 10}}));
}

TEST(nestedSequence, nothingSetLeavesNoElement)
{
    MapEnvironment env;

    Struct s;
    ASSERT_FALSE(bind(s, env));
    ASSERT_TRUE(s.subStructs.empty());
}

TEST(nestedSequence, colonForm)
{
    MapEnvironment env({{"TEST_PREFIX_SUB_STRUCTS:0:PORT", "1"}, {"TEST_PREFIX_SUB_STRUCTS:1:PORT", "2"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 1}, {.port = 2}}));
}

TEST(nestedSequence, underscoreFormOnlyTriedIfColonFormFoundNothing)
{
    MapEnvironment env({{"TEST_PREFIX_SUB_STRUCTS:0:PORT", "1"}, {"TEST_PREFIX_SUB_STRUCTS__0__PORT", "2"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 1}}));
}

TEST(nestedSequence, gapTruncates)
{
    MapEnvironment env({{"TEST_PREFIX_SUB_STRUCTS__0__PORT", "1"}, {"TEST_PREFIX_SUB_STRUCTS__2__PORT", "3"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 1}}));
}

TEST(nestedSequence, replacesPreviousContents)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_SUB_STRUCTS__0__PORT", "1"}});

    Struct s;
    s.subStructs = {{.port = 5}, {.port = 6}};
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 1}}));
}

TEST(nestedSequence, absenceKeepsPreviousContents)
{
    MapEnvironment env;

    Struct s;
    s.subStructs = {{.port = 5}, {.port = 6}};
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 5}, {.port = 6}}));
}

TEST(nestedSequence, failingElementIsLeftAttached)
{
    MapEnvironment env({{"TEST_PREFIX_SUB_STRUCTS__0__PORT", "1"}, {"TEST_PREFIX_SUB_STRUCTS__1__PORT", "70000"}});

    Struct s;
    try {
        bind(s, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "TEST_PREFIX_SUB_STRUCTS__1__PORT");
    }

    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 1}, {.port = 0}}));
}

TEST(nestedSequence, probesColonThenUnderscorePerElement)
{
    MockEnvironment env;
    {
        InSequence seq;
        EXPECT_CALL(env, get("S:0:PORT")).WillOnce(Return(std::nullopt));
        EXPECT_CALL(env, get("S__0__PORT")).WillOnce(Return(std::string("1")));
        EXPECT_CALL(env, get("S:1:PORT")).WillOnce(Return(std::nullopt));
        EXPECT_CALL(env, get("S__1__PORT")).WillOnce(Return(std::nullopt));
    }

    std::vector<SubStruct> values;
    auto found = expandNestedSequence(
        "S",
        [&]() { values.emplace_back(); },
        [&](const std::string & prefix) { return bindWithPrefix(values.back(), prefix, env); },
        [&]() { values.pop_back(); },
        [&]() { keepLastElement(values); });

    ASSERT_TRUE(found);
    ASSERT_EQ(values, (std::vector<SubStruct>{{.port = 1}}));
}

} // namespace envbind
