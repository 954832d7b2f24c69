#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "envbind/bind/scalar.hh"
#include "envbind/bind/tests/mock-environment.hh"

namespace envbind {

using ::testing::Return;
using testing::MockEnvironment;

TEST(bindScalar, absentLeavesValue)
{
    MapEnvironment env;
    uint16_t port = 80;

    ASSERT_FALSE(bindScalar(port, env, "PORT"));
    ASSERT_EQ(port, 80);
}

TEST(bindScalar, presentOverridesValue)
{
    MapEnvironment env(StringMap{{"PORT", "8080"}});
    uint16_t port = 80;

    ASSERT_TRUE(bindScalar(port, env, "PORT"));
    ASSERT_EQ(port, 8080);
}

TEST(bindScalar, emptyStringIsAValue)
{
    MapEnvironment env(StringMap{{"NAME", ""}});
    std::string name = "default";

    ASSERT_TRUE(bindScalar(name, env, "NAME"));
    ASSERT_EQ(name, "");
}

TEST(bindScalar, notUnicode)
{
    MapEnvironment env(StringMap{{"NAME", "ab\xff"}});
    std::string name = "default";

    try {
        bindScalar(name, env, "NAME");
        FAIL() << "expected a NotUnicodeError";
    } catch (NotUnicodeError & e) {
        ASSERT_EQ(e.varName(), "NAME");
        ASSERT_EQ(e.raw(), "ab\xff");
        ASSERT_EQ(e.message(), "NAME: not valid text");
    }

    ASSERT_EQ(name, "default");
}

TEST(bindScalar, notUnicodeTakesPrecedenceOverDecoding)
{
    MapEnvironment env(StringMap{{"PORT", "\xc0\x80"}});
    uint16_t port = 0;

    ASSERT_THROW(bindScalar(port, env, "PORT"), NotUnicodeError);
}

TEST(bindScalar, parseError)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_SUB__PORT", "not a port"}});
    uint16_t port = 80;

    try {
        bindScalar(port, env, "TEST_PREFIX_SUB__PORT");
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "TEST_PREFIX_SUB__PORT");
        ASSERT_EQ(e.reason(), "'not a port' is not a valid 16-bit unsigned integer");
        ASSERT_EQ(e.message(), "TEST_PREFIX_SUB__PORT: 'not a port' is not a valid 16-bit unsigned integer");
    }

    ASSERT_EQ(port, 80);
}

TEST(bindScalar, parseErrorIsAnEnvVarError)
{
    MapEnvironment env(StringMap{{"FLAG", "maybe"}});
    bool flag = false;

    ASSERT_THROW(bindScalar(flag, env, "FLAG"), EnvVarError);
    ASSERT_THROW(bindScalar(flag, env, "FLAG"), Error);
}

TEST(bindScalar, looksUpOnce)
{
    MockEnvironment env;
    EXPECT_CALL(env, get("PORT")).Times(1).WillOnce(Return(std::string("1")));

    uint16_t port = 0;
    ASSERT_TRUE(bindScalar(port, env, "PORT"));
    ASSERT_EQ(port, 1);
}

} // namespace envbind
