#include <gtest/gtest.h>

#include "envbind/util/environment-variables.hh"
#include "envbind/util/error.hh"

namespace envbind {

TEST(setEnv, setAndUnset)
{
    setEnv("ENVBIND_TEST_SET_ENV", "one");
    ASSERT_EQ(getEnv("ENVBIND_TEST_SET_ENV"), "one");

    setEnv("ENVBIND_TEST_SET_ENV", "two");
    ASSERT_EQ(getEnv("ENVBIND_TEST_SET_ENV"), "two");

    unsetEnv("ENVBIND_TEST_SET_ENV");
    ASSERT_EQ(getEnv("ENVBIND_TEST_SET_ENV"), std::nullopt);
}

TEST(setEnv, invalidName)
{
    ASSERT_THROW(setEnv("ENVBIND=TEST", "x"), SysError);
    ASSERT_THROW(setEnv("", "x"), SysError);
}

TEST(getEnv, wholeEnvironment)
{
    setEnv("ENVBIND_TEST_WHOLE", "a=b");
    auto env = getEnv();
    ASSERT_EQ(env.at("ENVBIND_TEST_WHOLE"), "a=b");
    unsetEnv("ENVBIND_TEST_WHOLE");
}

} // namespace envbind
