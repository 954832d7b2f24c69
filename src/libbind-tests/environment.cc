#include <gtest/gtest.h>

#include "envbind/bind/environment.hh"
#include "envbind/bind/tests/scoped-env.hh"

namespace envbind {

using testing::ScopedEnv;

TEST(MapEnvironment, lookupIsExact)
{
    MapEnvironment env({{"APP_PORT", "8080"}, {"app_port", "1"}});

    ASSERT_EQ(env.get("APP_PORT"), "8080");
    ASSERT_EQ(env.get("app_port"), "1");
    ASSERT_EQ(env.get("APP_PORT "), std::nullopt);
    ASSERT_EQ(env.get("APP_POR"), std::nullopt);
}

TEST(MapEnvironment, emptyValueIsPresent)
{
    MapEnvironment env(StringMap{{"EMPTY", ""}});

    ASSERT_EQ(env.get("EMPTY"), "");
}

TEST(MapEnvironment, keepsRawBytes)
{
    MapEnvironment env(StringMap{{"BYTES", "\xff\xfe"}});

    ASSERT_EQ(env.get("BYTES"), "\xff\xfe");
}

TEST(ProcessEnvironment, seesProcessVariables)
{
    ScopedEnv scoped;
    scoped.set("ENVBIND_TEST_PROCESS_ENV", "value");
    scoped.unset("ENVBIND_TEST_PROCESS_ENV_UNSET");

    ASSERT_EQ(processEnvironment().get("ENVBIND_TEST_PROCESS_ENV"), "value");
    ASSERT_EQ(processEnvironment().get("ENVBIND_TEST_PROCESS_ENV_UNSET"), std::nullopt);
}

TEST(ScopedEnv, restoresPreviousState)
{
    ScopedEnv outer(StringMap{{"ENVBIND_TEST_SCOPED", "before"}});
    outer.unset("ENVBIND_TEST_SCOPED_NEW");

    {
        ScopedEnv inner;
        inner.set("ENVBIND_TEST_SCOPED", "during");
        inner.set("ENVBIND_TEST_SCOPED_NEW", "during");
        inner.set("ENVBIND_TEST_SCOPED", "again");
        ASSERT_EQ(ProcessEnvironment().get("ENVBIND_TEST_SCOPED"), "again");
    }

    ASSERT_EQ(ProcessEnvironment().get("ENVBIND_TEST_SCOPED"), "before");
    ASSERT_EQ(ProcessEnvironment().get("ENVBIND_TEST_SCOPED_NEW"), std::nullopt);
}

} // namespace envbind
