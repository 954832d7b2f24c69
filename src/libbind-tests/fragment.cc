#include <gtest/gtest.h>

#include "envbind/bind/fragment.hh"

namespace envbind {

TEST(toEnvFragment, singleWord)
{
    ASSERT_EQ(toEnvFragment("port"), "PORT");
    ASSERT_EQ(toEnvFragment("PORT"), "PORT");
}

TEST(toEnvFragment, snakeCase)
{
    ASSERT_EQ(toEnvFragment("sub_structs"), "SUB_STRUCTS");
    ASSERT_EQ(toEnvFragment("nested_vector"), "NESTED_VECTOR");
}

TEST(toEnvFragment, camelAndPascalCase)
{
    ASSERT_EQ(toEnvFragment("subStructs"), "SUB_STRUCTS");
    ASSERT_EQ(toEnvFragment("SubStructs"), "SUB_STRUCTS");
    ASSERT_EQ(toEnvFragment("arrayStrings"), "ARRAY_STRINGS");
}

TEST(toEnvFragment, acronyms)
{
    ASSERT_EQ(toEnvFragment("httpURLPrefix"), "HTTP_URL_PREFIX");
    ASSERT_EQ(toEnvFragment("maxTTL"), "MAX_TTL");
}

TEST(toEnvFragment, digitsStayWithPrecedingWord)
{
    ASSERT_EQ(toEnvFragment("ipv6Address"), "IPV6_ADDRESS");
    ASSERT_EQ(toEnvFragment("retry_3"), "RETRY_3");
}

TEST(toEnvFragment, collapsesSeparators)
{
    ASSERT_EQ(toEnvFragment("_leading"), "LEADING");
    ASSERT_EQ(toEnvFragment("trailing_"), "TRAILING");
    ASSERT_EQ(toEnvFragment("kebab-case--name"), "KEBAB_CASE_NAME");
    ASSERT_EQ(toEnvFragment("mixed_Case"), "MIXED_CASE");
}

TEST(toEnvFragment, empty)
{
    ASSERT_EQ(toEnvFragment(""), "");
    ASSERT_EQ(toEnvFragment("__"), "");
}

} // namespace envbind
