#include <gtest/gtest.h>

#include "envbind/bind/indexed-name.hh"

#include <limits>

namespace envbind {

TEST(IndexedName, appendsIndex)
{
    IndexedName name("APP_PORTS__");
    ASSERT_EQ(name.at(0), "APP_PORTS__0");
    ASSERT_EQ(name.at(1), "APP_PORTS__1");
    ASSERT_EQ(name.at(42), "APP_PORTS__42");
}

TEST(IndexedName, appendsSuffixAfterIndex)
{
    IndexedName name("APP_HOSTS:", ":");
    ASSERT_EQ(name.at(0), "APP_HOSTS:0:");
    ASSERT_EQ(name.at(10), "APP_HOSTS:10:");
}

TEST(IndexedName, shrinksWhenIndexGetsShorter)
{
    IndexedName name("X__", "__");
    ASSERT_EQ(name.at(12345), "X__12345__");
    ASSERT_EQ(name.at(7), "X__7__");
}

TEST(IndexedName, largestIndex)
{
    IndexedName name("N:");
    ASSERT_EQ(name.at(std::numeric_limits<size_t>::max()), "N:" + std::to_string(std::numeric_limits<size_t>::max()));
}

TEST(IndexedName, reusesBuffer)
{
    IndexedName name("SOME_RATHER_LONG_PREFIX_ITEMS__", "__");
    auto data = name.at(0).data();
    for (size_t i = 1; i < 1000; ++i)
        ASSERT_EQ(name.at(i).data(), data);
}

TEST(IndexedName, emptyStem)
{
    IndexedName name("");
    ASSERT_EQ(name.at(3), "3");
}

} // namespace envbind
