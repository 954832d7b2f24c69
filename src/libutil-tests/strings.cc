#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "envbind/util/strings.hh"
#include "envbind/util/util.hh"

#include <limits>

namespace envbind {

/* ----------------------------------------------------------------------------
 * trim
 * --------------------------------------------------------------------------*/

TEST(trim, empty)
{
    ASSERT_EQ(trim(""), "");
    ASSERT_EQ(trim(" \t\n"), "");
}

TEST(trim, surroundingWhitespace)
{
    ASSERT_EQ(trim("  foo bar\n"), "foo bar");
    ASSERT_EQ(trim("foo"), "foo");
}

TEST(trim, customWhitespace)
{
    ASSERT_EQ(trim("\f utf-8 \f", " \f"), "utf-8");
    ASSERT_EQ(trim("\f utf-8 \f"), "\f utf-8 \f");
}

/* ----------------------------------------------------------------------------
 * toLower
 * --------------------------------------------------------------------------*/

TEST(toLower, asciiOnly)
{
    ASSERT_EQ(toLower("Shift_JIS"), "shift_jis");
    ASSERT_EQ(toLower("\xc3\x89T\xc3\x89"), "\xc3\x89t\xc3\x89");
}

/* ----------------------------------------------------------------------------
 * isValidUtf8
 * --------------------------------------------------------------------------*/

TEST(isValidUtf8, ascii)
{
    ASSERT_TRUE(isValidUtf8(""));
    ASSERT_TRUE(isValidUtf8("hello, world"));
    ASSERT_TRUE(isValidUtf8(std::string_view("a\0b", 3)));
}

TEST(isValidUtf8, multibyte)
{
    ASSERT_TRUE(isValidUtf8("\xc3\xa9"));         // é
    ASSERT_TRUE(isValidUtf8("\xe2\x82\xac"));     // €
    ASSERT_TRUE(isValidUtf8("\xf0\x9f\x98\x80")); // U+1F600
    ASSERT_TRUE(isValidUtf8("\xf4\x8f\xbf\xbf")); // U+10FFFF
}

TEST(isValidUtf8, rejectsStrayBytes)
{
    ASSERT_FALSE(isValidUtf8("\xff"));
    ASSERT_FALSE(isValidUtf8("\x80"));
    ASSERT_FALSE(isValidUtf8("abc\xfe"));
}

TEST(isValidUtf8, rejectsTruncatedSequences)
{
    ASSERT_FALSE(isValidUtf8("\xc3"));
    ASSERT_FALSE(isValidUtf8("\xe2\x82"));
    ASSERT_FALSE(isValidUtf8("\xe2\x82x"));
}

TEST(isValidUtf8, rejectsOverlongForms)
{
    ASSERT_FALSE(isValidUtf8("\xc0\x80"));
    ASSERT_FALSE(isValidUtf8("\xe0\x80\xaf"));
    ASSERT_FALSE(isValidUtf8("\xf0\x80\x80\xaf"));
}

TEST(isValidUtf8, rejectsSurrogatesAndOutOfRange)
{
    ASSERT_FALSE(isValidUtf8("\xed\xa0\x80"));
    ASSERT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));
}

RC_GTEST_PROP(isValidUtf8, acceptsAscii, ())
{
    auto s = *rc::gen::container<std::string>(rc::gen::inRange<char>(0, 0x7f));
    RC_ASSERT(isValidUtf8(s));
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, decimal)
{
    ASSERT_EQ(string2Int<int>("123"), 123);
    ASSERT_EQ(string2Int<int>("-123"), -123);
    ASSERT_EQ(string2Int<int>("+5"), 5);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<int>("abc"), std::nullopt);
    ASSERT_EQ(string2Int<int>("12 "), std::nullopt);
    ASSERT_EQ(string2Int<int>("0x10"), std::nullopt);
}

TEST(string2Int, narrowTypesAreNumbers)
{
    ASSERT_EQ(string2Int<unsigned char>("7"), 7);
    ASSERT_EQ(string2Int<signed char>("-7"), -7);
    ASSERT_EQ(string2Int<unsigned char>("256"), std::nullopt);
    ASSERT_EQ(string2Int<signed char>("-129"), std::nullopt);
    ASSERT_EQ(string2Int<short>("32768"), std::nullopt);
}

TEST(string2Int, rejectsNegativeUnsigned)
{
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned long long>("-0"), std::nullopt);
}

TEST(string2Int, limits)
{
    ASSERT_EQ(string2Int<long long>("-9223372036854775808"), std::numeric_limits<long long>::min());
    ASSERT_EQ(string2Int<unsigned long long>("18446744073709551615"), std::numeric_limits<unsigned long long>::max());
    ASSERT_EQ(string2Int<unsigned long long>("18446744073709551616"), std::nullopt);
}

RC_GTEST_PROP(string2Int, parsesPrintedInts, (int32_t n))
{
    RC_ASSERT(string2Int<int32_t>(std::to_string(n)) == n);
}

/* ----------------------------------------------------------------------------
 * string2Float
 * --------------------------------------------------------------------------*/

TEST(string2Float, decimal)
{
    ASSERT_EQ(string2Float<double>("1.5"), 1.5);
    ASSERT_EQ(string2Float<double>("-2"), -2.0);
    ASSERT_EQ(string2Float<float>("0.25"), 0.25f);
}

TEST(string2Float, rejectsGarbage)
{
    ASSERT_EQ(string2Float<double>(""), std::nullopt);
    ASSERT_EQ(string2Float<double>("one"), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * get
 * --------------------------------------------------------------------------*/

TEST(get, emptyContainer)
{
    StringMap map;

    ASSERT_EQ(get(map, "one"), nullptr);
}

TEST(get, getFromContainer)
{
    StringMap map;
    map["one"] = "yi";
    map["two"] = "er";

    ASSERT_EQ(*get(map, "one"), "yi");
}

} // namespace envbind
