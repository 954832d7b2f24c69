#include <gtest/gtest.h>

#include "envbind/bind/decode.hh"

#include <cstdint>
#include <limits>

namespace envbind {

/* ----------------------------------------------------------------------------
 * integers
 * --------------------------------------------------------------------------*/

TEST(EnvDecoder, decodesUnsignedIntegers)
{
    ASSERT_EQ(EnvDecoder<uint16_t>::decode("42"), 42);
    ASSERT_EQ(EnvDecoder<uint16_t>::decode("65535"), 65535);
    ASSERT_EQ(EnvDecoder<uint64_t>::decode("18446744073709551615"), std::numeric_limits<uint64_t>::max());
}

TEST(EnvDecoder, decodesSignedIntegers)
{
    ASSERT_EQ(EnvDecoder<int32_t>::decode("-17"), -17);
    ASSERT_EQ(EnvDecoder<int64_t>::decode("-9223372036854775808"), std::numeric_limits<int64_t>::min());
}

TEST(EnvDecoder, acceptsLeadingPlus)
{
    ASSERT_EQ(EnvDecoder<int32_t>::decode("+5"), 5);
}

TEST(EnvDecoder, decodesBytesAsNumbers)
{
    ASSERT_EQ(EnvDecoder<uint8_t>::decode("7"), 7);
    ASSERT_EQ(EnvDecoder<uint8_t>::decode("255"), 255);
    ASSERT_EQ(EnvDecoder<int8_t>::decode("-128"), -128);
}

TEST(EnvDecoder, rejectsOutOfRangeIntegers)
{
    ASSERT_THROW(EnvDecoder<uint8_t>::decode("256"), DecodeError);
    ASSERT_THROW(EnvDecoder<int8_t>::decode("128"), DecodeError);
    ASSERT_THROW(EnvDecoder<uint16_t>::decode("65536"), DecodeError);
    ASSERT_THROW(EnvDecoder<int64_t>::decode("9223372036854775808"), DecodeError);
}

TEST(EnvDecoder, rejectsNegativeUnsigned)
{
    ASSERT_THROW(EnvDecoder<uint32_t>::decode("-1"), DecodeError);
    ASSERT_THROW(EnvDecoder<uint8_t>::decode("-0"), DecodeError);
}

TEST(EnvDecoder, rejectsMalformedIntegers)
{
    ASSERT_THROW(EnvDecoder<int32_t>::decode(""), DecodeError);
    ASSERT_THROW(EnvDecoder<int32_t>::decode("notanumber"), DecodeError);
    ASSERT_THROW(EnvDecoder<int32_t>::decode("12abc"), DecodeError);
    ASSERT_THROW(EnvDecoder<int32_t>::decode(" 12"), DecodeError);
    ASSERT_THROW(EnvDecoder<int32_t>::decode("1.5"), DecodeError);
}

TEST(EnvDecoder, integerErrorNamesTheType)
{
    try {
        EnvDecoder<uint16_t>::decode("x");
        FAIL() << "expected a DecodeError";
    } catch (DecodeError & e) {
        ASSERT_EQ(e.message(), "'x' is not a valid 16-bit unsigned integer");
    }

    try {
        EnvDecoder<int8_t>::decode("x");
        FAIL() << "expected a DecodeError";
    } catch (DecodeError & e) {
        ASSERT_EQ(e.message(), "'x' is not a valid 8-bit signed integer");
    }
}

/* ----------------------------------------------------------------------------
 * bool
 * --------------------------------------------------------------------------*/

TEST(EnvDecoder, decodesBooleans)
{
    for (auto s : {"true", "yes", "1"})
        ASSERT_TRUE(EnvDecoder<bool>::decode(s)) << s;
    for (auto s : {"false", "no", "0"})
        ASSERT_FALSE(EnvDecoder<bool>::decode(s)) << s;
}

TEST(EnvDecoder, rejectsOtherBooleans)
{
    ASSERT_THROW(EnvDecoder<bool>::decode("TRUE"), DecodeError);
    ASSERT_THROW(EnvDecoder<bool>::decode(""), DecodeError);
    ASSERT_THROW(EnvDecoder<bool>::decode("2"), DecodeError);
}

/* ----------------------------------------------------------------------------
 * floating point
 * --------------------------------------------------------------------------*/

TEST(EnvDecoder, decodesFloatingPoint)
{
    ASSERT_DOUBLE_EQ(EnvDecoder<double>::decode("0.25"), 0.25);
    ASSERT_DOUBLE_EQ(EnvDecoder<double>::decode("-3e2"), -300.0);
    ASSERT_FLOAT_EQ(EnvDecoder<float>::decode("1.5"), 1.5f);
}

TEST(EnvDecoder, rejectsMalformedFloatingPoint)
{
    ASSERT_THROW(EnvDecoder<double>::decode(""), DecodeError);
    ASSERT_THROW(EnvDecoder<double>::decode("one"), DecodeError);
}

/* ----------------------------------------------------------------------------
 * text
 * --------------------------------------------------------------------------*/

TEST(EnvDecoder, decodesSingleCharacter)
{
    ASSERT_EQ(EnvDecoder<char>::decode(","), ',');
    ASSERT_THROW(EnvDecoder<char>::decode(""), DecodeError);
    ASSERT_THROW(EnvDecoder<char>::decode("ab"), DecodeError);
}

TEST(EnvDecoder, keepsStringsVerbatim)
{
    ASSERT_EQ(EnvDecoder<std::string>::decode(""), "");
    ASSERT_EQ(EnvDecoder<std::string>::decode("  spaced %s out  "), "  spaced %s out  ");
    ASSERT_EQ(EnvDecoder<std::string>::decode("h\xc3\xa9llo"), "h\xc3\xa9llo");
}

TEST(EnvDecoder, keepsPathsVerbatim)
{
    ASSERT_EQ(EnvDecoder<std::filesystem::path>::decode("/var//lib/../app"), std::filesystem::path("/var//lib/../app"));
    ASSERT_EQ(EnvDecoder<std::filesystem::path>::decode("relative/dir"), std::filesystem::path("relative/dir"));
    ASSERT_TRUE(EnvDecoder<std::filesystem::path>::decode("").empty());
}

} // namespace envbind
