#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "envbind/bind/text-encoding.hh"

#include <sstream>

namespace envbind {

TEST(parseTextEncoding, canonicalNames)
{
    ASSERT_EQ(parseTextEncoding("utf-8"), TextEncoding::Utf8);
    ASSERT_EQ(parseTextEncoding("shift_jis"), TextEncoding::ShiftJis);
    ASSERT_EQ(parseTextEncoding("windows-1252"), TextEncoding::Windows1252);
    ASSERT_EQ(parseTextEncoding("x-user-defined"), TextEncoding::UserDefined);
}

TEST(parseTextEncoding, aliases)
{
    ASSERT_EQ(parseTextEncoding("utf8"), TextEncoding::Utf8);
    ASSERT_EQ(parseTextEncoding("latin1"), TextEncoding::Windows1252);
    ASSERT_EQ(parseTextEncoding("us-ascii"), TextEncoding::Windows1252);
    ASSERT_EQ(parseTextEncoding("iso-8859-9"), TextEncoding::Windows1254);
    ASSERT_EQ(parseTextEncoding("sjis"), TextEncoding::ShiftJis);
    ASSERT_EQ(parseTextEncoding("gb2312"), TextEncoding::Gbk);
    ASSERT_EQ(parseTextEncoding("utf-16"), TextEncoding::Utf16Le);
    ASSERT_EQ(parseTextEncoding("iso-2022-kr"), TextEncoding::Replacement);
}

TEST(parseTextEncoding, ignoresCase)
{
    ASSERT_EQ(parseTextEncoding("UTF-8"), TextEncoding::Utf8);
    ASSERT_EQ(parseTextEncoding("Latin1"), TextEncoding::Windows1252);
    ASSERT_EQ(parseTextEncoding("KOI8-R"), TextEncoding::Koi8R);
}

TEST(parseTextEncoding, ignoresSurroundingAsciiWhitespace)
{
    ASSERT_EQ(parseTextEncoding("  utf-8\t"), TextEncoding::Utf8);
    ASSERT_EQ(parseTextEncoding("\n\fbig5\r"), TextEncoding::Big5);
}

TEST(parseTextEncoding, unknownLabels)
{
    ASSERT_EQ(parseTextEncoding(""), std::nullopt);
    ASSERT_EQ(parseTextEncoding("utf-7"), std::nullopt);
    ASSERT_EQ(parseTextEncoding("utf 8"), std::nullopt);
    ASSERT_EQ(parseTextEncoding("latin-1"), std::nullopt);
}

TEST(showTextEncoding, canonicalNames)
{
    ASSERT_EQ(showTextEncoding(TextEncoding::Utf8), "UTF-8");
    ASSERT_EQ(showTextEncoding(TextEncoding::Iso8859_8I), "ISO-8859-8-I");
    ASSERT_EQ(showTextEncoding(TextEncoding::MacCyrillic), "x-mac-cyrillic");
    ASSERT_EQ(showTextEncoding(TextEncoding::UserDefined), "x-user-defined");
}

TEST(showTextEncoding, roundTripsThroughCanonicalName)
{
    for (size_t i = 0; i <= static_cast<size_t>(TextEncoding::UserDefined); ++i) {
        auto encoding = static_cast<TextEncoding>(i);
        ASSERT_EQ(parseTextEncoding(showTextEncoding(encoding)), encoding) << showTextEncoding(encoding);
    }
}

TEST(TextEncoding, printsAndSerialisesCanonicalName)
{
    std::ostringstream str;
    str << TextEncoding::EucKr;
    ASSERT_EQ(str.str(), "EUC-KR");

    ASSERT_EQ(nlohmann::json(TextEncoding::Big5), "Big5");
}

TEST(EnvDecoder, decodesTextEncoding)
{
    ASSERT_EQ(EnvDecoder<TextEncoding>::decode("cp1251"), TextEncoding::Windows1251);
}

TEST(EnvDecoder, rejectsUnknownTextEncoding)
{
    try {
        EnvDecoder<TextEncoding>::decode("klingon");
        FAIL() << "expected a DecodeError";
    } catch (DecodeError & e) {
        ASSERT_EQ(e.message(), "Unrecognized encoding");
    }
}

} // namespace envbind
