#include "envbind/bind/text-encoding.hh"
#include "envbind/util/strings.hh"
#include "envbind/util/util.hh"

#include <array>
#include <cassert>
#include <map>
#include <memory>
#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

namespace envbind {

struct TextEncodingDetails
{
    TextEncoding tag;
    std::string_view name;
    std::vector<std::string_view> labels;
};

constexpr size_t numTextEncodings = 1 + static_cast<size_t>(TextEncoding::UserDefined);

/**
 * Entries are in the order of the `TextEncoding` tags, which
 * `showTextEncoding()` relies on.
 */
static const std::array<TextEncodingDetails, numTextEncodings> textEncodingDetails = {{
    {
        .tag = TextEncoding::Utf8,
        .name = "UTF-8",
        .labels = {"unicode-1-1-utf-8", "unicode11utf8", "unicode20utf8", "utf-8", "utf8", "x-unicode20utf8"},
    },
    {
        .tag = TextEncoding::Ibm866,
        .name = "IBM866",
        .labels = {"866", "cp866", "csibm866", "ibm866"},
    },
    {
        .tag = TextEncoding::Iso8859_2,
        .name = "ISO-8859-2",
        .labels =
            {"csisolatin2",
             "iso-8859-2",
             "iso-ir-101",
             "iso8859-2",
             "iso88592",
             "iso_8859-2",
             "iso_8859-2:1987",
             "l2",
             "latin2"},
    },
    {
        .tag = TextEncoding::Iso8859_3,
        .name = "ISO-8859-3",
        .labels =
            {"csisolatin3",
             "iso-8859-3",
             "iso-ir-109",
             "iso8859-3",
             "iso88593",
             "iso_8859-3",
             "iso_8859-3:1988",
             "l3",
             "latin3"},
    },
    {
        .tag = TextEncoding::Iso8859_4,
        .name = "ISO-8859-4",
        .labels =
            {"csisolatin4",
             "iso-8859-4",
             "iso-ir-110",
             "iso8859-4",
             "iso88594",
             "iso_8859-4",
             "iso_8859-4:1988",
             "l4",
             "latin4"},
    },
    {
        .tag = TextEncoding::Iso8859_5,
        .name = "ISO-8859-5",
        .labels =
            {"csisolatincyrillic",
             "cyrillic",
             "iso-8859-5",
             "iso-ir-144",
             "iso8859-5",
             "iso88595",
             "iso_8859-5",
             "iso_8859-5:1988"},
    },
    {
        .tag = TextEncoding::Iso8859_6,
        .name = "ISO-8859-6",
        .labels =
            {"arabic",
             "asmo-708",
             "csiso88596e",
             "csiso88596i",
             "csisolatinarabic",
             "ecma-114",
             "iso-8859-6",
             "iso-8859-6-e",
             "iso-8859-6-i",
             "iso-ir-127",
             "iso8859-6",
             "iso88596",
             "iso_8859-6",
             "iso_8859-6:1987"},
    },
    {
        .tag = TextEncoding::Iso8859_7,
        .name = "ISO-8859-7",
        .labels =
            {"csisolatingreek",
             "ecma-118",
             "elot_928",
             "greek",
             "greek8",
             "iso-8859-7",
             "iso-ir-126",
             "iso8859-7",
             "iso88597",
             "iso_8859-7",
             "iso_8859-7:1987",
             "sun_eu_greek"},
    },
    {
        .tag = TextEncoding::Iso8859_8,
        .name = "ISO-8859-8",
        .labels =
            {"csiso88598e",
             "csisolatinhebrew",
             "hebrew",
             "iso-8859-8",
             "iso-8859-8-e",
             "iso-ir-138",
             "iso8859-8",
             "iso88598",
             "iso_8859-8",
             "iso_8859-8:1988",
             "visual"},
    },
    {
        .tag = TextEncoding::Iso8859_8I,
        .name = "ISO-8859-8-I",
        .labels = {"csiso88598i", "iso-8859-8-i", "logical"},
    },
    {
        .tag = TextEncoding::Iso8859_10,
        .name = "ISO-8859-10",
        .labels = {"csisolatin6", "iso-8859-10", "iso-ir-157", "iso8859-10", "iso885910", "l6", "latin6"},
    },
    {
        .tag = TextEncoding::Iso8859_13,
        .name = "ISO-8859-13",
        .labels = {"iso-8859-13", "iso8859-13", "iso885913"},
    },
    {
        .tag = TextEncoding::Iso8859_14,
        .name = "ISO-8859-14",
        .labels = {"iso-8859-14", "iso8859-14", "iso885914"},
    },
    {
        .tag = TextEncoding::Iso8859_15,
        .name = "ISO-8859-15",
        .labels = {"csisolatin9", "iso-8859-15", "iso8859-15", "iso885915", "iso_8859-15", "l9"},
    },
    {
        .tag = TextEncoding::Iso8859_16,
        .name = "ISO-8859-16",
        .labels = {"iso-8859-16"},
    },
    {
        .tag = TextEncoding::Koi8R,
        .name = "KOI8-R",
        .labels = {"cskoi8r", "koi", "koi8", "koi8-r", "koi8_r"},
    },
    {
        .tag = TextEncoding::Koi8U,
        .name = "KOI8-U",
        .labels = {"koi8-ru", "koi8-u"},
    },
    {
        .tag = TextEncoding::Macintosh,
        .name = "macintosh",
        .labels = {"csmacintosh", "mac", "macintosh", "x-mac-roman"},
    },
    {
        .tag = TextEncoding::Windows874,
        .name = "windows-874",
        .labels = {"dos-874", "iso-8859-11", "iso8859-11", "iso885911", "tis-620", "windows-874"},
    },
    {
        .tag = TextEncoding::Windows1250,
        .name = "windows-1250",
        .labels = {"cp1250", "windows-1250", "x-cp1250"},
    },
    {
        .tag = TextEncoding::Windows1251,
        .name = "windows-1251",
        .labels = {"cp1251", "windows-1251", "x-cp1251"},
    },
    {
        .tag = TextEncoding::Windows1252,
        .name = "windows-1252",
        .labels =
            {"ansi_x3.4-1968",
             "ascii",
             "cp1252",
             "cp819",
             "csisolatin1",
             "ibm819",
             "iso-8859-1",
             "iso-ir-100",
             "iso8859-1",
             "iso88591",
             "iso_8859-1",
             "iso_8859-1:1987",
             "l1",
             "latin1",
             "us-ascii",
             "windows-1252",
             "x-cp1252"},
    },
    {
        .tag = TextEncoding::Windows1253,
        .name = "windows-1253",
        .labels = {"cp1253", "windows-1253", "x-cp1253"},
    },
    {
        .tag = TextEncoding::Windows1254,
        .name = "windows-1254",
        .labels =
            {"cp1254",
             "csisolatin5",
             "iso-8859-9",
             "iso-ir-148",
             "iso8859-9",
             "iso88599",
             "iso_8859-9",
             "iso_8859-9:1989",
             "l5",
             "latin5",
             "windows-1254",
             "x-cp1254"},
    },
    {
        .tag = TextEncoding::Windows1255,
        .name = "windows-1255",
        .labels = {"cp1255", "windows-1255", "x-cp1255"},
    },
    {
        .tag = TextEncoding::Windows1256,
        .name = "windows-1256",
        .labels = {"cp1256", "windows-1256", "x-cp1256"},
    },
    {
        .tag = TextEncoding::Windows1257,
        .name = "windows-1257",
        .labels = {"cp1257", "windows-1257", "x-cp1257"},
    },
    {
        .tag = TextEncoding::Windows1258,
        .name = "windows-1258",
        .labels = {"cp1258", "windows-1258", "x-cp1258"},
    },
    {
        .tag = TextEncoding::MacCyrillic,
        .name = "x-mac-cyrillic",
        .labels = {"x-mac-cyrillic", "x-mac-ukrainian"},
    },
    {
        .tag = TextEncoding::Gbk,
        .name = "GBK",
        .labels =
            {"chinese", "csgb2312", "csiso58gb231280", "gb2312", "gb_2312", "gb_2312-80", "gbk", "iso-ir-58", "x-gbk"},
    },
    {
        .tag = TextEncoding::Gb18030,
        .name = "gb18030",
        .labels = {"gb18030"},
    },
    {
        .tag = TextEncoding::Big5,
        .name = "Big5",
        .labels = {"big5", "big5-hkscs", "cn-big5", "csbig5", "x-x-big5"},
    },
    {
        .tag = TextEncoding::EucJp,
        .name = "EUC-JP",
        .labels = {"cseucpkdfmtjapanese", "euc-jp", "x-euc-jp"},
    },
    {
        .tag = TextEncoding::Iso2022Jp,
        .name = "ISO-2022-JP",
        .labels = {"csiso2022jp", "iso-2022-jp"},
    },
    {
        .tag = TextEncoding::ShiftJis,
        .name = "Shift_JIS",
        .labels = {"csshiftjis", "ms932", "ms_kanji", "shift-jis", "shift_jis", "sjis", "windows-31j", "x-sjis"},
    },
    {
        .tag = TextEncoding::EucKr,
        .name = "EUC-KR",
        .labels =
            {"cseuckr",
             "csksc56011987",
             "euc-kr",
             "iso-ir-149",
             "korean",
             "ks_c_5601-1987",
             "ks_c_5601-1989",
             "ksc5601",
             "ksc_5601",
             "windows-949"},
    },
    {
        .tag = TextEncoding::Replacement,
        .name = "replacement",
        .labels = {"csiso2022kr", "hz-gb-2312", "iso-2022-cn", "iso-2022-cn-ext", "iso-2022-kr", "replacement"},
    },
    {
        .tag = TextEncoding::Utf16Be,
        .name = "UTF-16BE",
        .labels = {"unicodefffe", "utf-16be"},
    },
    {
        .tag = TextEncoding::Utf16Le,
        .name = "UTF-16LE",
        .labels = {"csunicode", "iso-10646-ucs-2", "ucs-2", "unicode", "unicodefeff", "utf-16", "utf-16le"},
    },
    {
        .tag = TextEncoding::UserDefined,
        .name = "x-user-defined",
        .labels = {"x-user-defined"},
    },
}};

std::optional<TextEncoding> parseTextEncoding(std::string_view label)
{
    using LabelMap = std::map<std::string_view, TextEncoding>;

    static std::unique_ptr<LabelMap> labelMap = []() {
        auto labelMap = std::make_unique<LabelMap>();
        for (auto & encoding : textEncodingDetails)
            for (auto & l : encoding.labels)
                (*labelMap)[l] = encoding.tag;
        return labelMap;
    }();

    /* ASCII whitespace as defined by the Encoding Standard. */
    auto key = toLower(trim(label, " \t\n\f\r"));

    if (auto encoding = get(*labelMap, std::string_view(key)))
        return *encoding;
    else
        return std::nullopt;
}

std::string_view showTextEncoding(TextEncoding encoding)
{
    assert((size_t) encoding < textEncodingDetails.size());
    return textEncodingDetails[(size_t) encoding].name;
}

std::ostream & operator<<(std::ostream & str, TextEncoding encoding)
{
    return str << showTextEncoding(encoding);
}

void to_json(nlohmann::json & j, const TextEncoding & encoding)
{
    j = showTextEncoding(encoding);
}

TextEncoding EnvDecoder<TextEncoding>::decode(std::string_view text)
{
    if (auto encoding = parseTextEncoding(text))
        return *encoding;
    throw DecodeError("Unrecognized encoding");
}

} // namespace envbind
