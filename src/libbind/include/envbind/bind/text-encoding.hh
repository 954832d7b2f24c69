#pragma once
/**
 * @file
 *
 * Character encodings named by the labels of the WHATWG Encoding
 * Standard, e.g. for a variable selecting how a host reads its input
 * files.
 */

#include "envbind/bind/decode.hh"

#include <iosfwd>
#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace envbind {

enum struct TextEncoding {
    Utf8,
    Ibm866,
    Iso8859_2,
    Iso8859_3,
    Iso8859_4,
    Iso8859_5,
    Iso8859_6,
    Iso8859_7,
    Iso8859_8,
    Iso8859_8I,
    Iso8859_10,
    Iso8859_13,
    Iso8859_14,
    Iso8859_15,
    Iso8859_16,
    Koi8R,
    Koi8U,
    Macintosh,
    Windows874,
    Windows1250,
    Windows1251,
    Windows1252,
    Windows1253,
    Windows1254,
    Windows1255,
    Windows1256,
    Windows1257,
    Windows1258,
    MacCyrillic,
    Gbk,
    Gb18030,
    Big5,
    EucJp,
    Iso2022Jp,
    ShiftJis,
    EucKr,
    Replacement,
    Utf16Be,
    Utf16Le,
    UserDefined,
};

/**
 * Map an encoding label to its encoding.
 *
 * Leading and trailing ASCII whitespace is ignored and the comparison
 * is ASCII case-insensitive, so `" Latin1 "` names `windows-1252`.
 *
 * @return `std::nullopt` if the label is not recognised.
 */
std::optional<TextEncoding> parseTextEncoding(std::string_view label);

/**
 * @return the canonical name of an encoding, e.g. `"UTF-8"` or
 * `"Shift_JIS"`.
 */
std::string_view showTextEncoding(TextEncoding encoding);

std::ostream & operator<<(std::ostream & str, TextEncoding encoding);

void to_json(nlohmann::json & j, const TextEncoding & encoding);

template<>
struct EnvDecoder<TextEncoding>
{
    static TextEncoding decode(std::string_view text);
};

} // namespace envbind
