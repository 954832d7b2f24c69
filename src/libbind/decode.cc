#include "envbind/bind/decode.hh"
#include "envbind/util/util.hh"

#include <limits>

namespace envbind {

template<DecimalInteger T>
T EnvDecoder<T>::decode(std::string_view text)
{
    if (auto n = string2Int<T>(text))
        return *n;
    throw DecodeError(
        "'%s' is not a valid %d-bit %s integer",
        text,
        std::numeric_limits<T>::digits + (std::numeric_limits<T>::is_signed ? 1 : 0),
        std::numeric_limits<T>::is_signed ? "signed" : "unsigned");
}

template struct EnvDecoder<signed char>;
template struct EnvDecoder<short>;
template struct EnvDecoder<int>;
template struct EnvDecoder<long>;
template struct EnvDecoder<long long>;
template struct EnvDecoder<unsigned char>;
template struct EnvDecoder<unsigned short>;
template struct EnvDecoder<unsigned int>;
template struct EnvDecoder<unsigned long>;
template struct EnvDecoder<unsigned long long>;

bool EnvDecoder<bool>::decode(std::string_view text)
{
    if (text == "true" || text == "yes" || text == "1")
        return true;
    else if (text == "false" || text == "no" || text == "0")
        return false;
    else
        throw DecodeError("'%s' is not a Boolean", text);
}

double EnvDecoder<double>::decode(std::string_view text)
{
    if (auto n = string2Float<double>(text))
        return *n;
    throw DecodeError("'%s' is not a valid floating-point number", text);
}

float EnvDecoder<float>::decode(std::string_view text)
{
    if (auto n = string2Float<float>(text))
        return *n;
    throw DecodeError("'%s' is not a valid floating-point number", text);
}

char EnvDecoder<char>::decode(std::string_view text)
{
    if (text.size() != 1)
        throw DecodeError("'%s' is not a single character", text);
    return text[0];
}

std::string EnvDecoder<std::string>::decode(std::string_view text)
{
    return std::string(text);
}

std::filesystem::path EnvDecoder<std::filesystem::path>::decode(std::string_view text)
{
    return std::filesystem::path(text);
}

} // namespace envbind
