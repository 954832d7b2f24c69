#pragma once
/**
 * @file
 *
 * Decoders turning the text of an environment variable into a value.
 *
 * A type is decodable if `EnvDecoder<T>` is specialised for it with a
 * static member
 *
 * ```
 * static T decode(std::string_view text);
 * ```
 *
 * that either returns the value or throws `DecodeError`. Hosts add
 * their own types by providing further specialisations.
 */

#include "envbind/bind/env-error.hh"

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>

namespace envbind {

template<typename T>
struct EnvDecoder;

template<typename T>
concept Decodable = requires(std::string_view text) {
    { EnvDecoder<T>::decode(text) } -> std::convertible_to<T>;
};

/**
 * The standard signed and unsigned integer types, i.e. everything
 * `int8_t` through `uint64_t` can name, but not `bool` or the
 * character types.
 */
template<typename T>
concept DecimalInteger =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t>
    && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

/**
 * Decimal integers, with an optional leading sign, range-checked
 * against `T`.
 */
template<DecimalInteger T>
struct EnvDecoder<T>
{
    static T decode(std::string_view text);
};

extern template struct EnvDecoder<signed char>;
extern template struct EnvDecoder<short>;
extern template struct EnvDecoder<int>;
extern template struct EnvDecoder<long>;
extern template struct EnvDecoder<long long>;
extern template struct EnvDecoder<unsigned char>;
extern template struct EnvDecoder<unsigned short>;
extern template struct EnvDecoder<unsigned int>;
extern template struct EnvDecoder<unsigned long>;
extern template struct EnvDecoder<unsigned long long>;

/**
 * `true`, `yes` and `1`, or `false`, `no` and `0`.
 */
template<>
struct EnvDecoder<bool>
{
    static bool decode(std::string_view text);
};

template<>
struct EnvDecoder<double>
{
    static double decode(std::string_view text);
};

template<>
struct EnvDecoder<float>
{
    static float decode(std::string_view text);
};

/**
 * Exactly one byte.
 */
template<>
struct EnvDecoder<char>
{
    static char decode(std::string_view text);
};

/**
 * The text verbatim.
 */
template<>
struct EnvDecoder<std::string>
{
    static std::string decode(std::string_view text);
};

/**
 * The text verbatim. No canonicalisation is done, and the empty path is
 * accepted.
 */
template<>
struct EnvDecoder<std::filesystem::path>
{
    static std::filesystem::path decode(std::string_view text);
};

} // namespace envbind
