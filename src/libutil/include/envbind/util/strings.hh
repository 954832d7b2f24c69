#pragma once
///@file

#include <string>
#include <string_view>

namespace envbind {

/**
 * Remove whitespace from the start and end of a string.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Convert a string to lower case. Only ASCII letters are affected.
 */
std::string toLower(std::string s);

/**
 * @return true iff `s` is a well-formed UTF-8 byte sequence (no
 * overlong forms, no surrogates, nothing above U+10FFFF).
 */
bool isValidUtf8(std::string_view s);

} // namespace envbind
