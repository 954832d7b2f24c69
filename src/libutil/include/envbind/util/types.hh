#pragma once
///@file

#include <list>
#include <string>
#include <map>

namespace envbind {

typedef std::list<std::string> Strings;

/**
 * Ordered std::string -> std::string map with a transparent comparator,
 * so lookups by `std::string_view` do not allocate a temporary key.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

} // namespace envbind
