#pragma once
///@file

#include "envbind/util/types.hh"
#include "envbind/util/error.hh"

#include <optional>
#include <string_view>

namespace envbind {

/**
 * Parse a string into an integer.
 *
 * Only plain decimal notation is accepted, with an optional leading
 * sign. Values outside the range of `N` are rejected, as is a leading
 * `-` for unsigned types.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s);

/**
 * Parse a string into a float.
 */
template<class N>
std::optional<N> string2Float(const std::string_view s);

/**
 * Get a value for the specified key from an associate container.
 */
template<class T, typename K>
const typename T::mapped_type * get(const T & map, const K & key)
{
    auto i = map.find(key);
    if (i == map.end())
        return nullptr;
    return &i->second;
}

template<class T, typename K>
typename T::mapped_type * get(T & map, const K & key)
{
    auto i = map.find(key);
    if (i == map.end())
        return nullptr;
    return &i->second;
}

/**
 * Deleted because this is use-after-free liability. Just don't pass temporaries to this overload set.
 */
template<class T, typename K>
typename T::mapped_type * get(T && map, const K & key) = delete;

/**
 * C++17 std::visit boilerplate
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace envbind
