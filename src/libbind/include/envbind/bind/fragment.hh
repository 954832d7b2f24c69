#pragma once
///@file

#include <string>
#include <string_view>

namespace envbind {

/**
 * Convert the identifier of a member to the fragment of the
 * environment variable name for it, in upper snake case:
 *
 * - `port` -> `PORT`
 * - `subStructs`, `sub_structs`, `SubStructs` -> `SUB_STRUCTS`
 * - `httpURLPrefix` -> `HTTP_URL_PREFIX`
 *
 * Words are split at `_` and `-`, before an upper-case letter that
 * follows a lower-case letter or digit, and before the last letter of
 * a run of upper-case letters that is followed by a lower-case one.
 * Digits stay attached to the word before them.
 */
std::string toEnvFragment(std::string_view identifier);

} // namespace envbind
