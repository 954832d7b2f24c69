#pragma once

/**
 * @file
 *
 * @brief Some ANSI escape sequences.
 */

namespace envbind {

#ifdef ENVBIND_COLOR
#define ANSI_NORMAL "\e[0m"
#define ANSI_BOLD "\e[1m"
#define ANSI_RED "\e[31;1m"
#define ANSI_WARNING "\e[35;1m"
#else
#define ANSI_NORMAL ""
#define ANSI_BOLD ""
#define ANSI_RED ""
#define ANSI_WARNING ""
#endif

} // namespace envbind
