#pragma once
/**
 * @file
 *
 * Utilities for working with the current process's environment
 * variables.
 */

#include <optional>

#include "envbind/util/types.hh"

namespace envbind {

/**
 * @return an environment variable.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Get the entire environment.
 */
StringMap getEnv();

/**
 * Like POSIX `setenv`, but always overrides.
 *
 * @throws SysError if the variable cannot be set.
 */
void setEnv(const std::string & name, const std::string & value);

/**
 * Like POSIX `unsetenv`.
 *
 * @throws SysError if the variable cannot be removed.
 */
void unsetEnv(const std::string & name);

} // namespace envbind
