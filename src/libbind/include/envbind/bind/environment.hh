#pragma once
/**
 * @file
 *
 * The source of environment variables consulted while binding.
 */

#include "envbind/util/types.hh"

#include <optional>
#include <string>

namespace envbind {

/**
 * Read-only lookup of environment variables by exact, case-sensitive
 * name.
 *
 * `get()` returns the raw bytes of a variable, or `std::nullopt` if it
 * is not set. Whether those bytes are valid text is decided by the
 * caller (see `bindScalar()`), so a variable is either absent, present
 * with text, or present but undecodable.
 *
 * Lookups must be free of side effects: the binder may ask for the same
 * name more than once during one pass.
 */
struct Environment
{
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string & name) const = 0;
};

/**
 * The environment of the current process.
 */
struct ProcessEnvironment : Environment
{
    std::optional<std::string> get(const std::string & name) const override;
};

/**
 * An environment held in memory, e.g. a snapshot taken with
 * `getEnv()` or one synthesised by a host.
 */
struct MapEnvironment : Environment
{
    StringMap vars;

    MapEnvironment(StringMap vars = {})
        : vars(std::move(vars))
    {
    }

    std::optional<std::string> get(const std::string & name) const override;
};

/**
 * @return the shared `ProcessEnvironment` instance.
 */
const Environment & processEnvironment();

} // namespace envbind
