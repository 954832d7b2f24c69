#pragma once
///@file

#include "envbind/util/types.hh"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace envbind::testing {

/**
 * Set and unset variables of the process environment for the duration
 * of a test. Every variable touched is restored to its previous state
 * (value or absence) when the guard is destroyed.
 */
class ScopedEnv
{
    std::vector<std::pair<std::string, std::optional<std::string>>> saved;

    void save(const std::string & name);

public:

    ScopedEnv() = default;

    ScopedEnv(const StringMap & vars);

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv & operator=(const ScopedEnv &) = delete;

    ~ScopedEnv();

    void set(const std::string & name, const std::string & value);

    void unset(const std::string & name);
};

} // namespace envbind::testing
