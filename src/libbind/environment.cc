#include "envbind/bind/environment.hh"
#include "envbind/util/environment-variables.hh"
#include "envbind/util/util.hh"

namespace envbind {

std::optional<std::string> ProcessEnvironment::get(const std::string & name) const
{
    return getEnv(name);
}

std::optional<std::string> MapEnvironment::get(const std::string & name) const
{
    if (auto value = envbind::get(vars, name))
        return *value;
    return std::nullopt;
}

const Environment & processEnvironment()
{
    static ProcessEnvironment env;
    return env;
}

} // namespace envbind
