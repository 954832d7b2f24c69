#include "envbind/util/environment-variables.hh"
#include "envbind/util/error.hh"

#include <cstdlib>
#include <cstring>

extern char ** environ __attribute__((weak));

namespace envbind {

std::optional<std::string> getEnv(const std::string & key)
{
    char * value = getenv(key.c_str());
    if (!value)
        return {};
    return std::string(value);
}

StringMap getEnv()
{
    StringMap env;
    for (size_t i = 0; environ[i]; ++i) {
        auto s = environ[i];
        auto eq = strchr(s, '=');
        if (!eq)
            // invalid env, just keep going
            continue;
        env.emplace(std::string(s, eq), std::string(eq + 1));
    }
    return env;
}

void setEnv(const std::string & name, const std::string & value)
{
    if (::setenv(name.c_str(), value.c_str(), 1) == -1)
        throw SysError("setting environment variable '%s'", name);
}

void unsetEnv(const std::string & name)
{
    if (::unsetenv(name.c_str()) == -1)
        throw SysError("unsetting environment variable '%s'", name);
}

} // namespace envbind
