#include "envbind/bind/tests/scoped-env.hh"
#include "envbind/util/environment-variables.hh"
#include "envbind/util/logging.hh"

namespace envbind::testing {

ScopedEnv::ScopedEnv(const StringMap & vars)
{
    for (auto & [name, value] : vars)
        set(name, value);
}

ScopedEnv::~ScopedEnv()
{
    for (auto i = saved.rbegin(); i != saved.rend(); ++i) {
        try {
            if (i->second)
                setEnv(i->first, *i->second);
            else
                unsetEnv(i->first);
        } catch (SystemError & e) {
            logError(e.info());
        }
    }
}

void ScopedEnv::save(const std::string & name)
{
    saved.emplace_back(name, getEnv(name));
}

void ScopedEnv::set(const std::string & name, const std::string & value)
{
    save(name);
    setEnv(name, value);
}

void ScopedEnv::unset(const std::string & name)
{
    save(name);
    unsetEnv(name);
}

} // namespace envbind::testing
