#pragma once
///@file

#include "envbind/bind/decode.hh"
#include "envbind/bind/environment.hh"
#include "envbind/util/logging.hh"

#include <string>

namespace envbind {

/**
 * Check that the raw value of a variable is text.
 *
 * @throws NotUnicodeError if it is not.
 */
void checkText(const std::string & name, const std::string & raw);

/**
 * Override `current` with the decoded value of the variable `name`, if
 * that variable is set.
 *
 * A single lookup and a single decode attempt are made. If the variable
 * is not set, `current` is left untouched.
 *
 * @return whether the variable was set.
 *
 * @throws NotUnicodeError if the variable is not valid UTF-8.
 * @throws EnvParseError if the decoder rejected the text.
 */
template<Decodable T>
bool bindScalar(T & current, const Environment & env, const std::string & name)
{
    auto raw = env.get(name);
    if (!raw) {
        vomit("environment variable '%s' is not set", name);
        return false;
    }

    checkText(name, *raw);

    try {
        current = EnvDecoder<T>::decode(*raw);
    } catch (DecodeError & e) {
        throw EnvParseError(name, e.message());
    }

    debug("using environment variable '%s'", name);
    return true;
}

} // namespace envbind
