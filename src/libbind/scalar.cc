#include "envbind/bind/scalar.hh"
#include "envbind/util/strings.hh"

namespace envbind {

void checkText(const std::string & name, const std::string & raw)
{
    if (!isValidUtf8(raw))
        throw NotUnicodeError(name, raw);
}

} // namespace envbind
