#include "envbind/bind/bind.hh"
#include "envbind/bind/indexed-name.hh"

namespace envbind {

bool bindNested(
    const std::string & base,
    bool clearAbsentOptionals,
    const std::function<bool(const std::string & prefix, bool clearAbsentOptionals)> & bind)
{
    /* Both forms are always tried, the underscore form last. */
    bool colon = bind(base + ":", clearAbsentOptionals);
    bool underscore = bind(base + "__", false);
    return colon || underscore;
}

bool expandSequence(
    const std::string & base,
    const std::function<bool(const std::string & name)> & tryAppend,
    const std::function<void()> & keepLast)
{
    IndexedName colon(base + ":");
    IndexedName underscore(base + "__");

    bool found = false;

    for (size_t i = 0;; ++i) {
        if (!tryAppend(colon.at(i)) && !tryAppend(underscore.at(i))) {
            vomit("sequence '%s' ends before index %d", base, i);
            break;
        }
        if (i == 0)
            keepLast();
        found = true;
    }

    return found;
}

bool expandNestedSequence(
    const std::string & base,
    const std::function<void()> & appendDefault,
    const std::function<bool(const std::string & prefix)> & bindLast,
    const std::function<void()> & popLast,
    const std::function<void()> & keepLast)
{
    IndexedName colon(base + ":", ":");
    IndexedName underscore(base + "__", "__");

    bool found = false;

    for (size_t i = 0;; ++i) {
        appendDefault();
        if (!bindLast(colon.at(i)) && !bindLast(underscore.at(i))) {
            popLast();
            vomit("sequence '%s' ends before index %d", base, i);
            break;
        }
        if (i == 0)
            keepLast();
        found = true;
    }

    return found;
}

bool bindOptional(
    bool present,
    bool clearAbsent,
    const std::function<void()> & emplace,
    const std::function<void()> & reset,
    const std::function<bool()> & bindInner)
{
    bool inPlace = present && !clearAbsent;

    if (!inPlace)
        emplace();

    bool found;
    try {
        found = bindInner();
    } catch (...) {
        reset();
        throw;
    }

    if (!found && !inPlace)
        reset();

    return found;
}

} // namespace envbind
