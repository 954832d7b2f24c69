#pragma once
///@file

#include <cstddef>
#include <string>

namespace envbind {

/**
 * Generator for the names of successive sequence elements, e.g.
 * `APP_PORTS__0`, `APP_PORTS__1`, ... or `APP_HOSTS:0:`, `APP_HOSTS:1:`, ...
 *
 * The name is kept in one buffer of which only the index and the
 * suffix after it are rewritten by `at()`, so probing a long sequence
 * does not allocate a new string per element.
 */
class IndexedName
{
    std::string buf;
    size_t stemLen;
    std::string suffix;

public:

    /**
     * @param stem Everything before the index.
     * @param suffix Everything after the index.
     */
    IndexedName(std::string stem, std::string suffix = "");

    /**
     * @return the name of element `index`. The reference is valid until
     * the next call to `at()`.
     */
    const std::string & at(size_t index);
};

} // namespace envbind
