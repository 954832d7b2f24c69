#include "envbind/bind/indexed-name.hh"

#include <charconv>
#include <limits>

namespace envbind {

IndexedName::IndexedName(std::string stem, std::string suffix)
    : buf(std::move(stem))
    , stemLen(buf.size())
    , suffix(std::move(suffix))
{
    buf.reserve(stemLen + std::numeric_limits<size_t>::digits10 + 1 + this->suffix.size());
}

const std::string & IndexedName::at(size_t index)
{
    char digits[std::numeric_limits<size_t>::digits10 + 1];
    auto res = std::to_chars(digits, digits + sizeof(digits), index);
    buf.resize(stemLen);
    buf.append(digits, res.ptr);
    buf.append(suffix);
    return buf;
}

} // namespace envbind
