#include "envbind/bind/fragment.hh"

namespace envbind {

static bool isUpper(char c)
{
    return c >= 'A' && c <= 'Z';
}

static bool isLower(char c)
{
    return c >= 'a' && c <= 'z';
}

static bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

std::string toEnvFragment(std::string_view identifier)
{
    std::string res;
    res.reserve(identifier.size() + 4);

    auto separate = [&]() {
        if (!res.empty() && res.back() != '_')
            res.push_back('_');
    };

    for (size_t i = 0; i < identifier.size(); ++i) {
        char c = identifier[i];

        if (c == '_' || c == '-') {
            separate();
            continue;
        }

        if (isUpper(c) && i > 0) {
            char prev = identifier[i - 1];
            bool nextLower = i + 1 < identifier.size() && isLower(identifier[i + 1]);
            if (isLower(prev) || isDigit(prev) || (isUpper(prev) && nextLower))
                separate();
        }

        res.push_back(isLower(c) ? c - 'a' + 'A' : c);
    }

    while (!res.empty() && res.back() == '_')
        res.pop_back();

    return res;
}

} // namespace envbind
