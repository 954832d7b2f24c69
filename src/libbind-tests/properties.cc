#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "envbind/bind/bind.hh"
#include "envbind/bind/tests/records.hh"

namespace envbind {

using testing::Struct;
using testing::SubStruct;

RC_GTEST_PROP(BindWithPrefixProperty, scalarOverride, (uint16_t port))
{
    MapEnvironment env({{"PREFIX_PORT", std::to_string(port)}});

    SubStruct s;
    RC_ASSERT(bindWithPrefix(s, "PREFIX_", env));
    RC_ASSERT(s.port == port);
}

RC_GTEST_PROP(BindWithPrefixProperty, textIsKeptVerbatim, ())
{
    auto name = *rc::gen::container<std::string>(rc::gen::inRange<char>(' ', '\x7f'));

    MapEnvironment env({{"TEST_PREFIX_NAME", name}});

    Struct s;
    RC_ASSERT(bind(s, env));
    RC_ASSERT(s.name == name);
}

RC_GTEST_PROP(SequenceProperty, lengthIsDiscovered, (std::vector<uint32_t> values, bool colon))
{
    StringMap vars;
    for (size_t i = 0; i < values.size(); ++i)
        vars.emplace(fmt("TEST_PREFIX_ARRAY%s%d", colon ? ":" : "__", i), std::to_string(values[i]));
    MapEnvironment env(vars);

    Struct s;
    RC_ASSERT(bind(s, env) == !values.empty());
    RC_ASSERT(s.array == values);
}

RC_GTEST_PROP(SequenceProperty, gapTruncates, (std::vector<uint32_t> values))
{
    RC_PRE(!values.empty());
    auto gap = *rc::gen::inRange<size_t>(0, values.size());

    StringMap vars;
    for (size_t i = 0; i < values.size(); ++i)
        if (i != gap)
            vars.emplace(fmt("TEST_PREFIX_ARRAY__%d", i), std::to_string(values[i]));
    MapEnvironment env(vars);

    Struct s;
    bind(s, env);
    RC_ASSERT(s.array == std::vector<uint32_t>(values.begin(), values.begin() + gap));
}

RC_GTEST_PROP(NestedSequenceProperty, noTrailingElement, (std::vector<uint16_t> ports))
{
    StringMap vars;
    for (size_t i = 0; i < ports.size(); ++i)
        vars.emplace(fmt("TEST_PREFIX_SUB_STRUCTS__%d__PORT", i), std::to_string(ports[i]));
    MapEnvironment env(vars);

    Struct s;
    bind(s, env);
    RC_ASSERT(s.subStructs.size() == ports.size());
    for (size_t i = 0; i < ports.size(); ++i)
        RC_ASSERT(s.subStructs[i].port == ports[i]);
}

RC_GTEST_PROP(BindProperty, idempotent, (std::vector<uint32_t> values, bool hasPort, uint16_t port))
{
    StringMap vars;
    for (size_t i = 0; i < values.size(); ++i)
        vars.emplace(fmt("TEST_PREFIX_ARRAY:%d", i), std::to_string(values[i]));
    if (hasPort)
        vars.emplace("TEST_PREFIX_OPTIONAL_SUB__PORT", std::to_string(port));
    MapEnvironment env(vars);

    Struct s;
    auto found1 = bind(s, env);
    auto json1 = toJSON(s);
    auto found2 = bind(s, env);

    RC_ASSERT(found1 == found2);
    RC_ASSERT(toJSON(s) == json1);
}

} // namespace envbind
