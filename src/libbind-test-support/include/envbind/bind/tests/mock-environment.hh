#pragma once
///@file

#include "envbind/bind/environment.hh"

#include <gmock/gmock.h>

namespace envbind::testing {

/**
 * An environment whose lookups can be scripted and checked, e.g. to
 * verify which variables are consulted and in what order.
 */
class MockEnvironment : public Environment
{
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string & name), (const, override));
};

} // namespace envbind::testing
