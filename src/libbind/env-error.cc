#include "envbind/bind/env-error.hh"

namespace envbind {

NotUnicodeError::NotUnicodeError(std::string varName, std::string raw)
    : EnvVarError(varName, "%s: not valid text", varName)
    , raw_(std::move(raw))
{
}

EnvParseError::EnvParseError(std::string varName, std::string reason)
    : EnvVarError(varName, "%s: %s", varName, reason)
    , reason_(std::move(reason))
{
}

} // namespace envbind
