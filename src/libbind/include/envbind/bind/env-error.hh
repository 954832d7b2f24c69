#pragma once
///@file

#include "envbind/util/error.hh"

#include <string>

namespace envbind {

/**
 * Thrown by an `EnvDecoder` when the text of a variable cannot be
 * turned into a value. Carries only the reason; the variable name is
 * attached by `bindScalar()`.
 */
MakeError(DecodeError, Error);

/**
 * A specific environment variable could not be used.
 *
 * Binding aborts on the first such error, and it reaches the caller of
 * `bind()` unchanged from whatever depth of the record it was thrown
 * at. Fields bound before the failure keep their new values.
 */
class EnvVarError : public Error
{
    std::string varName_;

public:
    template<typename... Args>
    EnvVarError(std::string varName, const std::string & fs, const Args &... args)
        : Error(fs, args...)
        , varName_(std::move(varName))
    {
    }

    const std::string & varName() const
    {
        return varName_;
    }
};

/**
 * The variable is set, but its bytes are not valid UTF-8.
 */
class NotUnicodeError : public EnvVarError
{
    std::string raw_;

public:
    NotUnicodeError(std::string varName, std::string raw);

    const std::string & raw() const
    {
        return raw_;
    }
};

/**
 * The variable is set to text that its field's decoder rejected.
 */
class EnvParseError : public EnvVarError
{
    std::string reason_;

public:
    EnvParseError(std::string varName, std::string reason);

    const std::string & reason() const
    {
        return reason_;
    }
};

} // namespace envbind
