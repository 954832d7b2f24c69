#include <gtest/gtest.h>

#include "envbind/util/error.hh"

#include <sstream>

namespace envbind {

TEST(BaseError, formatsArguments)
{
    Error e("variable '%s' has %d problems", "X", 2);

    ASSERT_EQ(e.message(), "variable 'X' has 2 problems");
    ASSERT_EQ(std::string(e.what()), "variable 'X' has 2 problems");
}

TEST(BaseError, literalMessageIsNotInterpreted)
{
    Error e(std::string("100% sure"));

    ASSERT_EQ(e.message(), "100% sure");
}

TEST(BaseError, exitStatus)
{
    UsageError e("bad usage");
    ASSERT_EQ(e.info().status, 1u);

    e.withExitStatus(2);
    ASSERT_EQ(e.info().status, 2u);
}

TEST(SysError, appendsStrerror)
{
    SysError e(ENOENT, "opening '%s'", "/nonexistent");

    ASSERT_EQ(e.errNo, ENOENT);
    ASSERT_EQ(e.message(), std::string("opening '/nonexistent': ") + strerror(ENOENT));
}

TEST(SysError, isASystemError)
{
    ASSERT_THROW(throw SysError(EINVAL, "nope"), SystemError);
}

TEST(showErrorInfo, prefixesLevel)
{
    std::ostringstream out;
    showErrorInfo(out, ErrorInfo{.level = lvlWarn, .msg = HintFmt("careful")});

    ASSERT_NE(out.str().find("warning:"), std::string::npos);
    ASSERT_NE(out.str().find("careful"), std::string::npos);
}

TEST(fmt, singleArgumentIsLiteral)
{
    ASSERT_EQ(fmt("50%s"), "50%s");
    ASSERT_EQ(fmt("%s-%d", "a", 1), "a-1");
}

} // namespace envbind
