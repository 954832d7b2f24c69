#include <gtest/gtest.h>

#include "envbind/util/logging.hh"

#include <utility>
#include <vector>

namespace envbind {

class CapturingLogger : public Logger
{
public:
    std::vector<std::pair<Verbosity, std::string>> & lines;

    CapturingLogger(std::vector<std::pair<Verbosity, std::string>> & lines)
        : lines(lines)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        lines.emplace_back(lvl, std::string(s));
    }

    void logEI(const ErrorInfo & ei) override
    {
        lines.emplace_back(ei.level, ei.msg.str());
    }
};

class LoggingTest : public ::testing::Test
{
protected:
    std::vector<std::pair<Verbosity, std::string>> lines;
    std::unique_ptr<Logger> savedLogger;
    Verbosity savedVerbosity;

    void SetUp() override
    {
        savedLogger = std::exchange(logger, std::make_unique<CapturingLogger>(lines));
        savedVerbosity = verbosity;
    }

    void TearDown() override
    {
        logger = std::move(savedLogger);
        verbosity = savedVerbosity;
    }
};

TEST_F(LoggingTest, respectsVerbosity)
{
    verbosity = lvlInfo;
    printInfo("shown %d", 1);
    debug("hidden %d", 2);

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlInfo);
    ASSERT_EQ(lines[0].second, "shown 1");
}

TEST_F(LoggingTest, vomitAtHighestVerbosity)
{
    verbosity = lvlVomit;
    vomit("probing '%s'", "X:0");

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlVomit);
    ASSERT_EQ(lines[0].second, "probing 'X:0'");
}

TEST_F(LoggingTest, argumentsAreNotEvaluatedWhenSuppressed)
{
    verbosity = lvlError;
    int evaluated = 0;
    debug("%d", ++evaluated);

    ASSERT_EQ(evaluated, 0);
    ASSERT_TRUE(lines.empty());
}

TEST_F(LoggingTest, logError)
{
    verbosity = lvlError;
    Error e("X: %s", "bad");
    logError(e.info());

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlError);
    ASSERT_EQ(lines[0].second, "X: bad");
}

} // namespace envbind
