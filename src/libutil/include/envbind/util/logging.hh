#pragma once
///@file

#include "envbind/util/error.hh"

#include <memory>
#include <string>
#include <string_view>

namespace envbind {

class Logger
{
public:

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger();

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)         \
    do {                                          \
        if ((level) <= envbind::verbosity) {      \
            envbind::logger->logEI((level), errorInfo); \
        }                                         \
    } while (0)

#define logError(errorInfo...) logErrorInfo(envbind::lvlError, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)   \
    do {                                             \
        auto __lvl = level;                          \
        if (__lvl <= envbind::verbosity) {           \
            loggerParam->log(__lvl, envbind::fmt(args)); \
        }                                            \
    } while (0)
#define printMsg(level, args...) printMsgUsing(envbind::logger, level, args)

#define printError(args...) printMsg(envbind::lvlError, args)
#define printInfo(args...) printMsg(envbind::lvlInfo, args)
#define debug(args...) printMsg(envbind::lvlDebug, args)
#define vomit(args...) printMsg(envbind::lvlVomit, args)

/**
 * if verbosity >= lvlWarn, print a message with a yellow 'warning:' prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

} // namespace envbind
