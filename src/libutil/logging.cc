#include "envbind/util/logging.hh"
#include "envbind/util/ansicolor.hh"
#include "envbind/util/environment-variables.hh"

#include <cerrno>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace envbind {

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    std::cout << s << "\n";
}

class SimpleLogger : public Logger
{
public:

    bool systemd;

    SimpleLogger()
    {
        systemd = getEnv("IN_SYSTEMD") == "1";
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError:
                c = '3';
                break;
            case lvlWarn:
                c = '4';
                break;
            case lvlNotice:
            case lvlInfo:
                c = '5';
                break;
            case lvlTalkative:
            case lvlChatty:
                c = '6';
                break;
            case lvlDebug:
            case lvlVomit:
                c = '7';
                break;
            default:
                c = '7';
                break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeToStderr(prefix + std::string(s) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.str());
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

void writeToStderr(std::string_view s)
{
    while (!s.empty()) {
        auto res = ::write(STDERR_FILENO, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            /* Ignore failing writes to stderr. */
            return;
        }
        s.remove_prefix(res);
    }
}

} // namespace envbind
