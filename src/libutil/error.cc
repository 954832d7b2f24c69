#include "envbind/util/error.hh"
#include "envbind/util/ansicolor.hh"

#include <sstream>

namespace envbind {

std::optional<std::string> ErrorInfo::programName = std::nullopt;

const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        what_ = err.msg.str();
        return *what_;
    }
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    std::string prefix;
    switch (einfo.level) {
    case Verbosity::lvlError: {
        prefix = ANSI_RED "error";
        break;
    }
    case Verbosity::lvlWarn: {
        prefix = ANSI_WARNING "warning";
        break;
    }
    default: {
        prefix = ANSI_BOLD "note";
        break;
    }
    }

    if (einfo.programName)
        prefix = fmt("%s: %s", *einfo.programName, prefix);

    out << prefix << ":" ANSI_NORMAL " " << einfo.msg.str();
    return out;
}

} // namespace envbind
