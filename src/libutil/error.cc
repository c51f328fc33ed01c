#include "seqrt/util/error.hh"

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace seqrt {

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

std::string filterANSIEscapes(std::string_view s)
{
    std::string t;
    t.reserve(s.size());

    for (auto i = s.begin(); i != s.end();) {
        if (*i == '\033' && i + 1 != s.end() && *(i + 1) == '[') {
            i += 2;
            while (i != s.end() && (*i < 0x40 || *i > 0x7e))
                ++i;
            if (i != s.end())
                ++i;
        } else
            t += *i++;
    }

    return t;
}

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, true);
        what_ = oss.str();
        return *what_;
    }
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case Verbosity::lvlError:
        prefix = "error";
        break;
    case Verbosity::lvlWarn:
        prefix = "warning";
        break;
    case Verbosity::lvlNotice:
    case Verbosity::lvlInfo:
        prefix = "info";
        break;
    case Verbosity::lvlTalkative:
        prefix = "talk";
        break;
    case Verbosity::lvlChatty:
        prefix = "chat";
        break;
    case Verbosity::lvlVomit:
        prefix = "vomit";
        break;
    case Verbosity::lvlDebug:
        prefix = "debug";
        break;
    default:
        unreachable();
    }

    out << prefix << ": " << filterANSIEscapes(einfo.msg.str());

    if (showTrace)
        for (auto & trace : einfo.traces)
            out << "\n       … " << filterANSIEscapes(trace.hint.str());

    return out;
}

void panic(std::string_view msg)
{
    std::cerr << msg << std::endl;
    std::abort();
}

} // namespace seqrt
