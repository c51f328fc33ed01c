#include "seqrt/util/logging.hh"

#include <iostream>
#include <sstream>

namespace seqrt {

std::unique_ptr<Logger> logger = makeSimpleLogger();

Verbosity verbosity = lvlInfo;

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, "\033[33;1m" "warning:" "\033[0m" " " + msg);
}

void SimpleLogger::log(Verbosity lvl, std::string_view s)
{
    if (lvl > verbosity)
        return;

    std::string prefix;
    if (printLevel) {
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

    std::lock_guard<std::mutex> guard(lock);
    std::cerr << prefix << filterANSIEscapes(s) << "\n";
}

void SimpleLogger::logEI(const ErrorInfo & ei)
{
    std::ostringstream oss;
    showErrorInfo(oss, ei, true);

    log(ei.level, oss.str());
}

std::unique_ptr<Logger> makeSimpleLogger(bool printLevel)
{
    return std::make_unique<SimpleLogger>(printLevel);
}

} // namespace seqrt
