#pragma once
///@file

#include "seqrt/util/error.hh"

#include <memory>
#include <mutex>

namespace seqrt {

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
};

/**
 * A logger that writes to stderr, optionally prefixing every line
 * with its verbosity level.
 */
class SimpleLogger : public Logger
{
    bool printLevel;
    std::mutex lock;

public:
    explicit SimpleLogger(bool printLevel = false)
        : printLevel(printLevel)
    {
    }

    void log(Verbosity lvl, std::string_view s) override;

    void logEI(const ErrorInfo & ei) override;
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger(bool printLevel = false);

extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)      \
    do {                                       \
        if ((level) <= seqrt::verbosity) {     \
            logger->logEI((level), errorInfo); \
        }                                      \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)     \
    do {                                               \
        auto __lvl = level;                            \
        if (__lvl <= seqrt::verbosity) {               \
            loggerParam->log(__lvl, seqrt::fmt(args)); \
        }                                              \
    } while (0)
#define printMsg(level, args...) printMsgUsing(logger, level, args)

#define printError(args...) printMsg(lvlError, args)
#define notice(args...) printMsg(lvlNotice, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define printTalkative(args...) printMsg(lvlTalkative, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

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

} // namespace seqrt
