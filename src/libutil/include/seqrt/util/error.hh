#pragma once
///@file

/**
 * @brief This file defines two main structs/classes used in seqrt error handling.
 *
 * ErrorInfo provides a standard payload of error information, with conversion to string
 * happening in the logger rather than at the call site.
 *
 * BaseError is the ancestor of seqrt specific exceptions, and contains
 * an ErrorInfo.
 *
 * ErrorInfo structs are sent to the logger as part of an exception, or directly with
 * logError.
 * See libutil-tests/logging.cc for usage examples.
 */

#include "seqrt/util/fmt.hh"

#include <list>
#include <optional>
#include <string>

namespace seqrt {

typedef enum {
    lvlError = 0,
    lvlWarn,
    lvlNotice,
    lvlInfo,
    lvlTalkative,
    lvlChatty,
    lvlDebug,
    lvlVomit
} Verbosity;

struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;
    std::list<Trace> traces;

    /**
     * Exit status.
     */
    unsigned int status = 1;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * Catch Error rather than BaseError.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * Cached formatted contents of `err.msg`.
     */
    mutable std::optional<std::string> what_;
    /**
     * Format `err.msg` and set `what_` to the resulting value.
     */
    const std::string & calcWhat() const;

public:
    BaseError(const BaseError &) = default;
    BaseError & operator=(const BaseError &) = default;
    BaseError & operator=(BaseError &&) = default;

    template<typename... Args>
    BaseError(unsigned int status, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(args...), .status = status}
    {
    }

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = hint}
    {
    }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    /** The error message without "error: " prefixed to it. */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        calcWhat();
        return err;
    }

    template<typename... Args>
    void addTrace(const std::string & fs, const Args &... args)
    {
        addTrace(HintFmt(fs, args...));
    }

    void addTrace(HintFmt hint);

    bool hasTrace() const
    {
        return !err.traces.empty();
    }

    const ErrorInfo & info()
    {
        return err;
    };
};

#define MakeError(newClass, superClass)  \
    class newClass : public superClass   \
    {                                    \
    public:                              \
        using superClass::superClass;    \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * Print a message and abort() when an impossible code path is reached.
 */
[[noreturn]]
void panic(std::string_view msg);

/**
 * Used in places where we can't fall back on a regular error, such as
 * an exhaustive switch whose default arm can only be reached through
 * memory corruption.
 */
#define unreachable() (::seqrt::panic(::seqrt::fmt("unexpected code path reached at %s:%d", __FILE__, __LINE__)))

} // namespace seqrt
