#pragma once
///@file

#include <exception>
#include <vector>

#include "seqrt/util/error.hh"

namespace seqrt {

MakeError(SeqError, Error);

/**
 * Assignment to a bare (unboxed) element, or to a read-only Container.
 */
MakeError(ImmutableAssignment, SeqError);
MakeError(IndexOutOfRange, SeqError);
MakeError(EmptyCollection, SeqError);

/**
 * An operation that needs every element was applied to a lazy
 * producer.
 */
MakeError(InfiniteLength, SeqError);
MakeError(AlreadyConsumed, SeqError);
MakeError(NotPositional, SeqError);
MakeError(TypeError, SeqError);
MakeError(Cancelled, SeqError);

/**
 * One or more work units of a parallel sequence failed. Carries every
 * unit's failure message; the first failure can be rethrown as-is.
 */
class WorkUnitFailure : public SeqError
{
    size_t failedUnits;
    size_t totalUnits;
    std::vector<std::string> messages;
    std::exception_ptr first;

public:
    WorkUnitFailure(size_t totalUnits, std::vector<std::string> messages, std::exception_ptr first);

    size_t getFailedUnits() const
    {
        return failedUnits;
    }

    size_t getTotalUnits() const
    {
        return totalUnits;
    }

    const std::vector<std::string> & getMessages() const
    {
        return messages;
    }

    [[noreturn]] void rethrowFirst() const;
};

} // namespace seqrt
