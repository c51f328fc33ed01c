#include "seqrt/seq/seq-error.hh"

namespace seqrt {

WorkUnitFailure::WorkUnitFailure(size_t totalUnits, std::vector<std::string> messages, std::exception_ptr first)
    : SeqError(
          "%d of %d parallel work units failed; first failure: %s",
          messages.size(),
          totalUnits,
          messages.empty() ? std::string("unknown") : messages.front())
    , failedUnits(messages.size())
    , totalUnits(totalUnits)
    , messages(std::move(messages))
    , first(first)
{
}

void WorkUnitFailure::rethrowFirst() const
{
    if (first)
        std::rethrow_exception(first);
    throw SeqError(messages.empty() ? std::string("unknown work unit failure") : messages.front());
}

} // namespace seqrt
