#pragma once
///@file

#include <array>
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>

#include <nlohmann/json_fwd.hpp>

#include "seqrt/seq/list.hh"

namespace seqrt {

/**
 * A statistics counter, on its own cache line since work units of
 * parallel sequences bump them concurrently. Updates are dropped
 * unless `Counter::enabled` is set (the `show-stats` setting).
 */
class alignas(64) Counter
{
    std::atomic<uint64_t> n{0};

public:

    static bool enabled;

    void operator++(int) noexcept
    {
        if (enabled)
            n.fetch_add(1, std::memory_order_relaxed);
    }

    void operator+=(uint64_t k) noexcept
    {
        if (enabled)
            n.fetch_add(k, std::memory_order_relaxed);
    }

    uint64_t load() const noexcept
    {
        return n.load(std::memory_order_relaxed);
    }

    void reset() noexcept
    {
        n = 0;
    }
};

/**
 * How many Lists of each kind were fully reified with a given number
 * of elements.
 */
class ReificationSizes
{
    mutable std::mutex mutex;
    std::array<std::map<size_t, uint64_t>, 3> bySize;

public:

    void record(ListKind kind, size_t size);

    /**
     * `{"List": {"<size>": <count>, ...}, "Array": ..., "Slip": ...}`,
     * omitting kinds with no entries.
     */
    nlohmann::json toJSON() const;

    void clear();
};

struct SeqStats
{
    Counter nrLists;
    Counter nrArrays;
    Counter nrSlips;
    Counter nrContainers;
    Counter nrSeqs;
    Counter nrSeqsCached;
    Counter nrIteratorsTaken;
    Counter nrFlattens;
    Counter nrFlattenArrayFastPaths;
    Counter nrHyperUnits;
    Counter nrHyperFailures;
    Counter nrHyperCancellations;

    ReificationSizes reifiedSizes;

    /**
     * Count a newly allocated List under its kind.
     */
    void countList(ListKind kind);
};

extern SeqStats seqStats;

nlohmann::json statisticsToJSON();

/**
 * Print all counters as a JSON object.
 */
void printStatistics(std::ostream & str);

void resetStatistics();

} // namespace seqrt
