#include "seqrt/seq/stats.hh"

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace seqrt {

bool Counter::enabled = false;

SeqStats seqStats;

void ReificationSizes::record(ListKind kind, size_t size)
{
    if (!Counter::enabled)
        return;
    std::lock_guard<std::mutex> lock(mutex);
    bySize[(size_t) kind][size]++;
}

nlohmann::json ReificationSizes::toJSON() const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto res = nlohmann::json::object();
    for (auto kind : {ListKind::List, ListKind::Array, ListKind::Slip}) {
        auto & sizes = bySize[(size_t) kind];
        if (sizes.empty())
            continue;
        auto & obj = res[std::string(showListKind(kind))] = nlohmann::json::object();
        for (auto & [size, count] : sizes)
            obj[std::to_string(size)] = count;
    }
    return res;
}

void ReificationSizes::clear()
{
    std::lock_guard<std::mutex> lock(mutex);
    for (auto & sizes : bySize)
        sizes.clear();
}

void SeqStats::countList(ListKind kind)
{
    switch (kind) {
    case ListKind::List:
        nrLists++;
        break;
    case ListKind::Array:
        nrArrays++;
        break;
    case ListKind::Slip:
        nrSlips++;
        break;
    }
}

nlohmann::json statisticsToJSON()
{
    using json = nlohmann::json;

    json topObj = json::object();

    topObj["lists"] = {
        {"lists", seqStats.nrLists.load()},
        {"arrays", seqStats.nrArrays.load()},
        {"slips", seqStats.nrSlips.load()},
        {"containers", seqStats.nrContainers.load()},
        {"reifiedSizes", seqStats.reifiedSizes.toJSON()},
    };

    topObj["sequences"] = {
        {"created", seqStats.nrSeqs.load()},
        {"cached", seqStats.nrSeqsCached.load()},
        {"iteratorsTaken", seqStats.nrIteratorsTaken.load()},
    };

    topObj["flatten"] = {
        {"calls", seqStats.nrFlattens.load()},
        {"arrayFastPaths", seqStats.nrFlattenArrayFastPaths.load()},
    };

    topObj["hyper"] = {
        {"units", seqStats.nrHyperUnits.load()},
        {"failures", seqStats.nrHyperFailures.load()},
        {"cancellations", seqStats.nrHyperCancellations.load()},
    };

    return topObj;
}

void printStatistics(std::ostream & str)
{
    str << statisticsToJSON().dump(2) << "\n";
}

void resetStatistics()
{
    for (auto * c :
         {&seqStats.nrLists,
          &seqStats.nrArrays,
          &seqStats.nrSlips,
          &seqStats.nrContainers,
          &seqStats.nrSeqs,
          &seqStats.nrSeqsCached,
          &seqStats.nrIteratorsTaken,
          &seqStats.nrFlattens,
          &seqStats.nrFlattenArrayFastPaths,
          &seqStats.nrHyperUnits,
          &seqStats.nrHyperFailures,
          &seqStats.nrHyperCancellations})
        c->reset();
    seqStats.reifiedSizes.clear();
}

} // namespace seqrt
