#include <algorithm>

#include "seqrt/seq/settings.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

SeqSettings seqSettings;

void initSeqRuntime()
{
    seqSettings.applyEnvironment("SEQRT");

    Counter::enabled = seqSettings.showStats;

    int level = seqSettings.verbosity;
    if (level >= 0)
        verbosity = (Verbosity) std::min<int>(level, lvlVomit);

    debug("sequence runtime initialised (hyper-batch %d, hyper-degree %d)",
          seqSettings.hyperBatch.get(), seqSettings.hyperDegree.get());
}

} // namespace seqrt
