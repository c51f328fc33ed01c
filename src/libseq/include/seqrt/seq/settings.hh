#pragma once
///@file

#include "seqrt/util/config.hh"

namespace seqrt {

struct SeqSettings : Config
{
    Setting<size_t> hyperBatch{
        this,
        64,
        "hyper-batch",
        R"(
          Number of source elements handed to one work unit of a
          parallel sequence.
        )"};

    Setting<size_t> hyperDegree{
        this,
        4,
        "hyper-degree",
        R"(
          Maximum number of work units of a parallel sequence in flight
          at the same time.
        )"};

    Setting<bool> showStats{
        this,
        false,
        "show-stats",
        R"(
          Collect runtime statistics (see `printStatistics()`).
        )"};

    Setting<int> verbosity{
        this,
        -1,
        "verbosity",
        R"(
          Log level to use, from 0 (errors only) to 7 (everything). A
          negative value keeps the current level.
        )"};
};

extern SeqSettings seqSettings;

/**
 * Read `SEQRT_*` environment variables into `seqSettings` and apply
 * the settings that have global effect (statistics and log level).
 */
void initSeqRuntime();

} // namespace seqrt
