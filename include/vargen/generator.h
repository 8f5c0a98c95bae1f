// Batch materialization and the ordered parallel expansion of one template.
#pragma once

#include "vargen/batch_plan.h"
#include "vargen/combination_space.h"
#include "vargen/output_sink.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vargen {

struct GeneratorOptions {
    std::int64_t batch_size     = kDefaultBatchSize;
    std::size_t  jobs           = 0; // 0: hardware concurrency
    std::size_t  max_in_flight  = 0; // 0: twice the job count
    bool         squeeze_spaces = false;
};

// Render indices [batch.start, batch.end) in ascending order.
std::vector<std::string> generate_batch(const CombinationSpace &space, const Batch &batch, bool squeeze = false);

// Stream every combination of `space` into `sink` in index order. Batches are
// rendered concurrently and written one at a time. Returns the number of
// batches written.
std::uint64_t expand_space(const CombinationSpace &space, const GeneratorOptions &options, OutputSink &sink);

} // namespace vargen
