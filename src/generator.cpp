#include "vargen/generator.h"

#include "vargen/ordered_parallel.h"

#include <utility>

namespace vargen {

std::vector<std::string> generate_batch(const CombinationSpace &space, const Batch &batch, bool squeeze) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(batch.size()));
    for (std::uint64_t index = batch.start; index < batch.end; ++index) {
        std::string text;
        space.render_into(index, text);
        if (squeeze)
            squeeze_spaces(text);
        out.push_back(std::move(text));
    }
    return out;
}

std::uint64_t expand_space(const CombinationSpace &space, const GeneratorOptions &options, OutputSink &sink) {
    const BatchPlan   plan(space.total(), options.batch_size);
    const std::size_t jobs   = options.jobs != 0 ? options.jobs : default_concurrency(plan.count());
    const std::size_t window = options.max_in_flight != 0 ? options.max_in_flight : jobs * 2;

    ordered_parallel_for(
        plan.count(), jobs, window,
        [&](std::uint64_t i) { return generate_batch(space, plan.at(i), options.squeeze_spaces); },
        [&](std::uint64_t, std::vector<std::string> &&items) { sink.write_batch(items); });
    return plan.count();
}

} // namespace vargen
