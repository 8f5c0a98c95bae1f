#include "vargen/batch_plan.h"

#include "vargen/error.h"

#include <fmt/format.h>

#include <stdexcept>

namespace vargen {

BatchPlan::BatchPlan(std::uint64_t total, std::int64_t batch_size) : total_(total) {
    if (batch_size <= 0) {
        throw error(ErrorKind::InvalidConfiguration, fmt::format("batch_size must be a positive integer, got {}", batch_size));
    }
    batch_size_ = static_cast<std::uint64_t>(batch_size);
    count_      = total_ / batch_size_ + (total_ % batch_size_ != 0 ? 1 : 0);
}

Batch BatchPlan::at(std::uint64_t i) const {
    if (i >= count_) {
        throw std::out_of_range(fmt::format("batch {} is outside [0, {})", i, count_));
    }
    const std::uint64_t start = i * batch_size_;
    const std::uint64_t left  = total_ - start;
    return Batch{.start = start, .end = start + (left < batch_size_ ? left : batch_size_)};
}

} // namespace vargen
