// Partition of [0, total) into contiguous batches.
#pragma once

#include <cstddef>
#include <cstdint>

namespace vargen {

inline constexpr std::int64_t kDefaultBatchSize = 10;

// Half-open index range [start, end).
struct Batch {
    std::uint64_t start = 0;
    std::uint64_t end   = 0;

    std::uint64_t size() const { return end - start; }
    bool          operator==(const Batch &) const = default;
};

// Batches are computed on demand, so a plan over a huge space costs nothing
// up front. Every batch holds batch_size indices except possibly the last.
class BatchPlan {
  public:
    // Throws vargen::error(InvalidConfiguration) when batch_size <= 0.
    BatchPlan(std::uint64_t total, std::int64_t batch_size);

    std::uint64_t total() const { return total_; }
    std::uint64_t batch_size() const { return batch_size_; }
    std::uint64_t count() const { return count_; }

    // Throws std::out_of_range for i >= count().
    Batch at(std::uint64_t i) const;

  private:
    std::uint64_t total_      = 0;
    std::uint64_t batch_size_ = 1;
    std::uint64_t count_      = 0;
};

} // namespace vargen
