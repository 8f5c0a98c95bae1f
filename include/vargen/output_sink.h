// Ordered, flushed-per-batch writer for rendered combinations.
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace vargen {

// Single writer for the output destination. Consecutive items are separated
// by `separator`; nothing is written before the first item unless
// `separator_before_first` is set, and nothing after the last.
class OutputSink {
  public:
    OutputSink(std::ostream &out, std::string separator, bool separator_before_first = false);

    // Write and flush one batch. Throws vargen::error(IOFailure) when the
    // stream goes bad.
    void write_batch(std::span<const std::string> items);

    std::uint64_t items_written() const { return items_written_; }
    std::uint64_t bytes_written() const { return bytes_written_; }
    std::uint64_t batches_written() const { return batches_written_; }

  private:
    std::ostream &out_;
    std::string   separator_;
    bool          pending_separator_ = false;
    std::uint64_t items_written_     = 0;
    std::uint64_t bytes_written_     = 0;
    std::uint64_t batches_written_   = 0;
};

// True when appending to `path` must start with a separator: the file exists,
// is not empty and does not already end with `separator`. Throws
// vargen::error(IOFailure) if an existing file cannot be read.
bool append_needs_separator(const std::filesystem::path &path, std::string_view separator);

// Open `path` for writing, truncating unless `append`. Missing parent
// directories are created. Throws vargen::error(IOFailure).
std::ofstream open_output_file(const std::filesystem::path &path, bool append);

} // namespace vargen
