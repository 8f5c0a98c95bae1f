#include "vargen/output_sink.h"

#include "vargen/error.h"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace vargen {
namespace fs = std::filesystem;

namespace {

std::string errno_message() {
    const int err = errno;
    return err != 0 ? std::string(std::strerror(err)) : std::string("unknown error");
}

} // namespace

OutputSink::OutputSink(std::ostream &out, std::string separator, bool separator_before_first)
    : out_(out), separator_(std::move(separator)), pending_separator_(separator_before_first) {}

void OutputSink::write_batch(std::span<const std::string> items) {
    if (items.empty()) {
        return;
    }
    fmt::memory_buffer buffer;
    for (const auto &item : items) {
        if (pending_separator_) {
            buffer.append(separator_);
        }
        buffer.append(item);
        pending_separator_ = true;
    }
    errno = 0;
    out_.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    out_.flush();
    if (!out_) {
        throw error(ErrorKind::IOFailure, fmt::format("write failed after {} bytes: {}", bytes_written_, errno_message()));
    }
    items_written_ += items.size();
    bytes_written_ += buffer.size();
    ++batches_written_;
}

bool append_needs_separator(const fs::path &path, std::string_view separator) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }
    // Pipes and devices have no end to inspect.
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw error(ErrorKind::IOFailure, fmt::format("cannot stat '{}': {}", path.string(), ec.message()));
    }
    if (size == 0) {
        return false;
    }
    if (separator.empty() || size < separator.size()) {
        return !separator.empty();
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw error(ErrorKind::IOFailure, fmt::format("cannot read '{}': {}", path.string(), errno_message()));
    }
    std::string tail(separator.size(), '\0');
    in.seekg(static_cast<std::streamoff>(size - separator.size()));
    in.read(tail.data(), static_cast<std::streamsize>(tail.size()));
    if (!in) {
        throw error(ErrorKind::IOFailure, fmt::format("cannot read the end of '{}'", path.string()));
    }
    return tail != separator;
}

std::ofstream open_output_file(const fs::path &path, bool append) {
    if (path.empty()) {
        throw error(ErrorKind::InvalidConfiguration, "output path is empty");
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw error(ErrorKind::IOFailure,
                        fmt::format("failed to create directory '{}': {}", path.parent_path().string(), ec.message()));
        }
    }
    const auto    mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    errno = 0;
    std::ofstream file(path, std::ios::out | mode);
    if (!file) {
        throw error(ErrorKind::IOFailure, fmt::format("failed to open output file '{}': {}", path.string(), errno_message()));
    }
    return file;
}

} // namespace vargen
