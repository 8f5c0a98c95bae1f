// Thread-safe stderr logging for the vargen tool.
#pragma once

#include <fmt/format.h>
#include <llvm/Support/raw_ostream.h>

#include <atomic>
#include <iterator>
#include <mutex>
#include <string_view>
#include <utility>

namespace vargen::tool {

inline std::mutex &errs_mutex() {
    static std::mutex mu;
    return mu;
}

inline std::atomic<bool> &verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on, std::memory_order_relaxed); }

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    llvm::errs() << fmt::to_string(buffer);
}

inline void log_err_raw(std::string_view message) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    llvm::errs() << message;
}

// Printed only with --verbose.
template <typename... Args>
void log_info(fmt::format_string<Args...> format_string, Args &&...args) {
    if (!verbose_flag().load(std::memory_order_relaxed)) {
        return;
    }
    log_err(format_string, std::forward<Args>(args)...);
}

} // namespace vargen::tool
