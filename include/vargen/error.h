#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vargen {

// One enumerator per class of fatal failure. Callers dispatch on `kind()`
// instead of parsing messages.
enum class ErrorKind {
    MalformedTemplate,
    EmptyChoiceGroup,
    CombinationSpaceTooLarge,
    InvalidConfiguration,
    IOFailure,
    WorkerFailure,
};

// Stable lowercase name, used in CLI diagnostics.
std::string_view kind_name(ErrorKind kind);

class error : public std::runtime_error {
  public:
    error(ErrorKind kind, std::string message, std::optional<std::size_t> position = std::nullopt)
        : std::runtime_error(std::move(message)), kind_(kind), position_(position) {}

    ErrorKind kind() const { return kind_; }

    // 0-based character offset into the template text, when the failure has one.
    const std::optional<std::size_t> &position() const { return position_; }

  private:
    ErrorKind                 kind_;
    std::optional<std::size_t> position_;
};

// Rethrow `e` with "<context>: " prepended to its message, keeping kind and position.
[[noreturn]] void rethrow_with_context(const error &e, std::string_view context);

} // namespace vargen
