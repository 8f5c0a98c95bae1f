#include "vargen/error.h"

#include <fmt/format.h>

namespace vargen {

std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MalformedTemplate: return "malformed_template";
    case ErrorKind::EmptyChoiceGroup: return "empty_choice_group";
    case ErrorKind::CombinationSpaceTooLarge: return "combination_space_too_large";
    case ErrorKind::InvalidConfiguration: return "invalid_configuration";
    case ErrorKind::IOFailure: return "io_failure";
    case ErrorKind::WorkerFailure: return "worker_failure";
    }
    return "unknown";
}

void rethrow_with_context(const error &e, std::string_view context) {
    throw error(e.kind(), fmt::format("{}: {}", context, e.what()), e.position());
}

} // namespace vargen
