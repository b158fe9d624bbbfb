/// @file src/core/errors.cpp
/// @brief PipelineError formatting.

#include "strp/errors.hpp"

#include <fmt/format.h>

namespace strp {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedInput:     return "MalformedInput";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::TrainingFailure:    return "TrainingFailure";
        case ErrorKind::InsufficientModels: return "InsufficientModels";
    }
    return "Unknown";
}

std::string PipelineError::to_string() const {
    return fmt::format("{}: {}", strp::to_string(kind), message);
}

PipelineError make_error(ErrorKind kind, std::string message) {
    return PipelineError{.kind = kind, .message = std::move(message)};
}

}  // namespace strp
