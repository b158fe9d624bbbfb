#pragma once

/// @file include/strp/errors.hpp
/// @brief Error kinds and the value-or-error `Result<T>` carrier.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name the four failure kinds the pipeline can report and carry them next
/// to a value without exceptions.
///
/// ## Guarantees
/// - No operation returning `Result` throws on an expected failure path
/// - `value()` on an error result throws `std::logic_error` (programming bug)
///
/// ## NOT Responsible For
/// - Per-record problems inside a batch; those are counted in
///   `AssemblyDiagnostics` and never surface as errors
/// - Geospatial misses; those are the `NO_POI_WITHIN_CAP_KM` sentinel

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace strp {

enum class ErrorKind {
    MalformedInput,      ///< A whole input (not a single record) is unusable
    ConfigurationError,  ///< Invalid or inconsistent configuration
    TrainingFailure,     ///< A regressor failed to fit or timed out
    InsufficientModels,  ///< Too few trained models to form an ensemble
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

struct PipelineError {
    ErrorKind   kind;
    std::string message;

    /// "ConfigurationError: <message>"
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] PipelineError make_error(ErrorKind kind, std::string message);

/// Holds either a `T` or a `PipelineError`.
///
/// Reads like `std::optional<T>` (`has_value`, `operator bool`, `*`, `->`)
/// with `error()` to inspect the cause.
template <class T>
class Result {
    static_assert(!std::is_same_v<T, PipelineError>);

public:
    Result(T value) : state_(std::move(value)) {}                 // NOLINT
    Result(PipelineError error) : state_(std::move(error)) {}     // NOLINT

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        check();
        return std::get<0>(state_);
    }
    [[nodiscard]] const T& value() const& {
        check();
        return std::get<0>(state_);
    }
    [[nodiscard]] T&& value() && {
        check();
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const PipelineError& error() const {
        if (has_value()) throw std::logic_error("Result::error() on a value");
        return std::get<1>(state_);
    }

    T&       operator*() &       { return value(); }
    const T& operator*() const&  { return value(); }
    T*       operator->()        { return &value(); }
    const T* operator->() const  { return &value(); }

private:
    void check() const {
        if (!has_value()) {
            throw std::logic_error("Result::value() on error: " +
                                   std::get<1>(state_).to_string());
        }
    }

    std::variant<T, PipelineError> state_;
};

}  // namespace strp
