#pragma once

/// @file include/erastat/errors.hpp
/// @brief Exception taxonomy for structural and numerical failures.
///
/// # Propagation Policy
/// - Structural errors (bad era column, empty input, unknown column, length
///   mismatch, out-of-range parameter) are caller contract violations and are
///   thrown immediately.
/// - Numerical degeneracies inside one era never throw by default; they use
///   the documented fallbacks (see constants.hpp). `DegenerateEraError` is
///   only raised when the caller opts in via `ZeroStdPolicy::kThrow`.
/// - Feature-set drift between a model and a dataset is not an error: it is
///   reported as a `FeatureAlignment` and logged (see prediction_source.hpp).

#include <stdexcept>
#include <string>

namespace erastat {

/// Base class for every error raised by the engine.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The era column is absent, empty, or contains a null label.
class InvalidEraColumn : public Error {
public:
    using Error::Error;
};

/// A two-way chronological split needs at least two eras.
class InsufficientErasError : public Error {
public:
    using Error::Error;
};

/// Empty input to a rank/quantile transform or a selection over no rows.
class DegenerateInputError : public Error {
public:
    using Error::Error;
};

/// An era's neutralized scores have zero std under `ZeroStdPolicy::kThrow`.
class DegenerateEraError : public Error {
public:
    DegenerateEraError(const std::string& era, const std::string& what)
        : Error(what), era_(era) {}

    /// Label of the offending era.
    [[nodiscard]] const std::string& era() const noexcept { return era_; }

private:
    std::string era_;
};

/// A named column does not exist in the dataset.
class UnknownColumnError : public Error {
public:
    using Error::Error;
};

/// Two columns or matrices that must align have different row counts.
class ShapeMismatchError : public Error {
public:
    using Error::Error;
};

/// A configuration value is outside its legal range.
class InvalidParameterError : public Error {
public:
    using Error::Error;
};

}  // namespace erastat
