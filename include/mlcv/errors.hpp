#pragma once

/// @file include/mlcv/errors.hpp
/// @brief Exception hierarchy for the MLCV library.
///
/// Every failure in the numeric core aborts the current step and propagates
/// to the caller; nothing is retried internally. Messages name the matrix,
/// shape or option that failed together with the offending dimensions.
///
///   Error
///   ├── ConfigurationError         invalid sizes or options (k > d, bad mode)
///   ├── ShapeMismatchError         batch / weight / width mismatches
///   └── NumericalInstabilityError  C(0) not positive definite, eigen failure

#include <stdexcept>
#include <string>

namespace mlcv {

/// Base of all library errors.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid layer sizes, feature counts, reduction modes or option values.
/// Raised eagerly at construction or call time.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/// Batch, weight or feature-width mismatch between inputs. Raised before any
/// numeric work begins.
class ShapeMismatchError : public Error {
public:
    using Error::Error;
};

/// Covariance not positive definite after regularization, eigen solve not
/// converged, or non-finite statistics.
class NumericalInstabilityError : public Error {
public:
    using Error::Error;
};

} // namespace mlcv
