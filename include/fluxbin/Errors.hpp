#pragma once
#include <stdexcept>
#include <string>

namespace fluxbin {

// Common base of everything the rebinning core throws.
class RebinError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Requested edges (explicit or derived from centres) reach outside the
 * sampled range [x_0, x_{n-1}].                                          */
class RangeError : public RebinError {
public:
    using RebinError::RebinError;
};

/* Shape / monotonicity / finiteness violations, mismatched lengths,
 * fewer than two samples, zero-width or inverted bins.                   */
class MalformedInputError : public RebinError {
public:
    using RebinError::RebinError;
};

} // namespace fluxbin
