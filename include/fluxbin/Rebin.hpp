#pragma once
#include "Types.hpp"
#include "Edges.hpp"

namespace fluxbin {

/**
 * Flux-conserving rebin of the piecewise-linear density y(x).
 *
 * Every output bin receives the exact integral of the linear interpolant
 * over [e_k, e_{k+1}] divided by the bin width.  The target must lie inside
 * [x_0, x_{n-1}]; RangeError otherwise, MalformedInputError for bad shapes.
 */
Vector trapz_rebin(const Vector&    x,
                   const Vector&    y,
                   const BinTarget& target);

// edges given directly
Vector trapz_rebin(const Vector& x,
                   const Vector& y,
                   const Vector& edges);

} // namespace fluxbin
