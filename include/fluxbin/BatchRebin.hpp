#pragma once
#include "Types.hpp"
#include "Edges.hpp"
#include "RebinPlan.hpp"
#include "ExecutionPolicy.hpp"
#include <functional>
#include <vector>

namespace fluxbin {

/**
 * Rebin many spectra that share one sample grid x onto one target.
 *
 * The (x, edges) decomposition is built once as a RebinPlan and applied to
 * every spectrum; column s of the result equals trapz_rebin(x, ys.col(s),
 * target) to floating-point accuracy, whatever backend the policy selects.
 * All validation happens before the first spectrum is touched, so a failure
 * never leaves a partially filled result.
 *
 *   ys      : x.size() × n_spectra   (one spectrum per column)
 *   returns : n_bins   × n_spectra
 */
Matrix trapz_rebin_batch(const Vector&          x,
                         const Matrix&          ys,
                         const BinTarget&       target,
                         const ExecutionPolicy& policy = {});

std::vector<Vector> trapz_rebin_batch(const Vector&              x,
                                      const std::vector<Vector>& ys,
                                      const BinTarget&           target,
                                      const ExecutionPolicy&     policy = {});

// precomputed plan
Matrix trapz_rebin_batch(const RebinPlan&       plan,
                         const Matrix&          ys,
                         const ExecutionPolicy& policy = {});

/*
 * Run body(s) for s in [0, n) under the policy's backend.  Every index is
 * visited exactly once; exceptions from the body reach the caller.
 */
void for_each_index(std::size_t n, const ExecutionPolicy& policy,
                    const std::function<void(std::size_t)>& body);

} // namespace fluxbin
