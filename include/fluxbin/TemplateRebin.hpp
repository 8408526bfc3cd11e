#pragma once
#include "Types.hpp"
#include "Edges.hpp"
#include "ExecutionPolicy.hpp"
#include <map>
#include <string>

namespace fluxbin {

// camera / band name → output grid of that camera
using TargetSet = std::map<std::string, BinTarget>;

/**
 * Rebin a rest-frame template (x, y) onto every target grid at every trial
 * redshift.  At redshift z the template abscissa becomes (1+z)·x; the
 * density values are used unchanged.
 *
 * Returns, per target name, an n_bins × redshifts.size() matrix whose column
 * j is the template seen at redshifts[j].  Every (redshift, target) pair is
 * range-checked before any integration, so one out-of-range pair rejects
 * the whole call with RangeError.
 */
std::map<std::string, Matrix>
rebin_template(const Vector&          x,
               const Vector&          y,
               const Vector&          redshifts,
               const TargetSet&       targets,
               const ExecutionPolicy& policy = {});

} // namespace fluxbin
