#pragma once
#include "Types.hpp"
#include "Edges.hpp"
#include <memory>
#include <utility>

namespace fluxbin {

/*
 * Sample → bin decomposition of one (x, edges) pair.
 *
 * Row k of the weight matrix holds the contribution of every input sample to
 * output bin k, already divided by the bin width, so that
 *
 *     trapz_rebin(x, y, edges) == weights() * y
 *
 * for any y on the grid x.  The plan is immutable once built and may be
 * shared read-only between threads.
 */
class RebinPlan {
public:
    // Validates exactly like trapz_rebin(); throws RangeError / MalformedInputError.
    static RebinPlan build(const Vector& x, const BinTarget& target);
    static RebinPlan build(const Vector& x, const Vector& edges);

    Eigen::Index n_bins()    const { return weights_.rows(); }
    Eigen::Index n_samples() const { return weights_.cols(); }

    const Vector&       x()       const { return x_; }
    const Vector&       edges()   const { return edges_; }
    const SparseMatrix& weights() const { return weights_; }

    /* ---- weighted reduction --------------------------------------- */
    Vector apply(const Vector& y) const;
    Matrix apply(const Matrix& ys) const;           // one spectrum per column

    /*
     * Variance of each bin mean for independent per-sample variances:
     * var_k = Σ_i w_ki² var_i.  Take the square root for 1-σ errors.
     */
    Vector apply_variance(const Vector& var) const;

    // out must already have n_bins() rows; used by the parallel backends
    void apply_into(const Eigen::Ref<const Vector>& y,
                    Eigen::Ref<Vector>              out) const;

private:
    RebinPlan(Vector x, Vector edges, SparseMatrix w)
        : x_(std::move(x)), edges_(std::move(edges)), weights_(std::move(w)) {}

    Vector       x_;
    Vector       edges_;
    SparseMatrix weights_;
};

using RebinPlanPtr = std::shared_ptr<const RebinPlan>;

} // namespace fluxbin
