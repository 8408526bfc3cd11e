#include "fluxbin/RebinPlan.hpp"
#include "fluxbin/Errors.hpp"
#include <string>
#include <vector>

namespace fluxbin {

namespace {

using Triplet = Eigen::Triplet<double>;

/* A trapezoid corner is either a sample (t == 0 on segment j) or a point
 * interpolated between samples j and j+1 with fraction t.               */
struct Corner {
    Eigen::Index j;
    double       t;
    double       x;
};

inline void add_corner(std::vector<Triplet>& trip, Eigen::Index k,
                       const Corner& c, double w)
{
    if (c.t != 1.0) trip.emplace_back(k, c.j,     w * (1.0 - c.t));
    if (c.t != 0.0) trip.emplace_back(k, c.j + 1, w * c.t);
}

inline Corner corner_at(const Vector& x, Eigen::Index j, double xi)
{
    return Corner{j, (xi - x[j]) / (x[j + 1] - x[j]), xi};
}

// Same merge as the reference path, emitting weights instead of areas.
SparseMatrix build_weights(const Vector& x, const Vector& edges)
{
    const Eigen::Index nx    = x.size();
    const Eigen::Index nbins = edges.size() - 1;

    std::vector<Triplet> trip;
    trip.reserve(static_cast<std::size_t>(2 * (nx + 2 * nbins)));

    Eigen::Index j = 0;
    for (Eigen::Index k = 0; k < nbins; ++k) {
        const double lo  = edges[k];
        const double hi  = edges[k + 1];
        const double inv = 1.0 / (hi - lo);

        while (j + 2 < nx && x[j + 1] <= lo) ++j;

        Corner prev = corner_at(x, j, lo);

        Eigen::Index i = j + 1;
        for (; i < nx && x[i] < hi; ++i) {
            const Corner cur{i, 0.0, x[i]};
            const double w = 0.5 * (cur.x - prev.x) * inv;
            add_corner(trip, k, prev, w);
            add_corner(trip, k, cur,  w);
            prev = cur;
        }

        const Corner last = corner_at(x, i - 1, hi);
        const double w    = 0.5 * (last.x - prev.x) * inv;
        add_corner(trip, k, prev, w);
        add_corner(trip, k, last, w);
    }

    SparseMatrix W(nbins, nx);
    W.setFromTriplets(trip.begin(), trip.end());   // duplicates are summed
    W.makeCompressed();
    return W;
}

} // anonymous namespace

/* ==============================================================
 *  construction
 * =============================================================*/
RebinPlan RebinPlan::build(const Vector& x, const BinTarget& target)
{
    require_strictly_increasing(x, "x");

    Vector edges = target.resolve_edges();
    require_edges_within(edges, x);

    SparseMatrix W = build_weights(x, edges);
    return RebinPlan(x, std::move(edges), std::move(W));
}

RebinPlan RebinPlan::build(const Vector& x, const Vector& edges)
{
    return build(x, BinTarget::edges(edges));
}

/* ==============================================================
 *  reduction
 * =============================================================*/
Vector RebinPlan::apply(const Vector& y) const
{
    Vector out(n_bins());
    apply_into(y, out);
    return out;
}

Matrix RebinPlan::apply(const Matrix& ys) const
{
    if (ys.rows() != n_samples())
        throw MalformedInputError("batch has " + std::to_string(ys.rows()) +
                                  " rows, grid has " +
                                  std::to_string(n_samples()) + " samples");
    Matrix out = weights_ * ys;
    return out;
}

Vector RebinPlan::apply_variance(const Vector& var) const
{
    if (var.size() != n_samples())
        throw MalformedInputError("variance has " + std::to_string(var.size()) +
                                  " samples, grid has " +
                                  std::to_string(n_samples()));

    Vector out(n_bins());
    for (Eigen::Index k = 0; k < weights_.outerSize(); ++k) {
        double sum = 0.0;
        for (SparseMatrix::InnerIterator it(weights_, k); it; ++it)
            sum += it.value() * it.value() * var[it.col()];
        out[k] = sum;
    }
    return out;
}

void RebinPlan::apply_into(const Eigen::Ref<const Vector>& y,
                           Eigen::Ref<Vector>              out) const
{
    if (y.size() != n_samples())
        throw MalformedInputError("spectrum has " + std::to_string(y.size()) +
                                  " samples, grid has " +
                                  std::to_string(n_samples()));

    const double* yData = y.data();
    for (Eigen::Index k = 0; k < weights_.outerSize(); ++k) {
        double sum = 0.0;
        for (SparseMatrix::InnerIterator it(weights_, k); it; ++it)
            sum += it.value() * yData[it.col()];
        out[k] = sum;
    }
}

} // namespace fluxbin
