#include "fluxbin/Rebin.hpp"
#include "fluxbin/Errors.hpp"

namespace fluxbin {

namespace {

/* -------------------------------------------------------------- *
 *  linear interpolation inside the segment [x_j , x_{j+1}]       *
 * -------------------------------------------------------------- */
inline double interp_segment(const Vector& x, const Vector& y,
                             Eigen::Index j, double xi)
{
    const double t = (xi - x[j]) / (x[j + 1] - x[j]);
    return y[j] * (1.0 - t) + y[j + 1] * t;
}

/* -------------------------------------------------------------- *
 *  two-index merge over the sample grid and the (validated)      *
 *  edge list                                                     *
 * -------------------------------------------------------------- */
Vector integrate_bins(const Vector& x, const Vector& y, const Vector& edges)
{
    const Eigen::Index nx    = x.size();
    const Eigen::Index nbins = edges.size() - 1;

    Vector out(nbins);

    Eigen::Index j = 0;                   // x_j ≤ lo < x_{j+1}
    for (Eigen::Index k = 0; k < nbins; ++k) {
        const double lo = edges[k];
        const double hi = edges[k + 1];

        while (j + 2 < nx && x[j + 1] <= lo) ++j;

        double x_prev = lo;
        double y_prev = interp_segment(x, y, j, lo);
        double area   = 0.0;

        /* samples strictly inside the bin */
        Eigen::Index i = j + 1;
        for (; i < nx && x[i] < hi; ++i) {
            area  += 0.5 * (y_prev + y[i]) * (x[i] - x_prev);
            x_prev = x[i];
            y_prev = y[i];
        }

        /* partial trapezoid up to the right edge; hi ≤ x_{n-1} keeps i < nx */
        const double y_hi = interp_segment(x, y, i - 1, hi);
        area += 0.5 * (y_prev + y_hi) * (hi - x_prev);

        out[k] = area / (hi - lo);
    }
    return out;
}

} // anonymous namespace

/* ==============================================================
 *  public interface
 * =============================================================*/
Vector trapz_rebin(const Vector&    x,
                   const Vector&    y,
                   const BinTarget& target)
{
    require_sample_grid(x, y);

    const Vector edges = target.resolve_edges();
    require_edges_within(edges, x);

    return integrate_bins(x, y, edges);
}

Vector trapz_rebin(const Vector& x,
                   const Vector& y,
                   const Vector& edges)
{
    return trapz_rebin(x, y, BinTarget::edges(edges));
}

} // namespace fluxbin
