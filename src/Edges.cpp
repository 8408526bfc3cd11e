#include "fluxbin/Edges.hpp"
#include "fluxbin/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace fluxbin {

/* -------------------------------------------------------------- *
 *  build pixel edges from centres:                               *
 *      e_0 , c_0 , e_1 , c_1 , …                                 *
 * -------------------------------------------------------------- */
Vector centers_to_edges(const Vector& centers)
{
    require_strictly_increasing(centers, "centers_to_edges(): centers");

    const Eigen::Index N = centers.size();
    Vector edges(N + 1);

    for (Eigen::Index i = 1; i < N; ++i)
        edges[i] = 0.5 * (centers[i - 1] + centers[i]);
    edges[0] = centers[0] - (edges[1] - centers[0]);
    edges[N] = centers[N - 1] + (centers[N - 1] - edges[N - 1]);

    return edges;
}

/* ==============================================================
 *  BinTarget
 * =============================================================*/
BinTarget BinTarget::edges(Vector e)
{
    return BinTarget(Kind::Edges, std::move(e));
}

BinTarget BinTarget::centers(Vector c)
{
    return BinTarget(Kind::Centers, std::move(c));
}

Vector BinTarget::resolve_edges() const
{
    if (kind_ == Kind::Centers) return centers_to_edges(values_);

    // zero-width / inverted bins are reported here, before any integration
    require_strictly_increasing(values_, "edges");
    return values_;
}

Eigen::Index BinTarget::n_bins() const
{
    return kind_ == Kind::Centers ? values_.size()
                                  : std::max<Eigen::Index>(values_.size() - 1, 0);
}

/* ==============================================================
 *  validation
 * =============================================================*/
void require_strictly_increasing(const Vector& v, const std::string& what)
{
    if (v.size() < 2)
        throw MalformedInputError(what + " needs at least 2 elements, got " +
                                  std::to_string(v.size()));

    if (!v.allFinite())
        throw MalformedInputError(what + " contains NaN/Inf");

    for (Eigen::Index i = 1; i < v.size(); ++i) {
        if (!(v[i] > v[i - 1])) {
            std::ostringstream msg;
            msg << what << " must be strictly increasing (element " << i
                << ": " << v[i - 1] << " -> " << v[i] << ")";
            throw MalformedInputError(msg.str());
        }
    }
}

void require_sample_grid(const Vector& x, const Vector& y)
{
    if (x.size() != y.size())
        throw MalformedInputError("x and y differ in length (" +
                                  std::to_string(x.size()) + " vs " +
                                  std::to_string(y.size()) + ")");
    require_strictly_increasing(x, "x");
}

void require_edges_within(const Vector& edges, const Vector& x)
{
    require_strictly_increasing(edges, "edges");

    const double lo = x[0];
    const double hi = x[x.size() - 1];
    const double e0 = edges[0];
    const double eN = edges[edges.size() - 1];

    if (e0 < lo || eN > hi) {
        std::ostringstream msg;
        msg << "edges must be within input x range: edges span [" << e0
            << ", " << eN << "], x spans [" << lo << ", " << hi << "]";
        throw RangeError(msg.str());
    }
}

} // namespace fluxbin
