#pragma once
#include "Types.hpp"
#include <string>
#include <utility>

namespace fluxbin {

/**
 * Build bin edges from bin centres:
 *
 *     e_0 , c_0 , e_1 , c_1 , … , c_{n-1} , e_n
 *
 * Interior edges are midpoints, the two outer edges mirror the adjacent
 * half-spacing.  Throws MalformedInputError for fewer than two centres or
 * a sequence that is not strictly increasing.
 */
Vector centers_to_edges(const Vector& centers);

/**
 * Output grid of a rebin call, given either as N+1 edges or as N centres.
 */
class BinTarget {
public:
    enum class Kind { Edges, Centers };

    BinTarget() : kind_(Kind::Edges) {}      // empty; resolves to an error

    static BinTarget edges(Vector e);
    static BinTarget centers(Vector c);

    Kind          kind()   const { return kind_; }
    const Vector& values() const { return values_; }

    // Edges to integrate over; derived once per call for centres.
    Vector resolve_edges() const;

    Eigen::Index n_bins() const;

private:
    BinTarget(Kind k, Vector v) : kind_(k), values_(std::move(v)) {}

    Kind   kind_;
    Vector values_;
};

/* ---- validation helpers shared by the reference and batch paths ---- */

// len ≥ 2, finite, strictly increasing
void require_strictly_increasing(const Vector& v, const std::string& what);

// x and y describe one tabulated spectrum
void require_sample_grid(const Vector& x, const Vector& y);

// edges strictly increasing and inside [x_0, x_{n-1}]
void require_edges_within(const Vector& edges, const Vector& x);

} // namespace fluxbin
