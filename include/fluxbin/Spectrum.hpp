#pragma once
#include "Types.hpp"
#include <string>

namespace fluxbin {

// Tabulated spectrum as read from disk
struct Spectrum {
    Vector x;            // abscissa (e.g. wavelength), strictly increasing
    Vector y;            // density
    Vector err;          // 1-σ uncertainties; empty for 2-column input

    bool has_errors() const { return err.size() == x.size() && err.size() > 0; }
};

/*
 * Whitespace separated table with 2 (x y) or 3 (x y err) columns.
 * '#' comments, blank lines and unparsable lines are skipped.
 */
Spectrum load_ascii(const std::string& path, int columns = 2);

// one row per output bin: lower edge, upper edge, value[, err]
void write_ascii(const std::string& path,
                 const Vector&      edges,
                 const Vector&      y,
                 const Vector&      err = Vector());

} // namespace fluxbin
