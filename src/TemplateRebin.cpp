#include "fluxbin/TemplateRebin.hpp"
#include "fluxbin/BatchRebin.hpp"
#include "fluxbin/Errors.hpp"
#include "fluxbin/Rebin.hpp"
#include <cmath>
#include <sstream>
#include <vector>

namespace fluxbin {

std::map<std::string, Matrix>
rebin_template(const Vector&          x,
               const Vector&          y,
               const Vector&          redshifts,
               const TargetSet&       targets,
               const ExecutionPolicy& policy)
{
    /* ---------- validation of everything, before any work ---------- */
    require_sample_grid(x, y);

    for (Eigen::Index j = 0; j < redshifts.size(); ++j) {
        const double z = redshifts[j];
        if (!std::isfinite(z) || z <= -1.0) {
            std::ostringstream msg;
            msg << "redshift " << z << " (index " << j << ") must be finite and > -1";
            throw MalformedInputError(msg.str());
        }
    }

    std::vector<std::string> names;
    std::vector<Vector>      edges;
    names.reserve(targets.size());
    edges.reserve(targets.size());
    for (const auto& [name, target] : targets) {
        names.push_back(name);
        edges.push_back(target.resolve_edges());
    }

    const double x_lo = x[0];
    const double x_hi = x[x.size() - 1];
    for (Eigen::Index j = 0; j < redshifts.size(); ++j) {
        const double scale = 1.0 + redshifts[j];
        for (std::size_t t = 0; t < names.size(); ++t) {
            const Vector& e = edges[t];
            if (e[0] < scale * x_lo || e[e.size() - 1] > scale * x_hi) {
                std::ostringstream msg;
                msg << "target '" << names[t] << "' [" << e[0] << ", "
                    << e[e.size() - 1] << "] is outside the template range ["
                    << scale * x_lo << ", " << scale * x_hi
                    << "] at redshift " << redshifts[j];
                throw RangeError(msg.str());
            }
        }
    }

    /* ---------- one column per redshift, one worker per column ----- */
    std::vector<Matrix> result(names.size());
    for (std::size_t t = 0; t < names.size(); ++t)
        result[t].resize(edges[t].size() - 1, redshifts.size());

    for_each_index(static_cast<std::size_t>(redshifts.size()), policy,
                   [&](std::size_t s) {
        const auto   j  = static_cast<Eigen::Index>(s);
        const Vector xz = (1.0 + redshifts[j]) * x;
        for (std::size_t t = 0; t < names.size(); ++t)
            result[t].col(j) = trapz_rebin(xz, y, edges[t]);
    });

    std::map<std::string, Matrix> out;
    for (std::size_t t = 0; t < names.size(); ++t)
        out.emplace(names[t], std::move(result[t]));
    return out;
}

} // namespace fluxbin
