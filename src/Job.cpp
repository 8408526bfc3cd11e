#include "fluxbin/Job.hpp"
#include "fluxbin/BatchRebin.hpp"
#include "fluxbin/RebinPlan.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace fluxbin {

std::vector<GridGroup> group_by_grid(const std::vector<Spectrum>& spectra)
{
    std::vector<GridGroup> groups;
    for (std::size_t i = 0; i < spectra.size(); ++i) {
        const Vector& x = spectra[i].x;
        auto it = std::find_if(groups.begin(), groups.end(), [&](const GridGroup& g) {
            return g.x.size() == x.size() && g.x == x;
        });
        if (it == groups.end()) groups.push_back({x, {i}});
        else                    it->members.push_back(i);
    }
    return groups;
}

std::string output_path(const JobConfig& job, const std::string& input)
{
    const fs::path in_path(input);
    return (fs::path(job.output_dir) / (in_path.stem().string() + "_rebinned.txt")).string();
}

JobReport run_job(const JobConfig& job, bool verbose)
{
    /* ---------- load every input before any rebinning ----------- */
    std::vector<Spectrum> spectra;
    spectra.reserve(job.inputs.size());
    for (const auto& path : job.inputs) {
        spectra.push_back(load_ascii(path, job.columns));
        if (verbose)
            std::cout << "Loaded: " << fs::path(path).filename()
                      << " (" << spectra.back().x.size() << " points)\n";
    }

    const std::vector<GridGroup> groups = group_by_grid(spectra);

    /* ---------- validate every grid before writing anything ------ */
    std::vector<RebinPlan> plans;
    plans.reserve(groups.size());
    for (const auto& group : groups)
        plans.push_back(RebinPlan::build(group.x, job.target));

    fs::create_directories(job.output_dir);

    JobReport report;
    report.n_groups = groups.size();
    report.outputs.resize(job.inputs.size());

    for (std::size_t g = 0; g < groups.size(); ++g) {
        const GridGroup& group = groups[g];
        const RebinPlan& plan  = plans[g];

        Matrix ys(group.x.size(), static_cast<Eigen::Index>(group.members.size()));
        for (std::size_t m = 0; m < group.members.size(); ++m)
            ys.col(static_cast<Eigen::Index>(m)) = spectra[group.members[m]].y;

        const Matrix out = trapz_rebin_batch(plan, ys, job.execution);

        if (verbose)
            std::cout << "[batch] " << group.members.size() << " spectra, "
                      << group.x.size() << " samples -> " << plan.n_bins() << " bins\n";

        for (std::size_t m = 0; m < group.members.size(); ++m) {
            const std::size_t idx = group.members[m];
            const Spectrum&   s   = spectra[idx];

            Vector err;
            if (s.has_errors())
                err = plan.apply_variance(s.err.array().square().matrix()).array().sqrt().matrix();

            const std::string path = output_path(job, job.inputs[idx]);
            write_ascii(path, plan.edges(), out.col(static_cast<Eigen::Index>(m)), err);
            report.outputs[idx] = path;

            if (verbose) std::cout << "Wrote: " << path << '\n';
        }
    }
    return report;
}

} // namespace fluxbin
