#pragma once
#include "JsonUtils.hpp"
#include "Spectrum.hpp"
#include <string>
#include <vector>

namespace fluxbin {

// Inputs sharing one sample grid are rebinned together through one plan.
struct GridGroup {
    Vector                   x;
    std::vector<std::size_t> members;     // indices into the input list
};

std::vector<GridGroup> group_by_grid(const std::vector<Spectrum>& spectra);

struct JobReport {
    std::size_t              n_groups = 0;
    std::vector<std::string> outputs;     // same order as JobConfig::inputs
};

// <output_dir>/<stem>_rebinned.txt
std::string output_path(const JobConfig& job, const std::string& input);

/*
 * Load every input, rebin each grid group through the batch path and write
 * one table per input.  Error columns are propagated as σ_k = sqrt(Σ w² σ²).
 * All inputs are loaded and every group's plan is built before the first
 * file is written.
 */
JobReport run_job(const JobConfig& job, bool verbose = false);

} // namespace fluxbin
