#pragma once
#include "Edges.hpp"
#include "ExecutionPolicy.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fluxbin {

nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

// One rebinning job as described by a JSON job file
struct JobConfig {
    std::vector<std::string> inputs;
    int                      columns    = 2;       // 2 or 3
    BinTarget                target;
    std::string              output_dir = ".";
    ExecutionPolicy          execution;
};

/*
 *  "target": { "edges":   [ … ] }
 *          | { "centers": [ … ] }
 *          | { "linspace": [lo, hi, n], "as": "edges" | "centers" }
 */
BinTarget       parse_target(const nlohmann::json& j);
ExecutionPolicy parse_execution(const nlohmann::json& j);
JobConfig       parse_job(const nlohmann::json& j);

} // namespace fluxbin
