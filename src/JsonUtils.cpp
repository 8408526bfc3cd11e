#include "fluxbin/JsonUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace fluxbin {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open job file '" + path + "'");
    nlohmann::json j;
    f >> j;
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out;
    auto begin = input.cbegin();
    std::smatch m;
    // substituted values are copied verbatim, never re-scanned
    while (std::regex_search(begin, input.cend(), m, re)) {
        out.append(m.prefix().first, m.prefix().second);
        const std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out += env ? env : "";
        begin = m[0].second;
    }
    out.append(begin, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ------------------------------------------------------------------ */

static Vector to_vector(const nlohmann::json& arr)
{
    std::vector<double> v = arr.get<std::vector<double>>();
    return Eigen::Map<Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

BinTarget parse_target(const nlohmann::json& j)
{
    if (j.contains("edges"))   return BinTarget::edges(to_vector(j["edges"]));
    if (j.contains("centers")) return BinTarget::centers(to_vector(j["centers"]));

    if (j.contains("linspace")) {
        const auto& ls = j["linspace"];
        if (!ls.is_array() || ls.size() != 3)
            throw std::runtime_error("target.linspace must be [lo, hi, n]");

        const double lo = ls[0].get<double>();
        const double hi = ls[1].get<double>();
        const int    n  = ls[2].get<int>();
        if (n < 2)
            throw std::runtime_error("target.linspace needs n >= 2");

        Vector v = Vector::LinSpaced(n, lo, hi);
        const std::string as = j.value("as", std::string("edges"));
        if (as == "edges")   return BinTarget::edges(std::move(v));
        if (as == "centers") return BinTarget::centers(std::move(v));
        throw std::runtime_error("target.as must be 'edges' or 'centers', got '" + as + "'");
    }

    throw std::runtime_error("target needs one of 'edges', 'centers' or 'linspace'");
}

ExecutionPolicy parse_execution(const nlohmann::json& j)
{
    ExecutionPolicy p;
    if (j.contains("backend"))    p.backend     = backend_from_string(j["backend"].get<std::string>());
    if (j.contains("threads"))    p.threads     = j["threads"].get<unsigned>();
    if (j.contains("chunk"))      p.chunk       = j["chunk"].get<std::size_t>();
    if (j.contains("cachePlans")) p.cache_plans = j["cachePlans"].get<bool>();
    return p;
}

JobConfig parse_job(const nlohmann::json& j)
{
    if (!j.contains("inputs") || j["inputs"].empty())
        throw std::runtime_error("job file lists no 'inputs'");
    if (!j.contains("target"))
        throw std::runtime_error("job file has no 'target'");

    JobConfig cfg;
    cfg.inputs  = j["inputs"].get<std::vector<std::string>>();
    cfg.columns = j.value("columns", 2);
    if (cfg.columns != 2 && cfg.columns != 3)
        throw std::runtime_error("'columns' must be 2 or 3");

    cfg.target     = parse_target(j["target"]);
    cfg.output_dir = j.value("outputDir", std::string("."));
    if (j.contains("execution"))
        cfg.execution = parse_execution(j["execution"]);
    return cfg;
}

} // namespace fluxbin
