#pragma once
#include <cstddef>
#include <string>

namespace fluxbin {

// How the batch reduction is distributed over spectra.
enum class Backend {
    Auto,        // best available: OpenMP, then ThreadPool, then Sequential
    Sequential,
    OpenMP,
    ThreadPool
};

/*
 * Caller-supplied execution strategy for the batch paths.  Nothing here
 * is read from the environment; a policy fully describes what runs.
 */
struct ExecutionPolicy {
    Backend     backend     = Backend::Auto;
    unsigned    threads     = 0;      // 0 = hardware concurrency
    std::size_t chunk       = 0;      // spectra per pool task, 0 = even split
    bool        cache_plans = false;  // reuse plans through PlanCache

    static ExecutionPolicy sequential() { return {Backend::Sequential, 1}; }
};

bool        backend_available(Backend b);
Backend     resolve_backend(const ExecutionPolicy& policy);
unsigned    resolve_threads(const ExecutionPolicy& policy);

std::string to_string(Backend b);
Backend     backend_from_string(const std::string& name);   // throws std::runtime_error

} // namespace fluxbin
