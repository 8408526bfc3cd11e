#include "fluxbin/ExecutionPolicy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace fluxbin {

bool backend_available(Backend b)
{
    switch (b) {
    case Backend::Auto:
    case Backend::Sequential:
    case Backend::ThreadPool:
        return true;
    case Backend::OpenMP:
#ifdef _OPENMP
        return true;
#else
        return false;
#endif
    }
    return false;
}

unsigned resolve_threads(const ExecutionPolicy& policy)
{
    if (policy.threads > 0) return policy.threads;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1u : hw;
}

Backend resolve_backend(const ExecutionPolicy& policy)
{
    const unsigned nthreads = resolve_threads(policy);

    switch (policy.backend) {
    case Backend::Sequential:
        return Backend::Sequential;
    case Backend::OpenMP:
        /* no OpenMP runtime → same plan, plain loop */
        if (!backend_available(Backend::OpenMP) || nthreads <= 1)
            return Backend::Sequential;
        return Backend::OpenMP;
    case Backend::ThreadPool:
        return nthreads <= 1 ? Backend::Sequential : Backend::ThreadPool;
    case Backend::Auto:
        if (nthreads <= 1) return Backend::Sequential;
        if (backend_available(Backend::OpenMP)) return Backend::OpenMP;
        return Backend::ThreadPool;
    }
    return Backend::Sequential;
}

std::string to_string(Backend b)
{
    switch (b) {
    case Backend::Auto:       return "auto";
    case Backend::Sequential: return "sequential";
    case Backend::OpenMP:     return "openmp";
    case Backend::ThreadPool: return "threadpool";
    }
    return "unknown";
}

Backend backend_from_string(const std::string& name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "auto")                            return Backend::Auto;
    if (s == "sequential" || s == "serial")     return Backend::Sequential;
    if (s == "openmp" || s == "omp")            return Backend::OpenMP;
    if (s == "threadpool" || s == "threads")    return Backend::ThreadPool;

    throw std::runtime_error("unknown execution backend '" + name + "'");
}

} // namespace fluxbin
