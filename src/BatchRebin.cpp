#include "fluxbin/BatchRebin.hpp"
#include "fluxbin/Errors.hpp"
#include "fluxbin/PlanCache.hpp"
#include "fluxbin/ThreadPool.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <string>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace fluxbin {

namespace {

RebinPlanPtr make_plan(const Vector& x, const BinTarget& target,
                       const ExecutionPolicy& policy)
{
    if (!policy.cache_plans)
        return std::make_shared<const RebinPlan>(RebinPlan::build(x, target));

    /* resolve + validate first so bad input never reaches the cache */
    require_strictly_increasing(x, "x");
    const Vector edges = target.resolve_edges();
    require_edges_within(edges, x);
    return PlanCache::instance().get_or_build(x, edges);
}

#ifdef _OPENMP
void run_openmp(std::size_t n, unsigned nthreads,
                const std::function<void(std::size_t)>& body)
{
    /* exceptions must not leave an OpenMP region: park the first one */
    std::exception_ptr first;
    std::mutex         first_mtx;

    const std::ptrdiff_t N = static_cast<std::ptrdiff_t>(n);
    #pragma omp parallel for schedule(static) num_threads(nthreads)
    for (std::ptrdiff_t s = 0; s < N; ++s) {
        try {
            body(static_cast<std::size_t>(s));
        } catch (...) {
            std::lock_guard<std::mutex> lk(first_mtx);
            if (!first) first = std::current_exception();
        }
    }
    if (first) std::rethrow_exception(first);
}
#endif

} // anonymous namespace

/* ==============================================================
 *  backend dispatch
 * =============================================================*/
void for_each_index(std::size_t n, const ExecutionPolicy& policy,
                    const std::function<void(std::size_t)>& body)
{
    const Backend  backend  = resolve_backend(policy);
    const unsigned nthreads = resolve_threads(policy);

    switch (backend) {
    case Backend::OpenMP:
#ifdef _OPENMP
        run_openmp(n, nthreads, body);
        return;
#else
        break;                          // resolve_backend never picks this
#endif
    case Backend::ThreadPool: {
        ThreadPool pool(static_cast<unsigned>(
            std::min<std::size_t>(nthreads, std::max<std::size_t>(n, 1))));
        pool.for_each_chunk(n, policy.chunk, [&body](std::size_t b, std::size_t e) {
            for (std::size_t s = b; s < e; ++s) body(s);
        });
        return;
    }
    case Backend::Sequential:
    case Backend::Auto:
        break;
    }

    for (std::size_t s = 0; s < n; ++s) body(s);
}

/* ==============================================================
 *  public interface
 * =============================================================*/
Matrix trapz_rebin_batch(const RebinPlan&       plan,
                         const Matrix&          ys,
                         const ExecutionPolicy& policy)
{
    if (ys.rows() != plan.n_samples())
        throw MalformedInputError("batch has " + std::to_string(ys.rows()) +
                                  " samples per spectrum, x has " +
                                  std::to_string(plan.n_samples()));

    Matrix out(plan.n_bins(), ys.cols());

    /* every worker writes only its own output column */
    for_each_index(static_cast<std::size_t>(ys.cols()), policy,
                   [&](std::size_t s) {
        const auto col = static_cast<Eigen::Index>(s);
        plan.apply_into(ys.col(col), out.col(col));
    });
    return out;
}

Matrix trapz_rebin_batch(const Vector&          x,
                         const Matrix&          ys,
                         const BinTarget&       target,
                         const ExecutionPolicy& policy)
{
    if (ys.rows() != x.size())
        throw MalformedInputError("batch has " + std::to_string(ys.rows()) +
                                  " samples per spectrum, x has " +
                                  std::to_string(x.size()));

    const RebinPlanPtr plan = make_plan(x, target, policy);
    return trapz_rebin_batch(*plan, ys, policy);
}

std::vector<Vector> trapz_rebin_batch(const Vector&              x,
                                      const std::vector<Vector>& ys,
                                      const BinTarget&           target,
                                      const ExecutionPolicy&     policy)
{
    for (std::size_t s = 0; s < ys.size(); ++s) {
        if (ys[s].size() != x.size())
            throw MalformedInputError("spectrum " + std::to_string(s) + " has " +
                                      std::to_string(ys[s].size()) +
                                      " samples, x has " +
                                      std::to_string(x.size()));
    }

    const RebinPlanPtr plan = make_plan(x, target, policy);

    std::vector<Vector> out(ys.size(), Vector(plan->n_bins()));
    for_each_index(ys.size(), policy, [&](std::size_t s) {
        plan->apply_into(ys[s], out[s]);
    });
    return out;
}

} // namespace fluxbin
