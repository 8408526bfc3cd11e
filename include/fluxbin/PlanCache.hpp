/* ===================================================================== *
 *  include/fluxbin/PlanCache.hpp   ––  bounded L-R-U cache of plans
 * ===================================================================== */
#pragma once
#include "RebinPlan.hpp"

#include <ankerl/unordered_dense.h>
#include <list>
#include <memory>
#include <shared_mutex>

namespace fluxbin {

/*
 * Thread–safe bounded cache of RebinPlans with L-R-U eviction and shared
 * ownership.  Evicting a plan never invalidates a pointer a caller holds.
 *
 *   • RebinPlanPtr try_get(x, edges)
 *   • RebinPlanPtr get_or_build(x, edges)
 */
class PlanCache
{
public:
    static PlanCache& instance();

    static std::size_t make_key(const Vector& x, const Vector& edges);

    RebinPlanPtr try_get(const Vector& x, const Vector& edges) const;
    RebinPlanPtr get_or_build(const Vector& x, const Vector& edges);

    /* ------------ house-keeping ------------------------------------ */
    void        set_capacity(std::size_t n);
    std::size_t capacity() const;
    std::size_t size() const;
    void        clear();

private:
    PlanCache() = default;

    using LruList = std::list<std::size_t>;
    struct Node {
        RebinPlanPtr      plan;
        LruList::iterator lru_pos;
    };
    using Map = ankerl::unordered_dense::map<std::size_t, Node>;

    // hit only if the stored plan really is for (x, edges)
    static bool matches(const RebinPlan& p, const Vector& x, const Vector& edges);

    void touch_(Map::iterator it) const;
    void evict_if_needed_();

    mutable std::shared_mutex mtx_;
    mutable Map     cache_;
    mutable LruList lru_;
    std::size_t     max_entries_ = 64;
};

} // namespace fluxbin
