/* ===================================================================== *
 *  src/PlanCache.cpp
 * ===================================================================== */
#include "fluxbin/PlanCache.hpp"
#include <functional>
#include <mutex>
#include <string_view>

namespace fluxbin {

namespace {

template<typename T>
inline void hash_combine(std::size_t& seed, const T& v)
{
    seed ^= std::hash<T>{}(v) +
            0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

inline std::size_t hash_values(const Vector& v)
{
    const std::string_view bytes(reinterpret_cast<const char*>(v.data()),
                                 static_cast<std::size_t>(v.size()) * sizeof(double));
    return ankerl::unordered_dense::hash<std::string_view>{}(bytes);
}

} // anonymous namespace

/* -------- singleton -------------------------------------------------- */
PlanCache& PlanCache::instance()
{
    static PlanCache inst;
    return inst;
}

std::size_t PlanCache::make_key(const Vector& x, const Vector& edges)
{
    std::size_t seed = 0x5EEDF1A8ULL;   // domain separator

    hash_combine(seed, static_cast<std::size_t>(x.size()));
    hash_combine(seed, hash_values(x));
    hash_combine(seed, static_cast<std::size_t>(edges.size()));
    hash_combine(seed, hash_values(edges));
    return seed;
}

bool PlanCache::matches(const RebinPlan& p, const Vector& x, const Vector& edges)
{
    return p.x().size() == x.size() && p.edges().size() == edges.size() &&
           p.x() == x && p.edges() == edges;
}

/* -------- lookup ----------------------------------------------------- */
RebinPlanPtr PlanCache::try_get(const Vector& x, const Vector& edges) const
{
    const std::size_t key = make_key(x, edges);

    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it == cache_.end() || !matches(*it->second.plan, x, edges))
        return nullptr;
    touch_(it);                      // update LRU even on read
    return it->second.plan;
}

RebinPlanPtr PlanCache::get_or_build(const Vector& x, const Vector& edges)
{
    const std::size_t key = make_key(x, edges);
    {
        std::unique_lock lk(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end() && matches(*it->second.plan, x, edges)) {
            touch_(it);
            return it->second.plan;          //  fast-path hit
        }
    }

    /* ---------- build the plan outside any lock -------------------- */
    RebinPlanPtr plan = std::make_shared<const RebinPlan>(RebinPlan::build(x, edges));

    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        if (matches(*it->second.plan, x, edges)) {   // someone else inserted
            touch_(it);
            return it->second.plan;
        }
        /* key collision: the newer grid wins the slot */
        lru_.erase(it->second.lru_pos);
        cache_.erase(it);
    }

    auto lru_it = lru_.insert(lru_.begin(), key);   // MRU front
    cache_.try_emplace(key, Node{plan, lru_it});
    evict_if_needed_();
    return plan;
}

/* -------- simple helpers -------------------------------------------- */
void PlanCache::set_capacity(std::size_t n)
{
    std::unique_lock lk(mtx_);
    max_entries_ = (n == 0) ? 1 : n;
    evict_if_needed_();
}

std::size_t PlanCache::capacity() const
{
    std::shared_lock lk(mtx_);
    return max_entries_;
}

std::size_t PlanCache::size() const
{
    std::shared_lock lk(mtx_);
    return cache_.size();
}

void PlanCache::clear()
{
    std::unique_lock lk(mtx_);
    cache_.clear();
    lru_.clear();
}

/* ===================================================================== *
 *            internal L-R-U helpers (private)
 * ===================================================================== */
void PlanCache::touch_(Map::iterator it) const
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}

void PlanCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        std::size_t victim = lru_.back();
        lru_.pop_back();
        cache_.erase(victim);        // shared_ptr keeps data alive
    }
}

} // namespace fluxbin
