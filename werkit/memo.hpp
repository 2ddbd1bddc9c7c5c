#pragma once

#include "common.hpp"
#include "pipeline.hpp"

// A value computed at most once, on first access. Concurrent first accesses block until the single
// computation has finished. Nothing is allocated until then.
template <class V>
class OnceCell
{
    mutable std::mutex mtx;
    mutable std::atomic<V *> value{nullptr};

public:
    OnceCell() = default;
    OnceCell(OnceCell &&other) noexcept : value(other.value.exchange(nullptr)) {}
    OnceCell &operator=(OnceCell &&other) noexcept
    {
        delete value.exchange(other.value.exchange(nullptr));
        return *this;
    }
    ~OnceCell() { delete value.load(); }

    template <class F>
    const V &get(F compute) const
    {
        V *ret = value.load(std::memory_order_acquire);
        if (ret != nullptr)
            return *ret;
        std::lock_guard<std::mutex> lock(mtx);
        ret = value.load(std::memory_order_relaxed);
        if (ret == nullptr)
        {
            ret = new V(compute());
            value.store(ret, std::memory_order_release);
        }
        return *ret;
    }

    bool has_value() const { return value.load() != nullptr; }

    // Forget the value. Not safe against concurrent `get`.
    void reset() { delete value.exchange(nullptr); }
};

// Per-instance memoization of a pipeline-derived value. The caller passes the key for the stage the
// value is derived at, so a value computed under one configuration is never returned for another.
// The entry map is created by the first insertion; entries then live as long as the cache.
template <class V>
class StageCache
{
    using Entries = lockmap<PipelineKey, V>;

    mutable std::atomic<Entries *> entries{nullptr};

    // The entry map, created on first call. Racing creators agree on a single map.
    Entries *storage() const
    {
        Entries *ret = entries.load(std::memory_order_acquire);
        if (ret != nullptr)
            return ret;
        auto fresh = std::make_unique<Entries>();
        if (entries.compare_exchange_strong(ret, fresh.get(), std::memory_order_acq_rel))
            return fresh.release();
        return ret;
    }

public:
    StageCache() = default;
    StageCache(StageCache &&other) noexcept : entries(other.entries.exchange(nullptr)) {}
    StageCache &operator=(StageCache &&other) noexcept
    {
        delete entries.exchange(other.entries.exchange(nullptr));
        return *this;
    }
    ~StageCache() { delete entries.load(); }

    // Return the value stored under `key`, calling `compute` first if there is none. `compute` runs
    // without holding any lock; if two threads race, the first insertion wins and both see it.
    template <class F>
    const V &get(const PipelineKey &key, F compute) const
    {
        const V *found = nullptr;
        Entries *table = entries.load(std::memory_order_acquire);
        if ((table != nullptr) && table->if_contains(key, [&found](const V &stored) { found = &stored; }))
            return *found;

        SPDLOG_TRACE("StageCache: miss for {}.", key.str());
        V value = compute();
        table = storage();
        table->try_emplace_l(
            key, [](V &) {}, std::move(value));
        table->if_contains(key, [&found](const V &stored) { found = &stored; });
        return *found;
    }

    bool contains(const PipelineKey &key) const
    {
        Entries *table = entries.load(std::memory_order_acquire);
        return (table != nullptr) && table->contains(key);
    }

    size_t size() const
    {
        Entries *table = entries.load(std::memory_order_acquire);
        return (table == nullptr) ? 0 : table->size();
    }

    // Whether the entry map has been created.
    bool has_storage() const { return entries.load(std::memory_order_acquire) != nullptr; }
};
