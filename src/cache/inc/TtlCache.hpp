#ifndef IBCHECK_CACHE_TTL_CACHE_HPP
#define IBCHECK_CACHE_TTL_CACHE_HPP
/**
 * @file TtlCache.hpp
 * @brief Keyed TTL cache with double-checked refresh.
 *
 * get() first looks for a fresh entry under a shared lock. On a miss or a
 * stale entry it takes the exclusive lock, checks again (another caller may
 * have refreshed the entry while this one waited), and only then runs the
 * loader. At most one load runs per key at a time, so N concurrent
 * callers racing a stale key trigger exactly one load.
 *
 * Failed loads are cached with their error, so a key that keeps failing is
 * retried once per TTL window. Entries are replaced in place and never
 * expire by deletion; close() drops everything.
 *
 * @note Thread-safe: All members may be called concurrently.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace ibcheck {
namespace cache {

/* ----------------------------- Types ----------------------------- */

/// Clock used for entry timestamps.
using Clock = std::chrono::steady_clock;

/// Injectable time source (tests advance a fake clock).
using NowFn = std::function<Clock::time_point()>;

/**
 * @brief Cached value with the error of the load that produced it.
 */
template <typename V> struct CacheEntry {
  V value{};
  std::string error{};
  Clock::time_point timestamp{};

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

/**
 * @brief Result of a loader call: value plus optional error text.
 */
template <typename V> struct LoadResult {
  V value{};
  std::string error{};
};

/* ----------------------------- TtlCache ----------------------------- */

/**
 * @brief Generic keyed TTL cache.
 *
 * Each key owns a slot with its own lock, so a slow refresh of one key never
 * blocks lookups or refreshes of another.
 *
 * @tparam K Key type (hashable).
 * @tparam V Value type (copyable).
 */
template <typename K, typename V, typename Hash = std::hash<K>> class TtlCache {
public:
  using Entry = CacheEntry<V>;
  using Loader = std::function<LoadResult<V>()>;

  /**
   * @param ttl Freshness window for entries.
   * @param now Time source; defaults to Clock::now.
   */
  explicit TtlCache(Clock::duration ttl, NowFn now = nullptr)
      : ttl_(ttl), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

  TtlCache(const TtlCache&) = delete;
  TtlCache& operator=(const TtlCache&) = delete;

  /**
   * @brief Return the entry for @p key, loading it if missing or stale.
   * @param key Cache key.
   * @param loader Called at most once per stale window; must not call back
   *        into this cache with the same key.
   * @return Copy of the stored entry (value, error, and timestamp).
   */
  [[nodiscard]] Entry get(const K& key, const Loader& loader) {
    const std::shared_ptr<Slot> SLOT = slotFor(key);

    {
      std::shared_lock<std::shared_mutex> lock(SLOT->mutex);
      if (SLOT->filled && isFresh(SLOT->entry)) {
        return SLOT->entry;
      }
    }

    std::unique_lock<std::shared_mutex> lock(SLOT->mutex);
    if (SLOT->filled && isFresh(SLOT->entry)) {
      return SLOT->entry;
    }

    LoadResult<V> loaded = loader();
    SLOT->entry.value = std::move(loaded.value);
    SLOT->entry.error = std::move(loaded.error);
    SLOT->entry.timestamp = now_();
    SLOT->filled = true;
    loads_.fetch_add(1, std::memory_order_relaxed);
    return SLOT->entry;
  }

  /// Drop all entries. The cache stays usable afterwards.
  void close() {
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    slots_.clear();
  }

  /// Number of stored keys (fresh or stale).
  [[nodiscard]] std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    return slots_.size();
  }

  /// Total loader invocations since construction.
  [[nodiscard]] std::size_t loadCount() const noexcept {
    return loads_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] Clock::duration ttl() const noexcept { return ttl_; }

private:
  struct Slot {
    std::shared_mutex mutex;
    Entry entry{};
    bool filled{false};
  };

  std::shared_ptr<Slot> slotFor(const K& key) {
    {
      std::shared_lock<std::shared_mutex> lock(mapMutex_);
      const auto IT = slots_.find(key);
      if (IT != slots_.end()) {
        return IT->second;
      }
    }
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto& slot = slots_[key];
    if (!slot) {
      slot = std::make_shared<Slot>();
    }
    return slot;
  }

  [[nodiscard]] bool isFresh(const Entry& entry) const { return now_() - entry.timestamp < ttl_; }

  const Clock::duration ttl_;
  const NowFn now_;
  mutable std::shared_mutex mapMutex_;
  std::unordered_map<K, std::shared_ptr<Slot>, Hash> slots_;
  std::atomic<std::size_t> loads_{0};
};

} // namespace cache
} // namespace ibcheck

#endif // IBCHECK_CACHE_TTL_CACHE_HPP
