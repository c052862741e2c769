#ifndef IBCHECK_COLLECT_COUNTER_COLLECTOR_HPP
#define IBCHECK_COLLECT_COUNTER_COLLECTOR_HPP
/**
 * @file CounterCollector.hpp
 * @brief Port counters of an RDMA adapter, one worker thread per counter family.
 * @note Linux-only. Reads <ibClass>/<dev>/ports/<port>/{counters,hw_counters}/.
 * @note Thread-safe: collect() may be called concurrently for different adapters.
 */

#include "src/collect/inc/AdapterInfo.hpp"
#include "src/collect/inc/SysPaths.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ibcheck {
namespace collect {

/* ----------------------------- Constants ----------------------------- */

/// Counter families read in parallel.
inline constexpr const char* COUNTER_FAMILIES[] = {"counters", "hw_counters"};

/* ----------------------------- Types ----------------------------- */

/// Counter name -> value. Names are unique across families.
using CounterSet = std::map<std::string, std::uint64_t>;

/**
 * @brief Union of all families plus the families that could not be read.
 */
struct CounterSnapshot {
  CounterSet counters;
  std::vector<std::string> failedFamilies;

  [[nodiscard]] bool complete() const noexcept { return failedFamilies.empty(); }
};

/* ----------------------------- CounterCollector ----------------------------- */

/**
 * @brief Reads all counter families of one port concurrently.
 *
 * Each family is read by its own std::thread into a private map; the maps
 * are merged into the result under a mutex. A family whose directory is
 * missing or unreadable is logged and contributes nothing.
 */
class CounterCollector {
public:
  explicit CounterCollector(SysPaths paths);

  /**
   * @brief Read every counter file of @p ibDev port @p port.
   * @note Unparsable counter files are skipped individually.
   */
  [[nodiscard]] CounterSnapshot collect(const std::string& ibDev, int port = DEFAULT_PORT) const;

private:
  SysPaths paths_;
};

/**
 * @brief Read one counter family directory into @p out.
 * @return false if the directory does not exist or is empty.
 */
[[nodiscard]] bool readCounterFamily(const std::string& dir, CounterSet& out);

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_COUNTER_COLLECTOR_HPP
