/**
 * @file CounterCollector.cpp
 * @brief Implementation of concurrent port counter collection.
 */

#include "src/collect/inc/CounterCollector.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <mutex>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace ibcheck {

namespace collect {

using helpers::files::isDirectory;
using helpers::files::joinPath;
using helpers::files::listDir;
using helpers::files::readAttr;
using helpers::strings::parseUnsigned;

/* ----------------------------- API ----------------------------- */

bool readCounterFamily(const std::string& dir, CounterSet& out) {
  if (!isDirectory(dir)) {
    return false;
  }
  const std::vector<std::string> NAMES = listDir(dir);
  if (NAMES.empty()) {
    return false;
  }
  for (const std::string& name : NAMES) {
    long long value = 0;
    if (!parseUnsigned(readAttr(joinPath(dir, name)), value)) {
      helpers::log::logger()->debug("skipping unparsable counter {}/{}", dir, name);
      continue;
    }
    out[name] = static_cast<std::uint64_t>(value);
  }
  return true;
}

/* ----------------------------- CounterCollector ----------------------------- */

CounterCollector::CounterCollector(SysPaths paths) : paths_(std::move(paths)) {}

CounterSnapshot CounterCollector::collect(const std::string& ibDev, int port) const {
  CounterSnapshot snap;
  std::mutex mergeMutex;
  std::vector<std::thread> workers;

  const std::string PORT_DIR = joinPath(paths_.ibClass, fmt::format("{}/ports/{}", ibDev, port));

  for (const char* family : COUNTER_FAMILIES) {
    workers.emplace_back([&snap, &mergeMutex, &ibDev, family, DIR = joinPath(PORT_DIR, family)]() {
      CounterSet local;
      const bool OK = readCounterFamily(DIR, local);

      std::lock_guard<std::mutex> lock(mergeMutex);
      if (!OK) {
        helpers::log::logger()->warn("{}: counter family {} unavailable", ibDev, family);
        snap.failedFamilies.emplace_back(family);
        return;
      }
      for (auto& [name, value] : local) {
        snap.counters.emplace(name, value);
      }
    });
  }

  for (std::thread& t : workers) {
    t.join();
  }
  return snap;
}

} // namespace collect

} // namespace ibcheck
