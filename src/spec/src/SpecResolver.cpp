/**
 * @file SpecResolver.cpp
 * @brief Cluster selection and per-board spec binding with remote fallbacks.
 */

#include "src/spec/inc/SpecResolver.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/spec/inc/SpecDocument.hpp"
#include "src/spec/inc/SpecLocator.hpp"

#include <set>
#include <utility>

#include <fmt/core.h>

namespace ibcheck {

namespace spec {

/* ----------------------------- ClusterSource ----------------------------- */

const char* toString(ClusterSource source) noexcept {
  switch (source) {
  case ClusterSource::Local:
    return "local";
  case ClusterSource::Remote:
    return "remote";
  case ClusterSource::Default:
    return "default";
  }
  return "unknown";
}

/* ----------------------------- SpecResolver ----------------------------- */

SpecResolver::SpecResolver(ClusterSpecSet clusters, HcaCatalog catalog, std::string remoteBaseUrl,
                           SpecFetcher& fetcher)
    : clusters_(std::move(clusters)), catalog_(std::move(catalog)),
      remoteBaseUrl_(std::move(remoteBaseUrl)), fetcher_(fetcher) {
  while (!remoteBaseUrl_.empty() && remoteBaseUrl_.back() == '/') {
    remoteBaseUrl_.pop_back();
  }
}

bool SpecResolver::selectCluster(const std::string& clusterName, ResolveResult& out) {
  const auto LOCAL = clusters_.find(clusterName);
  if (LOCAL != clusters_.end()) {
    out.spec = LOCAL->second;
    out.source = ClusterSource::Local;
    return true;
  }

  if (!remoteBaseUrl_.empty()) {
    const std::string URL =
        fmt::format("{}/{}/{}.yaml", remoteBaseUrl_, CLUSTER_SECTION, clusterName);
    helpers::log::logger()->info("no local spec for cluster '{}', trying {}", clusterName, URL);
    const FetchResult R = fetcher_.fetch(URL);
    ClusterSpecSet remote;
    std::string error;
    if (!R.ok()) {
      helpers::log::logger()->warn("fetch {}: {}", URL, R.describe());
    } else if (!parseClusterSpecs(R.body, remote, error)) {
      helpers::log::logger()->warn("{}: {}", URL, error);
    } else {
      const auto IT = remote.find(clusterName);
      if (IT != remote.end()) {
        out.spec = IT->second;
        out.source = ClusterSource::Remote;
        return true;
      }
      helpers::log::logger()->warn("{} has no entry for cluster '{}'", URL, clusterName);
    }
  }

  const auto DEFAULT = clusters_.find(DEFAULT_CLUSTER);
  if (DEFAULT != clusters_.end()) {
    helpers::log::logger()->warn("no spec for cluster '{}', falling back to '{}'", clusterName,
                                 DEFAULT_CLUSTER);
    out.spec = DEFAULT->second;
    out.source = ClusterSource::Default;
    return true;
  }

  out.error = fmt::format("no infiniband spec for cluster '{}' and no '{}' entry", clusterName,
                          DEFAULT_CLUSTER);
  return false;
}

bool SpecResolver::fetchBoard(const std::string& boardId, AdapterSpec& out) {
  if (remoteBaseUrl_.empty()) {
    return false;
  }
  const std::string URL = fmt::format("{}/{}/{}.yaml", remoteBaseUrl_, CATALOG_SECTION, boardId);
  helpers::log::logger()->info("loading spec of board {} from {}", boardId, URL);
  const FetchResult R = fetcher_.fetch(URL);
  if (!R.ok()) {
    helpers::log::logger()->warn("fetch {}: {}", URL, R.describe());
    return false;
  }
  HcaCatalog remote;
  std::string error;
  if (!parseHcaCatalog(R.body, remote, error)) {
    helpers::log::logger()->warn("{}: {}", URL, error);
    return false;
  }
  const auto IT = remote.find(boardId);
  if (IT == remote.end()) {
    helpers::log::logger()->warn("{} has no entry for board {}", URL, boardId);
    return false;
  }
  out = IT->second;
  return true;
}

ResolveResult SpecResolver::resolve(const std::string& clusterName,
                                    const std::vector<std::string>& hostBoardIds) {
  ResolveResult result;
  result.clusterName = clusterName.empty() ? std::string(DEFAULT_CLUSTER) : clusterName;
  if (!selectCluster(result.clusterName, result)) {
    return result;
  }

  const std::set<std::string> BOARDS(hostBoardIds.begin(), hostBoardIds.end());
  std::map<std::string, AdapterSpec> bound;

  for (const std::string& id : BOARDS) {
    if (id.empty()) {
      continue;
    }
    const auto IN_CLUSTER = result.spec.hcaSpecs.find(id);
    if (IN_CLUSTER != result.spec.hcaSpecs.end()) {
      if (IN_CLUSTER->second.hardware.boardId == id) {
        bound.emplace(id, IN_CLUSTER->second);
        continue;
      }
      helpers::log::logger()->warn("cluster spec entry {} records board_id '{}', refreshing", id,
                                   IN_CLUSTER->second.hardware.boardId);
    }

    const auto IN_CATALOG = catalog_.find(id);
    if (IN_CATALOG != catalog_.end()) {
      helpers::log::logger()->info("spec of board {} taken from the board catalog", id);
      bound.emplace(id, IN_CATALOG->second);
      continue;
    }

    AdapterSpec fetched;
    if (fetchBoard(id, fetched)) {
      bound.emplace(id, std::move(fetched));
      continue;
    }
    result.missingBoardIds.push_back(id);
  }

  result.spec.hcaSpecs = std::move(bound);
  if (!result.missingBoardIds.empty()) {
    result.error =
        fmt::format("spec for the following board IDs not found in any source: {}",
                    helpers::strings::join(result.missingBoardIds, ", "));
    return result;
  }

  helpers::log::logger()->info("resolved spec for cluster '{}' ({}), {} board(s)",
                               result.clusterName, toString(result.source),
                               result.spec.hcaSpecs.size());
  return result;
}

/* ----------------------------- resolveClusterSpec ----------------------------- */

ResolveResult resolveClusterSpec(const SpecSettings& settings, SpecFetcher& fetcher,
                                 const std::vector<std::string>& hostBoardIds) {
  SpecLocator locator(settings.specDir, settings.remoteBaseUrl, settings.clusterName, fetcher);
  std::string file;
  std::string error;
  if (!locator.ensureSpecFile(settings.specFile, file, error)) {
    helpers::log::logger()->warn("{}", error);
    file.clear();
  }

  ClusterSpecSet clusters;
  const std::size_t SOURCES =
      loadClusterSpecs(file, settings.specDir, settings.devSpecDir, clusters);
  if (SOURCES == 0 || clusters.empty()) {
    ResolveResult failed;
    failed.clusterName = settings.clusterName;
    failed.error = "failed to load infiniband spec from any source";
    if (!error.empty()) {
      failed.error += ": " + error;
    }
    return failed;
  }

  HcaCatalog catalog;
  const std::string CATALOG_DIR = settings.devSpecDir.empty()
                                      ? std::string()
                                      : helpers::files::joinPath(settings.devSpecDir, "hca");
  (void)loadHcaCatalog(file, settings.specDir, CATALOG_DIR, catalog);

  SpecResolver resolver(std::move(clusters), std::move(catalog), settings.remoteBaseUrl, fetcher);
  return resolver.resolve(settings.clusterName, hostBoardIds);
}

} // namespace spec

} // namespace ibcheck
