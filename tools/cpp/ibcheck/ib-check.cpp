/**
 * @file ib-check.cpp
 * @brief One-shot InfiniBand/RoCE health check with pass/fail per item.
 *
 * Resolves the expected spec for the host's cluster and boards, collects the
 * adapter inventory, runs every check item and prints a table or JSON.
 *
 * Exit codes:
 *  - 0: every item normal
 *  - 1: at least one item abnormal
 *  - 2: configuration or spec resolution failed
 */

#include "src/check/inc/Checker.hpp"
#include "src/check/inc/Report.hpp"
#include "src/collect/inc/AdapterInfo.hpp"
#include "src/collect/inc/ProcessRunner.hpp"
#include "src/collect/inc/SysPaths.hpp"
#include "src/config/inc/AgentConfig.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/inventory/inc/SnapshotCollector.hpp"
#include "src/route/inc/ConnectivityProber.hpp"
#include "src/route/inc/GatewayResolver.hpp"
#include "src/route/inc/NetlinkRoutingSource.hpp"
#include "src/spec/inc/SpecFetcher.hpp"
#include "src/spec/inc/SpecResolver.hpp"

#include <unistd.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = ibcheck::helpers::args;
namespace check = ibcheck::check;
namespace config = ibcheck::config;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_CONFIG = 1,
  ARG_SPEC = 2,
  ARG_SPEC_DIR = 3,
  ARG_REMOTE = 4,
  ARG_JSON = 5,
  ARG_VERBOSE = 6,
  ARG_LOG_LEVEL = 7,
  ARG_NO_FIX = 8,
  ARG_NO_PROBE = 9,
};

constexpr int EXIT_HEALTHY = 0;
constexpr int EXIT_ABNORMAL = 1;
constexpr int EXIT_SETUP_FAILED = 2;

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Check InfiniBand/RoCE adapters against the cluster hardware spec.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", false, "Show this help message"};
  map[ARG_CONFIG] = {"--config", true, "Agent config file", "<path>"};
  map[ARG_SPEC] = {"--spec", true, "Spec file name, path or URL", "<file>"};
  map[ARG_SPEC_DIR] = {"--spec-dir", true, "Local spec directory", "<dir>"};
  map[ARG_REMOTE] = {"--remote", true, "Remote spec base URL", "<url>"};
  map[ARG_JSON] = {"--json", false, "Output in JSON format"};
  map[ARG_VERBOSE] = {"--verbose", false, "Show expected/observed values and suggestions"};
  map[ARG_LOG_LEVEL] = {"--log-level", true, "trace, debug, info, warn, error or off", "<level>"};
  map[ARG_NO_FIX] = {"--no-fix", false, "Do not correct PCIe max read request size"};
  map[ARG_NO_PROBE] = {"--no-probe", false, "Do not probe RoCE gateway reachability"};
  return map;
}

/// Apply flags on top of the file and environment.
void applyArgs(const args::ParsedArgs& pargs, config::AgentConfig& cfg) {
  const auto VALUE = [&pargs](ArgKey key, std::string& out) {
    const auto IT = pargs.find(key);
    if (IT != pargs.end()) {
      out = IT->second;
    }
  };
  VALUE(ARG_SPEC, cfg.specFile);
  VALUE(ARG_SPEC_DIR, cfg.specDir);
  VALUE(ARG_REMOTE, cfg.remoteBaseUrl);
  VALUE(ARG_LOG_LEVEL, cfg.logLevel);
  if (args::has(pargs, ARG_NO_FIX)) {
    cfg.autoFixMrr = false;
  }
  if (args::has(pargs, ARG_NO_PROBE)) {
    cfg.checkConnectivity = false;
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }
  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_SETUP_FAILED;
  }
  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_HEALTHY;
  }
  const bool JSON_OUTPUT = args::has(pargs, ARG_JSON);
  const bool VERBOSE = args::has(pargs, ARG_VERBOSE);

  // Configuration: defaults, file, environment, flags
  ibcheck::helpers::log::init(spdlog::level::info);
  config::AgentConfig cfg;
  const auto CONFIG_IT = pargs.find(ARG_CONFIG);
  const std::string CONFIG_PATH =
      CONFIG_IT != pargs.end() ? CONFIG_IT->second : std::string(config::DEFAULT_CONFIG_FILE);
  if (!config::loadAgentConfig(CONFIG_PATH, cfg, error)) {
    ibcheck::helpers::log::logger()->error("config: {}", error);
    return EXIT_SETUP_FAILED;
  }
  config::applyEnvironment(cfg);
  applyArgs(pargs, cfg);
  ibcheck::helpers::log::setLevel(ibcheck::helpers::log::parseLevel(cfg.logLevel));
  if (VERBOSE && !JSON_OUTPUT) {
    fmt::print("=== Configuration ===\n{}\n", config::describe(cfg));
  }

  // Spec, bound to the board IDs present on this host
  const ibcheck::collect::SysPaths PATHS;
  ibcheck::spec::CurlSpecFetcher fetcher(cfg.httpTimeout);
  const ibcheck::spec::ResolveResult SPEC = ibcheck::spec::resolveClusterSpec(
      cfg.specSettings(), fetcher, ibcheck::collect::readBoardIds(PATHS));
  if (!SPEC.ok()) {
    ibcheck::helpers::log::logger()->error("spec: {}", SPEC.error);
    return EXIT_SETUP_FAILED;
  }

  // Inventory
  ibcheck::collect::SystemProcessRunner runner;
  ibcheck::route::NetlinkRoutingSource routing;
  ibcheck::route::GatewayResolver resolver(PATHS, routing, cfg.gatewayCacheTtl);

  ibcheck::inventory::CollectorOptions options;
  options.autoFixMrr = cfg.autoFixMrr;
  options.scanAcs = cfg.scanAcs;
  options.commandTimeout = cfg.commandTimeout;
  ibcheck::inventory::SnapshotCollector collector(PATHS, runner, resolver, options);
  const ibcheck::inventory::InfinibandSnapshot SNAPSHOT = collector.collect();

  // Checks
  std::unique_ptr<ibcheck::route::ConnectivityProber> prober;
  if (cfg.checkConnectivity) {
    prober = std::make_unique<ibcheck::route::ConnectivityProber>(cfg.connectivityCacheTtl);
  }
  const check::CheckContext CTX{SNAPSHOT, SPEC.spec, prober.get()};
  const std::vector<check::CheckResult> RESULTS = check::runChecks(CTX, cfg.ignoredCheckers);

  check::ReportHeader header;
  header.node = cfg.nodeName;
  header.cluster = SPEC.clusterName;
  header.clusterSource = ibcheck::spec::toString(SPEC.source);
  header.adapters = SNAPSHOT.adapters.size();
  header.nicRole = ibcheck::collect::toString(SNAPSHOT.software.nicRole);

  if (JSON_OUTPUT) {
    fmt::print("{}", check::toJson(header, RESULTS));
  } else {
    fmt::print("{}", check::formatHuman(header, RESULTS, VERBOSE, ::isatty(STDOUT_FILENO) != 0));
  }

  if (prober) {
    prober->close();
  }
  resolver.close();
  return check::allNormal(RESULTS) ? EXIT_HEALTHY : EXIT_ABNORMAL;
}
