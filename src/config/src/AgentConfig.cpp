/**
 * @file AgentConfig.cpp
 * @brief yaml-cpp loading of the agent configuration.
 */

#include "src/config/inc/AgentConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/spec/inc/SpecLocator.hpp"

#include <unistd.h>

#include <array>
#include <cstdlib>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace ibcheck {

namespace config {

namespace {

constexpr std::size_t HOST_NAME_BUFFER = 256;

/// Read a duration key if present.
void readDuration(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
  const YAML::Node V = node[key];
  if (!V || V.IsNull()) {
    return;
  }
  std::chrono::milliseconds parsed{0};
  const std::string TEXT = V.as<std::string>();
  if (!parseDuration(TEXT, parsed)) {
    throw YAML::Exception(V.Mark(), fmt::format("{}: invalid duration '{}'", key, TEXT));
  }
  out = parsed;
}

void readString(const YAML::Node& node, const char* key, std::string& out) {
  const YAML::Node V = node[key];
  if (V && !V.IsNull()) {
    out = V.as<std::string>();
  }
}

void readBool(const YAML::Node& node, const char* key, bool& out) {
  const YAML::Node V = node[key];
  if (V && !V.IsNull()) {
    out = V.as<bool>();
  }
}

std::string hostName() {
  std::array<char, HOST_NAME_BUFFER> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0) {
    return {};
  }
  return std::string(buf.data());
}

} // namespace

/* ----------------------------- AgentConfig ----------------------------- */

std::string AgentConfig::clusterName() const { return spec::extractClusterName(nodeName); }

spec::SpecSettings AgentConfig::specSettings() const {
  spec::SpecSettings s;
  s.specFile = specFile;
  s.specDir = specDir;
  s.devSpecDir = devSpecDir;
  s.remoteBaseUrl = remoteBaseUrl;
  s.clusterName = clusterName();
  return s;
}

/* ----------------------------- Loading ----------------------------- */

bool parseDuration(std::string_view text, std::chrono::milliseconds& out) noexcept {
  text = helpers::strings::trimView(text);
  std::size_t digits = 0;
  while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
    ++digits;
  }
  long long value = 0;
  if (!helpers::strings::parseUnsigned(text.substr(0, digits), value)) {
    return false;
  }
  const std::string_view UNIT = text.substr(digits);
  if (UNIT.empty() || UNIT == "s") {
    out = std::chrono::seconds(value);
  } else if (UNIT == "ms") {
    out = std::chrono::milliseconds(value);
  } else if (UNIT == "m") {
    out = std::chrono::minutes(value);
  } else if (UNIT == "h") {
    out = std::chrono::hours(value);
  } else {
    return false;
  }
  return true;
}

bool parseAgentConfig(const std::string& text, AgentConfig& cfg, std::string& error) {
  try {
    const YAML::Node ROOT = YAML::Load(text);
    if (ROOT.IsNull()) {
      return true;
    }
    if (!ROOT.IsMap()) {
      error = "config is not a YAML mapping";
      return false;
    }
    const YAML::Node NODE = ROOT["infiniband"] ? ROOT["infiniband"] : ROOT;
    if (NODE.IsNull()) {
      return true;
    }
    if (!NODE.IsMap()) {
      error = "'infiniband' config section must be a mapping";
      return false;
    }

    AgentConfig next = cfg;
    readString(NODE, "spec_file", next.specFile);
    readString(NODE, "spec_dir", next.specDir);
    readString(NODE, "dev_spec_dir", next.devSpecDir);
    readString(NODE, "remote_base_url", next.remoteBaseUrl);
    readString(NODE, "node_name", next.nodeName);
    readDuration(NODE, "gateway_cache_ttl", next.gatewayCacheTtl);
    readDuration(NODE, "connectivity_cache_ttl", next.connectivityCacheTtl);
    readDuration(NODE, "command_timeout", next.commandTimeout);
    readDuration(NODE, "http_timeout", next.httpTimeout);
    readBool(NODE, "auto_fix_mrr", next.autoFixMrr);
    readBool(NODE, "check_connectivity", next.checkConnectivity);
    readBool(NODE, "scan_acs", next.scanAcs);
    readString(NODE, "log_level", next.logLevel);

    const YAML::Node IGNORED = NODE["ignored_checkers"];
    if (IGNORED && !IGNORED.IsNull()) {
      if (!IGNORED.IsSequence()) {
        error = "ignored_checkers must be a list";
        return false;
      }
      next.ignoredCheckers.clear();
      for (const auto& item : IGNORED) {
        next.ignoredCheckers.push_back(item.as<std::string>());
      }
    }
    cfg = std::move(next);
    return true;
  } catch (const YAML::Exception& e) {
    error = e.what();
    return false;
  }
}

bool loadAgentConfig(const std::string& path, AgentConfig& cfg, std::string& error) {
  if (!helpers::files::pathExists(path)) {
    helpers::log::logger()->debug("config {} not present, using defaults", path);
    return true;
  }
  std::string text;
  if (!helpers::files::readTextFile(path, text)) {
    error = fmt::format("cannot read config {}", path);
    return false;
  }
  if (!parseAgentConfig(text, cfg, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  helpers::log::logger()->debug("loaded config {}", path);
  return true;
}

void applyEnvironment(AgentConfig& cfg, const EnvLookup& env) {
  const auto GET = [&env](const char* name) -> const char* {
    return env ? env(name) : std::getenv(name);
  };

  const char* node = GET(ENV_NODE_NAME);
  if (node != nullptr && *node != '\0') {
    cfg.nodeName = node;
  } else if (cfg.nodeName.empty()) {
    cfg.nodeName = hostName();
  }

  const char* url = GET(ENV_SPEC_URL);
  if (url != nullptr && *url != '\0') {
    cfg.remoteBaseUrl = url;
  }

  const char* level = GET(ENV_LOG_LEVEL);
  if (level != nullptr && *level != '\0') {
    cfg.logLevel = level;
  }
}

std::string describe(const AgentConfig& cfg) {
  std::string out;
  out += fmt::format("  node:                   {}\n", cfg.nodeName);
  out += fmt::format("  cluster:                {}\n", cfg.clusterName());
  out += fmt::format("  spec_file:              {}\n", cfg.specFile);
  out += fmt::format("  spec_dir:               {}\n", cfg.specDir);
  out += fmt::format("  dev_spec_dir:           {}\n", cfg.devSpecDir);
  out += fmt::format("  remote_base_url:        {}\n", cfg.remoteBaseUrl);
  out += fmt::format("  gateway_cache_ttl:      {} ms\n", cfg.gatewayCacheTtl.count());
  out += fmt::format("  connectivity_cache_ttl: {} ms\n", cfg.connectivityCacheTtl.count());
  out += fmt::format("  command_timeout:        {} ms\n", cfg.commandTimeout.count());
  out += fmt::format("  http_timeout:           {} ms\n", cfg.httpTimeout.count());
  out += fmt::format("  auto_fix_mrr:           {}\n", cfg.autoFixMrr);
  out += fmt::format("  check_connectivity:     {}\n", cfg.checkConnectivity);
  out += fmt::format("  scan_acs:               {}\n", cfg.scanAcs);
  out += fmt::format("  ignored_checkers:       {}\n",
                     helpers::strings::join(cfg.ignoredCheckers, ","));
  out += fmt::format("  log_level:              {}\n", cfg.logLevel);
  return out;
}

} // namespace config

} // namespace ibcheck
