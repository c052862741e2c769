#ifndef IBCHECK_CONFIG_AGENT_CONFIG_HPP
#define IBCHECK_CONFIG_AGENT_CONFIG_HPP
/**
 * @file AgentConfig.hpp
 * @brief Agent settings from a YAML file plus environment overrides.
 *
 * File layout (every key optional):
 * @code
 * infiniband:
 *   spec_file: ""
 *   spec_dir: /var/ibcheck/config
 *   dev_spec_dir: config
 *   remote_base_url: ""
 *   gateway_cache_ttl: 5m
 *   connectivity_cache_ttl: 30s
 *   command_timeout: 30s
 *   http_timeout: 30s
 *   auto_fix_mrr: true
 *   check_connectivity: true
 *   scan_acs: true
 *   ignored_checkers: []
 *   log_level: info
 * @endcode
 *
 * Durations are integer seconds or a number with an "ms", "s", "m" or "h"
 * suffix. A document without an `infiniband:` key is read from its root.
 */

#include "src/spec/inc/SpecResolver.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace config {

/* ----------------------------- Constants ----------------------------- */

/// Default user config shipped with the agent.
inline constexpr const char* DEFAULT_CONFIG_FILE = "/var/ibcheck/config/default_user_config.yaml";

/// Environment overrides.
inline constexpr const char* ENV_NODE_NAME = "NODE_NAME";
inline constexpr const char* ENV_SPEC_URL = "IBCHECK_SPEC_URL";
inline constexpr const char* ENV_LOG_LEVEL = "IBCHECK_LOG_LEVEL";

/* ----------------------------- AgentConfig ----------------------------- */

struct AgentConfig {
  std::string specFile{};
  std::string specDir{"/var/ibcheck/config"};
  std::string devSpecDir{"config"};
  std::string remoteBaseUrl{};
  std::string nodeName{}; ///< Empty until the environment or hostname fills it
  std::chrono::milliseconds gatewayCacheTtl{std::chrono::minutes(5)};
  std::chrono::milliseconds connectivityCacheTtl{std::chrono::seconds(30)};
  std::chrono::milliseconds commandTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds httpTimeout{std::chrono::seconds(30)};
  bool autoFixMrr{true};
  bool checkConnectivity{true};
  bool scanAcs{true};
  std::vector<std::string> ignoredCheckers{};
  std::string logLevel{"info"};

  /// Cluster derived from nodeName ("default" if it has none).
  [[nodiscard]] std::string clusterName() const;

  /// Spec resolution inputs for this configuration.
  [[nodiscard]] spec::SpecSettings specSettings() const;
};

/* ----------------------------- Loading ----------------------------- */

/**
 * @brief Parse a duration: "30", "30s", "500ms", "5m", "1h".
 * @return false on anything else, including negative values.
 */
[[nodiscard]] bool parseDuration(std::string_view text, std::chrono::milliseconds& out) noexcept;

/**
 * @brief Overlay the keys present in @p text onto @p cfg.
 * @return false with @p error set on malformed YAML or a bad value.
 */
[[nodiscard]] bool parseAgentConfig(const std::string& text, AgentConfig& cfg,
                                    std::string& error);

/**
 * @brief Load @p path onto @p cfg.
 *
 * A missing file leaves the defaults in place and succeeds.
 */
[[nodiscard]] bool loadAgentConfig(const std::string& path, AgentConfig& cfg, std::string& error);

/// Environment lookup; returns nullptr for unset variables.
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Apply NODE_NAME, IBCHECK_SPEC_URL and IBCHECK_LOG_LEVEL.
 *
 * Without NODE_NAME the host name is used when nodeName is still empty.
 *
 * @param env Defaults to std::getenv.
 */
void applyEnvironment(AgentConfig& cfg, const EnvLookup& env = nullptr);

/// Readable multi-line dump for --verbose.
[[nodiscard]] std::string describe(const AgentConfig& cfg);

} // namespace config
} // namespace ibcheck

#endif // IBCHECK_CONFIG_AGENT_CONFIG_HPP
