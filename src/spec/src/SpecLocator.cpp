/**
 * @file SpecLocator.cpp
 * @brief Local-first spec file lookup with remote and bundled fallbacks.
 */

#include "src/spec/inc/SpecLocator.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/spec/inc/SpecDocument.hpp"
#include "src/spec/inc/SpecTypes.hpp"

#include <cctype>
#include <utility>

#include <fmt/core.h>

namespace ibcheck {

namespace spec {

using helpers::files::baseName;
using helpers::files::isRegularFile;
using helpers::files::joinPath;
using helpers::strings::startsWith;

/* ----------------------------- Helpers ----------------------------- */

std::string extractClusterName(std::string_view nodeName) {
  std::size_t n = 0;
  while (n < nodeName.size() && std::isalpha(static_cast<unsigned char>(nodeName[n])) != 0) {
    ++n;
  }
  if (n == 0) {
    return DEFAULT_CLUSTER;
  }
  return std::string(nodeName.substr(0, n));
}

bool isUrl(std::string_view name) noexcept {
  return startsWith(name, "http://") || startsWith(name, "https://");
}

std::string urlFileName(std::string_view url) {
  const std::size_t SCHEME = url.find("://");
  std::string_view rest = SCHEME == std::string_view::npos ? url : url.substr(SCHEME + 3);
  const std::size_t END = rest.find_first_of("?#");
  if (END != std::string_view::npos) {
    rest = rest.substr(0, END);
  }
  const std::size_t PATH = rest.find('/');
  if (PATH == std::string_view::npos) {
    return {};
  }
  return baseName(rest.substr(PATH));
}

/* ----------------------------- SpecLocator ----------------------------- */

SpecLocator::SpecLocator(std::string specDir, std::string remoteBaseUrl, std::string clusterName,
                         SpecFetcher& fetcher)
    : specDir_(std::move(specDir)), remoteBaseUrl_(std::move(remoteBaseUrl)),
      clusterName_(std::move(clusterName)), fetcher_(fetcher) {
  while (!remoteBaseUrl_.empty() && remoteBaseUrl_.back() == '/') {
    remoteBaseUrl_.pop_back();
  }
}

bool SpecLocator::download(const std::string& url, const std::string& path, std::string& error) {
  helpers::log::logger()->info("downloading spec {} -> {}", url, path);
  const FetchResult R = fetcher_.fetch(url);
  if (!R.ok()) {
    error = fmt::format("fetch {}: {}", url, R.describe());
    return false;
  }
  std::string yamlError;
  if (!isYamlDocument(R.body, yamlError)) {
    error = fmt::format("{} is not a valid spec document: {}", url, yamlError);
    return false;
  }
  if (!helpers::files::writeFileAtomic(path, R.body, error)) {
    return false;
  }
  return true;
}

bool SpecLocator::ensureSpecFile(const std::string& name, std::string& path, std::string& error) {
  const std::string SPEC = name.empty() ? clusterName_ + SPEC_SUFFIX : name;

  if (isUrl(SPEC)) {
    const std::string FILE = urlFileName(SPEC);
    if (FILE.empty()) {
      error = fmt::format("spec URL '{}' has no file name", SPEC);
      return false;
    }
    const std::string TARGET = joinPath(specDir_, FILE);
    if (!download(SPEC, TARGET, error)) {
      return false;
    }
    path = TARGET;
    return true;
  }

  if (isRegularFile(SPEC)) {
    helpers::log::logger()->info("using spec file {}", SPEC);
    path = SPEC;
    return true;
  }

  const std::string FILE = baseName(SPEC);
  const std::string LOCAL = joinPath(specDir_, FILE);
  if (isRegularFile(LOCAL)) {
    helpers::log::logger()->info("using spec file {}", LOCAL);
    path = LOCAL;
    return true;
  }

  std::string remoteError = "no remote spec URL configured";
  if (!remoteBaseUrl_.empty()) {
    if (download(remoteBaseUrl_ + "/" + FILE, LOCAL, remoteError)) {
      path = LOCAL;
      return true;
    }
    helpers::log::logger()->warn("{}", remoteError);
  }

  const std::string BUNDLED = joinPath(specDir_, DEFAULT_SPEC_FILE);
  if (isRegularFile(BUNDLED)) {
    helpers::log::logger()->warn("spec '{}' not found, falling back to {}", SPEC, BUNDLED);
    path = BUNDLED;
    return true;
  }

  error = fmt::format("spec '{}' not found locally ({}) and not downloadable: {}", SPEC, LOCAL,
                      remoteError);
  return false;
}

} // namespace spec

} // namespace ibcheck
