/**
 * @file SpecDocument.cpp
 * @brief yaml-cpp decoding of spec documents and precedence-ordered loading.
 */

#include "src/spec/inc/SpecDocument.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>
#include <set>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace ibcheck {

namespace spec {

using helpers::files::joinPath;
using helpers::files::listDir;
using helpers::files::pathExists;
using helpers::files::readTextFile;

namespace {

/* ----------------------------- Decoding ----------------------------- */

// Decoders throw YAML::Exception on type mismatches; the public parse
// functions turn that into an error string.

std::string scalar(const YAML::Node& node) {
  if (!node || node.IsNull()) {
    return {};
  }
  return node.as<std::string>();
}

void decodeHardware(const YAML::Node& node, HardwareSpec& out) {
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw YAML::Exception(node.Mark(), "hardware must be a mapping");
  }
  for (const HardwareField& field : HARDWARE_FIELDS) {
    const YAML::Node VALUE = node[field.first];
    if (VALUE) {
      out.*(field.second) = scalar(VALUE);
    }
  }
}

AdapterSpec decodeAdapter(const YAML::Node& node) {
  AdapterSpec spec;
  decodeHardware(node["hardware"], spec.hardware);
  const YAML::Node PERF = node["perf"];
  if (PERF && PERF.IsMap()) {
    if (PERF["one_way_bw"]) {
      spec.perf.oneWayBwGbps = PERF["one_way_bw"].as<double>();
    }
    if (PERF["avg_latency_us"]) {
      spec.perf.avgLatencyUs = PERF["avg_latency_us"].as<double>();
    }
  }
  return spec;
}

/// Board map; null entries are left out so they count as missing.
std::map<std::string, AdapterSpec> decodeBoards(const YAML::Node& node) {
  std::map<std::string, AdapterSpec> out;
  if (!node || node.IsNull()) {
    return out;
  }
  if (!node.IsMap()) {
    throw YAML::Exception(node.Mark(), "board specs must be a mapping of board_id to spec");
  }
  for (const auto& kv : node) {
    if (kv.second.IsNull()) {
      continue;
    }
    out.emplace(kv.first.as<std::string>(), decodeAdapter(kv.second));
  }
  return out;
}

/// ib_devs: either {ibDev: netDev} or a plain list of ibDev names.
std::map<std::string, std::string> decodeIbDevs(const YAML::Node& node) {
  std::map<std::string, std::string> out;
  if (!node || node.IsNull()) {
    return out;
  }
  if (node.IsSequence()) {
    for (const auto& item : node) {
      out.emplace(item.as<std::string>(), std::string());
    }
    return out;
  }
  for (const auto& kv : node) {
    out.emplace(kv.first.as<std::string>(), scalar(kv.second));
  }
  return out;
}

ClusterSpec decodeCluster(const YAML::Node& node) {
  ClusterSpec spec;
  if (!node.IsMap()) {
    throw YAML::Exception(node.Mark(), "cluster spec must be a mapping");
  }
  spec.ibDevs = decodeIbDevs(node["ib_devs"]);

  const YAML::Node SW = node["sw_deps"];
  if (SW && SW.IsMap()) {
    spec.swDeps.ofedVer = scalar(SW["ofed_ver"]);
    const YAML::Node MODS = SW["kernel_module"];
    if (MODS && MODS.IsSequence()) {
      for (const auto& m : MODS) {
        spec.swDeps.kernelModules.push_back(m.as<std::string>());
      }
    }
  }

  if (node["pcie_acs"]) {
    spec.pcieAcs = scalar(node["pcie_acs"]);
  }
  spec.hcaSpecs = decodeBoards(node["hca_specs"]);
  return spec;
}

enum class ParseStatus : std::uint8_t { Ok = 0, NoSection, Invalid };

/// Load @p text and select its top-level @p name section.
ParseStatus section(const std::string& text, const char* name, YAML::Node& out,
                    std::string& error) {
  const YAML::Node ROOT = YAML::Load(text);
  if (!ROOT.IsMap() || !ROOT[name] || ROOT[name].IsNull()) {
    error = fmt::format("document contains no '{}' section", name);
    return ParseStatus::NoSection;
  }
  out = ROOT[name];
  return ParseStatus::Ok;
}

ParseStatus parseClusterSection(const std::string& text, ClusterSpecSet& out,
                                std::string& error) {
  try {
    YAML::Node node;
    const ParseStatus STATUS = section(text, CLUSTER_SECTION, node, error);
    if (STATUS != ParseStatus::Ok) {
      return STATUS;
    }
    if (!node.IsMap()) {
      error = fmt::format("'{}' must map cluster names to specs", CLUSTER_SECTION);
      return ParseStatus::Invalid;
    }
    ClusterSpecSet parsed;
    for (const auto& kv : node) {
      if (kv.second.IsNull()) {
        continue;
      }
      parsed.emplace(kv.first.as<std::string>(), decodeCluster(kv.second));
    }
    out = std::move(parsed);
    return ParseStatus::Ok;
  } catch (const YAML::Exception& e) {
    error = e.what();
    return ParseStatus::Invalid;
  }
}

ParseStatus parseCatalogSection(const std::string& text, HcaCatalog& out, std::string& error) {
  try {
    YAML::Node node;
    const ParseStatus STATUS = section(text, CATALOG_SECTION, node, error);
    if (STATUS != ParseStatus::Ok) {
      return STATUS;
    }
    out = decodeBoards(node);
    return ParseStatus::Ok;
  } catch (const YAML::Exception& e) {
    error = e.what();
    return ParseStatus::Invalid;
  }
}

/* ----------------------------- Loading ----------------------------- */

template <typename Map, typename ParseFn>
std::size_t loadMerged(const char* what, const std::string& file, const std::string& productionDir,
                       const std::string& devDir, Map& out, ParseFn parse) {
  std::vector<std::string> paths;
  if (!file.empty()) {
    paths.push_back(file);
  }
  if (!productionDir.empty()) {
    paths.push_back(joinPath(productionDir, DEFAULT_SPEC_FILE));
  }
  if (!devDir.empty()) {
    for (std::string& p : listSpecFiles(devDir)) {
      paths.push_back(std::move(p));
    }
  }

  std::set<std::string> seen;
  std::size_t used = 0;
  for (const std::string& path : paths) {
    if (!seen.insert(path).second) {
      continue;
    }
    if (!pathExists(path)) {
      helpers::log::logger()->debug("{} spec source {} not present", what, path);
      continue;
    }
    std::string text;
    if (!readTextFile(path, text)) {
      helpers::log::logger()->warn("cannot read {} spec {}", what, path);
      continue;
    }
    Map doc;
    std::string error;
    const ParseStatus STATUS = parse(text, doc, error);
    if (STATUS == ParseStatus::NoSection) {
      helpers::log::logger()->debug("{}: {}", path, error);
      continue;
    }
    if (STATUS == ParseStatus::Invalid) {
      helpers::log::logger()->warn("skipping {} spec {}: {}", what, path, error);
      continue;
    }
    const std::size_t ADDED = mergeFillGaps(out, doc);
    ++used;
    helpers::log::logger()->info("{} spec {}: {} new entr{}", what, path, ADDED,
                                 ADDED == 1 ? "y" : "ies");
  }
  return used;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

bool parseClusterSpecs(const std::string& text, ClusterSpecSet& out, std::string& error) {
  return parseClusterSection(text, out, error) == ParseStatus::Ok;
}

bool parseHcaCatalog(const std::string& text, HcaCatalog& out, std::string& error) {
  return parseCatalogSection(text, out, error) == ParseStatus::Ok;
}

bool isYamlDocument(const std::string& text, std::string& error) {
  try {
    const YAML::Node ROOT = YAML::Load(text);
    if (!ROOT.IsMap()) {
      error = "document is not a YAML mapping";
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    error = e.what();
    return false;
  }
}

bool readClusterSpecFile(const std::string& path, ClusterSpecSet& out, std::string& error) {
  std::string text;
  if (!readTextFile(path, text)) {
    error = fmt::format("cannot read {}", path);
    return false;
  }
  if (!parseClusterSpecs(text, out, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

bool readHcaCatalogFile(const std::string& path, HcaCatalog& out, std::string& error) {
  std::string text;
  if (!readTextFile(path, text)) {
    error = fmt::format("cannot read {}", path);
    return false;
  }
  if (!parseHcaCatalog(text, out, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

/* ----------------------------- Loading ----------------------------- */

std::vector<std::string> listSpecFiles(const std::string& dir) {
  std::vector<std::string> out;
  for (const std::string& name : listDir(dir)) {
    if (helpers::strings::endsWith(name, SPEC_SUFFIX)) {
      out.push_back(joinPath(dir, name));
    }
  }
  return out;
}

std::size_t loadClusterSpecs(const std::string& file, const std::string& productionDir,
                             const std::string& devDir, ClusterSpecSet& out) {
  return loadMerged("cluster", file, productionDir, devDir, out, &parseClusterSection);
}

std::size_t loadHcaCatalog(const std::string& file, const std::string& productionDir,
                           const std::string& devDir, HcaCatalog& out) {
  return loadMerged("hca", file, productionDir, devDir, out, &parseCatalogSection);
}

} // namespace spec

} // namespace ibcheck
