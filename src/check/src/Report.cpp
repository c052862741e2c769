/**
 * @file Report.cpp
 * @brief Report rendering with fmt.
 */

#include "src/check/inc/Report.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace ibcheck {

namespace check {

using helpers::strings::jsonEscape;

namespace {

constexpr const char* RESET = "\033[0m";

const char* statusColor(const CheckResult& r) {
  if (r.normal()) {
    return "\033[32m"; // green
  }
  switch (r.level) {
  case Level::Critical:
    return "\033[31m"; // red
  case Level::Warning:
    return "\033[33m"; // yellow
  case Level::Info:
    return "\033[36m"; // cyan
  }
  return "";
}

const char* statusLabel(const CheckResult& r) {
  if (r.normal()) {
    return "PASS";
  }
  switch (r.level) {
  case Level::Critical:
    return "FAIL";
  case Level::Warning:
    return "WARN";
  case Level::Info:
    return "INFO";
  }
  return "????";
}

} // namespace

/* ----------------------------- Summary ----------------------------- */

const char* ReportSummary::overall() const noexcept {
  if (critical > 0) {
    return "critical";
  }
  if (warning > 0) {
    return "warning";
  }
  if (info > 0) {
    return "info";
  }
  return "pass";
}

ReportSummary summarize(const std::vector<CheckResult>& results) noexcept {
  ReportSummary s;
  for (const CheckResult& r : results) {
    if (r.normal()) {
      ++s.normal;
      continue;
    }
    ++s.abnormal;
    switch (r.level) {
    case Level::Critical:
      ++s.critical;
      break;
    case Level::Warning:
      ++s.warning;
      break;
    case Level::Info:
      ++s.info;
      break;
    }
  }
  return s;
}

/* ----------------------------- Human ----------------------------- */

std::string formatHuman(const ReportHeader& header, const std::vector<CheckResult>& results,
                        bool verbose, bool color) {
  std::string out;
  out.reserve(4096);

  out += "=== InfiniBand Health Check ===\n\n";
  out += fmt::format("  Node:     {}\n", header.node);
  out += fmt::format("  Cluster:  {} ({})\n", header.cluster, header.clusterSource);
  out += fmt::format("  Adapters: {}\n", header.adapters);
  if (!header.nicRole.empty()) {
    out += fmt::format("  NIC role: {}\n", header.nicRole);
  }
  out += "\n";

  for (const CheckResult& r : results) {
    out += fmt::format("  {}{:4}{} {:24} {}\n", color ? statusColor(r) : "", statusLabel(r),
                       color ? RESET : "", r.name, r.normal() ? std::string() : r.device);
    if (!verbose) {
      continue;
    }
    if (!r.spec.empty() || !r.curr.empty()) {
      out += fmt::format("       spec: {}\n       curr: {}\n", r.spec, r.curr);
    }
    if (!r.detail.empty()) {
      out += fmt::format("       -> {}\n", r.detail);
    }
    if (!r.normal() && !r.suggestion.empty()) {
      out += fmt::format("       fix: {}\n", r.suggestion);
    }
  }

  const ReportSummary S = summarize(results);
  out += "\n=== Summary ===\n";
  out += fmt::format("  normal: {}  abnormal: {} (critical {}, warning {}, info {})\n", S.normal,
                     S.abnormal, S.critical, S.warning, S.info);
  out += fmt::format("  Status: {}\n", S.overall());
  return out;
}

/* ----------------------------- JSON ----------------------------- */

std::string toJson(const ReportHeader& header, const std::vector<CheckResult>& results) {
  std::string out;
  out.reserve(4096);

  out += "{\n";
  out += fmt::format("  \"node\": \"{}\",\n", jsonEscape(header.node));
  out += fmt::format("  \"cluster\": \"{}\",\n", jsonEscape(header.cluster));
  out += fmt::format("  \"clusterSource\": \"{}\",\n", jsonEscape(header.clusterSource));
  out += fmt::format("  \"adapters\": {},\n", header.adapters);
  out += fmt::format("  \"nicRole\": \"{}\",\n", jsonEscape(header.nicRole));

  out += "  \"checks\": [";
  for (std::size_t i = 0; i < results.size(); ++i) {
    const CheckResult& R = results[i];
    out += i == 0 ? "\n" : ",\n";
    out += fmt::format("    {{\"name\": \"{}\", \"level\": \"{}\", \"status\": \"{}\", "
                       "\"spec\": \"{}\", \"curr\": \"{}\", \"device\": \"{}\", "
                       "\"detail\": \"{}\", \"suggestion\": \"{}\"}}",
                       jsonEscape(R.name), toString(R.level), toString(R.status),
                       jsonEscape(R.spec), jsonEscape(R.curr), jsonEscape(R.device),
                       jsonEscape(R.detail), jsonEscape(R.suggestion));
  }
  out += results.empty() ? "],\n" : "\n  ],\n";

  const ReportSummary S = summarize(results);
  out += "  \"summary\": {\n";
  out += fmt::format("    \"normal\": {},\n", S.normal);
  out += fmt::format("    \"abnormal\": {},\n", S.abnormal);
  out += fmt::format("    \"critical\": {},\n", S.critical);
  out += fmt::format("    \"warning\": {},\n", S.warning);
  out += fmt::format("    \"info\": {},\n", S.info);
  out += fmt::format("    \"overall\": \"{}\"\n", S.overall());
  out += "  }\n";
  out += "}\n";
  return out;
}

} // namespace check

} // namespace ibcheck
