/**
 * @file PcieInfo.cpp
 * @brief PCIe link, tree, MRR and ACS collection.
 */

#include "src/collect/inc/PcieInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

#include <fmt/core.h>

namespace ibcheck {

namespace collect {

using helpers::files::joinPath;
using helpers::files::listDir;
using helpers::files::readFirstLine;
using helpers::files::readLink;
using helpers::strings::splitFields;
using helpers::strings::trim;

namespace {

/* ----------------------------- Helpers ----------------------------- */

inline bool isHex(char c) noexcept { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

/// True if text[pos..pos+12) is "hhhh:hh:hh.f" with f in [0-7].
bool bdfAt(std::string_view text, std::size_t pos) noexcept {
  constexpr std::size_t LEN = 12;
  if (pos + LEN > text.size()) {
    return false;
  }
  const std::string_view S = text.substr(pos, LEN);
  for (const std::size_t I : {0U, 1U, 2U, 3U, 5U, 6U, 8U, 9U}) {
    if (!isHex(S[I])) {
      return false;
    }
  }
  return S[4] == ':' && S[7] == ':' && S[10] == '.' && S[11] >= '0' && S[11] <= '7';
}

/// Parse a 16-bit hex register value as printed by setpci.
bool parseHexWord(const std::string& text, unsigned& out) noexcept {
  const std::string T = trim(text);
  if (T.empty() || T.size() > 4) {
    return false;
  }
  char* end = nullptr;
  const unsigned long V = std::strtoul(T.c_str(), &end, 16);
  if (end == T.c_str() || *end != '\0') {
    return false;
  }
  out = static_cast<unsigned>(V);
  return true;
}

} // namespace

/* ----------------------------- Pure helpers ----------------------------- */

std::vector<std::string> extractBdfs(std::string_view text) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < text.size()) {
    // Require a non-hex boundary on the left, as a word-boundary match would.
    const bool LEFT_OK = i == 0 || !isHex(text[i - 1]);
    if (LEFT_OK && bdfAt(text, i)) {
      const std::size_t END = i + 12;
      if (END == text.size() || !std::isalnum(static_cast<unsigned char>(text[END]))) {
        out.emplace_back(text.substr(i, 12));
        i = END;
        continue;
      }
    }
    ++i;
  }
  return out;
}

int parseMaxReadReq(std::string_view lspciOutput) noexcept {
  constexpr std::string_view KEY = "MaxReadReq ";
  const std::size_t POS = lspciOutput.find(KEY);
  if (POS == std::string_view::npos) {
    return -1;
  }
  std::size_t i = POS + KEY.size();
  int value = 0;
  bool any = false;
  while (i < lspciOutput.size() && lspciOutput[i] >= '0' && lspciOutput[i] <= '9') {
    value = value * 10 + (lspciOutput[i] - '0');
    any = true;
    ++i;
  }
  return any ? value : -1;
}

std::string leadingNumber(std::string_view value) {
  const std::vector<std::string> FIELDS = splitFields(value);
  return FIELDS.empty() ? std::string() : FIELDS.front();
}

/* ----------------------------- sysfs ----------------------------- */

PcieLink readPcieLink(const SysPaths& paths, const std::string& bdf) {
  PcieLink link;
  const std::string DIR = joinPath(paths.pciDevices, bdf);
  link.speed = readFirstLine(joinPath(DIR, "current_link_speed"));
  link.width = readFirstLine(joinPath(DIR, "current_link_width"));
  return link;
}

std::string pcieTreeMin(const SysPaths& paths, const std::string& bdf, const std::string& attr) {
  const std::string TARGET = readLink(joinPath(paths.pciDevices, bdf));
  if (TARGET.empty()) {
    helpers::log::logger()->debug("cannot resolve PCI link for {}", bdf);
    return {};
  }

  std::vector<std::string> upstream;
  for (std::string& found : extractBdfs(TARGET)) {
    if (found != bdf) {
      upstream.push_back(std::move(found));
    }
  }

  // Root port only (or nothing): device hangs directly off the CPU.
  if (upstream.size() < 2) {
    helpers::log::logger()->debug("{} has {} upstream PCIe functions, tree check skipped", bdf,
                                  upstream.size());
    return {};
  }

  std::string minText;
  double minValue = 0.0;
  for (const std::string& up : upstream) {
    const std::string VALUE = readFirstLine(joinPath(joinPath(paths.pciDevices, up), attr));
    const std::string NUM = leadingNumber(VALUE);
    if (NUM.empty()) {
      continue;
    }
    char* end = nullptr;
    const double D = std::strtod(NUM.c_str(), &end);
    if (end == NUM.c_str()) {
      helpers::log::logger()->debug("unparsable {} '{}' on {}", attr, VALUE, up);
      continue;
    }
    if (minText.empty() || D < minValue) {
      minValue = D;
      minText = NUM;
    }
  }

  if (minText.empty()) {
    helpers::log::logger()->warn("no readable {} on the upstream path of {}", attr, bdf);
  }
  return minText;
}

/* ----------------------------- PcieInspector ----------------------------- */

PcieInspector::PcieInspector(SysPaths paths, ProcessRunner& runner,
                             std::chrono::milliseconds timeout)
    : paths_(std::move(paths)), runner_(runner), timeout_(timeout) {}

int PcieInspector::readMaxReadRequest(const std::string& bdf, std::string& error) {
  const CommandResult R = runner_.run({"lspci", "-s", bdf, "-vvv"}, timeout_);
  if (!R.ok()) {
    error = fmt::format("lspci -s {} failed: {}", bdf,
                        R.error.empty() ? fmt::format("exit {}", R.exitCode) : R.error);
    return -1;
  }
  const int MRR = parseMaxReadReq(R.output);
  if (MRR < 0) {
    error = fmt::format("MaxReadReq not reported for {}", bdf);
  }
  return MRR;
}

bool PcieInspector::setMaxReadRequestNibble(const std::string& bdf, unsigned nibble,
                                            std::string& error) {
  if (nibble > 0xF) {
    error = fmt::format("MRR nibble {} out of range", nibble);
    return false;
  }
  const std::string REG = fmt::format("{}.w", MRR_REGISTER);

  const CommandResult READ = runner_.run({"setpci", "-s", bdf, REG}, timeout_);
  unsigned current = 0;
  if (!READ.ok() || !parseHexWord(READ.output, current)) {
    error = fmt::format("read {} on {} failed: '{}'", REG, bdf, trim(READ.output));
    return false;
  }

  const unsigned WANT = (current & 0x0FFFU) | (nibble << 12);
  helpers::log::logger()->info("setting PCIe MaxReadReq on {}: 0x{:04x} -> 0x{:04x}", bdf,
                               current, WANT);

  const CommandResult WRITE =
      runner_.run({"setpci", "-s", bdf, fmt::format("{}={:04x}", REG, WANT)}, timeout_);
  if (!WRITE.ok()) {
    error = fmt::format("write {} on {} failed: {}", REG, bdf, WRITE.error);
    return false;
  }

  const CommandResult VERIFY = runner_.run({"setpci", "-s", bdf, REG}, timeout_);
  unsigned verified = 0;
  if (!VERIFY.ok() || !parseHexWord(VERIFY.output, verified)) {
    error = fmt::format("verify {} on {} failed", REG, bdf);
    return false;
  }
  if (verified != WANT) {
    error = fmt::format("verify {} on {}: expected 0x{:04x}, got 0x{:04x}", REG, bdf, WANT,
                        verified);
    return false;
  }
  return true;
}

std::string PcieInspector::collectMaxReadRequest(const std::string& bdf, bool autoFix) {
  std::string error;
  int mrr = readMaxReadRequest(bdf, error);
  if (mrr < 0) {
    helpers::log::logger()->warn("{}", error);
    return {};
  }

  if (autoFix && mrr != EXPECTED_MRR_BYTES) {
    if (!setMaxReadRequestNibble(bdf, MRR_NIBBLE_4096, error)) {
      helpers::log::logger()->error("MaxReadReq correction on {} failed: {}", bdf, error);
    } else {
      std::string rereadError;
      const int AFTER = readMaxReadRequest(bdf, rereadError);
      if (AFTER >= 0) {
        mrr = AFTER;
      } else {
        helpers::log::logger()->warn("{}", rereadError);
      }
    }
  }
  return std::to_string(mrr);
}

AcsScan PcieInspector::scanAcs() {
  AcsScan scan;
  const std::vector<std::string> BDFS = listDir(paths_.pciDevices);
  if (BDFS.empty()) {
    scan.error = fmt::format("no PCI devices under {}", paths_.pciDevices);
    return scan;
  }

  for (const std::string& bdf : BDFS) {
    const CommandResult R = runner_.run({"setpci", "-s", bdf, ACS_CTRL_REGISTER}, timeout_);
    if (R.error.find("not found") != std::string::npos) {
      scan.error = R.error;
      return scan;
    }
    const std::string VALUE = trim(R.output);
    unsigned parsed = 0;
    if (!R.ok() || !parseHexWord(VALUE, parsed)) {
      // Functions without an ACS capability make setpci fail; that is normal.
      ++scan.unreadable;
      continue;
    }
    ++scan.scanned;
    if (parsed != 0) {
      helpers::log::logger()->warn("ACS enabled on {} (ctrl=0x{})", bdf, VALUE);
      scan.enabled.push_back({bdf, VALUE});
    }
  }
  return scan;
}

} // namespace collect

} // namespace ibcheck
