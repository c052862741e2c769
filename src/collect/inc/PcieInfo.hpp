#ifndef IBCHECK_COLLECT_PCIE_INFO_HPP
#define IBCHECK_COLLECT_PCIE_INFO_HPP
/**
 * @file PcieInfo.hpp
 * @brief PCIe link state, upstream tree minimums, Max Read Request and ACS.
 * @note Linux-only. Link attributes come from sysfs; MRR and ACS registers
 *       are read (and MRR optionally written) with lspci/setpci.
 *
 * Writing the MRR register is a side effect of collection when enabled. It
 * is logged at info level and can be disabled through configuration.
 */

#include "src/collect/inc/ProcessRunner.hpp"
#include "src/collect/inc/SysPaths.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace ibcheck {
namespace collect {

/* ----------------------------- Constants ----------------------------- */

/// Expected Max Read Request size in bytes.
inline constexpr int EXPECTED_MRR_BYTES = 4096;

/// Device Control register offset holding the MRR field (setpci syntax).
inline constexpr const char* MRR_REGISTER = "68";

/// MRR field encoding for 4096 bytes (bits 14:12 of Device Control).
inline constexpr unsigned MRR_NIBBLE_4096 = 5;

/// ACS control register in setpci syntax.
inline constexpr const char* ACS_CTRL_REGISTER = "ecap_acs+6.w";

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Negotiated link of a PCI function.
 */
struct PcieLink {
  std::string speed; ///< current_link_speed, e.g. "32.0 GT/s PCIe"
  std::string width; ///< current_link_width, e.g. "16"
};

/**
 * @brief ACS control value of one PCI function.
 */
struct AcsEntry {
  std::string bdf;
  std::string control; ///< Raw register value, "0000" when disabled
};

/**
 * @brief Result of an ACS scan over all PCI functions.
 */
struct AcsScan {
  std::vector<AcsEntry> enabled; ///< Functions with ACS not disabled
  std::size_t scanned{0};        ///< Functions whose register was read
  std::size_t unreadable{0};     ///< Functions without ACS capability or read errors
  std::string error{};           ///< Set if the scan itself could not run

  [[nodiscard]] bool allDisabled() const noexcept { return error.empty() && enabled.empty(); }
};

/* ----------------------------- Pure helpers ----------------------------- */

/**
 * @brief Extract all full PCI addresses ("dddd:bb:dd.f") from @p text, in order.
 * @note Matches the pattern [0-9a-f]{4}:[0-9a-f]{2}:[0-9a-f]{2}\.[0-7].
 */
[[nodiscard]] std::vector<std::string> extractBdfs(std::string_view text);

/**
 * @brief Parse "MaxReadReq <n> bytes" from `lspci -vvv` output.
 * @return The byte count, or -1 if absent.
 */
[[nodiscard]] int parseMaxReadReq(std::string_view lspciOutput) noexcept;

/**
 * @brief Leading numeric token of a link attribute ("16.0 GT/s PCIe" -> "16.0").
 */
[[nodiscard]] std::string leadingNumber(std::string_view value);

/* ----------------------------- sysfs ----------------------------- */

/// current_link_speed / current_link_width of @p bdf.
[[nodiscard]] PcieLink readPcieLink(const SysPaths& paths, const std::string& bdf);

/**
 * @brief Minimum of @p attr across the upstream bridges of @p bdf.
 *
 * Upstream functions are taken from the device symlink target, excluding
 * @p bdf itself. With fewer than two upstream functions (device attached
 * directly to the root complex) the result is "". Otherwise the leading
 * numeric token with the smallest value among readable attributes.
 */
[[nodiscard]] std::string pcieTreeMin(const SysPaths& paths, const std::string& bdf,
                                      const std::string& attr);

/* ----------------------------- PcieInspector ----------------------------- */

/**
 * @brief Register-level PCIe inspection through lspci/setpci.
 */
class PcieInspector {
public:
  PcieInspector(SysPaths paths, ProcessRunner& runner,
                std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT);

  /**
   * @brief Current Max Read Request in bytes.
   * @return -1 on failure, with @p error set.
   */
  [[nodiscard]] int readMaxReadRequest(const std::string& bdf, std::string& error);

  /**
   * @brief Rewrite the MRR field of Device Control.
   *
   * Reads `setpci -s <bdf> 68.w`, keeps the low 12 bits, sets the high
   * nibble to @p nibble, writes the value back and reads it again to verify.
   *
   * @return false with @p error set on any failed step or a verify mismatch.
   */
  [[nodiscard]] bool setMaxReadRequestNibble(const std::string& bdf, unsigned nibble,
                                             std::string& error);

  /**
   * @brief MRR as reported to checkers, optionally correcting it first.
   *
   * When @p autoFix is set and the observed value differs from
   * EXPECTED_MRR_BYTES, the register is rewritten and lspci is consulted
   * again, so the returned value reflects the corrected state.
   *
   * @return MRR as text ("4096"), or "" if unreadable.
   */
  [[nodiscard]] std::string collectMaxReadRequest(const std::string& bdf, bool autoFix);

  /**
   * @brief Read the ACS control register of every PCI function.
   * @note Read-only; ACS is never modified.
   */
  [[nodiscard]] AcsScan scanAcs();

private:
  SysPaths paths_;
  ProcessRunner& runner_;
  std::chrono::milliseconds timeout_;
};

} // namespace collect
} // namespace ibcheck

#endif // IBCHECK_COLLECT_PCIE_INFO_HPP
