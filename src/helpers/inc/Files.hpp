#ifndef IBCHECK_HELPERS_FILES_HPP
#define IBCHECK_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File and path utilities for sysfs/procfs collection and spec storage.
 *
 * Attribute reads use C-style I/O (open/read/close) into a bounded buffer, so
 * a misbehaving sysfs node cannot make a collector read unbounded data.
 * Directory listing, symlink and atomic-write helpers are cold-path.
 *
 * @note Thread-safe: All functions are stateless.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close, readlink

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace ibcheck {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound for a single sysfs attribute read (vpd is the largest we read).
inline constexpr std::size_t ATTR_READ_LIMIT = 4096;

/// Buffer size used for readlink().
inline constexpr std::size_t LINK_BUFFER_SIZE = 1024;

/* ----------------------------- Attribute Reads ----------------------------- */

/**
 * @brief Read up to @p limit bytes of a file.
 * @param path File to read.
 * @param out Receives the raw contents (untrimmed).
 * @param limit Maximum bytes to read.
 * @return false if the file cannot be opened or read.
 */
[[nodiscard]] inline bool readFileRaw(const std::string& path, std::string& out,
                                      std::size_t limit = ATTR_READ_LIMIT) noexcept {
  out.clear();
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::array<char, 512> chunk{};
  bool ok = true;
  while (out.size() < limit) {
    const std::size_t WANT = std::min(chunk.size(), limit - out.size());
    const ssize_t N = ::read(FD, chunk.data(), WANT);
    if (N < 0) {
      ok = false;
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  return ok;
}

/**
 * @brief Read a sysfs attribute, trimmed of surrounding whitespace.
 * @return Empty string if the file is missing or unreadable.
 */
[[nodiscard]] inline std::string readAttr(const std::string& path) noexcept {
  std::string raw;
  if (!readFileRaw(path, raw)) {
    return {};
  }
  return strings::trim(raw);
}

/**
 * @brief Read the first line of a sysfs attribute, trimmed.
 * @return Empty string if the file is missing or empty.
 */
[[nodiscard]] inline std::string readFirstLine(const std::string& path) noexcept {
  std::string raw;
  if (!readFileRaw(path, raw)) {
    return {};
  }
  const std::size_t NL = raw.find('\n');
  return strings::trim(std::string_view(raw).substr(0, NL));
}

/**
 * @brief Read a whole text file (no size limit).
 * @note NOT RT-safe: Used for spec documents and /proc tables.
 */
[[nodiscard]] inline bool readTextFile(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

/* ----------------------------- Path Utilities ----------------------------- */

/// True if @p path exists (file, directory, or symlink target).
[[nodiscard]] inline bool pathExists(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

/// True if @p path exists and is a directory.
[[nodiscard]] inline bool isDirectory(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/// True if @p path exists and is a regular file.
[[nodiscard]] inline bool isRegularFile(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode);
}

/**
 * @brief List entry names of a directory, sorted.
 * @return Empty vector if the directory cannot be opened.
 */
[[nodiscard]] inline std::vector<std::string> listDir(const std::string& path) {
  std::vector<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return names;
  }
  for (const auto& ENTRY : it) {
    names.push_back(ENTRY.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

/**
 * @brief Read a symlink target without resolving it.
 * @return Empty string if @p path is not a symlink.
 */
[[nodiscard]] inline std::string readLink(const std::string& path) noexcept {
  std::array<char, LINK_BUFFER_SIZE> buf{};
  const ssize_t LEN = ::readlink(path.c_str(), buf.data(), buf.size() - 1);
  if (LEN <= 0) {
    return {};
  }
  return std::string(buf.data(), static_cast<std::size_t>(LEN));
}

/// Last path component ("a/b/c.yaml" -> "c.yaml").
[[nodiscard]] inline std::string baseName(std::string_view path) {
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  const std::size_t SLASH = path.rfind('/');
  return std::string(SLASH == std::string_view::npos ? path : path.substr(SLASH + 1));
}

/// Join two path components with exactly one '/'.
[[nodiscard]] inline std::string joinPath(std::string_view dir, std::string_view name) {
  std::string out(dir);
  if (!out.empty() && out.back() != '/') {
    out.push_back('/');
  }
  while (!name.empty() && name.front() == '/') {
    name.remove_prefix(1);
  }
  out.append(name);
  return out;
}

/* ----------------------------- Writing ----------------------------- */

/**
 * @brief Write @p data to @p path atomically.
 *
 * Creates the parent directory, writes `<path>.tmp`, then renames it over
 * @p path. On failure the temp file is removed and @p error is set.
 */
[[nodiscard]] inline bool writeFileAtomic(const std::string& path, const std::string& data,
                                          std::string& error) {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path TARGET(path);
  if (TARGET.has_parent_path()) {
    fs::create_directories(TARGET.parent_path(), ec);
    if (ec) {
      error = "create directory " + TARGET.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  const std::string TMP = path + ".tmp";
  {
    std::ofstream out(TMP, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "open " + TMP + " for writing failed";
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      error = "write " + TMP + " failed";
      out.close();
      fs::remove(TMP, ec);
      return false;
    }
  }

  fs::rename(TMP, TARGET, ec);
  if (ec) {
    error = "rename " + TMP + " -> " + path + ": " + ec.message();
    std::error_code rmEc;
    fs::remove(TMP, rmEc);
    return false;
  }
  return true;
}

} // namespace files
} // namespace helpers
} // namespace ibcheck

#endif // IBCHECK_HELPERS_FILES_HPP
