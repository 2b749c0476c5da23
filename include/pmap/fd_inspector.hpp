/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file fd_inspector.hpp
 * @brief Snapshot the process descriptor table and diff two snapshots.
 *
 * Used to check that a pool releases exactly the descriptors it opened.
 * Linux-only (/proc/self/fd).
 */

#ifndef PMAP_FD_INSPECTOR_HPP_
#define PMAP_FD_INSPECTOR_HPP_

#include "pmap/platform.hpp"
#include "pmap/log.hpp"
#include "pmap/process.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pmap {

enum class FdKind : uint8_t {
  kDirectory = 0,
  kCharDevice,
  kBlockDevice,
  kRegular,
  kFifo,
  kSymlink,
  kSocket,
  kUnknown,
};

inline const char* FdKindName(FdKind k) noexcept {
  switch (k) {
    case FdKind::kDirectory:   return "directory";
    case FdKind::kCharDevice:  return "char device";
    case FdKind::kBlockDevice: return "block device";
    case FdKind::kRegular:     return "regular";
    case FdKind::kFifo:        return "fifo";
    case FdKind::kSymlink:     return "symlink";
    case FdKind::kSocket:      return "socket";
    default:                   return "unknown";
  }
}

struct FdInfo {
  FdKind kind = FdKind::kUnknown;
  std::string target;  ///< readlink of /proc/self/fd/N, e.g. "pipe:[1234]"

  bool operator==(const FdInfo& o) const { return kind == o.kind && target == o.target; }
  bool operator!=(const FdInfo& o) const { return !(*this == o); }
};

using FdTable = std::map<int, FdInfo>;

struct FdDifference {
  std::vector<int> opened;
  std::vector<int> closed;
};

namespace detail {

inline FdKind ClassifyMode(mode_t mode) noexcept {
  if (S_ISDIR(mode)) return FdKind::kDirectory;
  if (S_ISCHR(mode)) return FdKind::kCharDevice;
  if (S_ISBLK(mode)) return FdKind::kBlockDevice;
  if (S_ISREG(mode)) return FdKind::kRegular;
  if (S_ISFIFO(mode)) return FdKind::kFifo;
  if (S_ISLNK(mode)) return FdKind::kSymlink;
  if (S_ISSOCK(mode)) return FdKind::kSocket;
  return FdKind::kUnknown;
}

}  // namespace detail

/**
 * @brief Descriptors >= 3 currently open in this process.
 *
 * The directory listing's own descriptor is excluded, and each entry is
 * re-checked with fstat() so that one closed during the scan is dropped.
 */
inline FdTable Snapshot() {
  FdTable table;
  std::vector<int> candidates;
  {
    detail::DirGuard dir(opendir("/proc/self/fd"));
    if (!dir.get()) {
      PMAP_LOG_WARN("FdInspector", "cannot open /proc/self/fd");
      return table;
    }
    const int self = dirfd(dir.get());
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
      if (!detail::IsDigitString(entry->d_name)) continue;
      int fd = std::atoi(entry->d_name);
      if (fd < 3 || fd == self) continue;
      candidates.push_back(fd);
    }
  }

  for (int fd : candidates) {
    struct stat st;
    if (::fstat(fd, &st) != 0) continue;
    FdInfo info;
    info.kind = detail::ClassifyMode(st.st_mode);

    char path[64];
    char link[256];
    (void)std::snprintf(path, sizeof(path), "/proc/self/fd/%d", fd);
    ssize_t n = ::readlink(path, link, sizeof(link) - 1U);
    if (n > 0) info.target.assign(link, static_cast<size_t>(n));
    table.emplace(fd, std::move(info));
  }
  return table;
}

/**
 * @brief Descriptors opened and closed between two snapshots.
 *
 * A descriptor number present in both but pointing somewhere else counts as
 * both closed and reopened; a warning is logged for it.
 */
inline FdDifference Difference(const FdTable& before, const FdTable& after) {
  FdDifference diff;
  for (const auto& kv : before) {
    auto it = after.find(kv.first);
    if (it == after.end()) {
      diff.closed.push_back(kv.first);
    } else if (it->second != kv.second) {
      PMAP_LOG_WARN("FdInspector", "fd %d changed from %s to %s", kv.first,
                    kv.second.target.c_str(), it->second.target.c_str());
      diff.closed.push_back(kv.first);
      diff.opened.push_back(kv.first);
    }
  }
  for (const auto& kv : after) {
    if (before.find(kv.first) == before.end()) diff.opened.push_back(kv.first);
  }
  return diff;
}

}  // namespace pmap

#endif  // PMAP_FD_INSPECTOR_HPP_
