/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/utils/cpu_time.h"

#include <boost/filesystem.hpp>
#include <folly/Conv.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <glog/logging.h>
#include <unistd.h>
#include <unordered_map>
#include <vector>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace {

// Offsets into the space-separated fields following the command name.
// Field 3 of proc(5) ("state") is at offset 0.
constexpr size_t kPPidOffset = 1;
constexpr size_t kUTimeOffset = 11;  // Then stime, cutime, cstime.
constexpr size_t kMinFields = kUTimeOffset + 4;

folly::Optional<ProcStat> readProcStat(const boost::filesystem::path& file) {
  std::string line;
  if (!folly::readFile(file.c_str(), line)) {
    return folly::none;  // Usually, the process just exited.
  }
  try {
    return parseProcStat(line);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Bad " << file << ": " << ex.what();
    return folly::none;
  }
}

}  // anonymous namespace

ProcStat parseProcStat(folly::StringPiece line) {
  auto open = line.find('(');
  auto close = line.rfind(')');
  if (open == folly::StringPiece::npos || close == folly::StringPiece::npos ||
      close < open) {
    throw PkgSweepException("No command name in stat line: ", line);
  }
  ProcStat st;
  st.pid = folly::to<pid_t>(folly::trimWhitespace(line.subpiece(0, open)));

  std::vector<folly::StringPiece> fields;
  folly::split(' ', folly::trimWhitespace(line.subpiece(close + 1)), fields);
  if (fields.size() < kMinFields) {
    throw PkgSweepException(
      "Expected at least ", kMinFields, " fields after the command, got ",
      fields.size(), " in: ", line
    );
  }
  st.ppid = folly::to<pid_t>(fields[kPPidOffset]);
  st.cpuTicks = 0;
  for (size_t i = kUTimeOffset; i < kUTimeOffset + 4; ++i) {
    st.cpuTicks += folly::to<uint64_t>(fields[i]);
  }
  return st;
}

folly::Optional<double> processTreeCpuSeconds(
    pid_t root,
    const boost::filesystem::path& proc_dir) {
  auto root_stat =
    readProcStat(proc_dir / folly::to<std::string>(root) / "stat");
  if (!root_stat.has_value()) {
    return folly::none;
  }

  std::unordered_map<pid_t, std::vector<ProcStat>> children;
  boost::system::error_code ec;
  for (boost::filesystem::directory_iterator it(proc_dir, ec), end;
       !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().native();
    if (name.empty() ||
        name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    if (auto st = readProcStat(it->path() / "stat")) {
      if (st->pid != root) {
        children[st->ppid].push_back(*st);
      }
    }
  }

  uint64_t ticks = 0;
  std::vector<ProcStat> to_visit{*root_stat};
  while (!to_visit.empty()) {
    auto st = to_visit.back();
    to_visit.pop_back();
    ticks += st.cpuTicks;
    auto it = children.find(st.pid);
    if (it != children.end()) {
      to_visit.insert(to_visit.end(), it->second.begin(), it->second.end());
    }
  }

  static const long kTicksPerSec = ::sysconf(_SC_CLK_TCK);
  return static_cast<double>(ticks) / (kTicksPerSec > 0 ? kTicksPerSec : 100);
}

}}  // namespace facebook::pkgsweep
