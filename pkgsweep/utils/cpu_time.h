/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <sys/types.h>

namespace facebook { namespace pkgsweep {

struct ProcStat {
  pid_t pid;
  pid_t ppid;
  // utime + stime + cutime + cstime, in clock ticks.
  uint64_t cpuTicks;
};

// Parses one /proc/<pid>/stat line.  The command name may contain spaces
// and parentheses, so fields are counted from its last ')'.  Throws on
// malformed input.
ProcStat parseProcStat(folly::StringPiece line);

/**
 * Cumulative CPU seconds (user + system, including reaped children) of
 * `root` and every live descendant.  Descendants matter because the
 * supervised process is usually a sandbox launcher whose children do the
 * actual work, and their CPU time only reaches the launcher once reaped.
 *
 * Returns none if `root` cannot be read, e.g. because it already exited.
 */
folly::Optional<double> processTreeCpuSeconds(
  pid_t root,
  const boost::filesystem::path& proc_dir = "/proc"
);

}}  // namespace facebook::pkgsweep
