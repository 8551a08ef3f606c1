/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Optional.h>
#include <folly/Subprocess.h>
#include <map>
#include <string>
#include <vector>

#include "pkgsweep/sandbox/Sandbox.h"
#include "pkgsweep/statuses/Outcome.h"

namespace facebook { namespace pkgsweep {

class CancellationToken;
class Configuration;

struct ScriptRequest {
  std::string script;  // Fed to the runtime via stdin
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::vector<Mount> mounts;
  std::string workDir;
  bool echo{false};  // Copy the output to our stdout as it arrives
};

struct ScriptResult {
  std::string log;  // Combined stdout & stderr, at most the log limit
  Status status;
  folly::Optional<Reason> reason;
};

/**
 * Maps the exit of a process that no watchdog stopped: exit 0 is `ok`,
 * SIGABRT is crash/abort, SIGSEGV is crash/segfault, SIGKILL (typically
 * from a cgroup OOM kill) is kill/resource_limit, and anything else is a
 * `fail` with no reason yet.  Sandboxes and shells report a child's death
 * by signal N as exit code 128 + N, so those count as signals too.
 */
std::pair<Status, folly::Optional<Reason>> classifyExit(
  const folly::ProcessReturnCode& rc
);

/**
 * Runs one script in a sandboxed runtime process, racing it against
 * three watchdogs, any of which stops it:
 *
 *  - time limit: the configuration's effectiveTimeLimit(), kill/time_limit
 *  - inactivity: from --inactivity_first_check_ms on, every
 *    --inactivity_check_interval_ms, sample the CPU seconds of the process
 *    tree.  Less than one second of progress between two samples is
 *    kill/inactivity.  Unavailable samples and samples of exactly 0 never
 *    count as idle.
 *  - log size: output past the log limit is kill/log_limit
 *
 * Stopping sends SIGTERM to the process group, then SIGKILL after
 * --kill_grace_period_ms.  If the CancellationToken fires, the process is
 * stopped the same way, and the result is `kill` with no reason.  The
 * first stop wins: later watchdogs do not change the verdict.
 *
 * runScript() blocks the calling thread, which drives a private EventBase
 * until the process is reaped and its output pipe is closed.  Distinct
 * threads may call it concurrently.  Failing to start the process yields
 * a `fail` whose log explains why, rather than an exception.
 */
class ProcessSupervisor {
public:
  explicit ProcessSupervisor(
    const Sandbox* sandbox,
    const CancellationToken* cancel = nullptr
  );

  ScriptResult runScript(
    const Configuration& config,
    const ScriptRequest& request
  ) const;

  const Sandbox& sandbox() const { return *sandbox_; }

private:
  const Sandbox* sandbox_;
  const CancellationToken* cancel_;
};

}}  // namespace facebook::pkgsweep
