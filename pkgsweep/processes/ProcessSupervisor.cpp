/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/processes/ProcessSupervisor.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fcntl.h>
#include <folly/Conv.h>
#include <folly/Exception.h>
#include <folly/FileUtil.h>
#include <folly/futures/Future.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/io/async/EventBase.h>
#include <folly/Optional.h>
#include <folly/String.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <thread>
#include <unistd.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/processes/AsyncSubprocess.h"
#include "pkgsweep/processes/LogPipeReader.h"
#include "pkgsweep/utils/CancellationToken.h"
#include "pkgsweep/utils/cpu_time.h"
#include "pkgsweep/utils/signal.h"

DEFINE_int32(
  supervisor_poll_ms, 100,
  "How often supervised jobs are polled for exit, and their watchdogs "
  "evaluated."
);
DEFINE_int32(
  inactivity_first_check_ms, 60000,
  "When to take the first CPU time sample of a job."
);
DEFINE_int32(
  inactivity_check_interval_ms, 30000,
  "A job that used less than 1 CPU second since the previous sample, taken "
  "this long ago, is killed for inactivity."
);
DEFINE_int32(
  kill_grace_period_ms, 10000,
  "After SIGTERM, a job's process group has this long before SIGKILL."
);
DEFINE_int32(
  output_drain_timeout_ms, 5000,
  "After a job exits, wait this long for orphaned descendants to close its "
  "output pipe, before closing it ourselves."
);

namespace facebook { namespace pkgsweep {

namespace {

using Clock = std::chrono::steady_clock;

struct Verdict {
  Status status;
  folly::Optional<Reason> reason;
};

/**
 * The three watchdogs, plus cancellation, and the TERM-then-KILL stop
 * sequence.  Only used from the EventBase thread, so it needs no locking.
 */
class Watchdogs {
public:
  Watchdogs(const Configuration& config, const CancellationToken* cancel)
    : config_(config),
      cancel_(cancel),
      deadline_(Clock::now() + config.effectiveTimeLimit()),
      nextInactivityCheck_(
        Clock::now() + std::chrono::milliseconds(FLAGS_inactivity_first_check_ms)
      ) {}

  void onTick(folly::Subprocess& proc) noexcept {
    if (!verdict_.has_value()) {
      try {
        checkWatchdogs(proc.pid());
      } catch (const std::exception& ex) {
        LOG(ERROR) << "Failed to check watchdogs of job on " << config_.name
          << ": " << ex.what();
      }
    }
    if (sendTerm_) {
      sendTerm_ = false;
      signalGroup(proc, SIGTERM);
      killAfterTicks_ = std::max(
        1, FLAGS_kill_grace_period_ms / std::max(1, FLAGS_supervisor_poll_ms)
      );
    } else if (killAfterTicks_ > 0 && --killAfterTicks_ == 0) {
      LOG(WARNING) << "Job on " << config_.name << " outlived its grace "
        << "period, sending SIGKILL";
      signalGroup(proc, SIGKILL);
    }
  }

  // The output outgrew the log limit.  Too late to matter if the process
  // already exited, and the remaining output was being drained.
  void onLogOverflow() {
    if (!exited_) {
      stop({Status::Kill, Reason::LogLimit});
    }
  }

  void onExit() { exited_ = true; }

  bool stopRequested() const { return verdict_.has_value(); }
  const folly::Optional<Verdict>& verdict() const { return verdict_; }

private:
  void checkWatchdogs(pid_t pid) {
    auto now = Clock::now();
    if (cancel_ && cancel_->isCancelled()) {
      stop({Status::Kill, folly::none});
      return;
    }
    if (now >= deadline_) {
      stop({Status::Kill, Reason::TimeLimit});
      return;
    }
    if (now >= nextInactivityCheck_) {
      nextInactivityCheck_ =
        now + std::chrono::milliseconds(FLAGS_inactivity_check_interval_ms);
      auto cpu = processTreeCpuSeconds(pid);
      if (!cpu.has_value()) {
        return;  // Keep the previous sample
      }
      // Zero means the accounting is unavailable, not that we're idle.
      if (*cpu > 0 && previousCpuSec_.has_value()) {
        auto diff = *cpu - *previousCpuSec_;
        if (diff >= 0 && diff < 1) {
          stop({Status::Kill, Reason::Inactivity});
        }
      }
      previousCpuSec_ = *cpu;
    }
  }

  void stop(Verdict v) {
    if (verdict_.has_value()) {
      return;  // The first stop wins
    }
    LOG(INFO) << "Stopping job on " << config_.name << ": "
      << (v.reason.has_value() ? reasonMessage(v.reason) : "cancelled");
    verdict_ = std::move(v);
    sendTerm_ = true;
  }

  // Safe because AsyncSubprocess only ticks while the child is unreaped.
  void signalGroup(folly::Subprocess& proc, int sig) noexcept {
    CHECK(proc.returnCode().running());
    auto pid = proc.pid();
    CHECK_GT(pid, 1);
    if (::kill(-pid, sig) == -1) {
      PLOG(ERROR) << "Failed to send " << describeSignal(sig) << " to "
        << "process group " << pid << ", signaling just the process";
      try {
        proc.sendSignal(sig);
      } catch (const std::exception& ex) {
        LOG(ERROR) << "Failed to signal " << pid << ": " << ex.what();
      }
    }
  }

  const Configuration& config_;
  const CancellationToken* cancel_;
  const Clock::time_point deadline_;
  Clock::time_point nextInactivityCheck_;
  folly::Optional<double> previousCpuSec_;
  folly::Optional<Verdict> verdict_;
  bool sendTerm_{false};
  int killAfterTicks_{0};
  bool exited_{false};
};

void makePipe(folly::File* read_pipe, folly::File* write_pipe) {
  int fds[2];
  // CLOEXEC, or concurrently spawned jobs would inherit the write end, and
  // keep our reader from seeing EOF.
  folly::checkUnixError(::pipe2(fds, O_CLOEXEC), "pipe2");
  *read_pipe = folly::File(fds[0], /*owns_fd=*/ true);
  *write_pipe = folly::File(fds[1], /*owns_fd=*/ true);
}

/**
 * Feeds the script to the child's stdin, then closes it.  Nonblocking with
 * a short poll() so that `done` can abandon the write if the child never
 * reads its input.  The thread ignores SIGPIPE, so a child that exits
 * early only yields EPIPE.
 */
void writeStdin(
    folly::File pipe,
    std::string script,
    const std::atomic<bool>* done) {
  sigset_t sigpipe;
  sigemptyset(&sigpipe);
  sigaddset(&sigpipe, SIGPIPE);
  if (int err = pthread_sigmask(SIG_BLOCK, &sigpipe, nullptr)) {
    LOG(ERROR) << "Failed to block SIGPIPE: " << folly::errnoStr(err);
    return;
  }
  int fd = pipe.fd();
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    PLOG(ERROR) << "Failed to make the script pipe nonblocking";
    return;
  }
  folly::StringPiece remaining(script);
  while (!remaining.empty() && !done->load()) {
    struct pollfd pfd{fd, POLLOUT, 0};
    int r = ::poll(&pfd, 1, 100);
    if (r == -1 && errno != EINTR) {
      PLOG(ERROR) << "Failed to poll the script pipe";
      return;
    }
    if (r <= 0) {
      continue;
    }
    ssize_t n = folly::writeNoInt(fd, remaining.data(), remaining.size());
    if (n == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      if (errno == EPIPE) {
        VLOG(1) << "Job exited before reading its whole script";
      } else {
        PLOG(ERROR) << "Failed to write the script";
      }
      return;
    }
    remaining.advance(n);
  }
  if (!pipe.closeNoThrow()) {
    PLOG(WARNING) << "Failed to close the script pipe";
  }
}

void truncateLog(std::string* log, uint64_t limit) {
  if (log->size() <= limit) {
    return;
  }
  // Don't split a UTF-8 sequence.
  size_t n = limit;
  while (n > 0 && (static_cast<unsigned char>((*log)[n]) & 0xC0) == 0x80) {
    --n;
  }
  log->resize(n);
}

}  // anonymous namespace

std::pair<Status, folly::Optional<Reason>> classifyExit(
    const folly::ProcessReturnCode& rc) {
  int sig = 0;
  if (rc.killed()) {
    sig = rc.killSignal();
  } else if (rc.exited()) {
    if (rc.exitStatus() == 0) {
      return {Status::Ok, folly::none};
    }
    if (rc.exitStatus() > 128) {
      sig = rc.exitStatus() - 128;
    }
  }
  switch (sig) {
    case SIGABRT:
      return {Status::Crash, Reason::Abort};
    case SIGSEGV:
      return {Status::Crash, Reason::Segfault};
    case SIGKILL:
      return {Status::Kill, Reason::ResourceLimit};
    default:
      return {Status::Fail, folly::none};
  }
}

ProcessSupervisor::ProcessSupervisor(
    const Sandbox* sandbox,
    const CancellationToken* cancel)
  : sandbox_(sandbox), cancel_(cancel) {
  CHECK(sandbox_);
}

ScriptResult ProcessSupervisor::runScript(
    const Configuration& config,
    const ScriptRequest& request) const {
  CHECK_GT(config.logLimitBytes, 0)
    << "Configuration " << config.name << " has no log limit";
  ScriptResult result;

  SandboxCommand cmd;
  folly::File out_read, out_write;
  folly::Optional<folly::Subprocess> proc;
  try {
    cmd = sandbox_->prepare(config, SandboxRequest{
      request.args, request.env, request.mounts, request.workDir
    });
    makePipe(&out_read, &out_write);
    auto opts = folly::Subprocess::Options()
      .pipeStdin()
      .fd(STDOUT_FILENO, out_write.fd())
      .fd(STDERR_FILENO, out_write.fd())
      .parentDeathSignal(SIGKILL)
      .processGroupLeader();
    if (!cmd.chdir.empty()) {
      opts.chdir(cmd.chdir);
    }
    proc.emplace(cmd.argv, opts, nullptr, &cmd.env);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Cannot start job on " << config.name << ", cmd: "
      << folly::join(' ', cmd.argv) << ", err: " << ex.what();
    result.status = Status::Fail;
    result.log = folly::to<std::string>(
      "Failed to start ", folly::join(' ', cmd.argv), ": ", ex.what(), "\n"
    );
    truncateLog(&result.log, config.logLimitBytes);
    return result;
  }
  out_write.close();  // Only the child writes.

  folly::File stdin_pipe;
  for (auto& p : proc->takeOwnershipOfPipes()) {
    if (p.childFd == STDIN_FILENO) {
      stdin_pipe = std::move(p.pipe);
    }
  }
  std::atomic<bool> stdin_done{false};
  std::thread stdin_writer(
    writeStdin, std::move(stdin_pipe), request.script + "\n", &stdin_done
  );

  folly::EventBase evb;
  Watchdogs watchdogs(config, cancel_);
  LogPipeReader reader(
    &evb,
    std::move(out_read),
    config.logLimitBytes,
    request.echo,
    [&watchdogs]() { watchdogs.onLogOverflow(); }
  );
  std::unique_ptr<folly::AsyncTimeout> drain_timeout;
  folly::ProcessReturnCode rc;

  collectAllSemiFuture(
    asyncSubprocess(
      &evb,
      std::move(*proc),
      [&watchdogs](folly::Subprocess& p) noexcept { watchdogs.onTick(p); },
      FLAGS_supervisor_poll_ms
    ).thenValue([&](folly::ProcessReturnCode&& ret) noexcept {
      rc = ret;
      watchdogs.onExit();
      if (watchdogs.stopRequested()) {
        reader.drainAndClose();
      } else if (!reader.isClosed()) {
        drain_timeout = folly::AsyncTimeout::make(evb, [&reader]() noexcept {
          LOG(WARNING) << "Job output is still open after it exited, "
            << "closing it";
          reader.drainAndClose();
        });
        drain_timeout->scheduleTimeout(FLAGS_output_drain_timeout_ms);
      }
    }),
    reader.pipeClosed()
  ).toUnsafeFuture().thenValue([&evb](
      std::tuple<folly::Try<folly::Unit>, folly::Try<folly::Unit>>&&)
      noexcept {
    evb.terminateLoopSoon();
  });
  evb.loopForever();

  stdin_done.store(true);
  stdin_writer.join();

  if (watchdogs.verdict().has_value()) {
    result.status = watchdogs.verdict()->status;
    result.reason = watchdogs.verdict()->reason;
  } else {
    std::tie(result.status, result.reason) = classifyExit(rc);
  }
  VLOG(1) << "Job on " << config.name << " finished with " << rc.str()
    << ", status " << statusName(result.status);
  result.log = std::move(reader.buffer());
  truncateLog(&result.log, config.logLimitBytes);
  return result;
}

}}  // namespace facebook::pkgsweep
