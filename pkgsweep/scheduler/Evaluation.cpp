/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/Evaluation.h"

#include <algorithm>
#include <glog/logging.h>
#include <memory>
#include <thread>
#include <unistd.h>

#include "pkgsweep/cache/CacheManager.h"
#include "pkgsweep/config/PackageLists.h"
#include "pkgsweep/registry/Registry.h"
#include "pkgsweep/runners/JobRunner.h"
#include "pkgsweep/scheduler/CancellationListener.h"
#include "pkgsweep/scheduler/PackageResolution.h"
#include "pkgsweep/scheduler/RetryPolicy.h"
#include "pkgsweep/utils/CancellationToken.h"
#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace {
double secondsSince(std::chrono::steady_clock::time_point t) {
  return std::chrono::duration<double>(
    std::chrono::steady_clock::now() - t
  ).count();
}
}  // anonymous namespace

Evaluation::Evaluation(
    const JobRunner* runner,
    const Registry* registry,
    CacheManager* cache,
    CancellationToken* token,
    EvaluationOptions options)
  : runner_(runner),
    registry_(registry),
    cache_(cache),
    token_(token),
    options_(std::move(options)) {
  CHECK(runner_);
  CHECK(registry_);
  CHECK(token_);
  if (options_.ninstances == 0) {
    throw PkgSweepException("Need at least one worker instance");
  }
}

ResultTable Evaluation::run(
    const std::vector<Configuration>& configs,
    const std::vector<Package>& packages) {

  if (configs.empty()) {
    throw PkgSweepException("No configurations to evaluate");
  }
  checkConfigurations(configs);
  for (const auto& config : configs) {
    runner_->checkConfiguration(config);
  }

  auto resolved = resolvePackages(*registry_, configs, packages);

  // Naming packages explicitly is how one evaluates a blacklisted one.
  std::set<std::string> blacklist;
  if (!resolved.explicitList) {
    blacklist = options_.blacklist;
    blacklist.insert(skippedPackages().begin(), skippedPackages().end());
  }

  if (options_.validate && cache_) {
    LOG(INFO) << "Validating the shared caches";
    cache_->validate(*registry_, configs.front());
  }

  auto plan = planJobs(configs, resolved.packages, blacklist);
  const size_t num_workers = std::min(plan.jobs.size(), options_.ninstances);
  LOG(INFO) << "Evaluating " << resolved.packages.size() << " packages under "
    << configs.size() << " configurations: " << plan.jobs.size() << " jobs "
    << "on " << num_workers << " workers, " << plan.skips.size()
    << " blacklisted";

  {
    auto state = state_.wlock();
    state->queue = std::move(plan.jobs);
    state->totalJobs = state->queue.size();
    state->results = ResultTable();
    state->running.assign(num_workers, folly::none);
    state->firstError = nullptr;
  }
  startTime_ = std::chrono::steady_clock::now();

  std::unique_ptr<CancellationListener> listener;
  if (options_.handleSignals) {
    listener = std::make_unique<CancellationListener>(
      token_,
      [this]() { return describeRunning(); },
      options_.listenToKeys
    );
  }
  std::unique_ptr<ProgressPrinter> printer;
  if (options_.progress) {
    printer = std::make_unique<ProgressPrinter>(
      [this]() { return snapshot(); },
      token_,
      ::isatty(STDERR_FILENO)
    );
    printer->start();
  }

  std::vector<std::thread> workers;
  for (size_t i = 0; i < num_workers; ++i) {
    workers.emplace_back([this, i, &configs]() {
      try {
        workerLoop(i, configs);
      } catch (const EvaluationCancelled&) {
        VLOG(1) << "Worker " << i << " cancelled";
      } catch (const std::exception& ex) {
        LOG(ERROR) << "Caught an error in worker " << i << ", stopping: "
          << ex.what();
        {
          auto state = state_.wlock();
          if (!state->firstError) {
            state->firstError = std::current_exception();
          }
          state->running[i] = folly::none;
        }
        token_->cancel();
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }
  if (printer) {
    printer->stop();
  }
  listener.reset();

  auto state = state_.wlock();
  if (state->firstError) {
    std::rethrow_exception(state->firstError);
  }
  if (token_->isCancelled()) {
    LOG(WARNING) << "Evaluation was cancelled with " << state->queue.size()
      << " jobs left in the queue";
  }

  ResultTable results = std::move(state->results);
  if (auto removed = results.deduplicate()) {
    LOG(INFO) << "Removed " << removed << " duplicate evaluations that "
      << "resulted from retrying tests.";
  }
  results.append(resolved.skips);
  results.append(plan.skips);
  return results;
}

void Evaluation::workerLoop(
    size_t worker,
    const std::vector<Configuration>& configs) {
  while (!token_->isCancelled()) {
    folly::Optional<Job> job;
    {
      auto state = state_.wlock();
      if (!state->queue.empty()) {
        job.emplace(std::move(state->queue.back()));
        state->queue.pop_back();
        state->running[worker] = RunningJob{
          job->config.name,
          job->package.name,
          std::chrono::steady_clock::now(),
          std::chrono::duration<double>(
            job->config.effectiveTimeLimit()
          ).count(),
        };
      }
    }
    if (!job.hasValue()) {
      return;
    }
    auto outcome = attempt(worker, *job);
    state_.wlock()->running[worker] = folly::none;
    // An interrupted job is recorded as it was stopped, usually `kill` with
    // no reason, but is not retried.
    if (token_->isCancelled()) {
      state_.wlock()->results.append(
        ResultRow(job->config.name, job->package.name, std::move(outcome))
      );
      return;
    }
    recordAndRetry(*job, std::move(outcome), configs);
  }
}

Outcome Evaluation::attempt(size_t worker, const Job& job) const {
  Configuration::Overrides o;
  o.cpus = std::vector<int>{static_cast<int>(worker)};
  if (job.config.tracing == TracingMode::EnabledOnRetry) {
    o.tracing = TracingMode::Disabled;
  }
  auto main_config = job.config.with(o);
  auto outcome =
    runner_->evaluate(main_config, job.package, job.useSharedCache);

  if (options_.retry && !token_->isCancelled() &&
      shouldRetraceCrash(outcome, job.config.tracing)) {
    LOG(INFO) << job.package.name << " crashed under " << job.config.name
      << ", retrying with tracing";
    Configuration::Overrides traced_o;
    traced_o.tracing = TracingMode::Enabled;
    auto traced = runner_->evaluate(
      main_config.with(traced_o), job.package, job.useSharedCache
    );
    if (keepTracedOutcome(outcome, traced)) {
      return traced;
    }
    LOG(INFO) << "The traced evaluation of " << job.package.name << " under "
      << job.config.name << " did not reproduce the crash";
  }
  return outcome;
}

void Evaluation::recordAndRetry(
    const Job& job,
    Outcome outcome,
    const std::vector<Configuration>& configs) {
  auto state = state_.wlock();
  state->results.append(
    ResultRow(job.config.name, job.package.name, std::move(outcome))
  );
  if (!options_.retry) {
    return;
  }
  auto retry_names = lateRetryConfigurations(
    state->results.rowsForPackage(job.package.name), configs.size()
  );
  for (const auto& name : retry_names) {
    auto it = std::find_if(
      configs.begin(), configs.end(),
      [&name](const Configuration& c) { return c.name == name; }
    );
    CHECK(it != configs.end()) << "Unknown configuration " << name;
    LOG(INFO) << "Retrying " << job.package.name << " under " << name
      << " without the shared caches";
    state->queue.emplace_back(
      jobConfiguration(*it, job.package), job.package, false
    );
    ++state->totalJobs;
  }
}

ProgressSnapshot Evaluation::snapshot() const {
  ProgressSnapshot s;
  s.elapsedSec = secondsSince(startTime_);
  {
    auto state = state_.rlock();
    s.totalJobs = state->totalJobs;
    s.completed = state->results.size();
    s.ok = state->results.count(Status::Ok);
    s.fail = state->results.count(Status::Fail);
    s.crash = state->results.count(Status::Crash);
    s.kill = state->results.count(Status::Kill);
    for (const auto& r : state->running) {
      if (r.hasValue()) {
        s.running.push_back(
          RunningJobTiming{secondsSince(r->startTime), r->timeLimitSec}
        );
      }
    }
  }
  return s;
}

std::vector<std::string> Evaluation::describeRunning() const {
  std::vector<std::string> names;
  {
    auto state = state_.rlock();
    for (const auto& r : state->running) {
      if (r.hasValue()) {
        names.push_back(r->packageName + " (" + r->configName + ")");
      }
    }
  }
  return names;
}

}}  // namespace facebook::pkgsweep
