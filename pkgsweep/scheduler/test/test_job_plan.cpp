/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <folly/dynamic.h>
#include <map>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/registry/Registry.h"
#include "pkgsweep/scheduler/JobPlan.h"
#include "pkgsweep/scheduler/PackageResolution.h"

using namespace facebook::pkgsweep;

namespace {

Configuration config(const std::string& name, const std::string& registry) {
  return Configuration(folly::dynamic::object
    ("name", name)
    ("registry", registry)
    ("tracing", "enabled_on_retry"));
}

Package pinned(const std::string& name, const std::string& version) {
  Package p(name);
  p.version = version;
  return p;
}

// Each registry index name maps to the packages it can install.
struct FakeRegistry : public Registry {
  std::vector<Package> compatiblePackages(const Configuration& c)
      const override {
    ++queries[c.registry];
    return packages.at(c.registry);
  }
  folly::Optional<Sha1> lookupSlug(
      const Configuration&,
      folly::StringPiece,
      folly::StringPiece) const override {
    return folly::none;
  }

  std::map<std::string, std::vector<Package>> packages;
  mutable std::map<std::string, int> queries;
};

}  // anonymous namespace

TEST(TestPackageResolution, IntersectsRegistries) {
  FakeRegistry r;
  r.packages["old"] =
    {pinned("A", "1.0"), pinned("B", "1.0"), pinned("C", "2.0")};
  r.packages["new"] =
    {pinned("C", "2.0"), pinned("A", "1.0"), pinned("B", "1.1")};
  auto res = resolvePackages(
    r, {config("x", "old"), config("y", "new"), config("z", "old")}, {}
  );
  EXPECT_FALSE(res.explicitList);
  EXPECT_TRUE(res.skips.empty());
  // B is compatible with both, but not at the same version.
  EXPECT_EQ(
    (std::vector<Package>{pinned("A", "1.0"), pinned("C", "2.0")}),
    res.packages
  );
  EXPECT_EQ(1, r.queries["old"]);
  EXPECT_EQ(1, r.queries["new"]);
}

TEST(TestPackageResolution, ExplicitPackages) {
  FakeRegistry r;
  r.packages["reg"] = {pinned("A", "1.0"), pinned("B", "3.0")};
  auto res = resolvePackages(
    r,
    {config("x", "reg"), config("y", "reg")},
    {Package("B"), pinned("A", "0.9"), Package("Unknown")}
  );
  EXPECT_TRUE(res.explicitList);
  EXPECT_EQ(
    (std::vector<Package>{pinned("B", "3.0"), pinned("A", "0.9")}),
    res.packages
  );
  ASSERT_EQ(2U, res.skips.size());
  for (const auto& row : res.skips) {
    EXPECT_EQ("Unknown", row.package);
    EXPECT_EQ(Status::Skip, row.status);
    EXPECT_EQ(Reason::Uninstallable, *row.reason);
  }
  EXPECT_EQ("x", res.skips[0].configuration);
  EXPECT_EQ("y", res.skips[1].configuration);
}

TEST(TestJobPlan, CrossProduct) {
  std::vector<Configuration> configs{config("x", ""), config("y", "")};
  auto plan = planJobs(
    configs,
    {Package("A"), Package("B"), Package("LibFoo_jll"), Package("CPLEX"),
     Package("CUDA")},
    {"CPLEX"}
  );
  // The _jll package vanishes, CPLEX becomes skip rows.
  EXPECT_EQ(6U, plan.jobs.size());
  ASSERT_EQ(2U, plan.skips.size());
  for (const auto& row : plan.skips) {
    EXPECT_EQ("CPLEX", row.package);
    EXPECT_EQ(Reason::Blacklisted, *row.reason);
  }

  std::map<std::pair<std::string, std::string>, int> seen;
  for (const auto& job : plan.jobs) {
    ++seen[std::make_pair(job.config.name, job.package.name)];
    EXPECT_TRUE(job.useSharedCache);
    EXPECT_EQ(
      job.package.name == "CUDA"
        ? TracingMode::Disabled : TracingMode::EnabledOnRetry,
      job.config.tracing
    );
  }
  EXPECT_EQ(6U, seen.size());
}

TEST(TestJobPlan, JobConfiguration) {
  auto c = config("x", "");
  EXPECT_EQ(
    TracingMode::EnabledOnRetry, jobConfiguration(c, Package("A")).tracing
  );
  EXPECT_EQ(
    TracingMode::Disabled, jobConfiguration(c, Package("AMDGPU")).tracing
  );
}
