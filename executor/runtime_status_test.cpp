#include "executor/runtime_status.hpp"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

namespace {

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

using executor::RuntimeStatus;

const std::string test_tmpdir = "/tmp/codebox_testdir";

TEST(RuntimeStatusTest, UnavailableUntilProbed) {
  RuntimeStatus status(test_tmpdir, "", true);
  EXPECT_FALSE(status.Available());
  EXPECT_FALSE(status.Reason().empty());
}

TEST(RuntimeStatusTest, ProbeWorkingRuntime) {
  RuntimeStatus status(test_tmpdir, "unix", true);
  proto::HealthResponse health = status.Probe();
  EXPECT_TRUE(health.sandbox_runtime_available());
  EXPECT_THAT(health.status(), AnyOf(Eq("UP"), Eq("DEGRADED")));
  EXPECT_TRUE(status.Available());
  EXPECT_EQ(status.Reason(), "");
  if (health.status() == "UP") EXPECT_EQ(health.message(), "OK");
}

TEST(RuntimeStatusTest, UnisolatedFallbackIsDegraded) {
  std::unique_ptr<sandbox::Sandbox> best = sandbox::Sandbox::Create();
  ASSERT_TRUE(best);
  RuntimeStatus status(test_tmpdir, "", true);
  proto::HealthResponse health = status.Probe();
  EXPECT_TRUE(health.sandbox_runtime_available());
  if (best->Isolated()) {
    EXPECT_THAT(health.message(), Not(HasSubstr("does not isolate")));
  } else {
    EXPECT_EQ(health.status(), "DEGRADED");
    EXPECT_THAT(health.message(),
                HasSubstr("sandbox " + best->Name() + " does not isolate"));
  }
}

TEST(RuntimeStatusTest, NamedUnisolatedSandboxIsAccepted) {
  RuntimeStatus status(test_tmpdir, "unix", true);
  proto::HealthResponse health = status.Probe();
  EXPECT_THAT(health.message(), Not(HasSubstr("does not isolate")));
  EXPECT_TRUE(status.Available());
}

TEST(RuntimeStatusTest, ProbeUnknownSandbox) {
  RuntimeStatus status(test_tmpdir, "nonexistent", true);
  proto::HealthResponse health = status.Probe();
  EXPECT_EQ(health.status(), "DEGRADED");
  EXPECT_FALSE(health.sandbox_runtime_available());
  EXPECT_THAT(health.message(), HasSubstr("sandbox nonexistent"));
  EXPECT_FALSE(status.Available());
}

TEST(RuntimeStatusTest, ProbeUnwritableScratch) {
  RuntimeStatus status("/proc/codebox", "", true);
  proto::HealthResponse health = status.Probe();
  EXPECT_EQ(health.status(), "DEGRADED");
  EXPECT_FALSE(health.sandbox_runtime_available());
  EXPECT_THAT(health.message(), HasSubstr("scratch root not writable"));
  EXPECT_FALSE(status.Available());
}

TEST(RuntimeStatusTest, Disabled) {
  RuntimeStatus status(test_tmpdir, "", false);
  proto::HealthResponse health = status.Probe();
  EXPECT_EQ(health.status(), "DISABLED");
  EXPECT_THAT(health.message(), StartsWith("execution disabled"));
  EXPECT_FALSE(status.ExecutionEnabled());
}

TEST(RuntimeStatusTest, MarkUnavailableUntilNextProbe) {
  RuntimeStatus status(test_tmpdir, "unix", true);
  status.Probe();
  ASSERT_TRUE(status.Available());
  status.MarkUnavailable("scratch root vanished");
  EXPECT_FALSE(status.Available());
  EXPECT_EQ(status.Reason(), "scratch root vanished");
  status.Probe();
  EXPECT_TRUE(status.Available());
}

}  // namespace
