#include "sandbox/watchdog.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/cgroup.hpp"

namespace {

using ::testing::HasSubstr;
using std::chrono::milliseconds;

// A child in its own process group that sleeps until killed.
pid_t SpawnSleeper() {
  pid_t pid = fork();
  if (pid == 0) {
    setpgid(0, 0);
    for (;;) pause();
  }
  setpgid(pid, pid);
  return pid;
}

TEST(WatchdogTest, KillsAfterBudget) {
  pid_t pid = SpawnSleeper();
  ASSERT_GT(pid, 0);
  sandbox::Watchdog watchdog(pid, milliseconds(50));
  siginfo_t info{};
  ASSERT_EQ(waitid(P_PID, pid, &info, WEXITED | WNOWAIT), 0);
  watchdog.Disarm();
  EXPECT_TRUE(watchdog.Fired());
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  EXPECT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(WatchdogTest, DisarmedInTime) {
  pid_t pid = SpawnSleeper();
  ASSERT_GT(pid, 0);
  {
    sandbox::Watchdog watchdog(pid, milliseconds(10000));
    watchdog.Disarm();
    watchdog.Disarm();
    EXPECT_FALSE(watchdog.Fired());
  }
  kill(pid, SIGTERM);
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  EXPECT_EQ(WTERMSIG(status), SIGTERM);
}

TEST(WatchdogTest, ZeroBudgetNeverFires) {
  sandbox::Watchdog watchdog(getpid(), milliseconds(0));
  EXPECT_FALSE(watchdog.Fired());
}

TEST(CgroupTest, MissingRoot) {
  std::string error_msg;
  EXPECT_EQ(sandbox::Cgroup::Create("/nonexistent/cgroup", &error_msg),
            nullptr);
  EXPECT_THAT(error_msg, HasSubstr("/nonexistent/cgroup"));
}

}  // namespace
