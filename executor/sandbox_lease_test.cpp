#include "executor/sandbox_lease.hpp"

#include <chrono>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using executor::SandboxLease;
using executor::SlotPool;
using std::chrono::milliseconds;

const std::string test_tmpdir = "/tmp/codebox_testdir";

TEST(SandboxLeaseTest, OwnsScratchAndSlot) {
  SlotPool pool(1);
  std::string scratch;
  {
    SandboxLease lease(&pool, milliseconds(0), test_tmpdir, "unix");
    scratch = lease.ScratchDir();
    ASSERT_NE(lease.Sandbox(), nullptr);
    EXPECT_EQ(lease.Sandbox()->Name(), "unix");
    EXPECT_TRUE(util::File::IsDirectory(scratch));
    EXPECT_EQ(pool.InUse(), 1u);
    util::File::Write(util::File::JoinPath(scratch, "left_behind"), "x");
  }
  EXPECT_FALSE(util::File::IsDirectory(scratch));
  EXPECT_EQ(pool.InUse(), 0u);
}

TEST(SandboxLeaseTest, LeasesAreIndependent) {
  SlotPool pool(2);
  SandboxLease first(&pool, milliseconds(0), test_tmpdir, "");
  SandboxLease second(&pool, milliseconds(0), test_tmpdir, "");
  EXPECT_NE(first.ScratchDir(), second.ScratchDir());
  EXPECT_NE(first.Sandbox(), second.Sandbox());
}

TEST(SandboxLeaseTest, NoSlot) {
  SlotPool pool(1);
  SandboxLease held(&pool, milliseconds(0), test_tmpdir, "");
  EXPECT_THROW(  // NOLINT
      { SandboxLease lease(&pool, milliseconds(10), test_tmpdir, ""); },
      executor::no_slot_available);
  EXPECT_EQ(pool.InUse(), 1u);
}

TEST(SandboxLeaseTest, UnknownSandboxReleasesSlot) {
  SlotPool pool(1);
  EXPECT_THROW(  // NOLINT
      {
        SandboxLease lease(&pool, milliseconds(0), test_tmpdir,
                           "nonexistent");
      },
      executor::sandbox_unavailable);
  EXPECT_EQ(pool.InUse(), 0u);
}

TEST(SandboxLeaseTest, UnusableScratchRoot) {
  SlotPool pool(1);
  EXPECT_THROW(  // NOLINT
      { SandboxLease lease(&pool, milliseconds(0), "/proc/codebox", ""); },
      executor::sandbox_unavailable);
  EXPECT_EQ(pool.InUse(), 0u);
}

}  // namespace
