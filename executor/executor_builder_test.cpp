#include "executor/executor_builder.hpp"

#include <thread>

#include "executor/slot_pool.hpp"
#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

using executor::ExecutorBuilder;
using executor::ExecutorOptions;

TEST(ExecutorBuilderTest, OptionsFollowFlags) {
  gflags::FlagSaver saver;
  FLAGS_max_parallel = 3;
  FLAGS_memory_limit_mb = 128;
  FLAGS_sandbox = "unix";
  ExecutorOptions options = ExecutorBuilder::OptionsFromFlags();
  EXPECT_EQ(options.max_parallel, 3);
  EXPECT_EQ(options.memory_limit_mb, 128);
  EXPECT_EQ(options.sandbox, "unix");
}

TEST(ExecutorBuilderTest, NegativeParallelismMeansAutodetect) {
  gflags::FlagSaver saver;
  FLAGS_max_parallel = -4;
  ExecutorOptions options = ExecutorBuilder::OptionsFromFlags();
  EXPECT_EQ(options.max_parallel, 0);
  executor::SlotPool pool(options.max_parallel);
  size_t expected = std::thread::hardware_concurrency();
  EXPECT_EQ(pool.Capacity(), expected == 0 ? 1u : expected);
}

}  // namespace
