#include "language/pipeline.hpp"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

using language::LanguageProfile;
using language::Outcome;
using language::Pipeline;
using language::StepLimits;

const std::string test_tmpdir = "/tmp/codebox_testdir";

StepLimits Limits() {
  StepLimits limits;
  limits.run_wall_millis = 5000;
  limits.build_wall_millis = 30000;
  limits.memory_limit_mb = 128;
  limits.max_output_kb = 64;
  return limits;
}

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sandbox_ = sandbox::Sandbox::Create("unix");
    ASSERT_TRUE(sandbox_);
    scratch_.reset(new util::TempDir(test_tmpdir));
  }

  bool Run(proto::Language language, const std::string& code,
           const std::string& stdin_text, Outcome* outcome) {
    Pipeline pipeline(LanguageProfile::For(language), Limits());
    std::string error_msg;
    bool ok = pipeline.Run(sandbox_.get(), scratch_->Path(), code, stdin_text,
                           outcome, &error_msg);
    EXPECT_EQ(error_msg, "");
    return ok;
  }

  std::unique_ptr<sandbox::Sandbox> sandbox_;
  std::unique_ptr<util::TempDir> scratch_;
};

TEST_F(PipelineTest, InterpretedRunsDirectly) {
  if (!LanguageProfile::For(proto::PYTHON).Available()) GTEST_SKIP();
  Outcome outcome;
  ASSERT_TRUE(Run(proto::PYTHON, "print(input()[::-1])\n", "olleh\n",
                  &outcome));
  EXPECT_FALSE(outcome.build);
  ASSERT_TRUE(outcome.run);
  EXPECT_EQ(outcome.run->info.status_code, 0);
  EXPECT_EQ(outcome.run->stdout_text, "hello\n");
  EXPECT_EQ(outcome.run->memory_limit_kb, 128 * 1024);
  EXPECT_FALSE(outcome.run->output_truncated);
  EXPECT_EQ(util::File::Read(util::File::JoinPath(scratch_->Path(),
                                                  "box/main.py"),
                             1024, nullptr),
            "print(input()[::-1])\n");
}

TEST_F(PipelineTest, StderrIsSeparate) {
  if (!LanguageProfile::For(proto::PYTHON).Available()) GTEST_SKIP();
  Outcome outcome;
  ASSERT_TRUE(Run(proto::PYTHON, "print('out')\nraise ValueError('bad')\n", "",
                  &outcome));
  ASSERT_TRUE(outcome.run);
  EXPECT_EQ(outcome.run->info.status_code, 1);
  EXPECT_EQ(outcome.run->stdout_text, "out\n");
  EXPECT_THAT(outcome.run->stderr_text, HasSubstr("ValueError: bad"));
}

TEST_F(PipelineTest, CompiledBuildsThenRuns) {
  if (!LanguageProfile::For(proto::CPP).Available()) GTEST_SKIP();
  Outcome outcome;
  ASSERT_TRUE(Run(proto::CPP,
                  "#include <cstdio>\nint main() { std::puts(\"built\"); }\n",
                  "", &outcome));
  ASSERT_TRUE(outcome.build);
  EXPECT_EQ(outcome.build->info.status_code, 0);
  EXPECT_FALSE(outcome.BuildFailed());
  ASSERT_TRUE(outcome.run);
  EXPECT_EQ(outcome.run->stdout_text, "built\n");
}

TEST_F(PipelineTest, FailedBuildSkipsRun) {
  if (!LanguageProfile::For(proto::CPP).Available()) GTEST_SKIP();
  Outcome outcome;
  ASSERT_TRUE(Run(proto::CPP, "int main() { return x; }\n", "", &outcome));
  EXPECT_TRUE(outcome.BuildFailed());
  EXPECT_FALSE(outcome.run);
  EXPECT_NE(outcome.build->info.status_code, 0);
  EXPECT_THAT(outcome.build->stderr_text, HasSubstr("not declared"));
}

TEST_F(PipelineTest, OutputIsCapped) {
  if (!LanguageProfile::For(proto::PYTHON).Available()) GTEST_SKIP();
  StepLimits limits = Limits();
  limits.max_output_kb = 1;
  Pipeline pipeline(LanguageProfile::For(proto::PYTHON), limits);
  Outcome outcome;
  std::string error_msg;
  ASSERT_TRUE(pipeline.Run(sandbox_.get(), scratch_->Path(),
                           "print('x' * 100000)\n", "", &outcome, &error_msg));
  ASSERT_TRUE(outcome.run);
  EXPECT_LE(outcome.run->stdout_text.size(), 1024u);
}

}  // namespace
