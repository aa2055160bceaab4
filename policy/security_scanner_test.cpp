#include "policy/security_scanner.hpp"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using policy::SecurityScanner;

absl::optional<proto::SecurityFinding> Check(const std::string& code,
                                             proto::Language language) {
  return SecurityScanner::Default().Check(code, language);
}

TEST(SecurityScanner, JavaHelloWorldIsClean) {
  EXPECT_FALSE(Check(R"(public class Main {
  public static void main(String[] args) {
    System.out.println("Hello World");
  }
})",
                     proto::JAVA));
}

TEST(SecurityScanner, JavaProcessSpawn) {
  auto finding = Check(R"(public class Main {
  public static void main(String[] args) throws Exception {
    Runtime.getRuntime().exec("ls");
  }
})",
                       proto::JAVA);
  ASSERT_TRUE(finding);
  EXPECT_EQ(finding->severity(), proto::HIGH);
  EXPECT_EQ(finding->description(), "process spawning");
  EXPECT_EQ(finding->line(), 3);
  EXPECT_THAT(policy::DescribeFinding(*finding),
              HasSubstr("process spawning"));
}

TEST(SecurityScanner, JavaReflectionIsMedium) {
  auto finding =
      Check("Class<?> c = Class.forName(\"java.lang.String\");", proto::JAVA);
  ASSERT_TRUE(finding);
  EXPECT_EQ(finding->severity(), proto::MEDIUM);
}

TEST(SecurityScanner, HighFindingWins) {
  // The reflection rule matches first in the code, but process spawning is
  // HIGH.
  std::string code =
      "Class.forName(\"x\");\nnew ProcessBuilder(\"ls\").start();\n";
  std::vector<proto::SecurityFinding> findings =
      SecurityScanner::Default().Scan(code, proto::JAVA);
  ASSERT_EQ(findings.size(), 2u);
  auto finding = Check(code, proto::JAVA);
  ASSERT_TRUE(finding);
  EXPECT_EQ(finding->severity(), proto::HIGH);
  EXPECT_EQ(finding->line(), 2);
}

TEST(SecurityScanner, LowFindingStillRejects) {
  auto finding = Check("import sys\nsys.exit(0)\n", proto::PYTHON);
  ASSERT_TRUE(finding);
  EXPECT_EQ(finding->severity(), proto::LOW);
}

TEST(SecurityScanner, PythonRules) {
  EXPECT_TRUE(Check("import subprocess", proto::PYTHON));
  EXPECT_TRUE(Check("import socket", proto::PYTHON));
  EXPECT_TRUE(Check("f = open('x')", proto::PYTHON));
  EXPECT_TRUE(Check("__import__('os')", proto::PYTHON));
  EXPECT_FALSE(Check("import sys\nfor line in sys.stdin:\n    print(line)",
                     proto::PYTHON));
  EXPECT_FALSE(Check("while True: pass", proto::PYTHON));
}

TEST(SecurityScanner, JavaScriptRules) {
  EXPECT_TRUE(Check("const cp = require('child_process');",
                    proto::JAVASCRIPT));
  EXPECT_TRUE(Check("import fs from \"node:fs\";", proto::JAVASCRIPT));
  EXPECT_TRUE(Check("fetch('http://example.com')", proto::JAVASCRIPT));
  EXPECT_TRUE(Check("eval('1+1')", proto::JAVASCRIPT));
  EXPECT_FALSE(Check("function add(a, b) { return a + b; }\n"
                     "console.log(add(1, 2));",
                     proto::JAVASCRIPT));
}

TEST(SecurityScanner, CppRules) {
  EXPECT_TRUE(Check("#include <cstdlib>\nint main() { system(\"ls\"); }",
                    proto::CPP));
  EXPECT_TRUE(Check("#include <fstream>\nint main() {}", proto::CPP));
  EXPECT_TRUE(Check("#include <sys/socket.h>\nint main() {}", proto::CPP));
  EXPECT_FALSE(Check(R"(#include <iostream>
#include <vector>
int main() {
  std::vector<int> v{1, 2, 3};
  std::cout << v.size() << std::endl;
  return 0;
})",
                     proto::CPP));
}

TEST(SecurityScanner, SharedRulesApplyToEveryLanguage) {
  for (proto::Language language :
       {proto::JAVA, proto::PYTHON, proto::JAVASCRIPT, proto::CPP}) {
    auto finding = Check("// /etc/passwd", language);
    ASSERT_TRUE(finding) << proto::Language_Name(language);
    EXPECT_EQ(finding->description(), "access to system files");
  }
}

TEST(SecurityScanner, RulesAreLanguageAware) {
  // Dangerous in C++, harmless in Python.
  EXPECT_TRUE(Check("system(\"ls\")", proto::CPP));
  EXPECT_FALSE(Check("system = 3\nprint(system)", proto::PYTHON));
}

TEST(SecurityScanner, CustomRules) {
  SecurityScanner scanner(
      {}, {{proto::PYTHON, {{R"(\bforbidden\b)", "forbidden word",
                              proto::MEDIUM}}}});
  EXPECT_FALSE(scanner.Check("x = forbidden", proto::JAVA));
  auto finding = scanner.Check("\n\nx = forbidden", proto::PYTHON);
  ASSERT_TRUE(finding);
  EXPECT_EQ(finding->line(), 3);
  EXPECT_EQ(finding->pattern(), R"(\bforbidden\b)");
}

}  // namespace
