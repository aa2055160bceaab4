#include "language/profile.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "util/which.hpp"

namespace language {

namespace {

const constexpr char* kMemoryPlaceholder = "%MEMORY_MB%";
// Part of the memory ceiling given to the runtime heap; the rest is left to
// the runtime itself (code, stacks, metaspace).
const constexpr int64_t kHeapFraction = 2;
const constexpr int64_t kMinHeapMb = 16;

bool InPath(const std::string& binary) {
  return binary.find('/') == std::string::npos;
}

std::vector<std::unique_ptr<LanguageProfile>> MakeProfiles() {
  std::vector<std::unique_ptr<LanguageProfile>> profiles;
  profiles.push_back(absl::make_unique<CompiledProfile>(
      LanguageProfile::Options{
          proto::JAVA,
          "java",
          "Main.java",
          {"java", absl::StrCat("-Xmx", kMemoryPlaceholder, "m"),
           "-XX:+UseSerialGC", "-XX:-UsePerfData", "-XX:TieredStopAtLevel=1",
           "-Djava.io.tmpdir=.", "-cp", ".", "Main"},
          /*default_memory_mb=*/256,
          /*build_memory_mb=*/768,
          /*nice=*/5,
          /*max_procs=*/256,
          /*limit_address_space=*/false,
          /*rename_main_class=*/true,
          {"java.lang.OutOfMemoryError"}},
      std::vector<std::string>{"javac", "-J-Xmx384m", "-J-XX:+UseSerialGC",
                               "-J-XX:-UsePerfData", "-encoding", "UTF-8",
                               "Main.java"}));
  profiles.push_back(absl::make_unique<InterpretedProfile>(
      LanguageProfile::Options{proto::PYTHON,
                               "python",
                               "main.py",
                               {"python3", "-B", "main.py"},
                               /*default_memory_mb=*/128,
                               /*build_memory_mb=*/0,
                               /*nice=*/5,
                               /*max_procs=*/16,
                               /*limit_address_space=*/true,
                               /*rename_main_class=*/false,
                               {"MemoryError"}}));
  profiles.push_back(absl::make_unique<InterpretedProfile>(
      LanguageProfile::Options{
          proto::JAVASCRIPT,
          "javascript",
          "main.js",
          {"node", absl::StrCat("--max-old-space-size=", kMemoryPlaceholder),
           "main.js"},
          /*default_memory_mb=*/256,
          /*build_memory_mb=*/0,
          /*nice=*/5,
          /*max_procs=*/64,
          /*limit_address_space=*/false,
          /*rename_main_class=*/false,
          {"JavaScript heap out of memory", "Allocation failed"}}));
  profiles.push_back(absl::make_unique<CompiledProfile>(
      LanguageProfile::Options{proto::CPP,
                               "cpp",
                               "main.cpp",
                               {"./main"},
                               /*default_memory_mb=*/128,
                               /*build_memory_mb=*/768,
                               /*nice=*/5,
                               /*max_procs=*/32,
                               /*limit_address_space=*/true,
                               /*rename_main_class=*/false,
                               {"std::bad_alloc"}},
      std::vector<std::string>{"g++", "-std=c++17", "-O2", "-pipe", "-o",
                               "main", "main.cpp"}));
  return profiles;
}

const std::vector<std::unique_ptr<LanguageProfile>>& Profiles() {
  static const auto* profiles =
      new std::vector<std::unique_ptr<LanguageProfile>>(MakeProfiles());
  return *profiles;
}

}  // namespace

// static
const LanguageProfile& LanguageProfile::For(proto::Language language) {
  switch (language) {
    case proto::JAVA:
    case proto::PYTHON:
    case proto::JAVASCRIPT:
    case proto::CPP:
      for (const auto& profile : Profiles())
        if (profile->Language() == language) return *profile;
      break;
    default:
      break;
  }
  throw std::domain_error(
      absl::StrCat("Unsupported language ", static_cast<int>(language)));
}

// static
std::vector<const LanguageProfile*> LanguageProfile::All() {
  std::vector<const LanguageProfile*> all;
  for (const auto& profile : Profiles()) all.push_back(profile.get());
  std::sort(all.begin(), all.end(),
            [](const LanguageProfile* a, const LanguageProfile* b) {
              return a->Language() < b->Language();
            });
  return all;
}

LanguageProfile::LanguageProfile(Options options)
    : language_(options.language),
      name_(std::move(options.name)),
      source_file_(std::move(options.source_file)),
      run_(std::move(options.run)),
      default_memory_mb_(options.default_memory_mb),
      build_memory_mb_(options.build_memory_mb),
      nice_(options.nice),
      max_procs_(options.max_procs),
      limit_address_space_(options.limit_address_space),
      rename_main_class_(options.rename_main_class),
      memory_signatures_(std::move(options.memory_signatures)) {}

// static
Command LanguageProfile::Resolve(const std::vector<std::string>& command,
                                 int64_t memory_limit_mb) {
  CHECK(!command.empty());
  Command resolved;
  resolved.executable = command[0];
  if (InPath(command[0])) {
    resolved.executable = util::which(command[0]);
    if (resolved.executable.empty())
      throw std::runtime_error(
          absl::StrCat("Toolchain binary ", command[0], " not found"));
  }
  std::string heap_mb = std::to_string(
      std::max(kMinHeapMb, memory_limit_mb / kHeapFraction));
  for (size_t i = 1; i < command.size(); i++) {
    resolved.args.push_back(
        absl::StrReplaceAll(command[i], {{kMemoryPlaceholder, heap_mb}}));
  }
  return resolved;
}

Command LanguageProfile::RunCommand(int64_t memory_limit_mb) const {
  return Resolve(run_, memory_limit_mb);
}

std::string LanguageProfile::PrepareSource(const std::string& code) const {
  return rename_main_class_ ? RenameMainClass(code) : code;
}

std::vector<std::string> LanguageProfile::Toolchain() const {
  if (InPath(run_[0])) return {run_[0]};
  return {};
}

bool LanguageProfile::Available() const {
  for (const std::string& binary : Toolchain()) {
    if (util::which(binary, /*use_cache=*/false).empty()) {
      VLOG(1) << binary << " not found for " << name_;
      return false;
    }
  }
  return true;
}

bool LanguageProfile::IsOutOfMemory(const std::string& stderr_text) const {
  return std::any_of(memory_signatures_.begin(), memory_signatures_.end(),
                     [&stderr_text](const std::string& signature) {
                       return stderr_text.find(signature) != std::string::npos;
                     });
}

CompiledProfile::CompiledProfile(Options options,
                                 std::vector<std::string> build)
    : LanguageProfile(std::move(options)), build_(std::move(build)) {}

Command CompiledProfile::BuildCommand() const {
  return Resolve(build_, BuildMemoryMb());
}

std::vector<std::string> CompiledProfile::Toolchain() const {
  std::vector<std::string> toolchain = LanguageProfile::Toolchain();
  toolchain.insert(toolchain.begin(), build_[0]);
  return toolchain;
}

Command InterpretedProfile::BuildCommand() const {
  throw std::logic_error(Name() + " is not compiled");
}

std::string RenameMainClass(const std::string& code) {
  static const std::regex main_class(R"(\bclass\s+Main\b)");
  static const std::regex any_class(R"(\bclass\s+\w+)");
  if (std::regex_search(code, main_class)) return code;
  return std::regex_replace(code, any_class, "class Main",
                            std::regex_constants::format_first_only);
}

}  // namespace language
