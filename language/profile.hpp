#ifndef LANGUAGE_PROFILE_HPP
#define LANGUAGE_PROFILE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "proto/codebox.pb.h"

namespace language {

// A command to run inside the sandbox, with the executable resolved to an
// absolute path.
struct Command {
  std::string executable;
  std::vector<std::string> args;
};

// Static description of how a language is built and run. Profiles are
// immutable and shared by every request.
class LanguageProfile {
 public:
  struct Options {
    proto::Language language;
    std::string name;
    std::string source_file;
    // The first element is looked up in PATH. "%MEMORY_MB%" in any argument
    // is replaced by the fraction of the ceiling given to the runtime heap.
    std::vector<std::string> run;
    int64_t default_memory_mb;
    int64_t build_memory_mb;
    int32_t nice;
    int32_t max_procs;
    bool limit_address_space;
    // The public class must be called Main.
    bool rename_main_class;
    std::vector<std::string> memory_signatures;
  };

  // Returns the profile of the language. Throws std::domain_error for
  // UNKNOWN_LANGUAGE and values outside the enum.
  static const LanguageProfile& For(proto::Language language);
  // Every supported profile, in enum order.
  static std::vector<const LanguageProfile*> All();

  proto::Language Language() const { return language_; }
  // Lower-case name, as reported in responses ("cpp", "java", ...).
  const std::string& Name() const { return name_; }
  const std::string& SourceFile() const { return source_file_; }
  virtual bool IsCompiled() const = 0;

  // Turns the submitted code into the contents of SourceFile().
  std::string PrepareSource(const std::string& code) const;

  // Command that builds the program in the working directory. Throws
  // std::logic_error for interpreted languages and std::runtime_error if the
  // toolchain cannot be found.
  virtual Command BuildCommand() const = 0;
  // Command that runs the program with the given memory ceiling. Throws
  // std::runtime_error if the toolchain cannot be found.
  Command RunCommand(int64_t memory_limit_mb) const;

  // True if every binary of the toolchain can be found in PATH.
  bool Available() const;

  int64_t DefaultMemoryMb() const { return default_memory_mb_; }
  // Memory ceiling of the build step.
  int64_t BuildMemoryMb() const { return build_memory_mb_; }
  int32_t Nice() const { return nice_; }
  int32_t MaxProcs() const { return max_procs_; }
  // False for runtimes that reserve large address ranges at startup.
  bool LimitAddressSpace() const { return limit_address_space_; }
  // Returns true if the error output says the program ran out of memory.
  bool IsOutOfMemory(const std::string& stderr_text) const;

  virtual ~LanguageProfile() = default;

 protected:
  explicit LanguageProfile(Options options);

  static Command Resolve(const std::vector<std::string>& command,
                         int64_t memory_limit_mb);
  virtual std::vector<std::string> Toolchain() const;

 private:
  proto::Language language_;
  std::string name_;
  std::string source_file_;
  std::vector<std::string> run_;
  int64_t default_memory_mb_;
  int64_t build_memory_mb_;
  int32_t nice_;
  int32_t max_procs_;
  bool limit_address_space_;
  bool rename_main_class_;
  std::vector<std::string> memory_signatures_;
};

// A language whose source is compiled in the sandbox before running.
class CompiledProfile : public LanguageProfile {
 public:
  CompiledProfile(Options options, std::vector<std::string> build);
  bool IsCompiled() const override { return true; }
  Command BuildCommand() const override;

 protected:
  std::vector<std::string> Toolchain() const override;

 private:
  std::vector<std::string> build_;
};

// A language whose source is run directly by an interpreter.
class InterpretedProfile : public LanguageProfile {
 public:
  explicit InterpretedProfile(Options options)
      : LanguageProfile(std::move(options)) {}
  bool IsCompiled() const override { return false; }
  Command BuildCommand() const override;
};

// Renames the first declared class to Main, unless a class named Main is
// already declared.
std::string RenameMainClass(const std::string& code);

}  // namespace language

#endif
