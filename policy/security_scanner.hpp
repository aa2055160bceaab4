#ifndef POLICY_SECURITY_SCANNER_HPP
#define POLICY_SECURITY_SCANNER_HPP

#include <map>
#include <regex>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "proto/codebox.pb.h"

namespace policy {

// Deny-list of regular expressions matched against the source code before
// execution. This is a heuristic: it rejects the obvious attempts at
// spawning processes, touching files, opening sockets and similar, but it is
// not a security boundary. The sandbox is.
class SecurityScanner {
 public:
  struct Rule {
    std::string pattern;
    std::string description;
    proto::Severity severity;
  };

  // Scanner with the built-in rules.
  static const SecurityScanner& Default();

  // Rules that apply to every language are checked before the language ones.
  SecurityScanner(std::vector<Rule> shared,
                  std::map<proto::Language, std::vector<Rule>> per_language);

  // One finding for each rule that matches, in rule order. The line of a
  // finding is the line of the first match.
  std::vector<proto::SecurityFinding> Scan(const std::string& code,
                                           proto::Language language) const;

  // The finding that rejects the code: the first HIGH one, or else the first
  // one of any severity.
  absl::optional<proto::SecurityFinding> Check(const std::string& code,
                                               proto::Language language) const;

 private:
  struct CompiledRule {
    Rule rule;
    std::regex regex;
  };
  static std::vector<CompiledRule> Compile(const std::vector<Rule>& rules);

  std::vector<CompiledRule> shared_;
  std::map<proto::Language, std::vector<CompiledRule>> per_language_;
};

// Error text for a rejected request.
std::string DescribeFinding(const proto::SecurityFinding& finding);

}  // namespace policy

#endif
