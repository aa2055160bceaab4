#include "policy/security_scanner.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace policy {

namespace {

using Rule = SecurityScanner::Rule;

std::vector<Rule> SharedRules() {
  return {
      {R"((/etc/(passwd|shadow|sudoers)|/proc/|/sys/|/dev/(tcp|udp)/))",
       "access to system files", proto::HIGH},
      {R"(\brm\s+-(rf|fr)\b)", "file removal command", proto::MEDIUM},
  };
}

std::vector<Rule> JavaRules() {
  return {
      {R"(\bRuntime\s*\.\s*getRuntime\b|\bProcessBuilder\b|\bProcessHandle\b)",
       "process spawning", proto::HIGH},
      {R"(\bjava\s*\.\s*net\b|\b(Server|Datagram)?Socket\b|\bURL(Connection)?\b|\bHttpClient\b)",
       "network access", proto::HIGH},
      {R"(\bjava\s*\.\s*nio\s*\.\s*file\b|\bFile(Input|Output)Stream\b|\bFile(Reader|Writer)\b|\bRandomAccessFile\b|\bnew\s+File\s*\(|\bFiles\s*\.)",
       "file system access", proto::HIGH},
      {R"(\bSystem\s*\.\s*exit\b|\bRuntime\s*\.\s*(halt|exit)\b)",
       "process termination", proto::HIGH},
      {R"(\bjava\s*\.\s*lang\s*\.\s*reflect\b|\bClass\s*\.\s*forName\b|\.\s*getDeclared(Method|Field|Constructor)s?\b|\bClassLoader\b|\bsetAccessible\b|\bsun\s*\.\s*misc\b|\bUnsafe\b)",
       "reflection or dynamic class loading", proto::MEDIUM},
      {R"(\bSystem\s*\.\s*(getenv|getProperty|setProperty|getProperties|setSecurityManager|load|loadLibrary)\b)",
       "system property or environment access", proto::MEDIUM},
  };
}

std::vector<Rule> PythonRules() {
  return {
      {R"(\bsubprocess\b|\bos\s*\.\s*(system|popen|exec\w*|spawn\w*|fork\w*|kill\w*)\b|\bpty\b|\bmultiprocessing\b)",
       "process spawning", proto::HIGH},
      {R"(\b(import|from)\s+(socket|urllib\w*|http|requests|ftplib|smtplib|telnetlib|asyncio)\b)",
       "network access", proto::HIGH},
      {R"(\bopen\s*\(|\b(import|from)\s+(os|shutil|pathlib|tempfile|glob|io)\b|\bos\s*\.)",
       "file system access", proto::HIGH},
      {R"(\b(import|from)\s+ctypes\b|\bctypes\s*\.)", "native code loading",
       proto::HIGH},
      {R"(\b__import__\b|\bimportlib\b|\beval\s*\(|\bexec\s*\(|\bcompile\s*\(|\b__(builtins|subclasses|globals|code)__\b)",
       "dynamic code execution", proto::MEDIUM},
      {R"(\bsys\s*\.\s*(exit|modules|settrace|setprofile)\b|\bos\s*\.\s*_exit\b)",
       "interpreter state manipulation", proto::LOW},
  };
}

std::vector<Rule> JavaScriptRules() {
  return {
      {R"(['"](node:)?(child_process|cluster|worker_threads)['"])",
       "process spawning", proto::HIGH},
      {R"(['"](node:)?(net|http|https|http2|dgram|dns|tls)['"]|\bfetch\s*\(|\bXMLHttpRequest\b|\bWebSocket\b)",
       "network access", proto::HIGH},
      {R"(['"](node:)?(fs|fs/promises)['"])", "file system access",
       proto::HIGH},
      {R"(\beval\s*\(|\bFunction\s*\(|['"](node:)?vm['"]|\bprocess\s*\.\s*(binding|dlopen)\b|\bimport\s*\()",
       "dynamic code execution", proto::MEDIUM},
      {R"(\bprocess\s*\.\s*(env|kill|abort|setuid|setgid|chdir)\b)",
       "process environment access", proto::MEDIUM},
      {R"(\bprocess\s*\.\s*(exit|reallyExit)\b)", "process termination",
       proto::LOW},
  };
}

std::vector<Rule> CppRules() {
  return {
      {R"(\b(system|popen|fork|vfork|execl|execlp|execle|execv|execvp|execvpe|posix_spawnp?|kill|ptrace)\s*\(|#\s*include\s*<(unistd\.h|spawn\.h|sys/wait\.h|sys/ptrace\.h|signal\.h|csignal)>)",
       "process spawning", proto::HIGH},
      {R"(\bsocket\s*\(|#\s*include\s*<(sys/socket\.h|netinet/\w+\.h|arpa/inet\.h|netdb\.h)>)",
       "network access", proto::HIGH},
      {R"(\b(fopen|freopen|open|openat|creat|unlink|rmdir|mkdir|chmod|chdir)\s*\(|#\s*include\s*<(fstream|filesystem|dirent\.h|fcntl\.h|sys/stat\.h)>)",
       "file system access", proto::HIGH},
      {R"(\bsyscall\s*\(|#\s*include\s*<sys/syscall\.h>)", "raw system calls",
       proto::HIGH},
      {R"(\b(dlopen|dlsym)\s*\(|#\s*include\s*<dlfcn\.h>|\basm\b|\b__asm__\b)",
       "dynamic loading or inline assembly", proto::MEDIUM},
      {R"(\b(getenv|setenv|putenv|unsetenv)\s*\(|\benviron\b)",
       "environment access", proto::MEDIUM},
      {R"(\b(exit|_exit|_Exit|quick_exit|abort)\s*\()", "process termination",
       proto::LOW},
  };
}

int LineOf(const std::string& code, size_t pos) {
  return 1 + std::count(code.begin(), code.begin() + pos, '\n');
}

}  // namespace

// static
const SecurityScanner& SecurityScanner::Default() {
  static const SecurityScanner* scanner = new SecurityScanner(
      SharedRules(), {{proto::JAVA, JavaRules()},
                      {proto::PYTHON, PythonRules()},
                      {proto::JAVASCRIPT, JavaScriptRules()},
                      {proto::CPP, CppRules()}});
  return *scanner;
}

SecurityScanner::SecurityScanner(
    std::vector<Rule> shared,
    std::map<proto::Language, std::vector<Rule>> per_language)
    : shared_(Compile(shared)) {
  for (const auto& language : per_language)
    per_language_[language.first] = Compile(language.second);
}

// static
std::vector<SecurityScanner::CompiledRule> SecurityScanner::Compile(
    const std::vector<Rule>& rules) {
  std::vector<CompiledRule> compiled;
  for (const Rule& rule : rules) {
    compiled.push_back(CompiledRule{
        rule, std::regex(rule.pattern, std::regex::ECMAScript |
                                           std::regex::optimize)});
  }
  return compiled;
}

std::vector<proto::SecurityFinding> SecurityScanner::Scan(
    const std::string& code, proto::Language language) const {
  std::vector<proto::SecurityFinding> findings;
  auto scan = [&code, &findings](const std::vector<CompiledRule>& rules) {
    for (const CompiledRule& rule : rules) {
      std::smatch match;
      if (!std::regex_search(code, match, rule.regex)) continue;
      proto::SecurityFinding finding;
      finding.set_pattern(rule.rule.pattern);
      finding.set_description(rule.rule.description);
      finding.set_severity(rule.rule.severity);
      finding.set_line(LineOf(code, match.position(0)));
      findings.push_back(std::move(finding));
    }
  };
  scan(shared_);
  auto it = per_language_.find(language);
  if (it != per_language_.end()) scan(it->second);
  return findings;
}

absl::optional<proto::SecurityFinding> SecurityScanner::Check(
    const std::string& code, proto::Language language) const {
  std::vector<proto::SecurityFinding> findings = Scan(code, language);
  if (findings.empty()) return absl::nullopt;
  for (const proto::SecurityFinding& finding : findings) {
    if (finding.severity() == proto::HIGH) return finding;
  }
  return findings.front();
}

std::string DescribeFinding(const proto::SecurityFinding& finding) {
  return absl::StrCat("Security violation: ", finding.description(),
                      " is not allowed (line ", finding.line(), ")");
}

}  // namespace policy
