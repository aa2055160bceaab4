#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP

#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox running the child in new user, mount, PID, network, IPC and UTS
// namespaces. The network namespace has no configured interface, every mount
// is read-only except the sandbox root, and ExecutionOptions::hidden_dir is
// replaced by an empty directory. Requires unprivileged user namespaces.
//
// The forked child stays outside of the PID namespace as a keeper: it starts
// the init process of the namespace, which starts the program, and exits the
// same way the program did. When the program exits, init exits too and the
// kernel kills every process left in the namespace.
class Namespaced : public Unix {
 public:
  std::string Name() const override { return Name_(); }
  bool Isolated() const override { return true; }
  static Sandbox* Create() { return new Namespaced(); }
  static int Score();
  static std::string Name_() { return "namespaced"; }

 protected:
  Namespaced() = default;
  bool OnSetup(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  // The keeper and the init process.
  int SupervisorDepth() const override { return 2; }

 private:
  struct MountPoint {
    std::vector<char> path;
    unsigned long flags;
    // Failing to remount pseudo filesystems is tolerated.
    bool required;
  };
  bool SetupMounts(char* error_msg, size_t buflen);
  // Runs in the init process. Returns only in the program process.
  bool RunInit(int status_fd, char* error_msg, size_t buflen);

  std::vector<MountPoint> mounts_;
  std::vector<char> root_;
  std::vector<char> hidden_dir_;
  // Directories between hidden_dir_ and root_ (included), outermost first.
  std::vector<std::vector<char>> hidden_path_;
  char uid_map_[64] = {};
  char gid_map_[64] = {};
};

}  // namespace sandbox
#endif
