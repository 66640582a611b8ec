#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>
#include <string>
#include <vector>

#include <kj/async-io.h>
#include <kj/time.h>
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace sandbox {

// Sandbox that gives the program a private working directory and nothing
// else: the program runs with the privileges of the caller.
class UnixSandbox : public Sandbox {
 public:
  // Creates a fresh directory inside base_dir, containing root/ and in/.
  explicit UnixSandbox(const std::string& base_dir);

  const std::string& InDir() const override { return in_dir_; }
  const std::string& RootDir() const override { return root_dir_; }

  // Do not remove the directories on destruction.
  void Keep() { dir_.Keep(); }

 private:
  util::TempDir dir_;
  std::string in_dir_;
  std::string root_dir_;
};

class UnixExecutable : public Executable {
 public:
  UnixExecutable(kj::LowLevelAsyncIoProvider& io, std::string path,
                 std::vector<std::string> args,
                 kj::Duration poll_interval = 10 * kj::MILLISECONDS);
  // Kills the program if it is still running.
  ~UnixExecutable();
  KJ_DISALLOW_COPY(UnixExecutable);

  kj::Promise<int> Execute(Sandbox& sandbox,
                           const ExecuteRequest& request) override;

 private:
  struct Run;

  kj::Promise<void> Reap(Run* run);

  kj::LowLevelAsyncIoProvider& io_;
  std::string path_;
  std::vector<std::string> args_;
  kj::Duration poll_interval_;
  // Positive while a child exists that was not reaped yet.
  pid_t child_pid_ = -1;
};

// Program already built for this machine.
class BinaryPackage : public Package {
 public:
  BinaryPackage(kj::LowLevelAsyncIoProvider& io, std::string path,
                std::vector<std::string> args = {},
                kj::Duration poll_interval = 10 * kj::MILLISECONDS);

  // Copies the program into the sandbox root.
  kj::Promise<kj::Own<Executable>> Install(Sandbox& sandbox) override;

 private:
  kj::LowLevelAsyncIoProvider& io_;
  std::string path_;
  std::vector<std::string> args_;
  kj::Duration poll_interval_;
};

}  // namespace sandbox

#endif
