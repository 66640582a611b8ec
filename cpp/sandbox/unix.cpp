#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <capnp/message.h>
#include <capnp/serialize-async.h>
#include <kj/debug.h>
#include "capnp/control.capnp.h"

namespace sandbox {

namespace {

enum ChildStage {
  kSetsid,
  kSignals,
  kOpenStdin,
  kOpenStdout,
  kOpenStderr,
  kRedirect,
  kChdir,
  kRlimit,
  kExec,
  kNumStages
};

const char* StageName(int stage) {
  static const constexpr char* names[] = {
      "setsid",      "sigprocmask", "open stdin", "open stdout", "open stderr",
      "redirection", "chdir",       "setrlimit",  "exec"};
  static_assert(sizeof(names) / sizeof(*names) == kNumStages,
                "Missing stage name");
  if (stage < 0 || stage >= kNumStages) return "unknown";
  return names[stage];  // NOLINT
}

// Sent by the child on the error pipe when it cannot exec the program.
struct ChildError {
  int stage;
  int error;
};

// Everything the child needs, prepared before forking: only async-signal-safe
// calls are allowed after fork.
struct ChildSetup {
  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;
  std::string root;
  std::string executable;
  std::vector<std::vector<char>> args;
  std::vector<char*> argv;
  int error_fd = -1;
};

[[noreturn]] void Die(int fd, ChildStage stage) {
  ChildError error{stage, errno};
  while (write(fd, &error, sizeof(error)) == -1 && errno == EINTR) {
  }
  _exit(127);
}

void Redirect(int from, int to, int error_fd) {
  if (from == to) {
    // dup2 would be a no-op and leave close-on-exec set.
    if (fcntl(from, F_SETFD, 0) == -1) Die(error_fd, kRedirect);
    return;
  }
  if (dup2(from, to) == -1) Die(error_fd, kRedirect);
}

[[noreturn]] void Child(const ChildSetup& setup) {
  int fd = setup.error_fd;
  // New session, so that the whole process group can be killed at once and
  // Ctrl-Cs in the terminal do not reach the program.
  if (setsid() == -1) Die(fd, kSetsid);

  sigset_t mask;
  sigemptyset(&mask);
  if (sigprocmask(SIG_SETMASK, &mask, nullptr) == -1) Die(fd, kSignals);
  struct sigaction action {};
  action.sa_handler = SIG_DFL;  // NOLINT
  if (sigaction(SIGPIPE, &action, nullptr) == -1) Die(fd, kSignals);

  // Each open blocks until the judge opens the other end.
  int stdin_fd = open(setup.stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) Die(fd, kOpenStdin);
  int stdout_fd = open(setup.stdout_path.c_str(), O_WRONLY | O_CLOEXEC);
  if (stdout_fd == -1) Die(fd, kOpenStdout);
  int stderr_fd = open(setup.stderr_path.c_str(), O_WRONLY | O_CLOEXEC);
  if (stderr_fd == -1) Die(fd, kOpenStderr);

  Redirect(stdin_fd, STDIN_FILENO, fd);
  Redirect(stdout_fd, STDOUT_FILENO, fd);
  Redirect(stderr_fd, STDERR_FILENO, fd);

  if (chdir(setup.root.c_str()) == -1) Die(fd, kChdir);

  struct rlimit rlim {};
  if (setrlimit(RLIMIT_CORE, &rlim) == -1) Die(fd, kRlimit);

  execv(setup.executable.c_str(), setup.argv.data());
  Die(fd, kExec);
}

kj::Own<kj::AsyncIoStream> ConnectControl(kj::LowLevelAsyncIoProvider& io,
                                          const std::string& path) {
  struct sockaddr_un addr {};
  addr.sun_family = AF_UNIX;
  KJ_REQUIRE(path.size() < sizeof(addr.sun_path), "Socket path too long",
             path);
  strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);  // NOLINT
  int fd;
  KJ_SYSCALL(fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  kj::AutoCloseFd owned(fd);
  KJ_SYSCALL(connect(fd, reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
                     sizeof(addr)),
             path);
  return io.wrapSocketFd(owned.release(),
                         kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                             kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
}

kj::Promise<void> SendAttach(kj::AsyncOutputStream& out, pid_t pid) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<capnproto::ControlMessage>().initAttach().setPid(pid);
  auto promise = capnp::writeMessage(out, *message);
  return promise.attach(kj::mv(message));
}

kj::Promise<void> SendStarted(kj::AsyncOutputStream& out) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<capnproto::ControlMessage>().setStarted();
  auto promise = capnp::writeMessage(out, *message);
  return promise.attach(kj::mv(message));
}

kj::Promise<void> SendExit(kj::AsyncOutputStream& out,
                           const struct rusage& usage, int status) {
  auto to_ns = [](const struct timeval& tv) {
    return tv.tv_sec * 1000000000ULL + tv.tv_usec * 1000ULL;
  };
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  auto exit = message->initRoot<capnproto::ControlMessage>().initExit();
  exit.setTimeUsageNs(to_ns(usage.ru_utime) + to_ns(usage.ru_stime));
  exit.setStatus(status);
  auto promise = capnp::writeMessage(out, *message);
  return promise.attach(kj::mv(message));
}

std::string AbsolutePath(const std::string& path) {
  char* resolved = realpath(path.c_str(), nullptr);
  KJ_REQUIRE(resolved != nullptr, "realpath", path, strerror(errno));
  std::string result = resolved;
  free(resolved);  // NOLINT
  return result;
}

}  // namespace

// The program changes directory before exec, so every path handed to it must
// be absolute.
UnixSandbox::UnixSandbox(const std::string& base_dir)
    : dir_(base_dir),
      in_dir_(util::File::JoinPath(AbsolutePath(dir_.Path()), "in")),
      root_dir_(util::File::JoinPath(AbsolutePath(dir_.Path()), "root")) {
  util::File::MakeDirs(in_dir_);
  util::File::MakeDirs(root_dir_);
}

struct UnixExecutable::Run {
  kj::Own<kj::AsyncIoStream> control;
  int status = 0;
  struct rusage usage {};
};

UnixExecutable::UnixExecutable(kj::LowLevelAsyncIoProvider& io,
                               std::string path, std::vector<std::string> args,
                               kj::Duration poll_interval)
    : io_(io),
      path_(std::move(path)),
      args_(std::move(args)),
      poll_interval_(poll_interval) {}

UnixExecutable::~UnixExecutable() {
  if (child_pid_ <= 0) return;
  KJ_LOG(WARNING, "Killing a program that is still running", path_,
         child_pid_);
  kill(-child_pid_, SIGKILL);
  kill(child_pid_, SIGKILL);
  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
}

kj::Promise<int> UnixExecutable::Execute(Sandbox& sandbox,
                                         const ExecuteRequest& request) {
  KJ_REQUIRE(child_pid_ == -1, "The program is already running", path_);
  ChildSetup setup;
  setup.stdin_path = sandbox.HostPath(request.stdin_file);
  setup.stdout_path = sandbox.HostPath(request.stdout_file);
  setup.stderr_path = sandbox.HostPath(request.stderr_file);
  setup.root = sandbox.RootDir();
  setup.executable = path_;
  auto add_arg = [&setup](const std::string& s) {
    setup.args.emplace_back(s.begin(), s.end());
    setup.args.back().push_back('\0');
  };
  add_arg(path_);
  for (const auto& arg : args_) add_arg(arg);
  for (auto& arg : setup.args) setup.argv.push_back(arg.data());
  setup.argv.push_back(nullptr);

  auto run = kj::heap<Run>();
  run->control = ConnectControl(io_, sandbox.HostPath(request.cgroup_file));

  int error_pipe[2];
  KJ_SYSCALL(pipe2(error_pipe, O_CLOEXEC));  // NOLINT
  kj::AutoCloseFd error_read(error_pipe[0]);
  kj::AutoCloseFd error_write(error_pipe[1]);
  setup.error_fd = error_write.get();

  pid_t pid;
  KJ_SYSCALL(pid = fork());
  if (pid == 0) Child(setup);
  child_pid_ = pid;
  error_write = nullptr;
  KJ_LOG(INFO, "Program started", path_, pid);

  auto errors = io_.wrapInputFd(
      error_read.release(), kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                                kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
  // The pipe is closed without data by a successful exec.
  auto started = errors->readAllBytes();
  started = started.attach(kj::mv(errors));
  Run* r = run.get();
  return SendAttach(*r->control, pid)
      .then([started = kj::mv(started)]() mutable { return kj::mv(started); })
      .then([this, r](kj::Array<kj::byte> data) -> kj::Promise<void> {
        if (data.size() >= sizeof(ChildError)) {
          ChildError error{};
          memcpy(&error, data.begin(), sizeof(error));
          int status = 0;
          KJ_SYSCALL(waitpid(child_pid_, &status, 0));
          child_pid_ = -1;
          KJ_FAIL_REQUIRE("Could not start the program", path_,
                          StageName(error.stage), strerror(error.error));
        }
        return SendStarted(*r->control).then([this, r]() { return Reap(r); });
      })
      .then([this, r]() {
        KJ_LOG(INFO, "Program exited", path_, r->status);
        return SendExit(*r->control, r->usage, r->status).then([r]() {
          return r->status;
        });
      })
      .attach(kj::mv(run));
}

kj::Promise<void> UnixExecutable::Reap(Run* run) {
  pid_t ret;
  KJ_SYSCALL(ret = wait4(child_pid_, &run->status, WNOHANG, &run->usage));
  if (ret == child_pid_) {
    child_pid_ = -1;
    return kj::READY_NOW;
  }
  return io_.getTimer().afterDelay(poll_interval_).then([this, run]() {
    return Reap(run);
  });
}

BinaryPackage::BinaryPackage(kj::LowLevelAsyncIoProvider& io, std::string path,
                             std::vector<std::string> args,
                             kj::Duration poll_interval)
    : io_(io),
      path_(std::move(path)),
      args_(std::move(args)),
      poll_interval_(poll_interval) {}

kj::Promise<kj::Own<Executable>> BinaryPackage::Install(Sandbox& sandbox) {
  std::string dest =
      util::File::JoinPath(sandbox.RootDir(), util::File::BaseName(path_));
  util::File::HardCopy(path_, dest, true);
  util::File::MakeExecutable(dest);
  kj::Own<Executable> executable =
      kj::heap<UnixExecutable>(io_, dest, args_, poll_interval_);
  return kj::mv(executable);
}

}  // namespace sandbox
