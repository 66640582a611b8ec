#include "judge/run_context.hpp"

#include <signal.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <cstring>

#include <kj/debug.h>

namespace judge {

namespace {
size_t CheckedWorkers(const RunOptions& options) {
  KJ_REQUIRE(options.num_workers >= 3, "At least 3 workers are needed",
             options.num_workers);
  return options.num_workers;
}
}  // namespace

RunContext::RunContext(kj::LowLevelAsyncIoProvider& io, RunOptions options)
    : io_(io), options_(options), pool_(io, CheckedWorkers(options)) {
  struct sigaction action {};
  action.sa_handler = SIG_IGN;  // NOLINT
  KJ_SYSCALL(sigaction(SIGPIPE, &action, nullptr));
}

kj::Own<kj::ConnectionReceiver> RunContext::Listen(const std::string& path) {
  struct sockaddr_un addr {};
  addr.sun_family = AF_UNIX;
  KJ_REQUIRE(path.size() < sizeof(addr.sun_path), "Socket path too long",
             path);
  strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);  // NOLINT
  int fd;
  KJ_SYSCALL(fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                         0));
  kj::AutoCloseFd owned(fd);
  KJ_SYSCALL(bind(fd, reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
                  sizeof(addr)),
             path);
  KJ_SYSCALL(listen(fd, 1));
  return io_.wrapListenSocketFd(
      owned.release(), kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                           kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC |
                           kj::LowLevelAsyncIoProvider::ALREADY_NONBLOCK);
}

}  // namespace judge
