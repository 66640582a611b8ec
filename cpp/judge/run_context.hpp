#ifndef JUDGE_RUN_CONTEXT_HPP
#define JUDGE_RUN_CONTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <kj/async-io.h>
#include <kj/time.h>
#include "util/worker_pool.hpp"

namespace judge {

struct RunOptions {
  // Bytes of stderr kept in the verdict.
  size_t stderr_limit = 8192;
  // At least three: feeding stdin, reading stdout and opening stderr all
  // block at the same time.
  size_t num_workers = 4;
  kj::Duration poll_interval = 10 * kj::MILLISECONDS;
  // The program is killed after time_limit * wall_time_factor +
  // wall_time_extra of wall-clock time.
  int64_t wall_time_factor = 3;
  kj::Duration wall_time_extra = 1 * kj::SECONDS;
};

// Everything a judging run needs from its surroundings. Constructing one
// makes the process ignore SIGPIPE, since writes to a closed pipe must fail
// with EPIPE instead.
class RunContext {
 public:
  explicit RunContext(kj::LowLevelAsyncIoProvider& io,
                      RunOptions options = RunOptions());
  KJ_DISALLOW_COPY(RunContext);

  kj::LowLevelAsyncIoProvider& Io() { return io_; }
  kj::Timer& Timer() { return io_.getTimer(); }
  util::WorkerPool& Pool() { return pool_; }
  const RunOptions& Options() const { return options_; }

  // Binds a Unix domain socket at path and listens on it.
  kj::Own<kj::ConnectionReceiver> Listen(const std::string& path);

 private:
  kj::LowLevelAsyncIoProvider& io_;
  RunOptions options_;
  util::WorkerPool pool_;
};

}  // namespace judge

#endif
