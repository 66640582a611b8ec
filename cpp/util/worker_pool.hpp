#ifndef UTIL_WORKER_POOL_HPP
#define UTIL_WORKER_POOL_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/function.h>
#include <kj/io.h>

namespace util {

namespace detail {
template <typename T>
struct JobResult {
  std::mutex mutex;
  kj::Maybe<T> value;
  kj::Maybe<kj::Exception> failure;
};
}  // namespace detail

// Fixed set of threads running blocking jobs on behalf of an event loop.
// Completion is signalled to the loop by closing the write end of a pipe, so
// that the promises returned by Run resolve on the thread owning io.
class WorkerPool {
 public:
  WorkerPool(kj::LowLevelAsyncIoProvider& io, size_t num_workers);
  ~WorkerPool();
  KJ_DISALLOW_COPY(WorkerPool);

  size_t Size() const { return workers_.size(); }

  // Runs job on one of the threads. Exceptions thrown by job reject the
  // returned promise. Jobs still queued when the pool is destroyed are
  // dropped and their promises rejected.
  template <typename T>
  kj::Promise<T> Run(kj::Function<T()> job) {
    auto result = std::make_shared<detail::JobResult<T>>();
    kj::Promise<void> done = Submit(
        [job = kj::mv(job), result]() mutable {
          auto failure = kj::runCatchingExceptions([&job, &result]() {
            T value = job();
            std::lock_guard<std::mutex> lck(result->mutex);
            result->value = kj::mv(value);
          });
          std::lock_guard<std::mutex> lck(result->mutex);
          result->failure = kj::mv(failure);
        });
    return done.then([result]() -> T {
      std::lock_guard<std::mutex> lck(result->mutex);
      KJ_IF_MAYBE(exc, result->failure) {
        kj::throwFatalException(kj::mv(*exc));
      }
      KJ_IF_MAYBE(value, result->value) { return kj::mv(*value); }
      KJ_FAIL_REQUIRE("Worker pool stopped before running the job");
    });
  }

 private:
  struct Job {
    kj::Function<void()> task;
    // Closed once task is done, or when the job is dropped.
    kj::AutoCloseFd done;
  };

  kj::Promise<void> Submit(kj::Function<void()> task);
  void Work();

  kj::LowLevelAsyncIoProvider& io_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Job> queue_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

}  // namespace util

#endif
