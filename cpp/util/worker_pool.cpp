#include "util/worker_pool.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace util {

WorkerPool::WorkerPool(kj::LowLevelAsyncIoProvider& io, size_t num_workers)
    : io_(io) {
  KJ_REQUIRE(num_workers > 0, "A worker pool needs at least one thread");
  for (size_t i = 0; i < num_workers; i++) {
    workers_.emplace_back([this]() { Work(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& worker : workers_) worker.join();
}

kj::Promise<void> WorkerPool::Submit(kj::Function<void()> task) {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  kj::AutoCloseFd write_end(fds[1]);
  auto read_end = io_.wrapInputFd(
      fds[0], kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                  kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
  {
    std::lock_guard<std::mutex> lck(mutex_);
    queue_.push(Job{kj::mv(task), kj::mv(write_end)});
  }
  cv_.notify_one();
  auto promise = read_end->readAllBytes();
  return promise.attach(kj::mv(read_end))
      .then([](kj::Array<kj::byte> unused) {});
}

void WorkerPool::Work() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lck(mutex_);
      cv_.wait(lck, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      job = kj::mv(queue_.front());
      queue_.pop();
    }
    job.task();
  }
}

}  // namespace util
