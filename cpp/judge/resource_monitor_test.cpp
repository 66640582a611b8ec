#include "judge/resource_monitor.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

std::string Helper(const std::string& name) {
  return util::File::JoinPath(TEST_PROGRAMS_DIR, name);
}

// Starts a helper program as the leader of a new session.
pid_t StartSession(const std::string& program, const std::string& arg,
                   const char* extra = nullptr) {
  std::string path = Helper(program);
  pid_t pid = fork();
  if (pid == 0) {
    setsid();
    execl(path.c_str(), path.c_str(), arg.c_str(), extra,  // NOLINT
          nullptr);
    _exit(127);
  }
  return pid;
}

// Samples the session every few milliseconds until done says so.
bool SampleUntil(pid_t sid, judge::ProcessSample* sample,
                 const std::function<bool()>& done) {
  for (int i = 0; i < 1000; i++) {
    if (judge::SampleSession(sid, sample) && done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

// NOLINTNEXTLINE
TEST(SampleSession, NoSuchSession) {
  pid_t pid = fork();
  if (pid == 0) _exit(0);
  ASSERT_GT(pid, 0);
  waitpid(pid, nullptr, 0);
  judge::ProcessSample sample;
  EXPECT_FALSE(judge::SampleSession(pid, &sample));
}

// NOLINTNEXTLINE
TEST(SampleSession, CountsCpuTime) {
  pid_t pid = StartSession("busywait_arg1", "0.3");
  ASSERT_GT(pid, 0);
  judge::ProcessSample sample;
  EXPECT_TRUE(SampleUntil(pid, &sample, [&sample]() {
    return sample.time_usage_ns >= 250 * 1000 * 1000LL;
  }));
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(SampleSession, CountsMemory) {
  pid_t pid = StartSession("malloc_arg1", "64");
  ASSERT_GT(pid, 0);
  judge::ProcessSample sample;
  EXPECT_TRUE(SampleUntil(pid, &sample, [&sample]() {
    return sample.memory_usage_bytes >= 64 * 1024 * 1024LL;
  }));
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(SampleSession, CountsThreads) {
  pid_t pid = StartSession("threads_arg1", "8");
  ASSERT_GT(pid, 0);
  judge::ProcessSample sample;
  EXPECT_TRUE(
      SampleUntil(pid, &sample, [&sample]() { return sample.threads >= 9; }));
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(SampleSession, SkipsZombies) {
  pid_t pid = StartSession("return_arg1", "0");
  ASSERT_GT(pid, 0);
  judge::ProcessSample sample;
  // Not reaped yet, so the leader stays around as a zombie.
  bool gone = false;
  for (int i = 0; i < 1000 && !gone; i++) {
    gone = !judge::SampleSession(pid, &sample);
    if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_TRUE(gone);
  EXPECT_TRUE(sample.pids.empty());
  waitpid(pid, nullptr, 0);
}

// NOLINTNEXTLINE
TEST(SampleSession, FindsProcessesLeftBehind) {
  pid_t pid = StartSession("fork_sleep", "30", "own-group");
  ASSERT_GT(pid, 0);
  waitpid(pid, nullptr, 0);
  judge::ProcessSample sample;
  ASSERT_TRUE(judge::SampleSession(pid, &sample));
  ASSERT_EQ(sample.pids.size(), 1u);
  EXPECT_NE(sample.pids[0], pid);
  EXPECT_EQ(sample.threads, 1);
  kill(sample.pids[0], SIGKILL);
}

}  // namespace
