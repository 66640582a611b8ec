#include "judge/resource_monitor.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include <capnp/message.h>
#include <capnp/serialize-async.h>
#include <kj/debug.h>
#include "capnp/control.capnp.h"
#include "util/misc.hpp"

namespace judge {

namespace {
// Fields of /proc/<pid>/stat, counted from the one following the command.
const constexpr size_t kStateField = 0;
const constexpr size_t kSessionField = 3;
const constexpr size_t kUtimeField = 11;
const constexpr size_t kThreadsField = 17;

bool ReadProcFile(const std::string& path, std::string* content) {
  kj::AutoCloseFd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));  // NOLINT
  if (fd.get() == -1) return false;
  char buf[4096];
  content->clear();
  ssize_t amount;
  while ((amount = read(fd, buf, sizeof(buf))) != 0) {  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) return false;
    content->append(buf, amount);
  }
  return true;
}

bool IsPid(const char* name) {
  if (*name == '\0') return false;
  for (; *name; name++) {
    if (!isdigit(static_cast<unsigned char>(*name))) return false;
  }
  return true;
}

// The command may contain spaces and parentheses, so fields are counted from
// the last closing parenthesis.
bool ParseStat(const std::string& stat, std::vector<std::string>* fields) {
  size_t end = stat.rfind(')');
  if (end == std::string::npos || end + 2 > stat.size()) return false;
  *fields = util::split(util::strip(stat.substr(end + 2)), ' ');
  return fields->size() > kThreadsField;
}

int64_t Field(const std::string& field) {
  return strtoll(field.c_str(), nullptr, 10);
}

int64_t PeakResidentBytes(const std::string& pid) {
  std::string status;
  if (!ReadProcFile("/proc/" + pid + "/status", &status)) return 0;
  size_t pos = status.find("VmHWM:");
  if (pos == std::string::npos) return 0;
  int64_t kb = 0;
  if (sscanf(status.c_str() + pos, "VmHWM: %" SCNd64, &kb) != 1) {  // NOLINT
    return 0;
  }
  return kb * 1024;
}

// Kills every process of the session led by sid, including those that left
// its process group. Returns false if none was alive.
bool KillSession(pid_t sid, ProcessSample* sample) {
  if (!SampleSession(sid, sample)) return false;
  kill(-sid, SIGKILL);
  for (pid_t pid : sample->pids) kill(pid, SIGKILL);
  return true;
}

struct MonitorState {
  ~MonitorState() {
    if (pid <= 0 || swept) return;
    ProcessSample sample;
    if (KillSession(pid, &sample)) {
      KJ_LOG(WARNING, "Killed the program while it was being watched", pid);
    }
  }

  kj::Own<kj::AsyncIoStream> control;
  pid_t pid = -1;
  kj::TimePoint start = kj::origin<kj::TimePoint>();
  // Set once the program replaced the image of the runner it was forked from.
  // Before that its memory is a copy of the runner's.
  bool started = false;
  int status = 0;
  ResourceUsage usage;
  bool killing = false;
  bool swept = false;
};

void Merge(ResourceUsage* usage, int64_t time_usage_ns,
           int64_t memory_usage_bytes) {
  usage->time_usage_ns = std::max(usage->time_usage_ns, time_usage_ns);
  usage->memory_usage_bytes =
      std::max(usage->memory_usage_bytes, memory_usage_bytes);
}

int64_t WallLimitNs(const RunOptions& options, const CaseLimits& limits) {
  const int64_t max = std::numeric_limits<int64_t>::max();
  int64_t extra = options.wall_time_extra / kj::NANOSECONDS;
  if (limits.time_limit_ns > (max - extra) / options.wall_time_factor) {
    return max;
  }
  return limits.time_limit_ns * options.wall_time_factor + extra;
}

const char* LimitReached(const ResourceUsage& usage,
                         const ProcessSample& sample, const CaseLimits& limits,
                         int64_t wall_ns, int64_t wall_limit_ns) {
  if (usage.memory_usage_bytes >= limits.memory_limit_bytes) return "memory";
  if (usage.time_usage_ns >= limits.time_limit_ns) return "time";
  if (sample.threads > limits.process_limit) return "processes";
  if (wall_ns >= wall_limit_ns) return "wall time";
  return nullptr;
}

// Takes one sample of the session and kills it if a limit was reached. Until
// the program started only the wall clock is checked.
void Sample(RunContext& ctx, MonitorState* state, const CaseLimits& limits) {
  ProcessSample sample;
  if (SampleSession(state->pid, &sample) && state->started) {
    Merge(&state->usage, sample.time_usage_ns, sample.memory_usage_bytes);
  }
  ProcessSample counted = state->started ? sample : ProcessSample();
  int64_t wall_ns = (ctx.Timer().now() - state->start) / kj::NANOSECONDS;
  int64_t wall_limit_ns = WallLimitNs(ctx.Options(), limits);
  const char* reason =
      LimitReached(state->usage, counted, limits, wall_ns, wall_limit_ns);
  if (reason == nullptr) return;
  if (!state->killing) {
    KJ_LOG(INFO, "Killing the program", state->pid, reason);
    state->killing = true;
  }
  if (wall_ns >= wall_limit_ns) {
    state->usage.time_usage_ns =
        std::max(state->usage.time_usage_ns, limits.time_limit_ns);
  }
  // The program leads its own process group.
  kill(-state->pid, SIGKILL);
  kill(state->pid, SIGKILL);
  for (pid_t pid : sample.pids) kill(pid, SIGKILL);
}

kj::Promise<void> SampleLoop(RunContext& ctx, MonitorState* state,
                             CaseLimits limits) {
  Sample(ctx, state, limits);
  return ctx.Timer()
      .afterDelay(ctx.Options().poll_interval)
      .then([&ctx, state, limits]() { return SampleLoop(ctx, state, limits); });
}

// Reads the started and exit reports.
kj::Promise<void> ReadReports(RunContext& ctx, MonitorState* state,
                              CaseLimits limits) {
  return capnp::tryReadMessage(*state->control)
      .then([&ctx, state, limits](
                kj::Maybe<kj::Own<capnp::MessageReader>> message)
                -> kj::Promise<void> {
        KJ_IF_MAYBE(reader, message) {
          auto root = (*reader)->getRoot<capnproto::ControlMessage>();
          if (root.isStarted() && !state->started) {
            state->started = true;
            Sample(ctx, state, limits);
            return ReadReports(ctx, state, limits);
          }
          KJ_REQUIRE(root.isExit(), "Unexpected control message", state->pid);
          auto exit = root.getExit();
          Merge(&state->usage, exit.getTimeUsageNs(), 0);
          state->status = exit.getStatus();
          return kj::READY_NOW;
        }
        KJ_FAIL_REQUIRE("Control connection closed without an exit report",
                        state->pid);
      });
}

kj::Promise<void> Watch(RunContext& ctx, MonitorState* state,
                        kj::ForkedPromise<int>& execute, CaseLimits limits) {
  return ReadReports(ctx, state, limits)
      .exclusiveJoin(SampleLoop(ctx, state, limits))
      .then([&execute]() { return execute.addBranch(); })
      .then([state](int status) {
        KJ_REQUIRE(status == state->status,
                   "The exit report does not match the wait status", status,
                   state->status);
      });
}

// Processes of the session may outlive the program and keep its pipes open.
// They are killed until none is left.
kj::Promise<void> Sweep(RunContext& ctx, MonitorState* state) {
  ProcessSample sample;
  if (!KillSession(state->pid, &sample)) {
    state->swept = true;
    return kj::READY_NOW;
  }
  if (state->started) {
    Merge(&state->usage, sample.time_usage_ns, sample.memory_usage_bytes);
  }
  if (!state->killing) {
    KJ_LOG(INFO, "Killing processes left behind by the program", state->pid,
           sample.pids.size());
    state->killing = true;
  }
  return ctx.Timer()
      .afterDelay(ctx.Options().poll_interval)
      .then([&ctx, state]() { return Sweep(ctx, state); });
}
}  // namespace

bool SampleSession(pid_t sid, ProcessSample* sample) {
  static const int64_t ticks = sysconf(_SC_CLK_TCK);
  DIR* dir = opendir("/proc");
  if (dir == nullptr) return false;
  *sample = ProcessSample();
  std::string stat;
  std::vector<std::string> fields;
  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {  // NOLINT
    if (!IsPid(entry->d_name)) continue;
    std::string pid = entry->d_name;
    // Processes may exit at any time.
    if (!ReadProcFile("/proc/" + pid + "/stat", &stat)) continue;
    if (!ParseStat(stat, &fields)) continue;
    if (Field(fields[kSessionField]) != sid) continue;
    // Zombies hold no memory and no open files.
    const std::string& state = fields[kStateField];
    if (state == "Z" || state == "X") continue;
    // utime, stime, cutime and cstime.
    int64_t clock_ticks = 0;
    for (size_t i = kUtimeField; i < kUtimeField + 4; i++) {
      clock_ticks += Field(fields[i]);
    }
    sample->time_usage_ns += clock_ticks * (1000000000 / ticks);
    sample->memory_usage_bytes += PeakResidentBytes(pid);
    sample->threads += Field(fields[kThreadsField]);
    sample->pids.push_back(static_cast<pid_t>(Field(pid)));
  }
  closedir(dir);
  return !sample->pids.empty();
}

kj::Promise<ResourceUsage> WaitResourceUsage(RunContext& ctx,
                                             kj::ConnectionReceiver& listener,
                                             kj::ForkedPromise<int>& execute,
                                             const CaseLimits& limits) {
  auto state = kj::heap<MonitorState>();
  MonitorState* ptr = state.get();
  // If execute fails before the program connected nobody ever will; if it
  // succeeds the connection is already queued.
  auto connection = listener.accept().exclusiveJoin(
      execute.addBranch().then(
          [](int) -> kj::Promise<kj::Own<kj::AsyncIoStream>> {
            return kj::NEVER_DONE;
          }));
  return connection
      .then([ptr](kj::Own<kj::AsyncIoStream> control) {
        ptr->control = kj::mv(control);
        return capnp::tryReadMessage(*ptr->control);
      })
      .then([&ctx, &execute, ptr, limits](
                kj::Maybe<kj::Own<capnp::MessageReader>> message) {
        KJ_IF_MAYBE(reader, message) {
          auto root = (*reader)->getRoot<capnproto::ControlMessage>();
          KJ_REQUIRE(root.isAttach(), "Expected the pid of the program");
          ptr->pid = root.getAttach().getPid();
          KJ_REQUIRE(ptr->pid > 0, "Invalid pid", ptr->pid);
        } else {
          KJ_FAIL_REQUIRE(
              "Control connection closed before the program started");
        }
        ptr->start = ctx.Timer().now();
        return Watch(ctx, ptr, execute, limits)
            .then([&ctx, ptr]() { return Sweep(ctx, ptr); },
                  [&ctx, ptr](kj::Exception&& exc) {
                    return Sweep(ctx, ptr).then([exc = kj::mv(exc)]() mutable {
                      kj::throwFatalException(kj::mv(exc));
                    });
                  });
      })
      .then([ptr]() { return ptr->usage; })
      .attach(kj::mv(state));
}

}  // namespace judge
