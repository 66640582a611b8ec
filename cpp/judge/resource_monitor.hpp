#ifndef JUDGE_RESOURCE_MONITOR_HPP
#define JUDGE_RESOURCE_MONITOR_HPP

#include <sys/types.h>
#include <cstdint>
#include <vector>

#include <kj/async-io.h>
#include "judge/run_context.hpp"
#include "judge/verdict.hpp"

namespace judge {

struct ResourceUsage {
  int64_t time_usage_ns = 0;
  int64_t memory_usage_bytes = 0;
};

// Usage of a group of processes at one point in time.
struct ProcessSample {
  // User plus system CPU time, including reaped children.
  int64_t time_usage_ns = 0;
  // Sum of the peak resident sizes.
  int64_t memory_usage_bytes = 0;
  // Live threads, counting the main thread of each process.
  int64_t threads = 0;
  std::vector<pid_t> pids;
};

// Samples every live process of the session led by sid, zombies excluded.
// Returns false if none was found.
bool SampleSession(pid_t sid, ProcessSample* sample);

// Accepts the control connection of a single run of execute and watches the
// program until it terminates: once it started its usage is sampled every
// poll interval, and it is killed once it reaches the memory, time, process
// or wall-clock limit. When execute settles, whatever is left of the
// program's session is killed. Resolves to the peak usage, merging samples
// with the CPU time of the final report. Rejected if the report is missing,
// malformed or disagrees with execute, or if execute is rejected.
kj::Promise<ResourceUsage> WaitResourceUsage(RunContext& ctx,
                                             kj::ConnectionReceiver& listener,
                                             kj::ForkedPromise<int>& execute,
                                             const CaseLimits& limits);

}  // namespace judge

#endif
