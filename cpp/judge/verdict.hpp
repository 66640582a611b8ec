#ifndef JUDGE_VERDICT_HPP
#define JUDGE_VERDICT_HPP

#include <cstdint>
#include <string>

namespace judge {

// Values match the status codes reported to users.
enum class Status : int {
  ACCEPTED = 1,
  WRONG_ANSWER = 2,
  TIME_LIMIT_EXCEEDED = 3,
  MEMORY_LIMIT_EXCEEDED = 4,
  RUNTIME_ERROR = 6,
};

const char* StatusName(Status status);

struct CaseLimits {
  int64_t time_limit_ns = 0;
  int64_t memory_limit_bytes = 0;
  // Maximum number of live processes and threads of the program.
  int64_t process_limit = 64;
  int64_t score = 0;
};

// What was observed while running the program on a case.
struct Measurements {
  // Raw wait status, 0 for a clean exit.
  int exit_status = 0;
  bool correct = false;
  int64_t time_usage_ns = 0;
  int64_t memory_usage_bytes = 0;
};

struct Verdict {
  Status status = Status::WRONG_ANSWER;
  int64_t score = 0;
  int64_t time_usage_ns = 0;
  int64_t memory_usage_bytes = 0;
  std::string stderr_output;
};

// Memory, then time, then abnormal exit, then correctness: the first match
// decides. Usage equal to a limit exceeds it. Only ACCEPTED gets the score.
// stderr_output is left empty.
Verdict Classify(const Measurements& measurements, const CaseLimits& limits);

}  // namespace judge

#endif
