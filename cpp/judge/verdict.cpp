#include "judge/verdict.hpp"

namespace judge {

const char* StatusName(Status status) {
  switch (status) {
    case Status::ACCEPTED:
      return "ACCEPTED";
    case Status::WRONG_ANSWER:
      return "WRONG_ANSWER";
    case Status::TIME_LIMIT_EXCEEDED:
      return "TIME_LIMIT_EXCEEDED";
    case Status::MEMORY_LIMIT_EXCEEDED:
      return "MEMORY_LIMIT_EXCEEDED";
    case Status::RUNTIME_ERROR:
      return "RUNTIME_ERROR";
  }
  return "UNKNOWN";
}

Verdict Classify(const Measurements& measurements, const CaseLimits& limits) {
  Verdict verdict;
  verdict.time_usage_ns = measurements.time_usage_ns;
  verdict.memory_usage_bytes = measurements.memory_usage_bytes;
  if (measurements.memory_usage_bytes >= limits.memory_limit_bytes) {
    verdict.status = Status::MEMORY_LIMIT_EXCEEDED;
  } else if (measurements.time_usage_ns >= limits.time_limit_ns) {
    verdict.status = Status::TIME_LIMIT_EXCEEDED;
  } else if (measurements.exit_status != 0) {
    verdict.status = Status::RUNTIME_ERROR;
  } else if (!measurements.correct) {
    verdict.status = Status::WRONG_ANSWER;
  } else {
    verdict.status = Status::ACCEPTED;
    verdict.score = limits.score;
  }
  return verdict;
}

}  // namespace judge
