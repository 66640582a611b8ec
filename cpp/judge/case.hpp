#ifndef JUDGE_CASE_HPP
#define JUDGE_CASE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "judge/verdict.hpp"
#include "util/file.hpp"

namespace judge {

// Where the data of a case comes from. Both operations may block and are run
// on worker threads; a CaseData may be used by one run at a time.
class CaseData {
 public:
  virtual ~CaseData() = default;

  // Writes the input of the case to sink, ending it with an empty chunk.
  virtual void ProduceInput(util::File::ChunkReceiver* sink) const = 0;

  // Reads output to its end and tells whether it is a correct answer.
  virtual bool JudgeOutput(util::File::ChunkProducer* output) const = 0;
};

// A test case: limits plus the data to feed and check. Immutable.
class Case {
 public:
  Case(CaseLimits limits, std::unique_ptr<CaseData> data)
      : limits_(limits), data_(std::move(data)) {}

  const CaseLimits& Limits() const { return limits_; }
  const CaseData& Data() const { return *data_; }

 private:
  CaseLimits limits_;
  std::unique_ptr<CaseData> data_;
};

static const constexpr int64_t kDefaultMemoryKb = 262144;
static const constexpr int64_t kDefaultProcessLimit = 64;

// Opens a fresh stream on each call.
using Opener = std::function<util::File::ChunkProducer()>;

// Case backed by input and expected output files. Nothing is opened until the
// case is judged, and every judgement opens the files again. Carriage returns
// are removed from the input before the program sees it. Time and memory are
// converted by truncation.
std::unique_ptr<Case> MakeLegacyCase(Opener open_input, Opener open_output,
                                     double time_sec, double memory_kb,
                                     int64_t score);

// Case whose input is "a b\n" and whose answer is a + b.
std::unique_ptr<Case> MakeAPlusBCase(int64_t a, int64_t b,
                                     int64_t time_limit_ns,
                                     int64_t memory_limit_bytes,
                                     int64_t score);

}  // namespace judge

#endif
