#include "judge/case.hpp"

#include <cmath>
#include <limits>

#include <kj/debug.h>
#include "judge/compare.hpp"
#include "util/stream.hpp"

namespace judge {

namespace {

class LegacyData : public CaseData {
 public:
  LegacyData(Opener open_input, Opener open_output)
      : open_input_(std::move(open_input)),
        open_output_(std::move(open_output)) {}

  void ProduceInput(util::File::ChunkReceiver* sink) const override {
    auto input = open_input_();
    util::CopyStrippingCarriageReturns(&input, sink);
  }

  bool JudgeOutput(util::File::ChunkProducer* output) const override {
    auto expected = open_output_();
    return CompareOutput(&expected, output);
  }

 private:
  Opener open_input_;
  Opener open_output_;
};

class APlusBData : public CaseData {
 public:
  APlusBData(int64_t a, int64_t b, int64_t sum)
      : input_(std::to_string(a) + " " + std::to_string(b) + "\n"),
        answer_(std::to_string(sum)) {}

  void ProduceInput(util::File::ChunkReceiver* sink) const override {
    auto input = util::StringProducer(input_);
    util::File::Chunk chunk;
    while ((chunk = input()).size()) (*sink)(chunk);
    (*sink)(chunk);
  }

  bool JudgeOutput(util::File::ChunkProducer* output) const override {
    auto expected = util::StringProducer(answer_);
    return CompareOutput(&expected, output);
  }

 private:
  std::string input_;
  std::string answer_;
};

int64_t Truncate(double value, const char* what) {
  KJ_REQUIRE(std::isfinite(value) && value >= 0, "Invalid limit", what, value);
  KJ_REQUIRE(value < static_cast<double>(std::numeric_limits<int64_t>::max()),
             "Limit too large", what, value);
  return static_cast<int64_t>(value);
}

}  // namespace

std::unique_ptr<Case> MakeLegacyCase(Opener open_input, Opener open_output,
                                     double time_sec, double memory_kb,
                                     int64_t score) {
  KJ_REQUIRE(score >= 0, "Negative score", score);
  CaseLimits limits;
  limits.time_limit_ns = Truncate(time_sec * 1e9, "time");
  limits.memory_limit_bytes = Truncate(memory_kb * 1024, "memory");
  limits.process_limit = kDefaultProcessLimit;
  limits.score = score;
  return std::make_unique<Case>(
      limits, std::make_unique<LegacyData>(std::move(open_input),
                                           std::move(open_output)));
}

std::unique_ptr<Case> MakeAPlusBCase(int64_t a, int64_t b,
                                     int64_t time_limit_ns,
                                     int64_t memory_limit_bytes,
                                     int64_t score) {
  int64_t sum;
  KJ_REQUIRE(!__builtin_add_overflow(a, b, &sum), "a + b overflows", a, b);
  KJ_REQUIRE(time_limit_ns >= 0 && memory_limit_bytes >= 0 && score >= 0,
             "Negative limit", time_limit_ns, memory_limit_bytes, score);
  CaseLimits limits;
  limits.time_limit_ns = time_limit_ns;
  limits.memory_limit_bytes = memory_limit_bytes;
  limits.process_limit = kDefaultProcessLimit;
  limits.score = score;
  return std::make_unique<Case>(limits,
                                std::make_unique<APlusBData>(a, b, sum));
}

}  // namespace judge
