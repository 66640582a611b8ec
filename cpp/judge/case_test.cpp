#include "judge/case.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include "gtest/gtest.h"
#include "util/stream.hpp"

namespace {

std::string Input(const judge::Case& c) {
  std::string data;
  int empty_chunks = 0;
  util::File::ChunkReceiver sink = [&](util::File::Chunk chunk) {
    if (chunk.size() == 0) empty_chunks++;
    data += std::string(chunk.asChars().begin(), chunk.size());
  };
  c.Data().ProduceInput(&sink);
  EXPECT_EQ(empty_chunks, 1);
  return data;
}

bool Judge(const judge::Case& c, const std::string& output) {
  auto producer = util::StringProducer(output);
  return c.Data().JudgeOutput(&producer);
}

judge::Opener Counting(const std::string& content, int* opened) {
  return [content, opened]() {
    (*opened)++;
    return util::StringProducer(content);
  };
}

// NOLINTNEXTLINE
TEST(LegacyCase, Limits) {
  int opened = 0;
  auto c = judge::MakeLegacyCase(Counting("3 4\n", &opened),
                                 Counting("7\n", &opened), 1.0,
                                 judge::kDefaultMemoryKb, 100);
  EXPECT_EQ(c->Limits().time_limit_ns, 1000000000);
  EXPECT_EQ(c->Limits().memory_limit_bytes, 262144 * 1024LL);
  EXPECT_EQ(c->Limits().process_limit, 64);
  EXPECT_EQ(c->Limits().score, 100);
  EXPECT_EQ(opened, 0);
}

// NOLINTNEXTLINE
TEST(LegacyCase, LimitsAreTruncated) {
  int opened = 0;
  auto c = judge::MakeLegacyCase(Counting("", &opened), Counting("", &opened),
                                 2.5, 1.5, 0);
  EXPECT_EQ(c->Limits().time_limit_ns, 2500000000LL);
  EXPECT_EQ(c->Limits().memory_limit_bytes, 1536);
  c = judge::MakeLegacyCase(Counting("", &opened), Counting("", &opened),
                            1e-10, 0.0001, 0);
  EXPECT_EQ(c->Limits().time_limit_ns, 0);
  EXPECT_EQ(c->Limits().memory_limit_bytes, 0);
}

// NOLINTNEXTLINE
TEST(LegacyCase, InvalidLimits) {
  int opened = 0;
  EXPECT_ANY_THROW(judge::MakeLegacyCase(  // NOLINT
      Counting("", &opened), Counting("", &opened), -1, 1024, 10));
  EXPECT_ANY_THROW(judge::MakeLegacyCase(  // NOLINT
      Counting("", &opened), Counting("", &opened), 1,
      std::numeric_limits<double>::quiet_NaN(), 10));
  EXPECT_ANY_THROW(judge::MakeLegacyCase(  // NOLINT
      Counting("", &opened), Counting("", &opened), 1, 1024, -10));
}

// NOLINTNEXTLINE
TEST(LegacyCase, InputLosesCarriageReturns) {
  int opened = 0;
  auto c = judge::MakeLegacyCase(Counting("3 4\r\n", &opened),
                                 Counting("7\r\n", &opened), 1, 1024, 10);
  EXPECT_EQ(Input(*c), "3 4\n");
  EXPECT_EQ(opened, 1);
}

// NOLINTNEXTLINE
TEST(LegacyCase, FilesReopenedOnEveryUse) {
  int inputs = 0;
  int outputs = 0;
  auto c = judge::MakeLegacyCase(Counting("3 4\n", &inputs),
                                 Counting("7\n", &outputs), 1, 1024, 10);
  EXPECT_TRUE(Judge(*c, "7\n"));
  EXPECT_FALSE(Judge(*c, "8\n"));
  EXPECT_EQ(Input(*c), "3 4\n");
  EXPECT_EQ(Input(*c), "3 4\n");
  EXPECT_EQ(inputs, 2);
  EXPECT_EQ(outputs, 2);
}

// NOLINTNEXTLINE
TEST(APlusBCase, InputAndAnswer) {
  auto c = judge::MakeAPlusBCase(3, 4, 1000000000, 64 << 20, 10);
  EXPECT_EQ(Input(*c), "3 4\n");
  EXPECT_TRUE(Judge(*c, "7"));
  EXPECT_TRUE(Judge(*c, "7\n"));
  EXPECT_FALSE(Judge(*c, "8\n"));
  EXPECT_FALSE(Judge(*c, ""));
  EXPECT_EQ(c->Limits().score, 10);
  EXPECT_EQ(c->Limits().memory_limit_bytes, 64 << 20);
}

// NOLINTNEXTLINE
TEST(APlusBCase, NegativeOperands) {
  auto c = judge::MakeAPlusBCase(-10, 4, 1000000000, 64 << 20, 10);
  EXPECT_EQ(Input(*c), "-10 4\n");
  EXPECT_TRUE(Judge(*c, "-6\n"));
}

// NOLINTNEXTLINE
TEST(APlusBCase, Overflow) {
  EXPECT_ANY_THROW(judge::MakeAPlusBCase(  // NOLINT
      std::numeric_limits<int64_t>::max(), 1, 1000000000, 64 << 20, 10));
}

}  // namespace
