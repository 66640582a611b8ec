#include "judge/compare.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "gtest/gtest.h"
#include "util/stream.hpp"

namespace {

// Splits data in chunks of the given size.
util::File::ChunkProducer Chunked(std::string data, size_t size) {
  auto owned = std::make_shared<std::string>(std::move(data));
  size_t pos = 0;
  return [owned, pos, size]() mutable {
    size_t len = std::min(size, owned->size() - pos);
    util::File::Chunk chunk(
        reinterpret_cast<const kj::byte*>(owned->data()) + pos, len);
    pos += len;
    return chunk;
  };
}

// Produces head, then count chunks alternating spaces and tabs, then tail.
util::File::ChunkProducer Blanks(std::string head, size_t count,
                                 std::string tail) {
  auto pattern = std::make_shared<std::string>();
  for (size_t i = 0; i < util::kChunkSize; i++) *pattern += " \t"[i % 2];
  auto ends = std::make_shared<std::pair<std::string, std::string>>(
      std::move(head), std::move(tail));
  size_t step = 0;
  return [pattern, ends, count, step]() mutable {
    const std::string* piece = pattern.get();
    if (step == 0) piece = &ends->first;
    if (step == count + 1) piece = &ends->second;
    if (step > count + 1) return util::File::Chunk();
    step++;
    return util::File::Chunk(reinterpret_cast<const kj::byte*>(piece->data()),
                             piece->size());
  };
}

bool Same(const std::string& expected, const std::string& actual) {
  auto want = util::StringProducer(expected);
  auto got = util::StringProducer(actual);
  bool result = judge::CompareOutput(&want, &got);
  // Chunk boundaries must not matter.
  for (size_t size : {1, 2, 3, 7}) {
    auto want_chunks = Chunked(expected, size);
    auto got_chunks = Chunked(actual, size);
    EXPECT_EQ(judge::CompareOutput(&want_chunks, &got_chunks), result)
        << "chunk size " << size;
  }
  return result;
}

// NOLINTNEXTLINE
TEST(Compare, Identical) {
  EXPECT_TRUE(Same("7\n", "7\n"));
  EXPECT_TRUE(Same("", ""));
}

// NOLINTNEXTLINE
TEST(Compare, MissingFinalNewline) {
  EXPECT_TRUE(Same("7\n", "7"));
  EXPECT_TRUE(Same("7", "7\n\n\n"));
}

// NOLINTNEXTLINE
TEST(Compare, TrailingBlanksOnLines) {
  EXPECT_TRUE(Same("1 2\n3\n", "1 2  \t\n3\r\n"));
  EXPECT_TRUE(Same("1 2\r\n", "1 2\n"));
}

// NOLINTNEXTLINE
TEST(Compare, TrailingBlankLines) {
  EXPECT_TRUE(Same("a\nb\n", "a\nb\n  \n\t\n"));
  EXPECT_TRUE(Same("", "\n \n"));
}

// NOLINTNEXTLINE
TEST(Compare, DifferentContent) {
  EXPECT_FALSE(Same("7\n", "8\n"));
  EXPECT_FALSE(Same("7\n", "77\n"));
  EXPECT_FALSE(Same("7\n", ""));
  EXPECT_FALSE(Same("", "7"));
}

// NOLINTNEXTLINE
TEST(Compare, InnerWhitespaceMatters) {
  EXPECT_FALSE(Same("1 2\n", "1  2\n"));
  EXPECT_FALSE(Same("1 2\n", " 1 2\n"));
  EXPECT_FALSE(Same("1\t2\n", "1 2\n"));
}

// NOLINTNEXTLINE
TEST(Compare, InnerBlankLinesMatter) {
  EXPECT_FALSE(Same("a\nb\n", "a\n\nb\n"));
  EXPECT_TRUE(Same("a\n\nb\n", "a\n  \nb\n"));
}

// NOLINTNEXTLINE
TEST(Compare, DrainsActualAfterMismatch) {
  auto want = util::StringProducer("1\n");
  std::string big(3 * util::kChunkSize, 'x');
  auto got = Chunked("2\n" + big, 1000);
  size_t calls = 0;
  util::File::ChunkProducer counting = [&]() {
    calls++;
    return got();
  };
  EXPECT_FALSE(judge::CompareOutput(&want, &counting));
  // Every chunk plus the final empty one.
  EXPECT_EQ(calls, (big.size() + 2 + 999) / 1000 + 1);
}

// NOLINTNEXTLINE
TEST(Compare, LongBlankRuns) {
  // 64 MiB of alternating blanks.
  const size_t chunks = 64 * 1024 * 1024 / util::kChunkSize;
  {
    auto want = util::StringProducer("3\n");
    auto got = Blanks("3", chunks, "\n\n");
    EXPECT_TRUE(judge::CompareOutput(&want, &got));
  }
  {
    auto want = util::StringProducer("3\n");
    auto got = Blanks("3", chunks, "");
    EXPECT_TRUE(judge::CompareOutput(&want, &got));
  }
  {
    auto want = util::StringProducer("3\n");
    auto got = Blanks("3", chunks, "4\n");
    EXPECT_FALSE(judge::CompareOutput(&want, &got));
  }
  {
    auto want = util::StringProducer("3\n");
    auto got = Blanks("3\n", chunks, "\n4");
    EXPECT_FALSE(judge::CompareOutput(&want, &got));
  }
}

}  // namespace
