#include "util/file.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/judge_core_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  return remove(fpath);
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

void feed(util::File::ChunkReceiver* receiver, const std::string& content) {
  auto data = reinterpret_cast<const kj::byte*>(content.data());  // NOLINT
  size_t written = 0;
  while (written < content.size()) {
    size_t size = std::min(content.size() - written,
                           static_cast<size_t>(util::kChunkSize));
    (*receiver)(util::File::Chunk(data + written, size));
    written += size;
  }
  (*receiver)(util::File::Chunk());
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  return std::string((std::istreambuf_iterator<char>(t)),
                     std::istreambuf_iterator<char>());
}

std::string drain(util::File::ChunkProducer* producer) {
  util::File::Chunk chunk;
  std::string content;
  while ((chunk = (*producer)()).size()) {
    content += std::string(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string filepath = makeTestDir("read") + "/input1.txt";
  writeFile(filepath, "1 2\n");
  auto reader = util::File::Read(filepath);
  EXPECT_EQ(drain(&reader), "1 2\n");
}

// NOLINTNEXTLINE
TEST(File, ReadSpansChunks) {
  std::string filepath = makeTestDir("read") + "/output1.txt";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  writeFile(filepath, content);
  auto reader = util::File::Read(filepath);
  EXPECT_EQ(drain(&reader), content);
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  EXPECT_THROW(util::File::Read("/no/such/file"),  // NOLINT
               std::system_error);
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string filepath = makeTestDir("write") + "/deep/dir/file";
  {
    auto writer = util::File::Write(filepath);
    feed(&writer, "3\n");
  }
  EXPECT_EQ(readFile(filepath), "3\n");
}

// NOLINTNEXTLINE
TEST(File, WriteKeepsExisting) {
  std::string filepath = makeTestDir("write") + "/file";
  writeFile(filepath, "old");
  {
    auto writer = util::File::Write(filepath);
    feed(&writer, "new");
  }
  EXPECT_EQ(readFile(filepath), "old");
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  std::string filepath = makeTestDir("write") + "/file";
  writeFile(filepath, "old");
  {
    auto writer = util::File::Write(filepath, true);
    feed(&writer, "new");
  }
  EXPECT_EQ(readFile(filepath), "new");
}

// NOLINTNEXTLINE
TEST(File, WriteExistsNotOk) {
  std::string filepath = makeTestDir("write") + "/file";
  writeFile(filepath, "old");
  EXPECT_THROW(util::File::Write(filepath, false, false),  // NOLINT
               std::system_error);
}

/*
 * Fifo
 */

// NOLINTNEXTLINE
TEST(File, MakeFifo) {
  std::string fifo = makeTestDir("fifo") + "/stdin";
  util::File::MakeFifo(fifo);
  struct stat st {};
  ASSERT_EQ(stat(fifo.c_str(), &st), 0);
  EXPECT_TRUE(S_ISFIFO(st.st_mode));
  EXPECT_THROW(util::File::MakeFifo(fifo), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, ReadFromFifo) {
  std::string fifo = makeTestDir("fifo") + "/stdout";
  util::File::MakeFifo(fifo);
  std::thread writer([&fifo]() { writeFile(fifo, "from the other side"); });
  auto reader = util::File::Read(fifo);
  EXPECT_EQ(drain(&reader), "from the other side");
  writer.join();
}

/*
 * HardCopy
 */

// NOLINTNEXTLINE
TEST(File, HardCopy) {
  std::string testdir = makeTestDir("hardcopy");
  writeFile(testdir + "/program", "#!/bin/sh\n");
  util::File::HardCopy(testdir + "/program", testdir + "/root/program");
  EXPECT_EQ(readFile(testdir + "/root/program"), "#!/bin/sh\n");
  EXPECT_EQ(readFile(testdir + "/program"), "#!/bin/sh\n");
}

// NOLINTNEXTLINE
TEST(File, HardCopyExistNotOk) {
  std::string testdir = makeTestDir("hardcopy");
  writeFile(testdir + "/a", "a");
  writeFile(testdir + "/b", "b");
  EXPECT_THROW(  // NOLINT
      util::File::HardCopy(testdir + "/a", testdir + "/b", false, false),
      std::system_error);
  EXPECT_EQ(readFile(testdir + "/b"), "b");
}

/*
 * Remove, RemoveTree, MakeExecutable
 */

// NOLINTNEXTLINE
TEST(File, Remove) {
  std::string filepath = makeTestDir("remove") + "/file";
  writeFile(filepath, "holaa");
  util::File::Remove(filepath);
  EXPECT_FALSE(util::File::Exists(filepath));
  EXPECT_THROW(util::File::Remove(filepath), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, RemoveTree) {
  std::string dirpath = makeTestDir("removetree") + "/dir";
  util::File::MakeDirs(dirpath + "/in");
  writeFile(dirpath + "/in/stderr", "x");
  writeFile(dirpath + "/program", "y");
  util::File::RemoveTree(dirpath);
  EXPECT_FALSE(dirExists(dirpath));
}

// NOLINTNEXTLINE
TEST(File, MakeExecutable) {
  std::string filepath = makeTestDir("makeexecutable") + "/file";
  writeFile(filepath, "foo");
  util::File::MakeExecutable(filepath);
  EXPECT_EQ(access(filepath.c_str(), X_OK), 0);
  EXPECT_THROW(util::File::MakeExecutable(filepath + "/nope"),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a/b", "c/d"), "a/b/c/d");
  EXPECT_EQ(util::File::JoinPath("/a/b", "/in/stdin"), "/in/stdin");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b");
  EXPECT_EQ(util::File::BaseDir("a"), "");
  EXPECT_EQ(util::File::BaseName("a/b/c"), "c");
  EXPECT_EQ(util::File::BaseName("a"), "a");
}

// NOLINTNEXTLINE
TEST(File, Size) {
  std::string filepath = makeTestDir("size") + "/file";
  writeFile(filepath, "foobar");
  EXPECT_EQ(util::File::Size(filepath), 6);
  EXPECT_LT(util::File::Size(filepath + ".nope"), 0);
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tempdir(testdir);
    path = tempdir.Path();
    writeFile(path + "/leftover", "x");
    EXPECT_TRUE(dirExists(path));
    EXPECT_THAT(path, StartsWith(testdir));
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tempdir(testdir);
    tempdir.Keep();
    path = tempdir.Path();
  }
  EXPECT_TRUE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Move) {
  std::string testdir = makeTestDir("tempdir");
  util::TempDir tempdir(testdir);
  std::string path = tempdir.Path();
  {
    util::TempDir other = std::move(tempdir);
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

}  // namespace
