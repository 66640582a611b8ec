#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <utility>

#include <kj/common.h>
#include <kj/function.h>

namespace util {

static const constexpr uint32_t kChunkSize = 32 * 1024;

// File system helpers. Failures throw std::system_error with the errno of the
// call that failed.
class File {
 public:
  // Bytes owned by whoever produced them, valid until the next call.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // Called with every chunk of a stream in order, then with an empty chunk.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Returns the next chunk of a stream on each call, an empty one at the end.
  using ChunkProducer = kj::Function<Chunk()>;

  // Opens path for reading. On a named pipe this blocks until a writer opens
  // the other end.
  static ChunkProducer Read(const std::string& path);

  // Opens path for writing, creating its directories. An existing file is
  // truncated if overwrite is set, otherwise it is left alone and the data is
  // dropped, or EEXIST is thrown if exist_ok is not set. The empty chunk
  // flushes the file to disk.
  static ChunkReceiver Write(const std::string& path, bool overwrite = false,
                             bool exist_ok = true);

  // mkdir -p
  static void MakeDirs(const std::string& path);

  static void MakeFifo(const std::string& path);

  // Copies the content of from into a new file, to.
  static void HardCopy(const std::string& from, const std::string& to,
                       bool overwrite = false, bool exist_ok = true,
                       bool make_dirs = true);

  static void Remove(const std::string& path);

  // rm -r
  static void RemoveTree(const std::string& path);

  // Leaves only read and execute permissions to the owner.
  static void MakeExecutable(const std::string& path);

  // second if it is absolute, first/second otherwise.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Everything before the last slash, "" if there is none.
  static std::string BaseDir(const std::string& path);

  // Everything after the last slash.
  static std::string BaseName(const std::string& path);

  // Size in bytes, -1 if path cannot be stat'ed.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Fresh directory inside base, removed with all its content on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  ~TempDir();

  const std::string& Path() const;

  // Leaves the directory in place on destruction.
  void Keep();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
