#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <climits>
#include <system_error>
#include <vector>

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>

namespace util {

namespace {
const constexpr char kSeparator = '/';

[[noreturn]] void ThrowErrno(const std::string& what) {
  throw std::system_error(errno, std::system_category(), what);
}

int OpenRetrying(const std::string& path, int flags, mode_t mode = 0) {
  int fd;
  do {
    fd = open(path.c_str(), flags, mode);  // NOLINT
  } while (fd == -1 && errno == EINTR);
  return fd;
}

int RemoveEntry(const char* path, const struct stat* /*unused*/,
                int /*unused*/, struct FTW* /*unused*/) {
  return remove(path);
}
}  // namespace

File::ChunkProducer File::Read(const std::string& path) {
  kj::AutoCloseFd fd(OpenRetrying(path, O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) ThrowErrno("read " + path);
  // A null fd marks the end of the file.
  return [fd = std::move(fd), path,
          buf = std::array<kj::byte, kChunkSize>()]() mutable {
    while (fd != nullptr) {
      ssize_t amount = read(fd, buf.data(), buf.size());  // NOLINT
      if (amount > 0) return Chunk(buf.data(), amount);
      if (amount == -1 && errno == EINTR) continue;
      int error = errno;
      fd = nullptr;
      if (amount == -1) {
        throw std::system_error(error, std::system_category(), "read " + path);
      }
    }
    return Chunk();
  };
}

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  KJ_REQUIRE(exist_ok || !overwrite,
             "Cannot overwrite a file that must not exist", path);
  MakeDirs(BaseDir(path));
  if (Exists(path) && !overwrite) {
    if (!exist_ok) {
      throw std::system_error(EEXIST, std::system_category(), "write " + path);
    }
    return [](Chunk) {};
  }
  kj::AutoCloseFd fd(
      OpenRetrying(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.get() == -1) ThrowErrno("write " + path);
  return [fd = std::move(fd), path](Chunk chunk) mutable {
    if (fd == nullptr) return;
    if (chunk.size() == 0) {
      if (fsync(fd) == -1) ThrowErrno("fsync " + path);
      fd = nullptr;
      return;
    }
    const kj::byte* pos = chunk.begin();
    while (pos != chunk.end()) {
      ssize_t written = write(fd, pos, chunk.end() - pos);  // NOLINT
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) ThrowErrno("write " + path);
      pos += written;
    }
  };
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  size_t end = 0;
  do {
    end = path.find(kSeparator, end + 1);
    std::string dir = path.substr(0, end);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      ThrowErrno("mkdir " + dir);
    }
  } while (end != std::string::npos);
}

void File::MakeFifo(const std::string& path) {
  if (mkfifo(path.c_str(), S_IRUSR | S_IWUSR) == -1) {
    ThrowErrno("mkfifo " + path);
  }
}

void File::HardCopy(const std::string& from, const std::string& to,
                    bool overwrite, bool exist_ok, bool make_dirs) {
  if (make_dirs) MakeDirs(BaseDir(to));
  auto producer = Read(from);
  auto receiver = Write(to, overwrite, exist_ok);
  for (Chunk chunk = producer();; chunk = producer()) {
    receiver(chunk);
    if (chunk.size() == 0) break;
  }
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1) ThrowErrno("remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (nftw(path.c_str(), RemoveEntry, 64, FTW_DEPTH | FTW_PHYS) == -1) {
    ThrowErrno("remove " + path);
  }
}

void File::MakeExecutable(const std::string& path) {
  if (chmod(path.c_str(), S_IRUSR | S_IXUSR) == -1) {
    ThrowErrno("chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && second[0] == kSeparator) return second;
  return first + kSeparator + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t last = path.rfind(kSeparator);
  return last == std::string::npos ? "" : path.substr(0, last);
}

std::string File::BaseName(const std::string& path) {
  size_t last = path.rfind(kSeparator);
  return last == std::string::npos ? path : path.substr(last + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return -1;
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string pattern = File::JoinPath(base, "XXXXXX");
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  if (mkdtemp(name.data()) == nullptr) ThrowErrno("mkdtemp " + pattern);
  path_ = name.data();
}

void TempDir::Keep() { keep_ = true; }

const std::string& TempDir::Path() const { return path_; }

TempDir::~TempDir() {  // NOLINT
  if (keep_ || moved_) return;
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([this]() { File::RemoveTree(path_); });
}

}  // namespace util
