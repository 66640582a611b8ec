#include "util/stream.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <iterator>
#include <system_error>
#include <vector>

#include <kj/debug.h>
#include <kj/io.h>

namespace util {

namespace {
struct CappedRead {
  kj::Own<kj::AsyncInputStream> stream;
  size_t limit = 0;
  std::string data;
  std::array<kj::byte, 4096> buf;
};

kj::Promise<void> ReadLoop(CappedRead* state) {
  return state->stream->tryRead(state->buf.data(), 1, state->buf.size())
      .then([state](size_t amount) -> kj::Promise<void> {
        if (amount == 0) return kj::READY_NOW;
        size_t keep = std::min(amount, state->limit - state->data.size());
        state->data.append(reinterpret_cast<const char*>(state->buf.data()),
                           keep);
        return ReadLoop(state);
      });
}
}  // namespace

void CopyStrippingCarriageReturns(File::ChunkProducer* src,
                                  File::ChunkReceiver* dst) {
  std::vector<kj::byte> buf;
  File::Chunk chunk;
  while ((chunk = (*src)()).size()) {
    buf.clear();
    std::remove_copy(chunk.begin(), chunk.end(), std::back_inserter(buf),
                     '\r');
    // An empty chunk would be taken as EOF.
    if (!buf.empty()) (*dst)(File::Chunk(buf.data(), buf.size()));
  }
  (*dst)(File::Chunk());
}

File::ChunkProducer StringProducer(std::string data) {
  return [data = std::move(data), done = false]() mutable {
    if (done) return File::Chunk();
    done = true;
    return File::Chunk(reinterpret_cast<const kj::byte*>(data.data()),
                       data.size());
  };
}

File::ChunkReceiver WriteFifo(const std::string& path) {
  int raw_fd;
  do {
    raw_fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);  // NOLINT
  } while (raw_fd == -1 && errno == EINTR);
  if (raw_fd == -1) {
    throw std::system_error(errno, std::system_category(), "open " + path);
  }
  kj::AutoCloseFd fd(raw_fd);
  return [fd = std::move(fd), path](File::Chunk chunk) mutable {
    size_t pos = 0;
    while (pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + pos,  // NOLINT
                              chunk.size() - pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        throw std::system_error(errno, std::system_category(),
                                "write " + path);
      }
      pos += written;
    }
  };
}

kj::Promise<std::string> ReadCapped(kj::Own<kj::AsyncInputStream> stream,
                                    size_t limit) {
  auto state = kj::heap<CappedRead>();
  state->stream = kj::mv(stream);
  state->limit = limit;
  CappedRead* ptr = state.get();
  return ReadLoop(ptr)
      .then([ptr]() { return kj::mv(ptr->data); })
      .attach(kj::mv(state));
}

bool ReleaseFifo(const std::string& path, int flags) {
  kj::AutoCloseFd fd(open(path.c_str(),  // NOLINT
                          flags | O_NONBLOCK | O_CLOEXEC));
  return fd.get() != -1;
}

bool DiscardFifo(const std::string& path) {
  // Opening both ends never blocks.
  kj::AutoCloseFd fd(open(path.c_str(),  // NOLINT
                          O_RDWR | O_NONBLOCK | O_CLOEXEC));
  if (fd.get() == -1) return false;
  try {
    File::Remove(path);
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "Could not remove the pipe", path, exc.what());
  }
  return true;
}

}  // namespace util
