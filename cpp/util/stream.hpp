#ifndef UTIL_STREAM_HPP
#define UTIL_STREAM_HPP

#include <string>

#include <kj/async-io.h>
#include "util/file.hpp"

namespace util {

// Copies src to dst dropping every carriage return, then ends dst with an
// empty chunk.
void CopyStrippingCarriageReturns(File::ChunkProducer* src,
                                  File::ChunkReceiver* dst);

// Produces the content of data as a single chunk.
File::ChunkProducer StringProducer(std::string data);

// Opens the named pipe at path for writing, blocking until a reader opens it.
// Writes that hit a closed pipe throw std::system_error with EPIPE, so
// SIGPIPE must be ignored by the process. Empty chunks are ignored, the pipe
// is closed when the receiver is destroyed.
File::ChunkReceiver WriteFifo(const std::string& path);

// Reads stream until EOF, keeping only the first limit bytes. The rest is
// read and thrown away so that the writer never blocks on a full pipe.
kj::Promise<std::string> ReadCapped(kj::Own<kj::AsyncInputStream> stream,
                                    size_t limit);

// Wakes up whoever is blocked opening the other end of the FIFO at path by
// briefly opening the end selected by flags (O_RDONLY or O_WRONLY) in
// non-blocking mode. Returns false if that end could not be opened, which for
// O_WRONLY means that nobody is waiting to read yet.
bool ReleaseFifo(const std::string& path, int flags);

// Gives up on the FIFO at path: whoever is blocked opening it is let through
// and then sees the other end closed, and later opens fail as the path is
// removed. Returns false if the FIFO could not be opened.
bool DiscardFifo(const std::string& path);

}  // namespace util

#endif
