#include "judge/compare.hpp"

namespace judge {

namespace {

bool IsBlank(int c) { return c == ' ' || c == '\t' || c == '\r'; }

// Byte-at-a-time view of a chunk producer.
class ByteReader {
 public:
  explicit ByteReader(util::File::ChunkProducer* source) : source_(source) {}

  // Next byte without consuming it, or -1 at the end of the stream.
  int Peek() {
    while (pos_ == chunk_.size()) {
      if (eof_) return -1;
      chunk_ = (*source_)();
      pos_ = 0;
      if (chunk_.size() == 0) eof_ = true;
    }
    return chunk_[pos_];
  }

  void Advance() { pos_++; }

  // Consumes blanks. Returns true if the current line has nothing else, that
  // is if a newline or the end of the stream follows.
  bool SkipBlanks() {
    int c;
    while (IsBlank(c = Peek())) Advance();
    return c == '\n' || c == -1;
  }

  // Consumes the stream. Returns false, leaving the rest unread, as soon as a
  // byte other than a blank or a newline shows up.
  bool SkipBlankLines() {
    int c;
    while ((c = Peek()) != -1) {
      if (!IsBlank(c) && c != '\n') return false;
      Advance();
    }
    return true;
  }

  void Drain() {
    while (Peek() != -1) pos_ = chunk_.size();
  }

 private:
  util::File::ChunkProducer* source_;
  util::File::Chunk chunk_;
  size_t pos_ = 0;
  bool eof_ = false;
};

// Compares the streams a line at a time. Two lines are equal when they only
// differ in their trailing blanks, so at the first differing byte of a line
// both sides must have nothing but blanks left on it. Nothing is buffered
// besides the current chunk of each stream.
bool Compare(ByteReader* want, ByteReader* got) {
  while (true) {
    int a = want->Peek();
    int b = got->Peek();
    if (a == b) {
      if (a == -1) return true;
      want->Advance();
      got->Advance();
      continue;
    }
    if (!want->SkipBlanks() || !got->SkipBlanks()) return false;
    a = want->Peek();
    b = got->Peek();
    if (a == b) continue;
    // One stream ended, only blank lines may follow in the other.
    return a == -1 ? got->SkipBlankLines() : want->SkipBlankLines();
  }
}

}  // namespace

bool CompareOutput(util::File::ChunkProducer* expected,
                   util::File::ChunkProducer* actual) {
  ByteReader want(expected);
  ByteReader got(actual);
  bool same = Compare(&want, &got);
  got.Drain();
  return same;
}

}  // namespace judge
