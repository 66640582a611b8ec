#ifndef JUDGE_COMPARE_HPP
#define JUDGE_COMPARE_HPP

#include "util/file.hpp"

namespace judge {

// Returns true if both streams are equal once spaces, tabs and carriage
// returns at the end of each line, and blank lines at the end of the stream,
// are ignored. actual is always read to its end, even after a mismatch, so
// that its writer is never left with a broken pipe.
bool CompareOutput(util::File::ChunkProducer* expected,
                   util::File::ChunkProducer* actual);

}  // namespace judge

#endif
