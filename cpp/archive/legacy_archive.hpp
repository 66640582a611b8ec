#ifndef ARCHIVE_LEGACY_ARCHIVE_HPP
#define ARCHIVE_LEGACY_ARCHIVE_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <kj/common.h>
#include "judge/case.hpp"

namespace archive {

// The archive cannot be opened, or its manifest is malformed or references
// files that are not there.
class ManifestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

namespace detail {
struct Archive;
}  // namespace detail

// Reads the cases of a zip archive holding config.ini, input/ and output/.
// The first line of config.ini is the number of cases N, each of the next N
// lines is input|output|time_sec|score[|memory_kb]. All names are looked up
// ignoring case.
//
// The whole manifest is checked on construction, so a bad archive is
// reported before any of its cases is judged. The files are read only while
// the cases are judged, and the cases may outlive the reader.
class LegacyCaseReader {
 public:
  explicit LegacyCaseReader(const std::string& path);
  ~LegacyCaseReader();
  KJ_DISALLOW_COPY(LegacyCaseReader);

  size_t NumCases() const { return records_.size(); }

  // Returns the next case, or nullptr after the last one.
  std::unique_ptr<judge::Case> Next();

 private:
  struct Record {
    uint64_t input;
    uint64_t output;
    double time_sec;
    double memory_kb;
    int64_t score;
  };

  std::shared_ptr<detail::Archive> archive_;
  std::vector<Record> records_;
  size_t next_ = 0;
};

}  // namespace archive

#endif
