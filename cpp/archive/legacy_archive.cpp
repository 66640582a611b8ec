#include "archive/legacy_archive.hpp"

#include <zip.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <kj/debug.h>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace archive {

namespace detail {
// libzip handles are not thread safe, and entries are read from the worker
// threads of the judge: every call goes through mutex.
struct Archive {
  std::mutex mutex;
  zip_t* zip = nullptr;
  ~Archive() {
    if (zip != nullptr) zip_discard(zip);
  }
};
}  // namespace detail

namespace {
const char* kManifest = "config.ini";

struct EntryCloser {
  std::shared_ptr<detail::Archive> archive;
  void operator()(zip_file_t* file) const {
    std::lock_guard<std::mutex> lck(archive->mutex);
    if (zip_fclose(file) != 0) KJ_LOG(WARNING, "Cannot close archive entry");
  }
};

util::File::ChunkProducer OpenEntry(
    const std::shared_ptr<detail::Archive>& archive, uint64_t index) {
  zip_file_t* file;
  {
    std::lock_guard<std::mutex> lck(archive->mutex);
    file = zip_fopen_index(archive->zip, index, 0);
    KJ_REQUIRE(file != nullptr, "Cannot open archive entry",
               zip_get_name(archive->zip, index, 0),
               zip_strerror(archive->zip));
  }
  std::unique_ptr<zip_file_t, EntryCloser> entry(file, EntryCloser{archive});
  return [archive, entry = std::move(entry),
          buf = std::vector<kj::byte>(util::kChunkSize)]() mutable {
    std::lock_guard<std::mutex> lck(archive->mutex);
    zip_int64_t amount = zip_fread(entry.get(), buf.data(), buf.size());
    KJ_REQUIRE(amount >= 0, "Cannot read archive entry",
               zip_file_strerror(entry.get()));
    return util::File::Chunk(buf.data(), amount);
  };
}

std::string ReadEntry(const std::shared_ptr<detail::Archive>& archive,
                      uint64_t index) {
  auto producer = OpenEntry(archive, index);
  std::string content;
  util::File::Chunk chunk;
  while ((chunk = producer()).size()) {
    content.append(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

bool ParseDouble(const std::string& s, double* value) {
  if (s.empty()) return false;
  char* end = nullptr;
  *value = strtod(s.c_str(), &end);
  return *end == '\0';
}

bool ParseInt(const std::string& s, int64_t* value) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  *value = strtoll(s.c_str(), &end, 10);
  return *end == '\0' && errno != ERANGE;
}

ManifestError Malformed(size_t line, const std::string& what) {
  return ManifestError(std::string(kManifest) + " line " +
                       std::to_string(line) + ": " + what);
}
}  // namespace

LegacyCaseReader::LegacyCaseReader(const std::string& path)
    : archive_(std::make_shared<detail::Archive>()) {
  int error = 0;
  archive_->zip = zip_open(path.c_str(), ZIP_RDONLY, &error);
  if (archive_->zip == nullptr) {
    zip_error_t zip_error;
    zip_error_init_with_code(&zip_error, error);
    std::string message = zip_error_strerror(&zip_error);
    zip_error_fini(&zip_error);
    throw ManifestError("Cannot open " + path + ": " + message);
  }

  std::unordered_map<std::string, uint64_t> entries;
  zip_int64_t num_entries = zip_get_num_entries(archive_->zip, 0);
  for (zip_int64_t i = 0; i < num_entries; i++) {
    const char* name = zip_get_name(archive_->zip, i, 0);
    if (name != nullptr) entries.emplace(util::toLower(name), i);
  }
  auto lookup = [&entries](const std::string& name, size_t line) {
    auto it = entries.find(util::toLower(name));
    if (it == entries.end()) throw Malformed(line, "no such file " + name);
    return it->second;
  };

  auto manifest = entries.find(kManifest);
  if (manifest == entries.end()) {
    throw ManifestError(path + " has no " + kManifest);
  }
  std::vector<std::string> lines =
      util::split(ReadEntry(archive_, manifest->second), '\n');

  int64_t num_cases = 0;
  if (lines.empty() || !ParseInt(util::strip(lines[0]), &num_cases) ||
      num_cases < 0) {
    throw Malformed(1, "expected the number of cases");
  }
  if (static_cast<uint64_t>(num_cases) >= lines.size()) {
    throw Malformed(lines.size(), "expected " + std::to_string(num_cases) +
                                      " cases");
  }

  for (int64_t i = 1; i <= num_cases; i++) {
    size_t line = i + 1;
    std::vector<std::string> fields = util::split(lines[i], '|');
    if (fields.size() < 4) throw Malformed(line, "expected at least 4 fields");
    for (auto& field : fields) field = util::strip(field);
    Record record;
    record.input = lookup(util::File::JoinPath("input", fields[0]), line);
    record.output = lookup(util::File::JoinPath("output", fields[1]), line);
    if (!ParseDouble(fields[2], &record.time_sec) ||
        !std::isfinite(record.time_sec) || record.time_sec < 0) {
      throw Malformed(line, "invalid time limit " + fields[2]);
    }
    if (!ParseInt(fields[3], &record.score) || record.score < 0) {
      throw Malformed(line, "invalid score " + fields[3]);
    }
    if (fields.size() < 5 || !ParseDouble(fields[4], &record.memory_kb)) {
      record.memory_kb = judge::kDefaultMemoryKb;
    }
    if (!std::isfinite(record.memory_kb) || record.memory_kb < 0) {
      throw Malformed(line, "invalid memory limit " + fields[4]);
    }
    records_.push_back(record);
  }
  KJ_LOG(INFO, "Read archive", path, records_.size());
}

LegacyCaseReader::~LegacyCaseReader() = default;

std::unique_ptr<judge::Case> LegacyCaseReader::Next() {
  if (next_ == records_.size()) return nullptr;
  const Record& record = records_[next_++];
  auto archive = archive_;
  uint64_t input = record.input;
  uint64_t output = record.output;
  return judge::MakeLegacyCase(
      [archive, input]() { return OpenEntry(archive, input); },
      [archive, output]() { return OpenEntry(archive, output); },
      record.time_sec, record.memory_kb, record.score);
}

}  // namespace archive
