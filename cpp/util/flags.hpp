#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  static std::string log_file;
  static bool verbose;

  // Where sandboxes are created.
  static std::string temp_directory;
  static bool keep_sandboxes;

  static int32_t num_workers;
  static uint32_t stderr_limit;
  static int32_t poll_interval_millis;
};

#endif
