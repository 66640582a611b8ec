#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::temp_directory = "temp";
bool Flags::keep_sandboxes = false;

int32_t Flags::num_workers = 4;
uint32_t Flags::stderr_limit = 8192;
int32_t Flags::poll_interval_millis = 10;
