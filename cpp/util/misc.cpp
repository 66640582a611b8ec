#include "util/misc.hpp"

#include <algorithm>
#include <cctype>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string strip(const std::string& s) {
  const char* blanks = " \t\r\n";
  size_t begin = s.find_first_not_of(blanks);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(blanks);
  return s.substr(begin, end - begin + 1);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p));
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
}

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      unsigned long value = std::stoul(std::string(p));
      if (p.size() && p[0] == '-') return false;
      var = static_cast<uint32_t>(value);
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
}

}  // namespace util
