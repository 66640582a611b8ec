#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <string>

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/memory.h>
#include "util/file.hpp"

namespace sandbox {

// Paths, as seen by the program, of the files it talks through. They are all
// named pipes or sockets living in the staging directory of the sandbox.
struct ExecuteRequest {
  std::string stdin_file = "/in/stdin";
  std::string stdout_file = "/in/stdout";
  std::string stderr_file = "/in/stderr";
  // Control socket on which resource usage is reported.
  std::string cgroup_file = "/in/cgroup";
};

// Isolated environment in which a program is installed and run. Whoever
// creates a sandbox owns its directories and removes them.
class Sandbox {
 public:
  Sandbox() = default;
  virtual ~Sandbox() = default;
  KJ_DISALLOW_COPY(Sandbox);

  // Staging directory, visible to the program as /in.
  virtual const std::string& InDir() const = 0;

  // Working directory of the program.
  virtual const std::string& RootDir() const = 0;

  // Host path of a file the program sees under /in.
  std::string HostPath(const std::string& path) const {
    static const std::string prefix = "/in/";
    KJ_REQUIRE(path.compare(0, prefix.size(), prefix) == 0 &&
                   path.size() > prefix.size(),
               "Only paths under /in are visible outside the sandbox", path);
    return util::File::JoinPath(InDir(), path.substr(prefix.size()));
  }
};

class Executable {
 public:
  virtual ~Executable() = default;

  // Runs the program with its standard streams connected to the files in
  // request and resolves to the raw wait status once it terminated. Failing
  // to start the program rejects the promise. Its pid, the moment it started
  // and its final CPU time and status are reported on request.cgroup_file.
  virtual kj::Promise<int> Execute(Sandbox& sandbox,
                                   const ExecuteRequest& request) = 0;
};

// Something that can be turned into an executable inside a sandbox, for
// example a binary or a source file to compile.
class Package {
 public:
  virtual ~Package() = default;
  virtual kj::Promise<kj::Own<Executable>> Install(Sandbox& sandbox) = 0;
};

}  // namespace sandbox

#endif
