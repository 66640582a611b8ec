#include "judge/judge.hpp"

#include <fcntl.h>
#include <cerrno>
#include <string>
#include <system_error>

#include <kj/debug.h>
#include "judge/resource_monitor.hpp"
#include "util/file.hpp"
#include "util/stream.hpp"
#include "util/union_promise.hpp"

namespace judge {

namespace {
struct JudgeRun {
  // Jobs are only left pending when the run is cancelled. They must not stay
  // blocked on the pipes of a program that is about to be killed.
  ~JudgeRun() {
    if (!stdin_done) util::DiscardFifo(stdin_path);
    if (!stdout_done) util::DiscardFifo(stdout_path);
    if (!stderr_done) util::DiscardFifo(stderr_path);
  }

  kj::Own<sandbox::Executable> executable;
  sandbox::ExecuteRequest request;
  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;
  kj::Own<kj::ConnectionReceiver> listener;
  kj::Own<kj::ForkedPromise<int>> execute;

  // Set once the corresponding blocking job is over, or before the pipes
  // exist.
  bool stdin_done = true;
  bool stdout_done = true;
  bool stderr_done = true;

  int exit_status = 0;
  bool correct = false;
  ResourceUsage usage;
  std::string stderr_output;
};

InputDelivery FeedInput(const Case& c, const std::string& path) {
  try {
    auto sink = util::WriteFifo(path);
    c.Data().ProduceInput(&sink);
  } catch (const std::system_error& exc) {
    if (exc.code().value() != EPIPE) throw;
    return InputDelivery::kEndedEarly;
  }
  return InputDelivery::kComplete;
}

kj::AutoCloseFd OpenForReading(const std::string& path) {
  int fd;
  do {
    fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);  // NOLINT
  } while (fd == -1 && errno == EINTR);
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "open " + path);
  }
  return kj::AutoCloseFd(fd);
}

// Once the program is gone, a job may still be blocked opening its end of a
// pipe. Opening the other end lets it through: the writer then gets EPIPE and
// the readers get EOF.
kj::Promise<void> ReleasePipes(RunContext& ctx, JudgeRun* run) {
  if (!run->stdin_done) util::ReleaseFifo(run->stdin_path, O_RDONLY);
  if (!run->stdout_done) util::ReleaseFifo(run->stdout_path, O_WRONLY);
  if (!run->stderr_done) util::ReleaseFifo(run->stderr_path, O_WRONLY);
  if (run->stdin_done && run->stdout_done && run->stderr_done) {
    return kj::READY_NOW;
  }
  return ctx.Timer()
      .afterDelay(ctx.Options().poll_interval)
      .then([&ctx, run]() { return ReleasePipes(ctx, run); });
}

kj::Promise<Verdict> Run(RunContext& ctx, const Case& c,
                         sandbox::Sandbox& sandbox,
                         kj::Own<sandbox::Executable> executable) {
  auto owned_run = kj::heap<JudgeRun>();
  JudgeRun* run = owned_run.get();
  run->executable = kj::mv(executable);
  run->stdin_path = sandbox.HostPath(run->request.stdin_file);
  run->stdout_path = sandbox.HostPath(run->request.stdout_file);
  run->stderr_path = sandbox.HostPath(run->request.stderr_file);
  util::File::MakeFifo(run->stdin_path);
  util::File::MakeFifo(run->stdout_path);
  util::File::MakeFifo(run->stderr_path);
  run->stdin_done = run->stdout_done = run->stderr_done = false;
  run->listener = ctx.Listen(sandbox.HostPath(run->request.cgroup_file));

  // The program is started before anything touches the pipes.
  run->execute = kj::heap(
      kj::evalNow([run, &sandbox]() {
        return run->executable->Execute(sandbox, run->request);
      }).fork());

  util::UnionPromiseBuilder builder;
  builder.AddPromise(run->execute->addBranch().then(
                         [run](int status) { run->exit_status = status; }),
                     "execute");

  builder.AddPromise(
      ctx.Pool()
          .Run<InputDelivery>(
              [path = run->stdin_path, &c]() { return FeedInput(c, path); })
          .then(
              [run](InputDelivery delivery) {
                run->stdin_done = true;
                if (delivery == InputDelivery::kEndedEarly) {
                  KJ_LOG(INFO, "The program did not read all of its input");
                }
              },
              [run](kj::Exception&& exc) {
                run->stdin_done = true;
                kj::throwFatalException(kj::mv(exc));
              }),
      "stdin");

  builder.AddPromise(
      ctx.Pool()
          .Run<bool>([path = run->stdout_path, &c]() {
            auto output = util::File::Read(path);
            return c.Data().JudgeOutput(&output);
          })
          .then(
              [run](bool correct) {
                run->stdout_done = true;
                run->correct = correct;
              },
              [run](kj::Exception&& exc) {
                run->stdout_done = true;
                kj::throwFatalException(kj::mv(exc));
              }),
      "stdout");

  builder.AddPromise(
      ctx.Pool()
          .Run<kj::AutoCloseFd>(
              [path = run->stderr_path]() { return OpenForReading(path); })
          .then(
              [&ctx, run](kj::AutoCloseFd fd) {
                run->stderr_done = true;
                auto stream = ctx.Io().wrapInputFd(
                    fd.release(),
                    kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                        kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
                return util::ReadCapped(kj::mv(stream),
                                        ctx.Options().stderr_limit);
              },
              [run](kj::Exception&& exc) -> kj::Promise<std::string> {
                run->stderr_done = true;
                kj::throwFatalException(kj::mv(exc));
              })
          .then([run](std::string data) {
            run->stderr_output = kj::mv(data);
          }),
      "stderr");

  builder.AddPromise(
      WaitResourceUsage(ctx, *run->listener, *run->execute, c.Limits())
          .then([run](ResourceUsage usage) { run->usage = usage; }),
      "monitor");

  // A failure of execute is reported by its own branch above.
  builder.AddPromise(
      run->execute->addBranch()
          .then([](int) {}, [](kj::Exception&&) {})
          .then([&ctx, run]() { return ReleasePipes(ctx, run); }),
      "release");

  return std::move(builder)
      .Finalize()
      .then([run, &c]() {
        Measurements measurements;
        measurements.exit_status = run->exit_status;
        measurements.correct = run->correct;
        measurements.time_usage_ns = run->usage.time_usage_ns;
        measurements.memory_usage_bytes = run->usage.memory_usage_bytes;
        Verdict verdict = Classify(measurements, c.Limits());
        verdict.stderr_output = kj::mv(run->stderr_output);
        return verdict;
      })
      .attach(kj::mv(owned_run));
}
}  // namespace

kj::Promise<Verdict> Judge(RunContext& ctx, const Case& c,
                           sandbox::Sandbox& sandbox,
                           sandbox::Package& package) {
  return kj::evalNow([&package, &sandbox]() {
           return package.Install(sandbox);
         })
      .then([&ctx, &c, &sandbox](kj::Own<sandbox::Executable> executable) {
        return Run(ctx, c, sandbox, kj::mv(executable));
      });
}

}  // namespace judge
