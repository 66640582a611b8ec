#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/main.h>
#include "archive/legacy_archive.hpp"
#include "judge/case.hpp"
#include "judge/judge.hpp"
#include "judge/run_context.hpp"
#include "sandbox/unix.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"

namespace {
const constexpr char* kVersion = "judge-core 1.0";

std::function<bool(kj::StringPtr)> setInt64(int64_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      size_t pos = 0;
      var = std::stoll(std::string(p), &pos);
      return pos == p.size();
    } catch (const std::logic_error&) {
      return false;
    }
  };
}

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>& var) {
  return [&var](kj::StringPtr p) {
    var.emplace_back(p);
    return true;
  };
}
}  // namespace

class JudgeCoreMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit JudgeCoreMain(kj::ProcessContext& context) : context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, kVersion,
                           "Runs a program on test cases and judges it")
        .addSubCommand("legacy", KJ_BIND_METHOD(*this, getLegacyMain),
                       "judge every case of a legacy archive")
        .addSubCommand("aplusb", KJ_BIND_METHOD(*this, getAPlusBMain),
                       "judge one case asking for the sum of two numbers")
        .build();
  }

  kj::MainFunc getLegacyMain() {
    kj::MainBuilder builder(context, kVersion,
                            "Judges every case of a legacy archive");
    return AddOptions(builder)
        .expectArg("<archive>", util::setString(archive_path))
        .expectArg("<program>", util::setString(program))
        .expectZeroOrMoreArgs("<arg>", appendString(args))
        .callAfterParsing(KJ_BIND_METHOD(*this, RunLegacy))
        .build();
  }

  kj::MainFunc getAPlusBMain() {
    kj::MainBuilder builder(context, kVersion,
                            "Judges a program summing <a> and <b>");
    return AddOptions(builder)
        .expectArg("<a>", setInt64(a))
        .expectArg("<b>", setInt64(b))
        .expectArg("<program>", util::setString(program))
        .expectZeroOrMoreArgs("<arg>", appendString(args))
        .callAfterParsing(KJ_BIND_METHOD(*this, RunAPlusB))
        .build();
  }

 private:
  // NOLINTNEXTLINE(google-runtime-references)
  kj::MainBuilder& AddOptions(kj::MainBuilder& builder) {
    return builder
        .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                           "<LOGFILE>",
                           "Path where the log file should be stored")
        .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                   "Log informational messages too")
        .addOptionWithArg({'T', "temp-dir"},
                          util::setString(Flags::temp_directory), "<DIR>",
                          "Path where the sandboxes should be created")
        .addOption({'k', "keep-sandboxes"},
                   util::setBool(Flags::keep_sandboxes),
                   "Keep the sandboxes after evaluation")
        .addOptionWithArg({'w', "workers"}, util::setInt(Flags::num_workers),
                          "<N>", "Number of threads doing blocking I/O")
        .addOptionWithArg({"stderr-limit"}, util::setUint(Flags::stderr_limit),
                          "<BYTES>", "How much of stderr to keep")
        .addOptionWithArg({"poll-interval"},
                          util::setInt(Flags::poll_interval_millis), "<MS>",
                          "How often the program is checked, in milliseconds");
  }

  kj::MainBuilder::Validity CheckFlags() {
    if (Flags::num_workers < 3) return "--workers must be at least 3";
    if (Flags::poll_interval_millis <= 0) {
      return "--poll-interval must be positive";
    }
    return true;
  }

  judge::RunOptions Options() {
    judge::RunOptions options;
    options.num_workers = Flags::num_workers;
    options.stderr_limit = Flags::stderr_limit;
    options.poll_interval = Flags::poll_interval_millis * kj::MILLISECONDS;
    return options;
  }

  judge::Verdict JudgeCase(kj::AsyncIoContext& io, const judge::Case& c) {
    util::File::MakeDirs(Flags::temp_directory);
    judge::RunOptions options = Options();
    judge::RunContext ctx(*io.lowLevelProvider, options);
    sandbox::UnixSandbox box(Flags::temp_directory);
    if (Flags::keep_sandboxes) box.Keep();
    sandbox::BinaryPackage package(*io.lowLevelProvider, program, args,
                                   options.poll_interval);
    auto verdict = judge::Judge(ctx, c, box, package).wait(io.waitScope);
    if (Flags::keep_sandboxes) KJ_LOG(INFO, "Sandbox kept", box.InDir());
    return verdict;
  }

  void Print(size_t index, const judge::Verdict& verdict) {
    std::cout << "case " << index << ": " << judge::StatusName(verdict.status)
              << " score=" << verdict.score
              << " time_ns=" << verdict.time_usage_ns
              << " memory_bytes=" << verdict.memory_usage_bytes << std::endl;
    if (!verdict.stderr_output.empty()) {
      KJ_LOG(INFO, "stderr of case", index, verdict.stderr_output);
    }
  }

  kj::MainBuilder::Validity RunLegacy() {
    auto valid = CheckFlags();
    if (valid.getError() != nullptr) return valid;
    util::LogManager log_manager(context);
    auto io = kj::setupAsyncIo();
    std::unique_ptr<archive::LegacyCaseReader> reader;
    try {
      reader = std::make_unique<archive::LegacyCaseReader>(archive_path);
    } catch (const archive::ManifestError& exc) {
      context.exitError(kj::str(exc.what()));
    }
    size_t index = 0;
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                  while (auto c = reader->Next()) {
                    Print(index, JudgeCase(io, *c));
                    index++;
                  }
                })) {
      context.exitError(kj::str("Judging case ", index, " failed: ",
                                exc->getDescription()));
    }
    return true;
  }

  kj::MainBuilder::Validity RunAPlusB() {
    auto valid = CheckFlags();
    if (valid.getError() != nullptr) return valid;
    util::LogManager log_manager(context);
    auto io = kj::setupAsyncIo();
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                  auto c = judge::MakeAPlusBCase(
                      a, b, 1000000000, judge::kDefaultMemoryKb * 1024, 1);
                  Print(0, JudgeCase(io, *c));
                })) {
      context.exitError(kj::str("Judging failed: ", exc->getDescription()));
    }
    return true;
  }

  kj::ProcessContext& context;
  std::string archive_path;
  std::string program;
  std::vector<std::string> args;
  int64_t a = 0;
  int64_t b = 0;
};

KJ_MAIN(JudgeCoreMain);
