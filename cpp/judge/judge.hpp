#ifndef JUDGE_JUDGE_HPP
#define JUDGE_JUDGE_HPP

#include <kj/async.h>
#include "judge/case.hpp"
#include "judge/run_context.hpp"
#include "judge/verdict.hpp"
#include "sandbox/sandbox.hpp"

namespace judge {

// How much of its input the program consumed.
enum class InputDelivery {
  kComplete,
  // The program closed its stdin before reading all of it.
  kEndedEarly,
};

// Installs package in sandbox, runs it on one case and classifies the
// outcome. The input is fed and the output compared while the program runs,
// neither is ever held in memory whole. The promise is rejected on failures
// of the run itself, for example when the program cannot be started or the
// case data cannot be read. ctx, c and sandbox must outlive the promise.
// Dropping the promise kills the program and lets the blocking jobs of the
// run finish on their own: c must then stay alive as long as ctx.
kj::Promise<Verdict> Judge(RunContext& ctx, const Case& c,
                           sandbox::Sandbox& sandbox,
                           sandbox::Package& package);

}  // namespace judge

#endif
