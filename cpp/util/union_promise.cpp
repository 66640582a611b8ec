#include "util/union_promise.hpp"
#include <kj/debug.h>

namespace util {

namespace detail {
struct UnionPromiseBuilderInfo {
  size_t settled = 0;
  kj::Maybe<kj::Exception> first_failure;
};
}  // namespace detail

UnionPromiseBuilder::UnionPromiseBuilder()
    : info_(kj::heap<detail::UnionPromiseBuilderInfo>()) {}

UnionPromiseBuilder::~UnionPromiseBuilder() = default;

void UnionPromiseBuilder::AddPromise(kj::Promise<void> p,
                                     const std::string& what) {
  KJ_LOG(INFO, "Adding promise", what);
  detail::UnionPromiseBuilderInfo* info = info_.get();
  promises_.add(p.then([info]() { info->settled++; },
                       [info, what](kj::Exception exc) {
                         info->settled++;
                         KJ_LOG(WARNING, "Promise failed", what,
                                exc.getDescription());
                         if (info->first_failure == nullptr) {
                           info->first_failure = kj::mv(exc);
                         }
                       })
                     .eagerlyEvaluate(nullptr));
}

kj::Promise<void> UnionPromiseBuilder::Finalize() && {
  detail::UnionPromiseBuilderInfo* info = info_.get();
  // Every branch already swallowed its own failure, so the join below never
  // cancels a sibling early.
  return kj::joinPromises(promises_.releaseAsArray())
      .then([info]() {
        KJ_IF_MAYBE(exc, info->first_failure) {
          kj::throwFatalException(kj::mv(*exc));
        }
      })
      .attach(kj::mv(info_));
}

}  // namespace util
