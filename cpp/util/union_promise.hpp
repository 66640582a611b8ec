#ifndef UTIL_UNION_PROMISE
#define UTIL_UNION_PROMISE
#include <kj/async.h>
#include <kj/memory.h>
#include <kj/vector.h>
#include <string>

namespace util {
namespace detail {
struct UnionPromiseBuilderInfo;
}  // namespace detail

// Collects promises that belong to the same job. The promise returned by
// Finalize resolves only once every added promise has settled, whether it
// succeeded or failed, and is then rejected with the first failure seen, if
// any. A failing promise never cancels the others, so whatever they reference
// must stay alive until Finalize's promise settles.
class UnionPromiseBuilder {
 public:
  UnionPromiseBuilder();
  KJ_DISALLOW_COPY(UnionPromiseBuilder);
  UnionPromiseBuilder(UnionPromiseBuilder&&) = default;
  UnionPromiseBuilder& operator=(UnionPromiseBuilder&&) = default;
  ~UnionPromiseBuilder();

  // Adds a promise to the group, what is used in logs if it fails.
  void AddPromise(kj::Promise<void> p, const std::string& what = "unnamed");

  // Finalizes the builder and returns the "union" promise. Calling any other
  // method of the builder after Finalize() triggers undefined behaviour.
  kj::Promise<void> Finalize() && KJ_WARN_UNUSED_RESULT;

 private:
  kj::Own<detail::UnionPromiseBuilderInfo> info_;
  kj::Vector<kj::Promise<void>> promises_;
};

}  // namespace util
#endif
