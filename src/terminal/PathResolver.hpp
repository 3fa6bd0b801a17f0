#ifndef __PT_PATH_RESOLVER__
#define __PT_PATH_RESOLVER__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace pt {
/**
 * @brief Finds the PATH the user's login shell would have.
 *
 * A host started from a desktop launcher inherits a minimal PATH, so the
 * shell itself is asked.  Resolution order, first success wins:
 *  1. the cached value
 *  2. `<shell> -l -i -c 'echo $PATH'`
 *  3. `<shell> -l -c 'echo $PATH'`
 *  4. buildFallbackPath()
 * Every outcome, including the fallback, is cached until invalidate().
 * Resolution as a whole never fails.
 */
class PathResolver {
 public:
  explicit PathResolver(
      shared_ptr<SubprocessUtils> _subprocessUtils =
          std::make_shared<SubprocessUtils>(),
      int _timeoutMs = PATH_QUERY_TIMEOUT_MS);

  /**
   * @brief Returns the user's PATH.
   * @param shellOverride Shell to query; the detected shell when empty.
   */
  string resolve(const string& shellOverride = "");

  /** @brief Drops the cached value so the next resolve() queries again. */
  void invalidate();

  optional<string> getCachedPath();

  /** @brief The user's configured shell, or the platform default. */
  static string detectShell();

  /**
   * @brief Well-known user and package manager bin directories followed by
   * the inherited PATH, without duplicates, first occurrence kept.
   */
  static string buildFallbackPath();
  static string buildFallbackPath(const string& home,
                                  const string& inheritedPath);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  int timeoutMs;
  mutex cacheMutex;
  optional<string> cachedPath;

  optional<string> queryShell(const string& shell, const vector<string>& args);
  string storeInCache(const string& path);
};
}  // namespace pt

#endif  // __PT_PATH_RESOLVER__
