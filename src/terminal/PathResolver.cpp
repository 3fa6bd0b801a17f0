#include "PathResolver.hpp"

namespace pt {
namespace {
const string PATH_QUERY = "echo $PATH";

string joinPath(const string& base, const string& a, const string& b) {
  if (base.empty()) {
    return a + "/" + b;
  }
  return base + "/" + a + "/" + b;
}
}  // namespace

PathResolver::PathResolver(shared_ptr<SubprocessUtils> _subprocessUtils,
                           int _timeoutMs)
    : subprocessUtils(_subprocessUtils), timeoutMs(_timeoutMs) {}

string PathResolver::resolve(const string& shellOverride) {
  {
    lock_guard<mutex> guard(cacheMutex);
    if (cachedPath) {
      return *cachedPath;
    }
  }

  string shell = shellOverride.empty() ? detectShell() : shellOverride;
  VLOG(1) << "Resolving PATH through " << shell;

  // An interactive login shell also reads ~/.zshrc and friends.
  auto interactive = queryShell(shell, {"-l", "-i", "-c", PATH_QUERY});
  if (interactive) {
    VLOG(1) << "PATH from interactive login shell: " << *interactive;
    return storeInCache(*interactive);
  }

  auto login = queryShell(shell, {"-l", "-c", PATH_QUERY});
  if (login) {
    VLOG(1) << "PATH from login shell: " << *login;
    return storeInCache(*login);
  }

  string fallback = buildFallbackPath();
  LOG(WARNING) << "Could not query PATH from " << shell
               << ", using fallback: " << fallback;
  return storeInCache(fallback);
}

void PathResolver::invalidate() {
  lock_guard<mutex> guard(cacheMutex);
  cachedPath.reset();
}

optional<string> PathResolver::getCachedPath() {
  lock_guard<mutex> guard(cacheMutex);
  return cachedPath;
}

optional<string> PathResolver::queryShell(const string& shell,
                                          const vector<string>& args) {
  map<string, string> env;
  string home = GetEnvOrEmpty("HOME");
  string user = GetEnvOrEmpty("USER");
  if (!home.empty()) {
    env["HOME"] = home;
  }
  if (!user.empty()) {
    env["USER"] = user;
  }
  SubprocessResult result = subprocessUtils->SubprocessToStringWithTimeout(
      shell, args, env, timeoutMs);
  if (result.timedOut) {
    VLOG(1) << shell << " timed out after " << timeoutMs << "ms";
    return nullopt;
  }
  if (!result.succeeded()) {
    VLOG(1) << shell << " exited with " << result.exitCode;
    return nullopt;
  }
  string path = trim(result.output);
  if (path.empty()) {
    return nullopt;
  }
  return path;
}

string PathResolver::storeInCache(const string& path) {
  lock_guard<mutex> guard(cacheMutex);
  cachedPath = path;
  return path;
}

string PathResolver::detectShell() {
#if __APPLE__
  string shell = GetEnvOrEmpty("SHELL");
  return shell.empty() ? string("/bin/zsh") : shell;
#elif defined(_WIN32)
  string shell = GetEnvOrEmpty("COMSPEC");
  return shell.empty() ? string("cmd.exe") : shell;
#else
  string shell = GetEnvOrEmpty("SHELL");
  return shell.empty() ? string("/bin/bash") : shell;
#endif
}

string PathResolver::buildFallbackPath() {
  string inherited = GetEnvOrEmpty("PATH");
  if (inherited.empty()) {
    inherited = "/usr/bin:/bin";
  }
  return buildFallbackPath(GetEnvOrEmpty("HOME"), inherited);
}

string PathResolver::buildFallbackPath(const string& home,
                                       const string& inheritedPath) {
  vector<string> entries = {
      joinPath(home, ".local", "bin"),
      joinPath(home, ".bun", "bin"),
      "/usr/local/bin",
      "/opt/homebrew/bin",
      "/opt/homebrew/sbin",
      joinPath(home, ".npm-global", "bin"),
      home.empty() ? string("bin") : home + "/bin",
  };
  split(inheritedPath, ':', std::back_inserter(entries));

  unordered_set<string> seen;
  string result;
  for (auto& entry : entries) {
    if (entry.empty() || !seen.insert(entry).second) {
      continue;
    }
    if (!result.empty()) {
      result += ":";
    }
    result += entry;
  }
  return result;
}
}  // namespace pt
