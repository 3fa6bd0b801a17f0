#include "FakePtyBackend.hpp"
#include "FakeSubprocessUtils.hpp"
#include "PtySessionManager.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
struct ManagerFixture {
  ManagerFixture() : backend(std::make_shared<FakePtyBackend>()) {
    auto fake = std::make_shared<FakeSubprocessUtils>();
    auto resolver = std::make_shared<PathResolver>(fake);
    auto fakeBackend = backend;
    manager = std::make_shared<PtySessionManager>(
        resolver, [fakeBackend]() { return fakeBackend; });
    options.cwd = "/tmp";
    options.shellPath = string("/bin/sh");
    options.resolvedPath = string("/usr/bin:/bin");
  }

  shared_ptr<FakePtyBackend> backend;
  shared_ptr<PtySessionManager> manager;
  SpawnOptions options;
};
}  // namespace

TEST_CASE("Spawns the shell without arguments", "[PtySessionManager]") {
  ManagerFixture f;
  f.options.cols = 120;
  f.options.rows = 40;
  f.manager->spawn(f.options);

  REQUIRE(f.manager->isRunning());
  REQUIRE(f.backend->spawns.size() == 1);
  auto& record = f.backend->spawns[0];
  REQUIRE(record.program == "/bin/sh");
  REQUIRE(record.args.empty());
  REQUIRE(record.options.cwd == "/tmp");
  REQUIRE(record.options.cols == 120);
  REQUIRE(record.options.rows == 40);
  REQUIRE(record.options.name == PT_TERM_NAME);
  REQUIRE(!f.manager->getSessionId().empty());
}

TEST_CASE("A command bypasses the shell", "[PtySessionManager]") {
  ManagerFixture f;
  f.options.command = string("claude --model opus");
  f.manager->spawn(f.options);

  auto& record = f.backend->spawns[0];
  REQUIRE(record.program == "claude");
  REQUIRE(record.args == vector<string>({"--model", "opus"}));
  REQUIRE(f.manager->getProgram() == "claude");
}

TEST_CASE("The child environment carries terminal overrides",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);

  auto& env = f.backend->spawns[0].options.env;
  REQUIRE(env.at("TERM") == "xterm-256color");
  REQUIRE(env.at("COLORTERM") == "truecolor");
  REQUIRE(env.at("TERM_PROGRAM") == "xterm");
  REQUIRE(env.at("PATH") == "/usr/bin:/bin");
}

TEST_CASE("PATH is resolved when the caller does not supply it",
          "[PtySessionManager]") {
  auto fake = std::make_shared<FakeSubprocessUtils>();
  fake->addOutput("/resolved/bin\n");
  auto resolver = std::make_shared<PathResolver>(fake);
  auto backend = std::make_shared<FakePtyBackend>();
  PtySessionManager manager(resolver, [backend]() { return backend; });

  SpawnOptions options;
  options.cwd = "/tmp";
  options.shellPath = string("/bin/zsh");
  manager.spawn(options);

  REQUIRE(fake->calls.size() == 1);
  REQUIRE(fake->calls[0].command == "/bin/zsh");
  REQUIRE(backend->spawns[0].options.env.at("PATH") == "/resolved/bin");
}

TEST_CASE("Output reaches every callback in order, sanitized",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  vector<string> seen;
  f.manager->onData([&seen](const string& s) { seen.push_back("1:" + s); });
  f.manager->onData([&seen](const string& s) { seen.push_back("2:" + s); });

  f.backend->last()->emitData("hi\x1b[?2004h there");
  REQUIRE(seen == vector<string>({"1:hi there", "2:hi there"}));
}

TEST_CASE("Output queued behind poll is delivered by poll",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  string received;
  f.manager->onData([&received](const string& s) { received += s; });

  auto process = f.backend->last();
  process->queueData("abc");
  REQUIRE(received.empty());
  REQUIRE(f.manager->poll(0));
  REQUIRE(received == "abc");
  REQUIRE(!f.manager->poll(0));
}

TEST_CASE("A held back partial sequence is flushed when output stops",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  string received;
  f.manager->onData([&received](const string& s) { received += s; });

  f.backend->last()->emitData("prompt$ \x1b[");
  REQUIRE(received == "prompt$ ");
  REQUIRE(f.manager->poll(0));
  REQUIRE(received == "prompt$ \x1b[");
}

TEST_CASE("Exit is reported once with the exit code", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  vector<int> codes;
  f.manager->onExit(
      [&codes](const ExitStatus& status) { codes.push_back(status.exitCode); });

  f.backend->last()->emitExit(3);
  REQUIRE(codes == vector<int>({3}));
  REQUIRE(f.manager->getState() == SessionState::EXITED);
  REQUIRE(f.manager->getLastExitStatus()->exitCode == 3);
  REQUIRE(f.manager->getFd() == -1);
}

TEST_CASE("Pending output is delivered before the exit event",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  vector<string> events;
  f.manager->onData([&events](const string& s) { events.push_back(s); });
  f.manager->onExit(
      [&events](const ExitStatus&) { events.push_back("exit"); });

  auto process = f.backend->last();
  process->emitData("bye\x1b");
  process->emitExit(0);
  REQUIRE(events == vector<string>({"bye", "\x1b", "exit"}));
}

TEST_CASE("No callback runs after kill", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  int dataCount = 0;
  int exitCount = 0;
  f.manager->onData([&dataCount](const string&) { dataCount++; });
  f.manager->onExit([&exitCount](const ExitStatus&) { exitCount++; });

  auto process = f.backend->last();
  f.manager->kill();
  REQUIRE(process->killCount == 1);
  REQUIRE(f.manager->getState() == SessionState::IDLE);

  process->emitLateEvents("late output", 0);
  REQUIRE(dataCount == 0);
  REQUIRE(exitCount == 0);
}

TEST_CASE("Kill is idempotent", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->kill();
  f.manager->spawn(f.options);
  auto process = f.backend->last();
  f.manager->kill();
  f.manager->kill();
  REQUIRE(process->killCount == 1);
  REQUIRE(!f.manager->isRunning());
}

TEST_CASE("Kill after exit does not signal the child", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  auto process = f.backend->last();
  process->emitExit(0);
  f.manager->kill();
  REQUIRE(process->killCount == 0);
  REQUIRE(f.manager->getState() == SessionState::IDLE);
}

TEST_CASE("Kill swallows errors from the child", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  auto process = f.backend->last();
  // The child died but its exit has not been delivered yet.
  process->running = false;
  REQUIRE_NOTHROW(f.manager->kill());
  REQUIRE(process->killCount == 1);
}

TEST_CASE("Spawning again replaces the session", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  string firstId = f.manager->getSessionId();
  int dataCount = 0;
  f.manager->onData([&dataCount](const string&) { dataCount++; });
  auto first = f.backend->last();

  f.manager->spawn(f.options);
  REQUIRE(first->killCount == 1);
  REQUIRE(f.backend->processes.size() == 2);
  REQUIRE(f.manager->getSessionId() != firstId);

  // Callbacks registered for the old session are gone.
  f.backend->last()->emitData("new");
  first->emitLateEvents("old", 0);
  REQUIRE(dataCount == 0);
}

TEST_CASE("A callback may kill the session", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->spawn(f.options);
  int secondCount = 0;
  f.manager->onData([&f](const string&) { f.manager->kill(); });
  f.manager->onData([&secondCount](const string&) { secondCount++; });

  f.backend->last()->emitData("x");
  REQUIRE(secondCount == 0);
  REQUIRE(f.manager->getState() == SessionState::IDLE);
}

TEST_CASE("Writes are forwarded to a live session", "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->write("ignored");
  f.manager->spawn(f.options);
  auto process = f.backend->last();

  f.manager->write("ls");
  f.manager->sendText(" -la");
  f.manager->sendCommand("");
  f.manager->sendCommand("claude");
  REQUIRE(process->written == "ls -la\rclaude\r");

  process->emitExit(0);
  f.manager->write("too late");
  REQUIRE(process->written == "ls -la\rclaude\r");
}

TEST_CASE("Resize reaches the child and is ignored after exit",
          "[PtySessionManager]") {
  ManagerFixture f;
  f.manager->resize(10, 10);
  f.manager->spawn(f.options);
  auto process = f.backend->last();

  f.manager->resize(100, 30);
  REQUIRE(process->sizes == vector<pair<int, int>>({{100, 30}}));

  process->emitExit(0);
  REQUIRE_NOTHROW(f.manager->resize(50, 20));
  REQUIRE(process->sizes.size() == 1);
}

TEST_CASE("Spawn failures leave no session", "[PtySessionManager]") {
  ManagerFixture f;

  SECTION("backend rejects the process") {
    f.backend->failure = "Executable not found: nope";
    REQUIRE_THROWS_AS(f.manager->spawn(f.options), SpawnFailure);
  }

  SECTION("command does not parse") {
    f.options.command = string("claude 'oops");
    REQUIRE_THROWS_AS(f.manager->spawn(f.options), CommandParseError);
    REQUIRE(f.backend->spawns.empty());
  }

  SECTION("missing working directory") {
    f.options.cwd = "";
    REQUIRE_THROWS_AS(f.manager->spawn(f.options), SpawnFailure);
  }

  SECTION("invalid size") {
    f.options.cols = 0;
    REQUIRE_THROWS_AS(f.manager->spawn(f.options), SpawnFailure);
  }

  REQUIRE(f.manager->getState() == SessionState::IDLE);
  REQUIRE(!f.manager->isRunning());
}

TEST_CASE("A missing pty capability is reported as a load failure",
          "[PtySessionManager]") {
  auto resolver =
      std::make_shared<PathResolver>(std::make_shared<FakeSubprocessUtils>());
  int loads = 0;
  PtySessionManager manager(resolver, [&loads]() -> shared_ptr<PtyBackend> {
    loads++;
    throw BindingLoadFailure("Cannot use the pseudo-terminal device");
  });

  SpawnOptions options;
  options.cwd = "/tmp";
  options.resolvedPath = string("/usr/bin");
  REQUIRE_THROWS_AS(manager.spawn(options), BindingLoadFailure);
  REQUIRE(manager.getState() == SessionState::IDLE);

  // Loading is retried on the next spawn, and callers that only handle
  // spawn failures still see it.
  REQUIRE_THROWS_AS(manager.spawn(options), SpawnFailure);
  REQUIRE(loads == 2);
}

TEST_CASE("State names", "[PtySessionManager]") {
  REQUIRE(string(sessionStateName(SessionState::IDLE)) == "idle");
  REQUIRE(string(sessionStateName(SessionState::RUNNING)) == "running");
  REQUIRE(string(sessionStateName(SessionState::EXITED)) == "exited");
}
