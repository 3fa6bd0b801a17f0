#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace pt;

TEST_CASE("RawFdUtils writeAll writes all data", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawFdUtils::setNonBlockingCloseOnExec(fds[1]);

  // Larger than a pipe buffer, so the non-blocking writer sees EAGAIN.
  const string payload(256 * 1024, 'x');
  string received;
  std::thread reader([&]() {
    char buf[4096];
    while (true) {
      ssize_t rc = ::read(fds[0], buf, sizeof(buf));
      if (rc <= 0) {
        break;
      }
      received.append(buf, rc);
    }
  });

  RawFdUtils::writeAll(fds[1], payload.data(), payload.size());
  ::close(fds[1]);
  reader.join();
  ::close(fds[0]);
  REQUIRE(received == payload);
}

TEST_CASE("RawFdUtils writeAll throws on a closed pipe", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Close the read end so writes will fail with EPIPE
  ::close(fds[0]);
  signal(SIGPIPE, SIG_IGN);

  const string payload = "test data";
  REQUIRE_THROWS(RawFdUtils::writeAll(fds[1], payload.data(), payload.size()));
  ::close(fds[1]);
}

TEST_CASE("RawFdUtils waitForReadable reports ready descriptors",
          "[RawFdUtils]") {
  int a[2];
  int b[2];
  REQUIRE(::pipe(a) == 0);
  REQUIRE(::pipe(b) == 0);

  REQUIRE(RawFdUtils::waitForReadable({a[0], b[0]}, 0).empty());

  REQUIRE(::write(b[1], "!", 1) == 1);
  REQUIRE(RawFdUtils::waitForReadable({a[0], -1, b[0]}, 100) ==
          vector<int>({b[0]}));

  // A hang up counts as readable.
  ::close(a[1]);
  auto readable = RawFdUtils::waitForReadable({a[0], b[0]}, 100);
  REQUIRE(readable.size() == 2);

  ::close(a[0]);
  ::close(b[0]);
  ::close(b[1]);
}

TEST_CASE("RawFdUtils waitForReadable times out with nothing to watch",
          "[RawFdUtils]") {
  auto start = std::chrono::steady_clock::now();
  REQUIRE(RawFdUtils::waitForReadable({-1}, 20).empty());
  REQUIRE(std::chrono::steady_clock::now() - start >=
          std::chrono::milliseconds(15));
}

TEST_CASE("RawFdUtils writeSome stops when the descriptor is full",
          "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawFdUtils::setNonBlockingCloseOnExec(fds[1]);

  const string payload(1024 * 1024, 'x');
  size_t written =
      RawFdUtils::writeSome(fds[1], payload.data(), payload.size());
  REQUIRE(written > 0);
  REQUIRE(written < payload.size());
  REQUIRE(RawFdUtils::writeSome(fds[1], payload.data(), payload.size()) == 0);

  // A full pipe is not writable; draining it makes it writable again.
  REQUIRE(RawFdUtils::waitForReady({}, {fds[1]}, 0).empty());
  char buf[64 * 1024];
  size_t drained = 0;
  while (drained < written) {
    ssize_t rc = ::read(fds[0], buf, sizeof(buf));
    REQUIRE(rc > 0);
    drained += rc;
  }
  REQUIRE(RawFdUtils::waitForReady({}, {fds[1]}, 100) ==
          vector<int>({fds[1]}));

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawFdUtils waitForReady lists a descriptor once",
          "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(::write(fds[1], "!", 1) == 1);

  REQUIRE(RawFdUtils::waitForReady({fds[0]}, {fds[0]}, 100) ==
          vector<int>({fds[0]}));
  auto ready = RawFdUtils::waitForReady({fds[0]}, {fds[1]}, 100);
  REQUIRE(ready.size() == 2);

  ::close(fds[0]);
  ::close(fds[1]);
}
