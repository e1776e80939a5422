/**
 * @file test_process.cpp
 * @brief Tests for process.hpp
 */

#include "hive/process.hpp"

#include <catch2/catch.hpp>

#include <csignal>
#include <cstring>

#include <string>

#include <unistd.h>

TEST_CASE("Fork reports the child exit code", "[process]") {
  auto child = hive::ChildProcess::Fork([](int) { return 3; });
  REQUIRE(child.has_value());
  hive::ChildProcess& cp = child.value();
  REQUIRE(cp.Valid());
  REQUIRE(cp.Fd() >= 0);

  hive::ExitStatus st = cp.WaitFor(0);
  REQUIRE(cp.Reaped());
  REQUIRE(st.exited);
  REQUIRE(st.exit_code == 3);
  REQUIRE(st.Describe() == "exitcode 3");
}

TEST_CASE("Kill reports SIGKILL", "[process]") {
  auto child = hive::ChildProcess::Fork([](int) {
    for (;;) ::pause();
    return 0;
  });
  REQUIRE(child.has_value());
  hive::ChildProcess& cp = child.value();
  REQUIRE(hive::IsProcessAlive(cp.Pid()));

  hive::ExitStatus st = cp.Kill();
  REQUIRE(st.signaled);
  REQUIRE(st.term_signal == SIGKILL);
  REQUIRE(st.Describe() == "signal 9 (SIGKILL)");
}

TEST_CASE("WaitFor times out on a running child", "[process]") {
  auto child = hive::ChildProcess::Fork([](int) {
    for (;;) ::pause();
    return 0;
  });
  REQUIRE(child.has_value());
  hive::ExitStatus st = child.value().WaitFor(20);
  REQUIRE(st.timed_out);
  REQUIRE(st.Describe() == "still running");
  REQUIRE(!child.value().Reaped());
}

TEST_CASE("Control socket carries bytes both ways", "[process]") {
  auto child = hive::ChildProcess::Fork([](int fd) {
    char buf[16];
    size_t got = 0;
    while (got < 4U) {
      auto r = hive::ReadSome(fd, buf + got, 4U - got);
      if (!r) return 1;
      got += r.value();
    }
    if (std::memcmp(buf, "ping", 4) != 0) return 2;
    return hive::WriteAll(fd, "pong", 4) ? 0 : 3;
  });
  REQUIRE(child.has_value());
  hive::ChildProcess& cp = child.value();
  REQUIRE(hive::WriteAll(cp.Fd(), "ping", 4).has_value());

  char reply[4];
  size_t got = 0;
  while (got < 4U) {
    auto r = hive::ReadSome(cp.Fd(), reply + got, 4U - got);
    REQUIRE(r.has_value());
    got += r.value();
  }
  REQUIRE(std::string(reply, 4) == "pong");

  auto eof = hive::ReadSome(cp.Fd(), reply, sizeof(reply));
  REQUIRE(!eof.has_value());
  REQUIRE(eof.get_error() == hive::ProcessError::kPeerClosed);
  REQUIRE(cp.WaitFor(0).exit_code == 0);
}

TEST_CASE("CloseChannel gives the child EOF", "[process]") {
  auto child = hive::ChildProcess::Fork([](int fd) {
    char c;
    auto r = hive::ReadSome(fd, &c, 1);
    return (!r && r.get_error() == hive::ProcessError::kPeerClosed) ? 7 : 1;
  });
  REQUIRE(child.has_value());
  child.value().CloseChannel();
  REQUIRE(child.value().WaitFor(0).exit_code == 7);
}

TEST_CASE("Spawn of a missing executable fails with kExecFailed",
          "[process]") {
  hive::SpawnSpec spec;
  spec.executable = "/nonexistent/hive-child";
  auto r = hive::ChildProcess::Spawn(spec);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hive::ProcessError::kExecFailed);
}

TEST_CASE("Spawn runs an executable with the channel fd in its env",
          "[process]") {
  hive::SpawnSpec spec;
  spec.executable = "/bin/sh";
  spec.args = {"-c", "test -n \"$HIVE_CHILD_FD\" && test \"$EXTRA\" = yes"};
  spec.env.emplace_back("EXTRA", "yes");
  auto r = hive::ChildProcess::Spawn(spec);
  REQUIRE(r.has_value());
  hive::ExitStatus st = r.value().WaitFor(0);
  REQUIRE(st.exited);
  REQUIRE(st.exit_code == 0);
}

TEST_CASE("ReadRssBytes of self", "[process]") {
#if defined(__linux__)
  auto rss = hive::ReadRssBytes(::getpid());
  REQUIRE(rss.has_value());
  REQUIRE(*rss > 0U);
#endif
  REQUIRE(!hive::IsProcessAlive(-1));
}
