/**
 * @file test_io_poller.cpp
 * @brief Tests for io_poller.hpp
 */

#include "hive/io_poller.hpp"

#include <catch2/catch.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <thread>

TEST_CASE("IoPoller reports readable socket", "[io_poller]") {
  hive::IoPoller poller;
  REQUIRE(poller.IsValid());
  int sv[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
  REQUIRE(poller.Add(sv[0], static_cast<uint8_t>(hive::IoEvent::kReadable))
              .has_value());

  auto none = poller.Wait(0);
  REQUIRE(none.has_value());
  REQUIRE(none.value() == 0U);

  REQUIRE(::write(sv[1], "x", 1) == 1);
  auto one = poller.Wait(1000);
  REQUIRE(one.has_value());
  REQUIRE(one.value() == 1U);
  REQUIRE(poller.Results()[0].fd == sv[0]);
  REQUIRE(hive::HasEvent(poller.Results()[0].events, hive::IoEvent::kReadable));

  REQUIRE(poller.Remove(sv[0]).has_value());
  auto after = poller.Wait(0);
  REQUIRE(after.value() == 0U);
  ::close(sv[0]);
  ::close(sv[1]);
}

TEST_CASE("IoPoller Wait honours timeout", "[io_poller]") {
  hive::IoPoller poller;
  const uint64_t start = hive::SteadyNowUs();
  auto r = poller.Wait(30);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
  REQUIRE(hive::SteadyNowUs() - start >= 20000U);
}

TEST_CASE("IoPoller Remove of unknown fd fails", "[io_poller]") {
  hive::IoPoller poller;
  auto r = poller.Remove(12345);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hive::PollerError::kRemoveFailed);
}

TEST_CASE("Waker wakes a blocked Wait from another thread", "[io_poller]") {
  hive::IoPoller poller;
  hive::Waker waker;
  REQUIRE(waker.IsValid());
  REQUIRE(poller.Add(waker.Fd(), static_cast<uint8_t>(hive::IoEvent::kReadable))
              .has_value());

  std::thread t([&waker] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    waker.Notify();
  });
  auto r = poller.Wait(5000);
  t.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(poller.Results()[0].fd == waker.Fd());

  waker.Drain();
  REQUIRE(poller.Wait(0).value() == 0U);
}

TEST_CASE("Waker coalesces notifications", "[io_poller]") {
  hive::IoPoller poller;
  hive::Waker waker;
  REQUIRE(poller.Add(waker.Fd(), static_cast<uint8_t>(hive::IoEvent::kReadable))
              .has_value());
  for (int i = 0; i < 100; ++i) waker.Notify();
  REQUIRE(poller.Wait(0).value() == 1U);
  waker.Drain();
  REQUIRE(poller.Wait(0).value() == 0U);
}
