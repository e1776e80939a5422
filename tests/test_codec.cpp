/**
 * @file test_codec.cpp
 * @brief Tests for codec.hpp
 */

#include "hive/codec.hpp"

#include <catch2/catch.hpp>

#include <string>

TEST_CASE("DecodeTaskMessage with all fields", "[codec]") {
  const std::string body = R"({
    "id": "a1", "task": "tasks.add", "args": [2, 3], "kwargs": {"x": 1},
    "retries": 2, "eta": 1735689600000, "expires": 1735689700000,
    "origin": "host-a", "priority": 5, "routing_key": "rk",
    "soft_time_limit_ms": 100, "time_limit_ms": 200})";
  auto r = hive::DecodeTaskMessage(body);
  REQUIRE(r.has_value());
  const hive::TaskRequest& req = r.value();
  REQUIRE(req.id == "a1");
  REQUIRE(req.task == "tasks.add");
  REQUIRE(hive::json::parse(req.args_json) == hive::json::array({2, 3}));
  REQUIRE(hive::json::parse(req.kwargs_json)["x"] == 1);
  REQUIRE(req.retries == 2U);
  REQUIRE(req.eta_ms == 1735689600000ULL);
  REQUIRE(req.expires_ms == 1735689700000ULL);
  REQUIRE(req.origin == "host-a");
  REQUIRE(req.priority == 5U);
  REQUIRE(req.routing_key == "rk");
  REQUIRE(req.soft_time_limit_ms == 100U);
  REQUIRE(req.hard_time_limit_ms == 200U);
}

TEST_CASE("DecodeTaskMessage defaults optional fields", "[codec]") {
  auto r = hive::DecodeTaskMessage(R"({"id": "x", "task": "t"})");
  REQUIRE(r.has_value());
  REQUIRE(r.value().args_json == "[]");
  REQUIRE(r.value().kwargs_json == "{}");
  REQUIRE(r.value().retries == 0U);
  REQUIRE(r.value().eta_ms == 0U);
  REQUIRE(r.value().expires_ms == 0U);
}

TEST_CASE("DecodeTaskMessage rejects bad input", "[codec]") {
  using hive::CodecError;
  REQUIRE(hive::DecodeTaskMessage("not json").get_error() ==
          CodecError::kMalformed);
  REQUIRE(hive::DecodeTaskMessage("[1, 2]").get_error() ==
          CodecError::kMalformed);
  REQUIRE(hive::DecodeTaskMessage(R"({"task": "t"})").get_error() ==
          CodecError::kMissingField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "", "task": "t"})").get_error() ==
          CodecError::kMissingField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": 5, "task": "t"})").get_error() ==
          CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "args": {}})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "retries": -1})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "priority": 300})")
              .get_error() == CodecError::kInvalidField);
}

TEST_CASE("DecodeTaskMessage rejects out-of-range and fractional numbers",
          "[codec]") {
  using hive::CodecError;
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "retries": 1e300})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "eta": 1e300})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(
              R"({"id": "x", "task": "t", "eta": 18446744073709551616.0})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "expires": 1.5})")
              .get_error() == CodecError::kInvalidField);
  REQUIRE(hive::DecodeTaskMessage(R"({"id": "x", "task": "t", "retries": 0.25})")
              .get_error() == CodecError::kInvalidField);

  // Whole-valued floats are accepted.
  auto r = hive::DecodeTaskMessage(
      R"({"id": "x", "task": "t", "retries": 3.0, "eta": 1735689600000.0})");
  REQUIRE(r.has_value());
  REQUIRE(r.value().retries == 3U);
  REQUIRE(r.value().eta_ms == 1735689600000ULL);
}

TEST_CASE("EncodeTaskMessage is decodable with bumped retries", "[codec]") {
  hive::TaskRequest req;
  req.id = "r";
  req.task = "t";
  req.args_json = "[1]";
  req.retries = 4;
  req.eta_ms = 99;
  auto back = hive::DecodeTaskMessage(hive::EncodeTaskMessage(req));
  REQUIRE(back.has_value());
  REQUIRE(back.value().retries == 4U);
  REQUIRE(back.value().eta_ms == 99U);
  REQUIRE(back.value().args_json == "[1]");
}

TEST_CASE("Child request carries the soft limit", "[codec]") {
  hive::TaskRequest req;
  req.id = "c";
  req.task = "t";
  uint64_t soft = 0;
  auto r = hive::DecodeChildRequest(hive::EncodeChildRequest(req, 1500), &soft);
  REQUIRE(r.has_value());
  REQUIRE(soft == 1500U);
  REQUIRE(r.value().id == "c");
}

TEST_CASE("Child reply kinds", "[codec]") {
  SECTION("success") {
    auto r = hive::DecodeChildReply(hive::EncodeChildReply(
        "a", hive::TaskResult::Success(hive::json{{"k", "v"}}), 42));
    REQUIRE(r.has_value());
    REQUIRE(r.value().id == "a");
    REQUIRE(r.value().runtime_us == 42U);
    REQUIRE(r.value().result.kind == hive::TaskResult::Kind::kSuccess);
    REQUIRE(r.value().result.value["k"] == "v");
  }
  SECTION("failure keeps retryable") {
    auto r = hive::DecodeChildReply(hive::EncodeChildReply(
        "b", hive::TaskResult::Failure("ValueError", "bad", false), 1));
    REQUIRE(r.value().result.kind == hive::TaskResult::Kind::kFailure);
    REQUIRE(r.value().result.error.type == "ValueError");
    REQUIRE(!r.value().result.error.retryable);
  }
  SECTION("retry keeps the countdown") {
    auto r = hive::DecodeChildReply(hive::EncodeChildReply(
        "c", hive::TaskResult::Retry(300, hive::TaskError{"X", "y", true}), 1));
    REQUIRE(r.value().result.kind == hive::TaskResult::Kind::kRetry);
    REQUIRE(r.value().result.countdown_ms == 300U);
  }
  SECTION("malformed") {
    REQUIRE(hive::DecodeChildReply("{").get_error() ==
            hive::CodecError::kMalformed);
    REQUIRE(hive::DecodeChildReply(R"({"id": "x", "kind": "other"})")
                .get_error() == hive::CodecError::kInvalidField);
    REQUIRE(hive::DecodeChildReply(R"({"id": "x", "kind": "failure"})")
                .get_error() == hive::CodecError::kInvalidField);
  }
}

TEST_CASE("FrameReader reassembles split frames", "[codec]") {
  std::string wire;
  hive::AppendFrame(wire, "hello");
  hive::AppendFrame(wire, "");
  hive::AppendFrame(wire, "world!");

  hive::FrameReader reader;
  std::string frame;
  for (char c : wire) {
    reader.Feed(&c, 1);
  }
  REQUIRE(reader.Next(&frame));
  REQUIRE(frame == "hello");
  REQUIRE(reader.Next(&frame));
  REQUIRE(frame.empty());
  REQUIRE(reader.Next(&frame));
  REQUIRE(frame == "world!");
  REQUIRE(!reader.Next(&frame));
  REQUIRE(reader.Buffered() == 0U);
}

TEST_CASE("FrameReader waits for a complete frame", "[codec]") {
  std::string wire;
  hive::AppendFrame(wire, "abcdef");
  hive::FrameReader reader;
  reader.Feed(wire.data(), 7);
  std::string frame;
  REQUIRE(!reader.Next(&frame));
  reader.Feed(wire.data() + 7, wire.size() - 7);
  REQUIRE(reader.Next(&frame));
  REQUIRE(frame == "abcdef");
}

TEST_CASE("FrameReader fails on oversized frames", "[codec]") {
  const char hdr[4] = {'\x7F', '\xFF', '\xFF', '\xFF'};
  hive::FrameReader reader;
  reader.Feed(hdr, 4);
  std::string frame;
  REQUIRE(!reader.Next(&frame));
  REQUIRE(reader.Failed());
  reader.Reset();
  REQUIRE(!reader.Failed());
}
