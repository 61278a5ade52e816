/**
 * @file test_address_waiter.cpp
 * @brief Tests for address_waiter.hpp - TimedPoll and IPv4 readiness.
 */

#include "recon/address_waiter.hpp"

#include "fake_control_plane.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <optional>

using recon::AddressMap;
using recon::AddressWaiter;
using recon::InterfaceAddress;
using recon::testing::FakeClock;
using recon::testing::FakeControlPlane;
using recon::testing::MakeNetwork;

namespace {

const InterfaceAddress kV4{"inet", "10.0.0.5"};
const InterfaceAddress kV4b{"inet", "10.0.1.7"};
const InterfaceAddress kV6{"inet6", "fd42::5"};
const InterfaceAddress kLo{"inet", "127.0.0.1"};

constexpr std::chrono::milliseconds kInterval{1000};

}  // namespace

// ============================================================================
// Readiness helpers
// ============================================================================

TEST_CASE("Ipv4Addresses skips loopback and IPv6", "[waiter][addresses]") {
  AddressMap m = AddressWaiter::Ipv4Addresses(
      MakeNetwork({{"eth0", {kV6, kV4}}, {"lo", {kLo}}, {"eth1", {kV6}}}));
  REQUIRE(m.size() == 2);
  REQUIRE(m["eth0"] == std::vector<std::string>{"10.0.0.5"});
  REQUIRE(m["eth1"].empty());
  REQUIRE(m.count("lo") == 0);
}

TEST_CASE("HasAllIpv4 requires every device", "[waiter][addresses]") {
  REQUIRE(!AddressWaiter::HasAllIpv4(AddressMap{}));
  REQUIRE(!AddressWaiter::HasAllIpv4(
      AddressMap{{"eth0", {"10.0.0.5"}}, {"eth1", {}}}));
  REQUIRE(AddressWaiter::HasAllIpv4(
      AddressMap{{"eth0", {"10.0.0.5"}}, {"eth1", {"10.0.1.7"}}}));
}

// ============================================================================
// TimedPoll
// ============================================================================

TEST_CASE("TimedPoll returns the first ready value", "[waiter][poll]") {
  FakeClock clock;
  recon::TimedPoll poll(std::chrono::seconds(10), kInterval, clock);
  int probes = 0;
  auto r = poll.Run<int>("answer", [&probes]() {
    ++probes;
    if (probes < 3) return recon::Result<std::optional<int>>::success(std::nullopt);
    return recon::Result<std::optional<int>>::success(42);
  });
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 42);
  REQUIRE(probes == 3);
  REQUIRE(clock.sleeps() == 3);
}

TEST_CASE("TimedPoll times out", "[waiter][poll]") {
  FakeClock clock;
  recon::TimedPoll poll(std::chrono::seconds(5), kInterval, clock);
  auto r = poll.Run<int>("answer", []() {
    return recon::Result<std::optional<int>>::success(std::nullopt);
  });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kTimeout);
  REQUIRE(r.get_error().message == "timeout waiting for answer");
  REQUIRE(clock.sleeps() == 5);
}

TEST_CASE("TimedPoll with zero timeout never probes", "[waiter][poll]") {
  FakeClock clock;
  recon::TimedPoll poll(std::chrono::seconds(0), kInterval, clock);
  int probes = 0;
  auto r = poll.Run<int>("answer", [&probes]() {
    ++probes;
    return recon::Result<std::optional<int>>::success(1);
  });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kTimeout);
  REQUIRE(probes == 0);
}

TEST_CASE("TimedPoll propagates a probe error", "[waiter][poll]") {
  FakeClock clock;
  recon::TimedPoll poll(std::chrono::seconds(10), kInterval, clock);
  auto r = poll.Run<int>("answer", []() {
    return recon::Result<std::optional<int>>::error(
        recon::MakeError(recon::ErrorKind::kTransport, "connection reset"));
  });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kTransport);
  REQUIRE(clock.sleeps() == 1);
}

TEST_CASE("TimedPoll honours an already raised cancel flag", "[waiter][cancel]") {
  FakeClock clock;
  std::atomic<bool> cancel{true};
  recon::TimedPoll poll(std::chrono::seconds(10), kInterval, clock, &cancel);
  int probes = 0;
  auto r = poll.Run<int>("answer", [&probes]() {
    ++probes;
    return recon::Result<std::optional<int>>::success(1);
  });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kCancelled);
  REQUIRE(probes == 0);
  REQUIRE(clock.sleeps() == 0);
}

// ============================================================================
// AddressWaiter
// ============================================================================

TEST_CASE("Await succeeds once all devices have IPv4", "[waiter][await]") {
  FakeControlPlane cp;
  cp.SetNetworkStates({
      MakeNetwork({{"eth0", {kV6}}, {"lo", {kLo}}}),
      MakeNetwork({{"eth0", {kV6, kV4}}, {"eth1", {}}, {"lo", {kLo}}}),
      MakeNetwork({{"eth0", {kV6, kV4}}, {"eth1", {kV4b}}, {"lo", {kLo}}}),
  });
  FakeClock clock;
  AddressWaiter waiter(cp, clock, nullptr, kInterval);

  auto r = waiter.Await("web1", 30);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 2);
  REQUIRE(r.value().at("eth0") == std::vector<std::string>{"10.0.0.5"});
  REQUIRE(r.value().at("eth1") == std::vector<std::string>{"10.0.1.7"});
  REQUIRE(cp.fetch_state_calls() == 3);
}

TEST_CASE("Await never reports a partial result", "[waiter][await]") {
  FakeControlPlane cp;
  cp.SetNetworkStates({MakeNetwork({{"eth0", {kV4}}, {"eth1", {kV6}}})});
  FakeClock clock;
  AddressWaiter waiter(cp, clock, nullptr, kInterval);

  auto r = waiter.Await("web1", 4);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kTimeout);
  REQUIRE(r.get_error().message == "timeout waiting for addresses");
  REQUIRE(cp.fetch_state_calls() == 4);
}

TEST_CASE("Await treats loopback-only as not ready", "[waiter][await]") {
  FakeControlPlane cp;
  cp.SetNetworkStates({MakeNetwork({{"lo", {kLo}}})});
  FakeClock clock;
  AddressWaiter waiter(cp, clock, nullptr, kInterval);
  auto r = waiter.Await("web1", 2);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kTimeout);
}

TEST_CASE("Await stops on a fetch error", "[waiter][await]") {
  FakeControlPlane cp;
  cp.FailOn("FetchState",
            recon::MakeError(recon::ErrorKind::kApi, "forbidden", 403));
  FakeClock clock;
  AddressWaiter waiter(cp, clock, nullptr, kInterval);
  auto r = waiter.Await("web1", 30);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kApi);
  REQUIRE(r.get_error().status_code == 403);
}

TEST_CASE("Await is interrupted by the cancel flag", "[waiter][cancel]") {
  FakeControlPlane cp;
  cp.SetNetworkStates({MakeNetwork({{"eth0", {kV6}}})});
  FakeClock clock;
  std::atomic<bool> cancel{false};
  clock.OnSleep(
      [](uint32_t sleeps, void* ctx) {
        if (sleeps == 2) static_cast<std::atomic<bool>*>(ctx)->store(true);
      },
      &cancel);
  AddressWaiter waiter(cp, clock, &cancel, kInterval);

  auto r = waiter.Await("web1", 30);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kCancelled);
  REQUIRE(cp.fetch_state_calls() == 1);
}
