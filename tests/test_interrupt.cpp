/**
 * @file test_interrupt.cpp
 * @brief Tests for interrupt.hpp
 */

#include "recon/interrupt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>

TEST_CASE("InterruptGuard starts clear", "[interrupt]") {
  recon::InterruptGuard guard;
  REQUIRE(guard.IsValid());
  REQUIRE(!guard.IsRequested());
  REQUIRE(!guard.Flag().load());
  REQUIRE(guard.Signal() == 0);
}

TEST_CASE("InterruptGuard manual request", "[interrupt]") {
  recon::InterruptGuard guard;
  guard.Request();
  REQUIRE(guard.IsRequested());
  REQUIRE(guard.Flag().load());
  REQUIRE(guard.Signal() == 0);
}

TEST_CASE("InterruptGuard only one instance is active", "[interrupt]") {
  recon::InterruptGuard first;
  recon::InterruptGuard second;
  REQUIRE(first.IsValid());
  REQUIRE(!second.IsValid());

  auto r = second.Install();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kSettings);
}

TEST_CASE("InterruptGuard catches SIGINT", "[interrupt][signal]") {
  recon::InterruptGuard guard;
  auto r = guard.Install();
  REQUIRE(r.has_value());

  REQUIRE(std::raise(SIGINT) == 0);
  REQUIRE(guard.IsRequested());
  REQUIRE(guard.Signal() == SIGINT);
}

TEST_CASE("InterruptGuard catches SIGTERM", "[interrupt][signal]") {
  recon::InterruptGuard guard;
  REQUIRE(guard.Install().has_value());
  REQUIRE(std::raise(SIGTERM) == 0);
  REQUIRE(guard.Signal() == SIGTERM);
}

TEST_CASE("InterruptGuard restores previous handlers", "[interrupt][signal]") {
  struct sigaction before {};
  REQUIRE(::sigaction(SIGINT, nullptr, &before) == 0);
  {
    recon::InterruptGuard guard;
    REQUIRE(guard.Install().has_value());
    struct sigaction during {};
    REQUIRE(::sigaction(SIGINT, nullptr, &during) == 0);
    REQUIRE((during.sa_handler != before.sa_handler));
  }
  struct sigaction after {};
  REQUIRE(::sigaction(SIGINT, nullptr, &after) == 0);
  REQUIRE((after.sa_handler == before.sa_handler));
}

TEST_CASE("A new guard may be created after the first is gone", "[interrupt]") {
  { recon::InterruptGuard first; }
  recon::InterruptGuard second;
  REQUIRE(second.IsValid());
}
