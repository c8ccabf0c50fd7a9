// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for harness/driver - the liveness polling loop

#include <catch2/catch_test_macros.hpp>
#include "harness/driver.hpp"
#include "network/proxy.hpp"
#include <thread>

using namespace dropnet;
using namespace dropnet::harness;
using namespace std::chrono_literals;

namespace {

DriverConfig FastConfig(std::chrono::milliseconds timeout = 300ms) {
    DriverConfig config;
    config.timeout = timeout;
    config.poll_interval = 10ms;
    return config;
}

} // namespace

TEST_CASE("DriverConfig - validation", "[harness][driver]") {
    LivenessGate gate;

    DriverConfig zero_timeout = FastConfig(0ms);
    REQUIRE_THROWS_AS(zero_timeout.Validate(), std::invalid_argument);

    DriverConfig zero_poll = FastConfig();
    zero_poll.poll_interval = 0ms;
    REQUIRE_THROWS_AS(Driver(gate, nullptr, zero_poll), std::invalid_argument);

    REQUIRE(DriverConfig{}.timeout == 90s);
    REQUIRE(DriverConfig{}.poll_interval == 1s);
}

TEST_CASE("Driver - success", "[harness][driver]") {
    LivenessGate gate;
    Driver driver(gate, nullptr, FastConfig(5s));

    SECTION("Already latched at start") {
        auto outcome = driver.run([&] {
            gate.update_best_height(12);
            gate.set_success();
        });
        REQUIRE(driver.state() == DriverState::SUCCEEDED);
        REQUIRE(outcome.best_height == 12);
        REQUIRE(outcome.elapsed < 1s);
    }

    SECTION("Latched later by another thread") {
        std::thread writer;
        auto outcome = driver.run([&] {
            writer = std::thread([&] {
                std::this_thread::sleep_for(50ms);
                gate.update_best_height(10);
                gate.set_success();
            });
        });
        writer.join();
        REQUIRE(driver.state() == DriverState::SUCCEEDED);
        REQUIRE(outcome.best_height == 10);
        REQUIRE(outcome.elapsed >= 40ms);
    }
}

TEST_CASE("Driver - timeout", "[harness][driver]") {
    LivenessGate gate;
    gate.update_best_height(4);
    Driver driver(gate, nullptr, FastConfig(200ms));

    const auto begin = std::chrono::steady_clock::now();
    try {
        driver.run([] {});
        FAIL("expected LivenessTimeout");
    } catch (const LivenessTimeout &e) {
        REQUIRE(e.best_height() == 4);
        REQUIRE(e.elapsed() >= 200ms);
        REQUIRE(std::string(e.what()).find("best height 4") != std::string::npos);
    }
    const auto took = std::chrono::steady_clock::now() - begin;

    REQUIRE(took >= 200ms);
    // timeout + one poll interval, plus scheduling slack
    REQUIRE(took < 200ms + 10ms + 500ms);
    REQUIRE(driver.state() == DriverState::FAILED);
}

TEST_CASE("Driver - clock starts after the start action", "[harness][driver]") {
    LivenessGate gate;
    Driver driver(gate, nullptr, FastConfig(100ms));

    try {
        driver.run([] { std::this_thread::sleep_for(200ms); });
        FAIL("expected LivenessTimeout");
    } catch (const LivenessTimeout &e) {
        // A slow start does not eat into the liveness deadline
        REQUIRE(e.elapsed() >= 100ms);
        REQUIRE(e.elapsed() < 200ms + 500ms);
    }
}

TEST_CASE("Driver - start failure propagates", "[harness][driver]") {
    LivenessGate gate;
    Driver driver(gate, nullptr, FastConfig());

    REQUIRE_THROWS_AS(driver.run([] { throw std::runtime_error("cannot start"); }),
                      std::runtime_error);
    REQUIRE(driver.state() == DriverState::FAILED);
}

TEST_CASE("Driver - intercept fault is rethrown", "[harness][driver]") {
    LivenessGate gate;
    network::InterceptFault fault;
    Driver driver(gate, &fault, FastConfig(5s));

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(driver.run([&] {
        fault.record(std::make_exception_ptr(network::InterceptError(0, 1, "bad handler")));
    }), network::InterceptError);
    REQUIRE(std::chrono::steady_clock::now() - begin < 1s);
    REQUIRE(driver.state() == DriverState::FAILED);
}

TEST_CASE("Driver - success wins over a fault in the same tick", "[harness][driver]") {
    LivenessGate gate;
    network::InterceptFault fault;
    Driver driver(gate, &fault, FastConfig(5s));

    REQUIRE_NOTHROW(driver.run([&] {
        gate.set_success();
        fault.record(std::make_exception_ptr(network::InterceptError(0, 1, "late")));
    }));
    REQUIRE(driver.state() == DriverState::SUCCEEDED);
}

TEST_CASE("DriverStateName", "[harness][driver]") {
    REQUIRE(std::string(DriverStateName(DriverState::RUNNING)) == "RUNNING");
    REQUIRE(std::string(DriverStateName(DriverState::FAILED)) == "FAILED");
}
