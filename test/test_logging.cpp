// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <cstdlib>
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    dropnet::util::LogManager::Initialize(level, false, "");
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    dropnet::util::LogManager::Shutdown();
}

namespace {

// Logging is silent unless DROPNET_TEST_LOGLEVEL names a level
class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        const char* level = std::getenv("DROPNET_TEST_LOGLEVEL");
        InitializeTestLogging(level ? level : "off");
    }

    void testRunEnded(Catch::TestRunStats const&) override {
        ShutdownTestLogging();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
