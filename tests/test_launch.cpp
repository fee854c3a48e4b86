// tests/test_launch.cpp
#include <doctest/doctest.h>

#include "FakeBackend.hpp"

#include <Ember/AuthState.hpp>
#include <Ember/LaunchCoordinator.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/VersionCatalog.hpp>

using Ember::LaunchOutcome;
using Ember::VersionType;
using EmberTests::FakeBackend;
using EmberTests::makeVersion;

namespace {

struct LaunchFixture {
    FakeBackend backend;
    Ember::StatusBoard status;
    Ember::AuthState auth;
    Ember::VersionCatalog catalog{backend, status};
    Ember::LaunchCoordinator coordinator{backend, auth, catalog, status};
    int loginPrompts = 0;

    LaunchFixture() {
        backend.manifest = {makeVersion("1.20.4", VersionType::RELEASE), makeVersion("24w14a", VersionType::SNAPSHOT)};
        auth.setLoginHandler([this] { ++loginPrompts; });
    }

    void signIn() { auth.setAccount(Ember::Account::makeOffline("Steve")); }
};

} // namespace

TEST_CASE_FIXTURE(LaunchFixture, "launching without an account asks for a login") {
    backend.installed = {"1.20.4"};
    REQUIRE(catalog.refresh());

    CHECK(coordinator.launch() == LaunchOutcome::NOT_AUTHENTICATED);
    CHECK(loginPrompts == 1);
    CHECK(auth.loginRequestCount() == 1);
    CHECK(status.current() == "Please login first!");
    CHECK(backend.startCalls.empty());
}

TEST_CASE_FIXTURE(LaunchFixture, "launching with no version selected") {
    signIn();
    REQUIRE(catalog.refresh());
    REQUIRE(catalog.selectedVersion().empty());

    CHECK(coordinator.launch() == LaunchOutcome::NO_VERSION_SELECTED);
    CHECK(status.current() == "Please select a version!");
    CHECK(backend.startCalls.empty());
    CHECK(loginPrompts == 0);
}

TEST_CASE_FIXTURE(LaunchFixture, "launching an unknown version") {
    signIn();
    REQUIRE(catalog.refresh());
    catalog.select("1.99");

    CHECK(coordinator.launch() == LaunchOutcome::UNKNOWN_VERSION);
    CHECK(status.current() == "Version 1.99 is not installed or unknown");
    CHECK(backend.startCalls.empty());
}

TEST_CASE_FIXTURE(LaunchFixture, "a successful launch shows the backend's message as-is") {
    signIn();
    backend.installed = {"1.20.4"};
    backend.startResult = "Launched 1.20.4 (pid 4242)";
    REQUIRE(catalog.refresh());

    std::vector<std::string> seen;
    status.setListener([&](const std::string& s) { seen.push_back(s); });

    CHECK(coordinator.launch() == LaunchOutcome::LAUNCHED);
    CHECK(backend.startCalls == std::vector<std::string>{"1.20.4"});
    CHECK(seen == std::vector<std::string>{"Preparing to launch 1.20.4...", "Launched 1.20.4 (pid 4242)"});
}

TEST_CASE_FIXTURE(LaunchFixture, "a failed launch reports the error") {
    signIn();
    REQUIRE(catalog.refresh());
    catalog.select("24w14a");
    backend.startError = "Java executable not found at: /nope";

    CHECK(coordinator.launch() == LaunchOutcome::FAILED);
    CHECK(backend.startCalls.size() == 1);
    CHECK(status.current() == "Error: Java executable not found at: /nope");
}

TEST_CASE("launch outcome names") {
    CHECK(Ember::launch_outcome_to_string(LaunchOutcome::LAUNCHED) == "launched");
    CHECK(Ember::launch_outcome_to_string(LaunchOutcome::NOT_AUTHENTICATED) == "not_authenticated");
}
