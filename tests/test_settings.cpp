// tests/test_settings.cpp
#include <doctest/doctest.h>

#include "FakeBackend.hpp"
#include "TempDir.hpp"

#include <Ember/SettingsManager.hpp>
#include <Ember/SettingsStore.hpp>
#include <Ember/StatusBoard.hpp>

#include <fstream>

using Ember::LauncherConfig;
using EmberTests::FakeBackend;
using EmberTests::TempDir;

TEST_CASE("settings JSON keeps defaults for missing keys") {
    const LauncherConfig config = LauncherConfig::from_json(nlohmann::json::object());
    CHECK(config == LauncherConfig{});
    CHECK(config.minMemory == 1024);
    CHECK(config.maxMemory == 2048);
    CHECK(config.javaPath == "java");
    CHECK(config.theme == "dark");
    CHECK(config.requestTimeoutMs == 30000);
    CHECK_FALSE(config.gameDir.has_value());
}

TEST_CASE("settings JSON clamps out of range values") {
    const LauncherConfig config =
        LauncherConfig::from_json({{"min_memory", 4096}, {"max_memory", 2048}, {"download_threads", 0}});
    CHECK(config.minMemory == 2048);
    CHECK(config.maxMemory == 2048);
    CHECK(config.downloadThreads == 1);
}

TEST_CASE("settings JSON uses snake_case keys") {
    LauncherConfig config;
    config.javaPath = "/usr/lib/jvm/java-21/bin/java";
    config.gameDir = "/srv/minecraft";
    const auto j = config.to_json();
    CHECK(j.at("java_path") == "/usr/lib/jvm/java-21/bin/java");
    CHECK(j.at("game_dir") == "/srv/minecraft");
    CHECK(j.contains("request_timeout_ms"));
    CHECK(LauncherConfig::from_json(j) == config);
}

TEST_CASE("loading settings with an unsupported theme pins it and saves once") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.settings.theme = "light";
    backend.settings.maxMemory = 4096;

    Ember::SettingsManager manager(backend, status);
    REQUIRE(manager.load());
    CHECK(manager.settings().theme == "dark");
    CHECK(manager.settings().maxMemory == 4096);
    CHECK(backend.saveCount == 1);
    CHECK(backend.settings.theme == "dark");

    REQUIRE(manager.load());
    CHECK(backend.saveCount == 1);
}

TEST_CASE("settings load and save failures") {
    FakeBackend backend;
    Ember::StatusBoard status;
    Ember::SettingsManager manager(backend, status);

    backend.settingsError = "disk full";
    CHECK_FALSE(manager.load());
    CHECK(manager.settings() == LauncherConfig{});

    CHECK_FALSE(manager.save());
    CHECK(status.current() == "Error saving settings: disk full");

    backend.settingsError.reset();
    CHECK(manager.save());
    CHECK(status.current() == "Settings saved!");
}

TEST_CASE("settings file round trip") {
    TempDir dir("settings");
    Ember::SettingsStore store(dir.path() / "nested" / "settings.json");

    CHECK(store.load() == LauncherConfig{});

    LauncherConfig config;
    config.width = 1920;
    config.height = 1080;
    config.downloadThreads = 8;
    config.gameDir = (dir.path() / "game").string();
    store.save(config);

    CHECK(std::filesystem::exists(dir.path() / "nested" / "settings.json"));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "nested" / "settings.json.tmp"));
    CHECK(store.load() == config);
}

TEST_CASE("a corrupt settings file is an error") {
    TempDir dir("settings-corrupt");
    const auto file = dir.path() / "settings.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    Ember::SettingsStore store(file);
    CHECK_THROWS_AS(store.load(), Ember::BackendError);
}
