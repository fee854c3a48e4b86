// tests/test_services.cpp
#include <doctest/doctest.h>

#include "TempDir.hpp"

#include <Ember/Backend.hpp>
#include <Ember/Config.hpp>
#include <Ember/DownloadQueue.hpp>
#include <Ember/FabricInstaller.hpp>
#include <Ember/ForgeInstaller.hpp>
#include <Ember/GameInstaller.hpp>
#include <Ember/GameLauncher.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/JavaDownloader.hpp>
#include <Ember/JavaManager.hpp>
#include <Ember/VersionRepository.hpp>

#include <algorithm>
#include <fstream>
#include <memory>

using nlohmann::json;
using EmberTests::TempDir;

namespace {

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

bool contains(const std::vector<std::string>& haystack, const std::string& needle) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

long indexOf(const std::vector<std::string>& haystack, const std::string& needle) {
    auto it = std::find(haystack.begin(), haystack.end(), needle);
    return it == haystack.end() ? -1 : static_cast<long>(it - haystack.begin());
}

} // namespace

TEST_CASE("version manifest parsing") {
    const json manifest = json::parse(R"({
        "latest": {"release": "1.20.4", "snapshot": "24w14a"},
        "versions": [
            {"id": "24w14a", "type": "snapshot", "url": "https://x/24w14a.json", "sha1": "1", "releaseTime": "2024-04-03T12:00:00+00:00"},
            {"id": "1.20.4", "type": "release", "url": "https://x/1.20.4.json", "sha1": "2", "releaseTime": "2023-12-07T12:56:20+00:00"},
            {"id": "weird", "type": "experiment"},
            {"id": "rd-132211", "type": "old_alpha", "url": "https://x/rd.json"}
        ]
    })");
    const auto versions = Ember::VersionRepository::parseManifest(manifest);
    REQUIRE(versions.size() == 3);
    CHECK(versions[0].id == "24w14a");
    CHECK(versions[0].type == Ember::VersionType::SNAPSHOT);
    CHECK(versions[1].id == "1.20.4");
    CHECK(versions[2].type == Ember::VersionType::OLD_ALPHA);

    CHECK_THROWS_AS(Ember::VersionRepository::parseManifest(json::object()), Ember::BackendError);
}

TEST_CASE("Adoptium responses") {
    CHECK(Ember::JavaDownloader::parseAvailableReleases(json::parse(R"({"available_releases": [21, 8, 11, 17, 11, 22]})")) ==
          std::vector<unsigned int>{8, 11, 17, 21, 22});
    CHECK_THROWS_AS(Ember::JavaDownloader::parseAvailableReleases(json::parse(R"({"releases": []})")), Ember::BackendError);

    const json assets = json::parse(R"([{
        "binary": {"package": {
            "link": "https://github.com/adoptium/temurin21-binaries/releases/download/x/OpenJDK21U-jre_x64_linux_hotspot.tar.gz",
            "name": "OpenJDK21U-jre_x64_linux_hotspot.tar.gz",
            "checksum": "ABCDEF"
        }}
    }])");
    const auto package = Ember::JavaDownloader::parseLatestAsset(assets);
    CHECK(package.name == "OpenJDK21U-jre_x64_linux_hotspot.tar.gz");
    CHECK(package.checksum == "ABCDEF");
    CHECK_THROWS_WITH_AS(Ember::JavaDownloader::parseLatestAsset(json::array()),
                         "No Temurin build is available for this platform", Ember::BackendError);
}

TEST_CASE("Fabric loader list") {
    const json list = json::parse(R"([
        {"loader": {"version": "0.15.7", "stable": true}, "intermediary": {"version": "1.20.4"}},
        {"loader": {"version": "0.15.6", "stable": true}, "intermediary": {"version": "1.20.4"}}
    ])");
    CHECK(Ember::FabricInstaller::parseLoaderVersions(list) == std::vector<std::string>{"0.15.7", "0.15.6"});
    CHECK_THROWS_AS(Ember::FabricInstaller::parseLoaderVersions(json::object()), Ember::BackendError);
}

TEST_CASE("Forge metadata") {
    const json metadata = json::parse(R"({
        "1.20.1": ["1.20.1-46.0.14", "1.20.1-47.0.0", "1.20.1-47.2.0"],
        "1.7.10": ["1.7.10-10.13.4.1614-1.7.10"]
    })");
    CHECK(Ember::ForgeInstaller::parseMetadata(metadata, "1.20.1") ==
          std::vector<std::string>{"47.2.0", "47.0.0", "46.0.14"});
    CHECK(Ember::ForgeInstaller::parseMetadata(metadata, "1.7.10") ==
          std::vector<std::string>{"10.13.4.1614-1.7.10"});
    CHECK(Ember::ForgeInstaller::parseMetadata(metadata, "1.99").empty());

    CHECK(Ember::ForgeInstaller::installerUrl("1.20.1", "47.2.0") ==
          "https://maven.minecraftforge.net/net/minecraftforge/forge/1.20.1-47.2.0/forge-1.20.1-47.2.0-installer.jar");
}

TEST_CASE("asset objects are addressed by hash") {
    const json index = json::parse(R"({"objects": {
        "minecraft/sounds/a.ogg": {"hash": "bdf48ef6b5d0d23bbb02e17d04865216179f510a", "size": 1},
        "minecraft/sounds/b.ogg": {"hash": "bdf48ef6b5d0d23bbb02e17d04865216179f510a", "size": 1},
        "icons/icon_16x16.png": {"hash": "5ff04807c356f1beed0b86ccf659b44b9983e3fa", "size": 2}
    }})");
    const auto tasks = Ember::GameInstaller::assetObjectTasks(index, "/game/assets");
    REQUIRE(tasks.size() == 2);
    auto it = std::find_if(tasks.begin(), tasks.end(), [](const Ember::DownloadTask& t) {
        return t.sha1 == std::optional<std::string>("5ff04807c356f1beed0b86ccf659b44b9983e3fa");
    });
    REQUIRE(it != tasks.end());
    CHECK(it->url == "https://resources.download.minecraft.net/5f/5ff04807c356f1beed0b86ccf659b44b9983e3fa");
    CHECK(it->path == std::filesystem::path("/game/assets") / "objects" / "5f" / "5ff04807c356f1beed0b86ccf659b44b9983e3fa");

    CHECK(Ember::GameInstaller::assetObjectTasks(json::object(), "/game/assets").empty());
}

TEST_CASE("architecture bits for native classifiers") {
    Ember::RuleContext ctx;
    ctx.arch = "x86_64";
    CHECK(Ember::GameInstaller::archBits(ctx) == "64");
    ctx.arch = "x86";
    CHECK(Ember::GameInstaller::archBits(ctx) == "32");
}

TEST_CASE("existing files are only trusted with a matching checksum") {
    TempDir dir("queue");
    const auto file = dir.path() / "abc.txt";
    writeFile(file, "abc");

    Ember::DownloadTask task{"https://example.invalid/abc.txt", file, std::nullopt};
    CHECK_FALSE(Ember::DownloadQueue::isAlreadyValid(task));
    task.sha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
    CHECK(Ember::DownloadQueue::isAlreadyValid(task));
    task.sha1 = "0000000000000000000000000000000000000000";
    CHECK_FALSE(Ember::DownloadQueue::isAlreadyValid(task));
    task.path = dir.path() / "missing.txt";
    CHECK_FALSE(Ember::DownloadQueue::isAlreadyValid(task));

    CHECK(Ember::download_status_to_string(Ember::DownloadStatus::FAILED) == "Error");
}

TEST_CASE("an empty download batch finishes immediately") {
    Ember::HttpManager http(std::chrono::milliseconds(500));
    Ember::DownloadQueue queue(http, 4);
    int events = 0;
    queue.setListener([&](const Ember::DownloadProgress&) { ++events; });
    CHECK_NOTHROW(queue.run({}));
    CHECK(events == 0);
}

TEST_CASE("installed versions on disk") {
    TempDir dir("repo");
    Ember::Config config(dir.path());
    Ember::HttpManager http(std::chrono::milliseconds(500));
    Ember::VersionRepository repo(config, http);

    CHECK(repo.installedVersionIds().empty());

    repo.writeVersionJson("1.20.4", {{"id", "1.20.4"}, {"type", "release"}});
    repo.writeVersionJson("fabric-loader-0.15.7-1.20.4", {{"id", "fabric-loader-0.15.7-1.20.4"}, {"inheritsFrom", "1.20.4"}});
    repo.writeVersionJson("1.20.1-forge-47.2.0", {{"id", "1.20.1-forge-47.2.0"}, {"inheritsFrom", "1.20.1"}});
    std::filesystem::create_directories(config.versionsDir / "half-deleted");

    CHECK(repo.installedVersionIds() ==
          std::vector<std::string>{"1.20.1-forge-47.2.0", "1.20.4", "fabric-loader-0.15.7-1.20.4"});
    CHECK(repo.installedLoaderIds(Ember::LoaderKind::FABRIC) == std::vector<std::string>{"fabric-loader-0.15.7-1.20.4"});
    CHECK(repo.installedLoaderIds(Ember::LoaderKind::FORGE) == std::vector<std::string>{"1.20.1-forge-47.2.0"});
    CHECK(repo.isInstalled("1.20.4"));
    CHECK_FALSE(repo.isInstalled("half-deleted"));

    CHECK(repo.readVersionJson("1.20.4").at("type") == "release");
    CHECK(repo.clientJarPath("1.20.4") == config.versionsDir / "1.20.4" / "1.20.4.jar");
    CHECK(repo.nativesDirectory("1.20.4") == config.versionsDir / "1.20.4" / "natives");
    CHECK_THROWS_AS(repo.readVersionJson("1.12.2"), Ember::BackendError);

    SUBCASE("a separate game directory moves the version store") {
        config.setGameDirectory(dir.path() / "elsewhere");
        CHECK(repo.installedVersionIds().empty());
        CHECK(std::filesystem::is_directory(dir.path() / "elsewhere" / "assets" / "objects"));
    }
}

TEST_CASE("locating the java executable inside a runtime") {
    TempDir dir("jre");
#ifdef _WIN32
    const std::string exe = "java.exe";
#else
    const std::string exe = "java";
#endif
    writeFile(dir.path() / "jdk-21.0.2+13-jre" / "bin" / exe, "");
    CHECK(Ember::JavaManager::findJavaExecutable(dir.path()) == dir.path() / "jdk-21.0.2+13-jre" / "bin" / exe);

    TempDir empty("jre-empty");
    CHECK(Ember::JavaManager::findJavaExecutable(empty.path()).empty());
}

TEST_CASE("a configured java path that does not exist is rejected") {
    CHECK_THROWS_AS(Ember::JavaManager::normalizeJavaPath("/definitely/not/here/bin/java"), std::exception);
}

TEST_CASE("a java install into a custom directory leaves its existing content alone") {
    TempDir dir("custom-java");
    Ember::Config config(dir.path() / "data");
    Ember::HttpManager http(std::chrono::milliseconds(500));
    Ember::JavaManager java(config, http);

    const auto games = dir.path() / "Games";
    writeFile(games / "saves" / "world.dat", "precious");

    const auto target = java.installDirectoryFor(21, Ember::ImageType::JRE, games);
    CHECK(target == games / "temurin-21-jre");
    CHECK(java.installDirectoryFor(17, Ember::ImageType::JDK, std::nullopt) ==
          config.javaRuntimesDir / "temurin-17-jdk");

    const auto archive = dir.path() / "OpenJDK21U-jre.zip";
    writeFile(archive, "this is not a zip archive");
    CHECK_THROWS_AS(java.unpackRuntime(archive, 21, target), Ember::BackendError);

    CHECK(std::filesystem::is_regular_file(games / "saves" / "world.dat"));
    CHECK_FALSE(std::filesystem::exists(target));
}

TEST_CASE("an unusable data directory does not stop the java manager from starting") {
    TempDir dir("blocked");
    const auto blocker = dir.path() / "not-a-directory";
    writeFile(blocker, "");

    Ember::Config config(blocker);
    Ember::HttpManager http(std::chrono::milliseconds(500));
    std::unique_ptr<Ember::JavaManager> java;
    CHECK_NOTHROW(java = std::make_unique<Ember::JavaManager>(config, http));
}

TEST_CASE("a failed download leaves no partial file behind") {
    TempDir dir("refused");
    Ember::HttpManager http(std::chrono::milliseconds(2000));
    Ember::DownloadQueue queue(http, 2);
    const auto path = dir.path() / "libraries" / "missing.jar";

    // Nothing listens on the discard port, so the connection is refused at once
    const std::vector<Ember::DownloadTask> tasks{{"http://127.0.0.1:9/missing.jar", path, std::nullopt}};
    CHECK_THROWS_AS(queue.run(tasks), Ember::BackendError);
    CHECK_FALSE(std::filesystem::exists(path));
}

namespace {

Ember::LaunchContext sampleContext() {
    Ember::LaunchContext ctx;
    ctx.version = Ember::GameVersion::from_json(json::parse(R"({
        "id": "1.20.4",
        "type": "release",
        "mainClass": "net.minecraft.client.main.Main",
        "assets": "12",
        "assetIndex": {"id": "12", "sha1": "aa", "size": 1, "totalSize": 2, "url": "https://x/12.json"},
        "libraries": [
            {"name": "com.mojang:brigadier:1.2.9", "downloads": {"artifact": {"path": "com/mojang/brigadier/1.2.9/brigadier-1.2.9.jar", "sha1": "1", "size": 1, "url": "https://x/b.jar"}}},
            {"name": "com.mojang:brigadier:1.0.18"},
            {"name": "org.lwjgl:lwjgl:3.3.1:natives-windows", "rules": [{"action": "allow", "os": {"name": "windows"}}]}
        ],
        "arguments": {
            "game": ["--username", "${auth_player_name}", "--uuid", "${auth_uuid}", "--accessToken", "${auth_access_token}",
                     "--assetIndex", "${assets_index_name}", "--unknown", "${not_a_placeholder}"],
            "jvm": ["-Xmx512M", "-Djava.library.path=${natives_directory}", "-cp", "${classpath}"]
        }
    })"));
    ctx.account = Ember::Account::makeOffline("Steve");
    ctx.settings.minMemory = 1024;
    ctx.settings.maxMemory = 4096;
    ctx.settings.width = 1280;
    ctx.settings.height = 720;
    ctx.javaExecutable = "/usr/bin/java";
    ctx.gameDir = "/game";
    ctx.assetsDir = "/game/assets";
    ctx.librariesDir = "/game/libraries";
    ctx.nativesDir = "/game/versions/1.20.4/natives";
    ctx.clientJar = "/game/versions/1.20.4/1.20.4.jar";
    ctx.rules.osName = "linux";
    ctx.rules.arch = "x86_64";
    ctx.classpathSeparator = ':';
    return ctx;
}

} // namespace

TEST_CASE("placeholder substitution") {
    const std::map<std::string, std::string> vars = {{"a", "1"}, {"b", "two"}};
    CHECK(Ember::GameLauncher::substitutePlaceholders("${a}", vars) == "1");
    CHECK(Ember::GameLauncher::substitutePlaceholders("-Dx=${a}-${b}", vars) == "-Dx=1-two");
    CHECK(Ember::GameLauncher::substitutePlaceholders("${missing}", vars) == "${missing}");
    CHECK(Ember::GameLauncher::substitutePlaceholders("${unterminated", vars) == "${unterminated");
    CHECK(Ember::GameLauncher::substitutePlaceholders("plain", vars) == "plain");
}

TEST_CASE("classpath keeps the first copy of each library and ends with the client jar") {
    const auto ctx = sampleContext();
    const std::filesystem::path brigadier = std::filesystem::path("/game/libraries") / "com/mojang/brigadier/1.2.9/brigadier-1.2.9.jar";
    CHECK(Ember::GameLauncher::buildClasspath(ctx) == brigadier.string() + ":/game/versions/1.20.4/1.20.4.jar");
}

TEST_CASE("launch command layout") {
    const auto ctx = sampleContext();
    const auto command = Ember::GameLauncher::buildCommand(ctx);

    REQUIRE(command.size() > 4);
    CHECK(command[0] == std::filesystem::path("/usr/bin/java").string());
    CHECK(command[1] == "-Xms1024M");
    CHECK(command[2] == "-Xmx4096M");
    CHECK_FALSE(contains(command, "-Xmx512M"));

    CHECK(contains(command, "-Djava.library.path=" + std::filesystem::path("/game/versions/1.20.4/natives").string()));
    const long cp = indexOf(command, "-cp");
    const long mainClass = indexOf(command, "net.minecraft.client.main.Main");
    REQUIRE(cp > 0);
    REQUIRE(mainClass > cp);
    CHECK(command[static_cast<size_t>(cp) + 1] == Ember::GameLauncher::buildClasspath(ctx));

    const long username = indexOf(command, "--username");
    REQUIRE(username > mainClass);
    CHECK(command[static_cast<size_t>(username) + 1] == "Steve");
    CHECK(command[static_cast<size_t>(indexOf(command, "--uuid")) + 1] == ctx.account.uuid);
    CHECK(command[static_cast<size_t>(indexOf(command, "--accessToken")) + 1] == "0");
    CHECK(command[static_cast<size_t>(indexOf(command, "--assetIndex")) + 1] == "12");
    CHECK(contains(command, "${not_a_placeholder}"));

    const long width = indexOf(command, "--width");
    REQUIRE(width > mainClass);
    CHECK(command[static_cast<size_t>(width) + 1] == "1280");
    CHECK(command[static_cast<size_t>(indexOf(command, "--height")) + 1] == "720");
}

TEST_CASE("legacy versions pass minecraftArguments and get the classpath added") {
    auto ctx = sampleContext();
    ctx.version.arguments.reset();
    ctx.version.minecraftArguments = "--username ${auth_player_name} --version ${version_name}";
    ctx.settings.minMemory = 8192;
    ctx.settings.maxMemory = 2048;

    const auto command = Ember::GameLauncher::buildCommand(ctx);
    CHECK(command[1] == "-Xms2048M");
    CHECK(command[2] == "-Xmx2048M");
    CHECK(contains(command, "-cp"));
    CHECK(command[static_cast<size_t>(indexOf(command, "--version")) + 1] == "1.20.4");
    CHECK(indexOf(command, "--username") > indexOf(command, "net.minecraft.client.main.Main"));
}
