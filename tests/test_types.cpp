// tests/test_types.cpp
#include <doctest/doctest.h>

#include <Ember/Types/Account.hpp>
#include <Ember/Types/GameVersion.hpp>
#include <Ember/Types/Library.hpp>
#include <Ember/Types/Rule.hpp>
#include <Ember/Types/Version.hpp>
#include <Ember/Types/VersionArguments.hpp>

using Ember::RuleContext;
using nlohmann::json;

namespace {

RuleContext linux64() {
    RuleContext ctx;
    ctx.osName = "linux";
    ctx.arch = "x86_64";
    return ctx;
}

} // namespace

TEST_CASE("offline accounts get a stable name-based UUID") {
    const Ember::Account steve = Ember::Account::makeOffline("Steve");
    CHECK(steve.username == "Steve");
    CHECK(steve.accessToken == "0");
    CHECK(steve.type == Ember::AccountType::OFFLINE);

    REQUIRE(steve.uuid.size() == 36);
    CHECK(steve.uuid[8] == '-');
    CHECK(steve.uuid[13] == '-');
    CHECK(steve.uuid[18] == '-');
    CHECK(steve.uuid[23] == '-');
    CHECK(steve.uuid[14] == '3');
    CHECK(std::string("89ab").find(steve.uuid[19]) != std::string::npos);

    CHECK(Ember::Account::makeOffline("Steve").uuid == steve.uuid);
    CHECK(Ember::Account::makeOffline("Alex").uuid != steve.uuid);
    CHECK(Ember::Account::makeOffline("steve").uuid != steve.uuid);
    CHECK_THROWS_AS(Ember::Account::makeOffline(""), std::invalid_argument);
}

TEST_CASE("accounts survive JSON") {
    const Ember::Account steve = Ember::Account::makeOffline("Steve");
    const Ember::Account parsed = Ember::Account::from_json(steve.to_json());
    CHECK(parsed.username == steve.username);
    CHECK(parsed.uuid == steve.uuid);
    CHECK(parsed.type == Ember::AccountType::OFFLINE);
}

TEST_CASE("manifest rows") {
    const json row = {{"id", "1.20.4"}, {"type", "release"}, {"url", "https://piston-meta.mojang.com/v1/packages/x/1.20.4.json"},
                      {"releaseTime", "2023-12-07T12:56:20+00:00"}, {"sha1", "abc"}};
    const Ember::Version v = Ember::Version::from_json(row);
    CHECK(v.id == "1.20.4");
    CHECK(v.type == Ember::VersionType::RELEASE);
    CHECK_FALSE(v.isModded());
    REQUIRE(v.sha1.has_value());
    CHECK(*v.sha1 == "abc");
    CHECK(Ember::Version::from_json(v.to_json()) == v);

    CHECK(Ember::string_to_version_type("old_alpha") == Ember::VersionType::OLD_ALPHA);
    CHECK_THROWS_AS(Ember::string_to_version_type("pre_release"), std::runtime_error);
}

TEST_CASE("rules follow last-match-wins") {
    const auto ctx = linux64();
    CHECK(Ember::rules_allow({}, ctx));

    const std::vector<Ember::Rule> allowAllButOsx = {
        Ember::Rule::from_json({{"action", "allow"}}),
        Ember::Rule::from_json({{"action", "disallow"}, {"os", {{"name", "osx"}}}}),
    };
    CHECK(Ember::rules_allow(allowAllButOsx, ctx));
    RuleContext osx = ctx;
    osx.osName = "osx";
    CHECK_FALSE(Ember::rules_allow(allowAllButOsx, osx));

    const std::vector<Ember::Rule> windowsOnly = {
        Ember::Rule::from_json({{"action", "allow"}, {"os", {{"name", "windows"}}}}),
    };
    CHECK_FALSE(Ember::rules_allow(windowsOnly, ctx));

    const std::vector<Ember::Rule> x86Only = {
        Ember::Rule::from_json({{"action", "allow"}, {"os", {{"arch", "x86"}}}}),
    };
    CHECK_FALSE(Ember::rules_allow(x86Only, ctx));
}

TEST_CASE("feature rules") {
    auto ctx = linux64();
    const std::vector<Ember::Rule> demoOnly = {
        Ember::Rule::from_json({{"action", "allow"}, {"features", {{"is_demo_user", true}}}}),
    };
    CHECK_FALSE(Ember::rules_allow(demoOnly, ctx));
    ctx.features["is_demo_user"] = true;
    CHECK(Ember::rules_allow(demoOnly, ctx));
}

TEST_CASE("argument lists are flattened against the rules") {
    const json arguments = json::parse(R"({
        "game": [
            "--username", "${auth_player_name}",
            {"rules": [{"action": "allow", "features": {"is_demo_user": true}}], "value": "--demo"},
            {"rules": [{"action": "allow", "features": {"has_custom_resolution": true}}],
             "value": ["--width", "${resolution_width}", "--height", "${resolution_height}"]}
        ],
        "jvm": [
            {"rules": [{"action": "allow", "os": {"name": "osx"}}], "value": ["-XstartOnFirstThread"]},
            {"rules": [{"action": "allow", "os": {"name": "windows", "version": "^10\\."}}], "value": "-Dos.name=Windows 10"},
            "-Djava.library.path=${natives_directory}",
            "-cp", "${classpath}"
        ]
    })");
    const Ember::Arguments args = Ember::Arguments::from_json(arguments);
    REQUIRE(args.game.size() == 4);
    REQUIRE(args.jvm.size() == 5);

    auto ctx = linux64();
    CHECK(Ember::flatten_arguments(args.game, ctx) == std::vector<std::string>{"--username", "${auth_player_name}"});
    CHECK(Ember::flatten_arguments(args.jvm, ctx) ==
          std::vector<std::string>{"-Djava.library.path=${natives_directory}", "-cp", "${classpath}"});

    ctx.features["has_custom_resolution"] = true;
    CHECK(Ember::flatten_arguments(args.game, ctx).size() == 6);

    ctx.osName = "windows";
    CHECK(Ember::flatten_arguments(args.jvm, ctx).front() == "-Dos.name=Windows 10");
}

TEST_CASE("maven coordinates map to repository paths") {
    CHECK(Ember::maven_path("net.fabricmc:fabric-loader:0.15.7") ==
          "net/fabricmc/fabric-loader/0.15.7/fabric-loader-0.15.7.jar");
    CHECK(Ember::maven_path("org.lwjgl:lwjgl:3.3.1:natives-linux") ==
          "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1-natives-linux.jar");
    CHECK(Ember::maven_path("org.lwjgl:lwjgl:3.3.1", "natives-windows") ==
          "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1-natives-windows.jar");
    CHECK(Ember::maven_path("de.oceanlabs.mcp:mcp_config:1.20.1@zip") ==
          "de/oceanlabs/mcp/mcp_config/1.20.1/mcp_config-1.20.1.zip");
    CHECK(Ember::maven_path("broken") == "");
}

TEST_CASE("library artifacts") {
    SUBCASE("loader profile entry without downloads uses its maven repository") {
        const auto lib = Ember::Library::from_json(
            {{"name", "net.fabricmc:intermediary:1.20.4"}, {"url", "https://maven.fabricmc.net"}});
        auto artifact = lib.resolveArtifact();
        REQUIRE(artifact.has_value());
        CHECK(artifact->path == "net/fabricmc/intermediary/1.20.4/intermediary-1.20.4.jar");
        CHECK(artifact->url == "https://maven.fabricmc.net/net/fabricmc/intermediary/1.20.4/intermediary-1.20.4.jar");
    }
    SUBCASE("entry without a url falls back to the Mojang library host") {
        const auto lib = Ember::Library::from_json({{"name", "com.google.code.gson:gson:2.10.1"}});
        auto artifact = lib.resolveArtifact();
        REQUIRE(artifact.has_value());
        CHECK(artifact->url == "https://libraries.minecraft.net/com/google/code/gson/gson/2.10.1/gson-2.10.1.jar");
    }
    SUBCASE("legacy natives entry") {
        const auto lib = Ember::Library::from_json(json::parse(R"({
            "name": "org.lwjgl.lwjgl:lwjgl-platform:2.9.4-nightly-20150209",
            "natives": {"linux": "natives-linux", "windows": "natives-windows-${arch}"},
            "extract": {"exclude": ["META-INF/"]},
            "downloads": {
                "classifiers": {
                    "natives-linux": {"path": "a/linux.jar", "sha1": "11", "size": 1, "url": "https://x/linux.jar"},
                    "natives-windows-64": {"path": "a/win64.jar", "sha1": "22", "size": 2, "url": "https://x/win64.jar"}
                }
            }
        })"));
        CHECK_FALSE(lib.resolveArtifact().has_value());
        auto linuxNatives = lib.resolveNatives("linux", "64");
        REQUIRE(linuxNatives.has_value());
        CHECK(linuxNatives->path == "a/linux.jar");
        auto windows = lib.resolveNatives("windows", "64");
        REQUIRE(windows.has_value());
        CHECK(windows->sha1 == "22");
        CHECK_FALSE(lib.resolveNatives("windows", "32").has_value());
        CHECK_FALSE(lib.resolveNatives("osx", "64").has_value());
        REQUIRE(lib.extract.has_value());
        CHECK(lib.extract->exclude == std::vector<std::string>{"META-INF/"});
    }
}

TEST_CASE("loader profiles merge over their parent") {
    const auto parent = Ember::GameVersion::from_json(json::parse(R"({
        "id": "1.20.4",
        "type": "release",
        "mainClass": "net.minecraft.client.main.Main",
        "assets": "12",
        "assetIndex": {"id": "12", "sha1": "aa", "size": 1, "totalSize": 2, "url": "https://x/12.json"},
        "libraries": [{"name": "com.mojang:brigadier:1.2.9"}],
        "arguments": {"game": ["--version", "${version_name}"], "jvm": ["-cp", "${classpath}"]}
    })"));
    const auto child = Ember::GameVersion::from_json(json::parse(R"({
        "id": "fabric-loader-0.15.7-1.20.4",
        "inheritsFrom": "1.20.4",
        "type": "release",
        "mainClass": "net.fabricmc.loader.impl.launch.knot.KnotClient",
        "libraries": [{"name": "net.fabricmc:fabric-loader:0.15.7", "url": "https://maven.fabricmc.net/"}],
        "arguments": {"game": [], "jvm": ["-DFabricMcEmu= net.minecraft.client.main.Main "]}
    })"));
    REQUIRE(child.inheritsFrom.has_value());

    const auto merged = Ember::GameVersion::merge(child, parent);
    CHECK(merged.id == "fabric-loader-0.15.7-1.20.4");
    CHECK_FALSE(merged.inheritsFrom.has_value());
    REQUIRE(merged.jar.has_value());
    CHECK(*merged.jar == "1.20.4");
    CHECK(merged.mainClass == std::optional<std::string>("net.fabricmc.loader.impl.launch.knot.KnotClient"));
    REQUIRE(merged.libraries.size() == 2);
    CHECK(merged.libraries[0].name == "net.fabricmc:fabric-loader:0.15.7");
    CHECK(merged.libraries[1].name == "com.mojang:brigadier:1.2.9");
    REQUIRE(merged.assetIndex.has_value());
    CHECK(merged.assetIndex->id == "12");
    REQUIRE(merged.arguments.has_value());
    CHECK(merged.arguments->jvm.size() == 3);
    CHECK(merged.arguments->game.size() == 2);
}
