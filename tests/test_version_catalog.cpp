// tests/test_version_catalog.cpp
#include <doctest/doctest.h>

#include "FakeBackend.hpp"

#include <Ember/StatusBoard.hpp>
#include <Ember/VersionCatalog.hpp>

using Ember::VersionCatalog;
using Ember::VersionFilter;
using Ember::VersionType;
using EmberTests::FakeBackend;
using EmberTests::makeVersion;

namespace {

std::vector<Ember::Version> sampleManifest() {
    return {
        makeVersion("24w14a", VersionType::SNAPSHOT),
        makeVersion("1.20.4", VersionType::RELEASE),
        makeVersion("1.20.3", VersionType::RELEASE),
        makeVersion("23w51b", VersionType::SNAPSHOT),
        makeVersion("1.19.2", VersionType::RELEASE),
        makeVersion("b1.7.3", VersionType::OLD_BETA),
    };
}

std::vector<std::string> ids(const std::vector<Ember::Version>& versions) {
    std::vector<std::string> out;
    for (const auto& v : versions) out.push_back(v.id);
    return out;
}

} // namespace

TEST_CASE("default selection prefers the newest installed release") {
    const auto manifest = sampleManifest();

    SUBCASE("nothing installed leaves no selection") {
        CHECK_FALSE(VersionCatalog::pickDefaultSelection(manifest, {}).has_value());
    }
    SUBCASE("a release beats a newer installed snapshot") {
        auto pick = VersionCatalog::pickDefaultSelection(manifest, {"24w14a", "1.19.2", "1.20.3"});
        REQUIRE(pick.has_value());
        CHECK(*pick == "1.20.3");
    }
    SUBCASE("only snapshots installed picks the first in manifest order") {
        auto pick = VersionCatalog::pickDefaultSelection(manifest, {"23w51b", "24w14a"});
        REQUIRE(pick.has_value());
        CHECK(*pick == "24w14a");
    }
    SUBCASE("installed ids unknown to the manifest fall back to the first installed id") {
        auto pick = VersionCatalog::pickDefaultSelection(manifest, {"fabric-loader-0.15.7-1.20.4"});
        REQUIRE(pick.has_value());
        CHECK(*pick == "fabric-loader-0.15.7-1.20.4");
    }
}

TEST_CASE("filtering by type and query") {
    auto source = sampleManifest();
    source.insert(source.begin(), makeVersion("fabric-loader-0.15.7-1.20.4", VersionType::FABRIC));
    source.insert(source.begin(), makeVersion("1.20.1-forge-47.2.0", VersionType::FORGE));

    CHECK(ids(VersionCatalog::filter(source, "", VersionFilter::RELEASE)) ==
          std::vector<std::string>{"1.20.4", "1.20.3", "1.19.2"});
    CHECK(ids(VersionCatalog::filter(source, "", VersionFilter::SNAPSHOT)) ==
          std::vector<std::string>{"24w14a", "23w51b"});
    CHECK(ids(VersionCatalog::filter(source, "", VersionFilter::MODDED)) ==
          std::vector<std::string>{"1.20.1-forge-47.2.0", "fabric-loader-0.15.7-1.20.4"});
    CHECK(VersionCatalog::filter(source, "", VersionFilter::ALL).size() == source.size());

    SUBCASE("query is a case-insensitive substring") {
        CHECK(ids(VersionCatalog::filter(source, "1.20.4", VersionFilter::ALL)) ==
              std::vector<std::string>{"fabric-loader-0.15.7-1.20.4", "1.20.4"});
        CHECK(ids(VersionCatalog::filter(source, "W14A", VersionFilter::ALL)) == std::vector<std::string>{"24w14a"});
        CHECK(VersionCatalog::filter(source, "nothing-matches", VersionFilter::ALL).empty());
    }

    SUBCASE("full-width stop matches a dot") {
        CHECK(ids(VersionCatalog::filter(source, "1\xE3\x80\x82" "19", VersionFilter::RELEASE)) ==
              std::vector<std::string>{"1.19.2"});
    }

    SUBCASE("filtering twice gives the same result") {
        auto once = VersionCatalog::filter(source, "1.20", VersionFilter::RELEASE);
        auto twice = VersionCatalog::filter(once, "1.20", VersionFilter::RELEASE);
        CHECK(ids(once) == ids(twice));
    }
}

TEST_CASE("normalizeQuery lowercases and folds the full-width stop") {
    CHECK(VersionCatalog::normalizeQuery("1\xE3\x80\x82" "20") == "1.20");
    CHECK(VersionCatalog::normalizeQuery("Fabric-Loader") == "fabric-loader");
    CHECK(VersionCatalog::normalizeQuery("") == "");
}

TEST_CASE("refresh loads the manifest and selects a default") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.installed = {"1.19.2", "24w14a"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());
    CHECK(catalog.vanillaVersions().size() == 6);
    CHECK(catalog.selectedVersion() == "1.19.2");
    CHECK(catalog.isVanilla("1.20.4"));
    CHECK_FALSE(catalog.isVanilla("fabric-loader-0.15.7-1.20.4"));
}

TEST_CASE("refresh keeps an existing selection when nothing is installed") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();

    VersionCatalog catalog(backend, status);
    catalog.select("1.20.4");
    REQUIRE(catalog.refresh());
    CHECK(catalog.selectedVersion() == "1.20.4");
}

TEST_CASE("a failed refresh keeps the previous catalog") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.installed = {"1.20.4"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());

    backend.manifestError = "network is down";
    backend.manifest.clear();
    backend.installed.clear();
    CHECK_FALSE(catalog.refresh());
    CHECK(status.current() == "Error fetching versions: network is down");
    CHECK(catalog.vanillaVersions().size() == 6);
    CHECK(catalog.installedVersionIds() == std::vector<std::string>{"1.20.4"});
    CHECK(catalog.selectedVersion() == "1.20.4");
}

TEST_CASE("a failed installed-version listing keeps the previous catalog") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.installed = {"1.20.3", "1.19.2"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());
    REQUIRE(catalog.selectedVersion() == "1.20.3");

    backend.manifest = {makeVersion("1.21", VersionType::RELEASE)};
    backend.installedError = "versions directory is unreadable";
    CHECK_FALSE(catalog.refresh());
    CHECK(status.current() == "Error fetching versions: versions directory is unreadable");
    CHECK(catalog.vanillaVersions().size() == 6);
    CHECK(catalog.installedVersionIds() == std::vector<std::string>{"1.20.3", "1.19.2"});
    CHECK(catalog.selectedVersion() == "1.20.3");
}

TEST_CASE("a failed mod loader listing keeps the previous entries") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.fabricInstalled = {"fabric-loader-0.15.7-1.20.4"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());
    REQUIRE(catalog.refreshModLoaders());

    backend.fabricInstalled.clear();
    backend.loaderListError = "permission denied";
    CHECK_FALSE(catalog.refreshModLoaders());
    CHECK(status.current() == "Error listing mod loaders: permission denied");
    REQUIRE(catalog.modLoaderVersions().size() == 1);
    CHECK(catalog.modLoaderVersions()[0].id == "fabric-loader-0.15.7-1.20.4");
}

TEST_CASE("refreshAll brings in installed mod loaders for the modded filter") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = {makeVersion("1.20.4", VersionType::RELEASE)};
    backend.installed = {"1.20.4", "fabric-loader-0.15.7-1.20.4"};
    backend.fabricInstalled = {"fabric-loader-0.15.7-1.20.4"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refreshAll());
    CHECK(ids(catalog.filter("", VersionFilter::MODDED)) == std::vector<std::string>{"fabric-loader-0.15.7-1.20.4"});
    CHECK(ids(catalog.filter("", VersionFilter::ALL)) ==
          std::vector<std::string>{"fabric-loader-0.15.7-1.20.4", "1.20.4"});

    SUBCASE("loaders are still listed when the manifest is unreachable") {
        VersionCatalog offline(backend, status);
        backend.manifestError = "network is down";
        CHECK_FALSE(offline.refreshAll());
        CHECK(offline.modLoaderVersions().size() == 1);
    }
}

TEST_CASE("mod loader entries are listed ahead of vanilla versions") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.fabricInstalled = {"fabric-loader-0.15.7-1.20.4"};
    backend.forgeInstalled = {"1.20.1-forge-47.2.0"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());
    REQUIRE(catalog.refreshModLoaders());

    const auto all = catalog.versions();
    REQUIRE(all.size() == 8);
    CHECK(all[0].id == "fabric-loader-0.15.7-1.20.4");
    CHECK(all[0].type == VersionType::FABRIC);
    CHECK(all[1].id == "1.20.1-forge-47.2.0");
    CHECK(all[1].type == VersionType::FORGE);
    CHECK(all[2].id == "24w14a");

    CHECK(catalog.contains("1.20.1-forge-47.2.0"));
    CHECK(catalog.contains("1.20.3"));
    CHECK_FALSE(catalog.contains("1.99"));
}

TEST_CASE("installed loader ids count as known before the loader lists are refreshed") {
    FakeBackend backend;
    Ember::StatusBoard status;
    backend.manifest = sampleManifest();
    backend.installed = {"fabric-loader-0.15.7-1.20.4", "my-custom-pack"};

    VersionCatalog catalog(backend, status);
    REQUIRE(catalog.refresh());
    CHECK(catalog.contains("fabric-loader-0.15.7-1.20.4"));
    CHECK_FALSE(catalog.contains("my-custom-pack"));
}

TEST_CASE("version filter names") {
    CHECK(Ember::string_to_version_filter("release") == VersionFilter::RELEASE);
    CHECK(Ember::string_to_version_filter("modded") == VersionFilter::MODDED);
    CHECK_THROWS_AS(Ember::string_to_version_filter("beta"), std::runtime_error);
}
