// tests/FakeBackend.hpp
#ifndef EMBER_TESTS_FAKE_BACKEND_HPP
#define EMBER_TESTS_FAKE_BACKEND_HPP

#include <Ember/Backend.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace EmberTests {

    // Scriptable Backend. Each operation returns its canned value, or throws BackendError with
    // the matching *Error text when that is set. Calls are counted.
    class FakeBackend : public Ember::Backend {
    public:
        Ember::LauncherConfig settings;
        std::optional<std::string> settingsError;
        int saveCount = 0;

        std::vector<Ember::JavaInstallation> javaInstallations;
        std::optional<std::string> detectError;
        std::vector<unsigned int> javaReleases;
        std::optional<std::string> releasesError;
        Ember::JavaInstallation downloadedJava{"/opt/ember/temurin-21-jre/bin/java", "21.0.2", "Temurin", true};
        std::optional<std::string> downloadError;
        // Runs inside downloadAdoptiumJava, before it returns
        std::function<void()> onDownload;
        int downloadCount = 0;

        std::vector<Ember::Version> manifest;
        std::optional<std::string> manifestError;
        std::vector<std::string> installed;
        std::optional<std::string> installedError;
        std::vector<std::string> fabricInstalled;
        std::vector<std::string> forgeInstalled;
        std::optional<std::string> loaderListError;

        std::vector<std::string> loaderVersions;
        std::optional<std::string> loaderVersionsError;
        std::optional<std::string> installResult;
        std::optional<std::string> installError;
        std::vector<std::string> installCalls;

        std::string startResult = "Launched";
        std::optional<std::string> startError;
        std::vector<std::string> startCalls;

        Ember::LauncherConfig getSettings() override {
            if (settingsError) throw Ember::BackendError(*settingsError);
            return settings;
        }
        void saveSettings(const Ember::LauncherConfig& config) override {
            if (settingsError) throw Ember::BackendError(*settingsError);
            settings = config;
            ++saveCount;
        }

        std::vector<Ember::JavaInstallation> detectJava() override {
            if (detectError) throw Ember::BackendError(*detectError);
            return javaInstallations;
        }
        std::vector<unsigned int> fetchAvailableJavaVersions() override {
            if (releasesError) throw Ember::BackendError(*releasesError);
            return javaReleases;
        }
        Ember::JavaInstallation downloadAdoptiumJava(unsigned int, Ember::ImageType,
                                                     const std::optional<std::filesystem::path>&) override {
            ++downloadCount;
            if (onDownload) onDownload();
            if (downloadError) throw Ember::BackendError(*downloadError);
            return downloadedJava;
        }

        std::vector<Ember::Version> getVersions() override {
            if (manifestError) throw Ember::BackendError(*manifestError);
            return manifest;
        }
        std::vector<std::string> getInstalledVersions() override {
            if (installedError) throw Ember::BackendError(*installedError);
            return installed;
        }
        std::vector<std::string> listInstalledFabricVersions() override {
            if (loaderListError) throw Ember::BackendError(*loaderListError);
            return fabricInstalled;
        }
        std::vector<std::string> listInstalledForgeVersions() override {
            if (loaderListError) throw Ember::BackendError(*loaderListError);
            return forgeInstalled;
        }

        std::vector<std::string> getFabricLoaderVersions(const std::string&) override {
            if (loaderVersionsError) throw Ember::BackendError(*loaderVersionsError);
            return loaderVersions;
        }
        std::vector<std::string> getForgeVersions(const std::string&) override {
            if (loaderVersionsError) throw Ember::BackendError(*loaderVersionsError);
            return loaderVersions;
        }
        std::string installFabric(const std::string& gameVersion, const std::string& loaderVersion) override {
            installCalls.push_back("fabric:" + gameVersion + ":" + loaderVersion);
            if (installError) throw Ember::BackendError(*installError);
            std::string id = installResult.value_or("fabric-loader-" + loaderVersion + "-" + gameVersion);
            fabricInstalled.push_back(id);
            return id;
        }
        std::string installForge(const std::string& gameVersion, const std::string& loaderVersion) override {
            installCalls.push_back("forge:" + gameVersion + ":" + loaderVersion);
            if (installError) throw Ember::BackendError(*installError);
            std::string id = installResult.value_or(gameVersion + "-forge-" + loaderVersion);
            forgeInstalled.push_back(id);
            return id;
        }

        std::string startGame(const std::string& versionId) override {
            startCalls.push_back(versionId);
            if (startError) throw Ember::BackendError(*startError);
            return startResult;
        }
    };

    inline Ember::Version makeVersion(const std::string& id, Ember::VersionType type) {
        Ember::Version v;
        v.id = id;
        v.type = type;
        return v;
    }

} // namespace EmberTests

#endif // EMBER_TESTS_FAKE_BACKEND_HPP
