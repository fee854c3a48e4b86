// include/Ember/Backend.hpp
#ifndef EMBER_BACKEND_HPP
#define EMBER_BACKEND_HPP

#include <Ember/Types/JavaInstallation.hpp>
#include <Ember/Types/LauncherConfig.hpp>
#include <Ember/Types/Version.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Ember {

    // Raised by every backend operation. what() is shown to the user as-is.
    class BackendError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The command surface the launcher components talk to. Each method is one request/response
    // round trip; a failure is a thrown BackendError (or any std::exception) and nothing else.
    //
    //   get_settings                  -> getSettings
    //   save_settings                 -> saveSettings
    //   detect_java                   -> detectJava
    //   fetch_available_java_versions -> fetchAvailableJavaVersions
    //   download_adoptium_java        -> downloadAdoptiumJava
    //   get_versions                  -> getVersions
    //   get_installed_versions        -> getInstalledVersions
    //   list_installed_fabric_versions-> listInstalledFabricVersions
    //   start_game                    -> startGame
    class Backend {
    public:
        virtual ~Backend() = default;

        virtual LauncherConfig getSettings() = 0;
        virtual void saveSettings(const LauncherConfig& config) = 0;

        virtual std::vector<JavaInstallation> detectJava() = 0;
        virtual std::vector<unsigned int> fetchAvailableJavaVersions() = 0;
        virtual JavaInstallation downloadAdoptiumJava(unsigned int majorVersion, ImageType imageType,
                                                      const std::optional<std::filesystem::path>& customPath) = 0;

        // Vanilla manifest, newest first
        virtual std::vector<Version> getVersions() = 0;
        // Ids of every version directory holding a version JSON, vanilla and modded alike
        virtual std::vector<std::string> getInstalledVersions() = 0;
        virtual std::vector<std::string> listInstalledFabricVersions() = 0;
        virtual std::vector<std::string> listInstalledForgeVersions() = 0;

        virtual std::vector<std::string> getFabricLoaderVersions(const std::string& gameVersion) = 0;
        virtual std::vector<std::string> getForgeVersions(const std::string& gameVersion) = 0;
        // Both return the id of the newly installed version
        virtual std::string installFabric(const std::string& gameVersion, const std::string& loaderVersion) = 0;
        virtual std::string installForge(const std::string& gameVersion, const std::string& loaderVersion) = 0;

        // Human-readable result of the launch attempt
        virtual std::string startGame(const std::string& versionId) = 0;
    };

} // namespace Ember

#endif // EMBER_BACKEND_HPP
