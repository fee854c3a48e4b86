// include/Ember/JavaManager.hpp
#ifndef EMBER_JAVA_MANAGER_HPP
#define EMBER_JAVA_MANAGER_HPP

#include <Ember/Config.hpp>
#include <Ember/JavaDownloader.hpp>
#include <Ember/Types/JavaInstallation.hpp>

#include <filesystem>
#include <optional>
#include <spdlog/logger.h>
#include <string>
#include <vector>

namespace Ember {

    class HttpManager;

    struct JavaCandidate {
        std::filesystem::path executable;
        std::string origin; // where it was found: "path", "system", "sdkman", "JAVA_HOME", "ember", ...
    };

    // What `java -version` told us
    struct JavaProbe {
        std::string version;
        std::string vendor; // empty when the output names none we know
        bool is64Bit = false;
    };

    class JavaManager {
    public:
        JavaManager(const Config& config, HttpManager& httpManager);

        // Every usable Java on this machine, in discovery order, one entry per real executable.
        std::vector<JavaInstallation> detectInstallations();
        std::vector<JavaCandidate> candidateExecutables() const;
        std::optional<JavaInstallation> probe(const JavaCandidate& candidate) const;

        std::vector<unsigned int> availableReleases() { return m_javaDownloader.fetchAvailableReleases(); }

        // Downloads and unpacks Temurin into <customPath or runtimes>/temurin-<n>-<jre|jdk>.
        // Throws BackendError.
        JavaInstallation installAdoptium(unsigned int majorVersion, ImageType imageType,
                                         const std::optional<std::filesystem::path>& customPath,
                                         const Utils::CancellationToken* cancel = nullptr);

        // Replaces target with the contents of a downloaded archive and probes the java inside.
        // Throws BackendError; a failed extraction leaves nothing at target.
        JavaInstallation unpackRuntime(const std::filesystem::path& archive, unsigned int majorVersion,
                                       const std::filesystem::path& target);

        std::filesystem::path runtimeDirectoryFor(unsigned int majorVersion, ImageType imageType) const;
        std::filesystem::path installDirectoryFor(unsigned int majorVersion, ImageType imageType,
                                                  const std::optional<std::filesystem::path>& customPath) const;

        static std::optional<JavaProbe> parseVersionOutput(const std::string& output);

        // java executable under a Java home, also looking through a single wrapping directory
        // and the macOS Contents/Home layout. Empty if none.
        static std::filesystem::path findJavaExecutable(const std::filesystem::path& javaHome);

        // Turns the java_path setting into an executable path. A bare "java" is looked up on
        // PATH. Throws BackendError when nothing usable exists.
        static std::filesystem::path normalizeJavaPath(const std::string& javaPath);

    private:
        const Config& m_config;
        JavaDownloader m_javaDownloader;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember
#endif // EMBER_JAVA_MANAGER_HPP
