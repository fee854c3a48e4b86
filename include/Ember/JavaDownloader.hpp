// include/Ember/JavaDownloader.hpp
#ifndef EMBER_JAVA_DOWNLOADER_HPP
#define EMBER_JAVA_DOWNLOADER_HPP

#include <Ember/Types/JavaInstallation.hpp>

#include <string>
#include <vector>
#include <filesystem>
#include <spdlog/logger.h>
#include <nlohmann/json_fwd.hpp>

namespace Ember {

    class HttpManager;

    namespace Utils {
        class CancellationToken;
    }

    // One downloadable Temurin build as described by the Adoptium assets API
    struct AdoptiumPackage {
        std::string link;
        std::string name;
        std::string checksum; // SHA-256, hex
    };

    class JavaDownloader {
    public:
        static constexpr const char* ADOPTIUM_API = "https://api.adoptium.net/v3";

        explicit JavaDownloader(HttpManager& httpManager);

        // Major versions Adoptium publishes, ascending. Throws BackendError.
        std::vector<unsigned int> fetchAvailableReleases();

        // Downloads the newest Temurin build for this machine into downloadDir and verifies its
        // SHA-256. Returns the archive path. Throws BackendError.
        std::filesystem::path downloadAdoptium(unsigned int majorVersion, ImageType imageType,
                                               const std::filesystem::path& downloadDir,
                                               const Utils::CancellationToken* cancel = nullptr);

        static std::vector<unsigned int> parseAvailableReleases(const nlohmann::json& j);
        // First entry of a /v3/assets/latest response. Throws BackendError when it is empty or malformed.
        static AdoptiumPackage parseLatestAsset(const nlohmann::json& j);

    private:
        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_JAVA_DOWNLOADER_HPP
