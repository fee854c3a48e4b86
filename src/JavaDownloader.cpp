// src/JavaDownloader.cpp
#include <Ember/JavaDownloader.hpp>
#include <Ember/Backend.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/Utils/Crypto.hpp>
#include <Ember/Utils/Logger.hpp>
#include <Ember/Utils/OS.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace Ember {

JavaDownloader::JavaDownloader(HttpManager& httpManager) : m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaDownloader");
    m_logger->trace("Initialized.");
}

std::vector<unsigned int> JavaDownloader::parseAvailableReleases(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("available_releases") || !j.at("available_releases").is_array()) {
        throw BackendError("Adoptium response has no available_releases list");
    }
    std::vector<unsigned int> releases;
    for (const auto& entry : j.at("available_releases")) {
        if (entry.is_number_integer() && entry.get<long long>() > 0) {
            releases.push_back(entry.get<unsigned int>());
        }
    }
    std::sort(releases.begin(), releases.end());
    releases.erase(std::unique(releases.begin(), releases.end()), releases.end());
    return releases;
}

AdoptiumPackage JavaDownloader::parseLatestAsset(const nlohmann::json& j) {
    if (!j.is_array() || j.empty()) {
        throw BackendError("No Temurin build is available for this platform");
    }
    const nlohmann::json& firstBuild = j[0];
    if (!firstBuild.contains("binary") || !firstBuild["binary"].contains("package") ||
        !firstBuild["binary"]["package"].contains("link") ||
        !firstBuild["binary"]["package"].contains("name") ||
        !firstBuild["binary"]["package"].contains("checksum")) {
        throw BackendError("Adoptium response is missing package details");
    }
    const auto& package = firstBuild["binary"]["package"];
    return AdoptiumPackage{package["link"].get<std::string>(), package["name"].get<std::string>(),
                           package["checksum"].get<std::string>()};
}

std::vector<unsigned int> JavaDownloader::fetchAvailableReleases() {
    const std::string url = std::string(ADOPTIUM_API) + "/info/available_releases";
    m_logger->info("Adoptium API - Fetching available releases from {}", url);
    std::vector<unsigned int> releases = parseAvailableReleases(m_httpManager.GetJson(cpr::Url{url}));
    m_logger->debug("Adoptium API - {} releases available", releases.size());
    return releases;
}

std::filesystem::path JavaDownloader::downloadAdoptium(unsigned int majorVersion, ImageType imageType,
                                                       const std::filesystem::path& downloadDir,
                                                       const Utils::CancellationToken* cancel) {
    m_logger->info("Adoptium API - Downloading Java {} ({})", majorVersion, image_type_to_string(imageType));

    const std::string adoptiumOS = Utils::getOSStringForAdoptium(Utils::getCurrentOS());
    const std::string adoptiumArch = Utils::getArchStringForAdoptium(Utils::getCurrentArch());
    if (adoptiumOS.empty() || adoptiumArch.empty()) {
        throw BackendError("Unsupported platform for Adoptium downloads");
    }

    const std::string apiUrl = std::string(ADOPTIUM_API) + "/assets/latest/" + std::to_string(majorVersion) + "/hotspot";
    cpr::Parameters params = {
        {"architecture", adoptiumArch},
        {"heap_size", "normal"},
        {"image_type", image_type_to_string(imageType)},
        {"os", adoptiumOS},
        {"vendor", "eclipse"}
    };
    m_logger->debug("Adoptium API - Querying: {} with params: arch={}, os={}", apiUrl, adoptiumArch, adoptiumOS);
    const AdoptiumPackage package = parseLatestAsset(m_httpManager.GetJson(cpr::Url{apiUrl}, params));
    m_logger->info("Adoptium API - Found {} ({})", package.name, package.link);

    std::error_code ec;
    std::filesystem::create_directories(downloadDir, ec);
    if (ec) {
        throw BackendError("Failed to create " + downloadDir.string() + ": " + ec.message());
    }
    const std::filesystem::path downloadPath = downloadDir / package.name;

    cpr::Response response = m_httpManager.Download(downloadPath, cpr::Url{package.link}, cancel);
    if (!HttpManager::isSuccess(response)) {
        throw BackendError("Java download failed: " + HttpManager::describeFailure(response));
    }

    m_logger->debug("Adoptium API - Verifying SHA256 hash...");
    const std::string actualSha256 = Utils::calculateFileSHA256(downloadPath.string());
    std::string expected = package.checksum;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (actualSha256.empty() || actualSha256 != expected) {
        m_logger->error("Adoptium API - SHA256 hash mismatch! Expected: {}, Actual: {}", expected, actualSha256);
        std::filesystem::remove(downloadPath, ec);
        throw BackendError("Checksum mismatch for " + package.name);
    }
    m_logger->info("Adoptium API - Java archive downloaded and verified: {}", downloadPath.string());
    return downloadPath;
}

} // namespace Ember
