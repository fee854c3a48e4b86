// src/VersionRepository.cpp
#include <Ember/VersionRepository.hpp>
#include <Ember/Backend.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/Utils/Crypto.hpp>
#include <Ember/Utils/Logger.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace Ember {

namespace {

constexpr int MAX_INHERITANCE_DEPTH = 8;

} // namespace

VersionRepository::VersionRepository(const Config& config, HttpManager& httpManager)
    : m_config(config), m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("VersionRepository");
}

std::vector<Version> VersionRepository::parseManifest(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("versions") || !j.at("versions").is_array()) {
        throw BackendError("Version manifest has no versions list");
    }
    std::vector<Version> versions;
    versions.reserve(j.at("versions").size());
    for (const auto& entry : j.at("versions")) {
        try {
            versions.push_back(Version::from_json(entry));
        } catch (const std::exception& e) {
            CORE_LOG_WARN("[VersionRepository] Skipping manifest entry {}: {}", entry.value("id", "?"), e.what());
        }
    }
    return versions;
}

std::vector<Version> VersionRepository::fetchManifest() {
    std::lock_guard<std::mutex> lock(m_manifestMutex);
    if (m_manifest) {
        return *m_manifest;
    }
    m_logger->info("Fetching version manifest from {}", MANIFEST_URL);
    std::vector<Version> versions = parseManifest(m_httpManager.GetJson(cpr::Url{MANIFEST_URL}));
    m_logger->info("Manifest lists {} versions", versions.size());
    m_manifest = versions;
    return versions;
}

std::optional<Version> VersionRepository::findInManifest(const std::string& id) {
    const auto versions = fetchManifest();
    auto it = std::find_if(versions.begin(), versions.end(), [&](const Version& v) { return v.id == id; });
    if (it == versions.end()) {
        return std::nullopt;
    }
    return *it;
}

std::filesystem::path VersionRepository::versionDirectory(const std::string& id) const {
    return m_config.versionsDir / id;
}

std::filesystem::path VersionRepository::versionJsonPath(const std::string& id) const {
    return versionDirectory(id) / (id + ".json");
}

std::filesystem::path VersionRepository::clientJarPath(const std::string& id) const {
    return versionDirectory(id) / (id + ".jar");
}

std::filesystem::path VersionRepository::nativesDirectory(const std::string& id) const {
    return versionDirectory(id) / "natives";
}

std::vector<std::string> VersionRepository::installedVersionIds() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::is_directory(m_config.versionsDir, ec)) {
        return ids;
    }
    for (const auto& entry : std::filesystem::directory_iterator(m_config.versionsDir, ec)) {
        if (!entry.is_directory(ec)) continue;
        const std::string id = entry.path().filename().string();
        if (std::filesystem::is_regular_file(entry.path() / (id + ".json"), ec)) {
            ids.push_back(id);
        }
    }
    if (ec) {
        throw BackendError("Failed to list " + m_config.versionsDir.string() + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> VersionRepository::installedLoaderIds(LoaderKind kind) const {
    std::vector<std::string> ids = installedVersionIds();
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [kind](const std::string& id) { return classify_version_id(id) != kind; }),
              ids.end());
    return ids;
}

bool VersionRepository::isInstalled(const std::string& id) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(versionJsonPath(id), ec);
}

nlohmann::json VersionRepository::readVersionJson(const std::string& id) const {
    const auto path = versionJsonPath(id);
    std::ifstream in(path);
    if (!in) {
        throw BackendError("Version " + id + " is not installed");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        m_logger->error("Failed to parse {}: {}", path.string(), e.what());
        throw BackendError("Corrupt version file for " + id + ": " + e.what());
    }
}

void VersionRepository::writeVersionJson(const std::string& id, const nlohmann::json& j) const {
    std::error_code ec;
    std::filesystem::create_directories(versionDirectory(id), ec);
    if (ec) {
        throw BackendError("Failed to create " + versionDirectory(id).string() + ": " + ec.message());
    }
    std::ofstream out(versionJsonPath(id), std::ios::trunc);
    if (!out) {
        throw BackendError("Failed to write " + versionJsonPath(id).string());
    }
    out << j.dump(2);
}

void VersionRepository::ensureVersionJson(const std::string& id) {
    const auto path = versionJsonPath(id);
    std::optional<Version> entry;
    try {
        entry = findInManifest(id);
    } catch (const BackendError& e) {
        if (isInstalled(id)) {
            m_logger->warn("Cannot check {} against the manifest: {}", id, e.what());
            return;
        }
        throw;
    }

    if (!entry || !entry->url) {
        if (isInstalled(id)) {
            return;
        }
        throw BackendError("Version " + id + " is not installed or unknown");
    }

    if (isInstalled(id)) {
        if (!entry->sha1 || Utils::calculateFileSHA1(path.string()) == *entry->sha1) {
            return;
        }
        m_logger->warn("{} does not match the manifest checksum, downloading again", path.string());
    }

    m_logger->info("Downloading version JSON for {}", id);
    cpr::Response response = m_httpManager.Download(path, cpr::Url{*entry->url});
    if (!HttpManager::isSuccess(response)) {
        throw BackendError("Failed to download version " + id + ": " + HttpManager::describeFailure(response));
    }
    if (entry->sha1 && Utils::calculateFileSHA1(path.string()) != *entry->sha1) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw BackendError("Checksum mismatch for version " + id);
    }
}

GameVersion VersionRepository::resolve(const std::string& id) {
    if (!isInstalled(id)) {
        ensureVersionJson(id);
    }

    GameVersion version;
    try {
        version = GameVersion::from_json(readVersionJson(id));
    } catch (const nlohmann::json::exception& e) {
        throw BackendError("Invalid version file for " + id + ": " + e.what());
    }

    const bool explicitJar = version.jar.has_value();
    int depth = 0;
    while (version.inheritsFrom) {
        if (++depth > MAX_INHERITANCE_DEPTH) {
            throw BackendError("Inheritance chain of " + id + " is too deep");
        }
        const std::string parentId = *version.inheritsFrom;
        m_logger->debug("{} inherits from {}", version.id, parentId);
        ensureVersionJson(parentId);
        GameVersion parent;
        try {
            parent = GameVersion::from_json(readVersionJson(parentId));
        } catch (const nlohmann::json::exception& e) {
            throw BackendError("Invalid version file for " + parentId + ": " + e.what());
        }
        GameVersion merged = GameVersion::merge(version, parent);
        // A grandparent is still pending when the parent itself inherits
        merged.inheritsFrom = parent.inheritsFrom;
        if (!explicitJar && !parent.jar && parent.inheritsFrom) {
            merged.jar.reset(); // the client jar belongs to the root of the chain
        }
        version = std::move(merged);
    }
    return version;
}

} // namespace Ember
