// src/JavaToolchainManager.cpp
#include <Ember/JavaToolchainManager.hpp>
#include <Ember/Backend.hpp>
#include <Ember/SettingsManager.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/Utils/Logger.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace Ember {

namespace {

// Clears the in-flight flag however download() exits
class DownloadFlagGuard {
public:
    explicit DownloadFlagGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~DownloadFlagGuard() { m_flag.store(false); }
    DownloadFlagGuard(const DownloadFlagGuard&) = delete;
    DownloadFlagGuard& operator=(const DownloadFlagGuard&) = delete;

private:
    std::atomic<bool>& m_flag;
};

std::string toUpper(std::string s) {
    for (auto& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

} // namespace

std::string java_picker_state_to_string(JavaPickerState state) {
    switch (state) {
        case JavaPickerState::CLOSED: return "closed";
        case JavaPickerState::FETCHING_VERSIONS: return "fetching_versions";
        case JavaPickerState::READY: return "ready";
        case JavaPickerState::DOWNLOADING: return "downloading";
        default: throw std::runtime_error("Unknown JavaPickerState enum");
    }
}

JavaToolchainManager::JavaToolchainManager(Backend& backend, SettingsManager& settings, StatusBoard& status,
                                           std::chrono::milliseconds closeDelay)
    : m_backend(backend), m_settings(settings), m_status(status), m_closeDelay(closeDelay) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaToolchain");
    if (m_closeDelay < std::chrono::milliseconds::zero()) {
        m_closeDelay = std::chrono::milliseconds::zero();
    }
    if (m_closeDelay > std::chrono::milliseconds(10000)) {
        m_closeDelay = std::chrono::milliseconds(10000);
    }
}

bool JavaToolchainManager::detect() {
    m_detecting = true;
    bool ok = true;
    try {
        m_installations = m_backend.detectJava();
        if (m_installations.empty()) {
            m_status.setStatus("No Java installations found");
        } else {
            m_status.setStatus("Found " + std::to_string(m_installations.size()) + " Java installation(s)");
        }
    } catch (const std::exception& e) {
        m_logger->error("Failed to detect Java: {}", e.what());
        m_status.setStatus(std::string("Error detecting Java: ") + e.what());
        ok = false;
    }
    m_detecting = false;
    return ok;
}

void JavaToolchainManager::openDownloadPicker() {
    if (m_downloading.load()) {
        return;
    }
    m_pickerState = JavaPickerState::FETCHING_VERSIONS;
    m_pickerStatus.clear();
    try {
        m_availableVersions = m_backend.fetchAvailableJavaVersions();
        m_selectedMajor = pickDefaultMajorVersion(m_availableVersions, m_selectedMajor);
        m_logger->debug("{} Java major versions available, defaulting to {}", m_availableVersions.size(), m_selectedMajor);
    } catch (const std::exception& e) {
        m_logger->error("Failed to fetch available Java versions: {}", e.what());
        m_pickerStatus = std::string("Error fetching Java versions: ") + e.what();
    }
    m_pickerState = JavaPickerState::READY;
}

void JavaToolchainManager::closeDownloadPicker() {
    if (m_downloading.load()) {
        m_logger->debug("Ignoring close request while a download is in flight");
        return;
    }
    m_pickerState = JavaPickerState::CLOSED;
}

bool JavaToolchainManager::download() {
    return download(m_selectedMajor, m_selectedImageType);
}

bool JavaToolchainManager::download(unsigned int majorVersion, ImageType imageType,
                                    const std::optional<std::filesystem::path>& customPath) {
    if (m_downloading.exchange(true)) {
        m_logger->warn("Java download already in progress; rejecting request for Java {}", majorVersion);
        return false;
    }
    DownloadFlagGuard guard(m_downloading);

    m_selectedMajor = majorVersion;
    m_selectedImageType = imageType;
    m_pickerState = JavaPickerState::DOWNLOADING;
    const std::string label = std::to_string(majorVersion);
    m_pickerStatus = "Downloading Java " + label + " " + toUpper(image_type_to_string(imageType)) + "...";
    m_logger->info("{}", m_pickerStatus);

    JavaInstallation installed;
    try {
        installed = m_backend.downloadAdoptiumJava(majorVersion, imageType, customPath);
    } catch (const std::exception& e) {
        m_logger->error("Failed to download Java {}: {}", majorVersion, e.what());
        m_pickerStatus = std::string("Download failed: ") + e.what();
        m_pickerState = JavaPickerState::READY;
        return false;
    }

    m_pickerStatus = "Java " + label + " installed at " + installed.path;
    m_settings.settings().javaPath = installed.path;
    detect();

    std::this_thread::sleep_for(m_closeDelay);
    m_pickerState = JavaPickerState::CLOSED;
    m_status.setStatus("Java " + label + " is ready to use!");
    return true;
}

void JavaToolchainManager::selectJava(const std::string& path) {
    m_settings.settings().javaPath = path;
}

unsigned int JavaToolchainManager::pickDefaultMajorVersion(const std::vector<unsigned int>& available,
                                                           unsigned int fallback) {
    for (unsigned int preferred : {21u, 17u}) {
        if (std::find(available.begin(), available.end(), preferred) != available.end()) {
            return preferred;
        }
    }
    if (!available.empty()) {
        return *std::max_element(available.begin(), available.end());
    }
    return fallback;
}

} // namespace Ember
