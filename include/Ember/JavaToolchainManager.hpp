// include/Ember/JavaToolchainManager.hpp
#ifndef EMBER_JAVA_TOOLCHAIN_MANAGER_HPP
#define EMBER_JAVA_TOOLCHAIN_MANAGER_HPP

#include <Ember/Types/JavaInstallation.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Ember {

    class Backend;
    class SettingsManager;
    class StatusBoard;

    enum class JavaPickerState {
        CLOSED,
        FETCHING_VERSIONS,
        READY,
        DOWNLOADING,
    };

    std::string java_picker_state_to_string(JavaPickerState state);

    // Detects Java installations and drives the "download a JRE/JDK" picker.
    // At most one download runs at a time; while it runs the picker cannot be closed.
    class JavaToolchainManager {
    public:
        JavaToolchainManager(Backend& backend, SettingsManager& settings, StatusBoard& status,
                             std::chrono::milliseconds closeDelay = std::chrono::milliseconds(1500));

        // False only when the scan itself failed. An empty result is a successful scan.
        bool detect();
        const std::vector<JavaInstallation>& installations() const { return m_installations; }
        bool isDetecting() const { return m_detecting; }

        void openDownloadPicker();
        void closeDownloadPicker();

        // Downloads the picker's current selection
        bool download();
        // Returns false if another download is in flight or the download failed.
        bool download(unsigned int majorVersion, ImageType imageType,
                      const std::optional<std::filesystem::path>& customPath = std::nullopt);

        // Plain assignment of settings().javaPath; the path is validated at launch time.
        void selectJava(const std::string& path);

        void selectMajorVersion(unsigned int majorVersion) { m_selectedMajor = majorVersion; }
        void selectImageType(ImageType imageType) { m_selectedImageType = imageType; }

        JavaPickerState pickerState() const { return m_pickerState; }
        bool isPickerOpen() const { return m_pickerState != JavaPickerState::CLOSED; }
        bool isDownloading() const { return m_downloading.load(); }
        const std::string& pickerStatus() const { return m_pickerStatus; }
        const std::vector<unsigned int>& availableVersions() const { return m_availableVersions; }
        unsigned int selectedMajorVersion() const { return m_selectedMajor; }
        ImageType selectedImageType() const { return m_selectedImageType; }

        // 21 if offered, else 17, else the last (highest) offered, else fallback.
        static unsigned int pickDefaultMajorVersion(const std::vector<unsigned int>& available, unsigned int fallback);

    private:
        Backend& m_backend;
        SettingsManager& m_settings;
        StatusBoard& m_status;
        std::chrono::milliseconds m_closeDelay;

        std::vector<JavaInstallation> m_installations;
        bool m_detecting = false;

        JavaPickerState m_pickerState = JavaPickerState::CLOSED;
        std::vector<unsigned int> m_availableVersions;
        unsigned int m_selectedMajor = 21;
        ImageType m_selectedImageType = ImageType::JRE;
        std::string m_pickerStatus;
        std::atomic<bool> m_downloading{false};

        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Ember

#endif // EMBER_JAVA_TOOLCHAIN_MANAGER_HPP
