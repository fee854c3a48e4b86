// include/Ember/DownloadQueue.hpp
#ifndef EMBER_DOWNLOAD_QUEUE_HPP
#define EMBER_DOWNLOAD_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Ember {

    class HttpManager;

    namespace Utils {
        class CancellationToken;
    }

    struct DownloadTask {
        std::string url;
        std::filesystem::path path;
        std::optional<std::string> sha1;
    };

    enum class DownloadStatus {
        VERIFYING,
        SKIPPED,
        DOWNLOADING,
        FINISHED,
        FAILED,
    };

    std::string download_status_to_string(DownloadStatus status);

    struct DownloadProgress {
        std::string file;
        std::uint64_t downloaded = 0;
        std::uint64_t total = 0;
        DownloadStatus status = DownloadStatus::DOWNLOADING;
        std::size_t completedFiles = 0;
        std::size_t totalFiles = 0;
        std::uint64_t totalDownloadedBytes = 0;
    };

    // Fetches a batch of files on up to maxConcurrent worker threads. Files that already match
    // their SHA-1 are skipped.
    class DownloadQueue {
    public:
        // Invoked from worker threads, one call at a time
        using ProgressListener = std::function<void(const DownloadProgress&)>;

        DownloadQueue(HttpManager& httpManager, unsigned int maxConcurrent,
                      const Utils::CancellationToken* cancel = nullptr);

        void setListener(ProgressListener listener) { m_listener = std::move(listener); }

        // Returns once every task has finished. Throws BackendError if any failed or the batch
        // was cancelled; the successful files stay on disk.
        void run(const std::vector<DownloadTask>& tasks);

        // True when task.path exists and matches task.sha1. Without a checksum nothing is trusted.
        static bool isAlreadyValid(const DownloadTask& task);

    private:
        struct BatchState;

        HttpManager& m_httpManager;
        unsigned int m_maxConcurrent;
        const Utils::CancellationToken* m_cancel;
        ProgressListener m_listener;
        std::mutex m_listenerMutex;
        std::shared_ptr<spdlog::logger> m_logger;

        void processTask(const DownloadTask& task, BatchState& state);
        void emit(const DownloadProgress& progress);
    };

} // namespace Ember

#endif // EMBER_DOWNLOAD_QUEUE_HPP
