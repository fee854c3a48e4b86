// src/DownloadQueue.cpp
#include <Ember/DownloadQueue.hpp>
#include <Ember/Backend.hpp>
#include <Ember/HttpManager.hpp>
#include <Ember/Utils/Cancellation.hpp>
#include <Ember/Utils/Crypto.hpp>
#include <Ember/Utils/Logger.hpp>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace Ember {

std::string download_status_to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::VERIFYING: return "Verifying";
        case DownloadStatus::SKIPPED: return "Skipped";
        case DownloadStatus::DOWNLOADING: return "Downloading";
        case DownloadStatus::FINISHED: return "Finished";
        case DownloadStatus::FAILED: return "Error";
        default: throw std::runtime_error("Unknown DownloadStatus enum");
    }
}

struct DownloadQueue::BatchState {
    std::atomic<std::size_t> nextTask{0};
    std::atomic<std::size_t> completedFiles{0};
    std::atomic<std::uint64_t> totalDownloadedBytes{0};
    std::size_t totalFiles = 0;

    std::mutex errorMutex;
    std::vector<std::string> errors;
};

DownloadQueue::DownloadQueue(HttpManager& httpManager, unsigned int maxConcurrent, const Utils::CancellationToken* cancel)
    : m_httpManager(httpManager), m_maxConcurrent(std::max(1u, maxConcurrent)), m_cancel(cancel) {
    m_logger = Utils::Logger::GetOrCreateLogger("DownloadQueue");
}

bool DownloadQueue::isAlreadyValid(const DownloadTask& task) {
    std::error_code ec;
    if (!task.sha1 || !std::filesystem::is_regular_file(task.path, ec)) {
        return false;
    }
    return Utils::calculateFileSHA1(task.path.string()) == *task.sha1;
}

void DownloadQueue::emit(const DownloadProgress& progress) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    if (m_listener) {
        m_listener(progress);
    }
}

void DownloadQueue::run(const std::vector<DownloadTask>& tasks) {
    if (tasks.empty()) {
        return;
    }
    BatchState state;
    state.totalFiles = tasks.size();

    const std::size_t workerCount = std::min<std::size_t>(m_maxConcurrent, tasks.size());
    m_logger->info("Downloading {} files on {} threads", tasks.size(), workerCount);

    auto worker = [&]() {
        for (;;) {
            if (m_cancel != nullptr && m_cancel->isCancelled()) {
                return;
            }
            const std::size_t index = state.nextTask.fetch_add(1);
            if (index >= tasks.size()) {
                return;
            }
            processTask(tasks[index], state);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (m_cancel != nullptr && m_cancel->isCancelled()) {
        throw BackendError("Download cancelled");
    }
    if (!state.errors.empty()) {
        m_logger->error("{} of {} downloads failed", state.errors.size(), tasks.size());
        throw BackendError(std::to_string(state.errors.size()) + " of " + std::to_string(tasks.size()) +
                           " downloads failed; first error: " + state.errors.front());
    }
    m_logger->info("All {} files are in place", tasks.size());
}

void DownloadQueue::processTask(const DownloadTask& task, BatchState& state) {
    const std::string fileName = task.path.filename().string();
    auto progressOf = [&](DownloadStatus status, std::uint64_t downloaded, std::uint64_t total) {
        DownloadProgress p;
        p.file = fileName;
        p.downloaded = downloaded;
        p.total = total;
        p.status = status;
        p.completedFiles = state.completedFiles.load();
        p.totalFiles = state.totalFiles;
        p.totalDownloadedBytes = state.totalDownloadedBytes.load();
        return p;
    };

    std::error_code ec;
    if (std::filesystem::exists(task.path, ec)) {
        emit(progressOf(DownloadStatus::VERIFYING, 0, 0));
        if (isAlreadyValid(task)) {
            state.completedFiles.fetch_add(1);
            emit(progressOf(DownloadStatus::SKIPPED, 0, 0));
            return;
        }
    }

    auto fail = [&](const std::string& reason) {
        m_logger->error("{}: {}", fileName, reason);
        {
            std::lock_guard<std::mutex> lock(state.errorMutex);
            state.errors.push_back(fileName + ": " + reason);
        }
        emit(progressOf(DownloadStatus::FAILED, 0, 0));
    };

    std::uint64_t counted = 0;
    cpr::Response response = m_httpManager.Download(task.path, cpr::Url{task.url}, m_cancel,
        [&](std::uint64_t now, std::uint64_t total) {
            if (now > counted) {
                state.totalDownloadedBytes.fetch_add(now - counted);
                counted = now;
            }
            emit(progressOf(DownloadStatus::DOWNLOADING, now, total));
        });
    if (!HttpManager::isSuccess(response)) {
        fail(HttpManager::describeFailure(response));
        return;
    }
    if (task.sha1 && Utils::calculateFileSHA1(task.path.string()) != *task.sha1) {
        std::filesystem::remove(task.path, ec);
        fail("checksum mismatch");
        return;
    }

    state.completedFiles.fetch_add(1);
    emit(progressOf(DownloadStatus::FINISHED, 0, 0));
}

} // namespace Ember
