// include/Ember/HttpManager.hpp
#ifndef EMBER_HTTP_MANAGER_HPP
#define EMBER_HTTP_MANAGER_HPP

#include <cpr/cpr.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace Ember {

    namespace Utils {
        class CancellationToken;
    }

    // Shared by every backend service. Each request gets its own cpr::Session, so the
    // manager can be used from several download threads at once.
    class HttpManager {
    public:
        // (bytes received so far, total bytes or 0 when unknown)
        using ProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

        explicit HttpManager(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
        ~HttpManager();

        // Wall-clock bound for Get(); for downloads, the longest stretch without any received byte.
        void setTimeout(std::chrono::milliseconds timeout);
        std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(m_timeoutMs.load()); }

        cpr::Response Get(const cpr::Url& url, const cpr::Parameters& parameters = {});
        cpr::Response Get(const cpr::Url& url, const cpr::Header& header, const cpr::Parameters& parameters = {});

        // GET and parse. Throws BackendError on a transport error, a non-2xx status or bad JSON.
        nlohmann::json GetJson(const cpr::Url& url, const cpr::Parameters& parameters = {});

        // Streams url into filepath. The partial file is removed on failure.
        // A set cancel token or a stalled transfer aborts with a failed response.
        cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url,
                               const Utils::CancellationToken* cancel = nullptr,
                               const ProgressFn& progress = {});

        static bool isSuccess(const cpr::Response& response);
        // "HTTP 404 for <url>" or the transport error message
        static std::string describeFailure(const cpr::Response& response);

        static constexpr const char* USER_AGENT = "Ember-Launcher/1.0";

    private:
        cpr::SslOptions m_globalSslOptions;
        std::atomic<long> m_timeoutMs;
        std::shared_ptr<spdlog::logger> m_logger;

        cpr::Session CreateSession() const;
    };

} // namespace Ember

#endif // EMBER_HTTP_MANAGER_HPP
