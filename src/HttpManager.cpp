// src/HttpManager.cpp
#include <Ember/HttpManager.hpp>
#include <Ember/Backend.hpp>
#include <Ember/Utils/Cancellation.hpp>
#include <Ember/Utils/Logger.hpp>
#include <fstream>

namespace Ember {

HttpManager::HttpManager(std::chrono::milliseconds timeout) : m_timeoutMs(static_cast<long>(timeout.count())) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
    // System CA store, full verification
    m_globalSslOptions = cpr::Ssl(cpr::ssl::VerifyHost{true}, cpr::ssl::VerifyPeer{true});
    m_logger->trace("HttpManager initialized with a {} ms timeout.", m_timeoutMs.load());
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

void HttpManager::setTimeout(std::chrono::milliseconds timeout) {
    m_timeoutMs.store(static_cast<long>(timeout.count()));
}

// One session per request keeps concurrent downloads independent.
cpr::Session HttpManager::CreateSession() const {
    cpr::Session session;
    session.SetSslOptions(m_globalSslOptions);
    session.SetUserAgent(cpr::UserAgent{USER_AGENT});
    session.SetRedirect(cpr::Redirect{true});
    session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::milliseconds(m_timeoutMs.load())});
    return session;
}

bool HttpManager::isSuccess(const cpr::Response& response) {
    return response.error.code == cpr::ErrorCode::OK && response.status_code >= 200 && response.status_code < 300;
}

std::string HttpManager::describeFailure(const cpr::Response& response) {
    if (response.error.code != cpr::ErrorCode::OK) {
        return response.error.message.empty() ? "request to " + response.url.str() + " failed"
                                              : response.error.message;
    }
    return "HTTP " + std::to_string(response.status_code) + " for " + response.url.str();
}

cpr::Response HttpManager::Get(const cpr::Url& url, const cpr::Parameters& parameters) {
    m_logger->trace("GET: {}", url.str());
    cpr::Session session = CreateSession();
    session.SetUrl(url);
    session.SetParameters(parameters);
    session.SetTimeout(cpr::Timeout{std::chrono::milliseconds(m_timeoutMs.load())});
    return session.Get();
}

cpr::Response HttpManager::Get(const cpr::Url& url, const cpr::Header& header, const cpr::Parameters& parameters) {
    m_logger->trace("GET with headers: {}", url.str());
    cpr::Session session = CreateSession();
    session.SetUrl(url);
    session.SetHeader(header);
    session.SetParameters(parameters);
    session.SetTimeout(cpr::Timeout{std::chrono::milliseconds(m_timeoutMs.load())});
    return session.Get();
}

nlohmann::json HttpManager::GetJson(const cpr::Url& url, const cpr::Parameters& parameters) {
    cpr::Response response = Get(url, parameters);
    if (!isSuccess(response)) {
        m_logger->error("GET {} failed. Status: {}, Error: \"{}\"", url.str(), response.status_code, response.error.message);
        throw BackendError(describeFailure(response));
    }
    try {
        return nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::parse_error& e) {
        m_logger->error("Failed to parse JSON from {}: {}", url.str(), e.what());
        throw BackendError("Invalid JSON from " + url.str() + ": " + e.what());
    }
}

cpr::Response HttpManager::Download(const std::filesystem::path& filepath, const cpr::Url& url,
                                    const Utils::CancellationToken* cancel, const ProgressFn& progress) {
    m_logger->debug("DOWNLOAD to file: {} -> {}", url.str(), filepath.string());
    std::error_code dirEc;
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path(), dirEc);
    }
    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        cpr::Response r_fail;
        r_fail.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        r_fail.error.message = "Failed to open file for writing: " + filepath.string();
        r_fail.url = url;
        r_fail.status_code = 0;
        m_logger->error("{}", r_fail.error.message);
        return r_fail;
    }

    const auto stallLimit = std::chrono::milliseconds(m_timeoutMs.load());
    auto lastActivity = std::chrono::steady_clock::now();
    cpr::cpr_off_t lastNow = 0;
    bool stalled = false;
    bool cancelled = false;

    cpr::Session session = CreateSession();
    session.SetUrl(url);
    session.SetProgressCallback(cpr::ProgressCallback{
        [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            if (cancel != nullptr && cancel->isCancelled()) {
                cancelled = true;
                return false;
            }
            const auto now = std::chrono::steady_clock::now();
            if (downloadNow != lastNow) {
                lastNow = downloadNow;
                lastActivity = now;
                if (progress) {
                    progress(static_cast<std::uint64_t>(downloadNow),
                             static_cast<std::uint64_t>(downloadTotal > 0 ? downloadTotal : 0));
                }
            } else if (stallLimit.count() > 0 && now - lastActivity > stallLimit) {
                stalled = true;
                return false;
            }
            return true;
        }});

    cpr::Response response = session.Download(file_stream);
    file_stream.close();

    if (cancelled) {
        response.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        response.error.message = "Download cancelled";
    } else if (stalled) {
        response.error.code = cpr::ErrorCode::OPERATION_TIMEDOUT;
        response.error.message = "No data received for " + std::to_string(stallLimit.count()) + " ms from " + url.str();
    }

    if (!isSuccess(response)) {
        m_logger->error("Download to file failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
        std::error_code ec;
        if (std::filesystem::exists(filepath, ec)) {
            std::filesystem::remove(filepath, ec);
            if (ec) {
                m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
            } else {
                m_logger->debug("Removed partially downloaded file: {}", filepath.string());
            }
        }
    } else {
        m_logger->debug("Download to file successful for {} to {}. Size: {}", url.str(), filepath.string(), response.downloaded_bytes);
    }
    return response;
}

} // namespace Ember
