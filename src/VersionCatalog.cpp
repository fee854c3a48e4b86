// src/VersionCatalog.cpp
#include <Ember/VersionCatalog.hpp>
#include <Ember/Backend.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/Types/ModLoader.hpp>
#include <Ember/Utils/Logger.hpp>

#include <algorithm>
#include <future>
#include <stdexcept>

namespace Ember {

VersionFilter string_to_version_filter(const std::string& s) {
    if (s == "all") return VersionFilter::ALL;
    if (s == "release") return VersionFilter::RELEASE;
    if (s == "snapshot") return VersionFilter::SNAPSHOT;
    if (s == "modded") return VersionFilter::MODDED;
    throw std::runtime_error("Unknown version filter: " + s);
}

VersionCatalog::VersionCatalog(Backend& backend, StatusBoard& status)
    : m_backend(backend), m_status(status) {
    m_logger = Utils::Logger::GetOrCreateLogger("VersionCatalog");
}

bool VersionCatalog::refresh() {
    m_logger->debug("Refreshing manifest and installed versions");
    auto manifestFuture = std::async(std::launch::async, [this] { return m_backend.getVersions(); });
    auto installedFuture = std::async(std::launch::async, [this] { return m_backend.getInstalledVersions(); });

    std::vector<Version> manifest;
    std::vector<std::string> installed;
    std::string error;
    // Join both before looking at either result
    try {
        manifest = manifestFuture.get();
    } catch (const std::exception& e) {
        error = e.what();
    }
    try {
        installed = installedFuture.get();
    } catch (const std::exception& e) {
        if (error.empty()) error = e.what();
    }

    if (!error.empty()) {
        m_logger->error("Failed to fetch versions: {}", error);
        m_status.setStatus("Error fetching versions: " + error);
        return false;
    }

    m_vanilla = std::move(manifest);
    m_installedIds = std::move(installed);
    if (auto selection = pickDefaultSelection(m_vanilla, m_installedIds)) {
        m_selected = *selection;
    }
    m_logger->info("Catalog has {} versions, {} installed, selected '{}'",
                   m_vanilla.size(), m_installedIds.size(), m_selected);
    return true;
}

bool VersionCatalog::refreshModLoaders() {
    std::vector<Version> loaders;
    try {
        for (const auto& id : m_backend.listInstalledFabricVersions()) {
            loaders.push_back(Version{id, VersionType::FABRIC, std::nullopt, std::nullopt, std::nullopt});
        }
        for (const auto& id : m_backend.listInstalledForgeVersions()) {
            loaders.push_back(Version{id, VersionType::FORGE, std::nullopt, std::nullopt, std::nullopt});
        }
    } catch (const std::exception& e) {
        m_logger->error("Failed to list installed mod loaders: {}", e.what());
        m_status.setStatus(std::string("Error listing mod loaders: ") + e.what());
        return false;
    }
    m_modLoaders = std::move(loaders);
    return true;
}

bool VersionCatalog::refreshAll() {
    const bool catalogOk = refresh();
    const bool loadersOk = refreshModLoaders();
    return catalogOk && loadersOk;
}

std::vector<Version> VersionCatalog::versions() const {
    std::vector<Version> all = m_modLoaders;
    all.insert(all.end(), m_vanilla.begin(), m_vanilla.end());
    return all;
}

std::optional<Version> VersionCatalog::find(const std::string& id) const {
    for (const auto* list : {&m_modLoaders, &m_vanilla}) {
        auto it = std::find_if(list->begin(), list->end(), [&](const Version& v) { return v.id == id; });
        if (it != list->end()) {
            return *it;
        }
    }
    return std::nullopt;
}

bool VersionCatalog::isVanilla(const std::string& id) const {
    return std::any_of(m_vanilla.begin(), m_vanilla.end(), [&](const Version& v) { return v.id == id; });
}

bool VersionCatalog::contains(const std::string& id) const {
    if (find(id)) {
        return true;
    }
    // Installed loader ids count even before refreshModLoaders() has run
    return classify_version_id(id) != LoaderKind::NONE &&
           std::find(m_installedIds.begin(), m_installedIds.end(), id) != m_installedIds.end();
}

std::vector<Version> VersionCatalog::filter(const std::string& query, VersionFilter typeFilter) const {
    return filter(versions(), query, typeFilter);
}

std::vector<Version> VersionCatalog::filter(const std::vector<Version>& source, const std::string& query,
                                            VersionFilter typeFilter) {
    const std::string needle = normalizeQuery(query);
    std::vector<Version> result;
    for (const auto& version : source) {
        bool typeMatches = false;
        switch (typeFilter) {
            case VersionFilter::ALL: typeMatches = true; break;
            case VersionFilter::RELEASE: typeMatches = version.type == VersionType::RELEASE; break;
            case VersionFilter::SNAPSHOT: typeMatches = version.type == VersionType::SNAPSHOT; break;
            case VersionFilter::MODDED: typeMatches = version.isModded(); break;
        }
        if (!typeMatches) continue;
        if (!needle.empty() && normalizeQuery(version.id).find(needle) == std::string::npos) continue;
        result.push_back(version);
    }
    return result;
}

std::string VersionCatalog::normalizeQuery(const std::string& query) {
    static const std::string fullWidthStop = "\xE3\x80\x82"; // U+3002 in UTF-8
    std::string normalized;
    normalized.reserve(query.size());
    for (size_t i = 0; i < query.size();) {
        if (query.compare(i, fullWidthStop.size(), fullWidthStop) == 0) {
            normalized += '.';
            i += fullWidthStop.size();
            continue;
        }
        char c = query[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        normalized += c;
        ++i;
    }
    return normalized;
}

std::optional<std::string> VersionCatalog::pickDefaultSelection(const std::vector<Version>& manifest,
                                                                const std::vector<std::string>& installedIds) {
    if (installedIds.empty()) {
        return std::nullopt;
    }

    auto isInstalled = [&](const Version& v) {
        return std::find(installedIds.begin(), installedIds.end(), v.id) != installedIds.end();
    };

    const Version* firstInstalled = nullptr;
    for (const auto& version : manifest) {
        if (!isInstalled(version)) continue;
        if (version.type == VersionType::RELEASE) {
            return version.id;
        }
        if (!firstInstalled) {
            firstInstalled = &version;
        }
    }
    if (firstInstalled) {
        return firstInstalled->id;
    }
    return installedIds.front();
}

} // namespace Ember
