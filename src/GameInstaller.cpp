// src/GameInstaller.cpp
#include <Ember/GameInstaller.hpp>
#include <Ember/Backend.hpp>
#include <Ember/VersionRepository.hpp>
#include <Ember/Utils/Archive.hpp>
#include <Ember/Utils/Logger.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace Ember {

GameInstaller::GameInstaller(const Config& config, VersionRepository& versions, HttpManager& httpManager)
    : m_config(config), m_versions(versions), m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("GameInstaller");
}

std::string GameInstaller::archBits(const RuleContext& ctx) {
    return (ctx.arch == "x86" || ctx.arch == "arm32") ? "32" : "64";
}

std::filesystem::path GameInstaller::assetIndexPath(const GameVersion& version) const {
    return m_config.assetsDir / "indexes" / (version.assetIndex->id + ".json");
}

std::vector<DownloadTask> GameInstaller::collectTasks(const GameVersion& version, const RuleContext& ctx) const {
    std::vector<DownloadTask> tasks;
    std::set<std::filesystem::path> queued;
    auto add = [&](const std::string& url, const std::filesystem::path& path, const std::string& sha1) {
        if (url.empty() || !queued.insert(path).second) {
            return;
        }
        tasks.push_back({url, path, sha1.empty() ? std::nullopt : std::optional<std::string>(sha1)});
    };

    const std::string jarId = version.jar.value_or(version.id);
    if (auto it = version.downloads.find(MinecraftJARType::CLIENT); it != version.downloads.end()) {
        add(it->second.url, m_versions.clientJarPath(jarId), it->second.sha1);
    }

    const std::string bits = archBits(ctx);
    for (const auto& library : version.libraries) {
        if (!rules_allow(library.rules, ctx)) {
            continue;
        }
        if (auto artifact = library.resolveArtifact()) {
            if (artifact->url.empty()) {
                // Produced locally by a loader installer
                std::error_code ec;
                if (!std::filesystem::exists(m_config.librariesDir / artifact->path, ec)) {
                    m_logger->warn("Library {} has no download url and is missing", library.name);
                }
            } else {
                add(artifact->url, m_config.librariesDir / artifact->path, artifact->sha1);
            }
        }
        if (auto natives = library.resolveNatives(ctx.osName, bits)) {
            add(natives->url, m_config.librariesDir / natives->path, natives->sha1);
        }
    }

    if (version.assetIndex) {
        add(version.assetIndex->url, assetIndexPath(version), version.assetIndex->sha1);
    }
    return tasks;
}

std::vector<DownloadTask> GameInstaller::assetObjectTasks(const nlohmann::json& assetIndex,
                                                          const std::filesystem::path& assetsDir) {
    std::vector<DownloadTask> tasks;
    if (!assetIndex.contains("objects") || !assetIndex.at("objects").is_object()) {
        return tasks;
    }
    std::set<std::string> seen;
    for (const auto& [name, object] : assetIndex.at("objects").items()) {
        const std::string hash = object.value("hash", "");
        if (hash.size() < 2 || !seen.insert(hash).second) {
            continue;
        }
        const std::string prefix = hash.substr(0, 2);
        tasks.push_back({std::string(RESOURCES_URL) + prefix + "/" + hash,
                         assetsDir / "objects" / prefix / hash, hash});
    }
    return tasks;
}

void GameInstaller::extractNatives(const GameVersion& version, const RuleContext& ctx,
                                   const std::filesystem::path& dir) const {
    const std::string bits = archBits(ctx);
    for (const auto& library : version.libraries) {
        if (!rules_allow(library.rules, ctx)) {
            continue;
        }
        auto natives = library.resolveNatives(ctx.osName, bits);
        if (!natives) {
            continue;
        }
        std::vector<std::string> excludes = {"META-INF/"};
        if (library.extract) {
            excludes.insert(excludes.end(), library.extract->exclude.begin(), library.extract->exclude.end());
        }
        const auto jar = m_config.librariesDir / natives->path;
        if (!Utils::extractZipFiltered(jar, dir, excludes)) {
            throw BackendError("Failed to extract natives from " + jar.filename().string());
        }
    }
}

void GameInstaller::install(const GameVersion& version, unsigned int downloadThreads,
                            const Utils::CancellationToken* cancel,
                            const DownloadQueue::ProgressListener& listener) {
    const RuleContext ctx = RuleContext::current();
    m_logger->info("Installing files for {}", version.id);

    DownloadQueue queue(m_httpManager, downloadThreads, cancel);
    queue.setListener(listener);
    queue.run(collectTasks(version, ctx));

    if (version.assetIndex) {
        std::ifstream in(assetIndexPath(version));
        if (!in) {
            throw BackendError("Asset index " + version.assetIndex->id + " is missing");
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        nlohmann::json index;
        try {
            index = nlohmann::json::parse(buffer.str());
        } catch (const nlohmann::json::parse_error& e) {
            throw BackendError("Corrupt asset index " + version.assetIndex->id + ": " + e.what());
        }
        queue.run(assetObjectTasks(index, m_config.assetsDir));
    } else {
        m_logger->warn("{} has no asset index", version.id);
    }

    extractNatives(version, ctx, m_versions.nativesDirectory(version.id));
    m_logger->info("{} is installed", version.id);
}

} // namespace Ember
