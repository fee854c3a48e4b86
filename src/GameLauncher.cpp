// src/GameLauncher.cpp
#include <Ember/GameLauncher.hpp>
#include <Ember/Backend.hpp>
#include <Ember/GameInstaller.hpp>
#include <Ember/JavaManager.hpp>
#include <Ember/VersionRepository.hpp>
#include <Ember/Utils/Logger.hpp>
#include <Ember/Utils/OS.hpp>
#include <Ember/Utils/Process.hpp>

#include <algorithm>
#include <set>
#include <sstream>

namespace Ember {

namespace {

// "group:artifact:version[:classifier][@ext]" -> "group:artifact[:classifier]"
std::string libraryKey(const std::string& name) {
    std::vector<std::string> parts;
    std::stringstream ss(name.substr(0, name.find('@')));
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (parts.size() < 2) {
        return name;
    }
    std::string key = parts[0] + ":" + parts[1];
    if (parts.size() > 3) {
        key += ":" + parts[3];
    }
    return key;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool isMemoryFlag(const std::string& arg) {
    return startsWith(arg, "-Xmx") || startsWith(arg, "-Xms");
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string token;
    while (in >> token) {
        out.push_back(token);
    }
    return out;
}

} // namespace

GameLauncher::GameLauncher(const Config& config, VersionRepository& versions, GameInstaller& installer)
    : m_config(config), m_versions(versions), m_installer(installer) {
    m_logger = Utils::Logger::GetOrCreateLogger("GameLauncher");
}

std::string GameLauncher::buildClasspath(const LaunchContext& ctx) {
    std::vector<std::string> entries;
    std::set<std::string> seen;
    for (const auto& library : ctx.version.libraries) {
        if (!rules_allow(library.rules, ctx.rules)) {
            continue;
        }
        auto artifact = library.resolveArtifact();
        if (!artifact) {
            continue;
        }
        if (!seen.insert(libraryKey(library.name)).second) {
            continue;
        }
        entries.push_back((ctx.librariesDir / artifact->path).string());
    }
    entries.push_back(ctx.clientJar.string());

    std::string classpath;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) classpath += ctx.classpathSeparator;
        classpath += entries[i];
    }
    return classpath;
}

std::map<std::string, std::string> GameLauncher::placeholderValues(const LaunchContext& ctx, const std::string& classpath) {
    const bool offline = ctx.account.type == AccountType::OFFLINE;
    std::map<std::string, std::string> vars;
    vars["auth_player_name"] = ctx.account.username;
    vars["version_name"] = ctx.version.id;
    vars["game_directory"] = ctx.gameDir.string();
    vars["assets_root"] = ctx.assetsDir.string();
    vars["game_assets"] = ctx.assetsDir.string();
    vars["assets_index_name"] = ctx.version.assetIndex ? ctx.version.assetIndex->id : ctx.version.assets;
    vars["auth_uuid"] = ctx.account.uuid;
    vars["auth_access_token"] = offline ? "0" : ctx.account.accessToken;
    vars["auth_session"] = vars["auth_access_token"];
    vars["auth_xuid"] = "";
    vars["clientid"] = "";
    vars["user_type"] = offline ? "legacy" : "msa";
    vars["user_properties"] = "{}";
    vars["version_type"] = ctx.version.type;
    vars["natives_directory"] = ctx.nativesDir.string();
    vars["library_directory"] = ctx.librariesDir.string();
    vars["classpath_separator"] = std::string(1, ctx.classpathSeparator);
    vars["classpath"] = classpath;
    vars["launcher_name"] = LAUNCHER_NAME;
    vars["launcher_version"] = LAUNCHER_VERSION;
    vars["resolution_width"] = std::to_string(ctx.settings.width);
    vars["resolution_height"] = std::to_string(ctx.settings.height);
    return vars;
}

std::string GameLauncher::substitutePlaceholders(const std::string& arg, const std::map<std::string, std::string>& vars) {
    std::string result;
    size_t pos = 0;
    while (pos < arg.size()) {
        size_t open = arg.find("${", pos);
        if (open == std::string::npos) {
            break;
        }
        size_t close = arg.find('}', open + 2);
        if (close == std::string::npos) {
            break;
        }
        result.append(arg, pos, open - pos);
        const std::string name = arg.substr(open + 2, close - open - 2);
        auto it = vars.find(name);
        if (it != vars.end()) {
            result += it->second;
        } else {
            result.append(arg, open, close - open + 1);
        }
        pos = close + 1;
    }
    result.append(arg, pos, std::string::npos);
    return result;
}

std::vector<std::string> GameLauncher::buildCommand(const LaunchContext& ctx) {
    const std::string classpath = buildClasspath(ctx);
    const auto vars = placeholderValues(ctx, classpath);

    RuleContext rules = ctx.rules;
    rules.features["has_custom_resolution"] = true;
    rules.features["is_demo_user"] = false;

    std::vector<std::string> jvmArgs;
    std::vector<std::string> gameArgs;
    if (ctx.version.arguments) {
        for (const auto& arg : flatten_arguments(ctx.version.arguments->jvm, rules)) {
            jvmArgs.push_back(substitutePlaceholders(arg, vars));
        }
        for (const auto& arg : flatten_arguments(ctx.version.arguments->game, rules)) {
            gameArgs.push_back(substitutePlaceholders(arg, vars));
        }
    }
    if (ctx.version.minecraftArguments) {
        for (const auto& arg : splitWhitespace(*ctx.version.minecraftArguments)) {
            gameArgs.push_back(substitutePlaceholders(arg, vars));
        }
    }

    // Memory comes from the settings only
    jvmArgs.erase(std::remove_if(jvmArgs.begin(), jvmArgs.end(), isMemoryFlag), jvmArgs.end());

    auto hasJvmArg = [&](const std::string& prefix) {
        return std::any_of(jvmArgs.begin(), jvmArgs.end(), [&](const std::string& a) { return startsWith(a, prefix); });
    };
    if (!hasJvmArg("-Djava.library.path=")) {
        jvmArgs.push_back("-Djava.library.path=" + ctx.nativesDir.string());
    }
    if (std::find(jvmArgs.begin(), jvmArgs.end(), "-cp") == jvmArgs.end() &&
        std::find(jvmArgs.begin(), jvmArgs.end(), "-classpath") == jvmArgs.end()) {
        jvmArgs.push_back("-cp");
        jvmArgs.push_back(classpath);
    }

    if (std::find(gameArgs.begin(), gameArgs.end(), "--width") == gameArgs.end()) {
        gameArgs.push_back("--width");
        gameArgs.push_back(std::to_string(ctx.settings.width));
        gameArgs.push_back("--height");
        gameArgs.push_back(std::to_string(ctx.settings.height));
    }

    std::vector<std::string> command;
    command.push_back(ctx.javaExecutable.string());
    command.push_back("-Xms" + std::to_string(std::min(ctx.settings.minMemory, ctx.settings.maxMemory)) + "M");
    command.push_back("-Xmx" + std::to_string(ctx.settings.maxMemory) + "M");
    command.insert(command.end(), jvmArgs.begin(), jvmArgs.end());
    command.push_back(ctx.version.mainClass.value_or("net.minecraft.client.main.Main"));
    command.insert(command.end(), gameArgs.begin(), gameArgs.end());
    return command;
}

std::string GameLauncher::launch(const std::string& versionId, const Account& account, const LauncherConfig& settings,
                                 const Utils::CancellationToken* cancel,
                                 const DownloadQueue::ProgressListener& listener) {
    m_logger->info("Preparing {} for {}", versionId, account.username);
    GameVersion version = m_versions.resolve(versionId);
    if (!version.mainClass) {
        throw BackendError("Version " + versionId + " has no main class");
    }

    m_installer.install(version, settings.downloadThreads, cancel, listener);

    LaunchContext ctx;
    ctx.javaExecutable = JavaManager::normalizeJavaPath(settings.javaPath);
    ctx.version = std::move(version);
    ctx.account = account;
    ctx.settings = settings;
    ctx.gameDir = m_config.gameDirectory();
    ctx.assetsDir = m_config.assetsDir;
    ctx.librariesDir = m_config.librariesDir;
    ctx.nativesDir = m_versions.nativesDirectory(ctx.version.id);
    ctx.clientJar = m_versions.clientJarPath(ctx.version.jar.value_or(ctx.version.id));
    ctx.rules = RuleContext::current();
    ctx.classpathSeparator = Utils::getClasspathSeparator();

    const std::vector<std::string> command = buildCommand(ctx);
    m_logger->debug("Java: {}", command.front());
    m_logger->debug("Main class: {}", ctx.version.mainClass.value_or(""));

    long pid = 0;
    try {
        pid = Utils::spawnDetached(command, ctx.gameDir);
    } catch (const std::exception& e) {
        throw BackendError(std::string("Failed to start the game: ") + e.what());
    }
    m_logger->info("{} started with pid {}", ctx.version.id, pid);
    return "Launched " + ctx.version.id + " (pid " + std::to_string(pid) + ")";
}

} // namespace Ember
