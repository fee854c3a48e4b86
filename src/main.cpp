// src/main.cpp
#include <Ember/AuthState.hpp>
#include <Ember/Config.hpp>
#include <Ember/JavaToolchainManager.hpp>
#include <Ember/LaunchCoordinator.hpp>
#include <Ember/LocalBackend.hpp>
#include <Ember/ModLoaderInstaller.hpp>
#include <Ember/SettingsManager.hpp>
#include <Ember/StatusBoard.hpp>
#include <Ember/VersionCatalog.hpp>
#include <Ember/Utils/Logger.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

Ember::LocalBackend* g_backend = nullptr;

void handleInterrupt(int) {
    if (g_backend != nullptr) {
        g_backend->cancel();
    }
}

void printUsage() {
    fmt::print(
        "Usage: ember [--data-dir <dir>] [-v] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  versions [all|release|snapshot|modded] [query]\n"
        "  java detect\n"
        "  java available\n"
        "  java download <major> [jre|jdk] [path]\n"
        "  loaders <fabric|forge> <game-version>\n"
        "  install <fabric|forge> <game-version> <loader-version>\n"
        "  launch <username> [version]\n"
        "  settings show\n"
        "  settings set <key> <value>\n");
}

// Exit code 2 for bad invocations, 1 when the data directory is unusable; operation failures
// are reported on the status line.
constexpr int EXIT_USAGE = 2;

struct Components {
    Ember::StatusBoard status;
    Ember::AuthState auth;
    Ember::SettingsManager settings;
    Ember::VersionCatalog catalog;
    Ember::JavaToolchainManager java;
    Ember::ModLoaderInstaller modLoaders;
    Ember::LaunchCoordinator launcher;

    explicit Components(Ember::Backend& backend)
        : settings(backend, status),
          catalog(backend, status),
          java(backend, settings, status),
          modLoaders(backend, catalog, status),
          launcher(backend, auth, catalog, status) {}
};

int runVersions(Components& c, const std::vector<std::string>& args) {
    Ember::VersionFilter filter = Ember::VersionFilter::ALL;
    std::string query;
    if (!args.empty()) {
        try {
            filter = Ember::string_to_version_filter(args[0]);
        } catch (const std::runtime_error& e) {
            fmt::print(stderr, "{}\n", e.what());
            return EXIT_USAGE;
        }
    }
    if (args.size() > 1) {
        query = args[1];
    }
    c.catalog.refreshAll();
    for (const auto& v : c.catalog.filter(query, filter)) {
        const bool installed = std::find(c.catalog.installedVersionIds().begin(), c.catalog.installedVersionIds().end(),
                                         v.id) != c.catalog.installedVersionIds().end();
        fmt::print("{:<40} {:<10}{}\n", v.id, Ember::version_type_to_string(v.type), installed ? " [installed]" : "");
    }
    if (!c.catalog.selectedVersion().empty()) {
        fmt::print("Default selection: {}\n", c.catalog.selectedVersion());
    }
    return 0;
}

int runJava(Components& c, const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }
    const std::string& sub = args[0];
    if (sub == "detect") {
        if (c.java.detect()) {
            for (const auto& install : c.java.installations()) {
                fmt::print("{:<60} {:<12} {:<10} {}\n", install.path, install.version, install.vendor,
                           install.is64Bit ? "64-bit" : "32-bit");
            }
        }
        return 0;
    }
    if (sub == "available") {
        c.java.openDownloadPicker();
        for (unsigned int major : c.java.availableVersions()) {
            fmt::print("{}{}\n", major, major == c.java.selectedMajorVersion() ? " (default)" : "");
        }
        if (!c.java.pickerStatus().empty()) {
            fmt::print("{}\n", c.java.pickerStatus());
        }
        c.java.closeDownloadPicker();
        return 0;
    }
    if (sub == "download") {
        if (args.size() < 2) {
            printUsage();
            return EXIT_USAGE;
        }
        unsigned int major = 0;
        Ember::ImageType imageType = Ember::ImageType::JRE;
        try {
            major = Ember::string_to_java_major(args[1]);
            if (args.size() > 2) {
                imageType = Ember::string_to_image_type(args[2]);
            }
        } catch (const std::exception& e) {
            fmt::print(stderr, "Invalid argument: {}\n", e.what());
            return EXIT_USAGE;
        }
        std::optional<std::filesystem::path> customPath;
        if (args.size() > 3) {
            customPath = std::filesystem::path(args[3]);
        }
        if (c.java.download(major, imageType, customPath)) {
            c.settings.save();
        } else if (!c.java.pickerStatus().empty()) {
            fmt::print(stderr, "{}\n", c.java.pickerStatus());
        }
        return 0;
    }
    printUsage();
    return EXIT_USAGE;
}

std::optional<Ember::LoaderKind> parseLoaderKind(const std::string& s) {
    try {
        Ember::LoaderKind kind = Ember::string_to_loader_kind(s);
        if (kind != Ember::LoaderKind::NONE) {
            return kind;
        }
    } catch (const std::runtime_error&) {
        // falls through to the message below
    }
    fmt::print(stderr, "Unknown mod loader '{}', expected fabric or forge\n", s);
    return std::nullopt;
}

int runLoaders(Components& c, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return EXIT_USAGE;
    }
    auto kind = parseLoaderKind(args[0]);
    if (!kind) {
        return EXIT_USAGE;
    }
    for (const auto& loader : c.modLoaders.availableLoaderVersions(*kind, args[1])) {
        fmt::print("{}\n", loader);
    }
    return 0;
}

int runInstall(Components& c, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        printUsage();
        return EXIT_USAGE;
    }
    auto kind = parseLoaderKind(args[0]);
    if (!kind) {
        return EXIT_USAGE;
    }
    c.catalog.refreshAll();
    c.modLoaders.install(args[1], *kind, args[2]);
    return 0;
}

int runLaunch(Components& c, Ember::LocalBackend& backend, const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }
    const Ember::Account account = Ember::Account::makeOffline(args[0]);
    c.auth.setAccount(account);
    backend.setActiveAccount(account);

    c.catalog.refreshAll();
    if (args.size() > 1) {
        c.catalog.select(args[1]);
    }
    const Ember::LaunchOutcome outcome = c.launcher.launch();
    spdlog::debug("Launch outcome: {}", Ember::launch_outcome_to_string(outcome));
    return 0;
}

int runSettings(Components& c, const std::vector<std::string>& args) {
    if (args.empty() || (args[0] != "show" && args[0] != "set")) {
        printUsage();
        return EXIT_USAGE;
    }
    if (!c.settings.load()) {
        return 0;
    }
    if (args[0] == "show") {
        fmt::print("{}\n", c.settings.settings().to_json().dump(2));
        return 0;
    }
    if (args.size() < 3) {
        printUsage();
        return EXIT_USAGE;
    }
    Ember::json j = c.settings.settings().to_json();
    if (!j.contains(args[1]) && args[1] != "game_dir") {
        fmt::print(stderr, "Unknown setting '{}'\n", args[1]);
        return EXIT_USAGE;
    }
    Ember::json value;
    try {
        value = Ember::json::parse(args[2]);
    } catch (const Ember::json::parse_error&) {
        value = args[2]; // bare words are strings
    }
    j[args[1]] = value;
    try {
        c.settings.settings() = Ember::LauncherConfig::from_json(j);
    } catch (const Ember::json::exception& e) {
        fmt::print(stderr, "Invalid value for '{}': {}\n", args[1], e.what());
        return EXIT_USAGE;
    }
    c.settings.save();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path dataDir = "./.ember";
    bool verbose = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--data-dir") {
            if (i + 1 >= argc) {
                printUsage();
                return EXIT_USAGE;
            }
            dataDir = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    Ember::Config config(dataDir);
    Ember::Utils::Logger::Init(config.logsDir, "ember.log",
                               verbose ? spdlog::level::debug : spdlog::level::warn, spdlog::level::trace);
    CORE_LOG_INFO("Ember starting, data directory: {}", config.baseDataPath.string());

    std::unique_ptr<Ember::LocalBackend> backendPtr;
    try {
        backendPtr = std::make_unique<Ember::LocalBackend>(config);
    } catch (const std::exception& e) {
        CORE_LOG_CRITICAL("Cannot start with data directory {}: {}", config.baseDataPath.string(), e.what());
        fmt::print(stderr, "Cannot use data directory {}: {}\n", config.baseDataPath.string(), e.what());
        spdlog::shutdown();
        return 1;
    }
    Ember::LocalBackend& backend = *backendPtr;
    g_backend = &backend;
    std::signal(SIGINT, handleInterrupt);

    backend.setDownloadListener([](const Ember::DownloadProgress& progress) {
        if (progress.status == Ember::DownloadStatus::FINISHED || progress.status == Ember::DownloadStatus::FAILED) {
            fmt::print("[{}/{}] {} {}\n", progress.completedFiles, progress.totalFiles,
                       Ember::download_status_to_string(progress.status), progress.file);
        }
    });

    Components components(backend);
    components.status.setListener([](const std::string& status) { fmt::print("{}\n", status); });
    components.auth.setLoginHandler([] { fmt::print(stderr, "Pass a username to `ember launch` to sign in offline\n"); });

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    int exitCode = EXIT_USAGE;
    if (command == "versions") {
        exitCode = runVersions(components, args);
    } else if (command == "java") {
        components.settings.load();
        exitCode = runJava(components, args);
    } else if (command == "loaders") {
        exitCode = runLoaders(components, args);
    } else if (command == "install") {
        exitCode = runInstall(components, args);
    } else if (command == "launch") {
        exitCode = runLaunch(components, backend, args);
    } else if (command == "settings") {
        exitCode = runSettings(components, args);
    } else {
        printUsage();
    }

    g_backend = nullptr;
    spdlog::shutdown();
    return exitCode;
}
