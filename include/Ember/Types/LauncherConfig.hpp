// include/Ember/Types/LauncherConfig.hpp
#ifndef EMBER_LAUNCHERCONFIG_HPP
#define EMBER_LAUNCHERCONFIG_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    // The only theme the launcher ships. Anything else found on disk is corrected on load.
    inline constexpr const char* PINNED_THEME = "dark";

    struct LauncherConfig {
        unsigned int minMemory = 1024; // MiB
        unsigned int maxMemory = 2048; // MiB
        std::string javaPath = "java";
        unsigned int width = 854;
        unsigned int height = 480;
        unsigned int downloadThreads = 32;
        bool enableGpuAcceleration = false;
        bool enableVisualEffects = true;
        std::string activeEffect = "constellation";
        std::string theme = PINNED_THEME;
        unsigned int requestTimeoutMs = 30000;
        std::optional<std::string> gameDir;

        // Missing keys keep their defaults; min_memory is clamped to max_memory.
        static LauncherConfig from_json(const json& j);
        json to_json() const;
    };

    bool operator==(const LauncherConfig& a, const LauncherConfig& b);
}

#endif // EMBER_LAUNCHERCONFIG_HPP
