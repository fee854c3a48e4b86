// src/Types/LauncherConfig.cpp
#include <Ember/Types/LauncherConfig.hpp>

namespace Ember {

LauncherConfig LauncherConfig::from_json(const json& j) {
    LauncherConfig config;
    config.minMemory = j.value("min_memory", config.minMemory);
    config.maxMemory = j.value("max_memory", config.maxMemory);
    config.javaPath = j.value("java_path", config.javaPath);
    config.width = j.value("width", config.width);
    config.height = j.value("height", config.height);
    config.downloadThreads = j.value("download_threads", config.downloadThreads);
    config.enableGpuAcceleration = j.value("enable_gpu_acceleration", config.enableGpuAcceleration);
    config.enableVisualEffects = j.value("enable_visual_effects", config.enableVisualEffects);
    config.activeEffect = j.value("active_effect", config.activeEffect);
    config.theme = j.value("theme", config.theme);
    config.requestTimeoutMs = j.value("request_timeout_ms", config.requestTimeoutMs);
    if (j.contains("game_dir") && j.at("game_dir").is_string()) {
        config.gameDir = j.at("game_dir").get<std::string>();
    }

    if (config.minMemory > config.maxMemory) {
        config.minMemory = config.maxMemory;
    }
    if (config.downloadThreads == 0) {
        config.downloadThreads = 1;
    }
    return config;
}

json LauncherConfig::to_json() const {
    json j = {
        {"min_memory", minMemory},
        {"max_memory", maxMemory},
        {"java_path", javaPath},
        {"width", width},
        {"height", height},
        {"download_threads", downloadThreads},
        {"enable_gpu_acceleration", enableGpuAcceleration},
        {"enable_visual_effects", enableVisualEffects},
        {"active_effect", activeEffect},
        {"theme", theme},
        {"request_timeout_ms", requestTimeoutMs},
    };
    if (gameDir) {
        j["game_dir"] = *gameDir;
    }
    return j;
}

bool operator==(const LauncherConfig& a, const LauncherConfig& b) {
    return a.to_json() == b.to_json();
}

} // namespace Ember
