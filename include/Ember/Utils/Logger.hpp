// include/Ember/Utils/Logger.hpp
#ifndef EMBER_LOGGER_UTIL_HPP
#define EMBER_LOGGER_UTIL_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace Ember::Utils {

    class Logger {
    public:
        // Call once at startup. An empty logDir disables the file sink.
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "ember.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Returns the named logger, creating it on the shared sinks if needed.
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void SetLevel(const std::string &loggerName, spdlog::level::level_enum level);

        // Changes the console threshold for every logger sharing the Init() sinks.
        static void SetConsoleLevel(spdlog::level::level_enum level);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace Ember::Utils

#define CORE_LOG_TRACE(...)    if(auto& logger = ::Ember::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define CORE_LOG_INFO(...)     if(auto& logger = ::Ember::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define CORE_LOG_WARN(...)     if(auto& logger = ::Ember::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define CORE_LOG_ERROR(...)    if(auto& logger = ::Ember::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define CORE_LOG_CRITICAL(...) if(auto& logger = ::Ember::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // EMBER_LOGGER_UTIL_HPP
