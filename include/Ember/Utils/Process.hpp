// include/Ember/Utils/Process.hpp
#ifndef EMBER_PROCESS_UTIL_HPP
#define EMBER_PROCESS_UTIL_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace Ember::Utils {

    struct ProcessResult {
        int exitCode = -1;
        std::string output; // stdout and stderr, interleaved
    };

    // Runs args[0] (looked up on PATH) to completion and captures its output.
    // Throws std::runtime_error if the process cannot be started.
    ProcessResult runAndCapture(const std::vector<std::string>& args,
                                const std::filesystem::path& workingDir = {});

    // Starts args[0] in its own session and returns its pid without waiting.
    // Throws std::runtime_error if the process cannot be started.
    long spawnDetached(const std::vector<std::string>& args,
                       const std::filesystem::path& workingDir = {});

    // Resolves a bare program name against PATH. Empty if not found.
    std::filesystem::path findOnPath(const std::string& program);

} // namespace Ember::Utils

#endif // EMBER_PROCESS_UTIL_HPP
