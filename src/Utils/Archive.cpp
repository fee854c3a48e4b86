// src/Utils/Archive.cpp
#include <Ember/Utils/Archive.hpp>
#include <Ember/Utils/Logger.hpp>
#include <Ember/Utils/Process.hpp>

#include <miniz_cpp.hpp>
#include <algorithm>
#include <fstream>

namespace Ember::Utils {

namespace {

std::shared_ptr<spdlog::logger>& archiveLogger() {
    static std::shared_ptr<spdlog::logger> logger = Logger::GetOrCreateLogger("Archive");
    return logger;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), value.rbegin());
}

// Rejects entries that would escape the output directory ("../", absolute paths).
bool isSafeEntry(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') return false;
    if (name.find(':') != std::string::npos) return false;
    std::filesystem::path p(name);
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

bool extractArchive(const std::filesystem::path& archivePath, const std::filesystem::path& outputDirectory) {
    const std::string name = archivePath.filename().string();
    archiveLogger()->info("Extracting {} to {}", archivePath.string(), outputDirectory.string());

    std::error_code ec;
    std::filesystem::create_directories(outputDirectory, ec);
    if (ec) {
        archiveLogger()->error("Cannot create {}: {}", outputDirectory.string(), ec.message());
        return false;
    }

    if (endsWith(name, ".zip")) {
        try {
            miniz_cpp::zip_file zipFile;
            zipFile.load(archivePath.string());
            for (const auto& info : zipFile.infolist()) {
                if (!isSafeEntry(info.filename)) {
                    archiveLogger()->error("Refusing unsafe entry '{}' in {}", info.filename, name);
                    return false;
                }
            }
            archiveLogger()->debug("Extracting {} entries from {}", zipFile.infolist().size(), name);
            zipFile.extractall(outputDirectory.string());
            return true;
        } catch (const std::exception& e) {
            archiveLogger()->error("Error extracting zip {}: {}", archivePath.string(), e.what());
            return false;
        }
    }

    if (endsWith(name, ".tar.gz") || endsWith(name, ".tgz")) {
        try {
            ProcessResult tar = runAndCapture({"tar", "-xzf", archivePath.string(), "-C", outputDirectory.string()});
            if (tar.exitCode != 0) {
                archiveLogger()->error("tar extract failed (exit {}): {}", tar.exitCode, tar.output);
                return false;
            }
            return true;
        } catch (const std::exception& e) {
            archiveLogger()->error("Could not run tar for {}: {}", archivePath.string(), e.what());
            return false;
        }
    }

    archiveLogger()->error("Unsupported archive format: {}", name);
    return false;
}

bool extractZipFiltered(const std::filesystem::path& archivePath,
                        const std::filesystem::path& outputDirectory,
                        const std::vector<std::string>& excludePrefixes) {
    try {
        miniz_cpp::zip_file zipFile;
        zipFile.load(archivePath.string());

        for (const auto& info : zipFile.infolist()) {
            const std::string& entry = info.filename;
            if (entry.empty() || entry.back() == '/') continue;
            bool excluded = std::any_of(excludePrefixes.begin(), excludePrefixes.end(),
                                        [&](const std::string& prefix) { return entry.rfind(prefix, 0) == 0; });
            if (excluded) continue;
            if (!isSafeEntry(entry)) {
                archiveLogger()->warn("Skipping unsafe entry '{}' in {}", entry, archivePath.filename().string());
                continue;
            }

            std::filesystem::path target = outputDirectory / entry;
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                archiveLogger()->error("Cannot write {}", target.string());
                return false;
            }
            const std::string data = zipFile.read(info);
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
        }
        return true;
    } catch (const std::exception& e) {
        archiveLogger()->error("Error extracting natives from {}: {}", archivePath.string(), e.what());
        return false;
    }
}

} // namespace Ember::Utils
