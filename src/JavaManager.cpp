// src/JavaManager.cpp
#include <Ember/JavaManager.hpp>
#include <Ember/Backend.hpp>
#include <Ember/Utils/Archive.hpp>
#include <Ember/Utils/Logger.hpp>
#include <Ember/Utils/OS.hpp>
#include <Ember/Utils/Process.hpp>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>

namespace Ember {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? std::string(value) : fallback;
}

bool isFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

// <base>/<child>/<suffix> for every child directory of base
void addChildren(std::vector<JavaCandidate>& out, const std::filesystem::path& base,
                 const std::filesystem::path& suffix, const std::string& origin) {
    std::error_code ec;
    if (!std::filesystem::is_directory(base, ec)) {
        return;
    }
    std::vector<std::filesystem::path> children;
    for (const auto& entry : std::filesystem::directory_iterator(base, ec)) {
        if (entry.is_directory(ec)) {
            children.push_back(entry.path());
        }
    }
    std::sort(children.begin(), children.end());
    for (const auto& child : children) {
        std::filesystem::path exe = child / suffix;
        if (isFile(exe)) {
            out.push_back({exe, origin});
        }
    }
}

// Vendor names as they appear in `java -version` output
std::string vendorFromOutput(const std::string& output) {
    static const std::vector<std::pair<std::string, std::string>> markers = {
        {"Temurin", "Temurin"}, {"AdoptOpenJDK", "AdoptOpenJDK"}, {"Zulu", "Zulu"},
        {"Corretto", "Corretto"}, {"GraalVM", "GraalVM"}, {"Microsoft", "Microsoft"},
        {"Liberica", "Liberica"}, {"Java(TM)", "Oracle"}, {"OpenJDK", "OpenJDK"},
    };
    for (const auto& [marker, vendor] : markers) {
        if (output.find(marker) != std::string::npos) {
            return vendor;
        }
    }
    return "";
}

} // namespace

JavaManager::JavaManager(const Config& config, HttpManager& httpManager)
    : m_config(config), m_javaDownloader(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaManager");
    m_logger->trace("Initializing...");
    std::error_code ec;
    if (!std::filesystem::exists(m_config.javaRuntimesDir, ec)) {
        m_logger->info("Java runtimes directory {} does not exist. Creating.", m_config.javaRuntimesDir.string());
        if (!std::filesystem::create_directories(m_config.javaRuntimesDir, ec) && ec) {
            m_logger->error("Failed to create {}: {}", m_config.javaRuntimesDir.string(), ec.message());
        }
    }
}

std::vector<JavaCandidate> JavaManager::candidateExecutables() const {
    std::vector<JavaCandidate> candidates;
    const Utils::OperatingSystem os = Utils::getCurrentOS();
    const std::string exeName = Utils::getJavaExecutableName();

    // `which` may hand back a symlink chain (/usr/bin/java -> /etc/alternatives/...)
    try {
        const std::string lookup = os == Utils::OperatingSystem::WINDOWS ? "where" : "which";
        Utils::ProcessResult result = Utils::runAndCapture({lookup, "java"});
        if (result.exitCode == 0) {
            std::istringstream lines(result.output);
            std::string line;
            while (std::getline(lines, line)) {
                line.erase(0, line.find_first_not_of(" \t\r"));
                line.erase(line.find_last_not_of(" \t\r") + 1);
                if (line.empty() || !isFile(line)) continue;
                std::error_code ec;
                std::filesystem::path resolved = std::filesystem::canonical(line, ec);
                candidates.push_back({ec ? std::filesystem::path(line) : resolved, "path"});
            }
        }
    } catch (const std::exception& e) {
        m_logger->debug("PATH lookup for java failed: {}", e.what());
    }

    const std::string home = envOr("HOME", "");
    if (os == Utils::OperatingSystem::LINUX) {
        for (const char* base : {"/usr/lib/jvm", "/usr/java", "/opt/java", "/opt/jdk", "/opt/openjdk"}) {
            addChildren(candidates, base, std::filesystem::path("bin") / "java", "system");
        }
    } else if (os == Utils::OperatingSystem::MACOS) {
        for (const char* base : {"/Library/Java/JavaVirtualMachines", "/System/Library/Java/JavaVirtualMachines"}) {
            addChildren(candidates, base, std::filesystem::path("Contents") / "Home" / "bin" / "java", "system");
        }
        for (const char* exe : {"/usr/local/opt/openjdk/bin/java", "/opt/homebrew/opt/openjdk/bin/java"}) {
            if (isFile(exe)) candidates.push_back({exe, "homebrew"});
        }
        addChildren(candidates, "/opt/homebrew/Cellar/openjdk",
                    std::filesystem::path("libexec") / "openjdk.jdk" / "Contents" / "Home" / "bin" / "java", "homebrew");
    } else if (os == Utils::OperatingSystem::WINDOWS) {
        const std::vector<std::string> roots = {
            envOr("ProgramFiles", "C:\\Program Files"),
            envOr("ProgramFiles(x86)", "C:\\Program Files (x86)"),
            envOr("LOCALAPPDATA", ""),
        };
        const std::vector<std::string> vendorDirs = {
            "Java", "Eclipse Adoptium", "AdoptOpenJDK", "Microsoft\\jdk", "Zulu",
            "Amazon Corretto", "BellSoft\\LibericaJDK", "Programs\\Eclipse Adoptium",
        };
        for (const auto& root : roots) {
            if (root.empty()) continue;
            for (const auto& dir : vendorDirs) {
                addChildren(candidates, std::filesystem::path(root) / dir, std::filesystem::path("bin") / exeName, "system");
            }
        }
    }

    if (os != Utils::OperatingSystem::WINDOWS && !home.empty()) {
        std::filesystem::path sdkman = std::filesystem::path(home) / ".sdkman" / "candidates" / "java" / "current" / "bin" / "java";
        if (isFile(sdkman)) candidates.push_back({sdkman, "sdkman"});
    }

    if (const char* javaHome = std::getenv("JAVA_HOME"); javaHome != nullptr && *javaHome != '\0') {
        std::filesystem::path exe = std::filesystem::path(javaHome) / "bin" / exeName;
        if (isFile(exe)) candidates.push_back({exe, "JAVA_HOME"});
    }

    std::error_code ec;
    if (std::filesystem::is_directory(m_config.javaRuntimesDir, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(m_config.javaRuntimesDir, ec)) {
            if (!entry.is_directory(ec)) continue;
            std::filesystem::path exe = findJavaExecutable(entry.path());
            if (!exe.empty()) candidates.push_back({exe, "ember"});
        }
    }

    // Same executable reached twice (symlinks, JAVA_HOME pointing at a scanned dir): keep the first
    std::set<std::string> seen;
    std::vector<JavaCandidate> unique;
    for (auto& candidate : candidates) {
        std::filesystem::path key = std::filesystem::weakly_canonical(candidate.executable, ec);
        if (ec) key = candidate.executable;
        if (seen.insert(key.string()).second) {
            unique.push_back(std::move(candidate));
        }
    }
    return unique;
}

std::optional<JavaProbe> JavaManager::parseVersionOutput(const std::string& output) {
    static const std::string marker = "version \"";
    size_t start = output.find(marker);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += marker.size();
    size_t end = output.find('"', start);
    if (end == std::string::npos || end == start) {
        return std::nullopt;
    }

    JavaProbe probe;
    probe.version = output.substr(start, end - start);
    probe.vendor = vendorFromOutput(output);
    probe.is64Bit = output.find("64-Bit") != std::string::npos;
    return probe;
}

std::optional<JavaInstallation> JavaManager::probe(const JavaCandidate& candidate) const {
    Utils::ProcessResult result;
    try {
        result = Utils::runAndCapture({candidate.executable.string(), "-version"});
    } catch (const std::exception& e) {
        m_logger->debug("Skipping {}: {}", candidate.executable.string(), e.what());
        return std::nullopt;
    }
    if (result.exitCode != 0) {
        m_logger->debug("Skipping {}: -version exited with {}", candidate.executable.string(), result.exitCode);
        return std::nullopt;
    }
    auto parsed = parseVersionOutput(result.output);
    if (!parsed) {
        m_logger->debug("Skipping {}: unrecognised -version output", candidate.executable.string());
        return std::nullopt;
    }

    JavaInstallation installation;
    installation.path = candidate.executable.string();
    installation.version = parsed->version;
    installation.vendor = parsed->vendor.empty() ? candidate.origin : parsed->vendor;
    installation.is64Bit = parsed->is64Bit;
    return installation;
}

std::vector<JavaInstallation> JavaManager::detectInstallations() {
    m_logger->info("Scanning for Java installations...");
    std::vector<JavaInstallation> installations;
    for (const auto& candidate : candidateExecutables()) {
        if (auto installation = probe(candidate)) {
            m_logger->debug("Found Java {} ({}) at {}", installation->version, installation->vendor, installation->path);
            installations.push_back(std::move(*installation));
        }
    }
    m_logger->info("Scan complete. Found {} usable Java installations.", installations.size());
    return installations;
}

std::filesystem::path JavaManager::runtimeDirectoryFor(unsigned int majorVersion, ImageType imageType) const {
    return m_config.javaRuntimesDir / ("temurin-" + std::to_string(majorVersion) + "-" + image_type_to_string(imageType));
}

std::filesystem::path JavaManager::installDirectoryFor(unsigned int majorVersion, ImageType imageType,
                                                     const std::optional<std::filesystem::path>& customPath) const {
    if (!customPath) {
        return runtimeDirectoryFor(majorVersion, imageType);
    }
    // Never the custom directory itself
    return *customPath / runtimeDirectoryFor(majorVersion, imageType).filename();
}

JavaInstallation JavaManager::installAdoptium(unsigned int majorVersion, ImageType imageType,
                                              const std::optional<std::filesystem::path>& customPath,
                                              const Utils::CancellationToken* cancel) {
    const std::filesystem::path target = installDirectoryFor(majorVersion, imageType, customPath);
    const std::filesystem::path archive =
        m_javaDownloader.downloadAdoptium(majorVersion, imageType, m_config.downloadsDir / "java", cancel);

    std::error_code ec;
    JavaInstallation installation;
    try {
        installation = unpackRuntime(archive, majorVersion, target);
    } catch (const BackendError&) {
        std::filesystem::remove(archive, ec);
        throw;
    }
    std::filesystem::remove(archive, ec);
    return installation;
}

JavaInstallation JavaManager::unpackRuntime(const std::filesystem::path& archive, unsigned int majorVersion,
                                            const std::filesystem::path& target) {
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        m_logger->info("Install directory {} already exists. Removing for fresh extraction.", target.string());
        std::filesystem::remove_all(target, ec);
        if (ec) {
            throw BackendError("Cannot clear " + target.string() + ": " + ec.message());
        }
    }
    if (!Utils::extractArchive(archive, target)) {
        std::filesystem::remove_all(target, ec);
        throw BackendError("Failed to extract Java archive " + archive.filename().string());
    }

    std::filesystem::path javaExe = findJavaExecutable(target);
    if (javaExe.empty()) {
        throw BackendError("No Java executable found in " + target.string());
    }

    JavaInstallation installation;
    if (auto probed = probe({javaExe, "temurin"})) {
        installation = *probed;
    } else {
        m_logger->warn("Freshly installed Java at {} did not answer -version", javaExe.string());
        installation.path = javaExe.string();
        installation.version = std::to_string(majorVersion);
        installation.vendor = "Temurin";
        installation.is64Bit = Utils::getCurrentArch() == Utils::Architecture::X64 ||
                               Utils::getCurrentArch() == Utils::Architecture::ARM64;
    }
    m_logger->info("Java {} installed at {}", majorVersion, installation.path);
    return installation;
}

std::filesystem::path JavaManager::findJavaExecutable(const std::filesystem::path& javaHome) {
    const std::string exeName = Utils::getJavaExecutableName();
    std::error_code ec;
    if (!std::filesystem::is_directory(javaHome, ec)) {
        return {};
    }

    auto lookIn = [&](const std::filesystem::path& home) -> std::filesystem::path {
        for (const auto& bin : {home / "bin", home / "Contents" / "Home" / "bin"}) {
            if (isFile(bin / exeName)) {
                return bin / exeName;
            }
        }
        return {};
    };

    if (auto exe = lookIn(javaHome); !exe.empty()) {
        return exe;
    }
    // Archives usually unpack into a single jdk-17.0.9+9-jre style folder
    std::vector<std::filesystem::path> subdirs;
    for (const auto& entry : std::filesystem::directory_iterator(javaHome, ec)) {
        if (entry.is_directory(ec)) {
            subdirs.push_back(entry.path());
        }
    }
    std::sort(subdirs.begin(), subdirs.end());
    for (const auto& dir : subdirs) {
        if (auto exe = lookIn(dir); !exe.empty()) {
            return exe;
        }
    }
    return {};
}

std::filesystem::path JavaManager::normalizeJavaPath(const std::string& javaPath) {
    std::filesystem::path path(javaPath);
    const bool windows = Utils::getCurrentOS() == Utils::OperatingSystem::WINDOWS;

    std::error_code ec;
    if (windows && !std::filesystem::exists(path, ec) && !path.has_extension()) {
        path.replace_extension(".exe");
    }
    if (!std::filesystem::exists(path, ec)) {
        const bool bare = windows ? path == std::filesystem::path("java.exe") : javaPath == "java";
        if (bare) {
            std::filesystem::path found = Utils::findOnPath("java");
            if (!found.empty()) {
                return found;
            }
            if (!windows) {
                // Let the launch itself report a missing java
                return path;
            }
        }
        throw BackendError("Java executable not found at: " + path.string() +
                           "\nPlease configure a valid Java path in Settings.");
    }
    return path;
}

} // namespace Ember
