// src/Utils/OS.cpp
#include <Ember/Utils/OS.hpp>

namespace Ember {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__)
        return Architecture::ARM64;
    #elif defined(__arm__)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::string getOSStringForRules(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "osx";
        case OperatingSystem::LINUX: return "linux";
        default: return "unknown";
    }
}

std::string getArchStringForRules(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x86_64";
        case Architecture::X86: return "x86";
        case Architecture::ARM64: return "arm64";
        case Architecture::ARM32: return "arm32";
        default: return "unknown";
    }
}

std::string getOSStringForAdoptium(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "mac";
        case OperatingSystem::LINUX: return "linux";
        default: return "";
    }
}

std::string getArchStringForAdoptium(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x64";
        case Architecture::X86: return "x86"; // Adoptium uses x86 for 32-bit Windows
        case Architecture::ARM64: return "aarch64";
        case Architecture::ARM32: return "arm";
        default: return "";
    }
}

std::string getJavaExecutableName() {
    return getCurrentOS() == OperatingSystem::WINDOWS ? "java.exe" : "java";
}

char getClasspathSeparator() {
    return getCurrentOS() == OperatingSystem::WINDOWS ? ';' : ':';
}

} // namespace Utils
} // namespace Ember
