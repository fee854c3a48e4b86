// include/Ember/Utils/OS.hpp
#ifndef EMBER_OS_UTIL_HPP
#define EMBER_OS_UTIL_HPP

#include <string>

namespace Ember {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // Names used by "os" blocks in Mojang version JSON rules
        std::string getOSStringForRules(OperatingSystem os);
        std::string getArchStringForRules(Architecture arch);

        // For Adoptium API
        std::string getOSStringForAdoptium(OperatingSystem os);
        std::string getArchStringForAdoptium(Architecture arch);

        // "java.exe" on Windows, "java" elsewhere
        std::string getJavaExecutableName();
        char getClasspathSeparator();

    } // namespace Utils
} // namespace Ember

#endif // EMBER_OS_UTIL_HPP
