// include/Ember/Utils/Archive.hpp
#ifndef EMBER_ARCHIVE_UTIL_HPP
#define EMBER_ARCHIVE_UTIL_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace Ember::Utils {

    // Extracts a .zip (in-process) or a .tar.gz / .tgz (via the system tar) into outputDirectory.
    // Returns false and logs the reason on failure.
    bool extractArchive(const std::filesystem::path& archivePath, const std::filesystem::path& outputDirectory);

    // Extracts every file of a zip except entries starting with one of excludePrefixes.
    // Used for LWJGL native jars. Returns false and logs the reason on failure.
    bool extractZipFiltered(const std::filesystem::path& archivePath,
                            const std::filesystem::path& outputDirectory,
                            const std::vector<std::string>& excludePrefixes);

} // namespace Ember::Utils

#endif // EMBER_ARCHIVE_UTIL_HPP
