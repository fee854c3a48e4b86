// include/Ember/Types/JavaInstallation.hpp
#ifndef EMBER_JAVAINSTALLATION_HPP
#define EMBER_JAVAINSTALLATION_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    enum class ImageType {
        JRE = 1,
        JDK = 2,
    };

    ImageType string_to_image_type(const std::string& s);
    std::string image_type_to_string(ImageType type);

    // One usable Java executable. Records are replaced wholesale on re-detection, never edited.
    struct JavaInstallation {
        std::string path;     // the java executable
        std::string version;  // as reported by `java -version`, e.g. "17.0.9" or "1.8.0_392"
        std::string vendor;   // origin tag: "temurin", "system", "JAVA_HOME", ...
        bool is64Bit = true;

        // 8 for "1.8.0_392", 17 for "17.0.9". 0 if the version string is unparseable.
        unsigned int majorVersion() const;

        static JavaInstallation from_json(const json& j);
        json to_json() const;
    };

    bool operator==(const JavaInstallation& a, const JavaInstallation& b);

    // Transient request descriptor for a redistributable build.
    struct JavaDownloadInfo {
        unsigned int majorVersion = 21;
        ImageType imageType = ImageType::JRE;
    };

    unsigned int parse_java_major_version(const std::string& version);

    // A feature release number typed by the user: plain digits, 1 to 999. Throws std::runtime_error.
    unsigned int string_to_java_major(const std::string& s);
}

#endif // EMBER_JAVAINSTALLATION_HPP
