// src/Types/JavaInstallation.cpp
#include <Ember/Types/JavaInstallation.hpp>
#include <stdexcept>

namespace Ember {

ImageType string_to_image_type(const std::string& s) {
    if (s == "jre" || s == "JRE") return ImageType::JRE;
    if (s == "jdk" || s == "JDK") return ImageType::JDK;
    throw std::runtime_error("Unknown Java image type: " + s);
}

std::string image_type_to_string(ImageType type) {
    switch (type) {
        case ImageType::JRE: return "jre";
        case ImageType::JDK: return "jdk";
        default: throw std::runtime_error("Unknown ImageType enum");
    }
}

unsigned int parse_java_major_version(const std::string& version) {
    auto leadingNumber = [](const std::string& s, size_t pos, size_t& next) -> unsigned int {
        unsigned int value = 0;
        next = pos;
        while (next < s.size() && s[next] >= '0' && s[next] <= '9') {
            value = value * 10 + static_cast<unsigned int>(s[next] - '0');
            ++next;
        }
        return value;
    };

    size_t next = 0;
    unsigned int first = leadingNumber(version, 0, next);
    if (next == 0) {
        return 0;
    }
    // Legacy scheme: 1.<major>.x
    if (first == 1 && next < version.size() && version[next] == '.') {
        size_t after = 0;
        unsigned int second = leadingNumber(version, next + 1, after);
        if (after > next + 1) {
            return second;
        }
    }
    return first;
}

unsigned int string_to_java_major(const std::string& s) {
    if (s.empty() || s.size() > 3 || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid Java version: " + s);
    }
    const unsigned int major = static_cast<unsigned int>(std::stoul(s));
    if (major == 0) {
        throw std::runtime_error("Invalid Java version: " + s);
    }
    return major;
}

unsigned int JavaInstallation::majorVersion() const {
    return parse_java_major_version(version);
}

JavaInstallation JavaInstallation::from_json(const json& j) {
    JavaInstallation installation;
    installation.path = j.at("path").get<std::string>();
    installation.version = j.at("version").get<std::string>();
    installation.vendor = j.value("vendor", "unknown");
    installation.is64Bit = j.value("is_64bit", true);
    return installation;
}

json JavaInstallation::to_json() const {
    return json{
        {"path", path},
        {"version", version},
        {"vendor", vendor},
        {"is_64bit", is64Bit},
    };
}

bool operator==(const JavaInstallation& a, const JavaInstallation& b) {
    return a.path == b.path && a.version == b.version && a.vendor == b.vendor && a.is64Bit == b.is64Bit;
}

} // namespace Ember
