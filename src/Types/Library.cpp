// src/Types/Library.cpp
#include <Ember/Types/Library.hpp>
#include <sstream>

namespace Ember {

namespace {
const char* DEFAULT_LIBRARY_REPOSITORY = "https://libraries.minecraft.net/";

std::string withTrailingSlash(std::string base) {
    if (!base.empty() && base.back() != '/') base += '/';
    return base;
}
} // namespace

std::string maven_path(const std::string& name, const std::string& classifier) {
    std::vector<std::string> parts;
    std::stringstream ss(name);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (parts.size() < 3) {
        return "";
    }

    std::string extension = "jar";
    std::string& version = parts[2];
    // "group:artifact:version@zip"
    size_t at = version.find('@');
    if (at != std::string::npos) {
        extension = version.substr(at + 1);
        version = version.substr(0, at);
    }

    std::string group = parts[0];
    for (auto& c : group) {
        if (c == '.') c = '/';
    }
    std::string effectiveClassifier = classifier;
    if (effectiveClassifier.empty() && parts.size() > 3) {
        effectiveClassifier = parts[3];
    }

    std::string path = group + "/" + parts[1] + "/" + version + "/" + parts[1] + "-" + version;
    if (!effectiveClassifier.empty()) {
        path += "-" + effectiveClassifier;
    }
    return path + "." + extension;
}

LibraryArtifact LibraryArtifact::from_json(const json& j) {
    LibraryArtifact artifact;
    if (j.contains("path")) artifact.path = j.at("path").get<std::string>();
    if (j.contains("sha1")) artifact.sha1 = j.at("sha1").get<std::string>();
    if (j.contains("size")) artifact.size = j.at("size").get<unsigned int>();
    if (j.contains("url")) artifact.url = j.at("url").get<std::string>();
    return artifact;
}

LibraryDownloads LibraryDownloads::from_json(const json& j) {
    LibraryDownloads downloads;
    if (j.contains("artifact")) {
        downloads.artifact = LibraryArtifact::from_json(j.at("artifact"));
    }
    if (j.contains("classifiers")) {
        for (auto& [key, val] : j.at("classifiers").items()) {
            downloads.classifiers[key] = LibraryArtifact::from_json(val);
        }
    }
    return downloads;
}

LibraryExtractRule LibraryExtractRule::from_json(const json& j) {
    LibraryExtractRule extractRule;
    if (j.contains("exclude") && j.at("exclude").is_array()) {
        for (const auto& item : j.at("exclude")) {
            extractRule.exclude.push_back(item.get<std::string>());
        }
    }
    return extractRule;
}

std::optional<LibraryArtifact> Library::resolveArtifact() const {
    if (downloads) {
        if (downloads->artifact) {
            LibraryArtifact artifact = *downloads->artifact;
            if (artifact.path.empty()) artifact.path = maven_path(name);
            return artifact;
        }
        // natives-only entry of an old version
        return std::nullopt;
    }

    std::string path = maven_path(name);
    if (path.empty()) {
        return std::nullopt;
    }
    LibraryArtifact artifact;
    artifact.path = path;
    artifact.url = withTrailingSlash(url.value_or(DEFAULT_LIBRARY_REPOSITORY)) + path;
    return artifact;
}

std::optional<LibraryArtifact> Library::resolveNatives(const std::string& osName, const std::string& archBits) const {
    auto it = natives.find(osName);
    if (it == natives.end()) {
        return std::nullopt;
    }
    std::string classifier = it->second;
    const std::string archToken = "${arch}";
    size_t pos = classifier.find(archToken);
    if (pos != std::string::npos) {
        classifier.replace(pos, archToken.size(), archBits);
    }

    if (downloads) {
        auto found = downloads->classifiers.find(classifier);
        if (found == downloads->classifiers.end()) {
            return std::nullopt;
        }
        return found->second;
    }

    LibraryArtifact artifact;
    artifact.path = maven_path(name, classifier);
    artifact.url = withTrailingSlash(url.value_or(DEFAULT_LIBRARY_REPOSITORY)) + artifact.path;
    return artifact;
}

Library Library::from_json(const json& j) {
    Library lib;
    lib.name = j.at("name").get<std::string>();

    if (j.contains("downloads")) {
        lib.downloads = LibraryDownloads::from_json(j.at("downloads"));
    }
    if (j.contains("url") && j.at("url").is_string()) {
        lib.url = j.at("url").get<std::string>();
    }

    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            lib.rules.push_back(Rule::from_json(rule_json));
        }
    }

    if (j.contains("natives") && j.at("natives").is_object()) {
        for (auto& [os_key, classifier_val] : j.at("natives").items()) {
            lib.natives[os_key] = classifier_val.get<std::string>();
        }
    }

    if (j.contains("extract") && j.at("extract").is_object()) {
        lib.extract = LibraryExtractRule::from_json(j.at("extract"));
    }

    return lib;
}

} // namespace Ember
