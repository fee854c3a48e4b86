// include/Ember/Types/Library.hpp
#ifndef EMBER_LIBRARY_HPP
#define EMBER_LIBRARY_HPP

#include <string>
#include <Ember/Types/Rule.hpp>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    struct LibraryArtifact {
        std::string path;
        std::string sha1;
        unsigned int size = 0;
        std::string url;

        static LibraryArtifact from_json(const json& j);
    };

    struct LibraryDownloads {
        std::optional<LibraryArtifact> artifact;
        std::map<std::string, LibraryArtifact> classifiers; // Key: e.g., "natives-linux"

        static LibraryDownloads from_json(const json& j);
    };

    struct LibraryExtractRule {
        std::vector<std::string> exclude;

        static LibraryExtractRule from_json(const json& j);
    };

    struct Library {
        std::string name; // group:artifact:version[:classifier]
        std::optional<LibraryDownloads> downloads;
        std::optional<std::string> url; // maven repository base, used by loader profiles
        std::vector<Rule> rules;
        std::map<std::string, std::string> natives; // OS to classifier key e.g. "linux": "natives-linux"
        std::optional<LibraryExtractRule> extract;

        // Artifact to put on the classpath, derived from the maven name when the JSON has no
        // "downloads" block. Empty if the library only carries natives.
        std::optional<LibraryArtifact> resolveArtifact() const;

        // Native jar for the given OS, with ${arch} expanded. Empty if none.
        std::optional<LibraryArtifact> resolveNatives(const std::string& osName, const std::string& archBits) const;

        static Library from_json(const json& j);
    };

    // "net.fabricmc:fabric-loader:0.15.7" -> "net/fabricmc/fabric-loader/0.15.7/fabric-loader-0.15.7.jar"
    // Empty string for malformed names.
    std::string maven_path(const std::string& name, const std::string& classifier = "");
}

#endif // EMBER_LIBRARY_HPP
