// include/Ember/Types/MinecraftJAR.hpp
#ifndef EMBER_MINECRAFTJAR_HPP
#define EMBER_MINECRAFTJAR_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    enum class MinecraftJARType {
        CLIENT = 1,
        SERVER = 2,
        CLIENT_MAPPING = 3,
        SERVER_MAPPING = 4,
    };

    MinecraftJARType string_to_minecraft_jar_type(const std::string& s);
    std::string minecraft_jar_type_to_string(MinecraftJARType type);

    struct DownloadDetails {
        std::string sha1;
        unsigned int size = 0;
        std::string url;

        static DownloadDetails from_json(const json& j);
    };
}

#endif // EMBER_MINECRAFTJAR_HPP
