// include/Ember/Types/JavaVersion.hpp
#ifndef EMBER_JAVAVERSION_HPP
#define EMBER_JAVAVERSION_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    // The "javaVersion" block of a version JSON
    struct JavaVersion {
        std::string component;
        unsigned int majorVersion = 8;

        static JavaVersion from_json(const json& j);
    };
}

#endif // EMBER_JAVAVERSION_HPP
