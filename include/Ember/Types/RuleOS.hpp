// include/Ember/Types/RuleOS.hpp
#ifndef EMBER_RULEOS_HPP
#define EMBER_RULEOS_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    struct RuleOS {
        std::optional<std::string> name;
        std::optional<std::string> version; // regex over the OS version, unused by the launcher
        std::optional<std::string> arch;

        static RuleOS from_json(const json& j);
    };
}

#endif // EMBER_RULEOS_HPP
