// include/Ember/Types/Rule.hpp
#ifndef EMBER_RULE_HPP
#define EMBER_RULE_HPP

#include <string>
#include <optional>
#include <map>
#include <vector>
#include <Ember/Types/RuleOS.hpp>
#include <nlohmann/json.hpp>

namespace Ember {
    using std::optional;
    using json = nlohmann::json;

    enum class RuleAction {
        ALLOW = 1,
        DISALLOW = 2,
    };

    RuleAction string_to_rule_action(const std::string& s);

    typedef std::map<std::string, bool> Features;

    // What the rules are evaluated against: the host and the launcher's enabled features.
    struct RuleContext {
        std::string osName; // "windows", "osx", "linux"
        std::string arch;   // "x86", "x86_64", "arm64"
        Features features;

        static RuleContext current(const Features& features = {});
    };

    struct Rule {
        RuleAction action;
        optional<RuleOS> os;
        optional<Features> features;

        // True if every condition of this rule holds in ctx.
        bool appliesTo(const RuleContext& ctx) const;

        static Rule from_json(const json& j);
    };

    // Mojang semantics: no rules means allowed; otherwise the last applicable rule decides,
    // and nothing applicable means disallowed.
    bool rules_allow(const std::vector<Rule>& rules, const RuleContext& ctx);
}

#endif // EMBER_RULE_HPP
