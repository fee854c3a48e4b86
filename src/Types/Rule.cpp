// src/Types/Rule.cpp
#include <Ember/Types/Rule.hpp>
#include <Ember/Utils/OS.hpp>
#include <stdexcept>

namespace Ember {

RuleOS RuleOS::from_json(const json& j) {
    RuleOS os_obj;
    if (j.contains("name")) os_obj.name = j.at("name").get<std::string>();
    if (j.contains("version")) os_obj.version = j.at("version").get<std::string>();
    if (j.contains("arch")) os_obj.arch = j.at("arch").get<std::string>();
    return os_obj;
}

RuleAction string_to_rule_action(const std::string& s) {
    if (s == "allow") return RuleAction::ALLOW;
    if (s == "disallow") return RuleAction::DISALLOW;
    throw std::runtime_error("Unknown rule action: " + s);
}

RuleContext RuleContext::current(const Features& features) {
    RuleContext ctx;
    ctx.osName = Utils::getOSStringForRules(Utils::getCurrentOS());
    ctx.arch = Utils::getArchStringForRules(Utils::getCurrentArch());
    ctx.features = features;
    return ctx;
}

bool Rule::appliesTo(const RuleContext& ctx) const {
    if (os) {
        if (os->name && *os->name != ctx.osName) return false;
        if (os->arch && *os->arch != ctx.arch) return false;
    }
    if (features) {
        for (const auto& [key, wanted] : *features) {
            auto it = ctx.features.find(key);
            bool actual = it != ctx.features.end() && it->second;
            if (actual != wanted) return false;
        }
    }
    return true;
}

Rule Rule::from_json(const json& j) {
    Rule rule_obj;
    rule_obj.action = string_to_rule_action(j.at("action").get<std::string>());

    if (j.contains("os")) {
        rule_obj.os = RuleOS::from_json(j.at("os"));
    }

    if (j.contains("features")) {
        Features features_map;
        for (auto& [key, val] : j.at("features").items()) {
            features_map[key] = val.get<bool>();
        }
        rule_obj.features = features_map;
    }
    return rule_obj;
}

bool rules_allow(const std::vector<Rule>& rules, const RuleContext& ctx) {
    if (rules.empty()) {
        return true;
    }
    bool allowed = false;
    for (const auto& rule : rules) {
        if (rule.appliesTo(ctx)) {
            allowed = rule.action == RuleAction::ALLOW;
        }
    }
    return allowed;
}

} // namespace Ember
