// src/Types/VersionArguments.cpp
#include <Ember/Types/VersionArguments.hpp>
#include <Ember/Utils/Logger.hpp>

namespace Ember {

ConditionalArgumentValue ConditionalArgumentValue::from_json(const json& j) {
    ConditionalArgumentValue cav;
    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            cav.rules.push_back(Rule::from_json(rule_json));
        }
    }
    if (j.contains("value")) {
        if (j.at("value").is_string()) {
            cav.value = j.at("value").get<std::string>();
        } else if (j.at("value").is_array()) {
            std::vector<std::string> values;
            for (const auto& val_item : j.at("value")) {
                values.push_back(val_item.get<std::string>());
            }
            cav.value = values;
        }
    }
    return cav;
}

std::vector<VersionArgument> Arguments::parse_argument_array(const json& arr) {
    std::vector<VersionArgument> result_args;
    if (arr.is_array()) {
        for (const auto& arg_item_json : arr) {
            if (arg_item_json.is_string()) {
                result_args.emplace_back(arg_item_json.get<std::string>());
            } else if (arg_item_json.is_object()) {
                result_args.emplace_back(ConditionalArgumentValue::from_json(arg_item_json));
            } else {
                CORE_LOG_WARN("[VersionArgsParser] Unknown argument type in array: {}", arg_item_json.dump());
            }
        }
    }
    return result_args;
}

Arguments Arguments::from_json(const json& j) {
    Arguments args;
    if (j.contains("game")) {
        args.game = parse_argument_array(j.at("game"));
    }
    if (j.contains("jvm")) {
        args.jvm = parse_argument_array(j.at("jvm"));
    }
    return args;
}

std::vector<std::string> flatten_arguments(const std::vector<VersionArgument>& args, const RuleContext& ctx) {
    std::vector<std::string> flat;
    for (const auto& arg : args) {
        if (const auto* plain = std::get_if<std::string>(&arg)) {
            flat.push_back(*plain);
            continue;
        }
        const auto& conditional = std::get<ConditionalArgumentValue>(arg);
        if (!rules_allow(conditional.rules, ctx)) {
            continue;
        }
        if (const auto* single = std::get_if<std::string>(&conditional.value)) {
            flat.push_back(*single);
        } else {
            const auto& many = std::get<std::vector<std::string>>(conditional.value);
            flat.insert(flat.end(), many.begin(), many.end());
        }
    }
    return flat;
}

} // namespace Ember
