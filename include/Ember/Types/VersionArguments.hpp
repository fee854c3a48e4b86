// include/Ember/Types/VersionArguments.hpp
#ifndef EMBER_VERSIONARGUMENTS_HPP
#define EMBER_VERSIONARGUMENTS_HPP

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <Ember/Types/Rule.hpp>

namespace Ember {

    struct ConditionalArgumentValue {
        std::vector<Rule> rules;
        std::variant<std::string, std::vector<std::string>> value;
        static ConditionalArgumentValue from_json(const json& j);
    };

    using VersionArgument = std::variant<std::string, ConditionalArgumentValue>;

    struct Arguments {
        std::vector<VersionArgument> game;
        std::vector<VersionArgument> jvm;

        static Arguments from_json(const json& j);
        static std::vector<VersionArgument> parse_argument_array(const json& arr);
    };

    // Flattens an argument list, dropping conditional values whose rules do not allow ctx.
    std::vector<std::string> flatten_arguments(const std::vector<VersionArgument>& args, const RuleContext& ctx);

} // namespace Ember
#endif // EMBER_VERSIONARGUMENTS_HPP
