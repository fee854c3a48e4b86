// include/Ember/Types/Account.hpp
#ifndef EMBER_ACCOUNT_HPP
#define EMBER_ACCOUNT_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace Ember {
    using json = nlohmann::json;

    enum class AccountType {
        OFFLINE = 1,
        MICROSOFT = 2,
    };

    struct Account {
        std::string username;
        std::string uuid;        // dashed form
        std::string accessToken; // "0" for offline accounts
        AccountType type = AccountType::OFFLINE;

        // Same UUID the vanilla server derives for an offline player of this name.
        static Account makeOffline(const std::string& username);

        static Account from_json(const json& j);
        json to_json() const;
    };
}

#endif // EMBER_ACCOUNT_HPP
