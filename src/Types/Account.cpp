// src/Types/Account.cpp
#include <Ember/Types/Account.hpp>
#include <Ember/Utils/Crypto.hpp>
#include <stdexcept>

namespace Ember {

Account Account::makeOffline(const std::string& username) {
    if (username.empty()) {
        throw std::invalid_argument("Offline account needs a username");
    }
    Account account;
    account.username = username;
    account.uuid = Utils::nameUUIDFromString("OfflinePlayer:" + username);
    account.accessToken = "0";
    account.type = AccountType::OFFLINE;
    return account;
}

Account Account::from_json(const json& j) {
    Account account;
    account.username = j.at("username").get<std::string>();
    account.uuid = j.at("uuid").get<std::string>();
    account.accessToken = j.value("access_token", "0");
    account.type = j.value("type", "offline") == "microsoft" ? AccountType::MICROSOFT : AccountType::OFFLINE;
    return account;
}

json Account::to_json() const {
    return json{
        {"username", username},
        {"uuid", uuid},
        {"access_token", accessToken},
        {"type", type == AccountType::MICROSOFT ? "microsoft" : "offline"},
    };
}

} // namespace Ember
