#pragma once

#include <chrono>
#include <string>

namespace chatpool::account {

struct Credential {
    std::string email;
    std::string password;
};

// Mutable per-account state. Owned by AccountPool and only touched under its mutex.
struct Account {
    std::string id;
    std::string email;
    std::string passwordHash;
    std::string token;
    std::chrono::system_clock::time_point tokenExpires{};
    std::string userId;
    std::chrono::steady_clock::time_point lastUsed{};
    int loginFailures{};
    bool busy{};
    bool loggedIn{};
    bool initializing{};
    // Set by the first successful login; later re-logins do not count again.
    bool initialized{};
};

// Copy of the fields a request needs, taken while the account was marked busy.
struct AccountHandle {
    std::string id;
    std::string token;
    std::string userId;
};

} // namespace chatpool::account
