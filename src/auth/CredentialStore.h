#pragma once

#include "auth/Crypto.h"

#include <boost/system/error_code.hpp>

#include <optional>
#include <string>

namespace psmonitor::auth {

struct Account {
    std::string id;          // token subject
    std::string username;
    crypto::Bytes salt;
    crypto::Bytes hash;
    int iterations = 0;
};

// The single provisioned account, kept as JSON in <data_dir>/credentials.json.
class CredentialStore {
public:
    static constexpr int kDefaultIterations = 100000;
    static constexpr const char* kDefaultUsername = "psmonitor";

    // Loads the account, creating it on first run. When created, the
    // generated password is written to <data_dir>/psmonitor.secret (0600).
    // Throws std::runtime_error on I/O or parse failures.
    static CredentialStore open(const std::string& data_dir,
                                int iterations = kDefaultIterations);

    // In-memory store with a known password (tests, embedding).
    static CredentialStore with_password(const std::string& username,
                                         const std::string& password,
                                         int iterations = kDefaultIterations);

    // Returns the subject on success, errc::invalid_credentials otherwise
    // (same error whether the username or the password is wrong).
    boost::system::error_code authenticate(const std::string& username,
                                           const std::string& password,
                                           std::string& subject) const;

    const Account& account() const noexcept { return account_; }

    // Set only when open() provisioned a new account during this run.
    const std::optional<std::string>& generated_password() const noexcept { return generated_password_; }

private:
    explicit CredentialStore(Account account) : account_(std::move(account)) {}

    static Account make_account(const std::string& username, const std::string& password, int iterations);

    Account account_;
    std::optional<std::string> generated_password_;
};

} // namespace psmonitor::auth
