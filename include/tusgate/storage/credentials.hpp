#pragma once

#include "tusgate/net/http.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace tusgate {

struct AccessToken {
    std::string token;
    std::chrono::system_clock::time_point expiry;
};

// Source of OAuth2 bearer tokens for backend calls.
// Implementations must be thread-safe; failures throw BackendAuthError.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;
    virtual AccessToken get_access_token() = 0;
};

// Fixed token, for emulators and tests. An empty token means "no auth".
class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}

    AccessToken get_access_token() override {
        return {token_, std::chrono::system_clock::time_point::max()};
    }

private:
    std::string token_;
};

// Google service account: signs an RS256 JWT assertion and exchanges it at
// the token endpoint. Tokens are cached until TOKEN_REFRESH_MARGIN before
// their expiry.
class ServiceAccountTokenProvider : public TokenProvider {
public:
    struct Config {
        std::string credentials_json;   // key file content
        std::string credentials_file;   // or path; falls back to GOOGLE_APPLICATION_CREDENTIALS
        std::string scope;              // default: devstorage.read_write
    };

    ServiceAccountTokenProvider(const Config& config, std::shared_ptr<net::HttpClient> http);

    AccessToken get_access_token() override;

    // Loads and checks the key; returns an error message, empty on success
    std::string validate() const;

    const std::string& client_email() const { return client_email_; }

private:
    AccessToken fetch_token();

    std::shared_ptr<net::HttpClient> http_;
    std::string scope_;
    std::string client_email_;
    std::string private_key_;
    std::string token_uri_;
    std::string load_error_;

    std::mutex token_mutex_;
    AccessToken cached_;
};

// RSA-SHA256 signature of data with a PEM private key; empty on failure
std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data);

std::unique_ptr<TokenProvider> make_token_provider(const std::string& static_token,
                                                   const std::string& credentials_file,
                                                   std::shared_ptr<net::HttpClient> http);

} // namespace tusgate
