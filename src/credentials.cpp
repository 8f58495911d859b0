#include "tusgate/storage/credentials.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tusgate {

std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) return "";

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!pkey) return "";

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) { EVP_PKEY_free(pkey); return ""; }

    std::string signature;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
            signature.resize(sig_len);
            if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(signature.data()),
                                    &sig_len) == 1) {
                signature.resize(sig_len);
            } else {
                signature.clear();
            }
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return signature;
}

static std::string to_b64url(const std::string& s) {
    return net::base64url_encode(std::vector<uint8_t>(s.begin(), s.end()));
}

ServiceAccountTokenProvider::ServiceAccountTokenProvider(const Config& config,
                                                         std::shared_ptr<net::HttpClient> http)
    : http_(std::move(http)),
      scope_(config.scope.empty() ? constants::STORAGE_SCOPE : config.scope) {
    std::string json_text = config.credentials_json;
    std::string path = config.credentials_file;
    if (json_text.empty() && path.empty()) {
        if (const char* env = std::getenv("GOOGLE_APPLICATION_CREDENTIALS")) {
            path = env;
        }
    }

    if (json_text.empty()) {
        if (path.empty()) {
            load_error_ = "no service account credentials configured";
            return;
        }
        std::ifstream ifs(path);
        if (!ifs) {
            load_error_ = "cannot open credentials file: " + path;
            return;
        }
        std::ostringstream ss;
        ss << ifs.rdbuf();
        json_text = ss.str();
    }

    try {
        auto j = nlohmann::json::parse(json_text);
        client_email_ = j.value("client_email", "");
        private_key_ = j.value("private_key", "");
        token_uri_ = j.value("token_uri", std::string(constants::DEFAULT_TOKEN_URI));
    } catch (const nlohmann::json::exception& e) {
        load_error_ = std::string("invalid credentials JSON: ") + e.what();
        return;
    }

    if (client_email_.empty() || private_key_.empty()) {
        load_error_ = "credentials JSON lacks client_email or private_key";
    }
}

std::string ServiceAccountTokenProvider::validate() const {
    return load_error_;
}

AccessToken ServiceAccountTokenProvider::get_access_token() {
    std::lock_guard lock(token_mutex_);

    auto now = std::chrono::system_clock::now();
    if (!cached_.token.empty() && now < cached_.expiry - constants::TOKEN_REFRESH_MARGIN) {
        return cached_;
    }

    cached_ = fetch_token();
    return cached_;
}

AccessToken ServiceAccountTokenProvider::fetch_token() {
    if (!load_error_.empty()) {
        throw BackendAuthError(load_error_);
    }

    auto now = std::chrono::system_clock::now();
    auto iat = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    nlohmann::json claims = {
        {"iss", client_email_},
        {"scope", scope_},
        {"aud", token_uri_},
        {"iat", iat},
        {"exp", iat + 3600},
    };

    std::string signing_input = to_b64url(R"({"alg":"RS256","typ":"JWT"})") + "." +
                                to_b64url(claims.dump());

    std::string signature = rsa_sign_sha256(private_key_, signing_input);
    if (signature.empty()) {
        throw BackendAuthError("failed to sign JWT with service account key");
    }
    std::string jwt = signing_input + "." + to_b64url(signature);

    std::string post_body =
        "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + jwt;

    net::HttpRequest request = net::HttpRequest::post(token_uri_, post_body);
    request.headers.set_content_type("application/x-www-form-urlencoded");

    auto response = http_->execute_with_retry(request);
    if (!response.ok()) {
        std::string detail = response.error.empty()
            ? "HTTP " + std::to_string(response.status_code) + ": " + response.body_string()
            : response.error;
        throw BackendAuthError("token exchange failed: " + detail);
    }

    AccessToken token;
    try {
        auto j = nlohmann::json::parse(response.body_string());
        token.token = j.value("access_token", "");
        int64_t expires_in = j.value("expires_in", int64_t{3600});
        token.expiry = std::chrono::system_clock::now() + std::chrono::seconds(expires_in);
    } catch (const nlohmann::json::exception& e) {
        throw BackendAuthError(std::string("malformed token response: ") + e.what());
    }

    if (token.token.empty()) {
        throw BackendAuthError("token response carried no access_token");
    }

    log_debug("refreshed access token for %s", client_email_.c_str());
    return token;
}

std::unique_ptr<TokenProvider> make_token_provider(const std::string& static_token,
                                                   const std::string& credentials_file,
                                                   std::shared_ptr<net::HttpClient> http) {
    if (!static_token.empty() ||
        (credentials_file.empty() && !std::getenv("GOOGLE_APPLICATION_CREDENTIALS"))) {
        return std::make_unique<StaticTokenProvider>(static_token);
    }
    ServiceAccountTokenProvider::Config cfg;
    cfg.credentials_file = credentials_file;
    return std::make_unique<ServiceAccountTokenProvider>(cfg, std::move(http));
}

} // namespace tusgate
