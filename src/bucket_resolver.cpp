#include "tusgate/storage/bucket_resolver.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace tusgate {

std::string tenant_bucket_name(const std::string& tenant_id, const std::string& base_bucket) {
    if (tenant_id.empty()) {
        return base_bucket;
    }
    std::string tenant = tenant_id;
    std::transform(tenant.begin(), tenant.end(), tenant.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    char sep = base_bucket.find('.') != std::string::npos ? '.' : '_';
    return tenant + sep + base_bucket;
}

GcsBucketResolver::GcsBucketResolver(const Config& config,
                                     std::shared_ptr<net::HttpClient> http,
                                     std::shared_ptr<TokenProvider> tokens)
    : config_(config), http_(std::move(http)), tokens_(std::move(tokens)) {}

std::string GcsBucketResolver::api_base() const {
    if (!config_.endpoint.empty()) {
        return config_.endpoint + "/storage/v1";
    }
    return "https://storage.googleapis.com/storage/v1";
}

std::string GcsBucketResolver::resolve_bucket(const RequestContext& ctx) {
    std::string name = tenant_bucket_name(ctx.tenant_id, config_.base_bucket);
    {
        std::lock_guard lock(mutex_);
        if (known_.count(name)) return name;
    }

    ensure_bucket(name);

    std::lock_guard lock(mutex_);
    known_.insert(name);
    return name;
}

void GcsBucketResolver::ensure_bucket(const std::string& name) {
    auto token = tokens_->get_access_token();

    net::HttpRequest lookup = net::HttpRequest::get(api_base() + "/b/" + net::url_encode(name));
    lookup.verify_ssl = config_.verify_ssl;
    if (!token.token.empty()) lookup.headers.set_bearer_token(token.token);

    auto response = http_->execute_with_retry(lookup);
    if (response.ok()) {
        return;
    }
    if (net::is_auth_error_status(response.status_code)) {
        throw BackendAuthError("bucket lookup for " + name + " rejected: HTTP " +
                               std::to_string(response.status_code));
    }
    if (response.status_code != 404 || !config_.create_missing) {
        throw BackendRequestError(response.status_code,
            response.error.empty() ? response.body_string() : response.error);
    }

    log_info("creating bucket %s", name.c_str());

    nlohmann::json body = {{"name", name}};
    std::string url = api_base() + "/b";
    if (!config_.project_id.empty()) {
        url += "?project=" + net::url_encode(config_.project_id);
    }
    net::HttpRequest create = net::HttpRequest::post(url, std::string());
    create.set_json_body(body.dump());
    create.verify_ssl = config_.verify_ssl;
    if (!token.token.empty()) create.headers.set_bearer_token(token.token);

    auto created = http_->execute(create);
    // 409: another worker created it first
    if (!created.ok() && created.status_code != 409) {
        if (net::is_auth_error_status(created.status_code)) {
            throw BackendAuthError("bucket creation for " + name + " rejected: HTTP " +
                                   std::to_string(created.status_code));
        }
        throw BackendRequestError(created.status_code,
            created.error.empty() ? created.body_string() : created.error);
    }
}

} // namespace tusgate
