#pragma once

#include "tusgate/core/context.hpp"
#include "tusgate/net/http.hpp"
#include "tusgate/storage/credentials.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tusgate {

class BucketResolver {
public:
    virtual ~BucketResolver() = default;

    // Bucket holding the tenant's objects; created on first use
    virtual std::string resolve_bucket(const RequestContext& ctx) = 0;
};

// Bucket name for a tenant: "{tenant}{sep}{base}" with the tenant lowercased
// and sep '.' when the base name is dotted (domain-named buckets), '_' otherwise.
std::string tenant_bucket_name(const std::string& tenant_id, const std::string& base_bucket);

class GcsBucketResolver : public BucketResolver {
public:
    struct Config {
        std::string base_bucket;
        std::string project_id;
        std::string endpoint;       // empty for storage.googleapis.com
        bool verify_ssl = true;
        bool create_missing = true;
    };

    GcsBucketResolver(const Config& config,
                      std::shared_ptr<net::HttpClient> http,
                      std::shared_ptr<TokenProvider> tokens);

    std::string resolve_bucket(const RequestContext& ctx) override;

private:
    void ensure_bucket(const std::string& name);
    std::string api_base() const;

    Config config_;
    std::shared_ptr<net::HttpClient> http_;
    std::shared_ptr<TokenProvider> tokens_;

    std::mutex mutex_;
    std::unordered_set<std::string> known_;
};

// Fixed bucket, no lookups. Used with emulators and in tests.
class StaticBucketResolver : public BucketResolver {
public:
    explicit StaticBucketResolver(std::string bucket) : bucket_(std::move(bucket)) {}
    std::string resolve_bucket(const RequestContext&) override { return bucket_; }

private:
    std::string bucket_;
};

} // namespace tusgate
