#pragma once

#include "tusgate/storage/bucket_resolver.hpp"
#include "tusgate/storage/credentials.hpp"
#include "tusgate/storage/session_client.hpp"
#include "tusgate/net/http.hpp"

#include <memory>
#include <string>

namespace tusgate {

// Google Cloud Storage JSON API, resumable upload protocol.
// A session is opened with a POST to .../o?uploadType=resumable; the returned
// Location is the session URI that takes Content-Range PUTs.
class GcsSessionClient : public BackendSessionClient {
public:
    struct Config {
        std::string endpoint;          // empty for https://storage.googleapis.com
        bool verify_ssl = true;
        size_t download_chunk_size;    // bytes per ranged GET
        Config();
    };

    GcsSessionClient(const Config& config,
                     std::shared_ptr<net::HttpClient> http,
                     std::shared_ptr<TokenProvider> tokens,
                     std::shared_ptr<BucketResolver> buckets);

    std::string type_name() const override { return "gcs"; }

    std::string open_session(const RequestContext& ctx,
                             const std::string& object_key,
                             const std::string& content_type,
                             uint64_t declared_size,
                             const std::map<std::string, std::string>& metadata) override;

    ChunkResult append_chunk(const std::string& session_uri,
                             std::span<const uint8_t> data,
                             uint64_t range_start,
                             uint64_t declared_size) override;

    void delete_object(const RequestContext& ctx, const std::string& object_key) override;

    std::unique_ptr<ChunkedReader> open_download(const RequestContext& ctx,
                                                 const std::string& object_key) override;

    // URLs, exposed for tests
    std::string session_init_url(const std::string& bucket, const std::string& object_key) const;
    std::string object_url(const std::string& bucket, const std::string& object_key) const;

private:
    void authorize(net::HttpRequest& request);

    Config config_;
    std::shared_ptr<net::HttpClient> http_;
    std::shared_ptr<TokenProvider> tokens_;
    std::shared_ptr<BucketResolver> buckets_;
};

} // namespace tusgate
