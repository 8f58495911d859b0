#include "tusgate/server/http_server.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/upload/upload_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace tusgate {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// One client connection on a worker-private io_context. Each operation is
// started asynchronously and the context is run until it completes, so the
// stream's expiry bounds every blocking read and write.
class Connection {
public:
    Connection(asio::io_context& ioc, tcp::socket socket, std::chrono::seconds timeout)
        : ioc_(ioc), stream_(std::move(socket)), timeout_(timeout) {}

    ~Connection() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream_.close();
    }

    beast::tcp_stream& stream() { return stream_; }
    beast::flat_buffer& buffer() { return buffer_; }

    template <typename Initiate>
    beast::error_code run(Initiate&& initiate) {
        beast::error_code result;
        stream_.expires_after(timeout_);
        initiate([&result](beast::error_code ec, std::size_t) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

private:
    asio::io_context& ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::chrono::seconds timeout_;
};

using RequestParser = http::request_parser<http::buffer_body>;

// Request body straight off the parser, never past Content-Length
class RequestBodySource : public ByteSource {
public:
    RequestBodySource(Connection& conn, RequestParser& parser) : conn_(conn), parser_(parser) {}

    size_t read(uint8_t* buf, size_t max_len) override {
        while (!ended_ && max_len > 0 && !parser_.is_done()) {
            auto& body = parser_.get().body();
            body.data = buf;
            body.size = max_len;
            auto ec = conn_.run([&](auto handler) {
                http::async_read(conn_.stream(), conn_.buffer(), parser_, std::move(handler));
            });
            if (ec == http::error::need_buffer) ec = {};
            size_t n = max_len - body.size;
            if (ec) {
                // Peer closed or timed out: short body
                log_debug("request body ended early: %s", ec.message().c_str());
                ended_ = true;
            }
            if (n > 0) return n;
        }
        return 0;
    }

private:
    Connection& conn_;
    RequestParser& parser_;
    bool ended_ = false;
};

// Adapter headers onto a Beast message. A value with CR or LF would end the
// header block early, so the whole response is refused instead.
template <typename Body>
void copy_headers(const ProtocolResponse& resp, http::response<Body>& out) {
    for (const auto& [name, value] : resp.headers.all()) {
        if (!net::is_safe_header_value(value)) {
            throw std::invalid_argument("refusing " + name + " header containing CR/LF");
        }
        out.insert(name, value);
    }
}

void send_response(Connection& conn, const ProtocolResponse& resp, unsigned version,
                   bool head_only) {
    http::response<http::string_body> res{static_cast<http::status>(resp.status), version};
    copy_headers(resp, res);
    if (!head_only) res.body() = resp.body;
    res.keep_alive(false);
    res.prepare_payload();

    auto ec = conn.run([&](auto handler) {
        http::async_write(conn.stream(), res, std::move(handler));
    });
    if (ec) {
        throw std::runtime_error("client write failed: " + ec.message());
    }
}

// Streamed GET body. write() returns once Beast has handed the bytes to the
// socket, so a slow client throttles the backend reads.
class ResponseBodySink : public ByteSink {
public:
    ResponseBodySink(Connection& conn, unsigned version)
        : conn_(conn), res_{http::status::ok, version}, sr_(res_) {}

    void send_header(const ProtocolResponse& resp) {
        res_.result(static_cast<http::status>(resp.status));
        copy_headers(resp, res_);
        res_.keep_alive(false);
        res_.body().data = nullptr;
        res_.body().more = true;
        check(conn_.run([&](auto handler) {
            http::async_write_header(conn_.stream(), sr_, std::move(handler));
        }));
        header_sent_ = true;
    }

    void write(std::span<const uint8_t> data) override {
        if (data.empty()) return;
        res_.body().data = const_cast<uint8_t*>(data.data());
        res_.body().size = data.size();
        res_.body().more = true;
        check(conn_.run([&](auto handler) {
            http::async_write(conn_.stream(), sr_, std::move(handler));
        }));
    }

    void finish() {
        res_.body().data = nullptr;
        res_.body().size = 0;
        res_.body().more = false;
        check(conn_.run([&](auto handler) {
            http::async_write(conn_.stream(), sr_, std::move(handler));
        }));
    }

    bool header_sent() const { return header_sent_; }

private:
    static void check(beast::error_code ec) {
        if (ec == http::error::need_buffer) return;
        if (ec) throw std::runtime_error("client write failed: " + ec.message());
    }

    Connection& conn_;
    http::response<http::buffer_body> res_;
    http::response_serializer<http::buffer_body> sr_;
    bool header_sent_ = false;
};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

}  // namespace

bool is_valid_slot_id(const std::string& slot_id) {
    if (slot_id.empty() || slot_id.size() > 256) return false;
    return std::all_of(slot_id.begin(), slot_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
    });
}

HttpServer::Config::Config()
    : listen_address(constants::DEFAULT_LISTEN_ADDRESS),
      port(constants::DEFAULT_SERVER_PORT),
      worker_threads(constants::DEFAULT_WORKER_THREADS),
      max_body_bytes(constants::DEFAULT_MAX_UPLOAD_SIZE) {}

HttpServer::HttpServer(const Config& config, TusProtocolAdapter& adapter)
    : config_(config), adapter_(adapter), acceptor_(accept_ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::start() {
    beast::error_code ec;
    auto address = asio::ip::make_address(config_.listen_address, ec);
    if (ec) {
        return "Invalid listen address: " + config_.listen_address;
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return "Failed to create socket: " + ec.message();
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);

    acceptor_.bind(endpoint, ec);
    if (ec) {
        std::string err = "Failed to bind " + config_.listen_address + ":" +
                          std::to_string(config_.port) + ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return err;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::string err = "Failed to listen: " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return err;
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();

    running_ = true;
    size_t n_workers = std::max<size_t>(1, config_.worker_threads);
    for (size_t i = 0; i < n_workers; ++i) {
        workers_.emplace_back(&HttpServer::worker_loop, this);
    }

    do_accept();
    accept_ioc_.restart();
    accept_thread_ = std::thread([this] { accept_ioc_.run(); });

    log_info("Listening on %s:%u (%zu workers)", config_.listen_address.c_str(),
             static_cast<unsigned>(bound_port_), n_workers);
    return "";
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    // The pending accept completes with operation_aborted and is not re-armed
    asio::post(accept_ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) accept_thread_.join();

    queue_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    std::lock_guard lock(queue_mutex_);
    pending_.clear();
}

HttpServer::Stats HttpServer::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void HttpServer::count_bad_request() {
    std::lock_guard lock(stats_mutex_);
    stats_.bad_requests++;
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                log_error("Accept failed: %s", ec.message().c_str());
            }
        } else {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.connections_accepted++;
            }
            {
                std::lock_guard lock(queue_mutex_);
                pending_.push_back(std::move(socket));
            }
            queue_cv_.notify_one();
        }
        if (running_.load() && acceptor_.is_open()) do_accept();
    });
}

void HttpServer::worker_loop() {
    asio::io_context ioc;
    while (true) {
        std::optional<tcp::socket> accepted;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_.load() || !pending_.empty(); });
            if (!running_.load()) return;
            accepted.emplace(std::move(pending_.front()));
            pending_.pop_front();
        }

        // Rebind the descriptor to this worker's context
        beast::error_code ec;
        auto protocol = accepted->local_endpoint(ec).protocol();
        if (ec) continue;
        auto fd = accepted->release(ec);
        if (ec) {
            log_debug("cannot take over connection: %s", ec.message().c_str());
            continue;
        }
        tcp::socket socket(ioc);
        socket.assign(protocol, fd, ec);
        if (ec) {
            log_error("cannot assign connection: %s", ec.message().c_str());
            continue;
        }

        auto started = std::chrono::steady_clock::now();
        handle_connection(ioc, std::move(socket));
        if (observer_) observer_(std::chrono::steady_clock::now() - started);
    }
}

void HttpServer::handle_connection(asio::io_context& ioc, tcp::socket socket) {
    Connection conn(ioc, std::move(socket), std::chrono::seconds(config_.read_timeout_secs));
    RequestParser parser;
    parser.header_limit(config_.max_header_bytes);
    parser.body_limit(config_.max_body_bytes);

    std::string method;
    std::string path;
    unsigned version = 11;
    std::optional<ResponseBodySink> download_sink;

    auto reply_status = [&](int status, const std::string& message) {
        ProtocolResponse resp;
        resp.status = status;
        resp.body = message;
        resp.headers.set("Tus-Resumable", constants::TUS_VERSION);
        send_response(conn, resp, version, false);
    };

    try {
        auto ec = conn.run([&](auto handler) {
            http::async_read_header(conn.stream(), conn.buffer(), parser, std::move(handler));
        });
        if (ec) {
            count_bad_request();
            if (ec == http::error::body_limit) {
                reply_status(413, "request body exceeds the upload limit");
            } else if (ec == http::error::header_limit) {
                reply_status(431, "request header too large");
            } else if (ec != http::error::end_of_stream && ec != beast::error::timeout &&
                       ec != asio::error::eof && ec != asio::error::connection_reset) {
                reply_status(400, "malformed request");
            }
            return;
        }

        const auto& request = parser.get();
        version = request.version();
        method = to_upper(std::string(request.method_string()));
        std::string target(request.target());
        path = net::url_decode(target.substr(0, target.find('?')));

        net::HttpHeaders headers;
        for (const auto& field : request) {
            headers.add(std::string(field.name_string()), std::string(field.value()));
        }

        RequestContext ctx;
        ctx.tenant_id = headers.get("X-Tenant-Id").value_or(config_.default_tenant);
        ctx.principal = headers.get("X-Principal").value_or("");
        ctx.request_id = headers.get("X-Request-Id")
            .value_or("req-" + std::to_string(request_seq_.fetch_add(1) + 1));

        log_debug("%s %s tenant=%s request=%s", method.c_str(), path.c_str(),
                  ctx.tenant_id.c_str(), ctx.request_id.c_str());

        if (parser.chunked()) {
            reply_status(411, "chunked request bodies are not supported");
            return;
        }

        // Route: /files (collection) or /files/{slot}
        std::string slot_id;
        const std::string prefix = "/files";
        if (path == prefix || path == prefix + "/") {
            if (method == "POST") {
                slot_id = random_hex_token();
            } else if (method != "OPTIONS") {
                reply_status(405, "method not allowed on collection");
                return;
            }
        } else if (path.rfind(prefix + "/", 0) == 0) {
            slot_id = path.substr(prefix.size() + 1);
            if (!is_valid_slot_id(slot_id)) {
                reply_status(404, "not found");
                return;
            }
        } else {
            reply_status(404, "not found");
            return;
        }

        if (method == "GET") {
            download_sink.emplace(conn, version);
            try {
                adapter_.download(ctx, slot_id, *download_sink, [&](const ProtocolResponse& resp) {
                    download_sink->send_header(resp);
                });
                download_sink->finish();
            } catch (const BridgeError& e) {
                if (download_sink->header_sent()) throw;
                send_response(conn, adapter_.error_response(e), version, false);
            }
        } else {
            if (beast::iequals(request[http::field::expect], "100-continue")) {
                http::response<http::empty_body> cont{http::status::continue_, version};
                auto cont_ec = conn.run([&](auto handler) {
                    http::async_write(conn.stream(), cont, std::move(handler));
                });
                if (cont_ec) {
                    throw std::runtime_error("client write failed: " + cont_ec.message());
                }
            }

            RequestBodySource body(conn, parser);

            ProtocolRequest req;
            req.method = method;
            req.headers = headers;
            req.body = &body;

            auto resp = adapter_.dispatch(ctx, slot_id, req);
            send_response(conn, resp, version, method == "HEAD");
        }

        std::lock_guard lock(stats_mutex_);
        stats_.requests_served++;
    } catch (const std::exception& e) {
        log_error("%s %s: %s", method.c_str(), path.c_str(), e.what());
        // Mid-stream failures can only be signalled by closing the connection
        if (download_sink && download_sink->header_sent()) return;
        try {
            // Raised outside the adapter, e.g. a malformed Content-Length
            if (auto* bridge_error = dynamic_cast<const BridgeError*>(&e)) {
                send_response(conn, adapter_.error_response(*bridge_error), version, false);
            } else {
                reply_status(500, "internal error");
            }
        } catch (const std::exception& write_error) {
            log_debug("cannot report error to client: %s", write_error.what());
        }
    }
}

} // namespace tusgate
