#pragma once

#include "tusgate/server/protocol_adapter.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tusgate {

// HTTP/1.1 front end on Boost.Beast: one request per connection,
// Content-Length bodies only. Routes /files and /files/{slot} onto the
// protocol adapter. Connections are served on a fixed worker pool with
// blocking reads and writes so the adapter can stream bodies through.
class HttpServer {
public:
    struct Config {
        std::string listen_address;
        uint16_t port;                  // 0 picks an ephemeral port
        size_t worker_threads;
        std::string default_tenant;
        int read_timeout_secs = 30;
        uint32_t max_header_bytes = 64 * 1024;
        uint64_t max_body_bytes;        // larger Content-Length gets 413
        Config();
    };

    struct Stats {
        uint64_t connections_accepted = 0;
        uint64_t requests_served = 0;
        uint64_t bad_requests = 0;
    };

    // Called by the worker after each connection with its wall-clock duration
    using RequestObserver = std::function<void(std::chrono::duration<double>)>;

    HttpServer(const Config& config, TusProtocolAdapter& adapter);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the accept loop. Returns an error message, empty on success.
    std::string start();
    void stop();

    void set_request_observer(RequestObserver observer) { observer_ = std::move(observer); }

    uint16_t port() const { return bound_port_; }
    Stats stats() const;

private:
    void do_accept();
    void worker_loop();
    void handle_connection(boost::asio::io_context& ioc, boost::asio::ip::tcp::socket socket);
    void count_bad_request();

    Config config_;
    TusProtocolAdapter& adapter_;
    RequestObserver observer_;

    boost::asio::io_context accept_ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::vector<std::thread> workers_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<boost::asio::ip::tcp::socket> pending_;

    std::atomic<uint64_t> request_seq_{0};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

// True when a slot id is safe to echo in Location and object metadata
bool is_valid_slot_id(const std::string& slot_id);

} // namespace tusgate
