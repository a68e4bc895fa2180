#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

class SessionGateway;

// Embedded HTTP front end (`vpsx serve`).
//
// One thread per connection, one request per connection. JSON endpoints go
// through handle_api(); downloads and streamed command output are written
// as chunked responses straight from the gateway's sink callbacks.
class HttpServer {
public:
    HttpServer(SessionGateway& gateway, std::string bind, int port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen. PortInUse if the address is taken.
    Result<void> open();

    // SIGINT / SIGTERM call stop(). Must be called before run().
    void stop_on_signals();

    // Accept loop; returns after stop().
    void run();

    // Safe from any thread (and from a signal-watching thread).
    void stop();

    int port() const { return port_; }

private:
    struct Worker {
        std::thread thread;
        int fd = -1;
        std::atomic<bool> done{false};
    };

    void do_accept();
    void serve_connection(boost::asio::ip::tcp::socket socket);
    void reap_workers(bool all);

    // Cancelled by stop(), so streams in flight end promptly.
    CancelTokenPtr track_request();

    SessionGateway& gateway_;
    std::string bind_;
    int port_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::atomic<bool> stopping_{false};

    std::mutex workers_mutex_;
    std::list<std::unique_ptr<Worker>> workers_;

    std::mutex requests_mutex_;
    std::vector<std::weak_ptr<CancelToken>> requests_;
};
