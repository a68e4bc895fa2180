#include "http_server.hpp"
#include "http_routes.hpp"
#include <managers/session_gateway.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <csignal>
#include <sys/socket.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static constexpr std::uint64_t MAX_REQUEST_BODY = 64ull * 1024 * 1024;

namespace {

std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

void send_reply(tcp::socket& socket, unsigned version, const ApiReply& reply) {
    http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
    res.set(http::field::server, std::string("vpsx/") + VPSX_VERSION);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = dump_reply(reply);
    res.prepare_payload();

    beast::error_code ec;
    http::write(socket, res, ec);
    if (ec) gateway_log("HttpServer: reply write failed: " + ec.message());
}

// Chunked transfer-encoding response fed incrementally. A write failure
// (client gone) latches, and every later write reports false.
class ChunkedResponse {
public:
    ChunkedResponse(tcp::socket& socket, unsigned version)
        : socket_(socket), version_(version) {}

    bool begin(const std::string& content_type, const std::string& disposition = "") {
        http::response<http::empty_body> res{http::status::ok, version_};
        res.set(http::field::server, std::string("vpsx/") + VPSX_VERSION);
        res.set(http::field::content_type, content_type);
        if (!disposition.empty()) res.set(http::field::content_disposition, disposition);
        res.chunked(true);
        res.keep_alive(false);

        http::response_serializer<http::empty_body> sr{res};
        beast::error_code ec;
        http::write_header(socket_, sr, ec);
        ok_ = !ec;
        return ok_;
    }

    bool write(const char* data, size_t len) {
        if (!ok_) return false;
        if (len == 0) return true;
        beast::error_code ec;
        net::write(socket_, http::make_chunk(net::const_buffer(data, len)), ec);
        ok_ = !ec;
        return ok_;
    }

    bool write(const std::string& text) { return write(text.data(), text.size()); }

    // Only a finished response is complete; an abandoned one reads as truncated.
    void finish() {
        if (!ok_) return;
        beast::error_code ec;
        net::write(socket_, http::make_chunk_last(), ec);
        ok_ = !ec;
    }

private:
    tcp::socket& socket_;
    unsigned version_;
    bool ok_ = false;
};

std::string attachment(const std::string& name, bool inline_view) {
    std::string safe = name;
    std::replace(safe.begin(), safe.end(), '"', '_');
    return fmt::format("{}; filename=\"{}\"", inline_view ? "inline" : "attachment", safe);
}

} // namespace

HttpServer::HttpServer(SessionGateway& gateway, std::string bind, int port)
    : gateway_(gateway), bind_(std::move(bind)), port_(port), acceptor_(io_), signals_(io_) {
}

HttpServer::~HttpServer() {
    stop();
    reap_workers(true);
}

Result<void> HttpServer::open() {
    beast::error_code ec;
    auto address = net::ip::make_address(bind_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Invalid bind address: " + bind_);
    }

    tcp::endpoint endpoint{address, static_cast<unsigned short>(port_)};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (ec == net::error::address_in_use) {
        return Result<void>::Err(ErrorKind::PortInUse,
                                 fmt::format("Port {} is already in use", port_));
    }
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::OperationFailed,
                                 fmt::format("Cannot listen on {}:{}: {}", bind_, port_, ec.message()));
    }

    port_ = acceptor_.local_endpoint().port();
    gateway_log(fmt::format("HttpServer: listening on {}:{}", bind_, port_));
    return Result<void>::Ok();
}

void HttpServer::stop_on_signals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const beast::error_code& ec, int sig) {
        if (ec) return;
        gateway_log(fmt::format("HttpServer: signal {}, shutting down", sig));
        stop();
    });
}

void HttpServer::run() {
    do_accept();
    io_.run();
    reap_workers(true);
    gateway_log("HttpServer: stopped");
}

void HttpServer::stop() {
    if (stopping_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        for (auto& weak : requests_) {
            if (auto token = weak.lock()) token->cancel();
        }
    }
    {
        // Unblock workers parked in a read on an idle connection
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& w : workers_) {
            if (!w->done.load() && w->fd >= 0) ::shutdown(w->fd, SHUT_RDWR);
        }
    }
    // run() returns once the pending accept and signal waits are cancelled
    net::post(io_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    });
}

CancelTokenPtr HttpServer::track_request() {
    auto token = std::make_shared<CancelToken>();
    std::lock_guard<std::mutex> lock(requests_mutex_);
    requests_.erase(std::remove_if(requests_.begin(), requests_.end(),
                                   [](const std::weak_ptr<CancelToken>& w) { return w.expired(); }),
                    requests_.end());
    if (stopping_) token->cancel();
    requests_.push_back(token);
    return token;
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (!stopping_) gateway_log("HttpServer: accept failed: " + ec.message());
            return;
        }
        reap_workers(false);

        auto worker = std::make_unique<Worker>();
        Worker* raw = worker.get();
        raw->fd = socket.native_handle();
        raw->thread = std::thread([this, raw, s = std::move(socket)]() mutable {
            serve_connection(std::move(s));
            raw->done.store(true);
        });
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(std::move(worker));
        }
        do_accept();
    });
}

void HttpServer::reap_workers(bool all) {
    std::list<std::unique_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w->thread.joinable()) w->thread.join();
    }
}

// ── Connection ──────────────────────────────────────────────

void HttpServer::serve_connection(tcp::socket socket) {
    beast::error_code ec;
    beast::flat_buffer buffer;

    http::request_parser<http::empty_body> header;
    http::read_header(socket, buffer, header, ec);
    if (ec) {
        if (ec != http::error::end_of_stream) {
            gateway_log("HttpServer: bad request header: " + ec.message());
        }
        return;
    }

    unsigned version = header.get().version();
    ApiRequest req = parse_target(to_string(header.get().method_string()),
                                  to_string(header.get().target()));
    gateway_log(fmt::format("HttpServer: {} {}", req.method, req.path));

    if (req.method == "POST" && req.path == "/api/upload") {
        std::string path = req.param("path");
        if (path.empty()) {
            send_reply(socket, version, error_reply(ErrorKind::InvalidArgument, "Missing parameter: path"));
            return;
        }

        // Body lands in a local temp file first, then streams to the remote side
        auto temp = platform::temp_file("vpsx_upload_");
        http::request_parser<http::file_body> parser{std::move(header)};
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        parser.get().body().open(temp.string().c_str(), beast::file_mode::write, ec);
        if (ec) {
            send_reply(socket, version, error_reply(ErrorKind::OperationFailed,
                                                    "Cannot create temp file: " + ec.message()));
            return;
        }
        http::read(socket, buffer, parser, ec);
        parser.get().body().close();

        if (ec) {
            std::error_code rc;
            std::filesystem::remove(temp, rc);
            send_reply(socket, version, error_reply(ErrorKind::InvalidArgument,
                                                    "Upload body incomplete: " + ec.message()));
            return;
        }

        Result<TransferReport> r;
        {
            std::ifstream in(temp, std::ios::binary);
            auto token = track_request();
            r = gateway_.upload_file(in, path, token.get());
        }
        std::error_code rc;
        std::filesystem::remove(temp, rc);

        if (r.is_err()) {
            send_reply(socket, version, error_reply(r));
        } else {
            ApiReply ok;
            ok.body = {{"status", "ok"}, {"message", "File uploaded"}, {"bytes", r.value.bytes}};
            send_reply(socket, version, ok);
        }
        socket.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    http::request_parser<http::string_body> parser{std::move(header)};
    parser.body_limit(MAX_REQUEST_BODY);
    http::read(socket, buffer, parser, ec);
    if (ec) {
        send_reply(socket, version, error_reply(ErrorKind::InvalidArgument, "Bad request: " + ec.message()));
        return;
    }
    req.body = parser.get().body();

    if (req.method == "GET" && req.path == "/api/download") {
        std::string path = req.param("path");
        if (path.empty()) {
            send_reply(socket, version, error_reply(ErrorKind::InvalidArgument, "Missing parameter: path"));
            return;
        }
        // A link to a directory downloads as a zip
        auto st = gateway_.stat(path, true);
        if (st.is_err()) {
            send_reply(socket, version, error_reply(st));
            return;
        }

        const FileEntry& entry = st.value;
        bool inline_view = req.param("inline") == "1";
        std::string name = entry.name.empty() ? "root" : entry.name;
        ChunkedResponse out(socket, version);
        auto token = track_request();
        ByteSink sink = [&out](const char* data, size_t len) { return out.write(data, len); };

        if (entry.is_dir()) {
            if (!out.begin("application/zip", attachment(name + ".zip", inline_view))) return;
            auto r = gateway_.download_directory_archive(entry.path, sink, token.get());
            if (r.is_err()) {
                gateway_log_error("HttpServer: archive " + entry.path, r);
                return;
            }
            if (!r.value.warnings.empty()) {
                gateway_log(fmt::format("HttpServer: archive {} finished with {} warning(s)",
                                        entry.path, r.value.warnings.size()));
            }
        } else {
            if (!out.begin("application/octet-stream", attachment(name, inline_view))) return;
            auto r = gateway_.download_file(entry.path, sink, token.get());
            if (r.is_err()) {
                gateway_log_error("HttpServer: download " + entry.path, r);
                return;
            }
        }
        out.finish();
    } else if (req.method == "POST" && req.path == "/api/exec/stream") {
        std::string command = StringUtils::trim(req.body);
        if (command.empty()) {
            send_reply(socket, version, error_reply(ErrorKind::InvalidArgument, "No command provided"));
            return;
        }
        if (!gateway_.is_connected()) {
            send_reply(socket, version, error_reply(ErrorKind::ConnectionLost, "No active session"));
            return;
        }

        ChunkedResponse out(socket, version);
        if (!out.begin("text/plain; charset=utf-8")) return;
        auto token = track_request();
        int timeout = safe_stoi(req.param("timeout"), 0);
        auto r = gateway_.execute_streaming(
            command, timeout,
            [&](OutputStream, const std::string& chunk) {
                if (!out.write(chunk)) token->cancel();
            },
            token.get());
        if (r.is_err()) {
            gateway_log_error("HttpServer: stream", r);
            out.write(fmt::format("\nError: {}\n", r.error));
        }
        out.finish();
    } else if (auto reply = handle_api(gateway_, req)) {
        send_reply(socket, version, *reply);
    } else {
        send_reply(socket, version, error_reply(404, error_kind_name(ErrorKind::InvalidArgument),
                                                "Unknown endpoint: " + req.path));
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}
