#include <gtest/gtest.h>
#include <archive.h>
#include <archive_entry.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <managers/session_gateway.hpp>
#include <server/http_server.hpp>
#include <map>
#include <thread>
#include "common/fake_transport.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static std::map<std::string, std::string> read_zip(const std::string& bytes) {
    std::map<std::string, std::string> out;
    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_memory(a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        ADD_FAILURE() << "cannot open zip: " << archive_error_string(a);
        archive_read_free(a);
        return out;
    }

    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        std::string content;
        char buf[4096];
        la_ssize_t n;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            content.append(buf, static_cast<size_t>(n));
        }
        out[archive_entry_pathname(entry)] = content;
    }
    archive_read_free(a);
    return out;
}

// A live server on an ephemeral loopback port, backed by the fake remote.
class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        remote->add_dir("/srv");
        remote->add_dir("/srv/site");
        remote->add_file("/srv/site/index.html", "<h1>hello</h1>");
        remote->add_dir("/srv/site/css");
        remote->add_file("/srv/site/css/main.css", "body { margin: 0; }");
        remote->add_symlink("/srv/current", "/srv/site");
        remote->add_file("/srv/notes.txt", std::string(3 * SFTP_CHUNK_SIZE + 5, 'n'));
        remote->exec_handler = [](const std::string& cmd) {
            FakeCommand c;
            if (cmd == "whoami") c.out = "tester\n";
            if (cmd == "false") c.exit_code = 1;
            return c;
        };

        Config config;
        config.reconnect().max_attempts = 1;
        config.reconnect().initial_delay_ms = 1;
        gateway = std::make_unique<SessionGateway>(config, fake_transport_factory(remote));
        ASSERT_TRUE(gateway->connect(fake_credentials()).is_ok());

        server = std::make_unique<HttpServer>(*gateway, "127.0.0.1", 0);
        auto opened = server->open();
        ASSERT_TRUE(opened.is_ok()) << opened.error;
        ASSERT_GT(server->port(), 0);
        runner = std::thread([this]() { server->run(); });
    }

    void TearDown() override {
        if (server) server->stop();
        if (runner.joinable()) runner.join();
        server.reset();
        if (gateway) gateway->shutdown();
    }

    http::response<http::string_body> request(http::verb method, const std::string& target,
                                              const std::string& body = "") {
        net::io_context io;
        tcp::socket socket(io);
        socket.connect({net::ip::make_address("127.0.0.1"), static_cast<unsigned short>(server->port())});

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.body() = body;
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read(socket, buffer, parser);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return parser.release();
    }

    FakeRemotePtr remote;
    std::unique_ptr<SessionGateway> gateway;
    std::unique_ptr<HttpServer> server;
    std::thread runner;
};

TEST_F(HttpServerTest, DownloadFileStreamsItsBytes) {
    auto res = request(http::verb::get, "/api/download?path=/srv/notes.txt");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/octet-stream");
    EXPECT_NE(std::string(res[http::field::content_disposition]).find("notes.txt"), std::string::npos);
    EXPECT_EQ(res.body(), remote->content("/srv/notes.txt"));
}

TEST_F(HttpServerTest, DownloadDirectoryIsAZip) {
    auto res = request(http::verb::get, "/api/download?path=/srv/site");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/zip");

    auto entries = read_zip(res.body());
    EXPECT_EQ(entries["index.html"], "<h1>hello</h1>");
    EXPECT_EQ(entries["css/main.css"], "body { margin: 0; }");
}

TEST_F(HttpServerTest, DownloadSymlinkToDirectoryIsAZip) {
    auto res = request(http::verb::get, "/api/download?path=/srv/current");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/zip");
    EXPECT_NE(std::string(res[http::field::content_disposition]).find("current.zip"), std::string::npos);

    auto entries = read_zip(res.body());
    EXPECT_EQ(entries["index.html"], "<h1>hello</h1>");
    EXPECT_EQ(entries["css/main.css"], "body { margin: 0; }");
}

TEST_F(HttpServerTest, DownloadMissingPathIs404) {
    auto res = request(http::verb::get, "/api/download?path=/srv/ghost");
    EXPECT_EQ(res.result(), http::status::not_found);
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["status"], "error");
}

TEST_F(HttpServerTest, UploadLandsOnTheRemote) {
    std::string payload(2 * SFTP_CHUNK_SIZE + 3, 'u');
    auto res = request(http::verb::post, "/api/upload?path=/srv/uploaded.bin", payload);
    EXPECT_EQ(res.result(), http::status::ok);
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["bytes"], payload.size());
    EXPECT_EQ(remote->content("/srv/uploaded.bin"), payload);
    EXPECT_TRUE(remote->find(TEMP_UPLOAD_TAG).empty());
}

TEST_F(HttpServerTest, ExecStreamReturnsOutput) {
    auto res = request(http::verb::post, "/api/exec/stream", "whoami");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "tester\n");

    auto empty = request(http::verb::post, "/api/exec/stream", "   ");
    EXPECT_EQ(empty.result(), http::status::bad_request);
}

TEST_F(HttpServerTest, JsonRoutesAndUnknownEndpoint) {
    auto list = request(http::verb::get, "/api/list?path=/srv");
    EXPECT_EQ(list.result(), http::status::ok);
    EXPECT_NO_THROW(nlohmann::json::parse(list.body()));

    auto unknown = request(http::verb::get, "/api/nothing-here");
    EXPECT_EQ(unknown.result(), http::status::not_found);
}

TEST_F(HttpServerTest, NoSessionIsServiceUnavailable) {
    gateway->disconnect();
    auto res = request(http::verb::post, "/api/exec/stream", "whoami");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
}
