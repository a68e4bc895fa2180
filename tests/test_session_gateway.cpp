#include <gtest/gtest.h>
#include <managers/session_gateway.hpp>
#include <server/http_routes.hpp>
#include <sstream>
#include "common/fake_transport.hpp"

class SessionGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        remote->add_dir("/home");
        remote->add_dir("/home/tester");
        remote->add_file("/home/tester/notes.txt", "remember");
        remote->exec_handler = [](const std::string& cmd) {
            FakeCommand c;
            if (cmd == "whoami") c.out = "tester\n";
            if (cmd == "false") c.exit_code = 1;
            if (cmd == "sleep 10") c.hang = true;
            return c;
        };

        Config config;
        config.reconnect().max_attempts = 1;
        config.reconnect().initial_delay_ms = 1;
        gateway = std::make_unique<SessionGateway>(config, fake_transport_factory(remote));
    }

    void connect() {
        auto r = gateway->connect(fake_credentials());
        ASSERT_TRUE(r.is_ok()) << r.error;
    }

    ApiReply call(const std::string& method, const std::string& target, const std::string& body = "") {
        ApiRequest req = parse_target(method, target);
        req.body = body;
        auto reply = handle_api(*gateway, req);
        EXPECT_TRUE(reply.has_value()) << target;
        return reply ? *reply : ApiReply{};
    }

    FakeRemotePtr remote;
    std::unique_ptr<SessionGateway> gateway;
};

TEST_F(SessionGatewayTest, EverythingRemoteNeedsASession) {
    EXPECT_EQ(gateway->list_directory("/").kind, ErrorKind::ConnectionLost);
    EXPECT_EQ(gateway->read_file("/home/tester/notes.txt").kind, ErrorKind::ConnectionLost);
    EXPECT_EQ(gateway->execute_command("whoami").kind, ErrorKind::ConnectionLost);
    auto r = gateway->create_directory("/tmp");
    EXPECT_EQ(r.kind, ErrorKind::ConnectionLost);
    EXPECT_EQ(r.error, "No active session");
    EXPECT_EQ(remote->channels_opened.load(), 0);
}

TEST_F(SessionGatewayTest, ServerStatusIsIndependentOfSession) {
    auto s = gateway->server_status();
    EXPECT_EQ(s.phase, ServerPhase::NotStarted);
    EXPECT_TRUE(gateway->stop_server().is_ok());
}

TEST_F(SessionGatewayTest, FileAndCommandRoundTrip) {
    connect();
    ASSERT_TRUE(gateway->write_file("/home/tester/app.conf", "port=80\n").is_ok());
    auto back = gateway->read_file("/home/tester/app.conf");
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value, "port=80\n");

    auto who = gateway->execute_command("whoami");
    ASSERT_TRUE(who.is_ok());
    EXPECT_EQ(who.value.stdout_data, "tester\n");
}

TEST_F(SessionGatewayTest, BackgroundTransfers) {
    connect();
    auto in = std::make_shared<std::istringstream>(std::string(100000, 'q'));
    auto up = gateway->start_upload(in, "/home/tester/big.dat");
    auto uploaded = up->wait();
    ASSERT_TRUE(uploaded.is_ok()) << uploaded.error;
    EXPECT_EQ(uploaded.value.bytes, 100000u);
    EXPECT_TRUE(up->done());

    std::string received;
    auto down = gateway->start_download("/home/tester/big.dat", [&](const char* d, size_t n) {
        received.append(d, n);
        return true;
    });
    ASSERT_TRUE(down->wait().is_ok());
    EXPECT_EQ(received.size(), 100000u);
}

TEST_F(SessionGatewayTest, ShutdownDisconnects) {
    connect();
    gateway->shutdown();
    EXPECT_FALSE(gateway->is_connected());
    gateway->shutdown();
}

// ── HTTP routing ─────────────────────────────────────────────

TEST(HttpRoutes, ParseTargetDecodesQuery) {
    auto req = parse_target("GET", "/api/list/?path=%2Fhome%2Fmy+files&x");
    EXPECT_EQ(req.path, "/api/list");
    EXPECT_EQ(req.param("path"), "/home/my files");
    EXPECT_EQ(req.param("x", "fallback"), "");
    EXPECT_EQ(req.param("missing", "fallback"), "fallback");
}

TEST(HttpRoutes, StatusForErrorKinds) {
    EXPECT_EQ(http_status_for(ErrorKind::InvalidArgument), 400);
    EXPECT_EQ(http_status_for(ErrorKind::Authentication), 401);
    EXPECT_EQ(http_status_for(ErrorKind::PermissionDenied), 403);
    EXPECT_EQ(http_status_for(ErrorKind::PathNotFound), 404);
    EXPECT_EQ(http_status_for(ErrorKind::IsADirectory), 409);
    EXPECT_EQ(http_status_for(ErrorKind::ConnectionLost), 503);
    EXPECT_EQ(http_status_for(ErrorKind::CommandTimeout), 504);
    EXPECT_EQ(http_status_for(ErrorKind::Archive), 500);
}

TEST(HttpRoutes, ErrorBodyCarriesKindName) {
    auto reply = error_reply(ErrorKind::PathNotFound, "no such file: /x");
    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(reply.body["status"], "error");
    EXPECT_EQ(reply.body["kind"], "PathNotFoundError");
    EXPECT_EQ(reply.body["message"], "no such file: /x");
}

TEST(HttpRoutes, InvalidUtf8IsReplacedOnSerialization) {
    ApiReply reply;
    reply.body = {{"content", std::string("ok\xff")}};
    std::string text = dump_reply(reply);
    EXPECT_NE(text.find("ok\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(SessionGatewayTest, ListRouteSplitsDirectoriesAndFiles) {
    connect();
    remote->add_dir("/home/tester/src");
    auto reply = call("GET", "/api/list?path=/home/tester/");
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["path"], "/home/tester");
    ASSERT_EQ(reply.body["directories"].size(), 1u);
    EXPECT_EQ(reply.body["directories"][0]["name"], "src");
    EXPECT_EQ(reply.body["directories"][0]["kind"], "directory");
    ASSERT_EQ(reply.body["files"].size(), 1u);
    EXPECT_EQ(reply.body["files"][0]["name"], "notes.txt");
    EXPECT_EQ(reply.body["files"][0]["size"], 8);
    EXPECT_EQ(reply.body["files"][0]["size_text"], "8 B");
}

TEST_F(SessionGatewayTest, RoutesWithoutSessionAre503) {
    auto reply = call("GET", "/api/list?path=/");
    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(reply.body["kind"], "ConnectionLostError");

    auto session = call("GET", "/api/session");
    EXPECT_EQ(session.status, 200);
    EXPECT_EQ(session.body["session"]["connected"], false);
}

TEST_F(SessionGatewayTest, FileRoutes) {
    connect();
    EXPECT_EQ(call("POST", "/api/save?path=/home/tester/a.txt", "alpha").status, 200);
    auto file = call("GET", "/api/file?path=/home/tester/a.txt");
    ASSERT_EQ(file.status, 200);
    EXPECT_EQ(file.body["content"], "alpha");

    EXPECT_EQ(call("POST", "/api/mkdir?path=/home/tester/dir").status, 200);
    EXPECT_EQ(call("POST", "/api/mkdir?path=/home/tester/dir").status, 409);
    EXPECT_EQ(call("POST", "/api/touch?path=/home/tester/dir/empty").status, 200);
    EXPECT_EQ(call("POST", "/api/rename?from=/home/tester/a.txt&to=/home/tester/b.txt").status, 200);
    EXPECT_EQ(call("GET", "/api/stat?path=/home/tester/b.txt").body["entry"]["size"], 5);
    EXPECT_EQ(call("POST", "/api/delete?path=/home/tester/dir").status, 200);
    EXPECT_FALSE(remote->exists("/home/tester/dir/empty"));

    EXPECT_EQ(call("GET", "/api/file?path=/home/tester/gone").status, 404);
    EXPECT_EQ(call("GET", "/api/file?path=/home/tester").status, 409);
    EXPECT_EQ(call("GET", "/api/file").status, 400);
    EXPECT_EQ(call("POST", "/api/rename?from=/a").status, 400);
}

TEST_F(SessionGatewayTest, ExecRoute) {
    connect();
    auto ok = call("POST", "/api/exec", "  whoami\n");
    ASSERT_EQ(ok.status, 200);
    EXPECT_EQ(ok.body["result"]["stdout"], "tester\n");
    EXPECT_EQ(ok.body["result"]["exit_code"], 0);

    auto failed = call("POST", "/api/exec", "false");
    ASSERT_EQ(failed.status, 200);
    EXPECT_EQ(failed.body["result"]["exit_code"], 1);

    EXPECT_EQ(call("POST", "/api/exec", "   ").status, 400);

    auto timed_out = call("POST", "/api/exec?timeout=1", "sleep 10");
    EXPECT_EQ(timed_out.status, 504);
    EXPECT_EQ(timed_out.body["result"]["exit_code"], EXIT_CODE_TIMED_OUT);
}

TEST_F(SessionGatewayTest, UnknownAndWrongMethod) {
    ApiRequest unknown = parse_target("GET", "/api/nothing");
    EXPECT_FALSE(handle_api(*gateway, unknown).has_value());

    auto wrong = call("GET", "/api/save?path=/x");
    EXPECT_EQ(wrong.status, 405);
    EXPECT_EQ(call("GET", "/health").status, 200);
}
