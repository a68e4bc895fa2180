#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/credentials.hpp>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.connection().port, 22);
    EXPECT_EQ(r.value.timeouts().command_timeout_secs, SSH_CMD_TIMEOUT_SECS);
    EXPECT_EQ(r.value.reconnect().max_attempts, RECONNECT_MAX_ATTEMPTS);
    EXPECT_EQ(r.value.server().port, 0);
    EXPECT_EQ(r.value.server().bind, SERVER_DEFAULT_BIND);
}

TEST(Config, ParsesAllSections) {
    auto r = Config::parse(R"(
connection:
  host: vps.example.com
  port: 2222
  user: deploy
  auth: publickey
  key_path: /keys/id_ed25519
  host_key_policy: strict
timeouts:
  command_timeout_secs: 60
reconnect:
  max_attempts: 2
  initial_delay_ms: 100
  max_delay_ms: 300
server:
  port: 8080
  bind: 127.0.0.1
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.connection().host, "vps.example.com");
    EXPECT_EQ(c.connection().port, 2222);
    EXPECT_EQ(c.connection().user, "deploy");
    EXPECT_EQ(c.connection().auth, AuthMethod::PublicKey);
    ASSERT_TRUE(c.connection().key_path.has_value());
    EXPECT_EQ(*c.connection().key_path, "/keys/id_ed25519");
    EXPECT_EQ(c.connection().host_key_policy, HostKeyPolicy::Strict);
    EXPECT_EQ(c.timeouts().command_timeout_secs, 60);
    EXPECT_EQ(c.reconnect().max_attempts, 2);
    EXPECT_EQ(c.server().port, 8080);
    EXPECT_EQ(c.server().bind, "127.0.0.1");
}

TEST(Config, MalformedYamlIsInvalidArgument) {
    auto r = Config::parse("connection: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST(Config, RejectsUnknownAuthAndBadPort) {
    EXPECT_EQ(Config::parse("connection:\n  auth: telepathy\n").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(Config::parse("server:\n  port: 70000\n").kind, ErrorKind::InvalidArgument);
}

TEST(Config, ReconnectDelayDoublesAndCaps) {
    ReconnectPolicy p;
    p.initial_delay_ms = 500;
    p.max_delay_ms = 3000;
    EXPECT_EQ(p.delay_for_attempt(1), 500);
    EXPECT_EQ(p.delay_for_attempt(2), 1000);
    EXPECT_EQ(p.delay_for_attempt(3), 2000);
    EXPECT_EQ(p.delay_for_attempt(4), 3000);
    EXPECT_EQ(p.delay_for_attempt(10), 3000);
}

// ── Credentials ──────────────────────────────────────────────

static RemoteCredentials sample_credentials() {
    RemoteCredentials creds;
    creds.host = "203.0.113.7";
    creds.port = 2200;
    creds.username = "root";
    creds.secret = "p@ss: \"quoted\" #not-a-comment";
    return creds;
}

TEST(Credentials, HandOffPreservesEveryField) {
    RemoteCredentials creds = sample_credentials();
    creds.auth = AuthMethod::PublicKey;
    creds.key_path = "/home/me/.ssh/id_rsa";

    auto decoded = decode_credentials(encode_credentials(creds));
    ASSERT_TRUE(decoded.is_ok()) << decoded.error;
    EXPECT_EQ(decoded.value.host, creds.host);
    EXPECT_EQ(decoded.value.port, creds.port);
    EXPECT_EQ(decoded.value.username, creds.username);
    EXPECT_EQ(decoded.value.secret, creds.secret);
    EXPECT_EQ(decoded.value.auth, AuthMethod::PublicKey);
    EXPECT_EQ(decoded.value.key_path, creds.key_path);
}

TEST(Credentials, DecodeRejectsGarbage) {
    EXPECT_EQ(decode_credentials("- just\n- a list\n").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(decode_credentials("host: h\nuser: u\n").kind, ErrorKind::InvalidArgument);
}

TEST(Credentials, ValidateRequiresHostUserAndSecret) {
    RemoteCredentials creds = sample_credentials();
    EXPECT_TRUE(validate_credentials(creds).is_ok());

    auto no_host = creds;
    no_host.host.clear();
    EXPECT_EQ(validate_credentials(no_host).kind, ErrorKind::InvalidArgument);

    auto no_secret = creds;
    no_secret.secret.clear();
    EXPECT_EQ(validate_credentials(no_secret).kind, ErrorKind::InvalidArgument);

    auto bad_port = creds;
    bad_port.port = 0;
    EXPECT_EQ(validate_credentials(bad_port).kind, ErrorKind::InvalidArgument);

    auto key_file = creds;
    key_file.secret.clear();
    key_file.auth = AuthMethod::PublicKey;
    key_file.key_path = "/k";
    EXPECT_TRUE(validate_credentials(key_file).is_ok());
}

TEST(Credentials, TargetSpec) {
    RemoteCredentials creds;
    creds.username = "fallback";

    ASSERT_TRUE(apply_target_spec("admin@box.example:2022", creds).is_ok());
    EXPECT_EQ(creds.username, "admin");
    EXPECT_EQ(creds.host, "box.example");
    EXPECT_EQ(creds.port, 2022);

    RemoteCredentials plain;
    plain.username = "kept";
    ASSERT_TRUE(apply_target_spec("10.0.0.5", plain).is_ok());
    EXPECT_EQ(plain.username, "kept");
    EXPECT_EQ(plain.host, "10.0.0.5");
    EXPECT_EQ(plain.port, 22);

    EXPECT_EQ(apply_target_spec("host:notaport", plain).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(apply_target_spec("user@", plain).kind, ErrorKind::InvalidArgument);
}
