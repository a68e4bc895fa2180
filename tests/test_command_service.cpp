#include <gtest/gtest.h>
#include <chrono>
#include <managers/command_service.hpp>
#include <managers/connection_manager.hpp>
#include <thread>
#include <vector>
#include "common/fake_transport.hpp"

class CommandServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        remote->exec_handler = [](const std::string& cmd) {
            FakeCommand c;
            if (cmd == "printf ok") {
                c.out = "ok";
            } else if (cmd == "exit 7") {
                c.err = "boom\n";
                c.exit_code = 7;
            } else if (cmd == "sleep forever") {
                c.out = "partial";
                c.hang = true;
            } else if (cmd == "yes") {
                c.endless = "y\n";
            } else if (cmd == "kill -9 $$") {
                c.exit_code = 137;
                c.signal = "KILL";
            } else if (cmd.rfind("echo ", 0) == 0) {
                c.out = cmd.substr(5) + "\n";
                c.delay_ms = 20;
            }
            return c;
        };
        connection = std::make_unique<ConnectionManager>(fake_transport_factory(remote),
                                                         TransportOptions{}, fast_reconnect(1));
        ASSERT_TRUE(connection->connect(fake_credentials()).is_ok());
        commands = std::make_unique<CommandService>(*connection, 30);
    }

    FakeRemotePtr remote;
    std::unique_ptr<ConnectionManager> connection;
    std::unique_ptr<CommandService> commands;
};

TEST_F(CommandServiceTest, CapturesStdout) {
    auto r = commands->execute("printf ok");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "ok");
    EXPECT_EQ(r.value.stderr_data, "");
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_TRUE(r.value.success());
    EXPECT_GE(r.value.duration_ms(), 0);
}

TEST_F(CommandServiceTest, NonZeroExitIsNotAnError) {
    auto r = commands->execute("exit 7");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 7);
    EXPECT_EQ(r.value.stderr_data, "boom\n");
    EXPECT_FALSE(r.value.success());
}

TEST_F(CommandServiceTest, ExitSignalIsReported) {
    auto r = commands->execute("kill -9 $$");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_signal, "KILL");
    EXPECT_FALSE(r.value.success());
}

TEST_F(CommandServiceTest, EmptyCommandIsRejected) {
    EXPECT_EQ(commands->execute("").kind, ErrorKind::InvalidArgument);
}

TEST_F(CommandServiceTest, NoSessionFailsFast) {
    connection->disconnect();
    int opened = remote->channels_opened.load();
    EXPECT_EQ(commands->execute("printf ok").kind, ErrorKind::ConnectionLost);
    EXPECT_EQ(remote->channels_opened.load(), opened);
}

TEST_F(CommandServiceTest, TimeoutDiscardsOutputAndReportsSentinel) {
    auto r = commands->execute("sleep forever", 1);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CommandTimeout);
    EXPECT_EQ(r.value.exit_code, EXIT_CODE_TIMED_OUT);
    EXPECT_TRUE(r.value.timed_out());
    EXPECT_EQ(r.value.stdout_data, "");
    EXPECT_EQ(r.value.command, "sleep forever");

    // The service stays usable afterwards
    EXPECT_TRUE(commands->execute("printf ok").is_ok());
}

TEST_F(CommandServiceTest, ConcurrentCallersRunOneAtATime) {
    std::vector<std::thread> threads;
    std::vector<Result<CommandResult>> results(6, Result<CommandResult>::Err(ErrorKind::None, ""));
    for (int i = 0; i < 6; i++) {
        threads.emplace_back([&, i]() {
            results[i] = commands->execute("echo job" + std::to_string(i));
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < 6; i++) {
        ASSERT_TRUE(results[i].is_ok()) << results[i].error;
        EXPECT_EQ(results[i].value.stdout_data, "job" + std::to_string(i) + "\n");
    }
    // Serialized: no two executions overlap in time
    for (int i = 0; i < 6; i++) {
        for (int j = i + 1; j < 6; j++) {
            const auto& a = results[i].value;
            const auto& b = results[j].value;
            EXPECT_TRUE(a.finished_at <= b.started_at || b.finished_at <= a.started_at);
        }
    }
    EXPECT_EQ(commands->queued(), 0);
}

TEST_F(CommandServiceTest, StreamingForwardsChunks) {
    std::string out;
    std::string err;
    auto r = commands->execute_streaming("exit 7", 0, [&](OutputStream s, const std::string& chunk) {
        (s == OutputStream::Stdout ? out : err) += chunk;
    });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(err, "boom\n");
    EXPECT_EQ(out, "");
    EXPECT_EQ(r.value.exit_code, 7);
    EXPECT_EQ(r.value.stderr_data, "");
}

TEST_F(CommandServiceTest, StreamingCancelClosesChannel) {
    CancelToken cancel;
    std::string out;
    auto r = commands->execute_streaming("sleep forever", 0, [&](OutputStream, const std::string& chunk) {
        out += chunk;
        cancel.cancel();
    }, &cancel);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_EQ(out, "partial");
}

TEST_F(CommandServiceTest, TimeoutFiresWhileOutputKeepsFlowing) {
    auto start = std::chrono::steady_clock::now();
    auto r = commands->execute("yes", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CommandTimeout);
    EXPECT_EQ(r.value.exit_code, EXIT_CODE_TIMED_OUT);
    EXPECT_EQ(r.value.stdout_data, "");
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    // The turn was released
    EXPECT_TRUE(commands->execute("printf ok").is_ok());
    EXPECT_EQ(commands->queued(), 0);
}

TEST_F(CommandServiceTest, StreamingCancelWhileOutputKeepsFlowing) {
    CancelToken cancel;
    size_t received = 0;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = commands->execute_streaming("yes", 0, [&](OutputStream, const std::string& chunk) {
        received += chunk.size();
    }, &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_GT(received, 0u);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(commands->execute("printf ok").is_ok());
}
