#include <gtest/gtest.h>
#include <session/correlation_engine.hpp>
#include "support/fake_transport.hpp"
#include <chrono>
#include <deque>

class CorrelationEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
    OperationRegistry registry;
    DiagnosticRouter router{logger, VerbosityMode::Verbose, "test"};
    CorrelationEngine engine{registry, router, "build-box"};

    template <typename T>
    static bool is_ready(std::future<T>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

TEST_F(CorrelationEngineTest, UploadSettlesExactlyOnce) {
    auto reg = registry.register_op<bool>(OperationKind::Upload, "a.txt", "put a.txt");
    engine.process_line("Uploading a.txt to /tmp/a.txt");

    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_TRUE(reg.value.get());
    EXPECT_EQ(registry.pending_count(), 0u);
    EXPECT_TRUE(logger->contains("Uploaded a.txt to /tmp/a.txt"));

    engine.process_line("Uploading a.txt to /tmp/a.txt");
    EXPECT_EQ(engine.state_mismatches(), 1u);
}

TEST_F(CorrelationEngineTest, UnexpectedUploadIsStateMismatch) {
    EXPECT_NO_THROW(engine.process_line("Uploading ghost.txt to /tmp/ghost.txt"));
    EXPECT_EQ(engine.state_mismatches(), 1u);

    bool found = false;
    for (const auto& e : logger->entries()) {
        if (e.message.find("STATE_MISMATCH") != std::string::npos) {
            EXPECT_EQ(e.severity, Severity::Error);
            EXPECT_NE(e.message.find("ghost.txt"), std::string::npos);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(CorrelationEngineTest, DownloadKeyedByLocalPath) {
    auto reg = registry.register_op<bool>(OperationKind::Download, "syslog", "get /var/log/syslog");
    engine.process_line("Fetching /var/log/syslog to syslog");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_TRUE(reg.value.get());
}

TEST_F(CorrelationEngineTest, PwdResolvesTrimmedPath) {
    auto reg = registry.register_op<std::string>(OperationKind::Pwd, "", "pwd");
    engine.process_line("Remote working directory: /home/x");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_EQ(reg.value.get(), "/home/x");
}

TEST_F(CorrelationEngineTest, CdShellFailureRejects) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "missing", "cd missing");
    engine.process_line("sftp> cd missing");
    engine.process_line("-bash: cd: missing: No such file or directory");

    ASSERT_TRUE(is_ready(reg.value));
    try {
        reg.value.get();
        FAIL() << "expected rejection";
    } catch (const SftpError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("missing"), std::string::npos);
        EXPECT_NE(what.find("No such file or directory"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::OperationFailure);
    }
    EXPECT_EQ(engine.state_mismatches(), 0u);
}

TEST_F(CorrelationEngineTest, CdStatFailureUsesPendingPath) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "/srv/nowhere", "cd /srv/nowhere");
    engine.process_line("stat remote: No such file or directory");
    try {
        reg.value.get();
        FAIL() << "expected rejection";
    } catch (const SftpError& e) {
        EXPECT_NE(std::string(e.what()).find("/srv/nowhere"), std::string::npos);
    }
}

TEST_F(CorrelationEngineTest, CdSucceedsOnBarePrompt) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "ok", "cd ok");
    engine.process_line("sftp>");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_NO_THROW(reg.value.get());
    EXPECT_EQ(registry.pending_count(), 0u);
}

TEST_F(CorrelationEngineTest, CdEchoDoesNotSettle) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "ok", "cd ok");
    engine.process_line("sftp> cd ok");
    EXPECT_FALSE(is_ready(reg.value));
    EXPECT_EQ(registry.peek(OperationKind::Cd)->phase, OperationPhase::Echoed);

    // The next command's echo means the cd went through.
    engine.process_line("sftp> pwd");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_NO_THROW(reg.value.get());
}

TEST_F(CorrelationEngineTest, CdSettlesOnFenceEcho) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "ok", "cd ok");
    engine.process_line("sftp> cd ok");
    engine.process_line("sftp> lpwd");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_NO_THROW(reg.value.get());

    engine.process_line("Local working directory: /home/me");
    EXPECT_EQ(engine.state_mismatches(), 0u);
    EXPECT_FALSE(logger->contains("-> Local working directory"));
}

TEST_F(CorrelationEngineTest, ShellFailureForOtherPathIsMismatch) {
    auto reg = registry.register_op<void>(OperationKind::Cd, "docs", "cd docs");
    engine.process_line("sftp> cd docs");
    engine.process_line("-bash: cd: elsewhere: No such file or directory");

    EXPECT_FALSE(is_ready(reg.value));
    EXPECT_EQ(engine.state_mismatches(), 1u);
    EXPECT_TRUE(logger->contains("STATE_MISMATCH: sftp reported a failed cd into 'elsewhere'"));

    engine.process_line("sftp> lpwd");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_NO_THROW(reg.value.get());
}

TEST_F(CorrelationEngineTest, CdFailureWithoutPendingIsMismatch) {
    engine.process_line("stat remote: No such file or directory");
    EXPECT_EQ(engine.state_mismatches(), 1u);
}

TEST_F(CorrelationEngineTest, ConnectConsumedOnce) {
    auto reg = registry.register_op<bool>(OperationKind::Connect, "", "sftp build-box");
    engine.process_line("Connected to build-box.");
    ASSERT_TRUE(is_ready(reg.value));
    EXPECT_TRUE(reg.value.get());
    EXPECT_TRUE(logger->contains("connected to build-box"));

    engine.process_line("Connected to build-box.");
    EXPECT_EQ(engine.state_mismatches(), 1u);
}

TEST_F(CorrelationEngineTest, UnrecognizedLinesAreForwarded) {
    engine.process_line("-rw-r--r--    1 x  x  12 Jan  1 00:00 notes.txt");
    EXPECT_TRUE(logger->contains("-> -rw-r--r--"));
    EXPECT_EQ(engine.state_mismatches(), 0u);
    EXPECT_EQ(engine.lines_processed(), 1u);
    EXPECT_EQ(engine.last_line(), "-rw-r--r--    1 x  x  12 Jan  1 00:00 notes.txt");
}

TEST_F(CorrelationEngineTest, RunConsumesWholeSource) {
    struct ListSource : LineSource {
        std::deque<std::string> lines;
        std::optional<std::string> next_line() override {
            if (lines.empty()) return std::nullopt;
            auto line = lines.front();
            lines.pop_front();
            return line;
        }
    } source;
    source.lines = {"Connected to build-box.", "sftp> pwd", "Remote working directory: /srv"};

    auto connect = registry.register_op<bool>(OperationKind::Connect, "", "sftp build-box");
    auto pwd = registry.register_op<std::string>(OperationKind::Pwd, "", "pwd");

    EXPECT_EQ(engine.run(source), 3u);
    EXPECT_TRUE(connect.value.get());
    EXPECT_EQ(pwd.value.get(), "/srv");
}
