#include <gtest/gtest.h>
#include <session/line_classifier.hpp>

TEST(LineClassifierTest, Connected) {
    auto c = classify_line("Connected to build-box.");
    EXPECT_EQ(c.tag, LineTag::Connected);
    EXPECT_EQ(c.raw, "Connected to build-box.");
}

TEST(LineClassifierTest, UploadProgress) {
    auto c = classify_line("Uploading dist/app.tar.gz to /srv/www/app.tar.gz");
    EXPECT_EQ(c.tag, LineTag::UploadProgress);
    EXPECT_EQ(c.local_path, "dist/app.tar.gz");
    EXPECT_EQ(c.remote_path, "/srv/www/app.tar.gz");
}

TEST(LineClassifierTest, DownloadProgress) {
    auto c = classify_line("Fetching /var/log/syslog to syslog");
    EXPECT_EQ(c.tag, LineTag::DownloadProgress);
    EXPECT_EQ(c.remote_path, "/var/log/syslog");
    EXPECT_EQ(c.local_path, "syslog");
}

TEST(LineClassifierTest, TransferSplitsAtFirstSeparator) {
    auto c = classify_line("Uploading a.txt to dir to somewhere/a.txt");
    EXPECT_EQ(c.local_path, "a.txt");
    EXPECT_EQ(c.remote_path, "dir to somewhere/a.txt");
}

TEST(LineClassifierTest, PwdResultIsTrimmed) {
    auto c = classify_line("Remote working directory:    /home/x");
    EXPECT_EQ(c.tag, LineTag::PwdResult);
    EXPECT_EQ(c.remote_path, "/home/x");
}

TEST(LineClassifierTest, LocalPwdResult) {
    auto c = classify_line("Local working directory: /home/me");
    EXPECT_EQ(c.tag, LineTag::LocalPwdResult);
    EXPECT_EQ(c.local_path, "/home/me");
}

TEST(LineClassifierTest, ShellCdFailure) {
    auto c = classify_line("-bash: cd: missing: No such file or directory");
    EXPECT_EQ(c.tag, LineTag::CdFailureShell);
    EXPECT_EQ(c.remote_path, "missing");
    EXPECT_EQ(c.failure_reason, "No such file or directory");
}

TEST(LineClassifierTest, ShellCdFailurePathWithColon) {
    auto c = classify_line("-bash: cd: a: b: Permission denied");
    EXPECT_EQ(c.remote_path, "a: b");
    EXPECT_EQ(c.failure_reason, "Permission denied");
}

TEST(LineClassifierTest, StatRemoteFailure) {
    auto c = classify_line("stat remote: No such file or directory");
    EXPECT_EQ(c.tag, LineTag::CdFailureStat);
    EXPECT_EQ(c.failure_reason, "No such file or directory");
    EXPECT_TRUE(c.remote_path.empty());
}

TEST(LineClassifierTest, PromptWithCommand) {
    auto c = classify_line("sftp> put   a.txt    /tmp/a.txt");
    EXPECT_EQ(c.tag, LineTag::Prompt);
    EXPECT_EQ(c.action, "put");
    EXPECT_EQ(c.args_text, "a.txt /tmp/a.txt");
    EXPECT_EQ(prompt_command(c), "put a.txt /tmp/a.txt");
}

TEST(LineClassifierTest, BarePrompt) {
    auto c = classify_line("sftp>");
    EXPECT_EQ(c.tag, LineTag::Prompt);
    EXPECT_TRUE(c.action.empty());
    EXPECT_TRUE(prompt_command(c).empty());
}

TEST(LineClassifierTest, Unrecognized) {
    EXPECT_EQ(classify_line("drwxr-xr-x    2 x  x  4096 Jan  1 00:00 docs").tag,
              LineTag::Unrecognized);
    EXPECT_EQ(classify_line("Uploading").tag, LineTag::Unrecognized);
    EXPECT_EQ(classify_line("connected to host").tag, LineTag::Unrecognized);
}

TEST(LineClassifierTest, Deterministic) {
    const std::string line = "Fetching /a/b to c";
    auto first = classify_line(line);
    auto second = classify_line(line);
    EXPECT_EQ(first.tag, second.tag);
    EXPECT_EQ(first.local_path, second.local_path);
    EXPECT_EQ(first.remote_path, second.remote_path);
}

TEST(LineClassifierTest, TagNames) {
    EXPECT_STREQ(line_tag_name(LineTag::UploadProgress), "uploadProgress");
    EXPECT_STREQ(line_tag_name(LineTag::CdFailureStat), "cdFailureStat");
    EXPECT_STREQ(line_tag_name(LineTag::Unrecognized), "unrecognized");
}

TEST(LineClassifierTest, FormatRebuildsSameShape) {
    for (const std::string line : {"Remote working directory: /home/x",
                                   "Uploading a.txt to /tmp/a.txt",
                                   "Fetching /tmp/b.txt to b.txt"}) {
        auto c = classify_line(line);
        auto rebuilt = format_line(c);
        ASSERT_TRUE(rebuilt.has_value()) << line;
        EXPECT_EQ(*rebuilt, line);
        EXPECT_EQ(classify_line(*rebuilt).tag, c.tag);
    }
}

TEST(LineClassifierTest, FormatUndefinedForPrompt) {
    EXPECT_FALSE(format_line(classify_line("sftp> ls")).has_value());
    EXPECT_FALSE(format_line(classify_line("Connected to x.")).has_value());
}
