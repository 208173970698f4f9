#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/errors.hpp>
#include <transport/transport.hpp>
#include "correlation_engine.hpp"
#include "diagnostic_router.hpp"
#include "operation_registry.hpp"

// One interactive sftp child driven as an asynchronous API.
//
// Every operation writes one sftp command and returns a future that is
// settled when the child's output confirms (or refutes) it. A reader thread
// owned by the session is the only place futures are settled. Sessions share
// nothing, so several can run side by side.
//
// There is no timeout: if the confirming line never arrives the future stays
// pending until the session is destroyed (it then reports broken_promise).
class SftpSession {
public:
    // Spawn the configured sftp program and start reading its output.
    // Fails with a ProcessTransportUnavailable message if the child's pipes
    // cannot be set up.
    static Result<std::unique_ptr<SftpSession>> open(const SessionOptions& options);

    // Drive an already established transport.
    SftpSession(SessionOptions options, std::unique_ptr<SftpTransport> transport);
    ~SftpSession();

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    // Resolves with true once sftp prints its "Connected ..." line.
    std::shared_future<bool> connected() const { return connected_; }

    std::future<std::string> pwd();

    // Writes "cd <path>" followed by a harmless "lpwd"; the echo of the latter
    // closes the cd once no failure line came before it.
    std::future<void> cd(const std::string& remote_path);

    // These have no completion line; they settle once the command is written.
    std::future<void> lcd(const std::string& local_path);
    std::future<void> ls(const std::string& remote_path = "");
    std::future<void> lls(const std::string& local_path = "");
    std::future<void> send_command(const std::string& command);

    // Upload one file; remote_path empty = current remote directory.
    std::future<bool> upload_file(const std::string& local_path,
                                  const std::string& remote_path = "");

    // Upload files one after another, each starting once the previous one
    // settled. The first failure rejects the batch. A batch still running when
    // the session is destroyed is rejected instead of issuing more uploads.
    std::future<std::vector<bool>> upload_files(std::vector<std::string> local_paths,
                                                UploadProgressCallback on_uploaded = nullptr);

    // Download one file; local_path empty = current local directory.
    std::future<bool> download_file(const std::string& remote_path,
                                    const std::string& local_path = "");

    // Write "exit", close the child's stdin and wait for it to end.
    // Rejects with UncleanExit unless the exit status is clean.
    std::future<ExitStatus> close();

    // Terminate the child. Pending futures are not settled.
    bool kill();

    // False once the child's output stream has ended.
    bool output_open() const { return output_open_.load(); }

    const std::string& label() const { return options_.label; }
    const OperationRegistry& registry() const { return registry_; }
    const CorrelationEngine& engine() const { return engine_; }

private:
    SessionOptions options_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<SftpTransport> transport_;

    OperationRegistry registry_;
    DiagnosticRouter router_;
    CorrelationEngine engine_;
    std::shared_future<bool> connected_;

    std::thread reader_;
    std::thread closer_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> killed_{false};
    std::atomic<bool> output_open_{true};

    // Shared with running upload_files() batches; closed by the destructor
    // before anything a batch could touch is torn down.
    struct BatchGate {
        std::mutex mutex;
        bool open = true;
    };
    std::shared_ptr<BatchGate> batch_gate_ = std::make_shared<BatchGate>();

    void read_loop();

    // Register, write `command` (then `fence`, if any), and on write failure
    // reject the registered operation.
    template <typename T>
    std::future<T> issue(OperationKind kind, const std::string& key, const std::string& command,
                         const std::string& fence = "");

    std::future<void> write_only(const std::string& command);
};
