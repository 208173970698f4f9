#include "sftp_session.hpp"
#include <core/constants.hpp>
#include <core/logger.hpp>
#include <transport/process_transport.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

using StringUtils::quote_path;

static std::shared_ptr<Logger> make_logger(const SessionOptions& options) {
    std::shared_ptr<Logger> base = options.logger;
    if (!base) base = std::make_shared<ConsoleLogger>();
    if (options.log_file.empty()) return base;
    return std::make_shared<TeeLogger>(std::vector<std::shared_ptr<Logger>>{
        base, std::make_shared<FileLogger>(options.log_file)});
}

template <typename T>
static std::future<T> rejected(ErrorKind kind, const std::string& message) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(SftpError(kind, message)));
    return promise.get_future();
}

// ── Lifecycle ────────────────────────────────────────────────

Result<std::unique_ptr<SftpSession>> SftpSession::open(const SessionOptions& options) {
    using SessionResult = Result<std::unique_ptr<SftpSession>>;

    if (options.host.empty() && options.program_args.empty()) {
        return SessionResult::Err("no host configured");
    }

    std::vector<std::string> args = options.program_args;
    if (args.empty()) args.push_back(options.host);

    auto transport = ProcessTransport::open(options.program, args, options.cwd);
    if (transport.is_err()) {
        return SessionResult::Err(fmt::format("{}: {}",
            error_kind_name(ErrorKind::ProcessTransportUnavailable), transport.error));
    }
    return SessionResult::Ok(std::make_unique<SftpSession>(options, std::move(transport.value)));
}

SftpSession::SftpSession(SessionOptions options, std::unique_ptr<SftpTransport> transport)
    : options_(std::move(options)),
      logger_(make_logger(options_)),
      transport_(std::move(transport)),
      router_(logger_, options_.verbosity, options_.label),
      engine_(registry_, router_, options_.host) {
    // The connect slot exists from the start; the first "Connected" line consumes it.
    auto reg = registry_.register_op<bool>(OperationKind::Connect, "",
                                           fmt::format("{} {}", options_.program, options_.host));
    connected_ = reg.value.share();

    reader_ = std::thread(&SftpSession::read_loop, this);
}

SftpSession::~SftpSession() {
    {
        std::lock_guard<std::mutex> lock(batch_gate_->mutex);
        batch_gate_->open = false;
    }
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!closing_.load()) {
            transport_->close_input();
            if (!killed_.load()) transport_->kill();
        }
    }
    if (closer_.joinable()) closer_.join();
    if (reader_.joinable()) reader_.join();
}

void SftpSession::read_loop() {
    uint64_t n = engine_.run(*transport_);
    output_open_.store(false);
    router_.route(EventClass::Routine, Severity::Debug,
                  fmt::format("sftp output closed after {} lines", n));
}

// ── Issuing commands ─────────────────────────────────────────

template <typename T>
std::future<T> SftpSession::issue(OperationKind kind, const std::string& key,
                                  const std::string& command, const std::string& fence) {
    auto reg = registry_.register_op<T>(kind, key, command);
    if (reg.is_err()) {
        router_.problem(fmt::format("{}: {}", error_kind_name(ErrorKind::DuplicateOperation),
                                    reg.error));
        return rejected<T>(ErrorKind::DuplicateOperation, reg.error);
    }

    auto written = transport_->write_command(command);
    if (written.is_ok() && !fence.empty()) {
        written = transport_->write_command(fence);
    }
    if (written.is_err()) {
        std::string message = fmt::format("'{}' could not be sent: {}", command, written.error);
        registry_.fail(kind, key, message);
        router_.problem(message);
    }
    return std::move(reg.value);
}

std::future<void> SftpSession::write_only(const std::string& command) {
    std::promise<void> promise;
    auto written = transport_->write_command(command);
    if (written.is_err()) {
        std::string message = fmt::format("'{}' could not be sent: {}", command, written.error);
        router_.problem(message);
        promise.set_exception(std::make_exception_ptr(
            SftpError(ErrorKind::OperationFailure, message)));
    } else {
        promise.set_value();
    }
    return promise.get_future();
}

std::future<std::string> SftpSession::pwd() {
    return issue<std::string>(OperationKind::Pwd, "", "pwd");
}

std::future<void> SftpSession::cd(const std::string& remote_path) {
    if (remote_path.empty()) {
        return rejected<void>(ErrorKind::OperationFailure, "cd needs a remote path");
    }
    return issue<void>(OperationKind::Cd, remote_path, "cd " + quote_path(remote_path),
                       CD_FENCE_COMMAND);
}

std::future<void> SftpSession::lcd(const std::string& local_path) {
    if (local_path.empty()) {
        return rejected<void>(ErrorKind::OperationFailure, "lcd needs a local path");
    }
    return write_only("lcd " + quote_path(local_path));
}

std::future<void> SftpSession::ls(const std::string& remote_path) {
    return write_only(remote_path.empty() ? "ls" : "ls " + quote_path(remote_path));
}

std::future<void> SftpSession::lls(const std::string& local_path) {
    return write_only(local_path.empty() ? "lls" : "lls " + quote_path(local_path));
}

std::future<void> SftpSession::send_command(const std::string& command) {
    return write_only(command);
}

std::future<bool> SftpSession::upload_file(const std::string& local_path,
                                           const std::string& remote_path) {
    if (local_path.empty()) {
        return rejected<bool>(ErrorKind::OperationFailure, "put needs a local path");
    }
    std::string command = "put " + quote_path(local_path);
    if (!remote_path.empty()) command += " " + quote_path(remote_path);
    return issue<bool>(OperationKind::Upload, local_path, command);
}

std::future<std::vector<bool>> SftpSession::upload_files(std::vector<std::string> local_paths,
                                                         UploadProgressCallback on_uploaded) {
    return std::async(std::launch::async,
        [this, gate = batch_gate_, label = options_.label,
         paths = std::move(local_paths), on_uploaded = std::move(on_uploaded)]() {
            std::vector<bool> results;
            results.reserve(paths.size());
            for (size_t i = 0; i < paths.size(); ++i) {
                std::future<bool> upload;
                {
                    // Holding the gate keeps the session alive while the put is issued.
                    std::lock_guard<std::mutex> lock(gate->mutex);
                    if (!gate->open) {
                        throw SftpError(ErrorKind::OperationFailure, fmt::format(
                            "{}: session closed before '{}' was uploaded", label, paths[i]));
                    }
                    upload = upload_file(paths[i]);
                }
                // get() rethrows a rejection, which ends the batch.
                results.push_back(upload.get());
                if (on_uploaded) on_uploaded(paths[i], i + 1);
            }
            return results;
        });
}

std::future<bool> SftpSession::download_file(const std::string& remote_path,
                                             const std::string& local_path) {
    if (remote_path.empty()) {
        return rejected<bool>(ErrorKind::OperationFailure, "get needs a remote path");
    }
    std::string command = "get " + quote_path(remote_path);
    if (!local_path.empty()) command += " " + quote_path(local_path);

    // sftp reports downloads as "Fetching <remote> to <local destination>".
    std::string key = local_path.empty() ? StringUtils::basename(remote_path) : local_path;
    return issue<bool>(OperationKind::Download, key, command);
}

// ── Shutdown ─────────────────────────────────────────────────

std::future<ExitStatus> SftpSession::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closing_.exchange(true)) {
        return rejected<ExitStatus>(ErrorKind::OperationFailure,
                                    fmt::format("{}: close() was already called", options_.label));
    }

    auto written = transport_->write_command(SFTP_EXIT_COMMAND);
    if (written.is_err()) {
        // Closing stdin below still ends the session.
        router_.problem(fmt::format("could not send '{}': {}", SFTP_EXIT_COMMAND, written.error),
                        Severity::Warn);
    }
    transport_->close_input();

    auto promise = std::make_shared<std::promise<ExitStatus>>();
    auto future = promise->get_future();
    closer_ = std::thread([this, promise]() {
        ExitStatus status = transport_->wait_exit();
        if (status.clean()) {
            router_.milestone("SFTP connection exited successfully");
            promise->set_value(status);
            return;
        }

        std::string message = status.signal != 0
            ? fmt::format("SFTP connection was terminated by signal {}", status.signal)
            : fmt::format("SFTP connection exited unsuccessfully with code {}", status.code);
        router_.problem(message);
        promise->set_exception(std::make_exception_ptr(
            SftpError(ErrorKind::UncleanExit, fmt::format("{}: {}", options_.label, message))));
    });
    return future;
}

bool SftpSession::kill() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    killed_.store(true);
    bool killed = transport_->kill();
    if (killed) {
        router_.problem("sftp child was killed; pending operations will not settle",
                        Severity::Warn);
    }
    return killed;
}
