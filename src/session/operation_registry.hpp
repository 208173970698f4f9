#pragma once

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/types.hpp>

enum class OperationKind {
    Connect,
    Pwd,
    Cd,
    Upload,
    Download,
    Generic,
};

const char* operation_kind_name(OperationKind kind);

// Single-slot kinds allow one outstanding operation; the others are keyed by path.
bool is_single_slot(OperationKind kind);

// Where a still-pending operation stands. Terminal states are represented by
// the operation leaving the registry.
enum class OperationPhase {
    Issued,   // command written, nothing observed yet
    Echoed,   // sftp echoed the command back ("sftp> cd x")
};

struct OperationInfo {
    OperationKind kind = OperationKind::Generic;
    std::string key;        // cd: target path, transfers: local path
    std::string command;    // exact text written to the child
    OperationPhase phase = OperationPhase::Issued;
};

enum class SettleOutcome {
    Settled,
    StateMismatch,     // nothing pending under that kind/key
    WrongResultType,   // pending, but its future carries a different type
    AlreadySettled,    // the promise was satisfied behind our back
};

// Outstanding operations and their promises. Registration happens on caller
// threads, settlement only on the session's reader thread.
class OperationRegistry {
public:
    // Create a pending operation and return its future. A second single-slot
    // registration fails; a keyed one replaces (and orphans) the earlier entry.
    template <typename T>
    Result<std::future<T>> register_op(OperationKind kind, const std::string& key,
                                       const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto slot = slot_key(kind, key);
        if (is_single_slot(kind) && pending_.count(slot)) {
            const auto& existing = pending_.at(slot).info;
            return Result<std::future<T>>::Err(fmt::format(
                "a {} operation is already outstanding ('{}')",
                operation_kind_name(kind), existing.command));
        }

        PendingOperation op;
        op.info = OperationInfo{kind, key, command, OperationPhase::Issued};
        std::promise<T> promise;
        auto future = promise.get_future();
        op.result = std::move(promise);
        pending_[slot] = std::move(op);
        return Result<std::future<T>>::Ok(std::move(future));
    }

    // Resolve and remove the matching operation.
    template <typename T>
    SettleOutcome settle(OperationKind kind, const std::string& key, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(slot_key(kind, key));
        if (it == pending_.end()) return SettleOutcome::StateMismatch;
        auto* promise = std::get_if<std::promise<T>>(&it->second.result);
        if (!promise) return SettleOutcome::WrongResultType;

        auto outcome = SettleOutcome::Settled;
        try {
            promise->set_value(std::move(value));
        } catch (const std::future_error&) {
            outcome = SettleOutcome::AlreadySettled;
        }
        pending_.erase(it);
        return outcome;
    }

    // Resolve a void-result operation (cd, generic).
    SettleOutcome settle(OperationKind kind, const std::string& key);

    // Reject and remove the matching operation with an SftpError.
    SettleOutcome fail(OperationKind kind, const std::string& key, const std::string& reason,
                       ErrorKind error = ErrorKind::OperationFailure);

    // Non-mutating lookup. For single-slot kinds the key is ignored.
    std::optional<OperationInfo> peek(OperationKind kind, const std::string& key = "") const;

    // Issued → Echoed. Returns false if nothing is pending or it was already echoed.
    bool mark_echoed(OperationKind kind, const std::string& key = "");

    size_t pending_count() const;
    size_t pending_count(OperationKind kind) const;

private:
    using ResultSlot = std::variant<std::promise<bool>,
                                    std::promise<std::string>,
                                    std::promise<void>>;

    struct PendingOperation {
        OperationInfo info;
        ResultSlot result;
    };

    using SlotKey = std::pair<OperationKind, std::string>;

    static SlotKey slot_key(OperationKind kind, const std::string& key) {
        return {kind, is_single_slot(kind) ? std::string() : key};
    }

    mutable std::mutex mutex_;
    std::map<SlotKey, PendingOperation> pending_;
};
