#include "operation_registry.hpp"

const char* operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Connect:  return "connect";
        case OperationKind::Pwd:      return "pwd";
        case OperationKind::Cd:       return "cd";
        case OperationKind::Upload:   return "upload";
        case OperationKind::Download: return "download";
        case OperationKind::Generic:  return "generic";
    }
    return "generic";
}

bool is_single_slot(OperationKind kind) {
    return kind == OperationKind::Connect || kind == OperationKind::Pwd ||
           kind == OperationKind::Cd;
}

SettleOutcome OperationRegistry::settle(OperationKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(slot_key(kind, key));
    if (it == pending_.end()) return SettleOutcome::StateMismatch;
    auto* promise = std::get_if<std::promise<void>>(&it->second.result);
    if (!promise) return SettleOutcome::WrongResultType;

    auto outcome = SettleOutcome::Settled;
    try {
        promise->set_value();
    } catch (const std::future_error&) {
        outcome = SettleOutcome::AlreadySettled;
    }
    pending_.erase(it);
    return outcome;
}

SettleOutcome OperationRegistry::fail(OperationKind kind, const std::string& key,
                                      const std::string& reason, ErrorKind error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(slot_key(kind, key));
    if (it == pending_.end()) return SettleOutcome::StateMismatch;

    auto ex = std::make_exception_ptr(SftpError(error, reason));
    auto outcome = SettleOutcome::Settled;
    std::visit([&](auto& promise) {
        try {
            promise.set_exception(ex);
        } catch (const std::future_error&) {
            outcome = SettleOutcome::AlreadySettled;
        }
    }, it->second.result);
    pending_.erase(it);
    return outcome;
}

std::optional<OperationInfo> OperationRegistry::peek(OperationKind kind,
                                                     const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(slot_key(kind, key));
    if (it == pending_.end()) return std::nullopt;
    return it->second.info;
}

bool OperationRegistry::mark_echoed(OperationKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(slot_key(kind, key));
    if (it == pending_.end() || it->second.info.phase == OperationPhase::Echoed) return false;
    it->second.info.phase = OperationPhase::Echoed;
    return true;
}

size_t OperationRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t OperationRegistry::pending_count(OperationKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : pending_) {
        if (entry.first.first == kind) ++n;
    }
    return n;
}
