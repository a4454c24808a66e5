// Authoritative record of every transfer task created by this process.
// All state changes go through here and are checked against the lifecycle.
#pragma once
#include "TransferTask.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace bridgescp {

class TransferStore {
public:
    TransferStore() = default;
    TransferStore(const TransferStore &) = delete;
    TransferStore &operator=(const TransferStore &) = delete;

    // Assigns the id and creation time; the task starts Pending.
    quint64 create(TransferTask task);

    std::optional<TransferTask> get(quint64 id) const;
    std::optional<TransferTask::Status> status(quint64 id) const;
    // All tasks ordered by id.
    std::vector<TransferTask> snapshot() const;
    int countInStatus(TransferTask::Status st) const;

    // Pending -> InProgress. Resets transferred bytes, stamps the start time
    // and counts the attempt.
    bool beginTransfer(quint64 id);
    // Only while InProgress, before any byte was recorded.
    bool setTotal(quint64 id, quint64 total);
    bool setDestination(quint64 id, const QString &dst);
    // Only while InProgress; transferred never decreases nor exceeds total.
    // false tells the copy loop to stop.
    bool recordProgress(quint64 id, quint64 transferred);
    // InProgress -> Completed; requires transferred == total.
    bool complete(quint64 id);
    // InProgress -> Failed
    bool fail(quint64 id, const QString &error);
    // Pending|InProgress -> Cancelled
    bool cancel(quint64 id);
    // Failed -> Pending with zero bytes and no error.
    bool resetForRetry(quint64 id);

    static bool isLegalTransition(TransferTask::Status from,
                                  TransferTask::Status to);

private:
    mutable std::mutex mtx_;
    std::map<quint64, TransferTask> tasks_;
    quint64 nextId_ = 1;

    // Applies from -> to when legal. Caller holds mtx_.
    TransferTask *transitionLocked(quint64 id, TransferTask::Status to);
};

} // namespace bridgescp
