// Task store: a mutex-guarded map, never held across I/O.
#include "TransferStore.hpp"
#include <QDateTime>

namespace bridgescp {

const char *transferStatusName(TransferTask::Status st) {
    switch (st) {
    case TransferTask::Status::Pending:
        return "Pending";
    case TransferTask::Status::InProgress:
        return "InProgress";
    case TransferTask::Status::Completed:
        return "Completed";
    case TransferTask::Status::Failed:
        return "Failed";
    case TransferTask::Status::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *transferDirectionLabel(TransferTask::Direction dir) {
    return dir == TransferTask::Direction::Upload ? "upload" : "download";
}

bool TransferStore::isLegalTransition(TransferTask::Status from,
                                      TransferTask::Status to) {
    using S = TransferTask::Status;
    switch (from) {
    case S::Pending:
        return to == S::InProgress || to == S::Cancelled;
    case S::InProgress:
        return to == S::Completed || to == S::Failed || to == S::Cancelled;
    case S::Failed:
        return to == S::Pending;
    case S::Completed:
    case S::Cancelled:
        return false;
    }
    return false;
}

quint64 TransferStore::create(TransferTask task) {
    std::lock_guard<std::mutex> lk(mtx_);
    task.id = nextId_++;
    task.status = TransferTask::Status::Pending;
    task.transferredBytes = 0;
    task.attempts = 0;
    task.createdAtMs = QDateTime::currentMSecsSinceEpoch();
    task.startedAtMs = 0;
    task.finishedAtMs = 0;
    task.error.clear();
    const quint64 id = task.id;
    tasks_.emplace(id, std::move(task));
    return id;
}

std::optional<TransferTask> TransferStore::get(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second;
}

std::optional<TransferTask::Status> TransferStore::status(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second.status;
}

std::vector<TransferTask> TransferStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferTask> out;
    out.reserve(tasks_.size());
    for (const auto &kv : tasks_)
        out.push_back(kv.second);
    return out;
}

int TransferStore::countInStatus(TransferTask::Status st) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto &kv : tasks_) {
        if (kv.second.status == st)
            ++n;
    }
    return n;
}

TransferTask *TransferStore::transitionLocked(quint64 id,
                                              TransferTask::Status to) {
    auto it = tasks_.find(id);
    if (it == tasks_.end() || !isLegalTransition(it->second.status, to))
        return nullptr;
    it->second.status = to;
    return &it->second;
}

bool TransferStore::beginTransfer(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask *t = transitionLocked(id, TransferTask::Status::InProgress);
    if (!t)
        return false;
    t->transferredBytes = 0;
    t->startedAtMs = QDateTime::currentMSecsSinceEpoch();
    t->finishedAtMs = 0;
    ++t->attempts;
    return true;
}

bool TransferStore::setTotal(quint64 id, quint64 total) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() ||
        it->second.status != TransferTask::Status::InProgress ||
        it->second.transferredBytes != 0)
        return false;
    it->second.totalBytes = total;
    return true;
}

bool TransferStore::setDestination(quint64 id, const QString &dst) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() ||
        it->second.status != TransferTask::Status::InProgress)
        return false;
    it->second.dst = dst;
    return true;
}

bool TransferStore::recordProgress(quint64 id, quint64 transferred) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return false;
    TransferTask &t = it->second;
    if (t.status != TransferTask::Status::InProgress ||
        transferred < t.transferredBytes || transferred > t.totalBytes)
        return false;
    t.transferredBytes = transferred;
    return true;
}

bool TransferStore::complete(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() ||
        it->second.transferredBytes != it->second.totalBytes)
        return false;
    TransferTask *t = transitionLocked(id, TransferTask::Status::Completed);
    if (!t)
        return false;
    t->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

bool TransferStore::fail(quint64 id, const QString &error) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask *t = transitionLocked(id, TransferTask::Status::Failed);
    if (!t)
        return false;
    t->error = error.isEmpty() ? QStringLiteral("Transfer failed") : error;
    t->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

bool TransferStore::cancel(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask *t = transitionLocked(id, TransferTask::Status::Cancelled);
    if (!t)
        return false;
    t->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

bool TransferStore::resetForRetry(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    TransferTask *t = transitionLocked(id, TransferTask::Status::Pending);
    if (!t)
        return false;
    t->transferredBytes = 0;
    t->error.clear();
    t->startedAtMs = 0;
    t->finishedAtMs = 0;
    return true;
}

} // namespace bridgescp
