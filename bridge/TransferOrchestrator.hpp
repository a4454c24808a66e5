// Bounded-concurrency transfer queue over registry sessions.
#pragma once
#include <QObject>
#include <QString>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>
#include "AuditLog.hpp"
#include "TransferProgress.hpp"
#include "TransferStore.hpp"
#include "bridgescp/BridgeError.hpp"
#include "bridgescp/CaseConflict.hpp"

namespace bridgescp {

class ConnectionRegistry;
class Session;
class SftpClient;

class TransferOrchestrator : public QObject {
    Q_OBJECT
public:
    struct Options {
        int maxConcurrent = 3;
        std::size_t chunkSize = 8192;
        bool preserveAttributes = true;
        CaseConflictPolicy casePolicy = CaseConflictPolicy::AutoRename;
    };

    // The registry must outlive the orchestrator. audit may be null.
    TransferOrchestrator(ConnectionRegistry &registry, Options opt,
                         AuditSink *audit = nullptr, QObject *parent = nullptr);
    ~TransferOrchestrator() override;

    // Resolves the source size, records a Pending task and queues it.
    // Returns without waiting for the transfer.
    bool submit(const QString &connection, const QString &src,
                const QString &dst, TransferTask::Direction dir, quint64 &id,
                Error &err);
    // Pending|InProgress -> Cancelled. No-op for unknown or finished tasks.
    void cancel(quint64 id);
    // Only Failed tasks can be retried; they go back to the end of the queue.
    bool retry(quint64 id, Error &err);

    std::optional<ProgressSnapshot> progress(quint64 id) const;
    std::optional<TransferTask> task(quint64 id) const { return store_.get(id); }
    // Every task of this process, ordered by id.
    std::vector<TransferTask> listActive() const { return store_.snapshot(); }

    // Blocks until nothing is queued or running. false on timeout.
    bool waitForIdle(int timeoutMs);
    int runningCount() const;

    const Options &options() const { return opt_; }

signals:
    void transferProgress(const bridgescp::ProgressSnapshot &snapshot);
    // status is a TransferTask::Status value
    void taskStatusChanged(quint64 id, int status);
    void tasksChanged();

private:
    ConnectionRegistry &registry_;
    Options opt_;
    AuditSink *audit_ = nullptr;
    TransferStore store_;

    // Lock order: queueMutex_ before the store's own mutex.
    mutable std::mutex queueMutex_;
    std::condition_variable queueCv_; // dispatcher wake-up
    std::condition_variable idleCv_;  // waitForIdle
    std::deque<quint64> backlog_;
    int running_ = 0;
    bool stopping_ = false;
    std::thread dispatcher_;

    // One thread per running task. A finished worker moves itself to
    // retiredWorkers_; the dispatcher joins those before starting more.
    std::mutex workersMutex_;
    std::unordered_map<quint64, std::thread> workers_;
    std::vector<std::thread> retiredWorkers_;

    void enqueue(quint64 id);
    void dispatchLoop();
    void launchWorker(quint64 id);
    void runTask(quint64 id);
    void executeTask(quint64 id);
    void finishWorker(quint64 id);

    bool resolveSourceSize(const TransferTask &t, SftpClient *client,
                           quint64 &total, Error &err) const;
    bool prepareDestination(const TransferTask &t, SftpClient *client,
                            QString &dst, QString &err);
    // false with empty err: the task left InProgress (cancelled).
    bool uploadLoop(quint64 id, Session &session, const QString &src,
                    const QString &dst, quint64 total, QString &err);
    bool downloadLoop(quint64 id, Session &session, const QString &src,
                      const QString &dst, quint64 total, QString &err);
    bool afterChunk(quint64 id, Session &session, quint64 done);
    bool stillRunning(quint64 id) const;
    void applyAttributes(const TransferTask &t, SftpClient *client,
                         const QString &dst);

    void failTask(quint64 id, const QString &error);
    void notifyStatus(quint64 id, TransferTask::Status st);
    void auditTask(AuditOperation op, const TransferTask &t, bool success,
                   const QString &error);
};

} // namespace bridgescp
