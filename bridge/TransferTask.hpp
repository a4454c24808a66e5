// Transfer task record. Owned by TransferStore; everyone else gets copies.
#pragma once
#include <QMetaType>
#include <QString>

namespace bridgescp {

struct TransferTask {
    enum class Direction { Upload, Download };
    // Lifecycle:
    //  - Pending: waiting in the backlog
    //  - InProgress: bytes are moving
    //  - Completed: every byte copied and the destination synced
    //  - Failed: stopped with an error; only an explicit retry re-queues it
    //  - Cancelled: stopped by the caller
    enum class Status { Pending, InProgress, Completed, Failed, Cancelled };

    quint64 id = 0;
    QString connection; // identity of the session used ("user@host:port")
    QString src;        // local for uploads, remote for downloads
    QString dst;        // remote for uploads, local for downloads
    Direction direction = Direction::Upload;
    Status status = Status::Pending;
    quint64 totalBytes = 0;
    quint64 transferredBytes = 0;
    int attempts = 0;
    qint64 createdAtMs = 0;
    qint64 startedAtMs = 0;
    qint64 finishedAtMs = 0;
    QString error; // empty = none

    bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed ||
               status == Status::Cancelled;
    }
};

const char *transferStatusName(TransferTask::Status st);
const char *transferDirectionLabel(TransferTask::Direction dir);

} // namespace bridgescp

Q_DECLARE_METATYPE(bridgescp::TransferTask)
