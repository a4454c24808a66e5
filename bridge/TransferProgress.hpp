// Progress view derived from a task; never stored.
#pragma once
#include "TransferTask.hpp"
#include <QMetaType>
#include <QString>

namespace bridgescp {

struct ProgressSnapshot {
    quint64 taskId = 0;
    QString filename;  // last component of the source path
    QString direction; // "upload" / "download"
    quint64 transferredBytes = 0;
    quint64 totalBytes = 0;
    double percentage = 0.0;       // 0 when total is 0
    double speedBytesPerSec = 0.0; // whole-task average
    quint64 etaSeconds = 0;        // 0 when speed is 0
};

ProgressSnapshot computeProgress(const TransferTask &t, qint64 nowMs);

// "foto.jpg 34.13% (8192/24000 B, 8.0 KiB/s, eta 2s)"
QString describeProgress(const ProgressSnapshot &p);

} // namespace bridgescp

Q_DECLARE_METATYPE(bridgescp::ProgressSnapshot)
