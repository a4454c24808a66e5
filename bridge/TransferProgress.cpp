#include "TransferProgress.hpp"
#include <QFileInfo>

namespace bridgescp {

ProgressSnapshot computeProgress(const TransferTask &t, qint64 nowMs) {
    ProgressSnapshot p;
    p.taskId = t.id;
    p.filename = QFileInfo(t.src).fileName();
    p.direction = QString::fromLatin1(transferDirectionLabel(t.direction));
    p.transferredBytes = t.transferredBytes;
    p.totalBytes = t.totalBytes;
    if (t.totalBytes > 0)
        p.percentage = (double)t.transferredBytes / (double)t.totalBytes * 100.0;

    // A finished task's speed is frozen at its finish time.
    const qint64 endMs = t.finishedAtMs > 0 ? t.finishedAtMs : nowMs;
    if (t.startedAtMs > 0 && endMs > t.startedAtMs) {
        const double elapsed = (double)(endMs - t.startedAtMs) / 1000.0;
        p.speedBytesPerSec = (double)t.transferredBytes / elapsed;
    }
    if (p.speedBytesPerSec > 0.0 && t.totalBytes > t.transferredBytes)
        p.etaSeconds = (quint64)((double)(t.totalBytes - t.transferredBytes) /
                                 p.speedBytesPerSec);
    return p;
}

QString describeProgress(const ProgressSnapshot &p) {
    return QStringLiteral("%1 %2% (%3/%4 B, %5 KiB/s, eta %6s)")
        .arg(p.filename)
        .arg(p.percentage, 0, 'f', 2)
        .arg(p.transferredBytes)
        .arg(p.totalBytes)
        .arg(p.speedBytesPerSec / 1024.0, 0, 'f', 1)
        .arg(p.etaSeconds);
}

} // namespace bridgescp
