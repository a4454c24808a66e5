// Queue implementation: one dispatcher thread feeding a bounded worker pool.
// Each worker streams one task in fixed-size chunks over a shared session.
#include "TransferOrchestrator.hpp"
#include "ConnectionRegistry.hpp"
#include "bridgescp/AttributeMapping.hpp"
#include "bridgescp/RuntimeLogging.hpp"
#include "bridgescp/SftpClient.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTimeZone>
#include <algorithm>
#include <chrono>
#include <system_error>
#include <unistd.h>
Q_LOGGING_CATEGORY(bsXfer, "bridgescp.transfer")

namespace bridgescp {

static QString logPath(const QString &path) {
    return QString::fromStdString(redacted(path.toStdString()));
}

static QString joinRemote(const QString &dir, const QString &name) {
    return dir.endsWith('/') ? dir + name : dir + '/' + name;
}

TransferOrchestrator::TransferOrchestrator(ConnectionRegistry &registry,
                                           Options opt, AuditSink *audit,
                                           QObject *parent)
    : QObject(parent), registry_(registry), opt_(opt), audit_(audit) {
    if (opt_.maxConcurrent < 1)
        opt_.maxConcurrent = 1;
    if (opt_.chunkSize == 0)
        opt_.chunkSize = 8192;
    qRegisterMetaType<bridgescp::ProgressSnapshot>("bridgescp::ProgressSnapshot");
    dispatcher_ = std::thread(&TransferOrchestrator::dispatchLoop, this);
}

TransferOrchestrator::~TransferOrchestrator() {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        stopping_ = true;
        backlog_.clear();
    }
    queueCv_.notify_all();
    if (dispatcher_.joinable())
        dispatcher_.join();
    // Workers stop at their next chunk boundary.
    int cancelled = 0;
    for (const auto &t : store_.snapshot()) {
        if (!t.isTerminal() && store_.cancel(t.id))
            ++cancelled;
    }
    std::unordered_map<quint64, std::thread> workersToJoin;
    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        workersToJoin.swap(workers_);
        retired.swap(retiredWorkers_);
    }
    for (auto &kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    for (auto &t : retired) {
        if (t.joinable())
            t.join();
    }
    qCInfo(bsXfer) << "Orchestrator stopped"
                   << "cancelled=" << cancelled;
}

bool TransferOrchestrator::resolveSourceSize(const TransferTask &t,
                                             SftpClient *client,
                                             quint64 &total, Error &err) const {
    if (t.direction == TransferTask::Direction::Upload) {
        QFileInfo fi(t.src);
        if (!fi.exists() || !fi.isReadable()) {
            err.set(ErrorCode::SourceUnavailable,
                    "Local source is not readable: " + t.src.toStdString());
            return false;
        }
        if (fi.isDir()) {
            err.set(ErrorCode::SourceUnavailable,
                    "Local source is a directory: " + t.src.toStdString());
            return false;
        }
        total = (quint64)fi.size();
        return true;
    }
    if (!client) {
        err.set(ErrorCode::SourceUnavailable,
                "Session not connected: " + t.connection.toStdString());
        return false;
    }
    FileInfo info{};
    std::string e;
    if (!client->stat(t.src.toStdString(), info, e)) {
        err.set(ErrorCode::SourceUnavailable,
                e.empty() ? "Remote source not found: " + t.src.toStdString()
                          : e);
        return false;
    }
    if (info.is_dir) {
        err.set(ErrorCode::SourceUnavailable,
                "Remote source is a directory: " + t.src.toStdString());
        return false;
    }
    total = info.size;
    return true;
}

bool TransferOrchestrator::submit(const QString &connection, const QString &src,
                                  const QString &dst,
                                  TransferTask::Direction dir, quint64 &id,
                                  Error &err) {
    if (src.isEmpty() || dst.isEmpty()) {
        err.set(ErrorCode::InvalidArgument,
                "Source and destination are required");
        return false;
    }
    TransferTask t;
    t.connection = connection;
    t.src = src;
    t.dst = dst;
    t.direction = dir;

    std::shared_ptr<Session> session;
    if (dir == TransferTask::Direction::Download)
        session = registry_.session(connection);
    if (!resolveSourceSize(t, session ? session->client() : nullptr,
                           t.totalBytes, err)) {
        qCWarning(bsXfer) << "Submit rejected" << logPath(src)
                          << QString::fromStdString(err.message);
        return false;
    }
    session.reset();

    id = store_.create(t);
    qCInfo(bsXfer) << "Task queued" << "taskId=" << id
                   << transferDirectionLabel(dir) << logPath(src)
                   << "bytes=" << t.totalBytes;
    enqueue(id);
    emit tasksChanged();
    return true;
}

void TransferOrchestrator::enqueue(quint64 id) {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        if (stopping_)
            return;
        backlog_.push_back(id);
    }
    queueCv_.notify_all();
}

void TransferOrchestrator::cancel(quint64 id) {
    if (!store_.cancel(id))
        return; // unknown or already finished
    qCInfo(bsXfer) << "cancelTask requested" << "taskId=" << id;
    notifyStatus(id, TransferTask::Status::Cancelled);
    if (auto t = store_.get(id))
        auditTask(AuditOperation::TransferCancelled, *t, true, QString());
    // A queued id is skipped by the dispatcher.
    queueCv_.notify_all();
}

bool TransferOrchestrator::retry(quint64 id, Error &err) {
    const auto st = store_.status(id);
    if (!st) {
        err.set(ErrorCode::InvalidArgument,
                "Unknown task " + std::to_string(id));
        return false;
    }
    if (!store_.resetForRetry(id)) {
        err.set(ErrorCode::InvalidStateTransition,
                "Task " + std::to_string(id) + " is " + transferStatusName(*st) +
                    "; only failed tasks can be retried");
        return false;
    }
    qCInfo(bsXfer) << "Retry queued" << "taskId=" << id;
    notifyStatus(id, TransferTask::Status::Pending);
    enqueue(id);
    return true;
}

std::optional<ProgressSnapshot> TransferOrchestrator::progress(quint64 id) const {
    auto t = store_.get(id);
    if (!t)
        return std::nullopt;
    return computeProgress(*t, QDateTime::currentMSecsSinceEpoch());
}

bool TransferOrchestrator::waitForIdle(int timeoutMs) {
    std::unique_lock<std::mutex> lk(queueMutex_);
    return idleCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] {
        return backlog_.empty() && running_ == 0;
    });
}

int TransferOrchestrator::runningCount() const {
    std::lock_guard<std::mutex> lk(queueMutex_);
    return running_;
}

void TransferOrchestrator::dispatchLoop() {
    try {
        std::unique_lock<std::mutex> lk(queueMutex_);
        for (;;) {
            queueCv_.wait(lk, [&] {
                return stopping_ ||
                       (!backlog_.empty() && running_ < opt_.maxConcurrent);
            });
            if (stopping_)
                return;
            const quint64 id = backlog_.front();
            backlog_.pop_front();
            // Cancelled while queued.
            if (!store_.beginTransfer(id)) {
                idleCv_.notify_all();
                continue;
            }
            ++running_;
            lk.unlock();
            launchWorker(id);
            lk.lock();
        }
    } catch (const std::system_error &e) {
        qCCritical(bsXfer) << "Dispatcher stopped:" << e.what();
    }
}

void TransferOrchestrator::launchWorker(quint64 id) {
    std::vector<std::thread> finished;
    std::thread previous;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        finished.swap(retiredWorkers_);
        // A retried task may still have its last worker winding down.
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            previous = std::move(it->second);
            workers_.erase(it);
        }
    }
    for (auto &t : finished) {
        if (t.joinable())
            t.join();
    }
    if (previous.joinable()) {
        qCInfo(bsXfer) << "Joining previous worker" << "taskId=" << id;
        previous.join();
    }
    try {
        std::lock_guard<std::mutex> wl(workersMutex_);
        workers_[id] = std::thread([this, id] { runTask(id); });
    } catch (const std::system_error &e) {
        qCCritical(bsXfer) << "Cannot start worker for task" << id << e.what();
        failTask(id, QStringLiteral("%1: %2")
                         .arg(QString::fromLatin1(
                                  errorCodeName(ErrorCode::PoisonedState)),
                              QString::fromUtf8(e.what())));
        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            --running_;
        }
        idleCv_.notify_all();
    }
}

void TransferOrchestrator::finishWorker(quint64 id) {
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        auto it = workers_.find(id);
        if (it != workers_.end() &&
            it->second.get_id() == std::this_thread::get_id()) {
            retiredWorkers_.push_back(std::move(it->second));
            workers_.erase(it);
        }
    }
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        --running_;
    }
    queueCv_.notify_all();
    idleCv_.notify_all();
}

void TransferOrchestrator::runTask(quint64 id) {
    qCInfo(bsXfer) << "Task started" << "taskId=" << id;
    if (stillRunning(id))
        notifyStatus(id, TransferTask::Status::InProgress);
    try {
        executeTask(id);
    } catch (const std::system_error &e) {
        qCCritical(bsXfer) << "Synchronization failure in task" << id << e.what();
        failTask(id, QStringLiteral("%1: %2")
                         .arg(QString::fromLatin1(
                                  errorCodeName(ErrorCode::PoisonedState)),
                              QString::fromUtf8(e.what())));
    } catch (const std::exception &e) {
        failTask(id, QString::fromUtf8(e.what()));
    }
    finishWorker(id);
}

void TransferOrchestrator::executeTask(quint64 id) {
    auto task = store_.get(id);
    if (!task)
        return;
    auditTask(AuditOperation::TransferStarted, *task, true, QString());

    std::shared_ptr<Session> session = registry_.session(task->connection);
    if (!session) {
        failTask(id, QStringLiteral("Session not connected: %1")
                         .arg(task->connection));
        return;
    }
    SftpClient *client = session->client();

    // The source may have changed since submit.
    quint64 total = 0;
    Error sizeErr;
    if (!resolveSourceSize(*task, client, total, sizeErr)) {
        failTask(id, QString::fromStdString(sizeErr.message));
        return;
    }
    if (!store_.setTotal(id, total))
        return; // cancelled
    task->totalBytes = total;

    QString dst = task->dst;
    QString err;
    if (!prepareDestination(*task, client, dst, err)) {
        failTask(id, err);
        return;
    }
    task->dst = dst;

    const bool ok = task->direction == TransferTask::Direction::Upload
                        ? uploadLoop(id, *session, task->src, dst, total, err)
                        : downloadLoop(id, *session, task->src, dst, total, err);
    if (!ok) {
        if (!err.isEmpty())
            failTask(id, err);
        else
            qCInfo(bsXfer) << "Task stopped early" << "taskId=" << id;
        return;
    }

    if (opt_.preserveAttributes)
        applyAttributes(*task, client, dst);

    if (store_.complete(id)) {
        qCInfo(bsXfer) << "Task completed" << "taskId=" << id
                       << "bytes=" << total;
        notifyStatus(id, TransferTask::Status::Completed);
        if (auto done = store_.get(id))
            auditTask(AuditOperation::TransferCompleted, *done, true, QString());
    }
}

bool TransferOrchestrator::prepareDestination(const TransferTask &t,
                                              SftpClient *client, QString &dst,
                                              QString &err) {
    const QFileInfo dfi(dst);
    const QString name = dfi.fileName();
    QString parentDir = dfi.path();
    std::vector<std::string> siblings;

    if (t.direction == TransferTask::Direction::Upload) {
        if (parentDir.isEmpty() || parentDir == QLatin1String("."))
            parentDir = QStringLiteral("/");
        // Create missing remote parents one level at a time.
        QString cur = "/";
        const QStringList parts = parentDir.split('/', Qt::SkipEmptyParts);
        for (const QString &part : parts) {
            const QString next = joinRemote(cur, part);
            bool isDir = false;
            std::string e;
            const bool exists = client->exists(next.toStdString(), isDir, e);
            if (!exists && !e.empty()) {
                err = QString::fromStdString(e);
                return false;
            }
            if (exists && !isDir) {
                err = QStringLiteral("Not a directory: %1").arg(next);
                return false;
            }
            if (!exists && !client->mkdir(next.toStdString(), e, 0755)) {
                err = QString::fromStdString(e);
                return false;
            }
            cur = next;
        }
        std::vector<FileInfo> entries;
        std::string e;
        if (!client->list(parentDir.toStdString(), entries, e)) {
            err = QString::fromStdString(e);
            return false;
        }
        for (const auto &fi : entries)
            siblings.push_back(fi.name);
    } else {
        if (!QDir().mkpath(dfi.absolutePath())) {
            err = QStringLiteral("Cannot create local directory %1")
                      .arg(dfi.absolutePath());
            return false;
        }
        parentDir = dfi.absolutePath();
        const QStringList names = QDir(parentDir).entryList(
            QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
        for (const QString &n : names)
            siblings.push_back(n.toStdString());
    }

    const auto conflict = checkCaseConflict(name.toStdString(), siblings);
    if (!conflict)
        return true;
    const QString existing = QString::fromStdString(conflict->conflictName);
    if (opt_.casePolicy == CaseConflictPolicy::Ignore ||
        conflict->proposedName.empty()) {
        qCWarning(bsXfer) << "Case conflict left as is" << "taskId=" << t.id
                          << logPath(name) << "vs" << logPath(existing);
        return true;
    }
    const QString renamed = QString::fromStdString(conflict->proposedName);
    dst = t.direction == TransferTask::Direction::Upload
              ? joinRemote(parentDir, renamed)
              : QDir(parentDir).filePath(renamed);
    if (!store_.setDestination(t.id, dst)) {
        err = QStringLiteral("Task left the running state");
        return false;
    }
    qCInfo(bsXfer) << "Case conflict resolved" << "taskId=" << t.id
                   << logPath(name) << "->" << logPath(renamed);
    if (audit_) {
        AuditEntry e;
        e.operation = AuditOperation::CaseConflictResolved;
        e.connection = t.connection;
        e.sourcePath = t.dst;
        e.destPath = dst;
        audit_->record(e);
    }
    return true;
}

bool TransferOrchestrator::stillRunning(quint64 id) const {
    return store_.status(id) == TransferTask::Status::InProgress;
}

bool TransferOrchestrator::afterChunk(quint64 id, Session &session,
                                      quint64 done) {
    if (!store_.recordProgress(id, done))
        return false;
    session.touch();
    if (auto cur = store_.get(id))
        emit transferProgress(
            computeProgress(*cur, QDateTime::currentMSecsSinceEpoch()));
    return true;
}

bool TransferOrchestrator::uploadLoop(quint64 id, Session &session,
                                      const QString &src, const QString &dst,
                                      quint64 total, QString &err) {
    QFile in(src);
    if (!in.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot open local file %1: %2")
                  .arg(src, in.errorString());
        return false;
    }
    std::string e;
    std::unique_ptr<RemoteFile> out =
        session.client()->open(dst.toStdString(), OpenMode::WriteTruncate, e, 0644);
    if (!out) {
        err = QString::fromStdString(e);
        return false;
    }
    std::vector<char> buf(opt_.chunkSize);
    quint64 done = 0;
    while (done < total) {
        if (!stillRunning(id))
            return false;
        const qint64 want = (qint64)std::min<quint64>(buf.size(), total - done);
        const qint64 n = in.read(buf.data(), want);
        if (n < 0) {
            err = QStringLiteral("Local read failed: %1").arg(in.errorString());
            return false;
        }
        if (n == 0) {
            err = QStringLiteral("Source ended after %1 of %2 bytes")
                      .arg(done)
                      .arg(total);
            return false;
        }
        qint64 off = 0;
        while (off < n) {
            const long long w =
                out->write(buf.data() + off, (std::size_t)(n - off), e);
            if (w < 0) {
                err = QString::fromStdString(e);
                return false;
            }
            if (w == 0) {
                err = QStringLiteral("Remote write made no progress");
                return false;
            }
            off += w;
        }
        done += (quint64)n;
        if (!afterChunk(id, session, done))
            return false;
    }
    if (!out->sync(e)) {
        err = QString::fromStdString(e);
        return false;
    }
    out->close();
    return true;
}

bool TransferOrchestrator::downloadLoop(quint64 id, Session &session,
                                        const QString &src, const QString &dst,
                                        quint64 total, QString &err) {
    std::string e;
    std::unique_ptr<RemoteFile> in =
        session.client()->open(src.toStdString(), OpenMode::Read, e);
    if (!in) {
        err = QString::fromStdString(e);
        return false;
    }
    QFile out(dst);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err = QStringLiteral("Cannot open local file %1: %2")
                  .arg(dst, out.errorString());
        return false;
    }
    std::vector<char> buf(opt_.chunkSize);
    quint64 done = 0;
    while (done < total) {
        if (!stillRunning(id))
            return false;
        const std::size_t want =
            (std::size_t)std::min<quint64>(buf.size(), total - done);
        const long long n = in->read(buf.data(), want, e);
        if (n < 0) {
            err = QString::fromStdString(e);
            return false;
        }
        if (n == 0) {
            err = QStringLiteral("Source ended after %1 of %2 bytes")
                      .arg(done)
                      .arg(total);
            return false;
        }
        if (out.write(buf.data(), n) != n) {
            err = QStringLiteral("Local write failed: %1").arg(out.errorString());
            return false;
        }
        done += (quint64)n;
        if (!afterChunk(id, session, done))
            return false;
    }
    if (!out.flush() || ::fsync(out.handle()) != 0) {
        err = QStringLiteral("Cannot sync %1: %2").arg(dst, out.errorString());
        return false;
    }
    out.close();
    in->close();
    return true;
}

void TransferOrchestrator::applyAttributes(const TransferTask &t,
                                           SftpClient *client,
                                           const QString &dst) {
    std::string e;
    if (t.direction == TransferTask::Direction::Upload) {
        const QFileInfo lfi(t.src);
        WindowsAttributes attrs;
        attrs.readOnly = !lfi.isWritable();
        attrs.hidden = lfi.fileName().startsWith('.');
        const std::uint32_t mode = windowsToPosix(attrs);
        if (!client->chmod(dst.toStdString(), mode, e))
            qCWarning(bsXfer) << "Failed to set permissions for" << logPath(dst)
                              << QString::fromStdString(e);
        const qint64 mtime = lfi.lastModified().toSecsSinceEpoch();
        e.clear();
        if (mtime > 0 &&
            !client->setTimes(dst.toStdString(), (std::uint64_t)mtime,
                              (std::uint64_t)mtime, e))
            qCWarning(bsXfer) << "Failed to set mtime for" << logPath(dst)
                              << QString::fromStdString(e);
        return;
    }

    FileInfo rinfo{};
    if (!client->stat(t.src.toStdString(), rinfo, e)) {
        qCWarning(bsXfer) << "Cannot read remote attributes of"
                          << logPath(t.src) << QString::fromStdString(e);
        return;
    }
    // Timestamps first: a read-only file can no longer be opened for writing.
    if (rinfo.mtime > 0) {
        QFile f(dst);
        const QDateTime tsUtc =
            QDateTime::fromSecsSinceEpoch((qint64)rinfo.mtime, QTimeZone::utc());
        if (!f.open(QIODevice::ReadWrite) ||
            !f.setFileTime(tsUtc, QFileDevice::FileModificationTime)) {
            qCWarning(bsXfer) << "Failed to set mtime for" << logPath(dst)
                              << "to" << tsUtc;
        }
    }
    const WindowsAttributes attrs = posixToWindows(rinfo.mode);
    if (attrs.readOnly) {
        const QFileDevice::Permissions writeBits =
            QFileDevice::WriteOwner | QFileDevice::WriteUser |
            QFileDevice::WriteGroup | QFileDevice::WriteOther;
        if (!QFile::setPermissions(dst, QFile::permissions(dst) & ~writeBits))
            qCWarning(bsXfer) << "Failed to mark" << logPath(dst) << "read-only";
    }
}

void TransferOrchestrator::failTask(quint64 id, const QString &error) {
    if (!store_.fail(id, error))
        return;
    qCWarning(bsXfer) << "Task failed" << "taskId=" << id << error;
    notifyStatus(id, TransferTask::Status::Failed);
    if (auto t = store_.get(id))
        auditTask(AuditOperation::TransferFailed, *t, false, t->error);
}

void TransferOrchestrator::notifyStatus(quint64 id, TransferTask::Status st) {
    emit taskStatusChanged(id, (int)st);
    emit tasksChanged();
}

void TransferOrchestrator::auditTask(AuditOperation op, const TransferTask &t,
                                     bool success, const QString &error) {
    if (!audit_)
        return;
    AuditEntry e;
    e.operation = op;
    e.connection = t.connection;
    e.sourcePath = t.src;
    e.destPath = t.dst;
    e.fileSize = t.totalBytes;
    e.success = success;
    e.error = error;
    audit_->record(e);
}

} // namespace bridgescp
