#include "BridgeService.hpp"
#include "bridgescp/Libssh2SftpClient.hpp"
#include "bridgescp/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <chrono>
Q_LOGGING_CATEGORY(bsService, "bridgescp.service")

namespace bridgescp {

BridgeService::BridgeService(const BridgeSettings &cfg,
                             std::unique_ptr<SftpClient> transport,
                             std::unique_ptr<AuditSink> audit, QObject *parent)
    : QObject(parent), cfg_(cfg), audit_(std::move(audit)) {
    ConnectionRegistry::Options ropt;
    ropt.keepaliveInterval = std::chrono::seconds(cfg_.keepaliveIntervalSec);
    ropt.staleAfter = std::chrono::seconds(cfg_.staleAfterSec);
    registry_ = std::make_unique<ConnectionRegistry>(std::move(transport), ropt,
                                                     audit_.get());

    TransferOrchestrator::Options topt;
    topt.maxConcurrent = cfg_.maxConcurrent;
    topt.chunkSize = (std::size_t)cfg_.chunkSize;
    topt.preserveAttributes = cfg_.preserveAttributes;
    topt.casePolicy = cfg_.casePolicy;
    orchestrator_ = std::make_unique<TransferOrchestrator>(*registry_, topt,
                                                           audit_.get());

    // Forwarded on the emitting thread; receivers pick their own connection type.
    connect(registry_.get(), &ConnectionRegistry::sessionConnected, this,
            &BridgeService::sessionConnected, Qt::DirectConnection);
    connect(registry_.get(), &ConnectionRegistry::sessionDisconnected, this,
            &BridgeService::sessionDisconnected, Qt::DirectConnection);
    connect(orchestrator_.get(), &TransferOrchestrator::transferProgress, this,
            &BridgeService::transferProgress, Qt::DirectConnection);
    connect(orchestrator_.get(), &TransferOrchestrator::taskStatusChanged, this,
            &BridgeService::taskStatusChanged, Qt::DirectConnection);
}

BridgeService::~BridgeService() {
    orchestrator_.reset();
    registry_.reset();
}

std::unique_ptr<BridgeService> BridgeService::create(const BridgeSettings &cfg,
                                                     QObject *parent) {
    std::unique_ptr<AuditSink> audit;
    if (cfg.auditEnabled) {
        const QString path =
            cfg.auditPath.isEmpty() ? defaultAuditLogPath() : cfg.auditPath;
        audit = std::make_unique<JsonAuditLog>(path);
        qCInfo(bsService) << "Audit log at"
                          << QString::fromStdString(redacted(path.toStdString()));
    }
    return std::make_unique<BridgeService>(
        cfg, std::make_unique<Libssh2SftpClient>(), std::move(audit), parent);
}

bool BridgeService::connectSession(SessionOptions opt, QString &identity,
                                   Error &err) {
    cfg_.applyTo(opt);
    return registry_->connectSession(opt, identity, err);
}

void BridgeService::disconnectSession(const QString &identity) {
    registry_->disconnectSession(identity);
}

QStringList BridgeService::listSessions() const {
    return registry_->sessions();
}

bool BridgeService::submitTransfer(const QString &identity, const QString &src,
                                   const QString &dst,
                                   TransferTask::Direction dir, quint64 &id,
                                   Error &err) {
    return orchestrator_->submit(identity, src, dst, dir, id, err);
}

std::optional<ProgressSnapshot> BridgeService::getProgress(quint64 id) const {
    return orchestrator_->progress(id);
}

std::vector<TransferTask> BridgeService::listTransfers() const {
    return orchestrator_->listActive();
}

void BridgeService::cancelTransfer(quint64 id) { orchestrator_->cancel(id); }

bool BridgeService::retryTransfer(quint64 id, Error &err) {
    return orchestrator_->retry(id, err);
}

std::shared_ptr<Session> BridgeService::liveSession(const QString &identity,
                                                    Error &err) {
    auto s = registry_->session(identity);
    if (!s)
        err.set(ErrorCode::Transport,
                "Session not connected: " + identity.toStdString());
    return s;
}

bool BridgeService::listRemote(const QString &identity, const QString &path,
                               std::vector<FileInfo> &out, Error &err) {
    auto s = liveSession(identity, err);
    if (!s)
        return false;
    std::string e;
    if (!s->client()->list(path.toStdString(), out, e)) {
        err.set(ErrorCode::Transport, e);
        return false;
    }
    std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir;
        return a.name < b.name;
    });
    return true;
}

bool BridgeService::removeRemote(const QString &identity, const QString &path,
                                 Error &err) {
    auto s = liveSession(identity, err);
    if (!s)
        return false;
    std::string e;
    const bool ok = s->client()->removeFile(path.toStdString(), e);
    auditRemote(AuditOperation::FileDelete, identity, path, ok,
                QString::fromStdString(e));
    if (!ok) {
        err.set(ErrorCode::Transport, e);
        return false;
    }
    return true;
}

bool BridgeService::remotePermissions(const QString &identity,
                                      const QString &path, std::uint32_t &mode,
                                      Error &err) {
    auto s = liveSession(identity, err);
    if (!s)
        return false;
    FileInfo info{};
    std::string e;
    if (!s->client()->stat(path.toStdString(), info, e)) {
        err.set(ErrorCode::Transport,
                e.empty() ? "No such remote path: " + path.toStdString() : e);
        return false;
    }
    mode = info.mode & 07777u;
    return true;
}

bool BridgeService::setRemotePermissions(const QString &identity,
                                         const QString &path,
                                         std::uint32_t mode, Error &err) {
    auto s = liveSession(identity, err);
    if (!s)
        return false;
    std::string e;
    const bool ok = s->client()->chmod(path.toStdString(), mode & 07777u, e);
    auditRemote(AuditOperation::PermissionChange, identity, path, ok,
                QString::fromStdString(e));
    if (!ok) {
        err.set(ErrorCode::Transport, e);
        return false;
    }
    return true;
}

void BridgeService::auditRemote(AuditOperation op, const QString &identity,
                                const QString &path, bool success,
                                const QString &error) {
    if (!audit_)
        return;
    AuditEntry e;
    e.operation = op;
    e.connection = identity;
    e.sourcePath = path;
    e.success = success;
    e.error = error;
    audit_->record(e);
}

} // namespace bridgescp
