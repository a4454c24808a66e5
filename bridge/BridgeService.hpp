// Composition root: owns one registry, one orchestrator and the audit sink,
// and exposes the operations callers (CLI, embedding apps) use.
#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>
#include "AuditLog.hpp"
#include "BridgeSettings.hpp"
#include "ConnectionRegistry.hpp"
#include "TransferOrchestrator.hpp"

namespace bridgescp {

class BridgeService : public QObject {
    Q_OBJECT
public:
    // transport is the prototype for new sessions. audit may be null.
    BridgeService(const BridgeSettings &cfg,
                  std::unique_ptr<SftpClient> transport,
                  std::unique_ptr<AuditSink> audit = nullptr,
                  QObject *parent = nullptr);
    ~BridgeService() override;

    // libssh2 transport; JSON audit log when enabled in cfg.
    static std::unique_ptr<BridgeService> create(const BridgeSettings &cfg,
                                                 QObject *parent = nullptr);

    // Timeouts and host-key policy come from the settings.
    bool connectSession(SessionOptions opt, QString &identity, Error &err);
    void disconnectSession(const QString &identity);
    QStringList listSessions() const;

    bool submitTransfer(const QString &identity, const QString &src,
                        const QString &dst, TransferTask::Direction dir,
                        quint64 &id, Error &err);
    std::optional<ProgressSnapshot> getProgress(quint64 id) const;
    std::vector<TransferTask> listTransfers() const;
    void cancelTransfer(quint64 id);
    bool retryTransfer(quint64 id, Error &err);

    // Directories first, then by name.
    bool listRemote(const QString &identity, const QString &path,
                    std::vector<FileInfo> &out, Error &err);
    bool removeRemote(const QString &identity, const QString &path, Error &err);
    // Permission bits only (no file type).
    bool remotePermissions(const QString &identity, const QString &path,
                           std::uint32_t &mode, Error &err);
    bool setRemotePermissions(const QString &identity, const QString &path,
                              std::uint32_t mode, Error &err);

    const BridgeSettings &settings() const { return cfg_; }
    ConnectionRegistry &registry() { return *registry_; }
    TransferOrchestrator &orchestrator() { return *orchestrator_; }
    AuditSink *audit() const { return audit_.get(); }

signals:
    void sessionConnected(const QString &identity);
    void sessionDisconnected(const QString &identity);
    void transferProgress(const bridgescp::ProgressSnapshot &snapshot);
    void taskStatusChanged(quint64 id, int status);

private:
    BridgeSettings cfg_;
    // Destruction order matters: orchestrator, then registry, then audit.
    std::unique_ptr<AuditSink> audit_;
    std::unique_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<TransferOrchestrator> orchestrator_;

    std::shared_ptr<Session> liveSession(const QString &identity, Error &err);
    void auditRemote(AuditOperation op, const QString &identity,
                     const QString &path, bool success, const QString &error);
};

} // namespace bridgescp
