// Registry of live SSH/SFTP sessions keyed by "user@host:port".
#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "bridgescp/SftpClient.hpp"

namespace bridgescp {

class AuditSink;

QString connectionIdentity(const SessionOptions &opt);

// An authenticated transport plus its activity bookkeeping. Shared with the
// transfers using it; the transport closes when the registry lets go and the
// last user drops its reference.
class Session {
public:
    Session(QString identity, std::unique_ptr<SftpClient> client,
            SessionOptions opt);

    const QString &identity() const { return identity_; }
    SftpClient *client() const { return client_.get(); }
    const SessionOptions &options() const { return opt_; }

    // Marks the session as used now. Lock-free.
    void touch();
    // Steady-clock milliseconds.
    qint64 lastActivityMs() const { return lastActivityMs_.load(); }
    qint64 lastHeartbeatMs() const { return lastHeartbeatMs_.load(); }

    static qint64 steadyNowMs();

private:
    friend class ConnectionRegistry;

    QString identity_;
    std::unique_ptr<SftpClient> client_;
    SessionOptions opt_;
    std::atomic<qint64> lastActivityMs_;
    std::atomic<qint64> lastHeartbeatMs_{0};
};

class ConnectionRegistry : public QObject {
    Q_OBJECT
public:
    struct Options {
        std::chrono::milliseconds keepaliveInterval{60000};
        std::chrono::milliseconds staleAfter{300000};
    };

    // New transports are created with prototype->newConnectionLike(); the
    // prototype itself is never connected. audit may be null.
    ConnectionRegistry(std::unique_ptr<SftpClient> prototype, Options opt,
                       AuditSink *audit = nullptr, QObject *parent = nullptr);
    ~ConnectionRegistry() override;

    // Reuses the live session for the same identity. A concurrent attempt
    // for the identity is waited for rather than duplicated.
    bool connectSession(const SessionOptions &opt, QString &identity,
                        Error &err);
    // Live session or null. Counts as activity.
    std::shared_ptr<Session> session(const QString &identity);
    // Idempotent.
    void disconnectSession(const QString &identity);

    QStringList sessions() const;
    bool isConnected(const QString &identity) const;

    const Options &options() const { return opt_; }

signals:
    void sessionConnected(const QString &identity);
    void sessionDisconnected(const QString &identity);

private:
    struct KeepaliveControl {
        std::mutex m;
        std::condition_variable cv;
        bool stop = false;
    };
    struct Entry {
        std::shared_ptr<Session> session; // null while connecting
        std::thread keepalive;
        std::shared_ptr<KeepaliveControl> control;
    };

    std::unique_ptr<SftpClient> prototype_;
    Options opt_;
    AuditSink *audit_ = nullptr;

    mutable std::mutex mtx_; // protects sessions_ and retired_
    std::condition_variable pendingCv_;
    std::map<QString, Entry> sessions_;
    // Keepalive threads that evicted their own session and cannot join
    // themselves; joined later from a caller thread.
    std::vector<std::thread> retired_;

    void keepaliveLoop(QString identity, std::weak_ptr<Session> weak,
                       std::shared_ptr<KeepaliveControl> ctl);
    void evict(const QString &identity,
               const std::shared_ptr<Session> &expected,
               const QString &reason);
    static void stopKeepalive(Entry &e);
    void closeSession(const std::shared_ptr<Session> &s, const QString &reason);
    void reapRetired();
    void auditSession(bool connect, const QString &identity, bool success,
                      const QString &error);
};

} // namespace bridgescp
