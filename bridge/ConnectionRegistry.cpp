// Session registry: connects outside the map lock, one keepalive thread per
// session, idle and dead sessions evicted by their own keepalive.
#include "ConnectionRegistry.hpp"
#include "AuditLog.hpp"
#include "bridgescp/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <system_error>
Q_LOGGING_CATEGORY(bsConn, "bridgescp.connection")

namespace bridgescp {

static QString logId(const QString &identity) {
    return QString::fromStdString(redacted(identity.toStdString()));
}

QString connectionIdentity(const SessionOptions &opt) {
    return QStringLiteral("%1@%2:%3")
        .arg(QString::fromStdString(opt.username),
             QString::fromStdString(opt.host))
        .arg(opt.port);
}

qint64 Session::steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Session::Session(QString identity, std::unique_ptr<SftpClient> client,
                 SessionOptions opt)
    : identity_(std::move(identity)), client_(std::move(client)),
      opt_(std::move(opt)), lastActivityMs_(steadyNowMs()) {}

void Session::touch() { lastActivityMs_.store(steadyNowMs()); }

ConnectionRegistry::ConnectionRegistry(std::unique_ptr<SftpClient> prototype,
                                       Options opt, AuditSink *audit,
                                       QObject *parent)
    : QObject(parent), prototype_(std::move(prototype)), opt_(opt),
      audit_(audit) {}

ConnectionRegistry::~ConnectionRegistry() {
    std::map<QString, Entry> entries;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        entries.swap(sessions_);
    }
    for (auto &kv : entries) {
        stopKeepalive(kv.second);
        if (kv.second.session)
            kv.second.session->client()->disconnect();
    }
    if (!entries.empty())
        qCInfo(bsConn) << "Registry closed" << entries.size() << "session(s)";
    reapRetired();
}

bool ConnectionRegistry::connectSession(const SessionOptions &opt,
                                        QString &identity, Error &err) {
    if (!opt.private_key_path.has_value() && !opt.password.has_value()) {
        err.set(ErrorCode::Authentication,
                "No credentials supplied (key or password required)");
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorCode::InvalidArgument, "Host and username are required");
        return false;
    }
    const QString id = connectionIdentity(opt);
    reapRetired();

    try {
        std::unique_lock<std::mutex> lk(mtx_);
        for (;;) {
            auto it = sessions_.find(id);
            if (it == sessions_.end())
                break;
            if (it->second.session) {
                it->second.session->touch();
                identity = id;
                return true;
            }
            // Another caller is establishing this identity.
            pendingCv_.wait(lk);
        }
        sessions_.emplace(id, Entry{});
    } catch (const std::system_error &e) {
        qCCritical(bsConn) << "Registry lock failed:" << e.what();
        err.set(ErrorCode::PoisonedState, e.what());
        return false;
    }

    auto abandon = [&]() {
        std::lock_guard<std::mutex> lk(mtx_);
        sessions_.erase(id);
        pendingCv_.notify_all();
    };

    qCInfo(bsConn) << "Connecting" << logId(id);
    Error connErr;
    std::unique_ptr<SftpClient> client =
        prototype_->newConnectionLike(opt, connErr);
    if (!client) {
        abandon();
        if (!connErr)
            connErr.set(ErrorCode::Transport, "Connection failed");
        qCWarning(bsConn) << "Connect failed" << logId(id)
                          << QString::fromStdString(connErr.describe());
        auditSession(true, id, false, QString::fromStdString(connErr.message));
        err = connErr;
        return false;
    }

    auto session = std::make_shared<Session>(id, std::move(client), opt);
    auto control = std::make_shared<KeepaliveControl>();
    std::thread keepalive;
    try {
        keepalive = std::thread(&ConnectionRegistry::keepaliveLoop, this, id,
                                std::weak_ptr<Session>(session), control);
    } catch (const std::system_error &e) {
        qCCritical(bsConn) << "Cannot start keepalive thread:" << e.what();
        session->client()->disconnect();
        abandon();
        err.set(ErrorCode::PoisonedState, e.what());
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Entry &e = sessions_[id];
        e.session = session;
        e.keepalive = std::move(keepalive);
        e.control = control;
        pendingCv_.notify_all();
    }
    qCInfo(bsConn) << "Session established" << logId(id);
    identity = id;
    emit sessionConnected(id);
    auditSession(true, id, true, QString());
    return true;
}

std::shared_ptr<Session> ConnectionRegistry::session(const QString &identity) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(identity);
    if (it == sessions_.end() || !it->second.session)
        return nullptr;
    it->second.session->touch();
    return it->second.session;
}

void ConnectionRegistry::disconnectSession(const QString &identity) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(identity);
        if (it == sessions_.end() || !it->second.session)
            return;
        entry = std::move(it->second);
        sessions_.erase(it);
    }
    stopKeepalive(entry);
    closeSession(entry.session, QStringLiteral("requested"));
    reapRetired();
}

QStringList ConnectionRegistry::sessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QStringList out;
    for (const auto &kv : sessions_) {
        if (kv.second.session)
            out << kv.first;
    }
    return out;
}

bool ConnectionRegistry::isConnected(const QString &identity) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(identity);
    return it != sessions_.end() && it->second.session != nullptr;
}

void ConnectionRegistry::keepaliveLoop(QString identity,
                                       std::weak_ptr<Session> weak,
                                       std::shared_ptr<KeepaliveControl> ctl) {
    std::unique_lock<std::mutex> lk(ctl->m);
    while (!ctl->stop) {
        if (ctl->cv.wait_for(lk, opt_.keepaliveInterval,
                             [&] { return ctl->stop; }))
            break;
        lk.unlock();
        std::shared_ptr<Session> s = weak.lock();
        if (!s)
            return;
        const qint64 now = Session::steadyNowMs();
        // Neither used nor heartbeated within the window, e.g. a delayed tick.
        if (now - s->lastActivityMs() > opt_.staleAfter.count()) {
            evict(identity, s, QStringLiteral("idle"));
            return;
        }
        std::string kaErr;
        if (!s->client()->sendKeepalive(kaErr)) {
            evict(identity, s,
                  QStringLiteral("keepalive failed: %1")
                      .arg(QString::fromStdString(kaErr)));
            return;
        }
        s->lastHeartbeatMs_.store(now);
        // Counts as activity at send time, so a stalled peer still goes stale.
        qint64 prev = s->lastActivityMs_.load();
        while (prev < now && !s->lastActivityMs_.compare_exchange_weak(prev, now)) {
        }
        lk.lock();
    }
}

void ConnectionRegistry::evict(const QString &identity,
                               const std::shared_ptr<Session> &expected,
                               const QString &reason) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(identity);
        // Already disconnected or replaced by a newer session.
        if (it == sessions_.end() || it->second.session != expected)
            return;
        // This runs on the session's own keepalive thread.
        retired_.push_back(std::move(it->second.keepalive));
        sessions_.erase(it);
    }
    closeSession(expected, reason);
}

void ConnectionRegistry::stopKeepalive(Entry &e) {
    if (e.control) {
        std::lock_guard<std::mutex> lk(e.control->m);
        e.control->stop = true;
    }
    if (e.control)
        e.control->cv.notify_all();
    if (e.keepalive.joinable())
        e.keepalive.join();
}

void ConnectionRegistry::closeSession(const std::shared_ptr<Session> &s,
                                      const QString &reason) {
    // In-flight transfers see a transport error on their next chunk.
    s->client()->disconnect();
    qCInfo(bsConn) << "Session closed" << logId(s->identity())
                   << "reason=" << reason;
    emit sessionDisconnected(s->identity());
    auditSession(false, s->identity(), true,
                 reason == QLatin1String("requested") ? QString() : reason);
}

void ConnectionRegistry::reapRetired() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        done.swap(retired_);
    }
    for (auto &t : done) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
            t.join();
        else if (t.joinable())
            t.detach();
    }
}

void ConnectionRegistry::auditSession(bool connect, const QString &identity,
                                      bool success, const QString &error) {
    if (!audit_)
        return;
    AuditEntry e;
    e.operation = connect ? AuditOperation::SessionConnect
                          : AuditOperation::SessionDisconnect;
    e.connection = identity;
    e.success = success;
    e.error = error;
    audit_->record(e);
}

} // namespace bridgescp
