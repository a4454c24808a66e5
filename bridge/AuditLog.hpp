// Audit trail of connection and transfer lifecycle events.
#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <mutex>
#include <optional>
#include <vector>

namespace bridgescp {

enum class AuditOperation {
    SessionConnect,
    SessionDisconnect,
    TransferStarted,
    TransferCompleted,
    TransferFailed,
    TransferCancelled,
    CaseConflictResolved,
    PermissionChange,
    FileDelete
};

const char *auditOperationName(AuditOperation op);
std::optional<AuditOperation> auditOperationFromName(const QString &name);

struct AuditEntry {
    AuditOperation operation = AuditOperation::SessionConnect;
    QString connection; // session identity, when there is one
    QString sourcePath;
    QString destPath;
    std::optional<quint64> fileSize;
    bool success = true;
    QString error;

    // Stamped by the sink when left empty.
    QString id;
    QDateTime timestamp;
    QString user;
    QString sessionId;
};

QJsonObject auditEntryToJson(const AuditEntry &e);
bool auditEntryFromJson(const QJsonObject &obj, AuditEntry &out);

// Destination for audit entries. Implementations must be thread-safe and
// must never throw; a failed write is logged, not reported.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEntry &entry) = 0;
};

struct AuditStatistics {
    int total = 0;
    int successful = 0;
    int failed = 0;
};

// One compact JSON object per line, appended to a file.
class JsonAuditLog : public AuditSink {
public:
    explicit JsonAuditLog(const QString &path);

    void record(const AuditEntry &entry) override;

    // Oldest first. limit <= 0 reads everything.
    bool readEntries(std::vector<AuditEntry> &out, int limit,
                     QString &err) const;
    bool statistics(AuditStatistics &out, QString &err) const;
    bool clear(QString &err);
    // Pretty-printed document with the entries and their counters.
    bool exportTo(const QString &exportPath, QString &err) const;

    QString path() const { return path_; }
    // Identifies every entry written by this process.
    QString sessionId() const { return sessionId_; }
    QString currentUser() const { return user_; }

private:
    mutable std::mutex mtx_;
    QString path_;
    QString sessionId_;
    QString user_;

    bool readEntriesLocked(std::vector<AuditEntry> &out, int limit,
                           QString &err) const;
};

} // namespace bridgescp
