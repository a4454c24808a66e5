#include "AuditLog.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QUuid>
Q_LOGGING_CATEGORY(bsAudit, "bridgescp.audit")

namespace bridgescp {

namespace {

struct OperationName {
    AuditOperation op;
    const char *name;
};

const OperationName kOperationNames[] = {
    {AuditOperation::SessionConnect, "session_connect"},
    {AuditOperation::SessionDisconnect, "session_disconnect"},
    {AuditOperation::TransferStarted, "transfer_started"},
    {AuditOperation::TransferCompleted, "transfer_completed"},
    {AuditOperation::TransferFailed, "transfer_failed"},
    {AuditOperation::TransferCancelled, "transfer_cancelled"},
    {AuditOperation::CaseConflictResolved, "case_conflict_resolved"},
    {AuditOperation::PermissionChange, "permission_change"},
    {AuditOperation::FileDelete, "file_delete"},
};

QString currentUserName() {
    QString u = qEnvironmentVariable("USER");
    if (u.isEmpty())
        u = qEnvironmentVariable("USERNAME");
    return u.isEmpty() ? QStringLiteral("unknown") : u;
}

} // namespace

const char *auditOperationName(AuditOperation op) {
    for (const auto &e : kOperationNames) {
        if (e.op == op)
            return e.name;
    }
    return "unknown";
}

std::optional<AuditOperation> auditOperationFromName(const QString &name) {
    for (const auto &e : kOperationNames) {
        if (name == QLatin1String(e.name))
            return e.op;
    }
    return std::nullopt;
}

QJsonObject auditEntryToJson(const AuditEntry &e) {
    QJsonObject o;
    o.insert("id", e.id);
    o.insert("timestamp", e.timestamp.toUTC().toString(Qt::ISODateWithMs));
    o.insert("operation", QString::fromLatin1(auditOperationName(e.operation)));
    o.insert("user", e.user);
    o.insert("session_id", e.sessionId);
    if (!e.connection.isEmpty())
        o.insert("connection", e.connection);
    if (!e.sourcePath.isEmpty())
        o.insert("source_path", e.sourcePath);
    if (!e.destPath.isEmpty())
        o.insert("dest_path", e.destPath);
    // JSON numbers are doubles; sizes stay exact up to 2^53.
    if (e.fileSize)
        o.insert("file_size", (double)*e.fileSize);
    o.insert("success", e.success);
    if (!e.error.isEmpty())
        o.insert("error_message", e.error);
    return o;
}

bool auditEntryFromJson(const QJsonObject &o, AuditEntry &out) {
    const auto op = auditOperationFromName(o.value("operation").toString());
    if (!op)
        return false;
    out = AuditEntry{};
    out.operation = *op;
    out.id = o.value("id").toString();
    out.timestamp =
        QDateTime::fromString(o.value("timestamp").toString(), Qt::ISODateWithMs);
    out.user = o.value("user").toString();
    out.sessionId = o.value("session_id").toString();
    out.connection = o.value("connection").toString();
    out.sourcePath = o.value("source_path").toString();
    out.destPath = o.value("dest_path").toString();
    if (o.contains("file_size"))
        out.fileSize = (quint64)o.value("file_size").toDouble();
    out.success = o.value("success").toBool();
    out.error = o.value("error_message").toString();
    return true;
}

JsonAuditLog::JsonAuditLog(const QString &path)
    : path_(path),
      sessionId_(QUuid::createUuid().toString(QUuid::WithoutBraces)),
      user_(currentUserName()) {}

void JsonAuditLog::record(const AuditEntry &entry) {
    AuditEntry e = entry;
    if (e.id.isEmpty())
        e.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (!e.timestamp.isValid())
        e.timestamp = QDateTime::currentDateTimeUtc();
    if (e.user.isEmpty())
        e.user = user_;
    if (e.sessionId.isEmpty())
        e.sessionId = sessionId_;
    QByteArray line = QJsonDocument(auditEntryToJson(e)).toJson(QJsonDocument::Compact);
    line.append('\n');

    std::lock_guard<std::mutex> lk(mtx_);
    QDir().mkpath(QFileInfo(path_).absolutePath());
    QFile f(path_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qCWarning(bsAudit) << "Cannot open audit log" << path_ << f.errorString();
        return;
    }
    if (f.write(line) != line.size())
        qCWarning(bsAudit) << "Short write to audit log" << path_ << f.errorString();
}

bool JsonAuditLog::readEntriesLocked(std::vector<AuditEntry> &out, int limit,
                                     QString &err) const {
    out.clear();
    QFile f(path_);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot read audit log %1: %2").arg(path_, f.errorString());
        return false;
    }
    int lineNo = 0;
    while (!f.atEnd()) {
        const QByteArray line = f.readLine().trimmed();
        ++lineNo;
        if (line.isEmpty())
            continue;
        QJsonParseError pe{};
        const QJsonDocument doc = QJsonDocument::fromJson(line, &pe);
        AuditEntry e;
        if (pe.error != QJsonParseError::NoError || !doc.isObject() ||
            !auditEntryFromJson(doc.object(), e)) {
            err = QStringLiteral("Malformed audit entry at line %1").arg(lineNo);
            return false;
        }
        out.push_back(std::move(e));
        if (limit > 0 && (int)out.size() >= limit)
            break;
    }
    return true;
}

bool JsonAuditLog::readEntries(std::vector<AuditEntry> &out, int limit,
                               QString &err) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return readEntriesLocked(out, limit, err);
}

bool JsonAuditLog::statistics(AuditStatistics &out, QString &err) const {
    std::vector<AuditEntry> entries;
    if (!readEntries(entries, 0, err))
        return false;
    out = AuditStatistics{};
    out.total = (int)entries.size();
    for (const auto &e : entries) {
        if (e.success)
            ++out.successful;
    }
    out.failed = out.total - out.successful;
    return true;
}

bool JsonAuditLog::clear(QString &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    QFile f(path_);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err = QStringLiteral("Cannot clear audit log %1: %2").arg(path_, f.errorString());
        return false;
    }
    qCInfo(bsAudit) << "Audit log cleared";
    return true;
}

bool JsonAuditLog::exportTo(const QString &exportPath, QString &err) const {
    std::vector<AuditEntry> entries;
    if (!readEntries(entries, 0, err))
        return false;
    QJsonArray arr;
    int ok = 0;
    for (const auto &e : entries) {
        arr.append(auditEntryToJson(e));
        if (e.success)
            ++ok;
    }
    QJsonObject doc;
    doc.insert("entries", arr);
    doc.insert("total_operations", (int)entries.size());
    doc.insert("successful_operations", ok);
    doc.insert("failed_operations", (int)entries.size() - ok);
    doc.insert("last_updated",
               QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));

    QSaveFile out(exportPath);
    if (!out.open(QIODevice::WriteOnly)) {
        err = QStringLiteral("Cannot write %1: %2").arg(exportPath, out.errorString());
        return false;
    }
    out.write(QJsonDocument(doc).toJson(QJsonDocument::Indented));
    if (!out.commit()) {
        err = QStringLiteral("Cannot write %1: %2").arg(exportPath, out.errorString());
        return false;
    }
    return true;
}

} // namespace bridgescp
