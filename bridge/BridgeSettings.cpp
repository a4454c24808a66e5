#include "BridgeSettings.hpp"
#include <QDir>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <algorithm>
Q_LOGGING_CATEGORY(bsSettings, "bridgescp.settings")

namespace bridgescp {

static int clampedInt(QSettings &s, const char *key, int def, int lo, int hi) {
    bool ok = false;
    const int raw = s.value(key, def).toInt(&ok);
    if (!ok) {
        qCWarning(bsSettings) << "Ignoring non-numeric" << key;
        return def;
    }
    const int v = std::clamp(raw, lo, hi);
    if (v != raw)
        qCWarning(bsSettings) << key << "clamped from" << raw << "to" << v;
    return v;
}

KnownHostsPolicy knownHostsPolicyFromString(const QString &s) {
    const QString v = s.trimmed().toLower();
    if (v == "accept-new" || v == "acceptnew" || v == "tofu")
        return KnownHostsPolicy::AcceptNew;
    if (v == "off" || v == "none")
        return KnownHostsPolicy::Off;
    return KnownHostsPolicy::Strict;
}

QString knownHostsPolicyName(KnownHostsPolicy p) {
    switch (p) {
    case KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case KnownHostsPolicy::Off:
        return QStringLiteral("off");
    case KnownHostsPolicy::Strict:
        break;
    }
    return QStringLiteral("strict");
}

QString defaultAuditLogPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + "/.bridgescp";
    return QDir(dir).filePath("audit.log");
}

BridgeSettings loadBridgeSettings(QSettings &s) {
    BridgeSettings c;
    c.maxConcurrent = clampedInt(s, "Transfer/maxConcurrent", 3, 1, 16);
    c.chunkSize = clampedInt(s, "Transfer/chunkSize", 8192, 512, 4 * 1024 * 1024);
    c.ioTimeoutMs = clampedInt(s, "Transfer/ioTimeoutMs", 60000, 1000, 600000);
    c.preserveAttributes = s.value("Transfer/preserveAttributes", true).toBool();
    c.casePolicy = caseConflictPolicyFromString(
        s.value("Transfer/caseConflictPolicy", "rename").toString().toStdString());

    c.connectTimeoutMs = clampedInt(s, "Connection/connectTimeoutMs", 10000, 500, 120000);
    c.handshakeTimeoutMs = clampedInt(s, "Connection/handshakeTimeoutMs", 10000, 500, 120000);
    c.channelTimeoutMs = clampedInt(s, "Connection/channelTimeoutMs", 10000, 500, 120000);
    c.keepaliveIntervalSec = clampedInt(s, "Connection/keepaliveIntervalSec", 60, 1, 3600);
    c.staleAfterSec = clampedInt(s, "Connection/staleAfterSec", 300, 1, 86400);

    c.knownHostsPolicy = knownHostsPolicyFromString(
        s.value("Security/knownHostsPolicy", "strict").toString());
    c.knownHostsPath = s.value("Security/knownHostsPath").toString().trimmed();

    c.auditEnabled = s.value("Audit/enabled", true).toBool();
    c.auditPath = s.value("Audit/path").toString().trimmed();
    if (c.auditPath.isEmpty())
        c.auditPath = defaultAuditLogPath();
    return c;
}

void saveBridgeSettings(QSettings &s, const BridgeSettings &c) {
    s.setValue("Transfer/maxConcurrent", c.maxConcurrent);
    s.setValue("Transfer/chunkSize", c.chunkSize);
    s.setValue("Transfer/ioTimeoutMs", c.ioTimeoutMs);
    s.setValue("Transfer/preserveAttributes", c.preserveAttributes);
    s.setValue("Transfer/caseConflictPolicy",
               QString::fromLatin1(caseConflictPolicyName(c.casePolicy)));
    s.setValue("Connection/connectTimeoutMs", c.connectTimeoutMs);
    s.setValue("Connection/handshakeTimeoutMs", c.handshakeTimeoutMs);
    s.setValue("Connection/channelTimeoutMs", c.channelTimeoutMs);
    s.setValue("Connection/keepaliveIntervalSec", c.keepaliveIntervalSec);
    s.setValue("Connection/staleAfterSec", c.staleAfterSec);
    s.setValue("Security/knownHostsPolicy", knownHostsPolicyName(c.knownHostsPolicy));
    if (!c.knownHostsPath.isEmpty())
        s.setValue("Security/knownHostsPath", c.knownHostsPath);
    s.setValue("Audit/enabled", c.auditEnabled);
    s.setValue("Audit/path", c.auditPath);
    s.sync();
}

void BridgeSettings::applyTo(SessionOptions &opt) const {
    opt.connect_timeout_ms = connectTimeoutMs;
    opt.handshake_timeout_ms = handshakeTimeoutMs;
    opt.channel_timeout_ms = channelTimeoutMs;
    opt.io_timeout_ms = ioTimeoutMs;
    opt.known_hosts_policy = knownHostsPolicy;
    if (!knownHostsPath.isEmpty())
        opt.known_hosts_path = knownHostsPath.toStdString();
}

} // namespace bridgescp
