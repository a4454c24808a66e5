// Persistent settings (QSettings) for connections, transfers and auditing.
#pragma once
#include <QSettings>
#include <QString>
#include "bridgescp/CaseConflict.hpp"
#include "bridgescp/SftpTypes.hpp"

namespace bridgescp {

struct BridgeSettings {
    // Transfer
    int maxConcurrent = 3;
    int chunkSize = 8192;
    int ioTimeoutMs = 60000;
    bool preserveAttributes = true;
    CaseConflictPolicy casePolicy = CaseConflictPolicy::AutoRename;

    // Connection
    int connectTimeoutMs = 10000;
    int handshakeTimeoutMs = 10000;
    int channelTimeoutMs = 10000;
    int keepaliveIntervalSec = 60;
    int staleAfterSec = 300;

    // Security
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Strict;
    QString knownHostsPath; // empty: ~/.ssh/known_hosts

    // Audit
    bool auditEnabled = true;
    QString auditPath; // empty: defaultAuditLogPath()

    // Copies the connection-level values into opt.
    void applyTo(SessionOptions &opt) const;
};

// Out-of-range values are clamped, unknown enum names fall back to defaults.
BridgeSettings loadBridgeSettings(QSettings &s);
void saveBridgeSettings(QSettings &s, const BridgeSettings &cfg);

QString defaultAuditLogPath();

KnownHostsPolicy knownHostsPolicyFromString(const QString &s);
QString knownHostsPolicyName(KnownHostsPolicy p);

} // namespace bridgescp
