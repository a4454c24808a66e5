// Command line front end: one session, one operation, progress on stdout.
#include "BridgeService.hpp"
#include "bridgescp/AttributeMapping.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTimer>
#include <cstdio>
#include <iostream>
#include <memory>
Q_LOGGING_CATEGORY(bsCli, "bridgescp.cli")

using namespace bridgescp;

namespace {

enum ExitCode { kExitOk = 0, kExitFailure = 1, kExitUsage = 2 };

int usageError(const QCommandLineParser &parser, const QString &msg) {
    std::cerr << msg.toStdString() << "\n\n"
              << parser.helpText().toStdString();
    return kExitUsage;
}

int runTransfer(QCoreApplication &app, BridgeService &service,
                const QString &identity, const QString &src,
                const QString &dst, TransferTask::Direction dir) {
    quint64 id = 0;
    Error err;
    if (!service.submitTransfer(identity, src, dst, dir, id, err)) {
        std::cerr << err.describe() << "\n";
        return kExitFailure;
    }
    QObject::connect(&service, &BridgeService::transferProgress, &app,
                     [id](const ProgressSnapshot &p) {
                         if (p.taskId == id)
                             std::cout << describeProgress(p).toStdString()
                                       << std::endl;
                     });
    QTimer poll;
    poll.setInterval(100);
    QObject::connect(&poll, &QTimer::timeout, &app, [&]() {
        const auto t = service.orchestrator().task(id);
        if (!t || !t->isTerminal())
            return;
        poll.stop();
        if (t->status == TransferTask::Status::Completed) {
            std::cout << "done: " << t->dst.toStdString() << " ("
                      << t->totalBytes << " bytes)" << std::endl;
            app.exit(kExitOk);
        } else {
            std::cerr << transferStatusName(t->status) << ": "
                      << t->error.toStdString() << std::endl;
            app.exit(kExitFailure);
        }
    });
    poll.start();
    return app.exec();
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("bridgescp");
    QCoreApplication::setApplicationName("bridgescp");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Move files between this machine and an SFTP server.");
    parser.addHelpOption();
    const QCommandLineOption configOpt("config", "INI settings file.", "file");
    const QCommandLineOption hostOpt("host", "Remote host.", "host");
    const QCommandLineOption portOpt("port", "SSH port (default 22).", "port", "22");
    const QCommandLineOption userOpt("user", "Remote user name.", "user");
    const QCommandLineOption keyOpt("key", "Private key file.", "path");
    const QCommandLineOption passphraseEnvOpt(
        "passphrase-env", "Environment variable holding the key passphrase.", "var");
    const QCommandLineOption passwordEnvOpt(
        "password-env", "Environment variable holding the password.", "var");
    parser.addOptions({configOpt, hostOpt, portOpt, userOpt, keyOpt,
                       passphraseEnvOpt, passwordEnvOpt});
    parser.addPositionalArgument("command", "upload, download, ls or rm.");
    parser.addPositionalArgument(
        "paths", "upload LOCAL REMOTE | download REMOTE LOCAL | ls REMOTE | rm REMOTE",
        "[paths...]");

    if (!parser.parse(app.arguments()))
        return usageError(parser, parser.errorText());
    if (parser.isSet("help")) {
        std::cout << parser.helpText().toStdString();
        return kExitOk;
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usageError(parser, "Missing command.");
    const QString cmd = args.first();
    const int wantPaths = (cmd == "upload" || cmd == "download") ? 2
                          : (cmd == "ls" || cmd == "rm")         ? 1
                                                                 : -1;
    if (wantPaths < 0)
        return usageError(parser, "Unknown command: " + cmd);
    if (args.size() - 1 != wantPaths)
        return usageError(parser, "Wrong number of paths for " + cmd + ".");
    if (!parser.isSet(hostOpt) || !parser.isSet(userOpt))
        return usageError(parser, "--host and --user are required.");
    if (parser.isSet(keyOpt) == parser.isSet(passwordEnvOpt))
        return usageError(parser, "Give exactly one of --key or --password-env.");
    bool portOk = false;
    const int port = parser.value(portOpt).toInt(&portOk);
    if (!portOk || port < 1 || port > 65535)
        return usageError(parser, "Invalid --port.");

    std::unique_ptr<QSettings> settings =
        parser.isSet(configOpt)
            ? std::make_unique<QSettings>(parser.value(configOpt), QSettings::IniFormat)
            : std::make_unique<QSettings>();
    const BridgeSettings cfg = loadBridgeSettings(*settings);

    SessionOptions opt;
    opt.host = parser.value(hostOpt).toStdString();
    opt.port = (std::uint16_t)port;
    opt.username = parser.value(userOpt).toStdString();
    if (parser.isSet(keyOpt)) {
        opt.private_key_path = parser.value(keyOpt).toStdString();
        if (parser.isSet(passphraseEnvOpt)) {
            const QByteArray var = parser.value(passphraseEnvOpt).toLocal8Bit();
            if (!qEnvironmentVariableIsSet(var.constData()))
                return usageError(parser, "Passphrase variable is not set.");
            opt.private_key_passphrase =
                qEnvironmentVariable(var.constData()).toStdString();
        }
    } else {
        const QByteArray var = parser.value(passwordEnvOpt).toLocal8Bit();
        if (!qEnvironmentVariableIsSet(var.constData()))
            return usageError(parser, "Password variable is not set.");
        opt.password = qEnvironmentVariable(var.constData()).toStdString();
    }

    std::unique_ptr<BridgeService> service = BridgeService::create(cfg);
    QString identity;
    Error err;
    if (!service->connectSession(opt, identity, err)) {
        std::cerr << err.describe() << "\n";
        return kExitFailure;
    }
    qCInfo(bsCli) << "Connected; running" << cmd;

    int rc = kExitOk;
    if (cmd == "upload") {
        rc = runTransfer(app, *service, identity, args.at(1), args.at(2),
                         TransferTask::Direction::Upload);
    } else if (cmd == "download") {
        rc = runTransfer(app, *service, identity, args.at(1), args.at(2),
                         TransferTask::Direction::Download);
    } else if (cmd == "ls") {
        std::vector<FileInfo> entries;
        if (!service->listRemote(identity, args.at(1), entries, err)) {
            std::cerr << err.describe() << "\n";
            rc = kExitFailure;
        } else {
            for (const auto &e : entries) {
                std::printf("%s %12llu %s\n", formatPermissions(e.mode).c_str(),
                            (unsigned long long)e.size, e.name.c_str());
            }
        }
    } else {
        if (!service->removeRemote(identity, args.at(1), err)) {
            std::cerr << err.describe() << "\n";
            rc = kExitFailure;
        }
    }

    service->disconnectSession(identity);
    return rc;
}
