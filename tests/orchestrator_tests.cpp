// Transfer queue tests: chunked copies over the in-memory transport.
#include "ConnectionRegistry.hpp"
#include "TestSupport.hpp"
#include "TransferOrchestrator.hpp"
#include "TransferStore.hpp"
#include "bridgescp/MockSftpClient.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimeZone>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <vector>

using namespace bridgescp;
using testsupport::MemoryAuditSink;
using testsupport::TestContext;
using testsupport::passwordOptions;
using testsupport::waitUntil;

namespace {

using Dir = TransferTask::Direction;
using St = TransferTask::Status;

struct Fixture {
    std::shared_ptr<MockRemoteState> state = std::make_shared<MockRemoteState>();
    MemoryAuditSink audit;
    QTemporaryDir tmp;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<TransferOrchestrator> orch;
    QString conn;

    explicit Fixture(TransferOrchestrator::Options opt = {}) {
        registry = std::make_unique<ConnectionRegistry>(
            std::make_unique<MockSftpClient>(state), ConnectionRegistry::Options{},
            &audit);
        orch = std::make_unique<TransferOrchestrator>(*registry, opt, &audit);
        Error err;
        registry->connectSession(passwordOptions(), conn, err);
    }

    ~Fixture() {
        // Workers go before the sessions they use.
        orch.reset();
        registry.reset();
    }

    QString localPath(const QString &name) const { return tmp.filePath(name); }

    QString writeLocal(const QString &name, const QByteArray &data) const {
        const QString path = localPath(name);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        if (f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            f.write(data);
            f.close();
        }
        return path;
    }

    St statusOf(quint64 id) const {
        const auto t = orch->task(id);
        return t ? t->status : St::Pending;
    }

    bool waitTerminal(quint64 id, int timeoutMs = 5000) const {
        return waitUntil(
            [&] {
                const auto t = orch->task(id);
                return t && t->isTerminal();
            },
            timeoutMs);
    }
};

QByteArray pattern(int size) {
    QByteArray data(size, '\0');
    for (int i = 0; i < size; ++i)
        data[i] = char('a' + i % 23);
    return data;
}

void test_progress_math(TestContext &t) {
    TransferTask task;
    task.id = 7;
    task.src = "/home/luis/foto.jpg";
    task.direction = Dir::Download;
    task.totalBytes = 24000;
    task.transferredBytes = 8192;
    task.startedAtMs = 1000;

    const ProgressSnapshot p = computeProgress(task, 3000);
    t.check(p.filename == "foto.jpg", "filename should be the last component");
    t.check(p.direction == "download", "direction label");
    t.check(std::fabs(p.percentage - 34.1333) < 0.01, "percentage of 8192/24000");
    t.check(p.speedBytesPerSec == 4096.0, "average speed over two seconds");
    t.check(p.etaSeconds == 3, "eta is remaining over speed, truncated");
    t.checkContains(describeProgress(p).toStdString(), "34.13%",
                    "description should show two decimals");

    task.totalBytes = 0;
    task.transferredBytes = 0;
    const ProgressSnapshot empty = computeProgress(task, 3000);
    t.check(empty.percentage == 0.0, "zero total reports zero percent");
    t.check(empty.etaSeconds == 0, "zero total has no eta");

    task.totalBytes = 24000;
    task.transferredBytes = 24000;
    task.finishedAtMs = 4000;
    const ProgressSnapshot done = computeProgress(task, 100000);
    t.check(done.speedBytesPerSec == 8000.0, "speed freezes at finish time");
    t.check(done.etaSeconds == 0, "finished task has no eta");

    TransferTask slow;
    slow.src = "/tmp/notes.txt";
    slow.totalBytes = 1500;
    slow.transferredBytes = 1000;
    slow.startedAtMs = 1000;
    const ProgressSnapshot frac = computeProgress(slow, 4000);
    t.check(std::fabs(frac.speedBytesPerSec - 333.333) < 0.01,
            "speed keeps its fractional part");
    t.check(frac.etaSeconds == 1, "eta of 1.5s truncates to 1");
    t.checkContains(describeProgress(frac).toStdString(), "0.3 KiB/s",
                    "description should round the speed for display");
}

void test_store_lifecycle(TestContext &t) {
    TransferStore store;
    TransferTask task;
    task.src = "a";
    task.dst = "b";
    task.totalBytes = 10;
    const quint64 id = store.create(task);
    t.check(id == 1, "ids start at one");
    t.check(store.status(id) == St::Pending, "new task is Pending");
    t.check(!store.complete(id), "Pending cannot complete");
    t.check(!store.recordProgress(id, 5), "no progress while Pending");
    t.check(store.beginTransfer(id), "Pending -> InProgress");
    t.check(store.get(id)->attempts == 1, "start counts an attempt");
    t.check(store.recordProgress(id, 5), "progress while running");
    t.check(!store.recordProgress(id, 4), "progress never decreases");
    t.check(!store.recordProgress(id, 11), "progress never exceeds total");
    t.check(!store.complete(id), "cannot complete short of total");
    t.check(store.fail(id, "boom"), "InProgress -> Failed");
    t.check(store.get(id)->error == "boom", "error is kept");
    t.check(!store.cancel(id), "Failed cannot be cancelled");
    t.check(store.resetForRetry(id), "Failed -> Pending");
    const auto reset = store.get(id);
    t.check(reset->transferredBytes == 0 && reset->error.isEmpty(),
            "retry clears bytes and error");
    t.check(store.beginTransfer(id) && store.recordProgress(id, 10) &&
                store.complete(id),
            "second attempt completes");
    t.check(store.get(id)->attempts == 2, "second attempt counted");
    t.check(!store.resetForRetry(id), "Completed cannot be retried");
    t.check(!TransferStore::isLegalTransition(St::Completed, St::Pending),
            "terminal states are final");
    t.check(TransferStore::isLegalTransition(St::Pending, St::Cancelled),
            "Pending can be cancelled");
    t.check(store.countInStatus(St::Completed) == 1, "count by status");
}

void test_upload_reports_each_chunk(TestContext &t) {
    Fixture f;
    const QByteArray data = pattern(24000);
    const QString src = f.writeLocal("foto.jpg", data);

    std::mutex m;
    std::vector<quint64> seen;
    std::vector<double> pct;
    QObject::connect(f.orch.get(), &TransferOrchestrator::transferProgress,
                     [&](const ProgressSnapshot &p) {
                         std::lock_guard<std::mutex> lk(m);
                         seen.push_back(p.transferredBytes);
                         pct.push_back(p.percentage);
                     });

    quint64 id = 0;
    Error err;
    t.check(f.orch->submit(f.conn, src, "/home/luis/subida.jpg", Dir::Upload,
                           id, err),
            "upload submit should succeed: " + err.describe());
    t.check(f.waitTerminal(id), "upload should finish");
    t.check(f.statusOf(id) == St::Completed, "upload should complete");
    t.check(f.state->fileContents("/home/luis/subida.jpg") ==
                data.toStdString(),
            "remote contents should match the source");

    std::lock_guard<std::mutex> lk(m);
    t.check(seen == std::vector<quint64>({8192, 16384, 24000}),
            "progress should follow chunk boundaries");
    if (pct.size() == 3) {
        t.check(std::fabs(pct[0] - 34.13) < 0.01, "first chunk is 34.13%");
        t.check(std::fabs(pct[1] - 68.27) < 0.01, "second chunk is 68.27%");
        t.check(pct[2] == 100.0, "last chunk is 100%");
    }
    const auto p = f.orch->progress(id);
    t.check(p && p->transferredBytes == 24000 && p->etaSeconds == 0,
            "final progress should be complete");
    t.check(f.audit.count(AuditOperation::TransferStarted) == 1 &&
                f.audit.count(AuditOperation::TransferCompleted) == 1,
            "upload should be audited");
}

void test_download(TestContext &t) {
    Fixture f;
    const QString dst = f.localPath("bajadas/foto.jpg");
    quint64 id = 0;
    Error err;
    t.check(f.orch->submit(f.conn, "/home/luis/foto.jpg", dst, Dir::Download,
                           id, err),
            "download submit should succeed: " + err.describe());
    t.check(f.orch->task(id)->totalBytes == 34567,
            "size should be resolved at submit");
    t.check(f.waitTerminal(id), "download should finish");
    t.check(f.statusOf(id) == St::Completed, "download should complete");

    QFile in(dst);
    t.check(in.open(QIODevice::ReadOnly), "downloaded file should exist");
    t.check(in.readAll() == QByteArray(34567, 'j'),
            "downloaded contents should match");
    t.check(QFileInfo(dst).lastModified().toSecsSinceEpoch() == 1700000000,
            "remote mtime should be applied");
}

void test_empty_file(TestContext &t) {
    Fixture f;
    f.state->putFile("/var/log/empty.log", "");
    const QString dst = f.localPath("empty.log");
    quint64 id = 0;
    Error err;
    t.check(f.orch->submit(f.conn, "/var/log/empty.log", dst, Dir::Download,
                           id, err),
            "empty download submit");
    t.check(f.waitTerminal(id), "empty download should finish");
    t.check(f.statusOf(id) == St::Completed, "empty file completes");
    t.check(QFileInfo(dst).exists() && QFileInfo(dst).size() == 0,
            "empty destination is created");
    const auto p = f.orch->progress(id);
    t.check(p && p->percentage == 0.0, "zero-byte task reports zero percent");
}

void test_concurrency_limit(TestContext &t) {
    Fixture f;
    f.state->chunkDelayMs = 20;
    std::atomic<int> maxRunning{0};
    auto *orch = f.orch.get();
    QObject::connect(orch, &TransferOrchestrator::transferProgress,
                     [&, orch](const ProgressSnapshot &) {
                         int running = 0;
                         for (const auto &task : orch->listActive()) {
                             if (task.status == St::InProgress)
                                 ++running;
                         }
                         int prev = maxRunning.load();
                         while (running > prev &&
                                !maxRunning.compare_exchange_weak(prev, running)) {
                         }
                     });

    std::vector<quint64> ids;
    for (int i = 0; i < 5; ++i) {
        const QString src =
            f.writeLocal(QStringLiteral("lote%1.bin").arg(i), pattern(4 * 8192));
        quint64 id = 0;
        Error err;
        t.check(f.orch->submit(f.conn, src,
                               QStringLiteral("/var/lote%1.bin").arg(i),
                               Dir::Upload, id, err),
                "batch submit should succeed");
        ids.push_back(id);
    }
    int peak = 0;
    const bool idle = waitUntil(
        [&] {
            peak = std::max(peak, f.orch->runningCount());
            return f.orch->waitForIdle(0);
        },
        10000);
    t.check(idle, "batch should drain");
    t.check(peak <= 3 && maxRunning.load() <= 3,
            "never more than three tasks in flight");
    t.check(maxRunning.load() >= 2, "tasks should overlap");
    for (quint64 id : ids)
        t.check(f.statusOf(id) == St::Completed, "every batch task completes");
}

void test_cancel_queued(TestContext &t) {
    TransferOrchestrator::Options opt;
    opt.maxConcurrent = 1;
    Fixture f(opt);
    f.state->chunkDelayMs = 30;
    const QString a = f.writeLocal("a.bin", pattern(4 * 8192));
    const QString b = f.writeLocal("b.bin", pattern(4 * 8192));
    quint64 first = 0, second = 0;
    Error err;
    f.orch->submit(f.conn, a, "/var/a.bin", Dir::Upload, first, err);
    f.orch->submit(f.conn, b, "/var/b.bin", Dir::Upload, second, err);
    f.orch->cancel(second);
    t.check(f.statusOf(second) == St::Cancelled, "queued task is cancelled");
    t.check(f.waitTerminal(first), "running task should finish");
    t.check(f.orch->waitForIdle(5000), "queue should drain");
    t.check(f.statusOf(first) == St::Completed, "other task is unaffected");
    t.check(!f.state->hasFile("/var/b.bin"), "cancelled task never starts");
    t.check(f.orch->task(second)->attempts == 0, "no attempt was made");

    f.orch->cancel(first);
    t.check(f.statusOf(first) == St::Completed,
            "cancel after completion is a no-op");
    f.orch->cancel(9999);
    t.check(f.audit.count(AuditOperation::TransferCancelled) == 1,
            "only the real cancellation is audited");
}

void test_cancel_in_flight(TestContext &t) {
    Fixture f;
    f.state->chunkDelayMs = 30;
    const QString src = f.writeLocal("grande.bin", pattern(20 * 8192));
    quint64 id = 0;
    Error err;
    f.orch->submit(f.conn, src, "/var/grande.bin", Dir::Upload, id, err);
    t.check(waitUntil([&] { return f.orch->task(id)->transferredBytes > 0; },
                      5000),
            "transfer should start moving bytes");
    f.orch->cancel(id);
    t.check(f.orch->waitForIdle(5000), "worker should stop");
    const auto task = f.orch->task(id);
    t.check(task->status == St::Cancelled, "in-flight task is cancelled");
    t.check(task->transferredBytes < task->totalBytes,
            "cancelled task stops early");

    Error retryErr;
    t.check(!f.orch->retry(id, retryErr), "cancelled task cannot be retried");
    t.check(retryErr.code == ErrorCode::InvalidStateTransition,
            "retry of a cancelled task is an invalid transition");
}

void test_failure_and_retry(TestContext &t) {
    Fixture f;
    const QByteArray data = pattern(3 * 8192);
    const QString bad = f.writeLocal("falla.bin", data);
    const QString good = f.writeLocal("bien.bin", data);
    {
        std::lock_guard<std::mutex> lk(f.state->mutex);
        f.state->failWriteAfter["/var/falla.bin"] = 8192;
    }
    quint64 badId = 0, goodId = 0;
    Error err;
    f.orch->submit(f.conn, bad, "/var/falla.bin", Dir::Upload, badId, err);
    f.orch->submit(f.conn, good, "/var/bien.bin", Dir::Upload, goodId, err);
    t.check(f.orch->waitForIdle(5000), "both tasks should finish");

    const auto failed = f.orch->task(badId);
    t.check(failed->status == St::Failed, "injected failure fails the task");
    t.checkContains(failed->error.toStdString(), "Injected write failure",
                    "task error should carry the transport message");
    t.check(f.statusOf(goodId) == St::Completed,
            "a failing task does not affect its neighbour");
    t.check(f.audit.count(AuditOperation::TransferFailed) == 1,
            "failure should be audited");

    Error retryErr;
    t.check(!f.orch->retry(goodId, retryErr), "completed task cannot be retried");
    t.check(retryErr.code == ErrorCode::InvalidStateTransition,
            "retry of a completed task is an invalid transition");
    retryErr.clear();
    t.check(!f.orch->retry(424242, retryErr), "unknown task cannot be retried");
    t.check(retryErr.code == ErrorCode::InvalidArgument,
            "unknown task id is an invalid argument");

    {
        std::lock_guard<std::mutex> lk(f.state->mutex);
        f.state->failWriteAfter.clear();
    }
    retryErr.clear();
    t.check(f.orch->retry(badId, retryErr), "failed task can be retried");
    t.check(f.waitTerminal(badId), "retried task should finish");
    const auto retried = f.orch->task(badId);
    t.check(retried->status == St::Completed, "retry should complete");
    t.check(retried->attempts == 2, "retry counts a second attempt");
    t.check(retried->error.isEmpty(), "retry clears the error");
    t.check(f.state->fileContents("/var/falla.bin") == data.toStdString(),
            "retried upload rewrites the whole file");
}

void test_case_conflict_rename(TestContext &t) {
    Fixture f;
    const QString src = f.writeLocal("FOTO.jpg", pattern(100));
    quint64 id = 0;
    Error err;
    f.orch->submit(f.conn, src, "/home/luis/FOTO.jpg", Dir::Upload, id, err);
    t.check(f.waitTerminal(id), "conflicting upload should finish");
    const auto task = f.orch->task(id);
    t.check(task->status == St::Completed, "conflicting upload completes");
    t.check(task->dst == "/home/luis/FOTO_1.jpg",
            "destination should be renamed");
    t.check(f.state->fileContents("/home/luis/foto.jpg") ==
                std::string(34567, 'j'),
            "existing file is untouched");
    t.check(f.state->hasFile("/home/luis/FOTO_1.jpg"), "renamed file exists");
    t.check(f.audit.count(AuditOperation::CaseConflictResolved) == 1,
            "rename should be audited");
}

void test_case_conflict_ignore(TestContext &t) {
    TransferOrchestrator::Options opt;
    opt.casePolicy = CaseConflictPolicy::Ignore;
    Fixture f(opt);
    const QString src = f.writeLocal("FOTO.jpg", pattern(100));
    quint64 id = 0;
    Error err;
    f.orch->submit(f.conn, src, "/home/luis/FOTO.jpg", Dir::Upload, id, err);
    t.check(f.waitTerminal(id), "ignored conflict upload should finish");
    t.check(f.orch->task(id)->dst == "/home/luis/FOTO.jpg",
            "ignore policy keeps the destination");
    t.check(f.audit.count(AuditOperation::CaseConflictResolved) == 0,
            "nothing to audit when ignoring");
}

void test_upload_attributes(TestContext &t) {
    Fixture f;
    const QString src = f.writeLocal("informe.txt", pattern(500));
    const QDateTime stamp = QDateTime::fromSecsSinceEpoch(1600000000, QTimeZone::utc());
    {
        QFile file(src);
        t.check(file.open(QIODevice::ReadWrite) &&
                    file.setFileTime(stamp, QFileDevice::FileModificationTime),
                "local mtime should be settable");
    }
    quint64 id = 0;
    Error err;
    f.orch->submit(f.conn, src, "/home/guest/nuevo/informe.txt", Dir::Upload, id,
                   err);
    t.check(f.waitTerminal(id), "attribute upload should finish");
    t.check(f.statusOf(id) == St::Completed, "attribute upload completes");
    t.check(f.state->modeOf("/home/guest/nuevo") & 040000,
            "missing remote parent is created");
    t.check((f.state->modeOf("/home/guest/nuevo/informe.txt") & 0777) == 0775,
            "normal file maps to 0775");
    t.check(f.state->mtimeOf("/home/guest/nuevo/informe.txt") == 1600000000,
            "local mtime is preserved");
}

void test_rejected_submissions(TestContext &t) {
    Fixture f;
    quint64 id = 0;
    Error err;
    t.check(!f.orch->submit(f.conn, f.localPath("no-existe.bin"), "/var/x",
                            Dir::Upload, id, err),
            "missing local source is rejected");
    t.check(err.code == ErrorCode::SourceUnavailable,
            "missing local source is SourceUnavailable");

    err.clear();
    t.check(!f.orch->submit(f.conn, f.tmp.path(), "/var/x", Dir::Upload, id, err),
            "local directory is rejected");
    t.check(err.code == ErrorCode::SourceUnavailable,
            "local directory is SourceUnavailable");

    err.clear();
    t.check(!f.orch->submit(f.conn, "/home/luis", f.localPath("x"),
                            Dir::Download, id, err),
            "remote directory is rejected");
    t.check(err.code == ErrorCode::SourceUnavailable,
            "remote directory is SourceUnavailable");

    err.clear();
    t.check(!f.orch->submit(f.conn, "/no/such/file", f.localPath("x"),
                            Dir::Download, id, err),
            "missing remote file is rejected");
    t.check(err.code == ErrorCode::SourceUnavailable,
            "missing remote file is SourceUnavailable");

    err.clear();
    t.check(!f.orch->submit("ghost@nowhere:22", "/readme.txt", f.localPath("x"),
                            Dir::Download, id, err),
            "download without a session is rejected");
    t.check(err.code == ErrorCode::SourceUnavailable,
            "download without a session is SourceUnavailable");

    err.clear();
    t.check(!f.orch->submit(f.conn, "", "/var/x", Dir::Upload, id, err),
            "empty source is rejected");
    t.check(err.code == ErrorCode::InvalidArgument,
            "empty source is InvalidArgument");

    t.check(f.orch->listActive().empty(), "rejected submissions create no task");
}

void test_upload_without_session_fails_at_start(TestContext &t) {
    Fixture f;
    const QString src = f.writeLocal("huerfano.bin", pattern(100));
    quint64 id = 0;
    Error err;
    t.check(f.orch->submit("ghost@nowhere:22", src, "/var/h.bin", Dir::Upload,
                           id, err),
            "upload source is local so submit succeeds");
    t.check(f.waitTerminal(id), "orphan upload should finish");
    const auto task = f.orch->task(id);
    t.check(task->status == St::Failed, "orphan upload fails");
    t.checkContains(task->error.toStdString(), "Session not connected",
                    "error names the missing session");
}

void test_disconnect_mid_transfer(TestContext &t) {
    Fixture f;
    QString other;
    Error err;
    f.registry->connectSession(passwordOptions("bob"), other, err);
    f.state->chunkDelayMs = 20;

    const QString big = f.writeLocal("largo.bin", pattern(30 * 8192));
    const QString small = f.writeLocal("corto.bin", pattern(4 * 8192));
    quint64 cut = 0, kept = 0;
    f.orch->submit(f.conn, big, "/var/largo.bin", Dir::Upload, cut, err);
    f.orch->submit(other, small, "/var/corto.bin", Dir::Upload, kept, err);
    t.check(waitUntil([&] { return f.orch->task(cut)->transferredBytes > 0; },
                      5000),
            "long transfer should start");
    f.registry->disconnectSession(f.conn);
    t.check(f.orch->waitForIdle(10000), "both tasks should end");

    const auto failed = f.orch->task(cut);
    t.check(failed->status == St::Failed,
            "transfer on the closed session fails");
    t.checkContains(failed->error.toStdString(), "Session closed",
                    "error reports the closed session");
    t.check(f.statusOf(kept) == St::Completed,
            "transfer on the other session completes");
}

void test_status_signals(TestContext &t) {
    Fixture f;
    std::mutex m;
    std::vector<int> statuses;
    std::atomic<int> changes{0};
    QObject::connect(f.orch.get(), &TransferOrchestrator::taskStatusChanged,
                     [&](quint64, int st) {
                         std::lock_guard<std::mutex> lk(m);
                         statuses.push_back(st);
                     });
    QObject::connect(f.orch.get(), &TransferOrchestrator::tasksChanged,
                     [&] { ++changes; });
    const QString src = f.writeLocal("senal.bin", pattern(10));
    quint64 id = 0;
    Error err;
    f.orch->submit(f.conn, src, "/var/senal.bin", Dir::Upload, id, err);
    t.check(f.orch->waitForIdle(5000), "signal task should finish");
    std::lock_guard<std::mutex> lk(m);
    t.check(statuses == std::vector<int>({(int)St::InProgress, (int)St::Completed}),
            "status signals follow the lifecycle");
    t.check(changes.load() >= 3, "list changes on submit, start and finish");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_progress_math(t);
    test_store_lifecycle(t);
    test_upload_reports_each_chunk(t);
    test_download(t);
    test_empty_file(t);
    test_concurrency_limit(t);
    test_cancel_queued(t);
    test_cancel_in_flight(t);
    test_failure_and_retry(t);
    test_case_conflict_rename(t);
    test_case_conflict_ignore(t);
    test_upload_attributes(t);
    test_rejected_submissions(t);
    test_upload_without_session_fails_at_start(t);
    test_disconnect_mid_transfer(t);
    test_status_signals(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bridgescp_orchestrator_tests\n";
    return EXIT_SUCCESS;
}
