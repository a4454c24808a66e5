// Core unit tests without external framework (run via CTest).
#include "bridgescp/AttributeMapping.hpp"
#include "bridgescp/CaseConflict.hpp"
#include "bridgescp/MockSftpClient.hpp"
#include "bridgescp/RuntimeLogging.hpp"

#include <cstdlib>
#include <stdlib.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

bridgescp::SessionOptions validOptions() {
    bridgescp::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    opt.password = "secret";
    return opt;
}

void test_session_defaults(TestContext &t) {
    bridgescp::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == bridgescp::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(o.connect_timeout_ms == 10000 && o.handshake_timeout_ms == 10000 &&
                o.channel_timeout_ms == 10000,
            "establishment timeouts should default to 10s each");
    t.check(o.io_timeout_ms == 60000, "chunk I/O timeout should default to 60s");
}

void test_error_describe(TestContext &t) {
    bridgescp::Error e;
    t.check(!e, "default Error should be falsy");
    e.set(bridgescp::ErrorCode::Transport, "connection refused");
    t.check(static_cast<bool>(e), "Error with a code should be truthy");
    t.check(e.describe() == "TransportError: connection refused",
            "describe should prefix the code name");
    e.clear();
    t.check(!e && e.message.empty(), "clear should reset code and message");

    // Reserved codes keep stable names for callers that match on them.
    e.set(bridgescp::ErrorCode::LockContention, "");
    t.check(e.describe() == "LockContention", "reserved code has a stable name");
    t.check(std::string(bridgescp::errorCodeName(
                bridgescp::ErrorCode::PoisonedState)) == "PoisonedState",
            "PoisonedState name");
}

void test_connect_validation(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::Error err;
    bridgescp::SessionOptions opt = validOptions();
    opt.host = "";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(err.code == bridgescp::ErrorCode::InvalidArgument,
            "empty host should be InvalidArgument");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
}

void test_connect_requires_credentials(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::SessionOptions opt = validOptions();
    opt.password.reset();
    bridgescp::Error err;
    t.check(!c.connect(opt, err), "connect without credentials should fail");
    t.check(err.code == bridgescp::ErrorCode::Authentication,
            "missing credentials should be an authentication error");
    t.check(state->connectCount.load() == 0,
            "no transport should be opened without credentials");

    err.clear();
    opt.password = "wrong";
    t.check(!c.connect(opt, err), "wrong password should be rejected");
    t.check(err.code == bridgescp::ErrorCode::Authentication,
            "wrong password should be an authentication error");

    err.clear();
    opt.password.reset();
    opt.private_key_path = "/home/alice/.ssh/id_ed25519";
    t.check(c.connect(opt, err), "any key should be accepted by default");
}

void test_connect_fault_injection(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::Error err;

    state->unreachable = true;
    t.check(!c.connect(validOptions(), err), "unreachable host should fail");
    t.check(err.code == bridgescp::ErrorCode::Transport,
            "unreachable host should be a transport error");

    state->unreachable = false;
    state->handshakeTimeout = true;
    err.clear();
    t.check(!c.connect(validOptions(), err), "handshake timeout should fail");
    t.check(err.code == bridgescp::ErrorCode::Timeout,
            "handshake timeout should be reported as Timeout");
    t.check(!c.isConnected(), "failed connect should leave client disconnected");
}

void test_disconnect_changes_state(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::Error err;
    t.check(c.connect(validOptions(), err),
            "connect should succeed before disconnect test");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");

    std::vector<bridgescp::FileInfo> out;
    std::string lerr;
    t.check(!c.list("/", out, lerr), "list should fail after disconnect");
}

void test_list_requires_connection(TestContext &t) {
    bridgescp::MockSftpClient c;
    std::vector<bridgescp::FileInfo> out;
    std::string err;
    t.check(!c.list("/", out, err), "list should fail when disconnected");
    t.check(!err.empty(), "list should provide error when disconnected");
}

void test_list_sorting_and_known_path(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr),
            "connect should succeed before list test");

    std::vector<bridgescp::FileInfo> out;
    std::string err;
    t.check(c.list("/home", out, err),
            "list('/home') should succeed in mock FS");
    t.check(out.size() == 3, "list('/home') should return 3 entries");
    if (out.size() == 3) {
        t.check(out[0].is_dir && out[0].name == "guest",
                "first entry should be dir 'guest'");
        t.check(out[1].is_dir && out[1].name == "luis",
                "second entry should be dir 'luis'");
        t.check(!out[2].is_dir && out[2].name == "notes.md",
                "third entry should be file 'notes.md'");
        t.check(out[2].size == 2048, "notes.md should report its size");
    }
}

void test_list_root_and_empty_path(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr),
            "connect should succeed before root listing test");

    std::vector<bridgescp::FileInfo> root;
    std::string err;
    t.check(c.list("/", root, err), "list('/') should succeed");
    t.check(root.size() == 3, "list('/') should return expected mock entries");
    if (root.size() == 3) {
        t.check(root[0].is_dir && root[0].name == "home",
                "root[0] should be 'home' directory");
        t.check(root[1].is_dir && root[1].name == "var",
                "root[1] should be 'var' directory");
        t.check(!root[2].is_dir && root[2].name == "readme.txt",
                "root[2] should be 'readme.txt' file");
    }

    std::vector<bridgescp::FileInfo> emptyPath;
    err.clear();
    t.check(c.list("", emptyPath, err), "list('') should be treated as '/'");
    t.check(emptyPath.size() == root.size(),
            "list('') should match root entry count");
}

void test_missing_path_error(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr),
            "connect should succeed before missing path test");

    std::vector<bridgescp::FileInfo> out;
    std::string err;
    t.check(!c.list("/does-not-exist", out, err),
            "list on missing path should fail");
    t.check(!err.empty(), "missing path should report non-empty error");

    bridgescp::FileInfo info;
    err.clear();
    t.check(!c.stat("/does-not-exist", info, err),
            "stat on missing path should fail");
    t.check(err.empty(), "stat on missing path should leave err empty");
}

void test_metadata_operations(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr), "connect before metadata test");

    bool isDir = false;
    std::string err;
    t.check(c.exists("/home/luis", isDir, err) && isDir,
            "exists should report directories");
    t.check(c.exists("/home/luis/foto.jpg", isDir, err) && !isDir,
            "exists should report files");
    t.check(!c.exists("/nope", isDir, err) && err.empty(),
            "exists on missing path should be false with empty err");

    bridgescp::FileInfo info;
    t.check(c.stat("/home/luis/foto.jpg", info, err),
            "stat on known file should succeed");
    t.check(info.size == 34567 && info.name == "foto.jpg",
            "stat should report size and base name");

    t.check(c.chmod("/home/luis/foto.jpg", 0600, err), "chmod should succeed");
    t.check((state->modeOf("/home/luis/foto.jpg") & 07777) == 0600,
            "chmod should update permission bits");

    t.check(c.setTimes("/home/luis/foto.jpg", 10, 20, err),
            "setTimes should succeed on known file");
    t.check(state->mtimeOf("/home/luis/foto.jpg") == 20,
            "setTimes should update mtime");

    t.check(c.mkdir("/home/luis/nuevo", err), "mkdir should create directory");
    t.check(!c.mkdir("/missing/parent", err),
            "mkdir without parent should fail");

    t.check(c.removeFile("/home/notes.md", err), "removeFile should succeed");
    t.check(!state->hasFile("/home/notes.md"),
            "removed file should be gone from state");
    err.clear();
    t.check(!c.removeFile("/home/notes.md", err) && !err.empty(),
            "removing a missing file should fail with error");
}

void test_file_channel_read_write(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr), "connect before file channel test");

    std::string err;
    auto out = c.open("/var/log/app.log", bridgescp::OpenMode::WriteTruncate, err);
    t.check(static_cast<bool>(out), "open for write should succeed: " + err);
    if (out) {
        t.check(out->write("hello ", 6, err) == 6, "first write should be full");
        t.check(out->write("world", 5, err) == 5, "second write should be full");
        t.check(out->sync(err), "sync should succeed");
        out->close();
    }
    t.check(state->fileContents("/var/log/app.log") == "hello world",
            "written bytes should land in order");

    auto in = c.open("/var/log/app.log", bridgescp::OpenMode::Read, err);
    t.check(static_cast<bool>(in), "open for read should succeed");
    if (in) {
        char buf[8];
        t.check(in->read(buf, sizeof(buf), err) == 8, "first read fills buffer");
        t.check(in->read(buf, sizeof(buf), err) == 3, "second read gets the rest");
        t.check(in->read(buf, sizeof(buf), err) == 0, "third read is EOF");
    }

    t.check(!c.open("/nope.txt", bridgescp::OpenMode::Read, err),
            "open missing file for read should fail");
    t.check(!c.open("/nodir/x.txt", bridgescp::OpenMode::WriteTruncate, err),
            "open for write without parent should fail");
}

void test_open_handle_dies_with_session(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr), "connect before handle test");

    std::string err;
    auto in = c.open("/readme.txt", bridgescp::OpenMode::Read, err);
    t.check(static_cast<bool>(in), "open should succeed");
    c.disconnect();
    if (in) {
        char buf[16];
        err.clear();
        t.check(in->read(buf, sizeof(buf), err) == -1,
                "read after disconnect should fail");
        t.checkContains(err, "Session closed",
                        "read after disconnect should say the session closed");
    }
}

void test_injected_io_failures(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    state->failReadAfter["/home/luis/foto.jpg"] = 4096;
    bridgescp::MockSftpClient c(state);
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr), "connect before failure test");

    std::string err;
    auto in = c.open("/home/luis/foto.jpg", bridgescp::OpenMode::Read, err);
    if (in) {
        char buf[4096];
        t.check(in->read(buf, sizeof(buf), err) == 4096,
                "read before the injected offset should succeed");
        t.check(in->read(buf, sizeof(buf), err) == -1,
                "read at the injected offset should fail");
        t.checkContains(err, "Injected read failure",
                        "injected read failure should be reported");
    }
}

void test_keepalive(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    std::string err;
    t.check(!c.sendKeepalive(err), "keepalive should fail when disconnected");
    bridgescp::Error cerr;
    t.check(c.connect(validOptions(), cerr), "connect before keepalive test");
    t.check(c.sendKeepalive(err), "keepalive should succeed when connected");
    state->failKeepalive = true;
    t.check(!c.sendKeepalive(err), "keepalive should report a dead peer");
    t.check(state->keepaliveCount.load() == 2, "keepalives should be counted");
}

void test_new_connection_like(TestContext &t) {
    auto state = std::make_shared<bridgescp::MockRemoteState>();
    bridgescp::MockSftpClient c(state);
    bridgescp::Error err;
    auto conn = c.newConnectionLike(validOptions(), err);
    t.check(static_cast<bool>(conn),
            "newConnectionLike should return a client");
    t.check(conn && conn->isConnected(),
            "newConnectionLike client should be connected");
    t.check(!c.isConnected(), "prototype should stay disconnected");
    t.check(state->connectCount.load() == 1,
            "newConnectionLike should open exactly one transport");
}

void test_new_connection_like_validation(TestContext &t) {
    bridgescp::MockSftpClient c;
    bridgescp::SessionOptions bad = validOptions();
    bad.host = "";
    bridgescp::Error err;
    auto conn = c.newConnectionLike(bad, err);
    t.check(!conn, "newConnectionLike should fail with invalid options");
    t.check(!err.message.empty(),
            "newConnectionLike should report validation errors");
}

void test_windows_to_posix(TestContext &t) {
    using bridgescp::WindowsAttributes;
    WindowsAttributes normal;
    t.check(bridgescp::windowsToPosix(normal) == 0775,
            "plain file should map to rwxrwxr-x");

    WindowsAttributes ro;
    ro.readOnly = true;
    t.check(bridgescp::windowsToPosix(ro) == 0445,
            "read-only should drop every write and owner/group execute bit");

    WindowsAttributes hidden;
    hidden.hidden = true;
    t.check(bridgescp::windowsToPosix(hidden) == 0700,
            "hidden should hide the file from group and others");

    WindowsAttributes sys;
    sys.system = true;
    t.check(bridgescp::windowsToPosix(sys) == 0770,
            "system should remove access for others");

    WindowsAttributes all;
    all.readOnly = all.hidden = all.system = true;
    t.check(bridgescp::windowsToPosix(all) == 0400,
            "read-only hidden system should leave owner read only");
}

void test_posix_to_windows(TestContext &t) {
    auto a = bridgescp::posixToWindows(0644);
    t.check(!a.readOnly && !a.hidden && a.system && a.archive,
            "0644 should be writable, visible, system (no other x), archive");

    a = bridgescp::posixToWindows(0755);
    t.check(!a.readOnly && !a.hidden && !a.system,
            "0755 should carry no restrictive attribute");

    a = bridgescp::posixToWindows(0400);
    t.check(a.readOnly && a.hidden && a.system,
            "0400 should be read-only, hidden and system");

    a = bridgescp::posixToWindows(0100555);
    t.check(a.readOnly && !a.hidden,
            "file type bits should be ignored");
}

void test_format_permissions(TestContext &t) {
    t.check(bridgescp::formatPermissions(040755) == "drwxr-xr-x",
            "directory 0755 should render drwxr-xr-x");
    t.check(bridgescp::formatPermissions(0100644) == "-rw-r--r--",
            "file 0644 should render -rw-r--r--");
    t.check(bridgescp::formatPermissions(0) == "----------",
            "no bits should render all dashes");
}

void test_case_conflict_detection(TestContext &t) {
    const std::vector<std::string> siblings = {"Report.TXT", "notes.md"};
    auto c = bridgescp::checkCaseConflict("report.txt", siblings);
    t.check(c.has_value(), "case-only difference should be a conflict");
    if (c) {
        t.check(c->conflictName == "Report.TXT",
                "conflict should name the existing sibling");
        t.check(c->proposedName == "report_1.txt",
                "proposal should append _1 before the extension");
    }
    t.check(!bridgescp::checkCaseConflict("notes.md", siblings),
            "exact match should not be a case conflict");
    t.check(!bridgescp::checkCaseConflict("other.md", siblings),
            "unrelated name should not be a conflict");
}

void test_unique_name_proposal(TestContext &t) {
    const std::vector<std::string> siblings = {"Data.csv", "data_1.CSV",
                                               "DATA_2.csv"};
    t.check(bridgescp::proposeUniqueName("data.csv", siblings) == "data_3.csv",
            "proposal should skip case-insensitive collisions");
    t.check(bridgescp::proposeUniqueName("Makefile", {"makefile"}) == "Makefile_1",
            "names without extension get a plain suffix");
    t.check(bridgescp::proposeUniqueName(".bashrc", {".BASHRC"}) == ".bashrc_1",
            "leading dot belongs to the stem");

    std::vector<std::string> crowded = {"a.txt"};
    for (int i = 1; i <= 1000; ++i)
        crowded.push_back("a_" + std::to_string(i) + ".txt");
    t.check(bridgescp::proposeUniqueName("A.txt", crowded).empty(),
            "proposal should give up after 1000 attempts");
}

void test_case_policy_names(TestContext &t) {
    using bridgescp::CaseConflictPolicy;
    t.check(bridgescp::caseConflictPolicyFromString("Ignore") ==
                CaseConflictPolicy::Ignore,
            "policy parsing should ignore case");
    t.check(bridgescp::caseConflictPolicyFromString("bogus") ==
                CaseConflictPolicy::AutoRename,
            "unknown policy should fall back to rename");
    t.check(std::string(bridgescp::caseConflictPolicyName(
                CaseConflictPolicy::AutoRename)) == "rename",
            "AutoRename should be named 'rename'");
}

} // namespace

void test_log_redaction(TestContext &t) {
    ::unsetenv("BRIDGESCP_ENV");
    ::unsetenv("BRIDGESCP_LOG_SENSITIVE");
    t.check(!bridgescp::sensitiveLoggingEnabled(),
            "sensitive logging should be off by default");
    t.check(bridgescp::redacted("alice@example.test:22") == "<redacted:21>",
            "identities should be redacted by default");
    t.check(bridgescp::redacted("") == "<empty>", "empty values are marked");

    ::setenv("BRIDGESCP_LOG_SENSITIVE", "1", 1);
    t.check(!bridgescp::sensitiveLoggingEnabled(),
            "the flag alone should not enable sensitive logging");
    ::setenv("BRIDGESCP_ENV", "  Dev ", 1);
    ::setenv("BRIDGESCP_LOG_SENSITIVE", "Yes", 1);
    t.check(bridgescp::sensitiveLoggingEnabled(),
            "dev environment plus flag enables sensitive logging");
    t.check(bridgescp::redacted("/home/luis") == "/home/luis",
            "values pass through when enabled");
    ::setenv("BRIDGESCP_ENV", "production", 1);
    t.check(!bridgescp::sensitiveLoggingEnabled(),
            "non-dev environments never log sensitive values");
    ::unsetenv("BRIDGESCP_ENV");
    ::unsetenv("BRIDGESCP_LOG_SENSITIVE");
}

int main() {
    TestContext t;
    test_session_defaults(t);
    test_error_describe(t);
    test_connect_validation(t);
    test_connect_requires_credentials(t);
    test_connect_fault_injection(t);
    test_disconnect_changes_state(t);
    test_list_requires_connection(t);
    test_list_sorting_and_known_path(t);
    test_list_root_and_empty_path(t);
    test_missing_path_error(t);
    test_metadata_operations(t);
    test_file_channel_read_write(t);
    test_open_handle_dies_with_session(t);
    test_injected_io_failures(t);
    test_keepalive(t);
    test_new_connection_like(t);
    test_new_connection_like_validation(t);
    test_windows_to_posix(t);
    test_posix_to_windows(t);
    test_format_permissions(t);
    test_case_conflict_detection(t);
    test_unique_name_proposal(t);
    test_case_policy_names(t);
    test_log_redaction(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bridgescp_core_tests\n";
    return EXIT_SUCCESS;
}
