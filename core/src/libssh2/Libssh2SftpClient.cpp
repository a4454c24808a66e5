// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Establishment steps are bounded independently; chunk I/O is bounded by the
// session timeout configured once the channel is up.
#include "bridgescp/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace bridgescp {

namespace {

// libssh2 global initialization (once per process)
std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

bool ensureLibssh2(Error& err) {
    std::call_once(g_libssh2_once, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        err.set(ErrorCode::Transport, "libssh2_init failed");
        return false;
    }
    return true;
}

// keyboard-interactive context: the only secret we hold is the password.
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

char* dupResponse(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Answers every prompt with the username or the password depending on its text.
void kbint_password_callback(const char* name, int name_len,
                             const char* instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        std::transform(prompt.begin(), prompt.end(), prompt.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

const char* hostKeyAlgName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
        default: return "UNKNOWN";
    }
}

std::string hexFingerprint(const char* prefix, const unsigned char* h, int len) {
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

FileInfo fromAttributes(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo fi{};
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    return fi;
}

} // namespace

// Handle on an open remote file. Every call takes the owner's I/O mutex and
// checks that the session it was opened on is still alive.
class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(Libssh2SftpClient* owner, LIBSSH2_SFTP_HANDLE* handle,
                      std::uint64_t generation, std::string path)
        : owner_(owner), handle_(handle), generation_(generation), path_(std::move(path)) {}
    ~Libssh2RemoteFile() override { close(); }

    long long read(char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(owner_->ioMutex_);
        if (!liveLocked(err)) return -1;
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            err = ioError("read", static_cast<int>(n));
            return -1;
        }
        return static_cast<long long>(n);
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(owner_->ioMutex_);
        if (!liveLocked(err)) return -1;
        ssize_t n = libssh2_sftp_write(handle_, buf, len);
        if (n < 0) {
            err = ioError("write", static_cast<int>(n));
            return -1;
        }
        return static_cast<long long>(n);
    }

    bool sync(std::string& err) override {
        std::lock_guard<std::mutex> lk(owner_->ioMutex_);
        if (!liveLocked(err)) return false;
        int rc = libssh2_sftp_fsync(handle_);
        if (rc == 0) return true;
        // fsync@openssh.com is an extension; servers without it are not an error.
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(owner_->sftp_) == LIBSSH2_FX_OP_UNSUPPORTED)
            return true;
        err = ioError("fsync", rc);
        return false;
    }

    void close() override {
        std::lock_guard<std::mutex> lk(owner_->ioMutex_);
        if (!handle_) return;
        // After a teardown the handle died with its session.
        if (owner_->connected_.load() && owner_->generation_ == generation_)
            libssh2_sftp_close(handle_);
        handle_ = nullptr;
    }

private:
    Libssh2SftpClient* owner_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::uint64_t generation_;
    std::string path_;

    bool liveLocked(std::string& err) const {
        if (!handle_) {
            err = "File already closed: " + path_;
            return false;
        }
        if (!owner_->connected_.load() || owner_->generation_ != generation_) {
            err = "Session closed while transferring " + path_;
            return false;
        }
        return true;
    }

    std::string ioError(const char* op, int rc) const {
        if (rc == LIBSSH2_ERROR_TIMEOUT)
            return std::string("Remote ") + op + " timed out: " + path_;
        return owner_->sftpError(op, path_);
    }
};

Libssh2SftpClient::Libssh2SftpClient() = default;

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, std::uint16_t port,
                                   int timeoutMs, Error& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorCode::Transport, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    bool timedOut = false;
    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive so half-open links are detected by the kernel too
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the attempt is bounded by timeoutMs.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int pr = ::poll(&pfd, 1, timeoutMs);
            if (pr == 0) {
                timedOut = true;
            } else if (pr > 0) {
                int soerr = 0;
                socklen_t len = sizeof(soerr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len);
                if (soerr == 0) rc = 0;
                else lastErrno = soerr;
            } else {
                lastErrno = errno;
            }
        } else if (rc != 0) {
            lastErrno = errno;
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    if (timedOut) {
        err.set(ErrorCode::Timeout, "Connection to " + host + ":" + portStr + " timed out after " +
                                        std::to_string(timeoutMs) + " ms");
    } else {
        err.set(ErrorCode::Transport, "Could not connect to " + host + ":" + portStr +
                                          (lastErrno ? std::string(": ") + std::strerror(lastErrno)
                                                     : std::string()));
    }
    return false;
}

bool Libssh2SftpClient::sshHandshake(const SessionOptions& opt, Error& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorCode::Transport, "libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.handshake_timeout_ms);

    int rc = libssh2_session_handshake(session_, sock_);
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        err.set(ErrorCode::Timeout, "SSH handshake timed out");
        return false;
    }
    if (rc != 0) {
        err.set(ErrorCode::Transport, "SSH handshake failed: " + lastSessionError());
        return false;
    }

    // SSH keepalive: requests a reply so a dead peer is noticed by sendKeepalive()
    libssh2_keepalive_config(session_, 1, 30);
    return true;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, Error& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorCode::Transport, "Could not initialize known_hosts");
        return false;
    }
    struct KnownHostsGuard {
        LIBSSH2_KNOWNHOSTS* h;
        ~KnownHostsGuard() { libssh2_knownhost_free(h); }
    } guard{nh};

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorCode::Transport, "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err.set(ErrorCode::Transport, "Could not obtain host key");
        return false;
    }
    const int alg = knownHostKeyAlg(keytype);

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) return true;

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorCode::Transport, "Host key does not match known_hosts");
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorCode::Transport, "Host not found in known_hosts");
        return false;
    }

    // AcceptNew and the host is unknown: TOFU
    std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (h) fpStr = hexFingerprint("SHA256:", h, 32);
#else
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1));
    if (h) fpStr = hexFingerprint("SHA1:", h, 20);
#endif
    if (opt.hostkey_confirm_cb &&
        !opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype), fpStr)) {
        err.set(ErrorCode::Transport, "Unknown host: fingerprint not confirmed");
        return false;
    }
    if (khPath.empty()) {
        err.set(ErrorCode::Transport, "known_hosts path is not defined");
        return false;
    }
    int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                                       LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                       nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err.set(ErrorCode::Transport, "Could not add/write host to known_hosts");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, Error& err) {
    // 1) Private key when given. 2) Password, with keyboard-interactive using the
    // same password when the server only offers that. Nothing else is tried.
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr,  // public key derived from the private one
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            err.set(ErrorCode::Timeout, "Key authentication timed out");
            return false;
        }
        if (rc != 0) {
            err.set(ErrorCode::Authentication, "Key authentication failed: " + lastSessionError());
            return false;
        }
        return true;
    }

    if (!opt.password.has_value()) {
        err.set(ErrorCode::Authentication, "No credentials supplied (key or password required)");
        return false;
    }

    int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
    if (rc_pw == 0) return true;
    if (rc_pw == LIBSSH2_ERROR_TIMEOUT) {
        err.set(ErrorCode::Timeout, "Password authentication timed out");
        return false;
    }
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err.set(ErrorCode::Transport, "Server closed the connection after the password attempt");
        return false;
    }
    const std::string pwErr = lastSessionError();

    char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                          static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        int rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(),
                                                           kbint_password_callback);
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
        if (rc_kbd == LIBSSH2_ERROR_TIMEOUT) {
            err.set(ErrorCode::Timeout, "Keyboard-interactive authentication timed out");
            return false;
        }
    }
    err.set(ErrorCode::Authentication,
            "Password authentication failed" +
                (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                (pwErr.empty() ? std::string() : ": " + pwErr));
    return false;
}

bool Libssh2SftpClient::openSftp(const SessionOptions& opt, Error& err) {
    libssh2_session_set_timeout(session_, opt.channel_timeout_ms);
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_TIMEOUT)
            err.set(ErrorCode::Timeout, "SFTP subsystem start timed out");
        else
            err.set(ErrorCode::Transport, "Could not start SFTP subsystem: " + lastSessionError());
        return false;
    }
    // From here on the timeout is the per-chunk I/O deadline.
    libssh2_session_set_timeout(session_, opt.io_timeout_ms);
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, Error& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (connected_.load()) {
        err.set(ErrorCode::InvalidStateTransition, "Already connected");
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorCode::InvalidArgument, "Host and username are required");
        return false;
    }
    if (!opt.private_key_path.has_value() && !opt.password.has_value()) {
        err.set(ErrorCode::Authentication, "No credentials supplied (key or password required)");
        return false;
    }
    if (!ensureLibssh2(err)) return false;

    if (!tcpConnect(opt.host, opt.port, opt.connect_timeout_ms, err) ||
        !sshHandshake(opt, err) ||
        !verifyHostKey(opt, err) ||
        !authenticate(opt, err) ||
        !openSftp(opt, err)) {
        // No half-open state survives a failed attempt.
        teardownLocked();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::teardownLocked() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    ++generation_;
    connected_ = false;
}

void Libssh2SftpClient::disconnect() {
    std::lock_guard<std::mutex> lk(ioMutex_);
    teardownLocked();
}

bool Libssh2SftpClient::readyLocked(std::string& err) const {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, static_cast<size_t>(emlen)) : std::string();
}

std::string Libssh2SftpClient::sftpError(const char* op, const std::string& path) const {
    std::string msg = std::string("sftp ") + op + " failed for " + path;
    if (sftp_ && libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL)
        msg += " (sftp status " + std::to_string(libssh2_sftp_last_error(sftp_)) + ")";
    else if (!lastSessionError().empty())
        msg += ": " + lastSessionError();
    return msg;
}

bool Libssh2SftpClient::sendKeepalive(std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;
    int secondsToNext = 0;
    if (libssh2_keepalive_send(session_, &secondsToNext) != 0) {
        err = "SSH keepalive failed: " + lastSessionError();
        return false;
    }
    return true;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;

    std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = sftpError("opendir", path);
        return false;
    }

    out.clear();
    out.reserve(64);
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi = fromAttributes(attrs);
            fi.name = std::string(filename, static_cast<size_t>(rc));
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = sftpError("readdir", path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            isDir = ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        return true;
    }
    unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
    if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_FAILURE) {
        err.clear();
        return false; // does not exist
    }
    err = sftpError("stat", remote_path);
    return false;
}

// Detailed remote metadata. Returns false (err empty) if the path does not exist.
bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE) {
            err.clear();
            return false;
        }
        err = sftpError("stat", remote_path);
        return false;
    }
    info = fromAttributes(st);
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    return true;
}

bool Libssh2SftpClient::chmod(const std::string& remote_path,
                              std::uint32_t mode,
                              std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode;
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        err = sftpError("chmod", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::setTimes(const std::string& remote_path,
                                 std::uint64_t atime,
                                 std::uint64_t mtime,
                                 std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(atime);
    a.mtime = static_cast<unsigned long>(mtime);
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        err = sftpError("setstat", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) != 0) {
        err = sftpError("mkdir", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   std::string& err) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = sftpError("unlink", remote_path);
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::open(const std::string& remote_path,
                                                    OpenMode mode,
                                                    std::string& err,
                                                    unsigned int perms) {
    std::lock_guard<std::mutex> lk(ioMutex_);
    if (!readyLocked(err)) return nullptr;
    const unsigned long flags = (mode == OpenMode::Read)
                                    ? LIBSSH2_FXF_READ
                                    : (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  static_cast<unsigned>(remote_path.size()),
                                                  flags, static_cast<long>(perms), LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = sftpError("open", remote_path);
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(this, h, generation_, remote_path);
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 Error& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace bridgescp
