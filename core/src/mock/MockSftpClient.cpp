#include "bridgescp/MockSftpClient.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace bridgescp {

namespace {

std::string normalize(const std::string& path) {
  if (path.empty()) return "/";
  std::string p = path;
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string parentOf(const std::string& path) {
  const auto pos = path.find_last_of('/');
  if (pos == std::string::npos || pos == 0) return "/";
  return path.substr(0, pos);
}

std::string baseName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

void sleepMs(int ms) {
  if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace

MockRemoteState::MockRemoteState() {
  // Small remote tree
  for (const char* d : {"/", "/home", "/home/luis", "/home/guest",
                        "/home/luis/proyectos", "/var", "/var/log"})
    putDir(d);
  putFile("/readme.txt", std::string(1280, 'r'));
  putFile("/home/notes.md", std::string(2048, 'n'));
  putFile("/home/luis/foto.jpg", std::string(34567, 'j'));
}

void MockRemoteState::putFile(const std::string& path, const std::string& contents,
                              std::uint32_t mode) {
  std::lock_guard<std::mutex> lk(mutex);
  const std::string p = normalize(path);
  files[p] = contents;
  modes[p] = mode;
  mtimes[p] = 1700000000;
}

void MockRemoteState::putDir(const std::string& path) {
  std::lock_guard<std::mutex> lk(mutex);
  const std::string p = normalize(path);
  dirs.insert(p);
  modes[p] = 040755;
}

bool MockRemoteState::hasFile(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mutex);
  return files.count(normalize(path)) > 0;
}

std::string MockRemoteState::fileContents(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mutex);
  auto it = files.find(normalize(path));
  return it == files.end() ? std::string() : it->second;
}

std::uint32_t MockRemoteState::modeOf(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mutex);
  auto it = modes.find(normalize(path));
  return it == modes.end() ? 0 : it->second;
}

std::uint64_t MockRemoteState::mtimeOf(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mutex);
  auto it = mtimes.find(normalize(path));
  return it == mtimes.end() ? 0 : it->second;
}

// File handle over one entry of the shared state. Reads see the contents as
// they are at each call; writes append at the handle's offset.
class MockRemoteFile : public RemoteFile {
public:
  MockRemoteFile(const MockSftpClient* owner, std::string path, OpenMode mode)
      : owner_(owner), generation_(owner->generation()), path_(std::move(path)), mode_(mode) {}

  long long read(char* buf, std::size_t len, std::string& err) override {
    if (!live(err)) return -1;
    sleepMs(owner_->state()->chunkDelayMs.load());
    if (!live(err)) return -1;
    auto& st = *owner_->state();
    std::lock_guard<std::mutex> lk(st.mutex);
    auto it = st.files.find(path_);
    if (it == st.files.end()) {
      err = "No such file: " + path_;
      return -1;
    }
    auto f = st.failReadAfter.find(path_);
    if (f != st.failReadAfter.end() && offset_ >= f->second) {
      err = "Injected read failure: " + path_;
      return -1;
    }
    if (offset_ >= it->second.size()) return 0;
    std::size_t n = std::min<std::size_t>(len, it->second.size() - offset_);
    std::copy_n(it->second.data() + offset_, n, buf);
    offset_ += n;
    return static_cast<long long>(n);
  }

  long long write(const char* buf, std::size_t len, std::string& err) override {
    if (!live(err)) return -1;
    if (mode_ != OpenMode::WriteTruncate) {
      err = "File not opened for writing: " + path_;
      return -1;
    }
    sleepMs(owner_->state()->chunkDelayMs.load());
    if (!live(err)) return -1;
    auto& st = *owner_->state();
    std::lock_guard<std::mutex> lk(st.mutex);
    auto f = st.failWriteAfter.find(path_);
    if (f != st.failWriteAfter.end() && offset_ >= f->second) {
      err = "Injected write failure: " + path_;
      return -1;
    }
    std::string& data = st.files[path_];
    if (data.size() < offset_ + len) data.resize(offset_ + len);
    std::copy_n(buf, len, &data[offset_]);
    offset_ += len;
    return static_cast<long long>(len);
  }

  bool sync(std::string& err) override { return live(err); }

  void close() override { closed_ = true; }

private:
  const MockSftpClient* owner_;
  std::uint64_t generation_;
  std::string path_;
  OpenMode mode_;
  std::size_t offset_ = 0;
  bool closed_ = false;

  bool live(std::string& err) const {
    if (closed_) {
      err = "File already closed: " + path_;
      return false;
    }
    if (!owner_->isConnected() || owner_->generation() != generation_) {
      err = "Session closed while transferring " + path_;
      return false;
    }
    return true;
  }
};

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteState> state)
    : state_(std::move(state)) {}

MockSftpClient::~MockSftpClient() = default;

bool MockSftpClient::connect(const SessionOptions& opt, Error& err) {
  if (opt.host.empty() || opt.username.empty()) {
    err.set(ErrorCode::InvalidArgument, "Host and username are required");
    return false;
  }
  if (!opt.private_key_path.has_value() && !opt.password.has_value()) {
    err.set(ErrorCode::Authentication, "No credentials supplied (key or password required)");
    return false;
  }
  ++state_->connectCount;
  sleepMs(state_->connectDelayMs.load());
  if (state_->unreachable.load()) {
    err.set(ErrorCode::Transport, "Could not connect to " + opt.host);
    return false;
  }
  if (state_->handshakeTimeout.load()) {
    err.set(ErrorCode::Timeout, "SSH handshake timed out");
    return false;
  }
  if (opt.private_key_path.has_value()) {
    if (!state_->acceptedKeyPath.empty() && *opt.private_key_path != state_->acceptedKeyPath) {
      err.set(ErrorCode::Authentication, "Key authentication failed");
      return false;
    }
  } else if (*opt.password != state_->acceptedPassword) {
    err.set(ErrorCode::Authentication, "Password authentication failed");
    return false;
  }
  connected_ = true;
  lastOpt_ = opt;
  return true;
}

void MockSftpClient::disconnect() {
  if (connected_.exchange(false)) ++generation_;
}

bool MockSftpClient::sendKeepalive(std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  ++state_->keepaliveCount;
  sleepMs(state_->keepaliveDelayMs.load());
  if (state_->failKeepalive.load()) {
    err = "SSH keepalive failed: peer not responding";
    return false;
  }
  return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  if (!state_->dirs.count(path)) {
    err = "Remote path not found in mock: " + path;
    return false;
  }
  out.clear();
  for (const auto& d : state_->dirs) {
    if (d != path && parentOf(d) == path) {
      FileInfo fi{};
      fi.name = baseName(d);
      fi.is_dir = true;
      fi.mode = state_->modes[d];
      out.push_back(fi);
    }
  }
  for (const auto& f : state_->files) {
    if (parentOf(f.first) == path) {
      FileInfo fi{};
      fi.name = baseName(f.first);
      fi.size = f.second.size();
      fi.mode = state_->modes[f.first];
      fi.mtime = state_->mtimes[f.first];
      out.push_back(fi);
    }
  }
  std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b){
    if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // dirs first
    return a.name < b.name;
  });
  return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
  isDir = false;
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  if (state_->dirs.count(path)) {
    isDir = true;
    return true;
  }
  err.clear();
  return state_->files.count(path) > 0;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  info = FileInfo{};
  info.name = baseName(path);
  if (state_->dirs.count(path)) {
    info.is_dir = true;
    info.mode = state_->modes[path];
    return true;
  }
  auto it = state_->files.find(path);
  if (it == state_->files.end()) {
    err.clear();
    return false;
  }
  info.size = it->second.size();
  info.mode = state_->modes[path];
  info.mtime = state_->mtimes[path];
  return true;
}

bool MockSftpClient::chmod(const std::string& remote_path,
                           std::uint32_t mode,
                           std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  const bool isDir = state_->dirs.count(path) > 0;
  if (!isDir && !state_->files.count(path)) {
    err = "No such file: " + path;
    return false;
  }
  state_->modes[path] = (isDir ? 040000u : 0100000u) | (mode & 07777u);
  return true;
}

bool MockSftpClient::setTimes(const std::string& remote_path,
                              std::uint64_t /*atime*/,
                              std::uint64_t mtime,
                              std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  if (!state_->files.count(path) && !state_->dirs.count(path)) {
    err = "No such file: " + path;
    return false;
  }
  state_->mtimes[path] = mtime;
  return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int mode) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_dir);
  std::lock_guard<std::mutex> lk(state_->mutex);
  if (state_->dirs.count(path) || state_->files.count(path)) {
    err = "Already exists: " + path;
    return false;
  }
  if (!state_->dirs.count(parentOf(path))) {
    err = "Parent directory missing: " + path;
    return false;
  }
  state_->dirs.insert(path);
  state_->modes[path] = 040000u | (mode & 07777u);
  return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  std::lock_guard<std::mutex> lk(state_->mutex);
  if (!state_->files.erase(path)) {
    err = "No such file: " + path;
    return false;
  }
  state_->modes.erase(path);
  state_->mtimes.erase(path);
  return true;
}

std::unique_ptr<RemoteFile> MockSftpClient::open(const std::string& remote_path,
                                                 OpenMode mode,
                                                 std::string& err,
                                                 unsigned int perms) {
  if (!connected_) {
    err = "Not connected";
    return nullptr;
  }
  const std::string path = normalize(remote_path);
  {
    std::lock_guard<std::mutex> lk(state_->mutex);
    if (state_->dirs.count(path)) {
      err = "Is a directory: " + path;
      return nullptr;
    }
    if (mode == OpenMode::Read) {
      if (!state_->files.count(path)) {
        err = "No such file: " + path;
        return nullptr;
      }
    } else {
      if (!state_->dirs.count(parentOf(path))) {
        err = "Parent directory missing: " + path;
        return nullptr;
      }
      const bool existed = state_->files.count(path) > 0;
      state_->files[path].clear();
      if (!existed) state_->modes[path] = 0100000u | (perms & 07777u);
      state_->mtimes[path] = 1700000000;
    }
  }
  return std::make_unique<MockRemoteFile>(this, path, mode);
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              Error& err) {
  auto ptr = std::make_unique<MockSftpClient>(state_);
  if (!ptr->connect(opt, err)) return nullptr;
  return ptr;
}

} // namespace bridgescp
