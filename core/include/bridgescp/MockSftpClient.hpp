#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace bridgescp {

// Simulated remote file system. Shared by every MockSftpClient created from
// the same state (including newConnectionLike), so tests can inspect what a
// transfer wrote and inject failures.
struct MockRemoteState {
  MockRemoteState();

  mutable std::mutex mutex;
  std::set<std::string> dirs;
  std::map<std::string, std::string> files;      // path -> contents
  std::map<std::string, std::uint32_t> modes;    // path -> POSIX bits
  std::map<std::string, std::uint64_t> mtimes;   // path -> epoch seconds

  // Credentials the fake server accepts. An empty key path accepts any key.
  std::string acceptedPassword = "secret";
  std::string acceptedKeyPath;

  // Fault injection
  std::atomic<bool> unreachable{false};      // connect -> Transport
  std::atomic<bool> handshakeTimeout{false}; // connect -> Timeout
  std::atomic<bool> failKeepalive{false};
  std::atomic<int>  keepaliveDelayMs{0};
  std::atomic<int>  connectDelayMs{0};
  std::atomic<int>  chunkDelayMs{0};         // per read/write call
  std::map<std::string, std::uint64_t> failReadAfter;  // path -> byte offset
  std::map<std::string, std::uint64_t> failWriteAfter; // path -> byte offset

  // Counters
  std::atomic<int> connectCount{0};   // transports actually opened
  std::atomic<int> keepaliveCount{0};

  void putFile(const std::string& path, const std::string& contents,
               std::uint32_t mode = 0100644);
  void putDir(const std::string& path);
  bool hasFile(const std::string& path) const;
  std::string fileContents(const std::string& path) const;
  std::uint32_t modeOf(const std::string& path) const;
  std::uint64_t mtimeOf(const std::string& path) const;
};

class MockSftpClient : public SftpClient {
public:
  explicit MockSftpClient(std::shared_ptr<MockRemoteState> state =
                              std::make_shared<MockRemoteState>());
  ~MockSftpClient() override;

  bool connect(const SessionOptions& opt, Error& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_.load(); }
  bool sendKeepalive(std::string& err) override;

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;
  bool exists(const std::string& remote_path,
              bool& isDir,
              std::string& err) override;
  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;
  bool chmod(const std::string& remote_path,
             std::uint32_t mode,
             std::string& err) override;
  bool setTimes(const std::string& remote_path,
                std::uint64_t atime,
                std::uint64_t mtime,
                std::string& err) override;
  bool mkdir(const std::string& remote_dir,
             std::string& err,
             unsigned int mode = 0755) override;
  bool removeFile(const std::string& remote_path,
                  std::string& err) override;

  std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                   OpenMode mode,
                                   std::string& err,
                                   unsigned int perms = 0644) override;

  std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                Error& err) override;

  const std::shared_ptr<MockRemoteState>& state() const { return state_; }
  const SessionOptions& lastOptions() const { return lastOpt_; }
  // Bumped on disconnect; open handles from an older generation fail.
  std::uint64_t generation() const { return generation_.load(); }

private:
  std::shared_ptr<MockRemoteState> state_;
  std::atomic<bool> connected_{false};
  std::atomic<std::uint64_t> generation_{0};
  SessionOptions lastOpt_{};
};

} // namespace bridgescp
