#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations of libssh2's INTERNAL types (leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace bridgescp {

class Libssh2RemoteFile;

// One TCP socket + SSH session + SFTP channel. Every libssh2 call on the
// session is serialized through ioMutex_, so several transfers may share one
// client and interleave chunk by chunk.
class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

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

private:
  friend class Libssh2RemoteFile;

  std::atomic<bool> connected_{false};
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr; // <- internal types
  _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same
  // Bumped on every teardown so stale RemoteFile handles never touch a
  // freed session.
  std::uint64_t generation_ = 0;
  mutable std::mutex ioMutex_;

  bool tcpConnect(const std::string& host, std::uint16_t port, int timeoutMs, Error& err);
  bool sshHandshake(const SessionOptions& opt, Error& err);
  bool verifyHostKey(const SessionOptions& opt, Error& err);
  bool authenticate(const SessionOptions& opt, Error& err);
  bool openSftp(const SessionOptions& opt, Error& err);
  void teardownLocked();
  bool readyLocked(std::string& err) const;
  std::string lastSessionError() const;
  std::string sftpError(const char* op, const std::string& path) const;
};

} // namespace bridgescp
