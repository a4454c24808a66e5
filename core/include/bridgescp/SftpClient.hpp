// Abstract interface for SFTP operations. Concrete implementations (libssh2,
// in-memory mock) follow this API so the orchestration layer stays decoupled
// from the backend.
#pragma once
#include "BridgeError.hpp"
#include "SftpTypes.hpp"
#include <memory>

namespace bridgescp {

// Open remote file handle obtained from SftpClient::open.
// Handles must be destroyed before the client that created them.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Bytes read, 0 at end of file, -1 on error (err filled).
    virtual long long read(char* buf, std::size_t len, std::string& err) = 0;
    // Bytes written (may be short), -1 on error (err filled).
    virtual long long write(const char* buf, std::size_t len, std::string& err) = 0;
    // Flush remote buffers to stable storage where the server supports it.
    virtual bool sync(std::string& err) = 0;
    virtual void close() = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, Error& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Transport-level heartbeat; false when the peer is gone.
    virtual bool sendKeepalive(std::string& err) = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Check existence (leaves err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Change permissions (POSIX mode, e.g. 0644)
    virtual bool chmod(const std::string& remote_path,
                       std::uint32_t mode,
                       std::string& err) = 0;

    // Set remote atime/mtime if the server allows it
    virtual bool setTimes(const std::string& remote_path,
                          std::uint64_t atime,
                          std::uint64_t mtime,
                          std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    // File channel: chunk-level access used by the copy loops.
    virtual std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                             OpenMode mode,
                                             std::string& err,
                                             unsigned int perms = 0644) = 0;

    // Create a new, connected client of the same kind with the given options.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          Error& err) = 0;
};

} // namespace bridgescp
