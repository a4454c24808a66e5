// Basic types shared between the transport and the orchestration layer.
// Kept as plain structs so they can be copied across threads freely.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace bridgescp {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accepts and stores new hosts; rejects key changes.
    Off         // No verification (not recommended).
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// How a remote file is opened through the file channel.
enum class OpenMode {
    Read,           // existing file, read only
    WriteTruncate   // create or truncate, write only
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    // Exactly one credential is used; the key wins when both are present.
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Returns true to accept and store. Without a callback AcceptNew accepts.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Each establishment step is bounded independently (milliseconds).
    int connect_timeout_ms   = 10000;
    int handshake_timeout_ms = 10000; // handshake + authentication
    int channel_timeout_ms   = 10000; // SFTP subsystem start
    // Deadline for every chunk read/write once the session is up.
    int io_timeout_ms        = 60000;
};

} // namespace bridgescp
