// Basic types shared between the UI and the core: addresses, listing entries, errors.
// Kept as plain structs so front ends can copy them around freely.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <utility>

namespace ftpdeck {

// Wire protocol spoken by the remote endpoint (URL scheme).
enum class Protocol {
    Ftp,   // ftp://  control + passive data connections
    Sftp,  // sftp:// libssh2 SFTP subsystem
    Mock   // mock:// in-memory server, no network
};

const char* protocolScheme(Protocol p);
// Lower-case scheme name; false for anything else.
bool protocolFromScheme(const std::string& scheme, Protocol& out);
std::uint16_t defaultPort(Protocol p);

struct Address {
    Protocol      protocol = Protocol::Ftp;
    std::string   host;
    std::uint16_t port = 21;
    std::string   user;
    std::string   password;
    std::string   path;  // initial remote directory, may be empty

    // host:port as shown in the status bar
    std::string display() const;
};

// Identity of a server login; password and initial path do not count.
inline bool operator==(const Address& a, const Address& b) {
    return a.host == b.host && a.port == b.port && a.user == b.user;
}
inline bool operator!=(const Address& a, const Address& b) { return !(a == b); }

enum class EntryKind { File, Directory };

struct DirEntry {
    std::string   name;        // base name
    EntryKind     kind = EntryKind::File;
    std::uint64_t size_bytes  = 0;
    std::uint64_t modified_at = 0;  // epoch seconds, 0 if unknown
    std::optional<std::uint32_t> permission_bits;

    bool isDir() const { return kind == EntryKind::Directory; }
};

// Directories first, then case-insensitive by name.
void sortEntries(std::vector<DirEntry>& entries);

enum class ErrorCode {
    None,
    // connect
    Unreachable,
    Refused,
    AuthRejected,
    Timeout,
    // single request
    Protocol,
    // session
    ConnectionLost,
    NotConnected,
    // per file
    NotFound,
    PermissionDenied,
    AlreadyExists,
    DiskFull,
    Interrupted,
    IOError,
    // user input
    Validation,
    Cancelled
};

enum class ErrorCategory { None, Connect, Protocol, ConnectionLost, Transfer, Validation, Cancelled };

ErrorCategory categoryOf(ErrorCode code);
const char* errorCodeName(ErrorCode code);

// Errors that leave the control channel unusable; a batch cannot continue past them.
bool isConnectionFatal(ErrorCode code);

struct Error {
    ErrorCode   code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }
    void clear() { code = ErrorCode::None; message.clear(); }
    void set(ErrorCode c, std::string msg) { code = c; message = std::move(msg); }

    // "Timeout: no reply from server"
    std::string describe() const;
};

} // namespace ftpdeck
