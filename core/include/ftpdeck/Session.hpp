// Abstract interface for a remote file-transfer session. Concrete backends (FTP, libssh2 SFTP,
// mock) follow this API so the endpoint, planner and controller stay protocol-agnostic.
#pragma once
#include "Types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ftpdeck {

enum class Direction { Download, Upload };

// One file's worth of bytes moving over a data connection (or SFTP handle).
class DataChannel {
public:
    virtual ~DataChannel() = default;

    // Reads up to len bytes. Returns the byte count, 0 at end of file, -1 on error.
    virtual long read(char* buf, std::size_t len, Error& err) = 0;

    // Writes all len bytes or fails.
    virtual bool write(const char* buf, std::size_t len, Error& err) = 0;

    // Finishes the transfer and collects the server's verdict on it.
    virtual bool close(Error& err) = 0;
};

class Session {
public:
    virtual ~Session() = default;

    // Connect and authenticate. On failure err is one of
    // Unreachable, Refused, AuthRejected or Timeout.
    virtual bool connect(const Address& addr, Error& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Bound for connects, replies and socket I/O.
    virtual void setTimeout(int ms) = 0;

    // Directory the server placed us in after login.
    virtual bool currentDirectory(std::string& out, Error& err) = 0;

    // Remote directory listing (without "." and "..")
    virtual bool list(const std::string& path,
                      std::vector<DirEntry>& out,
                      Error& err) = 0;

    virtual bool size(const std::string& path,
                      std::uint64_t& out,
                      Error& err) = 0;

    // Single round trip each. deleteEmptyDir fails on a non-empty directory.
    virtual bool mkdir(const std::string& path, Error& err) = 0;
    virtual bool rename(const std::string& from, const std::string& to, Error& err) = 0;
    virtual bool deleteFile(const std::string& path, Error& err) = 0;
    virtual bool deleteEmptyDir(const std::string& path, Error& err) = 0;

    // At most one channel is open at a time; the control channel stays busy until it closes.
    virtual std::unique_ptr<DataChannel> openDataChannel(const std::string& path,
                                                         Direction dir,
                                                         Error& err) = 0;

    // Abort the in-flight data transfer, if any. Safe to call when idle.
    virtual void abort() = 0;
};

// Backend for a protocol. Mock sessions created here get a fresh demo tree.
std::unique_ptr<Session> makeSession(Protocol p);

} // namespace ftpdeck
