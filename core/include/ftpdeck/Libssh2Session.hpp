// Session implementation using libssh2 for the sftp:// scheme.
// Encapsulates the TCP socket, SSH session and SFTP channel.
#pragma once
#include "Session.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace ftpdeck {

class Libssh2DataChannel;

class Libssh2Session : public Session {
public:
    Libssh2Session();
    ~Libssh2Session() override;

    bool connect(const Address& addr, Error& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void setTimeout(int ms) override { timeoutMs_ = ms > 0 ? ms : 10000; }

    bool currentDirectory(std::string& out, Error& err) override;
    bool list(const std::string& path, std::vector<DirEntry>& out, Error& err) override;
    bool size(const std::string& path, std::uint64_t& out, Error& err) override;

    bool mkdir(const std::string& path, Error& err) override;
    bool rename(const std::string& from, const std::string& to, Error& err) override;
    bool deleteFile(const std::string& path, Error& err) override;
    bool deleteEmptyDir(const std::string& path, Error& err) override;

    std::unique_ptr<DataChannel> openDataChannel(const std::string& path,
                                                 Direction dir,
                                                 Error& err) override;
    void abort() override;

    // Defaults to ~/.ssh/known_hosts
    void setKnownHostsPath(const std::string& path) { knownHostsPath_ = path; }

private:
    friend class Libssh2DataChannel;

    bool sshHandshakeAuth(const Address& addr, Error& err);
    bool checkHostKey(const Address& addr, Error& err);
    bool requireConnected(Error& err) const;
    // Fills err from the last SFTP status (or the session error when the link broke).
    void sftpFailed(const std::string& what, Error& err);

    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP* sftp_ = nullptr;
    bool connected_ = false;
    int timeoutMs_ = 10000;
    std::string knownHostsPath_;
    Libssh2DataChannel* active_ = nullptr;
};

} // namespace ftpdeck
