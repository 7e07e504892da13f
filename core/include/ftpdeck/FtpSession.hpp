// FTP backend (RFC 959): one control connection, passive data connections, binary type.
#pragma once
#include "FtpProtocol.hpp"
#include "Session.hpp"
#include <initializer_list>
#include <string>

namespace ftpdeck {

class FtpDataChannel;

class FtpSession : public Session {
public:
    FtpSession() = default;
    ~FtpSession() override;

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

private:
    friend class FtpDataChannel;

    bool requireConnected(Error& err) const;
    bool sendCommand(const std::string& line, Error& err);
    bool readReply(ftp::Reply& r, Error& err);
    bool command(const std::string& line, ftp::Reply& r, Error& err);
    // Single round trip that must answer with one of the given codes.
    bool simple(const std::string& line, std::initializer_list<int> okCodes, Error& err);
    // Turns a negative or unexpected reply into err; two unexpected replies in a row drop the link.
    void replyFailed(const ftp::Reply& r, const std::string& what, Error& err);
    void accepted() { strikes_ = 0; }
    bool openPassive(int& fd, Error& err);
    bool replyPending(int ms) const;
    void abortTransfer(FtpDataChannel* ch);
    void markLost();

    int ctrl_ = -1;
    Address addr_;
    bool connected_ = false;
    int timeoutMs_ = 10000;
    ftp::ReplyReader reader_;
    FtpDataChannel* active_ = nullptr;
    int strikes_ = 0;
};

} // namespace ftpdeck
