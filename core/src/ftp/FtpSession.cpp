// FTP backend: login, PASV data connections, LIST/RETR/STOR and ABOR handling.
#include "ftpdeck/FtpSession.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/Net.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>

#include <poll.h>

namespace ftpdeck {

// Passive data connection for one RETR or STOR. Closing it collects the
// transfer verdict from the control channel; dropping it unclosed aborts.
class FtpDataChannel : public DataChannel {
public:
    FtpDataChannel(FtpSession* session, int fd, Direction dir)
        : session_(session), fd_(fd), dir_(dir) {}

    ~FtpDataChannel() override {
        if (!finished_ && session_) session_->abortTransfer(this);
        net::closeSocket(fd_);
    }

    long read(char* buf, std::size_t len, Error& err) override {
        if (finished_ || dir_ != Direction::Download) {
            err.set(ErrorCode::Protocol, "channel not open for reading");
            return -1;
        }
        long n = net::recvSome(fd_, buf, len, err);
        if (n < 0) failAfterDataError(err);
        return n;
    }

    bool write(const char* buf, std::size_t len, Error& err) override {
        if (finished_ || dir_ != Direction::Upload) {
            err.set(ErrorCode::Protocol, "channel not open for writing");
            return false;
        }
        if (net::sendAll(fd_, buf, len, err)) return true;
        failAfterDataError(err);
        return false;
    }

    bool close(Error& err) override {
        if (finished_) return true;
        finished_ = true;
        net::closeSocket(fd_);
        if (!session_) {
            err.set(ErrorCode::NotConnected, "session closed");
            return false;
        }
        FtpSession* s = session_;
        s->active_ = nullptr;
        session_ = nullptr;
        ftp::Reply r;
        if (!s->readReply(r, err)) return false;
        if (r.code == 226 || r.code == 250) {
            s->accepted();
            return true;
        }
        s->replyFailed(r, "transfer", err);
        return false;
    }

    void detach() {
        session_ = nullptr;
        finished_ = true;
    }

    void dropData() { net::closeSocket(fd_); }

private:
    // The data socket broke; the control channel usually says why (552, 426, ...).
    void failAfterDataError(Error& err) {
        Error dataErr = err;
        Error replyErr;
        if (!close(replyErr)) {
            err = replyErr.ok() ? dataErr : replyErr;
            if (err.code == ErrorCode::Protocol) err = dataErr;
            return;
        }
        // Server claims success after our side failed
        if (dataErr.code == ErrorCode::ConnectionLost) dataErr.code = ErrorCode::Interrupted;
        err = dataErr;
    }

    FtpSession* session_;
    int fd_;
    Direction dir_;
    bool finished_ = false;
};

FtpSession::~FtpSession() {
    disconnect();
}

bool FtpSession::requireConnected(Error& err) const {
    if (!connected_ || ctrl_ == -1) {
        err.set(ErrorCode::NotConnected, "not connected");
        return false;
    }
    return true;
}

void FtpSession::markLost() {
    if (active_) {
        active_->detach();
        active_ = nullptr;
    }
    net::closeSocket(ctrl_);
    reader_.reset();
    if (connected_) LOGW("ftp: control connection to %s dropped", addr_.display().c_str());
    connected_ = false;
}

bool FtpSession::sendCommand(const std::string& line, Error& err) {
    if (ctrl_ == -1) {
        err.set(ErrorCode::NotConnected, "not connected");
        return false;
    }
    if (line.compare(0, 5, "PASS ") == 0) {
        LOGI("ftp> PASS ****");
    } else {
        LOGI("ftp> %s", line.c_str());
    }
    std::string wire = line + "\r\n";
    if (!net::sendAll(ctrl_, wire.data(), wire.size(), err)) {
        markLost();
        return false;
    }
    return true;
}

bool FtpSession::readReply(ftp::Reply& r, Error& err) {
    char buf[4096];
    while (!reader_.next(r)) {
        if (ctrl_ == -1) {
            err.set(ErrorCode::NotConnected, "not connected");
            return false;
        }
        long n = net::recvSome(ctrl_, buf, sizeof(buf), err);
        if (n == 0) err.set(ErrorCode::ConnectionLost, "server closed the control connection");
        if (n <= 0) {
            markLost();
            return false;
        }
        reader_.feed(buf, static_cast<std::size_t>(n));
    }
    LOGI("ftp< %d %s", r.code, r.text.c_str());
    if (r.code == 421) {
        err.set(ErrorCode::ConnectionLost, r.text.empty() ? "service not available" : r.text);
        markLost();
        return false;
    }
    return true;
}

bool FtpSession::command(const std::string& line, ftp::Reply& r, Error& err) {
    return sendCommand(line, err) && readReply(r, err);
}

bool FtpSession::simple(const std::string& line, std::initializer_list<int> okCodes, Error& err) {
    if (!requireConnected(err)) return false;
    ftp::Reply r;
    if (!command(line, r, err)) return false;
    if (std::find(okCodes.begin(), okCodes.end(), r.code) != okCodes.end()) {
        accepted();
        return true;
    }
    replyFailed(r, line.substr(0, line.find(' ')), err);
    return false;
}

void FtpSession::replyFailed(const ftp::Reply& r, const std::string& what, Error& err) {
    ErrorCode code = ftp::errorForReply(r);
    std::string msg = what + ": " + (r.code ? std::to_string(r.code) + " " : std::string()) + r.text;
    if (code != ErrorCode::Protocol) {
        // A well-formed refusal is still a sane conversation
        accepted();
        err.set(code, msg);
        return;
    }
    if (++strikes_ >= 2) {
        err.set(ErrorCode::ConnectionLost, "unexpected replies from server (" + msg + ")");
        markLost();
        return;
    }
    err.set(ErrorCode::Protocol, msg);
}

bool FtpSession::replyPending(int ms) const {
    if (ctrl_ == -1) return false;
    pollfd pfd{};
    pfd.fd = ctrl_;
    pfd.events = POLLIN;
    return ::poll(&pfd, 1, ms) > 0;
}

bool FtpSession::connect(const Address& addr, Error& err) {
    if (connected_) {
        err.set(ErrorCode::Protocol, "already connected");
        return false;
    }
    reader_.reset();
    strikes_ = 0;
    if (!net::tcpConnect(addr.host, addr.port, timeoutMs_, ctrl_, err)) return false;
    addr_ = addr;

    // Failures past the TCP connect are reported as refusals unless they timed out
    auto refuse = [&](const std::string& why) {
        if (err.code != ErrorCode::Timeout && err.code != ErrorCode::AuthRejected)
            err.set(ErrorCode::Refused, why);
        net::closeSocket(ctrl_);
        reader_.reset();
        return false;
    };

    ftp::Reply r;
    do {
        if (!readReply(r, err)) return refuse("no greeting from " + addr.display());
    } while (r.code == 120);
    if (r.code != 220) return refuse("greeting: " + std::to_string(r.code) + " " + r.text);

    const std::string user = addr.user.empty() ? "anonymous" : addr.user;
    if (!command("USER " + user, r, err)) return refuse("login interrupted");
    if (r.code == 331) {
        if (!command("PASS " + addr.password, r, err)) return refuse("login interrupted");
    }
    if (r.code != 230 && r.code != 202) {
        err.set(ErrorCode::AuthRejected, std::to_string(r.code) + " " + r.text);
        return refuse("");
    }

    if (!command("TYPE I", r, err)) return refuse("login interrupted");
    if (r.code != 200) return refuse("binary mode rejected: " + r.text);

    connected_ = true;
    LOGI("ftp: logged in to %s as %s", addr.display().c_str(), user.c_str());
    return true;
}

void FtpSession::disconnect() {
    if (active_) abortTransfer(active_);
    if (ctrl_ != -1 && connected_) {
        Error ignored;
        if (sendCommand("QUIT", ignored) && replyPending(1000)) {
            ftp::Reply r;
            readReply(r, ignored);
        }
    }
    net::closeSocket(ctrl_);
    reader_.reset();
    connected_ = false;
}

bool FtpSession::currentDirectory(std::string& out, Error& err) {
    if (!requireConnected(err)) return false;
    ftp::Reply r;
    if (!command("PWD", r, err)) return false;
    if (r.code == 257 && ftp::parsePwd(r.text, out)) {
        accepted();
        return true;
    }
    replyFailed(r, "PWD", err);
    return false;
}

bool FtpSession::openPassive(int& fd, Error& err) {
    ftp::Reply r;
    std::string host;
    std::uint16_t port = 0;
    if (!command("PASV", r, err)) return false;
    if (r.code == 227 && ftp::parsePasv(r.text, host, port)) {
        accepted();
    } else {
        // IPv6 or PASV-less servers
        if (!command("EPSV", r, err)) return false;
        if (r.code != 229 || !ftp::parseEpsv(r.text, port)) {
            replyFailed(r, "passive mode", err);
            return false;
        }
        accepted();
    }
    // Servers behind NAT advertise private addresses; the control peer is reachable.
    std::string peer = net::peerHost(ctrl_);
    if (!peer.empty()) host = peer;
    if (!net::tcpConnect(host, port, timeoutMs_, fd, err)) {
        err.set(ErrorCode::Interrupted, "data connection: " + err.message);
        return false;
    }
    return true;
}

bool FtpSession::list(const std::string& path, std::vector<DirEntry>& out, Error& err) {
    if (!requireConnected(err)) return false;
    if (active_) {
        err.set(ErrorCode::Protocol, "a transfer is in progress");
        return false;
    }
    int fd = -1;
    if (!openPassive(fd, err)) return false;

    ftp::Reply r;
    if (!command(path.empty() ? std::string("LIST") : "LIST " + path, r, err)) {
        net::closeSocket(fd);
        return false;
    }
    if (!r.preliminary()) {
        net::closeSocket(fd);
        replyFailed(r, "LIST " + path, err);
        return false;
    }

    std::string data;
    char buf[8192];
    for (;;) {
        long n = net::recvSome(fd, buf, sizeof(buf), err);
        if (n < 0) {
            net::closeSocket(fd);
            markLost();
            return false;
        }
        if (n == 0) break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    net::closeSocket(fd);

    if (!readReply(r, err)) return false;
    if (r.code != 226 && r.code != 250) {
        replyFailed(r, "LIST " + path, err);
        return false;
    }
    accepted();
    out = ftp::parseListing(data, std::time(nullptr));
    return true;
}

bool FtpSession::size(const std::string& path, std::uint64_t& out, Error& err) {
    if (!requireConnected(err)) return false;
    ftp::Reply r;
    if (!command("SIZE " + path, r, err)) return false;
    if (r.code != 213) {
        replyFailed(r, "SIZE " + path, err);
        return false;
    }
    accepted();
    out = std::strtoull(r.text.c_str(), nullptr, 10);
    return true;
}

bool FtpSession::mkdir(const std::string& path, Error& err) {
    return simple("MKD " + path, {257, 250}, err);
}

bool FtpSession::rename(const std::string& from, const std::string& to, Error& err) {
    if (!requireConnected(err)) return false;
    ftp::Reply r;
    if (!command("RNFR " + from, r, err)) return false;
    if (r.code != 350) {
        replyFailed(r, "RNFR " + from, err);
        return false;
    }
    accepted();
    return simple("RNTO " + to, {250}, err);
}

bool FtpSession::deleteFile(const std::string& path, Error& err) {
    return simple("DELE " + path, {250}, err);
}

bool FtpSession::deleteEmptyDir(const std::string& path, Error& err) {
    return simple("RMD " + path, {250}, err);
}

std::unique_ptr<DataChannel> FtpSession::openDataChannel(const std::string& path,
                                                         Direction dir,
                                                         Error& err) {
    if (!requireConnected(err)) return nullptr;
    if (active_) {
        err.set(ErrorCode::Protocol, "a transfer is in progress");
        return nullptr;
    }
    int fd = -1;
    if (!openPassive(fd, err)) return nullptr;

    const std::string verb = dir == Direction::Download ? "RETR " : "STOR ";
    ftp::Reply r;
    if (!command(verb + path, r, err)) {
        net::closeSocket(fd);
        return nullptr;
    }
    if (!r.preliminary()) {
        net::closeSocket(fd);
        replyFailed(r, verb + path, err);
        return nullptr;
    }
    accepted();
    auto ch = std::make_unique<FtpDataChannel>(this, fd, dir);
    active_ = ch.get();
    return ch;
}

void FtpSession::abort() {
    if (active_) abortTransfer(active_);
}

void FtpSession::abortTransfer(FtpDataChannel* ch) {
    if (ch != active_ || !connected_) {
        if (ch) ch->detach();
        return;
    }
    active_ = nullptr;
    ch->detach();
    Error err;
    // Urgent-data signalling is optional on modern servers; a plain ABOR suffices.
    if (!sendCommand("ABOR", err)) return;
    ch->dropData();

    // 426 then 226, or a lone 225/226 if the transfer had already finished
    ftp::Reply r;
    if (!readReply(r, err)) {
        LOGW("ftp: ABOR got no reply: %s", err.describe().c_str());
        return;
    }
    if (r.code == 426 || r.code == 451 || r.code == 226 || r.code == 250) {
        if (replyPending(r.code == 426 || r.code == 451 ? timeoutMs_ : 300)) readReply(r, err);
    }
    strikes_ = 0;
}

} // namespace ftpdeck
