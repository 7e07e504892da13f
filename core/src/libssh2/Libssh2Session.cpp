// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive and known_hosts trust-on-first-use.
#include "ftpdeck/Libssh2Session.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/Net.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ftpdeck {

// Global libssh2 initialization (once per process)
static void ensureLibssh2Init() {
    static std::once_flag once;
    std::call_once(once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) LOGE("libssh2_init failed: %d", rc);
    });
}

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static char* dupAnswer(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Keyboard-interactive callback: prompts mentioning "user" or "name" get the
// username, everything else gets the password.
static void kbintPasswordCallback(const char* name, int name_len,
                                  const char* instruction, int instruction_len,
                                  int num_prompts,
                                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                  void** abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length)
                                 : std::string();
        for (auto& c : prompt) c = (char)std::tolower((unsigned char)c);
        bool wantUser = prompt.find("user") != std::string::npos || prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupAnswer(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? (unsigned int)alen : 0;
    }
}

static std::string lastSessionError(LIBSSH2_SESSION* s) {
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (std::size_t)len) : std::string();
}

static bool isSocketError(long rc) {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
}

static void fillEntry(const LIBSSH2_SFTP_ATTRIBUTES& attrs, DirEntry& e) {
    bool isDir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                     ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                     : false;
    e.kind = isDir ? EntryKind::Directory : EntryKind::File;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size_bytes = isDir ? 0 : attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.modified_at = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
        e.permission_bits = static_cast<std::uint32_t>(attrs.permissions & 07777);
}

// One open SFTP file handle.
class Libssh2DataChannel : public DataChannel {
public:
    Libssh2DataChannel(Libssh2Session* session, LIBSSH2_SFTP_HANDLE* h, Direction dir)
        : session_(session), handle_(h), dir_(dir) {}

    ~Libssh2DataChannel() override {
        Error ignored;
        close(ignored);
    }

    long read(char* buf, std::size_t len, Error& err) override {
        if (!handle_ || dir_ != Direction::Download) {
            err.set(ErrorCode::Protocol, "handle not open for reading");
            return -1;
        }
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n >= 0) return static_cast<long>(n);
        if (session_) session_->sftpFailed("remote read", err);
        return -1;
    }

    bool write(const char* buf, std::size_t len, Error& err) override {
        if (!handle_ || dir_ != Direction::Upload) {
            err.set(ErrorCode::Protocol, "handle not open for writing");
            return false;
        }
        while (len > 0) {
            ssize_t w = libssh2_sftp_write(handle_, buf, len);
            if (w < 0) {
                if (session_) session_->sftpFailed("remote write", err);
                return false;
            }
            buf += w;
            len -= (std::size_t)w;
        }
        return true;
    }

    bool close(Error& err) override {
        if (!handle_) return true;
        int rc = libssh2_sftp_close(handle_);
        handle_ = nullptr;
        if (session_) {
            if (session_->active_ == this) session_->active_ = nullptr;
            if (rc != 0) {
                session_->sftpFailed("close", err);
                session_ = nullptr;
                return false;
            }
        }
        session_ = nullptr;
        return true;
    }

    void detach() {
        session_ = nullptr;
        handle_ = nullptr;
    }

private:
    Libssh2Session* session_;
    LIBSSH2_SFTP_HANDLE* handle_;
    Direction dir_;
};

Libssh2Session::Libssh2Session() {
    ensureLibssh2Init();
    if (const char* home = std::getenv("HOME")) knownHostsPath_ = std::string(home) + "/.ssh/known_hosts";
}

Libssh2Session::~Libssh2Session() {
    disconnect();
}

bool Libssh2Session::requireConnected(Error& err) const {
    if (!connected_ || !sftp_) {
        err.set(ErrorCode::NotConnected, "not connected");
        return false;
    }
    return true;
}

void Libssh2Session::sftpFailed(const std::string& what, Error& err) {
    long sessErr = session_ ? libssh2_session_last_errno(session_) : 0;
    if (sessErr != LIBSSH2_ERROR_SFTP_PROTOCOL || !sftp_) {
        if (isSocketError(sessErr)) {
            err.set(sessErr == LIBSSH2_ERROR_SOCKET_TIMEOUT ? ErrorCode::Timeout : ErrorCode::ConnectionLost,
                    what + ": " + lastSessionError(session_));
            LOGW("sftp: link lost during %s", what.c_str());
            connected_ = false;
        } else {
            err.set(ErrorCode::Protocol, what + ": " + (session_ ? lastSessionError(session_) : std::string()));
        }
        return;
    }
    unsigned long st = libssh2_sftp_last_error(sftp_);
    switch (st) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            err.set(ErrorCode::NotFound, what);
            break;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            err.set(ErrorCode::PermissionDenied, what);
            break;
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            err.set(ErrorCode::AlreadyExists, what);
            break;
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:
            err.set(ErrorCode::DiskFull, what);
            break;
        case LIBSSH2_FX_DIR_NOT_EMPTY:
            err.set(ErrorCode::IOError, what + ": directory not empty");
            break;
        case LIBSSH2_FX_CONNECTION_LOST:
        case LIBSSH2_FX_NO_CONNECTION:
            err.set(ErrorCode::ConnectionLost, what);
            connected_ = false;
            break;
        case LIBSSH2_FX_FAILURE:
            err.set(ErrorCode::IOError, what);
            break;
        default:
            err.set(ErrorCode::Protocol, what + ": sftp status " + std::to_string(st));
            break;
    }
}

bool Libssh2Session::checkHostKey(const Address& addr, Error& err) {
    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorCode::Refused, "cannot initialise known_hosts");
        return false;
    }
    if (!knownHostsPath_.empty()) {
        // A missing file is fine: the first host gets added below
        (void)libssh2_knownhost_readfile(nh, knownHostsPath_.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorCode::Refused, "server sent no host key");
        return false;
    }

    int alg = 0;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
            break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
            break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
            break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
            break;
#endif
        default:
            alg = 0;
            break;
    }

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, addr.host.c_str(), addr.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err.set(ErrorCode::Refused, "host key for " + addr.host + " does not match known_hosts");
        LOGE("sftp: host key mismatch for %s", addr.host.c_str());
        return false;
    }

    // Trust on first use
    std::string hostEntry = addr.host;
    if (addr.port != 22) hostEntry = "[" + addr.host + "]:" + std::to_string(addr.port);
    int addrc = libssh2_knownhost_addc(nh, hostEntry.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                                       LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, nullptr);
    if (addrc != 0 || knownHostsPath_.empty() ||
        libssh2_knownhost_writefile(nh, knownHostsPath_.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        LOGW("sftp: could not record host key for %s", addr.host.c_str());
    } else {
        LOGI("sftp: added %s to %s", hostEntry.c_str(), knownHostsPath_.c_str());
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2Session::sshHandshakeAuth(const Address& addr, Error& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorCode::Refused, "libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, timeoutMs_);

    int hs = libssh2_session_handshake(session_, sock_);
    if (hs != 0) {
        err.set(hs == LIBSSH2_ERROR_TIMEOUT ? ErrorCode::Timeout : ErrorCode::Refused,
                "SSH handshake failed: " + lastSessionError(session_));
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!checkHostKey(addr, err)) return false;

    // Password first; if the server is still talking, try keyboard-interactive.
    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, addr.user.c_str(), addr.password.c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (isSocketError(rc_pw)) {
        err.set(ErrorCode::Refused, "server closed the connection during authentication");
        return false;
    }
    if (rc_pw != 0) {
        char* methods = libssh2_userauth_list(session_, addr.user.c_str(), (unsigned)addr.user.size());
        std::string authlist = methods ? std::string(methods) : std::string();
        int rc_kbd = -1;
        if (authlist.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{addr.user.c_str(), addr.password.c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, addr.user.c_str(), kbintPasswordCallback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
        }
        if (rc_kbd != 0) {
            err.set(ErrorCode::AuthRejected,
                    "password rejected for " + addr.user +
                        (authlist.empty() ? std::string() : " (server offers: " + authlist + ")"));
            return false;
        }
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorCode::Refused, "SFTP subsystem unavailable: " + lastSessionError(session_));
        return false;
    }
    return true;
}

bool Libssh2Session::connect(const Address& addr, Error& err) {
    if (connected_) {
        err.set(ErrorCode::Protocol, "already connected");
        return false;
    }
    if (!net::tcpConnect(addr.host, addr.port, timeoutMs_, sock_, err)) return false;
    // libssh2 manages its own timeouts; socket-level ones interfere with userauth.
    net::setIoTimeout(sock_, 0);
    if (!sshHandshakeAuth(addr, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("sftp: logged in to %s as %s", addr.display().c_str(), addr.user.c_str());
    return true;
}

void Libssh2Session::disconnect() {
    if (active_) {
        active_->detach();
        active_ = nullptr;
    }
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    net::closeSocket(sock_);
    connected_ = false;
}

bool Libssh2Session::currentDirectory(std::string& out, Error& err) {
    if (!requireConnected(err)) return false;
    char buf[1024];
    int rc = libssh2_sftp_realpath(sftp_, ".", buf, sizeof(buf));
    if (rc < 0) {
        sftpFailed("realpath", err);
        return false;
    }
    out.assign(buf, (std::size_t)rc);
    return true;
}

bool Libssh2Session::list(const std::string& remote_path, std::vector<DirEntry>& out, Error& err) {
    if (!requireConnected(err)) return false;
    std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        sftpFailed("opendir " + path, err);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            DirEntry e;
            e.name = std::string(filename, (std::size_t)rc);
            if (e.name == "." || e.name == "..") continue;
            fillEntry(attrs, e);
            out.push_back(std::move(e));
        } else if (rc == 0) {
            break;
        } else {
            sftpFailed("readdir " + path, err);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2Session::size(const std::string& path, std::uint64_t& out, Error& err) {
    if (!requireConnected(err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), (unsigned)path.size(), LIBSSH2_SFTP_STAT, &st) != 0) {
        sftpFailed("stat " + path, err);
        return false;
    }
    out = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;
    return true;
}

bool Libssh2Session::mkdir(const std::string& path, Error& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, path.c_str(), 0755) != 0) {
        sftpFailed("mkdir " + path, err);
        return false;
    }
    return true;
}

bool Libssh2Session::rename(const std::string& from, const std::string& to, Error& err) {
    if (!requireConnected(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(), to.c_str(), (unsigned)to.size(), flags);
    if (rc != 0) {
        sftpFailed("rename " + from, err);
        return false;
    }
    return true;
}

bool Libssh2Session::deleteFile(const std::string& path, Error& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_unlink(sftp_, path.c_str()) != 0) {
        sftpFailed("unlink " + path, err);
        return false;
    }
    return true;
}

bool Libssh2Session::deleteEmptyDir(const std::string& path, Error& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, path.c_str()) != 0) {
        sftpFailed("rmdir " + path, err);
        return false;
    }
    return true;
}

std::unique_ptr<DataChannel> Libssh2Session::openDataChannel(const std::string& path,
                                                             Direction dir,
                                                             Error& err) {
    if (!requireConnected(err)) return nullptr;
    if (active_) {
        err.set(ErrorCode::Protocol, "a transfer is in progress");
        return nullptr;
    }
    unsigned long flags = dir == Direction::Download
                              ? LIBSSH2_FXF_READ
                              : (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, path.c_str(), (unsigned)path.size(), flags, 0644,
                                                  LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        sftpFailed(std::string(dir == Direction::Download ? "open for reading " : "open for writing ") + path, err);
        return nullptr;
    }
    auto ch = std::make_unique<Libssh2DataChannel>(this, h, dir);
    active_ = ch.get();
    return ch;
}

void Libssh2Session::abort() {
    // Closing the handle releases it on the server; there is no separate abort request.
    if (!active_) return;
    Error ignored;
    active_->close(ignored);
    active_ = nullptr;
}

} // namespace ftpdeck
