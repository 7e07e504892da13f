// Backend selection by URL scheme.
#include "ftpdeck/Session.hpp"
#include "ftpdeck/FtpSession.hpp"
#include "ftpdeck/Libssh2Session.hpp"
#include "ftpdeck/MockSession.hpp"

namespace ftpdeck {

std::unique_ptr<Session> makeSession(Protocol p) {
    switch (p) {
        case Protocol::Ftp:  return std::make_unique<FtpSession>();
        case Protocol::Sftp: return std::make_unique<Libssh2Session>();
        case Protocol::Mock: return std::make_unique<MockSession>();
    }
    return std::make_unique<FtpSession>();
}

} // namespace ftpdeck
