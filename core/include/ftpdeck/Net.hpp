// Thin POSIX TCP helpers shared by the FTP and SFTP backends.
#pragma once
#include "Types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace ftpdeck {
namespace net {

// Resolve and connect with TCP keepalive. timeoutMs bounds each connect attempt.
// Maps failures onto Unreachable / Refused / Timeout.
bool tcpConnect(const std::string& host, std::uint16_t port, int timeoutMs,
                int& fdOut, Error& err);

// SO_RCVTIMEO / SO_SNDTIMEO
void setIoTimeout(int fd, int ms);

bool sendAll(int fd, const char* data, std::size_t len, Error& err);

// Returns bytes received, 0 on orderly close, -1 on error (Timeout or ConnectionLost).
long recvSome(int fd, char* buf, std::size_t len, Error& err);

// Numeric address of the remote side, empty if unknown.
std::string peerHost(int fd);

void closeSocket(int& fd);

} // namespace net
} // namespace ftpdeck
