// Helpers for the shared value types.
#include "ftpdeck/Types.hpp"
#include <algorithm>
#include <cctype>

namespace ftpdeck {

const char* protocolScheme(Protocol p) {
    switch (p) {
        case Protocol::Ftp:  return "ftp";
        case Protocol::Sftp: return "sftp";
        case Protocol::Mock: return "mock";
    }
    return "ftp";
}

bool protocolFromScheme(const std::string& scheme, Protocol& out) {
    if (scheme == "ftp") out = Protocol::Ftp;
    else if (scheme == "sftp") out = Protocol::Sftp;
    else if (scheme == "mock") out = Protocol::Mock;
    else return false;
    return true;
}

std::uint16_t defaultPort(Protocol p) {
    switch (p) {
        case Protocol::Ftp:  return 21;
        case Protocol::Sftp: return 22;
        case Protocol::Mock: return 0;
    }
    return 21;
}

std::string Address::display() const {
    std::string s = host;
    if (host.find(':') != std::string::npos) s = "[" + host + "]";
    return s + ":" + std::to_string(port);
}

static std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void sortEntries(std::vector<DirEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) {
        if (a.isDir() != b.isDir()) return a.isDir();
        return lowered(a.name) < lowered(b.name);
    });
}

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorCategory::None;
        case ErrorCode::Unreachable:
        case ErrorCode::Refused:
        case ErrorCode::AuthRejected:
        case ErrorCode::Timeout:
            return ErrorCategory::Connect;
        case ErrorCode::Protocol:
            return ErrorCategory::Protocol;
        case ErrorCode::ConnectionLost:
        case ErrorCode::NotConnected:
            return ErrorCategory::ConnectionLost;
        case ErrorCode::NotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::AlreadyExists:
        case ErrorCode::DiskFull:
        case ErrorCode::Interrupted:
        case ErrorCode::IOError:
            return ErrorCategory::Transfer;
        case ErrorCode::Validation:
            return ErrorCategory::Validation;
        case ErrorCode::Cancelled:
            return ErrorCategory::Cancelled;
    }
    return ErrorCategory::None;
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "OK";
        case ErrorCode::Unreachable:      return "Unreachable";
        case ErrorCode::Refused:          return "Refused";
        case ErrorCode::AuthRejected:     return "Authentication rejected";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::Protocol:         return "Protocol error";
        case ErrorCode::ConnectionLost:   return "Connection lost";
        case ErrorCode::NotConnected:     return "Not connected";
        case ErrorCode::NotFound:         return "Not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::AlreadyExists:    return "Already exists";
        case ErrorCode::DiskFull:         return "Disk full";
        case ErrorCode::Interrupted:      return "Interrupted";
        case ErrorCode::IOError:          return "I/O error";
        case ErrorCode::Validation:       return "Invalid input";
        case ErrorCode::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

bool isConnectionFatal(ErrorCode code) {
    // A timeout mid-session leaves the reply stream out of sync
    return code == ErrorCode::ConnectionLost || code == ErrorCode::NotConnected ||
           code == ErrorCode::Timeout;
}

std::string Error::describe() const {
    if (message.empty()) return errorCodeName(code);
    return std::string(errorCodeName(code)) + ": " + message;
}

} // namespace ftpdeck
