#include "ftpdeck/Url.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace ftpdeck {

static std::string trimmed(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]), lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

static std::string percentEncode(const std::string& s, const char* reserved) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (c == '%' || std::strchr(reserved, c) || u < 0x20 || u >= 0x7f) {
            out += '%';
            out += kHex[u >> 4];
            out += kHex[u & 0x0f];
        } else {
            out += c;
        }
    }
    return out;
}

bool parseUrl(const std::string& text, Address& out, Error& err) {
    std::string s = trimmed(text);
    if (s.empty()) {
        err.set(ErrorCode::Validation, "empty address");
        return false;
    }

    Address a;
    std::size_t sep = s.find("://");
    if (sep != std::string::npos) {
        std::string scheme = s.substr(0, sep);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!protocolFromScheme(scheme, a.protocol)) {
            err.set(ErrorCode::Validation, "unsupported scheme '" + scheme + "'");
            return false;
        }
        s = s.substr(sep + 3);
    }

    std::string authority = s;
    std::size_t slash = s.find('/');
    if (slash != std::string::npos) {
        authority = s.substr(0, slash);
        a.path = percentDecode(s.substr(slash));
    }

    std::size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        std::size_t colon = userinfo.find(':');
        if (colon != std::string::npos) {
            a.user = percentDecode(userinfo.substr(0, colon));
            a.password = percentDecode(userinfo.substr(colon + 1));
        } else {
            a.user = percentDecode(userinfo);
        }
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            err.set(ErrorCode::Validation, "unterminated IPv6 address");
            return false;
        }
        a.host = authority.substr(1, close - 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                err.set(ErrorCode::Validation, "garbage after host: " + rest);
                return false;
            }
            portText = rest.substr(1);
        }
    } else {
        std::size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            a.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else {
            a.host = authority;
        }
    }
    if (a.host.empty()) {
        err.set(ErrorCode::Validation, "missing host");
        return false;
    }

    a.port = defaultPort(a.protocol);
    if (!portText.empty()) {
        bool digits = std::all_of(portText.begin(), portText.end(),
                                  [](unsigned char c) { return std::isdigit(c); });
        long v = digits && portText.size() <= 5 ? std::strtol(portText.c_str(), nullptr, 10) : -1;
        if (v < 1 || v > 65535) {
            err.set(ErrorCode::Validation, "invalid port '" + portText + "'");
            return false;
        }
        a.port = static_cast<std::uint16_t>(v);
    }

    if (a.user.empty()) {
        if (a.protocol == Protocol::Sftp) {
            const char* u = std::getenv("USER");
            a.user = u ? u : "";
        } else {
            a.user = "anonymous";
        }
    }

    out = a;
    return true;
}

std::string formatUrl(const Address& addr, bool withPassword) {
    std::string s = std::string(protocolScheme(addr.protocol)) + "://";
    if (!addr.user.empty()) {
        s += percentEncode(addr.user, ":@/");
        if (withPassword && !addr.password.empty()) s += ":" + percentEncode(addr.password, ":@/");
        s += "@";
    }
    s += addr.host.find(':') != std::string::npos ? "[" + addr.host + "]" : addr.host;
    if (addr.port != defaultPort(addr.protocol)) s += ":" + std::to_string(addr.port);
    if (!addr.path.empty()) {
        if (addr.path[0] != '/') s += "/";
        s += percentEncode(addr.path, "");
    }
    return s;
}

} // namespace ftpdeck
