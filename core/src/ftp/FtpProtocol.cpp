// Reply framing and LIST parsing for the FTP backend.
#include "ftpdeck/FtpProtocol.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace ftpdeck {
namespace ftp {

static bool startsWithCode(const std::string& line) {
    return line.size() >= 3 && std::isdigit((unsigned char)line[0]) &&
           std::isdigit((unsigned char)line[1]) && std::isdigit((unsigned char)line[2]);
}

void ReplyReader::feed(const char* data, std::size_t len) {
    buf_.append(data, len);
}

void ReplyReader::reset() {
    buf_.clear();
    multiCode_ = 0;
    multiText_.clear();
}

bool ReplyReader::next(Reply& out) {
    for (;;) {
        std::size_t nl = buf_.find('\n');
        if (nl == std::string::npos) return false;
        std::string line = buf_.substr(0, nl);
        buf_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (multiCode_ != 0) {
            // "123 last line" closes; anything else is continuation text
            if (startsWithCode(line) && std::atoi(line.substr(0, 3).c_str()) == multiCode_ &&
                (line.size() == 3 || line[3] == ' ')) {
                if (line.size() > 4) multiText_ += "\n" + line.substr(4);
                out.code = multiCode_;
                out.text = multiText_;
                multiCode_ = 0;
                multiText_.clear();
                return true;
            }
            multiText_ += "\n" + line;
            continue;
        }

        if (!startsWithCode(line)) {
            if (line.empty()) continue;
            out.code = 0;
            out.text = line;
            return true;
        }
        int code = std::atoi(line.substr(0, 3).c_str());
        if (line.size() > 3 && line[3] == '-') {
            multiCode_ = code;
            multiText_ = line.substr(4);
            continue;
        }
        out.code = code;
        out.text = line.size() > 4 ? line.substr(4) : std::string();
        return true;
    }
}

bool parsePasv(const std::string& text, std::string& host, std::uint16_t& port) {
    // Some servers omit the parentheses; scan for the first run of six numbers.
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !std::isdigit((unsigned char)text[i])) ++i;
        int nums[6];
        int count = 0;
        std::size_t j = i;
        while (j < text.size() && count < 6) {
            if (!std::isdigit((unsigned char)text[j])) break;
            int v = 0;
            std::size_t digits = 0;
            while (j < text.size() && std::isdigit((unsigned char)text[j]) && digits < 4) {
                v = v * 10 + (text[j] - '0');
                ++j;
                ++digits;
            }
            if (v > 255) break;
            nums[count++] = v;
            if (count < 6) {
                if (j >= text.size() || text[j] != ',') break;
                ++j;
            }
        }
        if (count == 6) {
            host = std::to_string(nums[0]) + "." + std::to_string(nums[1]) + "." +
                   std::to_string(nums[2]) + "." + std::to_string(nums[3]);
            port = static_cast<std::uint16_t>(nums[4] * 256 + nums[5]);
            return true;
        }
        if (j == i) ++j;
        i = j;
    }
    return false;
}

bool parseEpsv(const std::string& text, std::uint16_t& port) {
    std::size_t open = text.find('(');
    if (open == std::string::npos || open + 4 >= text.size()) return false;
    char delim = text[open + 1];
    // (|||port|)
    if (text[open + 2] != delim || text[open + 3] != delim) return false;
    std::size_t start = open + 4;
    std::size_t end = text.find(delim, start);
    if (end == std::string::npos || end == start) return false;
    long v = std::strtol(text.substr(start, end - start).c_str(), nullptr, 10);
    if (v <= 0 || v > 65535) return false;
    port = static_cast<std::uint16_t>(v);
    return true;
}

bool parsePwd(const std::string& text, std::string& path) {
    std::size_t q = text.find('"');
    if (q == std::string::npos) return false;
    std::string out;
    for (std::size_t i = q + 1; i < text.size(); ++i) {
        if (text[i] == '"') {
            if (i + 1 < text.size() && text[i + 1] == '"') {
                out += '"';
                ++i;
                continue;
            }
            path = out;
            return true;
        }
        out += text[i];
    }
    return false;
}

static int monthIndex(const std::string& tok) {
    static const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
    if (tok.size() != 3) return -1;
    std::string low;
    for (char c : tok) low += (char)std::tolower((unsigned char)c);
    for (int i = 0; i < 12; ++i)
        if (low == kMonths[i]) return i;
    return -1;
}

static bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static std::uint32_t modeFromString(const std::string& perms) {
    // "drwxr-xr-x": owner/group/other triplets after the type char
    std::uint32_t bits = 0;
    static const std::uint32_t kMasks[9] = {0400, 0200, 0100, 040, 020, 010, 04, 02, 01};
    for (int i = 0; i < 9 && (std::size_t)(i + 1) < perms.size(); ++i) {
        char c = perms[(std::size_t)i + 1];
        if (c != '-' && c != 'S' && c != 'T') bits |= kMasks[i];
    }
    return bits;
}

struct Token {
    std::string text;
    std::size_t end;  // offset just past the token in the source line
};

static std::vector<Token> tokenize(const std::string& line) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        if (i >= line.size()) break;
        std::size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
        out.push_back({line.substr(start, i - start), i});
    }
    return out;
}

static std::uint64_t toEpoch(int year, int month, int day, int hour, int minute) {
    std::tm tmv{};
    tmv.tm_year = year - 1900;
    tmv.tm_mon = month;
    tmv.tm_mday = day;
    tmv.tm_hour = hour;
    tmv.tm_min = minute;
    std::time_t t = ::timegm(&tmv);
    return t < 0 ? 0 : static_cast<std::uint64_t>(t);
}

static std::optional<DirEntry> parseUnixLine(const std::string& line, std::time_t now) {
    auto toks = tokenize(line);
    if (toks.size() < 6) return std::nullopt;
    const std::string& perms = toks[0].text;
    if (perms.size() < 10) return std::nullopt;
    char type = perms[0];
    if (type != 'd' && type != '-' && type != 'l') return std::nullopt;

    // Owner/group columns vary between servers; anchor on "<size> <Mon> <day> <time|year>".
    for (std::size_t m = 2; m + 2 < toks.size(); ++m) {
        int month = monthIndex(toks[m].text);
        if (month < 0 || !allDigits(toks[m - 1].text) || !allDigits(toks[m + 1].text)) continue;
        const std::string& when = toks[m + 2].text;
        int day = std::atoi(toks[m + 1].text.c_str());
        std::tm nowTm{};
        gmtime_r(&now, &nowTm);
        std::uint64_t mtime = 0;
        std::size_t colon = when.find(':');
        if (colon != std::string::npos) {
            int hh = std::atoi(when.substr(0, colon).c_str());
            int mm = std::atoi(when.substr(colon + 1).c_str());
            int year = nowTm.tm_year + 1900;
            // ls shows HH:MM for the last six months; a future date belongs to last year
            if (month > nowTm.tm_mon) --year;
            mtime = toEpoch(year, month, day, hh, mm);
        } else if (allDigits(when)) {
            mtime = toEpoch(std::atoi(when.c_str()), month, day, 0, 0);
        } else {
            continue;
        }

        std::size_t nameStart = toks[m + 2].end;
        while (nameStart < line.size() && line[nameStart] == ' ') ++nameStart;
        std::string name = line.substr(nameStart);
        if (type == 'l') {
            std::size_t arrow = name.find(" -> ");
            if (arrow != std::string::npos) name.resize(arrow);
        }
        if (name.empty() || name == "." || name == "..") return std::nullopt;

        DirEntry e;
        e.name = name;
        e.kind = type == 'd' ? EntryKind::Directory : EntryKind::File;
        e.size_bytes = e.isDir() ? 0 : std::strtoull(toks[m - 1].text.c_str(), nullptr, 10);
        e.modified_at = mtime;
        e.permission_bits = modeFromString(perms);
        return e;
    }
    return std::nullopt;
}

// "01-31-24  10:05AM       <DIR>          Reports" or "...  1234 notes.txt"
static std::optional<DirEntry> parseDosLine(const std::string& line) {
    auto toks = tokenize(line);
    if (toks.size() < 4) return std::nullopt;
    const std::string& date = toks[0].text;
    const std::string& time = toks[1].text;
    if (date.size() < 8 || date[2] != '-' || date[5] != '-') return std::nullopt;
    int mon = std::atoi(date.substr(0, 2).c_str()) - 1;
    int day = std::atoi(date.substr(3, 2).c_str());
    int year = std::atoi(date.substr(6).c_str());
    if (year < 70) year += 2000;
    else if (year < 100) year += 1900;
    std::size_t colon = time.find(':');
    if (colon == std::string::npos) return std::nullopt;
    int hh = std::atoi(time.substr(0, colon).c_str());
    int mm = std::atoi(time.substr(colon + 1, 2).c_str());
    if (time.size() >= 7) {
        bool pm = std::toupper((unsigned char)time[time.size() - 2]) == 'P';
        if (pm && hh < 12) hh += 12;
        if (!pm && hh == 12) hh = 0;
    }

    DirEntry e;
    if (toks[2].text == "<DIR>") {
        e.kind = EntryKind::Directory;
    } else if (allDigits(toks[2].text)) {
        e.size_bytes = std::strtoull(toks[2].text.c_str(), nullptr, 10);
    } else {
        return std::nullopt;
    }
    std::size_t nameStart = toks[2].end;
    while (nameStart < line.size() && line[nameStart] == ' ') ++nameStart;
    e.name = line.substr(nameStart);
    if (e.name.empty() || e.name == "." || e.name == "..") return std::nullopt;
    e.modified_at = toEpoch(year, mon, day, hh, mm);
    return e;
}

std::optional<DirEntry> parseListLine(const std::string& raw, std::time_t now) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    if (line.empty() || line.compare(0, 6, "total ") == 0) return std::nullopt;
    if (std::isdigit((unsigned char)line[0])) return parseDosLine(line);
    return parseUnixLine(line, now);
}

std::vector<DirEntry> parseListing(const std::string& data, std::time_t now) {
    std::vector<DirEntry> out;
    std::istringstream in(data);
    std::string line;
    while (std::getline(in, line)) {
        if (auto e = parseListLine(line, now)) out.push_back(std::move(*e));
    }
    return out;
}

static bool mentions(const std::string& text, const char* word) {
    std::string low;
    low.reserve(text.size());
    for (char c : text) low += (char)std::tolower((unsigned char)c);
    return low.find(word) != std::string::npos;
}

ErrorCode errorForReply(const Reply& r) {
    switch (r.code) {
        case 421:
            return ErrorCode::ConnectionLost;
        case 425:
        case 426:
            return ErrorCode::Interrupted;
        case 450:
        case 451:
            return ErrorCode::IOError;
        case 452:
        case 552:
            return ErrorCode::DiskFull;
        case 530:
        case 532:
        case 553:
            return ErrorCode::PermissionDenied;
        case 550:
            if (mentions(r.text, "denied") || mentions(r.text, "permission"))
                return ErrorCode::PermissionDenied;
            if (mentions(r.text, "exists")) return ErrorCode::AlreadyExists;
            return ErrorCode::NotFound;
        default:
            break;
    }
    return ErrorCode::Protocol;
}

} // namespace ftp
} // namespace ftpdeck
