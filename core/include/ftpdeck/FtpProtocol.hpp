// RFC 959 control-channel helpers: reply framing, passive-mode replies, LIST parsing.
// Pure functions over text so they can be exercised without a server.
#pragma once
#include "Types.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace ftpdeck {
namespace ftp {

struct Reply {
    int         code = 0;  // 0 if the server sent something that is not a reply
    std::string text;      // all lines joined with '\n', code prefixes stripped

    bool preliminary() const  { return code >= 100 && code < 200; }
    bool completion() const   { return code >= 200 && code < 300; }
    bool intermediate() const { return code >= 300 && code < 400; }
};

// Accumulates control-channel bytes and yields complete, possibly multi-line, replies.
class ReplyReader {
public:
    void feed(const char* data, std::size_t len);
    bool next(Reply& out);
    void reset();

private:
    std::string buf_;
    int         multiCode_ = 0;  // non-zero while inside "123-" ... "123 "
    std::string multiText_;
};

// "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
bool parsePasv(const std::string& text, std::string& host, std::uint16_t& port);

// "229 Entering Extended Passive Mode (|||port|)"
bool parseEpsv(const std::string& text, std::uint16_t& port);

// 257 "/some ""quoted"" dir" is current directory
bool parsePwd(const std::string& text, std::string& path);

// One line of a LIST response (Unix ls -l or DOS style). "." and ".." and
// anything unparseable yield nullopt.
std::optional<DirEntry> parseListLine(const std::string& line, std::time_t now);

std::vector<DirEntry> parseListing(const std::string& data, std::time_t now);

// Taxonomy for a negative reply to a file command.
ErrorCode errorForReply(const Reply& r);

} // namespace ftp
} // namespace ftpdeck
