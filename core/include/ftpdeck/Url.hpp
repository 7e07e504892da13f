// scheme://[user[:password]@]host[:port][/path] <-> Address
#pragma once
#include "Types.hpp"
#include <string>

namespace ftpdeck {

// A bare "host[:port]" means ftp. Missing user means "anonymous" for ftp and $USER for sftp.
// Fails with ErrorCode::Validation.
bool parseUrl(const std::string& text, Address& out, Error& err);

// Password is only included on request; the result parses back to the same Address.
std::string formatUrl(const Address& addr, bool withPassword = false);

} // namespace ftpdeck
