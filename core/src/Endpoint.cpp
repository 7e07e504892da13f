// Local (POSIX + std::filesystem) and remote (Session) endpoints.
#include "ftpdeck/Endpoint.hpp"
#include "ftpdeck/Connector.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ftpdeck {

const char* sideName(Side s) {
    return s == Side::Local ? "local" : "remote";
}

bool Endpoint::readText(const std::string& path, std::size_t limit, std::string& out, bool& truncated,
                        Error& err) {
    out.clear();
    truncated = false;
    std::unique_ptr<DataChannel> ch = openRead(path, err);
    if (!ch) return false;
    char buf[16 * 1024];
    for (;;) {
        long n = ch->read(buf, sizeof(buf), err);
        if (n < 0) return false;
        if (n == 0) break;
        std::size_t room = limit - out.size();
        if (static_cast<std::size_t>(n) > room) {
            out.append(buf, room);
            truncated = true;
            // Dropping the channel unclosed aborts the rest of the transfer
            ch.reset();
            return true;
        }
        out.append(buf, static_cast<std::size_t>(n));
    }
    return ch->close(err);
}

ErrorCode errorForErrno(int e) {
    switch (e) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case EEXIST:
            return ErrorCode::AlreadyExists;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ErrorCode::DiskFull;
        case EINTR:
            return ErrorCode::Interrupted;
        default:
            return ErrorCode::IOError;
    }
}

static bool failErrno(const std::string& what, Error& err, int e = errno) {
    err.set(errorForErrno(e), what + ": " + std::strerror(e));
    return false;
}

// stdio-backed channel for one local file
class LocalFileChannel : public DataChannel {
public:
    LocalFileChannel(std::FILE* f, std::string path) : f_(f), path_(std::move(path)) {}
    ~LocalFileChannel() override {
        if (f_) std::fclose(f_);
    }

    long read(char* buf, std::size_t len, Error& err) override {
        std::size_t n = std::fread(buf, 1, len, f_);
        if (n == 0 && std::ferror(f_)) {
            failErrno("read " + path_, err);
            return -1;
        }
        return static_cast<long>(n);
    }

    bool write(const char* buf, std::size_t len, Error& err) override {
        if (std::fwrite(buf, 1, len, f_) != len) return failErrno("write " + path_, err);
        return true;
    }

    bool close(Error& err) override {
        if (!f_) return true;
        int rc = std::fclose(f_);
        f_ = nullptr;
        if (rc != 0) return failErrno("close " + path_, err);
        return true;
    }

private:
    std::FILE* f_;
    std::string path_;
};

LocalEndpoint::LocalEndpoint(const std::string& startDir) {
    std::error_code ec;
    cwd_ = startDir.empty() ? fs::current_path(ec).string() : startDir;
    if (cwd_.empty()) cwd_ = "/";
}

bool LocalEndpoint::list(const std::string& path, std::vector<DirEntry>& out, Error& err) {
    DIR* d = ::opendir(path.c_str());
    if (!d) return failErrno(path, err);
    out.clear();
    for (;;) {
        errno = 0;
        dirent* de = ::readdir(d);
        if (!de) break;
        std::string name = de->d_name;
        if (name == "." || name == "..") continue;
        DirEntry e;
        e.name = name;
        struct stat st{};
        std::string full = join(path, name);
        if (::lstat(full.c_str(), &st) != 0) {
            out.push_back(std::move(e));
            continue;
        }
        // A symlink is listed as a file and never walked into
        e.kind = S_ISDIR(st.st_mode) ? EntryKind::Directory : EntryKind::File;
        e.size_bytes = e.isDir() ? 0 : static_cast<std::uint64_t>(st.st_size);
        if (S_ISLNK(st.st_mode)) {
            struct stat target{};
            bool regular = ::stat(full.c_str(), &target) == 0 && S_ISREG(target.st_mode);
            e.size_bytes = regular ? static_cast<std::uint64_t>(target.st_size) : 0;
        }
        e.modified_at = static_cast<std::uint64_t>(st.st_mtime);
        e.permission_bits = static_cast<std::uint32_t>(st.st_mode & 07777);
        out.push_back(std::move(e));
    }
    int e = errno;
    ::closedir(d);
    if (e != 0) return failErrno("readdir " + path, err, e);
    return true;
}

bool LocalEndpoint::mkdir(const std::string& path, Error& err) {
    if (::mkdir(path.c_str(), 0755) != 0) return failErrno("mkdir " + path, err);
    return true;
}

bool LocalEndpoint::rename(const std::string& from, const std::string& to, Error& err) {
    // rename(2) silently replaces files
    struct stat st{};
    if (::lstat(to.c_str(), &st) == 0) {
        err.set(ErrorCode::AlreadyExists, to + " already exists");
        return false;
    }
    if (::rename(from.c_str(), to.c_str()) != 0) return failErrno("rename " + from, err);
    return true;
}

bool LocalEndpoint::deleteFile(const std::string& path, Error& err) {
    if (::unlink(path.c_str()) != 0) return failErrno("delete " + path, err);
    return true;
}

bool LocalEndpoint::deleteEmptyDir(const std::string& path, Error& err) {
    if (::rmdir(path.c_str()) != 0) return failErrno("rmdir " + path, err);
    return true;
}

bool LocalEndpoint::statSize(const std::string& path, std::uint64_t& out, Error& err) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return failErrno(path, err);
    out = static_cast<std::uint64_t>(st.st_size);
    return true;
}

std::unique_ptr<DataChannel> LocalEndpoint::openRead(const std::string& path, Error& err) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        err.set(ErrorCode::IOError, path + " is a directory");
        return nullptr;
    }
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        failErrno("open " + path, err);
        return nullptr;
    }
    return std::make_unique<LocalFileChannel>(f, path);
}

std::unique_ptr<DataChannel> LocalEndpoint::openWrite(const std::string& path, Error& err) {
    std::FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        failErrno("create " + path, err);
        return nullptr;
    }
    return std::make_unique<LocalFileChannel>(f, path);
}

std::string LocalEndpoint::join(const std::string& dir, const std::string& name) const {
    return (fs::path(dir) / name).string();
}

std::string LocalEndpoint::parentOf(const std::string& path) const {
    std::string s = fs::path(path).lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    fs::path parent = fs::path(s).parent_path();
    return parent.empty() ? std::string("/") : parent.string();
}

bool RemoteEndpoint::available() const {
    return connector_.isConnected();
}

Session* RemoteEndpoint::live(Error& err) const {
    Session* s = connector_.session();
    if (!s || !s->isConnected()) {
        err.set(ErrorCode::NotConnected, "not connected");
        return nullptr;
    }
    return s;
}

bool RemoteEndpoint::list(const std::string& path, std::vector<DirEntry>& out, Error& err) {
    Session* s = live(err);
    return s && s->list(path, out, err);
}

bool RemoteEndpoint::mkdir(const std::string& path, Error& err) {
    Session* s = live(err);
    return s && s->mkdir(path, err);
}

bool RemoteEndpoint::rename(const std::string& from, const std::string& to, Error& err) {
    Session* s = live(err);
    return s && s->rename(from, to, err);
}

bool RemoteEndpoint::deleteFile(const std::string& path, Error& err) {
    Session* s = live(err);
    return s && s->deleteFile(path, err);
}

bool RemoteEndpoint::deleteEmptyDir(const std::string& path, Error& err) {
    Session* s = live(err);
    return s && s->deleteEmptyDir(path, err);
}

bool RemoteEndpoint::statSize(const std::string& path, std::uint64_t& out, Error& err) {
    Session* s = live(err);
    return s && s->size(path, out, err);
}

std::unique_ptr<DataChannel> RemoteEndpoint::openRead(const std::string& path, Error& err) {
    Session* s = live(err);
    return s ? s->openDataChannel(path, Direction::Download, err) : nullptr;
}

std::unique_ptr<DataChannel> RemoteEndpoint::openWrite(const std::string& path, Error& err) {
    Session* s = live(err);
    return s ? s->openDataChannel(path, Direction::Upload, err) : nullptr;
}

void RemoteEndpoint::abortTransfer() {
    if (Session* s = connector_.session()) s->abort();
}

std::string RemoteEndpoint::join(const std::string& dir, const std::string& name) const {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string RemoteEndpoint::parentOf(const std::string& path) const {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    std::size_t slash = p.rfind('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return p.substr(0, slash);
}

} // namespace ftpdeck
