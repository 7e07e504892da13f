// Mock implementation: a path -> node map standing in for a remote filesystem.
#include "ftpdeck/MockSession.hpp"
#include "ftpdeck/Log.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <thread>

namespace ftpdeck {

static std::uint64_t nowSeconds() {
    return static_cast<std::uint64_t>(std::time(nullptr));
}

MockRemote::MockRemote() {
    nodes_["/"] = Node{true, {}, nowSeconds()};
}

std::shared_ptr<MockRemote> MockRemote::demo() {
    auto r = std::make_shared<MockRemote>();
    r->addDir("/pub");
    r->addFile("/pub/readme.txt", "Welcome to the ftpdeck demo server.\nNothing here leaves this process.\n");
    r->addDir("/pub/photos");
    r->addFile("/pub/photos/harbour.jpg", std::string(180 * 1024, '\x5a'));
    r->addFile("/pub/photos/ridge.jpg", std::string(96 * 1024, '\x3c'));
    r->addFile("/pub/notes.md", "# notes\n\n- buy milk\n");
    r->addDir("/upload");
    return r;
}

std::string MockRemote::normalize(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        std::size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string seg = path.substr(i, j - i);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        i = j + 1;
    }
    std::string out;
    for (const auto& p : parts) out += "/" + p;
    return out.empty() ? "/" : out;
}

std::string MockRemote::parentOf(const std::string& path) {
    std::size_t slash = path.rfind('/');
    if (slash == 0 || slash == std::string::npos) return "/";
    return path.substr(0, slash);
}

void MockRemote::addDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string p = normalize(path);
    // create missing parents too
    for (std::string cur = p; cur != "/"; cur = parentOf(cur)) {
        if (!nodes_.count(cur)) nodes_[cur] = Node{true, {}, nowSeconds()};
    }
}

void MockRemote::addFile(const std::string& path, const std::string& contents) {
    std::string p = normalize(path);
    addDir(parentOf(p));
    std::lock_guard<std::mutex> lk(mtx_);
    nodes_[p] = Node{false, contents, nowSeconds()};
}

bool MockRemote::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalize(path)) > 0;
}

bool MockRemote::isDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.dir;
}

std::string MockRemote::contents(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it == nodes_.end() ? std::string() : it->second.data;
}

std::vector<std::string> MockRemote::paths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : nodes_) out.push_back(kv.first);
    return out;
}

void MockRemote::dropConnections() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++epoch_;
}

int MockRemote::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

int MockRemote::abortCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return aborts_;
}

class MockDataChannel : public DataChannel {
public:
    MockDataChannel(MockSession* session, std::string path, Direction dir, std::string data)
        : session_(session), path_(std::move(path)), dir_(dir), data_(std::move(data)) {}

    ~MockDataChannel() override {
        if (session_ && session_->active_ == this) session_->active_ = nullptr;
    }

    long read(char* buf, std::size_t len, Error& err) override {
        if (!beforeChunk(err)) return -1;
        std::size_t n = std::min(len, data_.size() - offset_);
        std::copy(data_.data() + offset_, data_.data() + offset_ + n, buf);
        offset_ += n;
        if (!account(n, err)) return -1;
        return static_cast<long>(n);
    }

    bool write(const char* buf, std::size_t len, Error& err) override {
        if (!beforeChunk(err)) return false;
        data_.append(buf, len);
        offset_ += len;
        return account(len, err);
    }

    bool close(Error& err) override {
        if (closed_) return true;
        closed_ = true;
        if (!session_) {
            err.set(ErrorCode::Interrupted, "transfer aborted");
            return false;
        }
        if (session_->active_ == this) session_->active_ = nullptr;
        auto& r = *session_->remote_;
        std::lock_guard<std::mutex> lk(r.mtx_);
        if (!session_->alive(err)) return false;
        if (dir_ == Direction::Upload) r.nodes_[path_] = MockRemote::Node{false, data_, nowSeconds()};
        return true;
    }

    void abortTransfer() {
        closed_ = true;
        session_ = nullptr;
    }

private:
    bool beforeChunk(Error& err) {
        if (closed_ || !session_) {
            err.set(ErrorCode::Interrupted, "transfer aborted");
            return false;
        }
        auto remote = session_->remote_;
        if (remote->chunk_delay_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(remote->chunk_delay_ms));
        if (remote->on_chunk) remote->on_chunk(path_, offset_);
        std::lock_guard<std::mutex> lk(remote->mtx_);
        return session_->alive(err);
    }

    bool account(std::size_t n, Error& err) {
        auto& r = *session_->remote_;
        std::lock_guard<std::mutex> lk(r.mtx_);
        r.bytesMoved_ += static_cast<long long>(n);
        if (r.drop_after_bytes >= 0 && r.bytesMoved_ >= r.drop_after_bytes) {
            ++r.epoch_;
            return session_->alive(err);
        }
        return true;
    }

    MockSession* session_;
    std::string path_;
    Direction dir_;
    std::string data_;
    std::size_t offset_ = 0;
    bool closed_ = false;
};

MockSession::MockSession(std::shared_ptr<MockRemote> remote) : remote_(std::move(remote)) {}

MockSession::~MockSession() {
    if (active_) active_->abortTransfer();
}

bool MockSession::alive(Error& err) {
    if (!connected_) {
        err.set(ErrorCode::NotConnected, "not connected");
        return false;
    }
    if (epoch_ != remote_->epoch_) {
        connected_ = false;
        err.set(ErrorCode::ConnectionLost, "mock server dropped the connection");
        return false;
    }
    return true;
}

bool MockSession::connect(const Address& addr, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (connected_) {
        err.set(ErrorCode::Protocol, "already connected");
        return false;
    }
    if (remote_->unreachable_hosts.count(addr.host)) {
        err.set(ErrorCode::Unreachable, addr.display() + ": no route to host");
        return false;
    }
    if (!remote_->required_password.empty() && addr.password != remote_->required_password) {
        err.set(ErrorCode::AuthRejected, "530 Login incorrect.");
        return false;
    }
    connected_ = true;
    epoch_ = remote_->epoch_;
    ++remote_->connects_;
    LOGI("mock: connected to %s", addr.display().c_str());
    return true;
}

void MockSession::disconnect() {
    if (active_) {
        active_->abortTransfer();
        active_ = nullptr;
    }
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    connected_ = false;
}

bool MockSession::isConnected() const {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    return connected_ && epoch_ == remote_->epoch_;
}

bool MockSession::currentDirectory(std::string& out, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    out = "/";
    return true;
}

bool MockSession::list(const std::string& path, std::vector<DirEntry>& out, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    const std::string p = MockRemote::normalize(path);
    auto fail = remote_->list_failures.find(p);
    if (fail != remote_->list_failures.end()) {
        err.set(fail->second, "LIST " + p);
        return false;
    }
    auto it = remote_->nodes_.find(p);
    if (it != remote_->nodes_.end() && !it->second.dir && remote_->list_file_as_entry) {
        // Like many FTP servers: LIST of a file answers with that file's own line
        out.clear();
        DirEntry e;
        e.name = p.substr(p.find_last_of('/') + 1);
        e.size_bytes = it->second.data.size();
        e.modified_at = it->second.mtime;
        e.permission_bits = 0644u;
        out.push_back(std::move(e));
        return true;
    }
    if (it == remote_->nodes_.end() || !it->second.dir) {
        err.set(ErrorCode::NotFound, p + ": no such directory");
        return false;
    }
    out.clear();
    const std::string prefix = p == "/" ? "/" : p + "/";
    for (auto c = remote_->nodes_.lower_bound(prefix); c != remote_->nodes_.end(); ++c) {
        const std::string& key = c->first;
        if (key.compare(0, prefix.size(), prefix) != 0) break;
        if (key.size() == prefix.size() || key.find('/', prefix.size()) != std::string::npos) continue;
        DirEntry e;
        e.name = key.substr(prefix.size());
        e.kind = c->second.dir ? EntryKind::Directory : EntryKind::File;
        e.size_bytes = c->second.dir ? 0 : c->second.data.size();
        e.modified_at = c->second.mtime;
        e.permission_bits = c->second.dir ? 0755u : 0644u;
        out.push_back(std::move(e));
    }
    return true;
}

bool MockSession::size(const std::string& path, std::uint64_t& out, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    auto it = remote_->nodes_.find(MockRemote::normalize(path));
    if (it == remote_->nodes_.end() || it->second.dir) {
        err.set(ErrorCode::NotFound, path + ": not a plain file");
        return false;
    }
    out = it->second.data.size();
    return true;
}

bool MockSession::mkdir(const std::string& path, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    const std::string p = MockRemote::normalize(path);
    if (remote_->nodes_.count(p)) {
        err.set(ErrorCode::AlreadyExists, p + ": file exists");
        return false;
    }
    auto parent = remote_->nodes_.find(MockRemote::parentOf(p));
    if (parent == remote_->nodes_.end() || !parent->second.dir) {
        err.set(ErrorCode::NotFound, p + ": parent directory missing");
        return false;
    }
    remote_->nodes_[p] = MockRemote::Node{true, {}, nowSeconds()};
    return true;
}

bool MockSession::rename(const std::string& from, const std::string& to, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    const std::string src = MockRemote::normalize(from);
    const std::string dst = MockRemote::normalize(to);
    auto& nodes = remote_->nodes_;
    if (!nodes.count(src) || src == "/") {
        err.set(ErrorCode::NotFound, src);
        return false;
    }
    if (nodes.count(dst)) {
        err.set(ErrorCode::AlreadyExists, dst);
        return false;
    }
    if (dst.compare(0, src.size() + 1, src + "/") == 0) {
        err.set(ErrorCode::IOError, "cannot move a directory into itself");
        return false;
    }
    std::map<std::string, MockRemote::Node> moved;
    for (auto it = nodes.begin(); it != nodes.end();) {
        if (it->first == src || it->first.compare(0, src.size() + 1, src + "/") == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = nodes.erase(it);
        } else {
            ++it;
        }
    }
    nodes.insert(moved.begin(), moved.end());
    return true;
}

bool MockSession::deleteFile(const std::string& path, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    const std::string p = MockRemote::normalize(path);
    auto fail = remote_->delete_failures.find(p);
    if (fail != remote_->delete_failures.end()) {
        err.set(fail->second, "DELE " + p);
        return false;
    }
    auto it = remote_->nodes_.find(p);
    if (it == remote_->nodes_.end()) {
        err.set(ErrorCode::NotFound, p);
        return false;
    }
    if (it->second.dir) {
        err.set(ErrorCode::IOError, p + ": is a directory");
        return false;
    }
    remote_->nodes_.erase(it);
    return true;
}

bool MockSession::deleteEmptyDir(const std::string& path, Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return false;
    const std::string p = MockRemote::normalize(path);
    auto fail = remote_->delete_failures.find(p);
    if (fail != remote_->delete_failures.end()) {
        err.set(fail->second, "RMD " + p);
        return false;
    }
    auto it = remote_->nodes_.find(p);
    if (it == remote_->nodes_.end() || !it->second.dir || p == "/") {
        err.set(ErrorCode::NotFound, p + ": no such directory");
        return false;
    }
    auto next = std::next(it);
    if (next != remote_->nodes_.end() && next->first.compare(0, p.size() + 1, p + "/") == 0) {
        err.set(ErrorCode::IOError, p + ": directory not empty");
        return false;
    }
    remote_->nodes_.erase(it);
    return true;
}

std::unique_ptr<DataChannel> MockSession::openDataChannel(const std::string& path,
                                                          Direction dir,
                                                          Error& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    if (!alive(err)) return nullptr;
    if (active_) {
        err.set(ErrorCode::Protocol, "a transfer is in progress");
        return nullptr;
    }
    const std::string p = MockRemote::normalize(path);
    auto fail = remote_->open_failures.find(p);
    if (fail != remote_->open_failures.end()) {
        err.set(fail->second, p);
        return nullptr;
    }
    std::string data;
    auto it = remote_->nodes_.find(p);
    if (dir == Direction::Download) {
        if (it == remote_->nodes_.end() || it->second.dir) {
            err.set(ErrorCode::NotFound, p + ": no such file");
            return nullptr;
        }
        data = it->second.data;
    } else {
        auto parent = remote_->nodes_.find(MockRemote::parentOf(p));
        if (parent == remote_->nodes_.end() || !parent->second.dir) {
            err.set(ErrorCode::NotFound, p + ": parent directory missing");
            return nullptr;
        }
        if (it != remote_->nodes_.end() && it->second.dir) {
            err.set(ErrorCode::IOError, p + ": is a directory");
            return nullptr;
        }
    }
    auto ch = std::make_unique<MockDataChannel>(this, p, dir, std::move(data));
    active_ = ch.get();
    return ch;
}

void MockSession::abort() {
    if (!active_) return;
    active_->abortTransfer();
    active_ = nullptr;
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    ++remote_->aborts_;
}

} // namespace ftpdeck
