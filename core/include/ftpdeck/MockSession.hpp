// Simulated remote server for trying the UI without a network (mock://) and for tests.
#pragma once
#include "Session.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace ftpdeck {

// In-memory filesystem shared by every MockSession created against it, so a
// test can inspect what a transfer produced and inject faults.
class MockRemote {
public:
    MockRemote();

    // /pub with a few files and an empty /upload
    static std::shared_ptr<MockRemote> demo();

    void addDir(const std::string& path);
    void addFile(const std::string& path, const std::string& contents);
    bool exists(const std::string& path) const;
    bool isDir(const std::string& path) const;
    std::string contents(const std::string& path) const;
    std::vector<std::string> paths() const;

    // Any live session fails its next call with ConnectionLost.
    void dropConnections();

    // Fault injection; all optional.
    std::set<std::string> unreachable_hosts;
    std::string required_password;  // empty accepts anything
    std::map<std::string, ErrorCode> list_failures;
    std::map<std::string, ErrorCode> open_failures;
    std::map<std::string, ErrorCode> delete_failures;
    bool list_file_as_entry = false;  // LIST of a file succeeds with one entry
    long long drop_after_bytes = -1;  // link dies once this many data bytes moved
    int chunk_delay_ms = 0;
    std::function<void(const std::string& path, std::uint64_t offset)> on_chunk;

    int connectCount() const;
    int abortCount() const;

private:
    friend class MockSession;
    friend class MockDataChannel;

    struct Node {
        bool dir = false;
        std::string data;
        std::uint64_t mtime = 0;
    };

    static std::string normalize(const std::string& path);
    static std::string parentOf(const std::string& path);

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    unsigned epoch_ = 0;
    long long bytesMoved_ = 0;
    int connects_ = 0;
    int aborts_ = 0;
};

class MockDataChannel;

class MockSession : public Session {
public:
    explicit MockSession(std::shared_ptr<MockRemote> remote = MockRemote::demo());
    ~MockSession() override;

    bool connect(const Address& addr, Error& err) override;
    void disconnect() override;
    bool isConnected() const override;
    void setTimeout(int ms) override { (void)ms; }

    bool currentDirectory(std::string& out, Error& err) override;
    bool list(const std::string& path, std::vector<DirEntry>& out, Error& err) override;
    bool size(const std::string& path, std::uint64_t& out, Error& err) override;

    bool mkdir(const std::string& path, Error& err) override;
    bool rename(const std::string& from, const std::string& to, Error& err) override;
    bool deleteFile(const std::string& path, Error& err) override;
    bool deleteEmptyDir(const std::string& path, Error& err) override;

    std::unique_ptr<DataChannel> openDataChannel(const std::string& path,
                                                 Direction dir,
                                                 Error& err) override;
    void abort() override;

    const std::shared_ptr<MockRemote>& remote() const { return remote_; }

private:
    friend class MockDataChannel;

    // Caller holds remote_->mtx_
    bool alive(Error& err);

    std::shared_ptr<MockRemote> remote_;
    bool connected_ = false;
    unsigned epoch_ = 0;
    MockDataChannel* active_ = nullptr;
};

} // namespace ftpdeck
