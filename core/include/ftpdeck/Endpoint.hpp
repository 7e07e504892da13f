// Uniform directory/file contract over the local filesystem and the remote session.
// Both sides report the same ErrorCode taxonomy so the planner, queue and
// controller never need to know which one they are talking to.
#pragma once
#include "Session.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ftpdeck {

class Connector;

enum class Side { Local, Remote };

const char* sideName(Side s);

class Endpoint {
public:
    virtual ~Endpoint() = default;

    virtual Side side() const = 0;

    // Remote is available only while its session is connected.
    virtual bool available() const = 0;

    const std::string& cwd() const { return cwd_; }
    void setCwd(const std::string& dir) { cwd_ = dir; }

    virtual bool list(const std::string& path, std::vector<DirEntry>& out, Error& err) = 0;
    virtual bool mkdir(const std::string& path, Error& err) = 0;
    virtual bool rename(const std::string& from, const std::string& to, Error& err) = 0;
    virtual bool deleteFile(const std::string& path, Error& err) = 0;
    virtual bool deleteEmptyDir(const std::string& path, Error& err) = 0;
    virtual bool statSize(const std::string& path, std::uint64_t& out, Error& err) = 0;

    // Streamed access; the caller closes the channel to commit.
    virtual std::unique_ptr<DataChannel> openRead(const std::string& path, Error& err) = 0;
    virtual std::unique_ptr<DataChannel> openWrite(const std::string& path, Error& err) = 0;

    // Release whatever openRead/openWrite currently holds. No-op when idle.
    virtual void abortTransfer() = 0;

    virtual std::string join(const std::string& dir, const std::string& name) const = 0;
    virtual std::string parentOf(const std::string& path) const = 0;

    // At most limit bytes of a file, for the viewer. truncated is set when more was available.
    bool readText(const std::string& path, std::size_t limit, std::string& out, bool& truncated, Error& err);

protected:
    std::string cwd_;
};

class LocalEndpoint : public Endpoint {
public:
    explicit LocalEndpoint(const std::string& startDir = std::string());

    Side side() const override { return Side::Local; }
    bool available() const override { return true; }

    bool list(const std::string& path, std::vector<DirEntry>& out, Error& err) override;
    bool mkdir(const std::string& path, Error& err) override;
    bool rename(const std::string& from, const std::string& to, Error& err) override;
    bool deleteFile(const std::string& path, Error& err) override;
    bool deleteEmptyDir(const std::string& path, Error& err) override;
    bool statSize(const std::string& path, std::uint64_t& out, Error& err) override;

    std::unique_ptr<DataChannel> openRead(const std::string& path, Error& err) override;
    std::unique_ptr<DataChannel> openWrite(const std::string& path, Error& err) override;
    void abortTransfer() override {}

    std::string join(const std::string& dir, const std::string& name) const override;
    std::string parentOf(const std::string& path) const override;
};

// errno -> taxonomy, shared with the local channel
ErrorCode errorForErrno(int e);

class RemoteEndpoint : public Endpoint {
public:
    explicit RemoteEndpoint(Connector& connector) : connector_(connector) {}

    Side side() const override { return Side::Remote; }
    bool available() const override;

    bool list(const std::string& path, std::vector<DirEntry>& out, Error& err) override;
    bool mkdir(const std::string& path, Error& err) override;
    bool rename(const std::string& from, const std::string& to, Error& err) override;
    bool deleteFile(const std::string& path, Error& err) override;
    bool deleteEmptyDir(const std::string& path, Error& err) override;
    bool statSize(const std::string& path, std::uint64_t& out, Error& err) override;

    std::unique_ptr<DataChannel> openRead(const std::string& path, Error& err) override;
    std::unique_ptr<DataChannel> openWrite(const std::string& path, Error& err) override;
    void abortTransfer() override;

    std::string join(const std::string& dir, const std::string& name) const override;
    std::string parentOf(const std::string& path) const override;

private:
    // Live session or nullptr with err = NotConnected. Never reconnects.
    Session* live(Error& err) const;

    Connector& connector_;
};

} // namespace ftpdeck
