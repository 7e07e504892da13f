// Connection lifecycle: connect-then-swap, record on success, two-tier fallback.
#include "ftpdeck/Connector.hpp"
#include "ftpdeck/Log.hpp"

#include <ctime>

namespace ftpdeck {

Address ConnectionRecord::toAddress() const {
    Address a;
    a.protocol = last_protocol;
    a.host = last_host;
    a.port = last_port ? last_port : defaultPort(last_protocol);
    a.user = last_user;
    a.password = last_password;
    return a;
}

ConnectionRecord ConnectionRecord::fromAddress(const Address& addr, std::uint64_t savedAt) {
    ConnectionRecord r;
    r.last_host = addr.host;
    r.last_port = addr.port;
    r.last_user = addr.user;
    r.last_password = addr.password;
    r.last_protocol = addr.protocol;
    r.saved_at = savedAt;
    return r;
}

Address builtinDefaultAddress() {
    Address a;
    a.protocol = Protocol::Ftp;
    a.host = "192.168.0.103";
    a.port = 9999;
    a.user = "anonymous";
    return a;
}

Connector::Connector(ConnectionStore& store, SessionFactory factory)
    : store_(store), factory_(std::move(factory)), default_(builtinDefaultAddress()) {}

Connector::~Connector() {
    disconnect();
}

bool Connector::connect(const Address& addr, Error& err) {
    std::unique_ptr<Session> candidate = factory_(addr.protocol);
    if (!candidate) {
        err.set(ErrorCode::Refused, std::string("no backend for ") + protocolScheme(addr.protocol));
        return false;
    }
    candidate->setTimeout(timeoutMs_);
    LOGI("connecting to %s://%s as %s", protocolScheme(addr.protocol), addr.display().c_str(), addr.user.c_str());
    if (!candidate->connect(addr, err)) {
        LOGW("connect to %s failed: %s", addr.display().c_str(), err.describe().c_str());
        return false;
    }

    if (session_) session_->disconnect();
    session_ = std::move(candidate);
    current_ = addr;

    Error saveErr;
    if (!store_.save(ConnectionRecord::fromAddress(addr, static_cast<std::uint64_t>(std::time(nullptr))), saveErr)) {
        // The session is fine; only the memory of it is not
        LOGW("could not save last connection: %s", saveErr.describe().c_str());
    }
    return true;
}

bool Connector::ensureConnected(Error& err) {
    if (isConnected()) return true;

    std::optional<ConnectionRecord> rec = store_.load();
    bool storedTried = false;
    Address stored;
    if (rec && !rec->last_host.empty()) {
        stored = rec->toAddress();
        storedTried = true;
        if (connect(stored, err)) return true;
    }
    if (storedTried && stored == default_ && stored.protocol == default_.protocol) {
        // Same server as the default tier; one attempt per server is enough.
        return false;
    }
    return connect(default_, err);
}

void Connector::disconnect() {
    if (session_) {
        session_->disconnect();
        LOGI("disconnected from %s", current_.display().c_str());
    }
}

bool Connector::isConnected() const {
    return session_ && session_->isConnected();
}

Address Connector::preferredAddress() {
    std::optional<ConnectionRecord> rec = store_.load();
    if (rec && !rec->last_host.empty()) return rec->toAddress();
    return default_;
}

} // namespace ftpdeck
