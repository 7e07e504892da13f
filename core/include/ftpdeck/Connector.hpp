// Owns the live Session and the reconnect policy around it.
#pragma once
#include "ConnectionStore.hpp"
#include "Session.hpp"
#include <functional>
#include <memory>

namespace ftpdeck {

using SessionFactory = std::function<std::unique_ptr<Session>(Protocol)>;

class Connector {
public:
    explicit Connector(ConnectionStore& store, SessionFactory factory = makeSession);
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    // Connects a fresh session. Only on success is the live session replaced
    // and the record saved; a failure leaves both exactly as they were.
    bool connect(const Address& addr, Error& err);

    // No-op when connected. Otherwise the stored last-good address, then the
    // default address, each tried once. err holds the last failure.
    bool ensureConnected(Error& err);

    void disconnect();
    bool isConnected() const;

    // nullptr when never connected
    Session* session() const { return session_.get(); }

    // Address of the live (or most recently live) session
    const Address& address() const { return current_; }

    void setDefaultAddress(const Address& addr) { default_ = addr; }
    const Address& defaultAddress() const { return default_; }

    // Address the UI should offer: stored record if any, else the default.
    Address preferredAddress();

    void setTimeout(int ms) { timeoutMs_ = ms; }

private:
    ConnectionStore& store_;
    SessionFactory factory_;
    std::unique_ptr<Session> session_;
    Address current_;
    Address default_;
    int timeoutMs_ = 10000;
};

} // namespace ftpdeck
