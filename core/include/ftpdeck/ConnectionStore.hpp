// Last known-good server login. Pure data; persistence is up to the implementation.
#pragma once
#include "Types.hpp"
#include <optional>

namespace ftpdeck {

struct ConnectionRecord {
    std::string   last_host;
    std::uint16_t last_port = 0;
    std::string   last_user;
    std::string   last_password;
    Protocol      last_protocol = Protocol::Ftp;
    std::uint64_t saved_at = 0;  // epoch seconds

    Address toAddress() const;
    static ConnectionRecord fromAddress(const Address& addr, std::uint64_t savedAt);
};

class ConnectionStore {
public:
    virtual ~ConnectionStore() = default;

    // nullopt when nothing was ever saved (or the stored record is unusable)
    virtual std::optional<ConnectionRecord> load() = 0;

    // Called only after a verified, authenticated connect.
    virtual bool save(const ConnectionRecord& rec, Error& err) = 0;
};

// Keeps the record in memory only.
class MemoryConnectionStore : public ConnectionStore {
public:
    std::optional<ConnectionRecord> load() override { return record_; }
    bool save(const ConnectionRecord& rec, Error& err) override {
        (void)err;
        record_ = rec;
        ++saves_;
        return true;
    }
    int saveCount() const { return saves_; }

private:
    std::optional<ConnectionRecord> record_;
    int saves_ = 0;
};

// Compiled-in fallback tier: ftp://anonymous@192.168.0.103:9999
Address builtinDefaultAddress();

} // namespace ftpdeck
