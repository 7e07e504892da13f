// One-shot uploader behind ftpdeck-send: plan every path into one batch,
// run it through the transfer queue and draw a console progress bar.
#pragma once
#include "ftpdeck/Connector.hpp"
#include "ftpdeck/TransferQueue.hpp"
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

enum QuickSendExit { SendOk = 0, SendUsage = 1, SendConnectFailed = 2, SendPartial = 3 };

class QuickSend {
public:
    QuickSend(ftpdeck::Connector& connector, ftpdeck::Endpoint& local, ftpdeck::Endpoint& remote,
              ftpdeck::QueueOptions opt = ftpdeck::QueueOptions(), std::FILE* out = stdout);

    // address empty: stored last-good address, then the default
    int run(const std::vector<std::string>& paths, const std::optional<ftpdeck::Address>& address, bool wait);

    // Upload plan for local paths into remoteDir. Paths that do not exist are
    // returned in missing and left out.
    static ftpdeck::Batch plan(ftpdeck::Endpoint& local, ftpdeck::Endpoint& remote,
                               const std::vector<std::string>& paths, const std::string& remoteDir,
                               std::uint64_t token, std::vector<std::string>& missing);

private:
    bool prepareRemoteDir(const std::string& dir, ftpdeck::Error& err);
    void drawProgress(const ftpdeck::ProgressSnapshot& s);
    void waitForEnter(bool wait);
    std::string paint(const char* code, const std::string& text) const;

    ftpdeck::Connector& connector_;
    ftpdeck::Endpoint& local_;
    ftpdeck::Endpoint& remote_;
    ftpdeck::QueueOptions opt_;
    std::FILE* out_;
    bool ansi_ = false;
};
