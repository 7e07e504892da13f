#include "QuickSend.hpp"
#include "Renderer.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/TransferPlanner.hpp"

#include <filesystem>
#include <iostream>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace ftpdeck;

static const char* kGreen = "\033[92m";
static const char* kRed = "\033[91m";
static const char* kYellow = "\033[93m";
static const char* kCyan = "\033[96m";
static const char* kDim = "\033[2m";

QuickSend::QuickSend(Connector& connector, Endpoint& local, Endpoint& remote, QueueOptions opt, std::FILE* out)
    : connector_(connector), local_(local), remote_(remote), opt_(opt), out_(out) {
    ansi_ = ::isatty(::fileno(out_)) == 1;
}

std::string QuickSend::paint(const char* code, const std::string& text) const {
    return ansi_ ? std::string(code) + text + "\033[0m" : text;
}

Batch QuickSend::plan(Endpoint& local, Endpoint& remote, const std::vector<std::string>& paths,
                      const std::string& remoteDir, std::uint64_t token, std::vector<std::string>& missing) {
    Batch all;
    all.token = token;
    all.kind = JobKind::Upload;
    all.origin = Side::Local;

    for (const std::string& raw : paths) {
        std::error_code ec;
        fs::path p = fs::absolute(raw, ec).lexically_normal();
        if (!ec && !p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
        fs::file_status st = fs::status(p, ec);
        if (ec || !fs::exists(st) || p.filename().empty()) {
            missing.push_back(raw);
            continue;
        }

        DirEntry item;
        item.name = p.filename().string();
        if (fs::is_directory(st)) {
            item.kind = EntryKind::Directory;
        } else {
            item.size_bytes = static_cast<std::uint64_t>(fs::file_size(p, ec));
            if (ec) item.size_bytes = 0;
        }

        Batch one = TransferPlanner::planCopy(JobKind::Upload, local, p.parent_path().string(), {item}, remote,
                                              remoteDir, token);
        for (TransferJob& j : one.jobs) {
            j.id = all.jobs.size() + 1;
            all.jobs.push_back(std::move(j));
        }
        all.bytes_total += one.bytes_total;
        all.plan_failures.insert(all.plan_failures.end(), one.plan_failures.begin(), one.plan_failures.end());
    }
    return all;
}

bool QuickSend::prepareRemoteDir(const std::string& dir, Error& err) {
    std::vector<DirEntry> listing;
    if (remote_.list(dir, listing, err)) return true;
    if (err.code != ErrorCode::NotFound) return false;

    // Create the missing components top-down
    std::string built;
    std::size_t pos = 0;
    while (pos <= dir.size()) {
        std::size_t next = dir.find('/', pos);
        if (next == std::string::npos) next = dir.size();
        const std::string part = dir.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty()) continue;
        built += "/" + part;
        Error mkErr;
        if (!remote_.mkdir(built, mkErr) && mkErr.code != ErrorCode::AlreadyExists) {
            // Might exist without the server saying so
            std::vector<DirEntry> again;
            if (!remote_.list(built, again, err)) return false;
        }
    }
    err.clear();
    return true;
}

void QuickSend::drawProgress(const ProgressSnapshot& s) {
    const double frac = s.bytes_total ? static_cast<double>(s.bytes_done) / static_cast<double>(s.bytes_total) : 1.0;
    const int width = 35;
    const int filled = static_cast<int>(width * frac);
    std::string bar;
    for (int i = 0; i < width; ++i) bar += i < filled ? "█" : "░";

    std::string name = s.current_name;
    name = fitColumns(name.size() > 22 ? fitColumns(name, 20) + ".." : name, 22);
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%6.1f%%", frac * 100.0);
    const std::string sizes = formatSize(static_cast<double>(s.bytes_done), true) + "/" +
                              formatSize(static_cast<double>(s.bytes_total), true);
    std::fprintf(out_, "\r  %s %s %s %s", name.c_str(), paint(kCyan, "[" + bar + "]").c_str(), pct,
                 paint(kDim, sizes).c_str());
    std::fflush(out_);
}

void QuickSend::waitForEnter(bool wait) {
    if (!wait) return;
    std::fprintf(out_, "\n%s\n", paint(kDim, "Press Enter to close...").c_str());
    std::fflush(out_);
    std::string line;
    std::getline(std::cin, line);
}

int QuickSend::run(const std::vector<std::string>& paths, const std::optional<Address>& address, bool wait) {
    if (paths.empty()) {
        std::fprintf(out_, "%s\n", paint(kYellow, "Usage: ftpdeck-send [--address URL] <file1> [folder1] ...").c_str());
        return SendUsage;
    }

    // Validate and count before touching the network
    std::size_t files = 0;
    std::uint64_t bytes = 0;
    std::size_t valid = 0;
    for (const std::string& raw : paths) {
        std::error_code ec;
        const fs::path p(raw);
        if (!fs::exists(p, ec)) {
            std::fprintf(out_, "%s\n", paint(kRed, "✗ Not found: " + raw).c_str());
            continue;
        }
        ++valid;
        if (!fs::is_directory(p, ec)) {
            ++files;
            bytes += static_cast<std::uint64_t>(fs::file_size(p, ec));
            continue;
        }
        // Counted the way the local listing classifies entries: only real directories are walked
        for (fs::recursive_directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code entryEc;
            if (it->is_directory(entryEc) && !it->is_symlink(entryEc)) continue;
            ++files;
            if (it->is_regular_file(entryEc)) bytes += static_cast<std::uint64_t>(it->file_size(entryEc));
        }
    }
    if (valid == 0) {
        std::fprintf(out_, "%s\n", paint(kRed, "No valid files/folders to send").c_str());
        return SendUsage;
    }
    std::fprintf(out_, "%s\n\n",
                 paint(kDim, "Total: " + std::to_string(files) + " file(s), " +
                                 formatSize(static_cast<double>(bytes), true)).c_str());

    const Address target = address ? *address : connector_.preferredAddress();
    std::fprintf(out_, "%s\n", paint(kYellow, "Connecting to " + target.display() + "...").c_str());
    std::fflush(out_);
    Error err;
    const bool up = address ? connector_.connect(*address, err) : connector_.ensureConnected(err);
    if (!up) {
        std::fprintf(out_, "%s\n", paint(kRed, "Connection failed: " + err.describe()).c_str());
        waitForEnter(wait);
        return SendConnectFailed;
    }
    std::fprintf(out_, "%s\n", paint(kGreen, "✓ Connected to " + connector_.address().display()).c_str());

    std::string dir = connector_.address().path;
    if (dir.empty()) {
        Session* s = connector_.session();
        if (!s || !s->currentDirectory(dir, err) || dir.empty()) dir = "/";
    } else if (!prepareRemoteDir(dir, err)) {
        std::fprintf(out_, "%s\n", paint(kRed, "Cannot use " + dir + ": " + err.describe()).c_str());
        connector_.disconnect();
        waitForEnter(wait);
        return isConnectionFatal(err.code) ? SendConnectFailed : SendPartial;
    }
    remote_.setCwd(dir);

    std::vector<std::string> missing;
    Batch batch = plan(local_, remote_, paths, dir, 1, missing);
    const std::size_t planned = batch.jobs.size();

    std::optional<BatchResult> result;
    {
        TransferQueue queue(local_, remote_, opt_);
        queue.enqueue(std::move(batch));
        for (;;) {
            const bool idle = queue.waitIdle(100);
            std::vector<ProgressSnapshot> snaps = queue.pollProgress();
            if (!snaps.empty()) drawProgress(snaps.back());
            if (idle) break;
        }
        result = queue.takeResult();
    }
    std::fprintf(out_, "\n\n");
    connector_.disconnect();

    if (!result) {
        // waitIdle returned with nothing to report; the batch never ran
        std::fprintf(out_, "%s\n", paint(kRed, "Transfer did not run").c_str());
        waitForEnter(wait);
        return SendPartial;
    }

    std::size_t sent = 0;
    for (const TransferJob& j : result->batch.jobs) {
        if (j.kind == JobKind::Upload && j.state == JobState::Done) ++sent;
        if (j.state == JobState::Failed)
            std::fprintf(out_, "%s\n", paint(kRed, "✗ " + j.source.path + ": " + j.error.describe()).c_str());
    }
    for (const PlanFailure& f : result->batch.plan_failures)
        std::fprintf(out_, "%s\n", paint(kRed, "✗ " + f.path + ": " + f.error.describe()).c_str());
    LOGI("quick-send: %zu jobs, %s", planned, result->summary().c_str());

    int code = SendOk;
    switch (result->outcome) {
        case BatchOutcome::Completed:
            std::fprintf(out_, "%s\n", paint(kGreen, "✓ Sent " + std::to_string(sent) +
                                                          " file(s) successfully!").c_str());
            break;
        case BatchOutcome::ConnectionLost:
            std::fprintf(out_, "%s\n", paint(kRed, "Connection lost: " + result->connection_error.describe() +
                                                        " (" + std::to_string(sent) + " file(s) sent)").c_str());
            code = SendConnectFailed;
            break;
        case BatchOutcome::Partial:
        case BatchOutcome::Cancelled:
            std::fprintf(out_, "%s\n", paint(kYellow, "Sent " + std::to_string(sent) + " file(s), " +
                                                           std::to_string(result->failed) + " failed").c_str());
            code = SendPartial;
            break;
    }
    waitForEnter(wait);
    return code;
}
