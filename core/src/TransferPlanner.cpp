// Worklist traversals: pre-order for copies, post-order for deletes.
#include "ftpdeck/TransferPlanner.hpp"
#include "ftpdeck/Log.hpp"

#include <algorithm>

namespace ftpdeck {

const char* jobKindName(JobKind k) {
    switch (k) {
        case JobKind::Upload:   return "upload";
        case JobKind::Download: return "download";
        case JobKind::Delete:   return "delete";
        case JobKind::Mkdir:    return "mkdir";
        case JobKind::Rename:   return "rename";
    }
    return "?";
}

const char* jobStateName(JobState s) {
    switch (s) {
        case JobState::Pending:   return "pending";
        case JobState::Active:    return "active";
        case JobState::Done:      return "done";
        case JobState::Failed:    return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "?";
}

std::string TransferJob::displayName() const {
    const std::string& p = kind == JobKind::Delete || kind == JobKind::Mkdir ? dest.path : source.path;
    std::string trimmed = p;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    std::size_t slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

namespace {

// Appends jobs with ids and token filled in.
struct BatchBuilder {
    Batch& batch;

    void add(JobKind kind, Location src, Location dst, bool dir, std::uint64_t size) {
        TransferJob j;
        j.id = batch.jobs.size() + 1;
        j.batch_token = batch.token;
        j.kind = kind;
        j.source = std::move(src);
        j.dest = std::move(dst);
        j.directory = dir;
        j.size_bytes = size;
        batch.bytes_total += size;
        batch.jobs.push_back(std::move(j));
    }

    void fail(const std::string& path, const Error& err) {
        LOGW("plan: skipping %s: %s", path.c_str(), err.describe().c_str());
        batch.plan_failures.push_back({path, err});
    }
};

Batch newBatch(JobKind kind, Side origin, std::uint64_t token) {
    Batch b;
    b.token = token;
    b.kind = kind;
    b.origin = origin;
    return b;
}

} // namespace

Batch TransferPlanner::planCopy(JobKind kind,
                                Endpoint& src, const std::string& srcDir,
                                const std::vector<DirEntry>& items,
                                Endpoint& dst, const std::string& dstDir,
                                std::uint64_t token) {
    Batch batch = newBatch(kind, src.side(), token);
    BatchBuilder out{batch};
    const Side s = src.side();
    const Side d = dst.side();

    for (const DirEntry& item : items) {
        const std::string from = src.join(srcDir, item.name);
        const std::string to = dst.join(dstDir, item.name);
        if (!item.isDir()) {
            out.add(kind, {s, from}, {d, to}, false, item.size_bytes);
            continue;
        }

        std::vector<std::pair<std::string, std::string>> work{{from, to}};
        while (!work.empty()) {
            auto [dirFrom, dirTo] = work.back();
            work.pop_back();

            std::vector<DirEntry> children;
            Error err;
            if (!src.list(dirFrom, children, err)) {
                out.fail(dirFrom, err);
                continue;
            }
            sortEntries(children);

            out.add(JobKind::Mkdir, {s, dirFrom}, {d, dirTo}, true, 0);
            std::vector<std::pair<std::string, std::string>> subdirs;
            for (const DirEntry& c : children) {
                const std::string cf = src.join(dirFrom, c.name);
                const std::string ct = dst.join(dirTo, c.name);
                if (c.isDir()) {
                    subdirs.emplace_back(cf, ct);
                } else {
                    out.add(kind, {s, cf}, {d, ct}, false, c.size_bytes);
                }
            }
            // First subdirectory is expanded next
            work.insert(work.end(), subdirs.rbegin(), subdirs.rend());
        }
    }
    LOGI("plan %s #%llu: %zu jobs, %llu bytes", jobKindName(kind), (unsigned long long)token,
         batch.jobs.size(), (unsigned long long)batch.bytes_total);
    return batch;
}

Batch TransferPlanner::planDelete(Endpoint& ep, const std::string& dir,
                                  const std::vector<DirEntry>& items,
                                  std::uint64_t token) {
    Batch batch = newBatch(JobKind::Delete, ep.side(), token);
    BatchBuilder out{batch};
    const Side side = ep.side();

    struct Frame {
        std::string path;
        bool expanded;
        bool blocked;  // a descendant could not be listed, so this rmdir would fail
    };

    for (const DirEntry& item : items) {
        const std::string path = ep.join(dir, item.name);
        if (!item.isDir()) {
            out.add(JobKind::Delete, {side, path}, {side, path}, false, 0);
            continue;
        }

        std::vector<Frame> work{{path, false, false}};
        while (!work.empty()) {
            Frame f = work.back();
            work.pop_back();
            if (f.expanded) {
                if (!f.blocked) out.add(JobKind::Delete, {side, f.path}, {side, f.path}, true, 0);
                continue;
            }

            std::vector<DirEntry> children;
            Error err;
            if (!ep.list(f.path, children, err)) {
                out.fail(f.path, err);
                // Expanded frames still on the stack are exactly the ancestors of f
                for (Frame& up : work)
                    if (up.expanded) up.blocked = true;
                continue;
            }
            sortEntries(children);

            work.push_back({f.path, true, false});
            std::vector<std::string> subdirs;
            for (const DirEntry& c : children) {
                const std::string cp = ep.join(f.path, c.name);
                if (c.isDir()) {
                    subdirs.push_back(cp);
                } else {
                    out.add(JobKind::Delete, {side, cp}, {side, cp}, false, 0);
                }
            }
            for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) work.push_back({*it, false, false});
        }
    }
    LOGI("plan delete #%llu: %zu jobs, %zu unreadable", (unsigned long long)token, batch.jobs.size(),
         batch.plan_failures.size());
    return batch;
}

Batch TransferPlanner::planRename(Endpoint& ep, const std::string& from, const std::string& to,
                                  std::uint64_t token) {
    Batch batch = newBatch(JobKind::Rename, ep.side(), token);
    batch.from_selection = false;
    BatchBuilder{batch}.add(JobKind::Rename, {ep.side(), from}, {ep.side(), to}, false, 0);
    return batch;
}

Batch TransferPlanner::planMkdir(Endpoint& ep, const std::string& path, std::uint64_t token) {
    Batch batch = newBatch(JobKind::Mkdir, ep.side(), token);
    batch.from_selection = false;
    BatchBuilder{batch}.add(JobKind::Mkdir, {ep.side(), path}, {ep.side(), path}, true, 0);
    return batch;
}

Batch TransferPlanner::planFile(JobKind kind,
                                Endpoint& src, const std::string& from,
                                Endpoint& dst, const std::string& to,
                                std::uint64_t size, std::uint64_t token) {
    Batch batch = newBatch(kind, src.side(), token);
    batch.from_selection = false;
    BatchBuilder{batch}.add(kind, {src.side(), from}, {dst.side(), to}, false, size);
    return batch;
}

} // namespace ftpdeck
