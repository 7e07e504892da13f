// Worker loop: drain batches FIFO, run jobs with chunked I/O, publish snapshots.
#include "ftpdeck/TransferQueue.hpp"
#include "ftpdeck/Log.hpp"

#include <algorithm>

namespace ftpdeck {

const char* batchOutcomeName(BatchOutcome o) {
    switch (o) {
        case BatchOutcome::Completed:      return "completed";
        case BatchOutcome::Partial:        return "partial";
        case BatchOutcome::Cancelled:      return "cancelled";
        case BatchOutcome::ConnectionLost: return "connection lost";
    }
    return "?";
}

std::string BatchResult::summary() const {
    std::string s = std::string(jobKindName(batch.kind)) + ": " + std::to_string(done) + " done";
    if (failed) s += ", " + std::to_string(failed) + " failed";
    if (cancelled) s += ", " + std::to_string(cancelled) + " cancelled";
    if (outcome == BatchOutcome::ConnectionLost) s += " (connection lost)";
    return s;
}

const Error* BatchResult::firstError() const {
    for (const auto& j : batch.jobs)
        if (j.state == JobState::Failed) return &j.error;
    if (!batch.plan_failures.empty()) return &batch.plan_failures.front().error;
    return nullptr;
}

void ProgressChannel::publish(const ProgressSnapshot& s) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (q_.size() >= capacity_) {
        q_.pop_front();
        ++dropped_;
    }
    q_.push_back(s);
}

std::vector<ProgressSnapshot> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<ProgressSnapshot> out(q_.begin(), q_.end());
    q_.clear();
    return out;
}

std::size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}

TransferQueue::TransferQueue(Endpoint& local, Endpoint& remote, QueueOptions opt)
    : local_(local), remote_(remote), opt_(opt), progress_(opt.progress_capacity) {
    if (opt_.chunk_bytes == 0) opt_.chunk_bytes = 64 * 1024;
}

TransferQueue::~TransferQueue() {
    shutdown();
}

void TransferQueue::enqueue(Batch batch) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopping_) return;
        LOGI("queue: batch #%llu (%s, %zu jobs)", (unsigned long long)batch.token, jobKindName(batch.kind),
             batch.jobs.size());
        queue_.push_back(std::move(batch));
        // Started lazily; a quick-send with nothing to do never spawns it
        if (!worker_.joinable()) worker_ = std::thread([this] { run(); });
    }
    cv_.notify_one();
}

static BatchResult cancelledBeforeStart(Batch batch) {
    BatchResult r;
    for (auto& j : batch.jobs) j.state = JobState::Cancelled;
    r.cancelled = batch.jobs.size();
    r.batch = std::move(batch);
    r.outcome = BatchOutcome::Cancelled;
    r.started = false;
    return r;
}

bool TransferQueue::cancel(std::uint64_t token) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const Batch& b) { return b.token == token; });
    if (it != queue_.end()) {
        LOGI("queue: batch #%llu cancelled before start", (unsigned long long)token);
        results_.push_back(cancelledBeforeStart(std::move(*it)));
        queue_.erase(it);
        lk.unlock();
        idleCv_.notify_all();
        return true;
    }
    if (activeToken_.load() == token && token != 0) {
        LOGI("queue: cancel requested for batch #%llu", (unsigned long long)token);
        cancelToken_.store(token);
        return true;
    }
    return false;
}

bool TransferQueue::busy() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !queue_.empty() || activeToken_.load() != 0;
}

std::optional<BatchResult> TransferQueue::takeResult() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (results_.empty()) return std::nullopt;
    BatchResult r = std::move(results_.front());
    results_.pop_front();
    return r;
}

bool TransferQueue::waitIdle(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    return idleCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                            [&] { return queue_.empty() && activeToken_.load() == 0; });
}

void TransferQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
        while (!queue_.empty()) {
            results_.push_back(cancelledBeforeStart(std::move(queue_.front())));
            queue_.pop_front();
        }
        if (activeToken_.load() != 0) cancelToken_.store(activeToken_.load());
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void TransferQueue::run() {
    for (;;) {
        Batch batch;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            batch = std::move(queue_.front());
            queue_.pop_front();
            activeToken_.store(batch.token);
        }

        BatchResult r = execute(batch);
        LOGI("queue: batch #%llu %s: %s", (unsigned long long)r.batch.token, batchOutcomeName(r.outcome),
             r.summary().c_str());

        {
            std::lock_guard<std::mutex> lk(mtx_);
            results_.push_back(std::move(r));
            activeToken_.store(0);
        }
        idleCv_.notify_all();
    }
}

void TransferQueue::advance(Batch& batch, std::uint64_t n) {
    // Files can grow after planning; never report past the planned total.
    batch.bytes_done = std::min(batch.bytes_total, batch.bytes_done + n);
}

void TransferQueue::publish(const Batch& batch, std::size_t index, bool force, bool finished) {
    auto now = std::chrono::steady_clock::now();
    if (!force && now - lastPublish_ < std::chrono::milliseconds(opt_.progress_interval_ms)) return;
    lastPublish_ = now;
    ProgressSnapshot s;
    s.batch_token = batch.token;
    s.bytes_done = batch.bytes_done;
    s.bytes_total = batch.bytes_total;
    s.current_job_index = index;
    s.job_count = batch.jobs.size();
    if (index > 0 && index <= batch.jobs.size()) s.current_name = batch.jobs[index - 1].displayName();
    s.finished = finished;
    progress_.publish(s);
}

BatchResult TransferQueue::execute(Batch& batch) {
    BatchResult r;
    r.started = true;
    bool lost = false;
    publish(batch, 0, true);

    for (std::size_t i = 0; i < batch.jobs.size(); ++i) {
        TransferJob& job = batch.jobs[i];
        if (lost || cancelRequested(batch.token)) {
            job.state = JobState::Cancelled;
            continue;
        }
        job.state = JobState::Active;
        publish(batch, i + 1, true);

        Error err;
        if (runJob(batch, job, err)) {
            job.state = JobState::Done;
        } else if (err.code == ErrorCode::Cancelled) {
            job.state = JobState::Cancelled;
        } else {
            job.state = JobState::Failed;
            job.error = err;
            LOGW("job %llu/%zu %s %s failed: %s", (unsigned long long)job.id, batch.jobs.size(),
                 jobKindName(job.kind), job.dest.path.c_str(), err.describe().c_str());
            if (isConnectionFatal(err.code)) {
                lost = true;
                r.connection_error = err;
            }
        }
        publish(batch, i + 1, true);
    }

    for (const auto& j : batch.jobs) {
        if (j.state == JobState::Done) ++r.done;
        else if (j.state == JobState::Failed) ++r.failed;
        else ++r.cancelled;
    }
    r.failed += batch.plan_failures.size();

    if (lost) r.outcome = BatchOutcome::ConnectionLost;
    else if (r.cancelled > 0) r.outcome = BatchOutcome::Cancelled;
    else if (r.failed > 0) r.outcome = BatchOutcome::Partial;
    else r.outcome = BatchOutcome::Completed;

    publish(batch, batch.jobs.size(), true, true);
    r.batch = std::move(batch);
    return r;
}

bool TransferQueue::runJob(Batch& batch, TransferJob& job, Error& err) {
    Endpoint& dst = endpointFor(job.dest.side);
    switch (job.kind) {
        case JobKind::Upload:
        case JobKind::Download:
            return copyFile(batch, job, err);
        case JobKind::Mkdir: {
            if (dst.mkdir(job.dest.path, err)) return true;
            if (isConnectionFatal(err.code)) return false;
            // Merge only into an existing directory; a file of that name keeps the error
            std::vector<DirEntry> siblings;
            Error listErr;
            if (!dst.list(dst.parentOf(job.dest.path), siblings, listErr)) return false;
            const std::string name = job.dest.path.substr(job.dest.path.find_last_of('/') + 1);
            for (const DirEntry& e : siblings) {
                if (e.name == name && e.isDir()) {
                    err.clear();
                    return true;
                }
            }
            return false;
        }
        case JobKind::Delete:
            return job.directory ? dst.deleteEmptyDir(job.dest.path, err) : dst.deleteFile(job.dest.path, err);
        case JobKind::Rename:
            return dst.rename(job.source.path, job.dest.path, err);
    }
    err.set(ErrorCode::Protocol, "unknown job kind");
    return false;
}

bool TransferQueue::copyFile(Batch& batch, TransferJob& job, Error& err) {
    Endpoint& from = endpointFor(job.source.side);
    Endpoint& to = endpointFor(job.dest.side);

    std::unique_ptr<DataChannel> in = from.openRead(job.source.path, err);
    if (!in) return false;
    std::unique_ptr<DataChannel> out = to.openWrite(job.dest.path, err);
    if (!out) {
        from.abortTransfer();
        return false;
    }

    // Cancelled or failed: release the remote data channel first, then drop
    // a partially written local file.
    auto giveUp = [&]() {
        from.abortTransfer();
        to.abortTransfer();
        in.reset();
        out.reset();
        if (job.dest.side == Side::Local) {
            Error rmErr;
            if (!to.deleteFile(job.dest.path, rmErr))
                LOGW("could not remove partial %s: %s", job.dest.path.c_str(), rmErr.describe().c_str());
        }
        return false;
    };

    std::vector<char> buf(opt_.chunk_bytes);
    std::uint64_t moved = 0;
    for (;;) {
        if (cancelRequested(batch.token)) {
            err.set(ErrorCode::Cancelled, "cancelled by user");
            return giveUp();
        }
        long n = in->read(buf.data(), buf.size(), err);
        if (n < 0) return giveUp();
        if (n == 0) break;
        if (!out->write(buf.data(), static_cast<std::size_t>(n), err)) return giveUp();
        moved += static_cast<std::uint64_t>(n);
        advance(batch, static_cast<std::uint64_t>(n));
        publish(batch, job.id, false);
    }

    if (!in->close(err)) return giveUp();
    if (!out->close(err)) return giveUp();
    // File shrank since planning: credit the rest so a finished batch reads 100%
    if (moved < job.size_bytes) advance(batch, job.size_bytes - moved);
    return true;
}

} // namespace ftpdeck
