// Serial transfer queue (one worker thread, one batch at a time) with
// throttled progress snapshots and cooperative cancellation.
#pragma once
#include "TransferPlanner.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace ftpdeck {

struct ProgressSnapshot {
    std::uint64_t batch_token = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    std::size_t   current_job_index = 0;  // 1-based, 0 before the first job starts
    std::size_t   job_count = 0;
    std::string   current_name;
    bool          finished = false;
};

enum class BatchOutcome { Completed, Partial, Cancelled, ConnectionLost };

const char* batchOutcomeName(BatchOutcome o);

struct BatchResult {
    Batch        batch;
    BatchOutcome outcome = BatchOutcome::Completed;
    bool         started = false;  // false: cancelled while still queued
    std::size_t  done = 0;
    std::size_t  failed = 0;       // includes plan failures
    std::size_t  cancelled = 0;
    Error        connection_error;

    // "upload: 3 done, 1 failed"
    std::string summary() const;
    // First job error (or plan failure), if any
    const Error* firstError() const;
};

// Bounded, mutex-protected snapshot mailbox; when full the oldest snapshot is dropped.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 64) : capacity_(capacity ? capacity : 1) {}

    void publish(const ProgressSnapshot& s);
    std::vector<ProgressSnapshot> drain();
    std::size_t dropped() const;

private:
    mutable std::mutex mtx_;
    std::deque<ProgressSnapshot> q_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
};

struct QueueOptions {
    std::size_t chunk_bytes = 64 * 1024;
    int         progress_interval_ms = 100;
    std::size_t progress_capacity = 64;
};

class TransferQueue {
public:
    TransferQueue(Endpoint& local, Endpoint& remote, QueueOptions opt = QueueOptions());
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    void enqueue(Batch batch);

    // Queued batch: removed at once, reported with started=false.
    // Active batch: cancellation requested, honoured between chunks and jobs.
    bool cancel(std::uint64_t token);

    // Something queued or running
    bool busy() const;
    std::uint64_t activeToken() const { return activeToken_.load(); }

    std::vector<ProgressSnapshot> pollProgress() { return progress_.drain(); }
    std::optional<BatchResult> takeResult();

    // Blocks until nothing is queued or running; false on timeout.
    bool waitIdle(int timeoutMs);

    // Cancels everything and joins the worker.
    void shutdown();

private:
    void run();
    BatchResult execute(Batch& batch);
    bool runJob(Batch& batch, TransferJob& job, Error& err);
    bool copyFile(Batch& batch, TransferJob& job, Error& err);
    bool cancelRequested(std::uint64_t token) const { return cancelToken_.load() == token; }
    void advance(Batch& batch, std::uint64_t n);
    void publish(const Batch& batch, std::size_t index, bool force, bool finished = false);
    Endpoint& endpointFor(Side s) { return s == Side::Local ? local_ : remote_; }

    Endpoint& local_;
    Endpoint& remote_;
    QueueOptions opt_;
    ProgressChannel progress_;

    std::thread worker_;
    mutable std::mutex mtx_;  // protects queue_, results_, stopping_
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<Batch> queue_;
    std::deque<BatchResult> results_;
    bool stopping_ = false;

    std::atomic<std::uint64_t> activeToken_{0};
    std::atomic<std::uint64_t> cancelToken_{0};

    // worker thread only
    std::chrono::steady_clock::time_point lastPublish_{};
};

} // namespace ftpdeck
