#include <QtTest>
#include <QTemporaryDir>

#include "TestSupport.hpp"
#include "ftpdeck/TransferQueue.hpp"

#include <atomic>

using namespace ftpdeck;
using testsupport::readFile;
using testsupport::str;
using testsupport::writeFile;

static DirEntry fileEntry(const std::string& name, std::uint64_t size) {
    DirEntry e;
    e.name = name;
    e.size_bytes = size;
    return e;
}

class TestTransferQueue : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> tmp_;
    std::shared_ptr<MockRemote> server_;
    std::unique_ptr<MemoryConnectionStore> store_;
    std::unique_ptr<Connector> connector_;
    std::unique_ptr<LocalEndpoint> local_;
    std::unique_ptr<RemoteEndpoint> remote_;
    std::unique_ptr<TransferQueue> queue_;

    TransferQueue& makeQueue(std::size_t chunk = 1024, int intervalMs = 0, std::size_t capacity = 4096) {
        QueueOptions opt;
        opt.chunk_bytes = chunk;
        opt.progress_interval_ms = intervalMs;
        opt.progress_capacity = capacity;
        queue_ = std::make_unique<TransferQueue>(*local_, *remote_, opt);
        return *queue_;
    }

    // Local files named in items, each filled to its size
    std::vector<DirEntry> localFiles(const std::vector<std::pair<std::string, int>>& layout) {
        std::vector<DirEntry> items;
        for (const auto& s : layout) {
            writeFile(tmp_->filePath(QString::fromStdString(s.first)), QByteArray(s.second, 'u'));
            items.push_back(fileEntry(s.first, static_cast<std::uint64_t>(s.second)));
        }
        return items;
    }

    Batch uploadPlan(const std::vector<DirEntry>& items, std::uint64_t token) {
        return TransferPlanner::planCopy(JobKind::Upload, *local_, local_->cwd(), items, *remote_, "/up", token);
    }

    std::optional<BatchResult> runToEnd(Batch b) {
        queue_->enqueue(std::move(b));
        if (!queue_->waitIdle(20000)) return std::nullopt;
        return queue_->takeResult();
    }

private slots:
    void init() {
        tmp_ = std::make_unique<QTemporaryDir>();
        QVERIFY(tmp_->isValid());
        server_ = std::make_shared<MockRemote>();
        server_->addDir("/up");
        store_ = std::make_unique<MemoryConnectionStore>();
        connector_ = std::make_unique<Connector>(*store_, testsupport::mockFactory(server_));
        Error err;
        QVERIFY(connector_->connect(testsupport::mockAddress(), err));
        local_ = std::make_unique<LocalEndpoint>(str(tmp_->path()));
        remote_ = std::make_unique<RemoteEndpoint>(*connector_);
    }

    void cleanup() {
        queue_.reset();
        remote_.reset();
        local_.reset();
        connector_.reset();
        store_.reset();
        server_.reset();
        tmp_.reset();
    }

    void uploadCompletesWithMonotonicProgress() {
        TransferQueue& q = makeQueue(1024);
        auto items = localFiles({{"a.txt", 5000}, {"b.txt", 7000}, {"c.txt", 300}});
        auto r = runToEnd(uploadPlan(items, 1));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Completed));
        QVERIFY(r->started);
        QCOMPARE(r->done, std::size_t(3));
        QCOMPARE(r->failed, std::size_t(0));
        QCOMPARE(r->batch.bytes_done, std::uint64_t(12300));
        QVERIFY(!r->firstError());
        QCOMPARE(QString::fromStdString(r->summary()), QString("upload: 3 done"));
        QCOMPARE(server_->contents("/up/b.txt"), std::string(7000, 'u'));

        std::vector<ProgressSnapshot> snaps = q.pollProgress();
        QVERIFY(snaps.size() > 3);
        std::uint64_t last = 0;
        for (const ProgressSnapshot& s : snaps) {
            QCOMPARE(s.batch_token, std::uint64_t(1));
            QVERIFY(s.bytes_done >= last);
            QVERIFY(s.bytes_done <= s.bytes_total);
            QVERIFY(s.current_job_index <= s.job_count);
            last = s.bytes_done;
        }
        QVERIFY(snaps.back().finished);
        QCOMPARE(snaps.back().bytes_done, std::uint64_t(12300));
        QVERIFY(!q.busy());
        QVERIFY(!q.takeResult());
    }

    void cancelDuringThirdJob() {
        TransferQueue& q = makeQueue(1024);
        std::vector<std::pair<std::string, int>> layout;
        for (int i = 1; i <= 10; ++i) layout.push_back({QString("f%1").arg(i, 2, 10, QChar('0')).toStdString(), 8192});
        auto items = localFiles(layout);

        std::atomic<bool> fired{false};
        server_->on_chunk = [&](const std::string& path, std::uint64_t offset) {
            if (path == "/up/f03" && offset >= 2048 && !fired.exchange(true)) q.cancel(42);
        };
        auto r = runToEnd(uploadPlan(items, 42));
        server_->on_chunk = nullptr;
        QVERIFY(r);
        QVERIFY(fired.load());
        QCOMPARE(int(r->outcome), int(BatchOutcome::Cancelled));
        QVERIFY(r->started);
        QCOMPARE(r->done, std::size_t(2));
        QCOMPARE(r->cancelled, std::size_t(8));
        QCOMPARE(r->failed, std::size_t(0));
        QCOMPARE(int(r->batch.jobs[1].state), int(JobState::Done));
        for (std::size_t i = 2; i < 10; ++i) QCOMPARE(int(r->batch.jobs[i].state), int(JobState::Cancelled));

        QVERIFY(server_->exists("/up/f02"));
        QVERIFY(!server_->exists("/up/f03"));
        QVERIFY(!server_->exists("/up/f04"));
        QVERIFY(server_->abortCount() >= 1);
    }

    void cancelWhileQueued() {
        TransferQueue& q = makeQueue(1024);
        server_->chunk_delay_ms = 3;
        auto slow = localFiles({{"slow.bin", 64 * 1024}});
        auto quick = localFiles({{"quick.bin", 10}});

        q.enqueue(uploadPlan(slow, 1));
        q.enqueue(uploadPlan(quick, 2));
        QVERIFY(q.busy());
        QVERIFY(q.cancel(2));
        QVERIFY(!q.cancel(99));

        auto queued = q.takeResult();
        QVERIFY(queued);
        QCOMPARE(queued->batch.token, std::uint64_t(2));
        QVERIFY(!queued->started);
        QCOMPARE(int(queued->outcome), int(BatchOutcome::Cancelled));
        QCOMPARE(queued->cancelled, std::size_t(1));
        QCOMPARE(int(queued->batch.jobs[0].state), int(JobState::Cancelled));

        QVERIFY(q.waitIdle(20000));
        auto first = q.takeResult();
        QVERIFY(first);
        QCOMPARE(first->batch.token, std::uint64_t(1));
        QCOMPARE(int(first->outcome), int(BatchOutcome::Completed));
        QVERIFY(!server_->exists("/up/quick.bin"));
    }

    void connectionLossStopsBatch() {
        makeQueue(1024);
        server_->drop_after_bytes = 3000;
        auto items = localFiles({{"a", 2000}, {"b", 2000}, {"c", 2000}, {"d", 2000}});
        auto r = runToEnd(uploadPlan(items, 5));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::ConnectionLost));
        QCOMPARE(int(r->connection_error.code), int(ErrorCode::ConnectionLost));
        QCOMPARE(r->done, std::size_t(1));
        QCOMPARE(r->failed, std::size_t(1));
        QCOMPARE(r->cancelled, std::size_t(2));
        QCOMPARE(int(r->batch.jobs[1].state), int(JobState::Failed));
        QVERIFY(server_->exists("/up/a"));
        QVERIFY(!server_->exists("/up/b"));
        QVERIFY(QString::fromStdString(r->summary()).endsWith("(connection lost)"));
        QVERIFY(!connector_->isConnected());
    }

    void perFileFailureIsPartial() {
        makeQueue();
        server_->open_failures["/up/b.txt"] = ErrorCode::PermissionDenied;
        auto items = localFiles({{"a.txt", 10}, {"b.txt", 10}, {"c.txt", 10}});
        auto r = runToEnd(uploadPlan(items, 6));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Partial));
        QCOMPARE(r->done, std::size_t(2));
        QCOMPARE(r->failed, std::size_t(1));
        QCOMPARE(int(r->batch.jobs[1].state), int(JobState::Failed));
        QCOMPARE(int(r->batch.jobs[1].error.code), int(ErrorCode::PermissionDenied));
        QVERIFY(r->firstError());
        QCOMPARE(int(r->firstError()->code), int(ErrorCode::PermissionDenied));
        QCOMPARE(QString::fromStdString(r->summary()), QString("upload: 2 done, 1 failed"));
        QVERIFY(server_->exists("/up/c.txt"));
    }

    void mkdirMergesIntoExistingDirectory() {
        makeQueue();
        server_->addFile("/up/proj/old.txt", "old");
        QVERIFY(writeFile(tmp_->filePath("proj/new.txt"), "new"));
        DirEntry proj;
        proj.name = "proj";
        proj.kind = EntryKind::Directory;
        auto r = runToEnd(uploadPlan({proj}, 7));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Completed));
        QCOMPARE(server_->contents("/up/proj/old.txt"), std::string("old"));
        QCOMPARE(server_->contents("/up/proj/new.txt"), std::string("new"));
    }

    void mkdirOverFileKeepsAlreadyExists() {
        makeQueue();
        server_->list_file_as_entry = true;
        server_->addFile("/up/proj", "plain file");
        QVERIFY(writeFile(tmp_->filePath("proj/new.txt"), "new"));
        DirEntry proj;
        proj.name = "proj";
        proj.kind = EntryKind::Directory;
        auto r = runToEnd(uploadPlan({proj}, 17));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Partial));
        QCOMPARE(int(r->batch.jobs[0].kind), int(JobKind::Mkdir));
        QCOMPARE(int(r->batch.jobs[0].state), int(JobState::Failed));
        QCOMPARE(int(r->batch.jobs[0].error.code), int(ErrorCode::AlreadyExists));
        QCOMPARE(int(r->firstError()->code), int(ErrorCode::AlreadyExists));
        QCOMPARE(r->done, std::size_t(0));
        QVERIFY(!server_->isDir("/up/proj"));
        QCOMPARE(server_->contents("/up/proj"), std::string("plain file"));
    }

    void failedDownloadLeavesNoPartialFile() {
        makeQueue(1024);
        server_->addFile("/big.bin", std::string(50 * 1024, 'b'));
        server_->drop_after_bytes = 10000;
        DirEntry big = fileEntry("big.bin", 50 * 1024);
        Batch b = TransferPlanner::planCopy(JobKind::Download, *remote_, "/", {big}, *local_, local_->cwd(), 8);
        auto r = runToEnd(std::move(b));
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::ConnectionLost));
        QVERIFY(!QFile::exists(tmp_->filePath("big.bin")));
    }

    void deleteAndRenameRunOnRemote() {
        makeQueue();
        server_->addFile("/up/tree/a", "1");
        server_->addFile("/up/tree/sub/b", "2");
        server_->addFile("/up/keep", "k");
        DirEntry tree;
        tree.name = "tree";
        tree.kind = EntryKind::Directory;
        auto del = runToEnd(TransferPlanner::planDelete(*remote_, "/up", {tree}, 9));
        QVERIFY(del);
        QCOMPARE(int(del->outcome), int(BatchOutcome::Completed));
        QCOMPARE(del->done, std::size_t(4));
        QVERIFY(!server_->exists("/up/tree"));

        auto ren = runToEnd(TransferPlanner::planRename(*remote_, "/up/keep", "/up/kept", 10));
        QVERIFY(ren);
        QCOMPARE(int(ren->outcome), int(BatchOutcome::Completed));
        QVERIFY(server_->exists("/up/kept"));

        server_->addFile("/up/other", "o");
        auto clash = runToEnd(TransferPlanner::planRename(*remote_, "/up/kept", "/up/other", 11));
        QVERIFY(clash);
        QCOMPARE(int(clash->outcome), int(BatchOutcome::Partial));
        QCOMPARE(int(clash->batch.jobs[0].error.code), int(ErrorCode::AlreadyExists));
        QCOMPARE(server_->contents("/up/other"), std::string("o"));
    }

    void bytesNeverExceedPlannedTotal() {
        makeQueue(1024);
        QVERIFY(writeFile(tmp_->filePath("grew.bin"), QByteArray(5000, 'g')));
        QVERIFY(writeFile(tmp_->filePath("shrank.bin"), QByteArray(100, 's')));

        auto grew = runToEnd(TransferPlanner::planFile(JobKind::Upload, *local_, str(tmp_->filePath("grew.bin")),
                                                       *remote_, "/up/grew.bin", 1000, 12));
        QVERIFY(grew);
        QCOMPARE(grew->batch.bytes_done, std::uint64_t(1000));
        QCOMPARE(server_->contents("/up/grew.bin").size(), std::size_t(5000));

        auto shrank = runToEnd(TransferPlanner::planFile(JobKind::Upload, *local_, str(tmp_->filePath("shrank.bin")),
                                                         *remote_, "/up/shrank.bin", 4000, 13));
        QVERIFY(shrank);
        QCOMPARE(shrank->batch.bytes_done, std::uint64_t(4000));
    }

    void progressChannelDropsOldest() {
        ProgressChannel ch(2);
        for (std::uint64_t t = 1; t <= 3; ++t) {
            ProgressSnapshot s;
            s.batch_token = t;
            ch.publish(s);
        }
        std::vector<ProgressSnapshot> out = ch.drain();
        QCOMPARE(out.size(), std::size_t(2));
        QCOMPARE(out[0].batch_token, std::uint64_t(2));
        QCOMPARE(out[1].batch_token, std::uint64_t(3));
        QCOMPARE(ch.dropped(), std::size_t(1));
        QVERIFY(ch.drain().empty());
    }
};

QTEST_GUILESS_MAIN(TestTransferQueue)
#include "tst_transferqueue.moc"
