#include <QtTest>
#include <QTemporaryDir>

#include "TestSupport.hpp"
#include "ftpdeck/TransferPlanner.hpp"
#include "ftpdeck/TransferQueue.hpp"

#include <algorithm>

using namespace ftpdeck;
using testsupport::str;
using testsupport::writeFile;

static DirEntry fileEntry(const std::string& name, std::uint64_t size) {
    DirEntry e;
    e.name = name;
    e.size_bytes = size;
    return e;
}

static DirEntry dirEntry(const std::string& name) {
    DirEntry e;
    e.name = name;
    e.kind = EntryKind::Directory;
    return e;
}

static std::size_t indexOf(const Batch& b, const std::string& destPath) {
    for (std::size_t i = 0; i < b.jobs.size(); ++i)
        if (b.jobs[i].dest.path == destPath) return i;
    return b.jobs.size();
}

class TestTransferPlanner : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* tmp_ = nullptr;
    std::shared_ptr<MockRemote> server_;
    MemoryConnectionStore* store_ = nullptr;
    Connector* connector_ = nullptr;
    RemoteEndpoint* remote_ = nullptr;
    LocalEndpoint* local_ = nullptr;

private slots:
    void init() {
        tmp_ = new QTemporaryDir();
        QVERIFY(tmp_->isValid());
        server_ = std::make_shared<MockRemote>();
        store_ = new MemoryConnectionStore();
        connector_ = new Connector(*store_, testsupport::mockFactory(server_));
        Error err;
        QVERIFY(connector_->connect(testsupport::mockAddress(), err));
        remote_ = new RemoteEndpoint(*connector_);
        local_ = new LocalEndpoint(str(tmp_->path()));
    }

    void cleanup() {
        delete local_;
        delete remote_;
        delete connector_;
        delete store_;
        server_.reset();
        delete tmp_;
    }

    void filesBecomeOneJobEach() {
        server_->addDir("/up");
        std::vector<DirEntry> items{fileEntry("b.txt", 20), fileEntry("a.txt", 10), fileEntry("c.txt", 30)};
        Batch b = TransferPlanner::planCopy(JobKind::Upload, *local_, local_->cwd(), items, *remote_, "/up", 7);

        QCOMPARE(b.token, std::uint64_t(7));
        QCOMPARE(int(b.kind), int(JobKind::Upload));
        QCOMPARE(int(b.origin), int(Side::Local));
        QVERIFY(b.from_selection);
        QCOMPARE(b.jobs.size(), std::size_t(3));
        QCOMPARE(b.bytes_total, std::uint64_t(60));
        QCOMPARE(b.bytes_done, std::uint64_t(0));
        QVERIFY(b.plan_failures.empty());

        // Marking order, not name order
        QCOMPARE(QString::fromStdString(b.jobs[0].dest.path), QString("/up/b.txt"));
        QCOMPARE(QString::fromStdString(b.jobs[1].dest.path), QString("/up/a.txt"));
        QCOMPARE(QString::fromStdString(b.jobs[2].dest.path), QString("/up/c.txt"));
        for (std::size_t i = 0; i < b.jobs.size(); ++i) {
            QCOMPARE(b.jobs[i].id, std::uint64_t(i + 1));
            QCOMPARE(b.jobs[i].batch_token, std::uint64_t(7));
            QCOMPARE(int(b.jobs[i].state), int(JobState::Pending));
            QCOMPARE(int(b.jobs[i].source.side), int(Side::Local));
            QCOMPARE(int(b.jobs[i].dest.side), int(Side::Remote));
        }
        QCOMPARE(QString::fromStdString(b.jobs[0].source.path), QString::fromStdString(local_->join(local_->cwd(), "b.txt")));
    }

    void copyCreatesDirectoriesBeforeContents() {
        QVERIFY(writeFile(tmp_->filePath("proj/x.txt"), "abc"));
        QVERIFY(writeFile(tmp_->filePath("proj/y.txt"), "abcd"));
        QVERIFY(QDir(tmp_->path()).mkpath("proj/empty"));
        QVERIFY(writeFile(tmp_->filePath("proj/lib/z.c"), "int a"));

        Batch b = TransferPlanner::planCopy(JobKind::Upload, *local_, local_->cwd(), {dirEntry("proj")}, *remote_,
                                            "/r", 1);
        QVERIFY(b.plan_failures.empty());
        QCOMPARE(b.jobs.size(), std::size_t(6));
        QCOMPARE(b.bytes_total, std::uint64_t(12));

        const std::vector<std::pair<JobKind, QString>> expected{
            {JobKind::Mkdir, "/r/proj"},        {JobKind::Upload, "/r/proj/x.txt"},
            {JobKind::Upload, "/r/proj/y.txt"}, {JobKind::Mkdir, "/r/proj/empty"},
            {JobKind::Mkdir, "/r/proj/lib"},    {JobKind::Upload, "/r/proj/lib/z.c"},
        };
        for (std::size_t i = 0; i < expected.size(); ++i) {
            QCOMPARE(int(b.jobs[i].kind), int(expected[i].first));
            QCOMPARE(QString::fromStdString(b.jobs[i].dest.path), expected[i].second);
        }
        QVERIFY(b.jobs[0].directory);
        QCOMPARE(b.jobs[0].size_bytes, std::uint64_t(0));

        // Every job's parent directory is created earlier in the batch
        for (std::size_t i = 1; i < b.jobs.size(); ++i) {
            const std::string parent = remote_->parentOf(b.jobs[i].dest.path);
            QVERIFY(indexOf(b, parent) < i);
        }
        QCOMPARE(QString::fromStdString(b.jobs[5].displayName()), QString("z.c"));
        QCOMPARE(QString::fromStdString(b.jobs[4].displayName()), QString("lib"));
    }

    void deleteRemovesContentsBeforeDirectory() {
        QVERIFY(writeFile(tmp_->filePath("d/f1"), "1"));
        QVERIFY(writeFile(tmp_->filePath("d/f2"), "2"));
        QVERIFY(QDir(tmp_->path()).mkpath("d/sub"));

        Batch b = TransferPlanner::planDelete(*local_, local_->cwd(), {dirEntry("d")}, 3);
        QCOMPARE(int(b.kind), int(JobKind::Delete));
        QCOMPARE(b.jobs.size(), std::size_t(4));
        QCOMPARE(b.bytes_total, std::uint64_t(0));

        const std::string root = local_->join(local_->cwd(), "d");
        QCOMPARE(b.jobs[0].dest.path, local_->join(root, "f1"));
        QCOMPARE(b.jobs[1].dest.path, local_->join(root, "f2"));
        QCOMPARE(b.jobs[2].dest.path, local_->join(root, "sub"));
        QCOMPARE(b.jobs[3].dest.path, root);
        QVERIFY(!b.jobs[0].directory);
        QVERIFY(b.jobs[2].directory);
        QVERIFY(b.jobs[3].directory);
        for (const TransferJob& j : b.jobs) QCOMPARE(int(j.kind), int(JobKind::Delete));
    }

    void unreadableSubtreeBecomesPlanFailure() {
        server_->addFile("/a/ok.txt", "fine");
        server_->addFile("/a/locked/secret.txt", "hidden");
        server_->list_failures["/a/locked"] = ErrorCode::PermissionDenied;

        Batch b = TransferPlanner::planDelete(*remote_, "/", {dirEntry("a")}, 4);
        QCOMPARE(b.plan_failures.size(), std::size_t(1));
        QCOMPARE(QString::fromStdString(b.plan_failures[0].path), QString("/a/locked"));
        QCOMPARE(int(b.plan_failures[0].error.code), int(ErrorCode::PermissionDenied));

        // /a cannot be emptied, so its rmdir is not planned either
        QCOMPARE(b.jobs.size(), std::size_t(1));
        QCOMPARE(QString::fromStdString(b.jobs[0].dest.path), QString("/a/ok.txt"));
        QVERIFY(std::none_of(b.jobs.begin(), b.jobs.end(), [](const TransferJob& j) {
            return j.dest.path.find("/a/locked") == 0 || j.dest.path == "/a";
        }));

        TransferQueue q(*local_, *remote_, QueueOptions{});
        q.enqueue(std::move(b));
        QVERIFY(q.waitIdle(20000));
        std::optional<BatchResult> r = q.takeResult();
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Partial));
        QCOMPARE(r->done, std::size_t(1));
        QCOMPARE(r->failed, std::size_t(1));
        QCOMPARE(int(r->firstError()->code), int(ErrorCode::PermissionDenied));
        QVERIFY(!server_->exists("/a/ok.txt"));
        QVERIFY(server_->exists("/a/locked/secret.txt"));
    }

    void unreadableSiblingBlocksOnlyItsAncestors() {
        server_->addFile("/t/x/locked/f", "1");
        server_->addFile("/t/y/g", "2");
        server_->list_failures["/t/x/locked"] = ErrorCode::PermissionDenied;

        Batch b = TransferPlanner::planDelete(*remote_, "/", {dirEntry("t")}, 14);
        QCOMPARE(b.plan_failures.size(), std::size_t(1));
        QVERIFY(indexOf(b, "/t/y/g") < indexOf(b, "/t/y"));
        QVERIFY(indexOf(b, "/t/y") < b.jobs.size());
        QCOMPARE(indexOf(b, "/t/x"), b.jobs.size());
        QCOMPARE(indexOf(b, "/t"), b.jobs.size());
        QCOMPARE(b.jobs.size(), std::size_t(2));
    }

    void deleteUnlinksSymlinkedDirectory() {
        QVERIFY(writeFile(tmp_->filePath("victim/precious.txt"), "keep"));
        QVERIFY(writeFile(tmp_->filePath("sel/a.txt"), "a"));
        QVERIFY(QFile::link(tmp_->filePath("victim"), tmp_->filePath("sel/link")));

        Batch b = TransferPlanner::planDelete(*local_, local_->cwd(), {dirEntry("sel")}, 15);
        QVERIFY(b.plan_failures.empty());
        QCOMPARE(b.jobs.size(), std::size_t(3));
        const std::size_t link = indexOf(b, str(tmp_->filePath("sel/link")));
        QVERIFY(link < b.jobs.size());
        QVERIFY(!b.jobs[link].directory);
        QVERIFY(std::none_of(b.jobs.begin(), b.jobs.end(), [](const TransferJob& j) {
            return j.dest.path.find("precious") != std::string::npos;
        }));

        TransferQueue q(*local_, *remote_, QueueOptions{});
        q.enqueue(std::move(b));
        QVERIFY(q.waitIdle(20000));
        std::optional<BatchResult> r = q.takeResult();
        QVERIFY(r);
        QCOMPARE(int(r->outcome), int(BatchOutcome::Completed));
        QVERIFY(!QFileInfo::exists(tmp_->filePath("sel")));
        QCOMPARE(testsupport::readFile(tmp_->filePath("victim/precious.txt")), QByteArray("keep"));
    }

    void selfLinkDoesNotMultiplyCopy() {
        server_->addDir("/up");
        QVERIFY(writeFile(tmp_->filePath("loop/f.txt"), "ff"));
        QVERIFY(QFile::link(tmp_->filePath("loop"), tmp_->filePath("loop/self")));

        Batch b = TransferPlanner::planCopy(JobKind::Upload, *local_, local_->cwd(), {dirEntry("loop")}, *remote_,
                                            "/up", 16);
        QVERIFY(b.plan_failures.empty());
        QCOMPARE(b.jobs.size(), std::size_t(3));
        QCOMPARE(int(b.jobs[0].kind), int(JobKind::Mkdir));
        const std::size_t self = indexOf(b, "/up/loop/self");
        QVERIFY(self < b.jobs.size());
        QCOMPARE(int(b.jobs[self].kind), int(JobKind::Upload));
        QVERIFY(std::none_of(b.jobs.begin(), b.jobs.end(), [](const TransferJob& j) {
            return j.dest.path.find("self/") != std::string::npos;
        }));
    }

    void deepTreeDoesNotRecurse() {
        std::string p = "/deep";
        for (int i = 0; i < 300; ++i) p += "/d";
        server_->addFile(p + "/leaf.bin", std::string(9, 'x'));

        Batch b = TransferPlanner::planCopy(JobKind::Download, *remote_, "/", {dirEntry("deep")}, *local_,
                                            local_->cwd(), 5);
        QCOMPARE(int(b.origin), int(Side::Remote));
        QCOMPARE(b.jobs.size(), std::size_t(302));
        QCOMPARE(b.bytes_total, std::uint64_t(9));
        QCOMPARE(int(b.jobs.back().kind), int(JobKind::Download));
        QCOMPARE(QString::fromStdString(b.jobs.back().displayName()), QString("leaf.bin"));
    }

    void singleJobBatches() {
        Batch r = TransferPlanner::planRename(*remote_, "/old", "/new", 8);
        QVERIFY(!r.from_selection);
        QCOMPARE(r.jobs.size(), std::size_t(1));
        QCOMPARE(int(r.jobs[0].kind), int(JobKind::Rename));
        QCOMPARE(QString::fromStdString(r.jobs[0].source.path), QString("/old"));
        QCOMPARE(QString::fromStdString(r.jobs[0].dest.path), QString("/new"));

        Batch m = TransferPlanner::planMkdir(*local_, "/tmp/x", 9);
        QVERIFY(!m.from_selection);
        QCOMPARE(int(m.kind), int(JobKind::Mkdir));
        QVERIFY(m.jobs[0].directory);

        Batch f = TransferPlanner::planFile(JobKind::Upload, *local_, "/tmp/copy_of_a", *remote_, "/a", 42, 10);
        QVERIFY(!f.from_selection);
        QCOMPARE(f.bytes_total, std::uint64_t(42));
        QCOMPARE(int(f.jobs[0].dest.side), int(Side::Remote));
    }
};

QTEST_GUILESS_MAIN(TestTransferPlanner)
#include "tst_transferplanner.moc"
