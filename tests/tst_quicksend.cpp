#include <QtTest>
#include <QTemporaryDir>

#include "QuickSend.hpp"
#include "TestSupport.hpp"

#include <cstdio>

using namespace ftpdeck;
using testsupport::mockAddress;
using testsupport::str;
using testsupport::writeFile;

static QString drain(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    QByteArray all;
    char buf[4096];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) all.append(buf, static_cast<int>(n));
    return QString::fromUtf8(all);
}

class TestQuickSend : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> tmp_;
    std::shared_ptr<MockRemote> server_;
    std::unique_ptr<MemoryConnectionStore> store_;
    std::unique_ptr<Connector> connector_;
    std::unique_ptr<LocalEndpoint> local_;
    std::unique_ptr<RemoteEndpoint> remote_;
    std::FILE* out_ = nullptr;

    std::string path(const QString& rel) const { return str(tmp_->filePath(rel)); }

    int send(const std::vector<std::string>& paths, const std::optional<Address>& address) {
        QueueOptions qo;
        qo.chunk_bytes = 1024;
        QuickSend qs(*connector_, *local_, *remote_, qo, out_);
        return qs.run(paths, address, false);
    }

private slots:
    void init() {
        tmp_ = std::make_unique<QTemporaryDir>();
        QVERIFY(tmp_->isValid());
        server_ = std::make_shared<MockRemote>();
        store_ = std::make_unique<MemoryConnectionStore>();
        connector_ = std::make_unique<Connector>(*store_, testsupport::mockFactory(server_));
        local_ = std::make_unique<LocalEndpoint>(str(tmp_->path()));
        remote_ = std::make_unique<RemoteEndpoint>(*connector_);
        out_ = std::tmpfile();
        QVERIFY(out_);
    }

    void cleanup() {
        if (out_) std::fclose(out_);
        out_ = nullptr;
        remote_.reset();
        local_.reset();
        connector_.reset();
        store_.reset();
        server_.reset();
        tmp_.reset();
    }

    void noPathsIsUsage() {
        QCOMPARE(send({}, mockAddress()), int(SendUsage));
        QVERIFY(drain(out_).contains("Usage: ftpdeck-send"));
        QCOMPARE(server_->connectCount(), 0);
    }

    void onlyMissingPathsIsUsage() {
        QCOMPARE(send({path("nope"), path("gone.txt")}, mockAddress()), int(SendUsage));
        const QString out = drain(out_);
        QVERIFY(out.contains(QString::fromStdString("✗ Not found: " + path("nope"))));
        QVERIFY(out.contains(QString::fromStdString("✗ Not found: " + path("gone.txt"))));
        QVERIFY(out.contains("No valid files/folders to send"));
        QCOMPARE(server_->connectCount(), 0);
    }

    void uploadsIntoNewRemoteDirectory() {
        QVERIFY(writeFile(tmp_->filePath("a.txt"), "alpha"));
        QVERIFY(writeFile(tmp_->filePath("pics/x.jpg"), QByteArray(3000, 'x')));
        QVERIFY(writeFile(tmp_->filePath("pics/raw/y.cr2"), QByteArray(2000, 'y')));

        const int rc = send({path("a.txt"), path("missing.bin"), path("pics")}, mockAddress("mock.test", "/in/box"));
        QCOMPARE(rc, int(SendOk));

        QVERIFY(server_->isDir("/in/box"));
        QCOMPARE(server_->contents("/in/box/a.txt"), std::string("alpha"));
        QCOMPARE(server_->contents("/in/box/pics/x.jpg").size(), std::size_t(3000));
        QCOMPARE(server_->contents("/in/box/pics/raw/y.cr2").size(), std::size_t(2000));
        QVERIFY(!connector_->isConnected());

        const QString out = drain(out_);
        QVERIFY(out.contains(QString::fromStdString("✗ Not found: " + path("missing.bin"))));
        QVERIFY(out.contains("Total: 3 file(s), 4.9 KB"));
        QVERIFY(out.contains("Connecting to mock.test:2121..."));
        QVERIFY(out.contains("✓ Connected to mock.test:2121"));
        QVERIFY(out.contains("✓ Sent 3 file(s) successfully!"));
        QVERIFY(!out.contains("\033["));
    }

    void totalsCountLinksLikeThePlan() {
        QVERIFY(writeFile(tmp_->filePath("pics/x.jpg"), QByteArray(3000, 'x')));
        QVERIFY(writeFile(tmp_->filePath("outside/a.bin"), QByteArray(5000, 'a')));
        QVERIFY(writeFile(tmp_->filePath("outside/b.bin"), QByteArray(5000, 'b')));
        QVERIFY(QFile::link(tmp_->filePath("pics/x.jpg"), tmp_->filePath("pics/alias.jpg")));
        QVERIFY(QFile::link(tmp_->filePath("outside"), tmp_->filePath("pics/out")));

        std::vector<std::string> missing;
        Batch b = QuickSend::plan(*local_, *remote_, {path("pics")}, "/in", 3, missing);
        std::size_t uploads = 0;
        for (const TransferJob& j : b.jobs)
            if (j.kind == JobKind::Upload) ++uploads;
        QCOMPARE(uploads, std::size_t(3));
        QCOMPARE(b.bytes_total, std::uint64_t(6000));

        QCOMPARE(send({path("pics")}, mockAddress("mock.test", "/in")), int(SendPartial));
        const QString out = drain(out_);
        QVERIFY(out.contains("Total: 3 file(s), 5.9 KB"));
        QVERIFY(out.contains("Sent 2 file(s), 1 failed"));
        QCOMPARE(server_->contents("/in/pics/alias.jpg").size(), std::size_t(3000));
        QVERIFY(!server_->exists("/in/pics/out/a.bin"));
        QVERIFY(QFileInfo::exists(tmp_->filePath("outside/a.bin")));
    }

    void existingRemoteDirectoryIsReused() {
        server_->addFile("/drop/old.txt", "old");
        QVERIFY(writeFile(tmp_->filePath("new.txt"), "new"));
        QCOMPARE(send({path("new.txt")}, mockAddress("mock.test", "/drop")), int(SendOk));
        QCOMPARE(server_->contents("/drop/old.txt"), std::string("old"));
        QCOMPARE(server_->contents("/drop/new.txt"), std::string("new"));
    }

    void storedAddressWhenNoneGiven() {
        Error err;
        QVERIFY(connector_->connect(mockAddress("stored.test"), err));
        connector_->disconnect();
        QVERIFY(writeFile(tmp_->filePath("f.txt"), "f"));

        QCOMPARE(send({path("f.txt")}, std::nullopt), int(SendOk));
        QCOMPARE(QString::fromStdString(connector_->address().host), QString("stored.test"));
        QCOMPARE(server_->contents("/f.txt"), std::string("f"));
        QVERIFY(drain(out_).contains("Connecting to stored.test:2121..."));
    }

    void unreachableServer() {
        QVERIFY(writeFile(tmp_->filePath("f.txt"), "f"));
        server_->unreachable_hosts.insert("mock.test");
        QCOMPARE(send({path("f.txt")}, mockAddress()), int(SendConnectFailed));
        const QString out = drain(out_);
        QVERIFY(out.contains("Connection failed: "));
        QVERIFY(!out.contains("Sent"));
        QVERIFY(server_->paths().size() == 1);
    }

    void failedFileIsPartial() {
        QVERIFY(writeFile(tmp_->filePath("ok.txt"), "ok"));
        QVERIFY(writeFile(tmp_->filePath("bad.txt"), "bad"));
        server_->open_failures["/up/bad.txt"] = ErrorCode::PermissionDenied;

        QCOMPARE(send({path("ok.txt"), path("bad.txt")}, mockAddress("mock.test", "/up")), int(SendPartial));
        QVERIFY(server_->exists("/up/ok.txt"));
        QVERIFY(!server_->exists("/up/bad.txt"));
        const QString out = drain(out_);
        QVERIFY(out.contains(QString::fromStdString("✗ " + path("bad.txt") + ": Permission denied")));
        QVERIFY(out.contains("Sent 1 file(s), 1 failed"));
    }

    void connectionLossStopsTheRun() {
        QVERIFY(writeFile(tmp_->filePath("a.bin"), QByteArray(4096, 'a')));
        QVERIFY(writeFile(tmp_->filePath("b.bin"), QByteArray(4096, 'b')));
        server_->drop_after_bytes = 5000;
        QCOMPARE(send({path("a.bin"), path("b.bin")}, mockAddress()), int(SendConnectFailed));
        QVERIFY(server_->exists("/a.bin"));
        QVERIFY(!server_->exists("/b.bin"));
        QVERIFY(drain(out_).contains("Connection lost: "));
    }

    void planMergesPathsIntoOneBatch() {
        QVERIFY(writeFile(tmp_->filePath("one.txt"), "1"));
        QVERIFY(writeFile(tmp_->filePath("tree/two.txt"), "22"));
        QVERIFY(writeFile(tmp_->filePath("tree/three.txt"), "333"));

        std::vector<std::string> missing;
        Batch b = QuickSend::plan(*local_, *remote_, {path("one.txt"), path("ghost"), path("tree") + "/"}, "/dst", 9,
                                  missing);
        QCOMPARE(missing.size(), std::size_t(1));
        QCOMPARE(QString::fromStdString(missing[0]), QString::fromStdString(path("ghost")));

        QCOMPARE(b.token, std::uint64_t(9));
        QCOMPARE(int(b.kind), int(JobKind::Upload));
        QCOMPARE(b.jobs.size(), std::size_t(4));
        QCOMPARE(b.bytes_total, std::uint64_t(6));
        for (std::size_t i = 0; i < b.jobs.size(); ++i) QCOMPARE(b.jobs[i].id, std::uint64_t(i + 1));

        QCOMPARE(QString::fromStdString(b.jobs[0].dest.path), QString("/dst/one.txt"));
        QCOMPARE(int(b.jobs[1].kind), int(JobKind::Mkdir));
        QCOMPARE(QString::fromStdString(b.jobs[1].dest.path), QString("/dst/tree"));
    }
};

QTEST_GUILESS_MAIN(TestQuickSend)
#include "tst_quicksend.moc"
