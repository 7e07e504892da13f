#include <QtTest>
#include <QTemporaryDir>

#include "TestSupport.hpp"
#include "ftpdeck/Endpoint.hpp"

#include <cerrno>

#include <unistd.h>

using namespace ftpdeck;
using testsupport::readFile;
using testsupport::str;
using testsupport::writeFile;

class TestLocalEndpoint : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* dir_ = nullptr;

    std::string path(const QString& rel) const { return str(dir_->filePath(rel)); }

private slots:
    void init() {
        dir_ = new QTemporaryDir();
        QVERIFY(dir_->isValid());
    }

    void cleanup() {
        delete dir_;
        dir_ = nullptr;
    }

    void errnoMapping() {
        QCOMPARE(int(errorForErrno(ENOENT)), int(ErrorCode::NotFound));
        QCOMPARE(int(errorForErrno(ENOTDIR)), int(ErrorCode::NotFound));
        QCOMPARE(int(errorForErrno(EACCES)), int(ErrorCode::PermissionDenied));
        QCOMPARE(int(errorForErrno(EROFS)), int(ErrorCode::PermissionDenied));
        QCOMPARE(int(errorForErrno(EEXIST)), int(ErrorCode::AlreadyExists));
        QCOMPARE(int(errorForErrno(ENOSPC)), int(ErrorCode::DiskFull));
        QCOMPARE(int(errorForErrno(EIO)), int(ErrorCode::IOError));
    }

    void listReportsKindsAndSizes() {
        QVERIFY(writeFile(dir_->filePath("a.txt"), "hello"));
        QVERIFY(QDir(dir_->path()).mkdir("sub"));
        LocalEndpoint ep(dir_->path().toStdString());
        QCOMPARE(QString::fromStdString(ep.cwd()), dir_->path());

        std::vector<DirEntry> out;
        Error err;
        QVERIFY(ep.list(ep.cwd(), out, err));
        sortEntries(out);
        QCOMPARE(out.size(), std::size_t(2));
        QCOMPARE(QString::fromStdString(out[0].name), QString("sub"));
        QVERIFY(out[0].isDir());
        QCOMPARE(QString::fromStdString(out[1].name), QString("a.txt"));
        QCOMPARE(out[1].size_bytes, std::uint64_t(5));
        QVERIFY(out[1].modified_at > 0);
    }

    void listTreatsSymlinksAsFiles() {
        QVERIFY(writeFile(dir_->filePath("target/inner.txt"), "inner"));
        QVERIFY(writeFile(dir_->filePath("data.txt"), "12345678"));
        QVERIFY(QDir(dir_->path()).mkdir("view"));
        QVERIFY(QFile::link(dir_->filePath("target"), dir_->filePath("view/dirlink")));
        QVERIFY(QFile::link(dir_->filePath("data.txt"), dir_->filePath("view/filelink")));
        QCOMPARE(::symlink(path("nowhere").c_str(), path("view/dangling").c_str()), 0);

        LocalEndpoint ep(dir_->path().toStdString());
        std::vector<DirEntry> out;
        Error err;
        QVERIFY(ep.list(path("view"), out, err));
        sortEntries(out);
        QCOMPARE(out.size(), std::size_t(3));
        for (const DirEntry& e : out) QVERIFY(!e.isDir());
        QCOMPARE(QString::fromStdString(out[0].name), QString("dangling"));
        QCOMPARE(out[0].size_bytes, std::uint64_t(0));
        QCOMPARE(QString::fromStdString(out[1].name), QString("dirlink"));
        QCOMPARE(out[1].size_bytes, std::uint64_t(0));
        QCOMPARE(QString::fromStdString(out[2].name), QString("filelink"));
        QCOMPARE(out[2].size_bytes, std::uint64_t(8));

        // Deleting the link leaves the directory it pointed at
        QVERIFY(ep.deleteFile(path("view/dirlink"), err));
        QCOMPARE(readFile(dir_->filePath("target/inner.txt")), QByteArray("inner"));
    }

    void listMissingDirectory() {
        LocalEndpoint ep;
        std::vector<DirEntry> out;
        Error err;
        QVERIFY(!ep.list(path("nope"), out, err));
        QCOMPARE(int(err.code), int(ErrorCode::NotFound));
    }

    void renameRefusesExistingTarget() {
        QVERIFY(writeFile(dir_->filePath("a"), "A"));
        QVERIFY(writeFile(dir_->filePath("b"), "B"));
        LocalEndpoint ep;
        Error err;
        QVERIFY(!ep.rename(path("a"), path("b"), err));
        QCOMPARE(int(err.code), int(ErrorCode::AlreadyExists));
        QCOMPARE(readFile(dir_->filePath("b")), QByteArray("B"));

        err.clear();
        QVERIFY(ep.rename(path("a"), path("c"), err));
        QVERIFY(!QFile::exists(dir_->filePath("a")));
        QCOMPARE(readFile(dir_->filePath("c")), QByteArray("A"));
    }

    void mkdirAndDeletes() {
        LocalEndpoint ep;
        Error err;
        QVERIFY(ep.mkdir(path("d"), err));
        QVERIFY(!ep.mkdir(path("d"), err));
        QCOMPARE(int(err.code), int(ErrorCode::AlreadyExists));

        QVERIFY(writeFile(dir_->filePath("d/f"), "x"));
        err.clear();
        QVERIFY(!ep.deleteEmptyDir(path("d"), err));
        QVERIFY(!err.ok());
        err.clear();
        QVERIFY(ep.deleteFile(path("d/f"), err));
        QVERIFY(ep.deleteEmptyDir(path("d"), err));
        QVERIFY(!QFileInfo::exists(dir_->filePath("d")));
    }

    void channelsCopyBytes() {
        QVERIFY(writeFile(dir_->filePath("src.bin"), QByteArray(100000, 'z')));
        LocalEndpoint ep;
        Error err;
        auto in = ep.openRead(path("src.bin"), err);
        QVERIFY(in);
        auto out = ep.openWrite(path("dst.bin"), err);
        QVERIFY(out);
        char buf[4096];
        for (;;) {
            long n = in->read(buf, sizeof(buf), err);
            QVERIFY(n >= 0);
            if (n == 0) break;
            QVERIFY(out->write(buf, static_cast<std::size_t>(n), err));
        }
        QVERIFY(in->close(err));
        QVERIFY(out->close(err));
        QCOMPARE(readFile(dir_->filePath("dst.bin")), QByteArray(100000, 'z'));

        std::uint64_t size = 0;
        QVERIFY(ep.statSize(path("dst.bin"), size, err));
        QCOMPARE(size, std::uint64_t(100000));
    }

    void openReadOnDirectoryFails() {
        LocalEndpoint ep;
        Error err;
        QVERIFY(!ep.openRead(dir_->path().toStdString(), err));
        QCOMPARE(int(err.code), int(ErrorCode::IOError));
    }

    void readTextTruncates() {
        QVERIFY(writeFile(dir_->filePath("long.txt"), QByteArray(40000, 'a')));
        QVERIFY(writeFile(dir_->filePath("short.txt"), "line one\nline two\n"));
        LocalEndpoint ep;
        std::string text;
        bool truncated = true;
        Error err;
        QVERIFY(ep.readText(path("short.txt"), 1024, text, truncated, err));
        QVERIFY(!truncated);
        QCOMPARE(QString::fromStdString(text), QString("line one\nline two\n"));

        QVERIFY(ep.readText(path("long.txt"), 1024, text, truncated, err));
        QVERIFY(truncated);
        QCOMPARE(text.size(), std::size_t(1024));
    }

    void pathHelpers() {
        LocalEndpoint ep("/");
        QCOMPARE(QString::fromStdString(ep.join("/home/u", "f.txt")), QString("/home/u/f.txt"));
        QCOMPARE(QString::fromStdString(ep.parentOf("/home/u/")), QString("/home"));
        QCOMPARE(QString::fromStdString(ep.parentOf("/home")), QString("/"));
        QCOMPARE(QString::fromStdString(ep.parentOf("/")), QString("/"));
    }
};

QTEST_GUILESS_MAIN(TestLocalEndpoint)
#include "tst_localendpoint.moc"
