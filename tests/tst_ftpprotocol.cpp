#include <QtTest>
#include <QDateTime>

#include "ftpdeck/FtpProtocol.hpp"

using namespace ftpdeck;

static std::uint64_t utc(int y, int mo, int d, int h = 0, int mi = 0) {
    return static_cast<std::uint64_t>(QDateTime(QDate(y, mo, d), QTime(h, mi), Qt::UTC).toSecsSinceEpoch());
}

// 2024-06-01 12:00 UTC, so "HH:MM" listings resolve deterministically
static std::time_t fixedNow() {
    return static_cast<std::time_t>(utc(2024, 6, 1, 12, 0));
}

class TestFtpProtocol : public QObject {
    Q_OBJECT

private slots:
    void singleLineReply() {
        ftp::ReplyReader rr;
        const char data[] = "220 Service ready\r\n";
        rr.feed(data, sizeof(data) - 1);
        ftp::Reply r;
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 220);
        QCOMPARE(QString::fromStdString(r.text), QString("Service ready"));
        QVERIFY(r.completion());
        QVERIFY(!rr.next(r));
    }

    void multiLineReply() {
        ftp::ReplyReader rr;
        const char data[] = "211-Features:\r\n MDTM\r\n SIZE\r\n211 End\r\n";
        rr.feed(data, sizeof(data) - 1);
        ftp::Reply r;
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 211);
        QCOMPARE(QString::fromStdString(r.text), QString("Features:\n MDTM\n SIZE\nEnd"));
    }

    // A line that looks like the closing code but continues with '-' stays inside the block
    void multiLineReplyWithNestedCode() {
        ftp::ReplyReader rr;
        const char data[] = "230-Welcome\r\n230-Quota: 1 GB\r\n230 Logged in\r\n";
        rr.feed(data, sizeof(data) - 1);
        ftp::Reply r;
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 230);
        QVERIFY(QString::fromStdString(r.text).endsWith("Logged in"));
        QVERIFY(!rr.next(r));
    }

    void replySplitAcrossReads() {
        ftp::ReplyReader rr;
        ftp::Reply r;
        rr.feed("150 Opening", 11);
        QVERIFY(!rr.next(r));
        const char rest[] = " data connection\r\n226 Transfer complete\r\n";
        rr.feed(rest, sizeof(rest) - 1);
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 150);
        QVERIFY(r.preliminary());
        QCOMPARE(QString::fromStdString(r.text), QString("Opening data connection"));
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 226);
    }

    void resetDropsPartialInput() {
        ftp::ReplyReader rr;
        rr.feed("220-Hello\r\n", 11);
        rr.reset();
        const char data[] = "331 Password required\r\n";
        rr.feed(data, sizeof(data) - 1);
        ftp::Reply r;
        QVERIFY(rr.next(r));
        QCOMPARE(r.code, 331);
        QVERIFY(r.intermediate());
    }

    void pasvReply() {
        std::string host;
        std::uint16_t port = 0;
        QVERIFY(ftp::parsePasv("Entering Passive Mode (192,168,1,2,19,137)", host, port));
        QCOMPARE(QString::fromStdString(host), QString("192.168.1.2"));
        QCOMPARE(int(port), 19 * 256 + 137);

        QVERIFY(ftp::parsePasv("Entering Passive Mode 10,0,0,1,4,1", host, port));
        QCOMPARE(QString::fromStdString(host), QString("10.0.0.1"));
        QCOMPARE(int(port), 1025);
    }

    void pasvReplyRejectsGarbage() {
        std::string host;
        std::uint16_t port = 0;
        QVERIFY(!ftp::parsePasv("Entering Passive Mode (300,1,1,1,1,1)", host, port));
        QVERIFY(!ftp::parsePasv("Entering Passive Mode", host, port));
        QVERIFY(!ftp::parsePasv("(1,2,3,4,5)", host, port));
    }

    void epsvReply() {
        std::uint16_t port = 0;
        QVERIFY(ftp::parseEpsv("Entering Extended Passive Mode (|||6446|)", port));
        QCOMPARE(int(port), 6446);
        QVERIFY(!ftp::parseEpsv("Entering Extended Passive Mode (|||)", port));
        QVERIFY(!ftp::parseEpsv("Entering Extended Passive Mode", port));
        QVERIFY(!ftp::parseEpsv("(|||70000|)", port));
    }

    void pwdReply() {
        std::string path;
        QVERIFY(ftp::parsePwd("\"/home/ftp\" is the current directory", path));
        QCOMPARE(QString::fromStdString(path), QString("/home/ftp"));
        QVERIFY(ftp::parsePwd("\"/srv/\"\"odd\"\" dir\" is current", path));
        QCOMPARE(QString::fromStdString(path), QString("/srv/\"odd\" dir"));
        QVERIFY(!ftp::parsePwd("current directory unknown", path));
    }

    void unixFileWithYear() {
        auto e = ftp::parseListLine("-rw-r--r--    1 ftp      ftp          1234 Mar 15  2023 report final.pdf",
                                    fixedNow());
        QVERIFY(e.has_value());
        QCOMPARE(QString::fromStdString(e->name), QString("report final.pdf"));
        QVERIFY(!e->isDir());
        QCOMPARE(e->size_bytes, std::uint64_t(1234));
        QCOMPARE(e->modified_at, utc(2023, 3, 15));
        QVERIFY(e->permission_bits.has_value());
        QCOMPARE(*e->permission_bits, std::uint32_t(0644));
    }

    void unixDirectoryWithTime() {
        auto e = ftp::parseListLine("drwxr-xr-x    2 ftp      ftp          4096 Jan 10 12:30 photos", fixedNow());
        QVERIFY(e.has_value());
        QCOMPARE(QString::fromStdString(e->name), QString("photos"));
        QVERIFY(e->isDir());
        QCOMPARE(e->size_bytes, std::uint64_t(0));
        QCOMPARE(e->modified_at, utc(2024, 1, 10, 12, 30));
        QCOMPARE(*e->permission_bits, std::uint32_t(0755));
    }

    // "Dec 24 08:00" seen in June can only be last December
    void unixTimeInTheFutureMeansLastYear() {
        auto e = ftp::parseListLine("-rw-r--r--    1 ftp      ftp            10 Dec 24 08:00 xmas.txt", fixedNow());
        QVERIFY(e.has_value());
        QCOMPARE(e->modified_at, utc(2023, 12, 24, 8, 0));
    }

    void unixSymlinkKeepsLinkName() {
        auto e = ftp::parseListLine("lrwxrwxrwx    1 ftp      ftp            11 Feb  2  2022 latest -> releases/v2",
                                    fixedNow());
        QVERIFY(e.has_value());
        QCOMPARE(QString::fromStdString(e->name), QString("latest"));
        QCOMPARE(e->size_bytes, std::uint64_t(11));
    }

    void unixWithoutGroupColumn() {
        auto e = ftp::parseListLine("-rw-r--r-- 1 owner 512 Apr  1  2021 a.txt", fixedNow());
        QVERIFY(e.has_value());
        QCOMPARE(QString::fromStdString(e->name), QString("a.txt"));
        QCOMPARE(e->size_bytes, std::uint64_t(512));
    }

    void dosDirectory() {
        auto e = ftp::parseListLine("01-31-24  10:05AM       <DIR>          Reports", fixedNow());
        QVERIFY(e.has_value());
        QVERIFY(e->isDir());
        QCOMPARE(QString::fromStdString(e->name), QString("Reports"));
        QCOMPARE(e->modified_at, utc(2024, 1, 31, 10, 5));
    }

    void dosFileAfternoon() {
        auto e = ftp::parseListLine("02-14-23  03:30PM                 1234 notes 2023.txt", fixedNow());
        QVERIFY(e.has_value());
        QVERIFY(!e->isDir());
        QCOMPARE(QString::fromStdString(e->name), QString("notes 2023.txt"));
        QCOMPARE(e->size_bytes, std::uint64_t(1234));
        QCOMPARE(e->modified_at, utc(2023, 2, 14, 15, 30));
    }

    void skippedLines() {
        QVERIFY(!ftp::parseListLine("total 12", fixedNow()));
        QVERIFY(!ftp::parseListLine("drwxr-xr-x    2 ftp ftp 4096 Jan 10 12:30 .", fixedNow()));
        QVERIFY(!ftp::parseListLine("drwxr-xr-x    2 ftp ftp 4096 Jan 10 12:30 ..", fixedNow()));
        QVERIFY(!ftp::parseListLine("hello world", fixedNow()));
        QVERIFY(!ftp::parseListLine("", fixedNow()));
    }

    void listingMixesStyles() {
        const std::string data =
            "total 2\r\n"
            "-rw-r--r--    1 ftp      ftp             5 Mar 15  2023 a.txt\r\n"
            "drwxr-xr-x    2 ftp      ftp          4096 Mar 15  2023 .\r\n"
            "01-31-24  10:05AM       <DIR>          Reports\r\n";
        std::vector<DirEntry> out = ftp::parseListing(data, fixedNow());
        QCOMPARE(out.size(), std::size_t(2));
        QCOMPARE(QString::fromStdString(out[0].name), QString("a.txt"));
        QCOMPARE(QString::fromStdString(out[1].name), QString("Reports"));
    }

    void errorForReply_data() {
        QTest::addColumn<int>("code");
        QTest::addColumn<QString>("text");
        QTest::addColumn<int>("expected");

        QTest::newRow("421") << 421 << "Timeout" << int(ErrorCode::ConnectionLost);
        QTest::newRow("426") << 426 << "Transfer aborted" << int(ErrorCode::Interrupted);
        QTest::newRow("451") << 451 << "Local error" << int(ErrorCode::IOError);
        QTest::newRow("552") << 552 << "Quota exceeded" << int(ErrorCode::DiskFull);
        QTest::newRow("530") << 530 << "Not logged in" << int(ErrorCode::PermissionDenied);
        QTest::newRow("550 missing") << 550 << "No such file or directory" << int(ErrorCode::NotFound);
        QTest::newRow("550 denied") << 550 << "Permission denied" << int(ErrorCode::PermissionDenied);
        QTest::newRow("550 exists") << 550 << "File exists" << int(ErrorCode::AlreadyExists);
        QTest::newRow("500") << 500 << "Syntax error" << int(ErrorCode::Protocol);
    }

    void errorForReply() {
        QFETCH(int, code);
        QFETCH(QString, text);
        QFETCH(int, expected);
        ftp::Reply r;
        r.code = code;
        r.text = text.toStdString();
        QCOMPARE(int(ftp::errorForReply(r)), expected);
    }
};

QTEST_GUILESS_MAIN(TestFtpProtocol)
#include "tst_ftpprotocol.moc"
