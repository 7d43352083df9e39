#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <string>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "report/SnapshotWriter.hpp"

namespace {

treesnap::Snapshot sampleSnapshot()
{
    treesnap::Snapshot snapshot;
    snapshot.rootPath = "/work/project";

    treesnap::FileRecord main;
    main.relativePath = "src/Main.java";
    main.size = "24 B";
    main.modifiedAt = "2024-03-01 10:15:00";
    main.language = treesnap::Language::Java;
    main.content = std::string("class Main {}\n// end\n\n\n");
    main.vcsStatus = treesnap::VcsStatus::Modified;

    treesnap::FileRecord make;
    make.relativePath = "Makefile";
    make.size = "5 B";
    make.modifiedAt = "2024-03-01 10:16:00";
    make.language = treesnap::Language::Other;

    snapshot.files = {make, main};
    return snapshot;
}

} // namespace

class SnapshotWriterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testIndexLines();
    void testTextWithoutContents();
    void testTextWithContents();
    void testTextTruncatesOnCharacterBoundary();
    void testJsonReport();
    void testWriteFailsForMissingDirectory();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SnapshotWriterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SnapshotWriterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SnapshotWriterTests::testIndexLines()
{
    const QString index = QString::fromStdString(treesnap::renderSnapshotIndex(sampleSnapshot()));
    const QStringList lines = index.split(QChar('\n'), Qt::SkipEmptyParts);

    QCOMPARE(lines.size(), 3);
    QCOMPARE(lines.at(0), QStringLiteral("Project Snapshot at: /work/project"));
    QCOMPARE(lines.at(1),
             QStringLiteral(" - Makefile | Other | 5 B | modified 2024-03-01 10:16:00 | vcs: clean"));
    QCOMPARE(lines.at(2),
             QStringLiteral(" - src/Main.java | Java | 24 B | modified 2024-03-01 10:15:00 | vcs: modified"));
}

void SnapshotWriterTests::testTextWithoutContents()
{
    const QString text = QString::fromStdString(
        treesnap::renderSnapshotText(sampleSnapshot(), false, 1024));

    QVERIFY(text.startsWith(QStringLiteral("Project Snapshot at: /work/project\n")));
    QVERIFY(text.contains(QStringLiteral("src/Main.java (Java, 24 B, modified 2024-03-01 10:15:00, vcs: modified)")));
    QVERIFY(!text.contains(QStringLiteral("FILE CONTENT")));
    QVERIFY(!text.contains(QStringLiteral("class Main")));
    QCOMPARE(text.count(QStringLiteral(
                 "==============================================================\n")),
             2);
}

void SnapshotWriterTests::testTextWithContents()
{
    const QString text = QString::fromStdString(
        treesnap::renderSnapshotText(sampleSnapshot(), true, 1024));

    QCOMPARE(text.count(QStringLiteral("FILE CONTENT")), 1);
    QVERIFY(text.contains(QStringLiteral("class Main {}\n// end\n")));
    QVERIFY(!text.contains(QStringLiteral("truncated")));
}

void SnapshotWriterTests::testTextTruncatesOnCharacterBoundary()
{
    treesnap::Snapshot snapshot;
    snapshot.rootPath = "/work/project";
    treesnap::FileRecord record;
    record.relativePath = "notes.md";
    record.size = "7 B";
    record.modifiedAt = "2024-03-01 10:15:00";
    record.language = treesnap::Language::Markdown;
    // "ab" followed by the two-byte "é" and "cd"; a cut after three bytes
    // would split the "é".
    record.content = std::string("ab\xC3\xA9" "cd");
    snapshot.files = {record};

    const std::string text = treesnap::renderSnapshotText(snapshot, true, 3);
    QVERIFY(text.find("---------------- FILE CONTENT ----------------\nab\n...(truncated in TXT)\n")
            != std::string::npos);
    QVERIFY(text.find('\xC3') == std::string::npos);

    const std::string whole = treesnap::renderSnapshotText(snapshot, true, 6);
    QVERIFY(whole.find("ab\xC3\xA9" "cd\n") != std::string::npos);
    QVERIFY(whole.find("truncated") == std::string::npos);
}

void SnapshotWriterTests::testJsonReport()
{
    const QString path = m_tempDir.path() + QStringLiteral("/snapshot.json");
    QVERIFY(treesnap::writeSnapshotJson(path, sampleSnapshot()));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readAll().toStdString());

    QCOMPARE(QString::fromStdString(parsed.at("rootPath").get<std::string>()),
             QStringLiteral("/work/project"));
    QCOMPARE(parsed.at("files").size(), static_cast<size_t>(2));

    const auto &make = parsed.at("files").at(0);
    QCOMPARE(QString::fromStdString(make.at("relativePath").get<std::string>()),
             QStringLiteral("Makefile"));
    QVERIFY(make.at("content").is_null());
    QCOMPARE(QString::fromStdString(make.at("vcsStatus").get<std::string>()), QStringLiteral("clean"));

    const auto &main = parsed.at("files").at(1);
    QCOMPARE(QString::fromStdString(main.at("modified").get<std::string>()),
             QStringLiteral("2024-03-01 10:15:00"));
    QCOMPARE(QString::fromStdString(main.at("language").get<std::string>()), QStringLiteral("Java"));
    QCOMPARE(QString::fromStdString(main.at("vcsStatus").get<std::string>()),
             QStringLiteral("modified"));

    const auto restored = parsed.get<treesnap::Snapshot>();
    QVERIFY(restored.files.at(1).content.has_value());
    QVERIFY(!restored.files.at(0).content.has_value());
    QVERIFY(restored.files.at(1).vcsStatus == treesnap::VcsStatus::Modified);
}

void SnapshotWriterTests::testWriteFailsForMissingDirectory()
{
    const QString path = m_tempDir.path() + QStringLiteral("/no/such/dir/snapshot.txt");
    QVERIFY(!treesnap::writeSnapshotText(path, sampleSnapshot(), false, 1024));
    QVERIFY(!treesnap::writeSnapshotJson(path, sampleSnapshot()));
}

QTEST_MAIN(SnapshotWriterTests)
#include "test_snapshot_writer.moc"
