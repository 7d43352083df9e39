#include <QtTest/QtTest>

#include "collector/path_classifier.hpp"
#include "common/collector_config.hpp"

class PathClassifierTests : public QObject
{
    Q_OBJECT
private slots:
    void testIgnoredDirectories();
    void testIgnoredFiles();
    void testSecretAndBinaryNames();
    void testPathSuffixDenylist();
    void testContentEligibility();
    void testSnapshotArtifacts();
    void testExtensionAndLanguage();
};

void PathClassifierTests::testIgnoredDirectories()
{
    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());

    QVERIFY(classifier.isIgnoredDirectory(".git"));
    QVERIFY(classifier.isIgnoredDirectory("node_modules"));
    QVERIFY(classifier.isIgnoredDirectory("snapshots"));
    QVERIFY(classifier.isIgnoredDirectory("Build"));
    QVERIFY(!classifier.isIgnoredDirectory("src"));
    // Exact segment match only.
    QVERIFY(!classifier.isIgnoredDirectory("builder"));
}

void PathClassifierTests::testIgnoredFiles()
{
    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());

    QVERIFY(classifier.isIgnoredFile("mvnw", "mvnw"));
    QVERIFY(classifier.isIgnoredFile("MVNW.cmd", "tools/MVNW.cmd"));
    QVERIFY(classifier.isIgnoredFile("snapshot.json", "snapshot.json"));
    QVERIFY(classifier.isIgnoredFile("treesnap", "bin/treesnap"));
    QVERIFY(!classifier.isIgnoredFile("Main.java", "src/Main.java"));
    QVERIFY(!classifier.isIgnoredFile("Makefile", "Makefile"));
}

void PathClassifierTests::testSecretAndBinaryNames()
{
    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());

    QVERIFY(classifier.isSecretName(".env"));
    QVERIFY(classifier.isSecretName(".env.local"));
    QVERIFY(classifier.isSecretName("app-secrets.yml"));
    QVERIFY(classifier.isSecretName("Credentials.json"));
    QVERIFY(classifier.isSecretName("server.pem"));
    // Substring heuristic, so some innocent names match too.
    QVERIFY(classifier.isSecretName("keyboard.js"));
    QVERIFY(!classifier.isSecretName("Main.java"));

    QVERIFY(classifier.isBinaryName("logo.PNG"));
    QVERIFY(classifier.isBinaryName("archive.tar.gz"));
    QVERIFY(classifier.isBinaryName("libfoo.so"));
    QVERIFY(!classifier.isBinaryName("notes.txt"));

    QVERIFY(classifier.isIgnoredFile(".env", ".env"));
    QVERIFY(classifier.isIgnoredFile("logo.png", "assets/logo.png"));
}

void PathClassifierTests::testPathSuffixDenylist()
{
    treesnap::CollectorConfig config = treesnap::CollectorConfig::defaults();
    config.ignoredFiles.push_back("tools/collector.cpp");
    const treesnap::PathClassifier classifier(config);

    QVERIFY(classifier.isIgnoredFile("collector.cpp", "tools/collector.cpp"));
    QVERIFY(classifier.isIgnoredFile("Collector.cpp", "repo/Tools/Collector.cpp"));
    QVERIFY(!classifier.isIgnoredFile("collector.cpp", "src/collector.cpp"));
    QVERIFY(!classifier.isIgnoredFile("collector.cpp", "collector.cpp"));
}

void PathClassifierTests::testContentEligibility()
{
    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());

    QVERIFY(classifier.isEligibleForContent("Main.java"));
    QVERIFY(classifier.isEligibleForContent("README.MD"));
    QVERIFY(classifier.isEligibleForContent("main.cpp"));
    QVERIFY(!classifier.isEligibleForContent("Makefile"));
    QVERIFY(!classifier.isEligibleForContent("data.csv"));
    QVERIFY(!classifier.isEligibleForContent(".gitignore"));
}

void PathClassifierTests::testSnapshotArtifacts()
{
    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());

    QVERIFY(classifier.isSnapshotArtifact("snapshot-20240101-120000.json"));
    QVERIFY(classifier.isSnapshotArtifact("SNAPSHOT-20240101-120000.txt"));
    QVERIFY(!classifier.isSnapshotArtifact("snapshot-20240101-120000.md"));
    QVERIFY(!classifier.isSnapshotArtifact("my-snapshot-1.json"));
}

void PathClassifierTests::testExtensionAndLanguage()
{
    QCOMPARE(QString::fromStdString(treesnap::extensionOf("archive.tar.gz")),
             QStringLiteral(".gz"));
    QCOMPARE(QString::fromStdString(treesnap::extensionOf("Main.JAVA")),
             QStringLiteral(".java"));
    QVERIFY(treesnap::extensionOf("Makefile").empty());

    const treesnap::PathClassifier classifier(treesnap::CollectorConfig::defaults());
    QVERIFY(classifier.languageFor("view.tsx") == treesnap::Language::Tsx);
    QVERIFY(classifier.languageFor("index.ts") == treesnap::Language::TypeScript);
    QVERIFY(classifier.languageFor("Build.KT") == treesnap::Language::Kotlin);
    QVERIFY(classifier.languageFor("engine.hpp") == treesnap::Language::Cpp);
    QVERIFY(classifier.languageFor("Makefile") == treesnap::Language::Other);
    QVERIFY(classifier.languageFor("data.csv") == treesnap::Language::Other);
}

QTEST_MAIN(PathClassifierTests)
#include "test_path_classifier.moc"
