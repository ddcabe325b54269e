/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionScannerTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// PixelAgents
#include "../agents/SessionScanner.h"

using namespace PixelAgents;

namespace
{
ClusterNode localNode()
{
    ClusterNode node;
    node.name = QStringLiteral("a");
    node.address = QStringLiteral("localhost");
    node.isLocal = true;
    return node;
}

SupervisorConfig testConfig(const QString &root)
{
    SupervisorConfig config;
    config.projectsRoot = root;
    config.scanIntervalMs = 50;
    config.activityWindowMinutes = 10;
    return config;
}

QString createSession(const QString &root, const QString &projectDir, const QString &name, const QDateTime &modified = QDateTime())
{
    QDir(root).mkpath(projectDir);
    const QString path = root + QLatin1Char('/') + projectDir + QLatin1Char('/') + name;

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return QString();
    }
    file.write("{\"type\":\"user\",\"message\":{\"content\":\"hi\"}}\n");
    file.flush();
    if (modified.isValid()) {
        file.setFileTime(modified, QFileDevice::FileModificationTime);
    }
    file.close();
    return path;
}

QStringList discoveredPaths(const QSignalSpy &spy)
{
    QStringList paths;
    for (const QList<QVariant> &arguments : spy) {
        paths << arguments.at(0).value<SessionFile>().path;
    }
    return paths;
}
}

void SessionScannerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void SessionScannerTest::testEncodeProjectDirName()
{
    QCOMPARE(SessionFile::encodeProjectDirName(QStringLiteral("/home/u/app")), QStringLiteral("-home-u-app"));
    QCOMPARE(SessionFile::encodeProjectDirName(QStringLiteral("C:\\Users\\Dev\\Arcadia")), QStringLiteral("C--Users-Dev-Arcadia"));
}

void SessionScannerTest::testProjectKeyFromDirName()
{
    QCOMPARE(SessionFile::projectKeyFromDirName(QStringLiteral("-home-u-app")), QStringLiteral("/home/u/app"));
    QCOMPARE(SessionFile::projectKeyFromDirName(SessionFile::encodeProjectDirName(QStringLiteral("/srv/x"))), QStringLiteral("/srv/x"));
}

void SessionScannerTest::testFromPathUnderClaudeProjects()
{
    const SessionFile file = SessionFile::fromPath(localNode(), QStringLiteral("/home/u/.claude/projects/-home-u-app/abc.jsonl"));

    QCOMPARE(file.projectDir, QStringLiteral("/home/u/.claude/projects/-home-u-app"));
    QCOMPARE(file.projectKey, QStringLiteral("/home/u/app"));
    QCOMPARE(file.identity(), QStringLiteral("a:/home/u/.claude/projects/-home-u-app/abc.jsonl"));
    QVERIFY(file.isValid());
}

void SessionScannerTest::testFromPathElsewhere()
{
    const SessionFile file = SessionFile::fromPath(localNode(), QStringLiteral("/tmp/root/-srv-data/s.jsonl"));

    QCOMPARE(file.projectDir, QStringLiteral("/tmp/root/-srv-data"));
    QCOMPARE(file.projectKey, QStringLiteral("/srv/data"));
}

void SessionScannerTest::testSessionId()
{
    const SessionFile file = SessionFile::fromPath(localNode(), QStringLiteral("/r/-p/0b7d1c5e-1111-2222-3333-444455556666.jsonl"));
    QCOMPARE(file.sessionId(), QStringLiteral("0b7d1c5e-1111-2222-3333-444455556666"));
}

void SessionScannerTest::testEmptyRootEmitsNothing()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    QDir(root.path()).mkpath(QStringLiteral("-home-u-app"));

    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);
    QSignalSpy finishedSpy(&scanner, &SessionScanner::scanFinished);

    scanner.scan();

    QCOMPARE(discoveredSpy.count(), 0);
    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(scanner.initialScanDone());
}

void SessionScannerTest::testMissingRootIsNotFatal()
{
    QTemporaryDir root;
    LocalSessionScanner scanner(localNode(), testConfig(root.filePath(QStringLiteral("does-not-exist"))));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    scanner.scan();
    scanner.scan();

    QCOMPARE(discoveredSpy.count(), 0);
}

void SessionScannerTest::testDiscoversEachFileOnce()
{
    QTemporaryDir root;
    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    const QString first = createSession(root.path(), QStringLiteral("-home-u-app"), QStringLiteral("s1.jsonl"));
    scanner.scan();
    scanner.scan();
    QCOMPARE(discoveredPaths(discoveredSpy), QStringList{first});
    QVERIFY(discoveredSpy.at(0).at(1).toBool()); // initial scan

    const QString second = createSession(root.path(), QStringLiteral("-home-u-other"), QStringLiteral("s2.jsonl"));
    scanner.scan();
    scanner.scan();
    QCOMPARE(discoveredPaths(discoveredSpy), (QStringList{first, second}));
    QVERIFY(!discoveredSpy.at(1).at(1).toBool());

    const SessionFile file = discoveredSpy.at(1).at(0).value<SessionFile>();
    QCOMPARE(file.projectKey, QStringLiteral("/home/u/other"));
    QCOMPARE(file.node.name, QStringLiteral("a"));
}

void SessionScannerTest::testInitialScanHonoursActivityWindow()
{
    QTemporaryDir root;
    const QDateTime now = QDateTime::currentDateTime();
    const QString dormant = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("old.jsonl"), now.addSecs(-30 * 60));
    const QString recent = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("recent.jsonl"), now.addSecs(-2 * 60));

    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    scanner.scan();
    QCOMPARE(discoveredPaths(discoveredSpy), QStringList{recent});

    // The dormant file was looked at and is never reported, even if touched
    QVERIFY(scanner.isKnown(dormant));
    createSession(root.path(), QStringLiteral("-p"), QStringLiteral("old.jsonl"));
    scanner.scan();
    QCOMPARE(discoveredSpy.count(), 1);
}

void SessionScannerTest::testLaterScansIgnoreActivityWindow()
{
    QTemporaryDir root;
    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    scanner.scan();
    QVERIFY(scanner.initialScanDone());

    // Copied in with an old timestamp after startup: still new to us
    const QString copied = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("copied.jsonl"), QDateTime::currentDateTime().addDays(-3));
    scanner.scan();

    QCOMPARE(discoveredPaths(discoveredSpy), QStringList{copied});
}

void SessionScannerTest::testKnownPredicateRemembersPath()
{
    QTemporaryDir root;
    const QString claimed = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("claimed.jsonl"));
    const QString free = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("free.jsonl"));

    bool claimedIsKnown = true;
    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    scanner.setKnownPredicate([&](const SessionFile &file) {
        return claimedIsKnown && file.path == claimed;
    });
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    scanner.scan();
    QCOMPARE(discoveredPaths(discoveredSpy), QStringList{free});

    // Released later: still not reported, the path was already considered
    claimedIsKnown = false;
    scanner.scan();
    QCOMPARE(discoveredSpy.count(), 1);
    QVERIFY(scanner.isKnown(claimed));
}

void SessionScannerTest::testMarkKnown()
{
    QTemporaryDir root;
    const QString path = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("s.jsonl"));

    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    scanner.markKnown(path);
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);

    scanner.scan();
    QCOMPARE(discoveredSpy.count(), 0);
}

void SessionScannerTest::testListDirectoryNewestFirst()
{
    QTemporaryDir root;
    const QDateTime now = QDateTime::currentDateTime();
    const QString older = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("b.jsonl"), now.addSecs(-120));
    const QString newer = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("a.jsonl"), now.addSecs(-10));
    QFile notes(root.path() + QStringLiteral("/-p/notes.txt"));
    QVERIFY(notes.open(QIODevice::WriteOnly));
    notes.close();

    const QList<SessionListingEntry> entries = LocalSessionScanner::listDirectory(localNode(), root.path() + QStringLiteral("/-p"));
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries[0].file.path, newer);
    QCOMPARE(entries[1].file.path, older);
    QVERIFY(entries[0].modified > entries[1].modified);

    QVERIFY(LocalSessionScanner::listDirectory(localNode(), root.path() + QStringLiteral("/nope")).isEmpty());
}

void SessionScannerTest::testStartScansImmediately()
{
    QTemporaryDir root;
    const QString path = createSession(root.path(), QStringLiteral("-p"), QStringLiteral("s.jsonl"));

    LocalSessionScanner scanner(localNode(), testConfig(root.path()));
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);
    scanner.start();
    QVERIFY(scanner.isRunning());

    QVERIFY(discoveredSpy.wait(2000));
    QCOMPARE(discoveredPaths(discoveredSpy), QStringList{path});

    // Periodic scans keep running without repeating the discovery
    const QString later = createSession(root.path(), QStringLiteral("-q"), QStringLiteral("t.jsonl"));
    QVERIFY(discoveredSpy.wait(2000));
    QCOMPARE(discoveredPaths(discoveredSpy), (QStringList{path, later}));

    scanner.stop();
    QVERIFY(!scanner.isRunning());
}

void SessionScannerTest::testBuildListCommand()
{
    QCOMPARE(RemoteSessionScanner::buildListCommand(10), QStringLiteral("find ~/.claude/projects -name \"*.jsonl\" -mmin -10 2>/dev/null || true"));
}

void SessionScannerTest::testParseListing()
{
    ClusterNode node;
    node.name = QStringLiteral("gpu1");
    node.address = QStringLiteral("user@gpu1");

    const QString output = QStringLiteral(
        "/home/user/.claude/projects/-home-user-app/s1.jsonl\n"
        "\n"
        "  /home/user/.claude/projects/-home-user-lib/s2.jsonl  \n"
        "/home/user/.claude/projects/-home-user-lib/notes.txt\n");

    const QList<SessionListingEntry> entries = RemoteSessionScanner::parseListing(output, node);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries[0].file.path, QStringLiteral("/home/user/.claude/projects/-home-user-app/s1.jsonl"));
    QCOMPARE(entries[0].file.projectKey, QStringLiteral("/home/user/app"));
    QCOMPARE(entries[1].file.projectDir, QStringLiteral("/home/user/.claude/projects/-home-user-lib"));
    QCOMPARE(entries[1].file.node.name, QStringLiteral("gpu1"));
    QVERIFY(!entries[0].modified.isValid());
}

void SessionScannerTest::testRemoteUnreachableIsSilent()
{
    ClusterNode node;
    node.name = QStringLiteral("ghost");
    node.address = QStringLiteral("nobody@pixelagents-test.invalid");

    SupervisorConfig config;
    config.connectTimeoutSecs = 1;
    config.listTimeoutMs = 3000;

    RemoteSessionScanner scanner(node, config);
    QSignalSpy discoveredSpy(&scanner, &SessionScanner::sessionDiscovered);
    QSignalSpy finishedSpy(&scanner, &SessionScanner::scanFinished);

    scanner.scan();
    QVERIFY(QTest::qWaitFor([&]() {
        return !scanner.isListingInFlight();
    }, 10000));

    QCOMPARE(discoveredSpy.count(), 0);
    QCOMPARE(finishedSpy.count(), 0);
    QVERIFY(!scanner.initialScanDone());
}

QTEST_GUILESS_MAIN(SessionScannerTest)

#include "moc_SessionScannerTest.cpp"
