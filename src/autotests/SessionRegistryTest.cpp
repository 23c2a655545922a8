/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistryTest.h"

#include <QSignalSpy>
#include <QTest>

#include "TestDoubles.h"
#include "session/SessionRegistry.h"

using namespace Termgrid;

void SessionRegistryTest::testCreateRegistersSession()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy createdSpy(&registry, &SessionRegistry::sessionCreated);

    bool called = false;
    bool succeeded = false;
    QString result;
    registry.create(30, 100, QStringLiteral("/tmp"), [&](bool success, const QString &value) {
        called = true;
        succeeded = success;
        result = value;
    });

    QCOMPARE(backend.pendingCreateCount(), 1);
    QCOMPARE(backend.pendingCreate(0).lines, 30);
    QCOMPARE(backend.pendingCreate(0).columns, 100);
    QCOMPARE(backend.pendingCreate(0).workingDirectory, QStringLiteral("/tmp"));
    QVERIFY(!called);
    QCOMPARE(registry.sessionCount(), 0);

    const QString sessionId = backend.completeCreate();
    QVERIFY(called);
    QVERIFY(succeeded);
    QCOMPARE(result, sessionId);
    QVERIFY(registry.hasSession(sessionId));
    QCOMPARE(registry.sessionIds(), QStringList{sessionId});
    QCOMPARE(createdSpy.count(), 1);
    QCOMPARE(createdSpy.at(0).at(0).toString(), sessionId);
}

void SessionRegistryTest::testCreateFailure()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy failedSpy(&registry, &SessionRegistry::operationFailed);

    bool succeeded = true;
    QString message;
    registry.create(24, 80, QString(), [&](bool success, const QString &value) {
        succeeded = success;
        message = value;
    });
    backend.failCreate(QStringLiteral("no such shell"));

    QVERIFY(!succeeded);
    QCOMPARE(message, QStringLiteral("no such shell"));
    QCOMPARE(registry.sessionCount(), 0);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<SessionRegistry::Operation>(), SessionRegistry::Operation::Create);
}

void SessionRegistryTest::testWriteAndResizeForwarded()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    registry.write(sessionId, QByteArray("ls\r"));
    registry.resize(sessionId, 40, 132);

    QCOMPARE(backend.writtenData(sessionId), QByteArray("ls\r"));
    QCOMPARE(backend.resizeCalls().size(), 1);
    QCOMPARE(backend.resizeCalls().at(0).sessionId, sessionId);
    QCOMPARE(backend.resizeCalls().at(0).lines, 40);
    QCOMPARE(backend.resizeCalls().at(0).columns, 132);
}

void SessionRegistryTest::testUnknownSessionIgnored()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy failedSpy(&registry, &SessionRegistry::operationFailed);

    registry.write(QStringLiteral("missing"), QByteArray("x"));
    registry.resize(QStringLiteral("missing"), 10, 10);
    registry.kill(QStringLiteral("missing"));

    QVERIFY(backend.writtenData(QStringLiteral("missing")).isEmpty());
    QVERIFY(backend.resizeCalls().isEmpty());
    QVERIFY(backend.killedSessions().isEmpty());
    QCOMPARE(failedSpy.count(), 0);
}

void SessionRegistryTest::testKillRemovesSession()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy exitSpy(&registry, &SessionRegistry::sessionExited);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    registry.kill(sessionId);

    QVERIFY(!registry.hasSession(sessionId));
    QCOMPARE(backend.killedSessions(), QStringList{sessionId});
    QCOMPARE(exitSpy.count(), 1);
    QCOMPARE(exitSpy.at(0).at(0).toString(), sessionId);

    // A second kill is a no-op
    registry.kill(sessionId);
    QCOMPARE(backend.killedSessions().size(), 1);
}

void SessionRegistryTest::testPendingKillClearedByExit()
{
    FakeSessionBackend backend;
    backend.setExitOnKill(false);
    SessionRegistry registry(&backend);
    QSignalSpy exitSpy(&registry, &SessionRegistry::sessionExited);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    registry.kill(sessionId);
    QCOMPARE(registry.pendingKillCount(), 1);
    QCOMPARE(exitSpy.count(), 0);

    backend.emitExit(sessionId, std::nullopt);
    QCOMPARE(registry.pendingKillCount(), 0);
    QCOMPARE(exitSpy.count(), 1);
}

void SessionRegistryTest::testKillFailureClearsPendingKill()
{
    FakeSessionBackend backend;
    backend.setFailKills(true);
    SessionRegistry registry(&backend);
    QSignalSpy exitSpy(&registry, &SessionRegistry::sessionExited);
    QSignalSpy failedSpy(&registry, &SessionRegistry::operationFailed);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    registry.kill(sessionId);

    QCOMPARE(backend.killedSessions(), QStringList{sessionId});
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), sessionId);
    QCOMPARE(failedSpy.at(0).at(1).value<SessionRegistry::Operation>(), SessionRegistry::Operation::Kill);
    QCOMPARE(registry.pendingKillCount(), 0);
    QVERIFY(!registry.hasSession(sessionId));
    QCOMPARE(exitSpy.count(), 0);
}

void SessionRegistryTest::testDuplicateExitDropped()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy exitSpy(&registry, &SessionRegistry::sessionExited);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    backend.emitExit(sessionId, 0);
    backend.emitExit(sessionId, 0);

    QCOMPARE(exitSpy.count(), 1);
    const std::optional<int> exitCode = exitSpy.at(0).at(1).value<std::optional<int>>();
    QVERIFY(exitCode.has_value());
    QCOMPARE(*exitCode, 0);
    QVERIFY(!registry.hasSession(sessionId));
}

void SessionRegistryTest::testExitOfUnknownSessionDropped()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy exitSpy(&registry, &SessionRegistry::sessionExited);

    backend.emitExit(QStringLiteral("stranger"), 1);

    QCOMPARE(exitSpy.count(), 0);
}

void SessionRegistryTest::testOutputForwarded()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy outputSpy(&registry, &SessionRegistry::outputReceived);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    backend.emitOutput(sessionId, QByteArray("hello"));

    QCOMPARE(outputSpy.count(), 1);
    QCOMPARE(outputSpy.at(0).at(0).toString(), sessionId);
    QCOMPARE(outputSpy.at(0).at(1).toByteArray(), QByteArray("hello"));
}

void SessionRegistryTest::testWriteFailureReported()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    QSignalSpy failedSpy(&registry, &SessionRegistry::operationFailed);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    backend.setFailWrites(true);
    registry.write(sessionId, QByteArray("x"));

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), sessionId);
    QCOMPARE(failedSpy.at(0).at(1).value<SessionRegistry::Operation>(), SessionRegistry::Operation::Write);
    // The session itself is unaffected
    QVERIFY(registry.hasSession(sessionId));
}

void SessionRegistryTest::testDestructorKillsAll()
{
    FakeSessionBackend backend;
    QStringList ids;
    {
        SessionRegistry registry(&backend);
        registry.create(24, 80, QString(), {});
        registry.create(24, 80, QString(), {});
        ids = backend.completeAllCreates();
        QCOMPARE(registry.sessionCount(), 2);
    }

    QStringList killed = backend.killedSessions();
    killed.sort();
    ids.sort();
    QCOMPARE(killed, ids);
    QVERIFY(backend.liveSessions().isEmpty());
}

QTEST_GUILESS_MAIN(SessionRegistryTest)

#include "moc_SessionRegistryTest.cpp"
