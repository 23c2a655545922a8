/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalBindingTest.h"

#include <QSignalSpy>
#include <QTest>

#include "TestDoubles.h"
#include "session/SessionRegistry.h"
#include "terminal/TerminalBinding.h"

using namespace Termgrid;

static TerminalBinding::EmulationFactory fakeFactory()
{
    return [](QObject *parent) -> TerminalEmulation * {
        return new FakeEmulation(parent);
    };
}

static TerminalBinding::Options manualOptions()
{
    TerminalBinding::Options options;
    options.autoCreate = false;
    return options;
}

void TerminalBindingTest::testAutoCreateAfterMount()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding::Options options;
    options.workingDirectory = QStringLiteral("/srv");
    TerminalBinding binding(&registry, fakeFactory(), options);
    QSignalSpy boundSpy(&binding, &TerminalBinding::bound);

    binding.mount(30, 90);
    QVERIFY(binding.isMounted());
    QCOMPARE(fakeEmulation(&binding)->lines(), 30);
    QCOMPARE(fakeEmulation(&binding)->columns(), 90);
    // The session is requested on the next event loop pass
    QCOMPARE(backend.createCount(), 0);

    QTRY_COMPARE(backend.pendingCreateCount(), 1);
    QCOMPARE(backend.pendingCreate(0).lines, 30);
    QCOMPARE(backend.pendingCreate(0).columns, 90);
    QCOMPARE(backend.pendingCreate(0).workingDirectory, QStringLiteral("/srv"));
    QVERIFY(binding.isCreatePending());
    QCOMPARE(binding.state(), TerminalBinding::State::Unbound);

    const QString sessionId = backend.completeCreate();
    QCOMPARE(binding.state(), TerminalBinding::State::Bound);
    QCOMPARE(binding.sessionId(), sessionId);
    QVERIFY(!binding.isCreatePending());
    QCOMPARE(boundSpy.count(), 1);
    QCOMPARE(boundSpy.at(0).at(0).toString(), sessionId);
}

void TerminalBindingTest::testNoAutoCreate()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());

    // Not mounted yet
    QVERIFY(!binding.createSession());

    binding.mount(24, 80);
    QTest::qWait(10);
    QCOMPARE(backend.createCount(), 0);

    QVERIFY(binding.createSession());
    QCOMPARE(backend.pendingCreateCount(), 1);
    // Only one request may be in flight
    QVERIFY(!binding.createSession());
    QCOMPARE(backend.pendingCreateCount(), 1);

    backend.completeCreate();
    QVERIFY(!binding.createSession());
    QCOMPARE(backend.createCount(), 1);
}

void TerminalBindingTest::testAttachExistingSession()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    registry.create(24, 80, QString(), {});
    const QString sessionId = backend.completeCreate();

    TerminalBinding::Options options;
    options.sessionId = sessionId;
    TerminalBinding binding(&registry, fakeFactory(), options);
    QSignalSpy boundSpy(&binding, &TerminalBinding::bound);
    binding.mount(24, 80);

    QCOMPARE(binding.state(), TerminalBinding::State::Bound);
    QCOMPARE(binding.sessionId(), sessionId);
    QCOMPARE(boundSpy.count(), 1);
    QTest::qWait(10);
    QCOMPARE(backend.createCount(), 1);

    backend.emitOutput(sessionId, QByteArray("after"));
    QCOMPARE(fakeEmulation(&binding)->received, QByteArray("after"));
}

void TerminalBindingTest::testOutputRoutedToOwnSessionOnly()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding first(&registry, fakeFactory(), manualOptions());
    TerminalBinding second(&registry, fakeFactory(), manualOptions());
    first.mount(24, 80);
    second.mount(24, 80);
    first.createSession();
    second.createSession();
    const QString firstId = backend.completeCreate();
    const QString secondId = backend.completeCreate();

    backend.emitOutput(firstId, QByteArray("one"));
    backend.emitOutput(secondId, QByteArray("two"));
    backend.emitOutput(QStringLiteral("unrelated"), QByteArray("three"));

    QCOMPARE(fakeEmulation(&first)->received, QByteArray("one"));
    QCOMPARE(fakeEmulation(&second)->received, QByteArray("two"));
}

void TerminalBindingTest::testInputWrittenWhenBound()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    const QString sessionId = backend.completeCreate();

    fakeEmulation(&binding)->type(QByteArray("pwd\r"));

    QCOMPARE(backend.writtenData(sessionId), QByteArray("pwd\r"));
    QVERIFY(fakeEmulation(&binding)->echoed.isEmpty());
}

void TerminalBindingTest::testLocalEchoWhenUnbound()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);

    fakeEmulation(&binding)->type(QByteArray("abc"));

    QCOMPARE(fakeEmulation(&binding)->echoed, QByteArray("abc"));

    // Still unbound while the create is in flight
    binding.createSession();
    fakeEmulation(&binding)->type(QByteArray("d"));
    QCOMPARE(fakeEmulation(&binding)->echoed, QByteArray("abcd"));
}

void TerminalBindingTest::testResizeDuringCreateIssuesOneResize()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();

    binding.geometryChanged(30, 100);
    binding.geometryChanged(35, 110);
    binding.geometryChanged(40, 120);
    QVERIFY(backend.resizeCalls().isEmpty());
    QCOMPARE(fakeEmulation(&binding)->lines(), 40);
    QCOMPARE(fakeEmulation(&binding)->columns(), 120);

    const QString sessionId = backend.completeCreate();

    QCOMPARE(backend.resizeCalls().size(), 1);
    QCOMPARE(backend.resizeCalls().at(0).sessionId, sessionId);
    QCOMPARE(backend.resizeCalls().at(0).lines, 40);
    QCOMPARE(backend.resizeCalls().at(0).columns, 120);
}

void TerminalBindingTest::testNoResizeWithoutGeometryChangeDuringCreate()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    backend.completeCreate();

    QVERIFY(backend.resizeCalls().isEmpty());
}

void TerminalBindingTest::testBoundResizeDeduplicated()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    backend.completeCreate();

    binding.geometryChanged(24, 80);
    QVERIFY(backend.resizeCalls().isEmpty());

    binding.geometryChanged(50, 80);
    binding.geometryChanged(50, 80);
    QCOMPARE(backend.resizeCalls().size(), 1);
    QCOMPARE(backend.resizeCalls().at(0).lines, 50);
}

void TerminalBindingTest::testInvalidGeometryIgnored()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    backend.completeCreate();

    binding.geometryChanged(0, 80);
    binding.geometryChanged(24, -1);

    QVERIFY(backend.resizeCalls().isEmpty());
    QCOMPARE(binding.lines(), 24);
    QCOMPARE(binding.columns(), 80);
}

void TerminalBindingTest::testExitLeavesBindingUnbound()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    QSignalSpy exitSpy(&binding, &TerminalBinding::sessionExited);
    binding.mount(24, 80);
    binding.createSession();
    const QString sessionId = backend.completeCreate();

    backend.emitExit(sessionId, 2);

    QCOMPARE(binding.state(), TerminalBinding::State::Unbound);
    QVERIFY(binding.hasExited());
    QCOMPARE(exitSpy.count(), 1);
    QCOMPARE(fakeEmulation(&binding)->notices, QStringList{QStringLiteral("[Process exited with code 2]")});

    // No automatic respawn, and no manual one either
    QTest::qWait(10);
    QVERIFY(!binding.createSession());
    QCOMPARE(backend.createCount(), 1);

    // Output for the dead id is no longer shown; input is echoed locally
    backend.emitOutput(sessionId, QByteArray("late"));
    QVERIFY(fakeEmulation(&binding)->received.isEmpty());
    fakeEmulation(&binding)->type(QByteArray("q"));
    QCOMPARE(fakeEmulation(&binding)->echoed, QByteArray("q"));
    QVERIFY(backend.writtenData(sessionId).isEmpty());
}

void TerminalBindingTest::testTerminatedNotice()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    const QString sessionId = backend.completeCreate();

    backend.emitExit(sessionId, std::nullopt);

    QCOMPARE(fakeEmulation(&binding)->notices, QStringList{QStringLiteral("[Process terminated]")});
}

void TerminalBindingTest::testSpawnFailureAndRetry()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    QSignalSpy failedSpy(&binding, &TerminalBinding::spawnFailed);
    QSignalSpy stateSpy(&binding, &TerminalBinding::stateChanged);
    QVERIFY(!binding.canCreateSession());
    binding.mount(24, 80);
    QVERIFY(binding.canCreateSession());
    binding.createSession();
    QVERIFY(!binding.canCreateSession());
    QCOMPARE(stateSpy.count(), 1);
    binding.geometryChanged(40, 100);

    backend.failCreate(QStringLiteral("Cannot start /bin/nope"));

    QCOMPARE(stateSpy.count(), 2);
    QVERIFY(binding.canCreateSession());
    QCOMPARE(binding.state(), TerminalBinding::State::Unbound);
    QCOMPARE(binding.errorText(), QStringLiteral("Cannot start /bin/nope"));
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(fakeEmulation(&binding)->notices, QStringList{QStringLiteral("SpawnError: Cannot start /bin/nope")});
    QVERIFY(backend.resizeCalls().isEmpty());

    QVERIFY(binding.createSession());
    QCOMPARE(backend.pendingCreate(0).lines, 40);
    QCOMPARE(backend.pendingCreate(0).columns, 100);
    const QString sessionId = backend.completeCreate();
    QCOMPARE(binding.state(), TerminalBinding::State::Bound);
    QVERIFY(binding.errorText().isEmpty());
    QVERIFY(!binding.canCreateSession());
    QCOMPARE(stateSpy.count(), 4);

    // An exited session is never replaced
    backend.emitExit(sessionId, 0);
    QCOMPARE(stateSpy.count(), 5);
    QVERIFY(!binding.canCreateSession());
    QVERIFY(!binding.createSession());
}

void TerminalBindingTest::testReleaseDuringCreateKillsOrphan()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();

    QVERIFY(binding.release().isEmpty());
    const QString sessionId = backend.completeCreate();

    QCOMPARE(binding.state(), TerminalBinding::State::Unbound);
    QVERIFY(!registry.hasSession(sessionId));
    QCOMPARE(backend.killedSessions(), QStringList{sessionId});
    QVERIFY(!binding.createSession());
}

void TerminalBindingTest::testDestroyDuringCreateKillsOrphan()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    auto *binding = new TerminalBinding(&registry, fakeFactory(), manualOptions());
    binding->mount(24, 80);
    binding->createSession();
    delete binding;

    const QString sessionId = backend.completeCreate();

    QVERIFY(!registry.hasSession(sessionId));
    QCOMPARE(backend.killedSessions(), QStringList{sessionId});
}

void TerminalBindingTest::testReleaseKeepsSession()
{
    FakeSessionBackend backend;
    SessionRegistry registry(&backend);
    TerminalBinding binding(&registry, fakeFactory(), manualOptions());
    binding.mount(24, 80);
    binding.createSession();
    const QString sessionId = backend.completeCreate();

    QCOMPARE(binding.release(), sessionId);

    QCOMPARE(binding.state(), TerminalBinding::State::Unbound);
    QVERIFY(binding.sessionId().isEmpty());
    QVERIFY(registry.hasSession(sessionId));
    QVERIFY(backend.killedSessions().isEmpty());

    backend.emitOutput(sessionId, QByteArray("ignored"));
    QVERIFY(fakeEmulation(&binding)->received.isEmpty());
}

QTEST_GUILESS_MAIN(TerminalBindingTest)

#include "moc_TerminalBindingTest.cpp"
