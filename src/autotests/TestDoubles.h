/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TESTDOUBLES_H
#define TESTDOUBLES_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>

#include "layout/LayoutStorage.h"
#include "popout/PopoutHost.h"
#include "session/SessionBackend.h"
#include "terminal/TerminalEmulation.h"

namespace Termgrid
{

class TerminalBinding;

/**
 * Scripted SessionBackend.  Create requests are queued until the test
 * completes or fails them; every other call is recorded and acknowledged
 * right away.
 */
class FakeSessionBackend : public SessionBackend
{
    Q_OBJECT
public:
    struct CreateRequest {
        int lines = 0;
        int columns = 0;
        QString workingDirectory;
        CreateCallback callback;
    };

    struct ResizeCall {
        QString sessionId;
        int lines = 0;
        int columns = 0;
    };

    explicit FakeSessionBackend(QObject *parent = nullptr);

    void create(int lines, int columns, const QString &workingDirectory, CreateCallback callback) override;
    void write(const QString &sessionId, const QByteArray &data, AckCallback callback) override;
    void resize(const QString &sessionId, int lines, int columns, AckCallback callback) override;
    void kill(const QString &sessionId, AckCallback callback) override;

    // Complete the oldest pending create; returns the new session id
    QString completeCreate();
    void failCreate(const QString &message);
    // Complete every pending create, including ones issued meanwhile
    QStringList completeAllCreates();

    void emitOutput(const QString &sessionId, const QByteArray &data);
    void emitExit(const QString &sessionId, std::optional<int> exitCode);

    int pendingCreateCount() const;
    CreateRequest pendingCreate(int index) const;
    int createCount() const;

    QByteArray writtenData(const QString &sessionId) const;
    QList<ResizeCall> resizeCalls() const;
    QStringList killedSessions() const;
    QStringList liveSessions() const;

    // When set, kill() does not report the session as exited
    void setExitOnKill(bool exitOnKill);
    void setFailWrites(bool failWrites);
    // Kills are reported as failed and the session stays alive
    void setFailKills(bool failKills);

private:
    QList<CreateRequest> _pendingCreates;
    int _createCount = 0;
    int _nextId = 1;
    QHash<QString, QByteArray> _written;
    QList<ResizeCall> _resizes;
    QStringList _killed;
    QSet<QString> _live;
    bool _exitOnKill = true;
    bool _failWrites = false;
    bool _failKills = false;
};

/**
 * Headless TerminalEmulation that records what it was asked to show.
 */
class FakeEmulation : public TerminalEmulation
{
    Q_OBJECT
public:
    explicit FakeEmulation(QObject *parent = nullptr);

    void receiveData(const QByteArray &data) override;
    void showNotice(const QString &text) override;
    void localEcho(const QByteArray &data) override;
    void setImageSize(int lines, int columns) override;
    int lines() const override;
    int columns() const override;
    void focus() override;

    // Simulate the user typing
    void type(const QByteArray &data);

    QByteArray received;
    QByteArray echoed;
    QStringList notices;
    int focusCount = 0;

private:
    int _lines = 0;
    int _columns = 0;
};

class MemoryLayoutStorage : public LayoutStorage
{
public:
    QByteArray read() const override;
    bool write(const QByteArray &blob) override;

    QByteArray blob;
    int writeCount = 0;
    bool failWrites = false;
};

class FakePopoutHost : public PopoutHost
{
    Q_OBJECT
public:
    explicit FakePopoutHost(QObject *parent = nullptr);

    void hostTab(const Tab &tab) override;
    // Simulate the user closing the popout window
    void close(const QString &tabId);

    QList<Tab> hosted;
};

FakeEmulation *fakeEmulation(TerminalBinding *binding);

} // namespace Termgrid

#endif // TESTDOUBLES_H
