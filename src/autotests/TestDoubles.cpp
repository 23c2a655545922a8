/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TestDoubles.h"

#include "terminal/TerminalBinding.h"

#include <utility>

namespace Termgrid
{

FakeSessionBackend::FakeSessionBackend(QObject *parent)
    : SessionBackend(parent)
{
}

void FakeSessionBackend::create(int lines, int columns, const QString &workingDirectory, CreateCallback callback)
{
    CreateRequest request;
    request.lines = lines;
    request.columns = columns;
    request.workingDirectory = workingDirectory;
    request.callback = std::move(callback);
    _pendingCreates.append(request);
    ++_createCount;
}

void FakeSessionBackend::write(const QString &sessionId, const QByteArray &data, AckCallback callback)
{
    if (_failWrites || !_live.contains(sessionId)) {
        if (callback) {
            callback(false, QStringLiteral("Session %1 is not writable").arg(sessionId));
        }
        return;
    }
    _written[sessionId].append(data);
    if (callback) {
        callback(true, QString());
    }
}

void FakeSessionBackend::resize(const QString &sessionId, int lines, int columns, AckCallback callback)
{
    _resizes.append(ResizeCall{sessionId, lines, columns});
    if (callback) {
        callback(true, QString());
    }
}

void FakeSessionBackend::kill(const QString &sessionId, AckCallback callback)
{
    _killed.append(sessionId);
    if (_failKills) {
        if (callback) {
            callback(false, QStringLiteral("Operation not permitted"));
        }
        return;
    }
    const bool wasLive = _live.remove(sessionId);
    if (callback) {
        callback(true, QString());
    }
    if (wasLive && _exitOnKill) {
        Q_EMIT sessionExited(sessionId, std::nullopt);
    }
}

QString FakeSessionBackend::completeCreate()
{
    if (_pendingCreates.isEmpty()) {
        return QString();
    }
    const CreateRequest request = _pendingCreates.takeFirst();
    const QString sessionId = QStringLiteral("fake-") + QString::number(_nextId++);
    _live.insert(sessionId);
    if (request.callback) {
        request.callback(true, sessionId);
    }
    return sessionId;
}

void FakeSessionBackend::failCreate(const QString &message)
{
    if (_pendingCreates.isEmpty()) {
        return;
    }
    const CreateRequest request = _pendingCreates.takeFirst();
    if (request.callback) {
        request.callback(false, message);
    }
}

QStringList FakeSessionBackend::completeAllCreates()
{
    QStringList ids;
    while (!_pendingCreates.isEmpty()) {
        ids.append(completeCreate());
    }
    return ids;
}

void FakeSessionBackend::emitOutput(const QString &sessionId, const QByteArray &data)
{
    Q_EMIT outputReceived(sessionId, data);
}

void FakeSessionBackend::emitExit(const QString &sessionId, std::optional<int> exitCode)
{
    _live.remove(sessionId);
    Q_EMIT sessionExited(sessionId, exitCode);
}

int FakeSessionBackend::pendingCreateCount() const
{
    return _pendingCreates.size();
}

FakeSessionBackend::CreateRequest FakeSessionBackend::pendingCreate(int index) const
{
    return _pendingCreates.value(index);
}

int FakeSessionBackend::createCount() const
{
    return _createCount;
}

QByteArray FakeSessionBackend::writtenData(const QString &sessionId) const
{
    return _written.value(sessionId);
}

QList<FakeSessionBackend::ResizeCall> FakeSessionBackend::resizeCalls() const
{
    return _resizes;
}

QStringList FakeSessionBackend::killedSessions() const
{
    return _killed;
}

QStringList FakeSessionBackend::liveSessions() const
{
    return _live.values();
}

void FakeSessionBackend::setExitOnKill(bool exitOnKill)
{
    _exitOnKill = exitOnKill;
}

void FakeSessionBackend::setFailWrites(bool failWrites)
{
    _failWrites = failWrites;
}

void FakeSessionBackend::setFailKills(bool failKills)
{
    _failKills = failKills;
}

FakeEmulation::FakeEmulation(QObject *parent)
    : TerminalEmulation(parent)
{
}

void FakeEmulation::receiveData(const QByteArray &data)
{
    received.append(data);
}

void FakeEmulation::showNotice(const QString &text)
{
    notices.append(text);
}

void FakeEmulation::localEcho(const QByteArray &data)
{
    echoed.append(data);
}

void FakeEmulation::setImageSize(int lines, int columns)
{
    _lines = lines;
    _columns = columns;
}

int FakeEmulation::lines() const
{
    return _lines;
}

int FakeEmulation::columns() const
{
    return _columns;
}

void FakeEmulation::focus()
{
    ++focusCount;
}

void FakeEmulation::type(const QByteArray &data)
{
    Q_EMIT sendData(data);
}

QByteArray MemoryLayoutStorage::read() const
{
    return blob;
}

bool MemoryLayoutStorage::write(const QByteArray &data)
{
    if (failWrites) {
        return false;
    }
    blob = data;
    ++writeCount;
    return true;
}

FakePopoutHost::FakePopoutHost(QObject *parent)
    : PopoutHost(parent)
{
}

void FakePopoutHost::hostTab(const Tab &tab)
{
    hosted.append(tab);
}

void FakePopoutHost::close(const QString &tabId)
{
    for (int i = 0; i < hosted.size(); ++i) {
        if (hosted.at(i).id == tabId) {
            const Tab tab = hosted.takeAt(i);
            Q_EMIT popoutClosed(tab);
            return;
        }
    }
}

FakeEmulation *fakeEmulation(TerminalBinding *binding)
{
    return binding ? qobject_cast<FakeEmulation *>(binding->emulation()) : nullptr;
}

} // namespace Termgrid

#include "moc_TestDoubles.cpp"
