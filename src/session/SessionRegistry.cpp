/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/SessionRegistry.h"

#include <QLoggingCategory>
#include <QMutexLocker>
#include <QPointer>

Q_LOGGING_CATEGORY(TermgridSession, "termgrid.session", QtInfoMsg)

namespace Termgrid
{

static const char *operationName(SessionRegistry::Operation operation)
{
    switch (operation) {
    case SessionRegistry::Operation::Create:
        return "SpawnError";
    case SessionRegistry::Operation::Write:
        return "WriteError";
    case SessionRegistry::Operation::Resize:
        return "ResizeError";
    case SessionRegistry::Operation::Kill:
        return "KillError";
    }
    return "Error";
}

SessionRegistry::SessionRegistry(SessionBackend *backend, QObject *parent)
    : QObject(parent)
    , _backend(backend)
{
    connect(_backend, &SessionBackend::outputReceived, this, &SessionRegistry::onBackendOutput);
    connect(_backend, &SessionBackend::sessionExited, this, &SessionRegistry::onBackendExit);
}

SessionRegistry::~SessionRegistry()
{
    killAll();
}

SessionBackend *SessionRegistry::backend() const
{
    return _backend;
}

void SessionRegistry::create(int lines, int columns, const QString &workingDirectory, CreateCallback callback)
{
    QPointer<SessionRegistry> guard(this);
    _backend->create(lines, columns, workingDirectory, [guard, lines, columns, workingDirectory, callback](bool success, const QString &result) {
        if (!guard) {
            return;
        }
        if (!success) {
            guard->reportFailure(QString(), Operation::Create, result);
            if (callback) {
                callback(false, result);
            }
            return;
        }

        {
            QMutexLocker locker(&guard->_mutex);
            SessionRecord record;
            record.lines = lines;
            record.columns = columns;
            record.workingDirectory = workingDirectory;
            guard->_sessions.insert(result, record);
        }
        qCDebug(TermgridSession) << "Session" << result << "created in" << workingDirectory;
        Q_EMIT guard->sessionCreated(result);
        if (callback) {
            callback(true, result);
        }
    });
}

void SessionRegistry::write(const QString &sessionId, const QByteArray &data)
{
    {
        QMutexLocker locker(&_mutex);
        if (!_sessions.contains(sessionId)) {
            return;
        }
    }

    QPointer<SessionRegistry> guard(this);
    _backend->write(sessionId, data, [guard, sessionId](bool success, const QString &error) {
        if (guard && !success) {
            guard->reportFailure(sessionId, Operation::Write, error);
        }
    });
}

void SessionRegistry::resize(const QString &sessionId, int lines, int columns)
{
    {
        QMutexLocker locker(&_mutex);
        auto it = _sessions.find(sessionId);
        if (it == _sessions.end()) {
            return;
        }
        it->lines = lines;
        it->columns = columns;
    }

    QPointer<SessionRegistry> guard(this);
    _backend->resize(sessionId, lines, columns, [guard, sessionId](bool success, const QString &error) {
        if (guard && !success) {
            guard->reportFailure(sessionId, Operation::Resize, error);
        }
    });
}

void SessionRegistry::kill(const QString &sessionId)
{
    {
        QMutexLocker locker(&_mutex);
        if (_sessions.remove(sessionId) == 0) {
            return;
        }
        _dying.insert(sessionId);
    }

    qCDebug(TermgridSession) << "Killing session" << sessionId;
    QPointer<SessionRegistry> guard(this);
    _backend->kill(sessionId, [guard, sessionId](bool success, const QString &error) {
        if (guard && !success) {
            {
                // No exit event is coming for a kill that failed
                QMutexLocker locker(&guard->_mutex);
                guard->_dying.remove(sessionId);
            }
            guard->reportFailure(sessionId, Operation::Kill, error);
        }
    });
}

void SessionRegistry::killAll()
{
    const QStringList ids = sessionIds();
    for (const QString &sessionId : ids) {
        kill(sessionId);
    }
}

bool SessionRegistry::hasSession(const QString &sessionId) const
{
    QMutexLocker locker(&_mutex);
    return _sessions.contains(sessionId);
}

QStringList SessionRegistry::sessionIds() const
{
    QMutexLocker locker(&_mutex);
    return _sessions.keys();
}

int SessionRegistry::sessionCount() const
{
    QMutexLocker locker(&_mutex);
    return _sessions.size();
}

int SessionRegistry::pendingKillCount() const
{
    QMutexLocker locker(&_mutex);
    return _dying.size();
}

void SessionRegistry::onBackendOutput(const QString &sessionId, const QByteArray &data)
{
    Q_EMIT outputReceived(sessionId, data);
}

void SessionRegistry::onBackendExit(const QString &sessionId, std::optional<int> exitCode)
{
    {
        QMutexLocker locker(&_mutex);
        const bool live = _sessions.remove(sessionId) > 0;
        const bool dying = _dying.remove(sessionId);
        if (!live && !dying) {
            qCDebug(TermgridSession) << "Ignoring exit for unknown session" << sessionId;
            return;
        }
    }

    qCInfo(TermgridSession) << "Session" << sessionId << "exited" << (exitCode ? QString::number(*exitCode) : QStringLiteral("without status"));
    Q_EMIT sessionExited(sessionId, exitCode);
}

void SessionRegistry::reportFailure(const QString &sessionId, Operation operation, const QString &message)
{
    qCWarning(TermgridSession) << operationName(operation) << sessionId << message;
    Q_EMIT operationFailed(sessionId, operation, message);
}

} // namespace Termgrid

#include "moc_SessionRegistry.cpp"
