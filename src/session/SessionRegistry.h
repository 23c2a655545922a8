/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QStringList>

#include <optional>

#include "session/SessionBackend.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

/**
 * Owns the mapping from session id to live backend process.
 *
 * All terminal bindings share the registry's outputReceived() and
 * sessionExited() signals and pick out the events for their own id.
 * Calls for ids the registry does not know (never created, killed or
 * already exited) are dropped without reaching the backend.
 */
class TERMGRIDPRIVATE_EXPORT SessionRegistry : public QObject
{
    Q_OBJECT
public:
    enum class Operation {
        Create,
        Write,
        Resize,
        Kill,
    };
    Q_ENUM(Operation)

    using CreateCallback = SessionBackend::CreateCallback;

    explicit SessionRegistry(SessionBackend *backend, QObject *parent = nullptr);
    ~SessionRegistry() override;

    void create(int lines, int columns, const QString &workingDirectory, CreateCallback callback);
    void write(const QString &sessionId, const QByteArray &data);
    void resize(const QString &sessionId, int lines, int columns);
    void kill(const QString &sessionId);
    void killAll();

    bool hasSession(const QString &sessionId) const;
    QStringList sessionIds() const;
    int sessionCount() const;
    // Killed sessions still waiting for their exit event
    int pendingKillCount() const;

    SessionBackend *backend() const;

Q_SIGNALS:
    void sessionCreated(const QString &sessionId);
    void outputReceived(const QString &sessionId, const QByteArray &data);
    void sessionExited(const QString &sessionId, std::optional<int> exitCode);
    void operationFailed(const QString &sessionId, Termgrid::SessionRegistry::Operation operation, const QString &message);

private Q_SLOTS:
    void onBackendOutput(const QString &sessionId, const QByteArray &data);
    void onBackendExit(const QString &sessionId, std::optional<int> exitCode);

private:
    struct SessionRecord {
        int lines = 0;
        int columns = 0;
        QString workingDirectory;
    };

    void reportFailure(const QString &sessionId, Operation operation, const QString &message);

    SessionBackend *_backend;

    mutable QMutex _mutex;
    QHash<QString, SessionRecord> _sessions;
    // Killed but not yet confirmed by an exit event
    QSet<QString> _dying;
};

} // namespace Termgrid

#endif // SESSIONREGISTRY_H
