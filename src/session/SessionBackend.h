/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONBACKEND_H
#define SESSIONBACKEND_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>
#include <optional>

#include "termgridprivate_export.h"

namespace Termgrid
{

/**
 * Process/PTY collaborator that actually runs the shells.
 *
 * Every call completes asynchronously: the callback runs on a later
 * turn of the event loop, never from inside the call itself.  Output
 * and exit notifications are pushed through the signals below; output
 * for one session id is emitted in the order the process produced it,
 * and sessionExited() is emitted exactly once per session.
 */
class TERMGRIDPRIVATE_EXPORT SessionBackend : public QObject
{
    Q_OBJECT
public:
    // On success result is the new session id, otherwise the error text.
    using CreateCallback = std::function<void(bool success, const QString &result)>;
    using AckCallback = std::function<void(bool success, const QString &error)>;

    explicit SessionBackend(QObject *parent = nullptr);
    ~SessionBackend() override;

    virtual void create(int lines, int columns, const QString &workingDirectory, CreateCallback callback) = 0;
    virtual void write(const QString &sessionId, const QByteArray &data, AckCallback callback) = 0;
    virtual void resize(const QString &sessionId, int lines, int columns, AckCallback callback) = 0;
    virtual void kill(const QString &sessionId, AckCallback callback) = 0;

Q_SIGNALS:
    void outputReceived(const QString &sessionId, const QByteArray &data);
    void sessionExited(const QString &sessionId, std::optional<int> exitCode);
};

} // namespace Termgrid

#endif // SESSIONBACKEND_H
