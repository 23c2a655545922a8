/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYBACKEND_H
#define PTYBACKEND_H

#include <QByteArray>
#include <QHash>
#include <QString>

#include <sys/types.h>

#include "session/SessionBackend.h"
#include "termgridprivate_export.h"

class QSocketNotifier;

namespace Termgrid
{

/**
 * SessionBackend that runs each shell on its own pseudo-terminal.
 *
 * The master side of every PTY is non-blocking and watched with
 * QSocketNotifier, so all I/O happens on the thread that owns the
 * backend.  Session ids have the form "pty-<n>".
 */
class TERMGRIDPRIVATE_EXPORT PtyBackend : public SessionBackend
{
    Q_OBJECT
public:
    explicit PtyBackend(const QString &shellProgram, QObject *parent = nullptr);
    ~PtyBackend() override;

    void create(int lines, int columns, const QString &workingDirectory, CreateCallback callback) override;
    void write(const QString &sessionId, const QByteArray &data, AckCallback callback) override;
    void resize(const QString &sessionId, int lines, int columns, AckCallback callback) override;
    void kill(const QString &sessionId, AckCallback callback) override;

    QString shellProgram() const;
    int processCount() const;
    pid_t processId(const QString &sessionId) const;

private:
    struct PtyProcess {
        int masterFd = -1;
        pid_t pid = -1;
        QSocketNotifier *readNotifier = nullptr;
        QSocketNotifier *writeNotifier = nullptr;
        QByteArray pendingInput;
        int reapAttempts = 0;
        bool hungUp = false;
    };

    QString spawn(int lines, int columns, const QString &workingDirectory, QString *error);
    void readFromPty(const QString &sessionId);
    void flushInput(const QString &sessionId);
    void hangUp(const QString &sessionId);
    void reap(const QString &sessionId);
    void escalate(const QString &sessionId);
    void deliver(std::function<void()> completion);

    QString _shellProgram;
    QHash<QString, PtyProcess> _processes;
    quint64 _nextId = 1;
};

} // namespace Termgrid

#endif // PTYBACKEND_H
