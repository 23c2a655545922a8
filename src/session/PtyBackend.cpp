/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/PtyBackend.h"

#include <QElapsedTimer>
#include <QFile>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QSocketNotifier>
#include <QTimer>

#include <utility>
#include <vector>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

Q_LOGGING_CATEGORY(TermgridPty, "termgrid.pty", QtInfoMsg)

namespace Termgrid
{

namespace
{
// Written by the child into the close-on-exec pipe when it cannot exec.
struct ChildFailure {
    int stage;
    int error;
};

enum ChildStage {
    ChangeDirectory = 1,
    Exec = 2,
};

const int MaxReapAttempts = 40;
const int ReapIntervalMs = 50;
const int HangupGraceMs = 2000;
const int ShutdownGraceMs = 500;
const int ShutdownPollUs = 10000;

QString errnoString(int error)
{
    return QString::fromLocal8Bit(std::strerror(error));
}

void reportChildFailure(int fd, int stage)
{
    const ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}
}

PtyBackend::PtyBackend(const QString &shellProgram, QObject *parent)
    : SessionBackend(parent)
    , _shellProgram(shellProgram)
{
}

PtyBackend::~PtyBackend()
{
    QList<pid_t> children;
    for (auto it = _processes.begin(); it != _processes.end(); ++it) {
        PtyProcess &process = it.value();
        delete process.readNotifier;
        delete process.writeNotifier;
        if (process.masterFd >= 0) {
            ::close(process.masterFd);
        }
        if (process.pid > 0) {
            ::kill(process.pid, SIGHUP);
            children.append(process.pid);
        }
    }
    _processes.clear();

    // No event loop is left to reap the shells, so wait for them here
    QElapsedTimer timer;
    timer.start();
    while (!children.isEmpty()) {
        for (auto it = children.begin(); it != children.end();) {
            if (::waitpid(*it, nullptr, WNOHANG) != 0) {
                it = children.erase(it);
            } else {
                ++it;
            }
        }
        if (children.isEmpty() || timer.elapsed() >= ShutdownGraceMs) {
            break;
        }
        ::usleep(ShutdownPollUs);
    }

    for (const pid_t pid : std::as_const(children)) {
        qCWarning(TermgridPty) << "pid" << pid << "ignored SIGHUP on shutdown, sending SIGKILL";
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
    }
}

QString PtyBackend::shellProgram() const
{
    return _shellProgram;
}

int PtyBackend::processCount() const
{
    return _processes.size();
}

pid_t PtyBackend::processId(const QString &sessionId) const
{
    auto it = _processes.constFind(sessionId);
    return it != _processes.constEnd() ? it->pid : -1;
}

void PtyBackend::deliver(std::function<void()> completion)
{
    QMetaObject::invokeMethod(this, std::move(completion), Qt::QueuedConnection);
}

void PtyBackend::create(int lines, int columns, const QString &workingDirectory, CreateCallback callback)
{
    QString error;
    const QString sessionId = spawn(lines, columns, workingDirectory, &error);

    deliver([this, sessionId, error, callback]() {
        if (sessionId.isEmpty()) {
            if (callback) {
                callback(false, error);
            }
            return;
        }
        if (callback) {
            callback(true, sessionId);
        }
        // Reading starts only after the caller knows the id, so the first
        // output chunk can always be routed.
        auto it = _processes.find(sessionId);
        if (it != _processes.end() && it->readNotifier) {
            it->readNotifier->setEnabled(true);
        }
    });
}

QString PtyBackend::spawn(int lines, int columns, const QString &workingDirectory, QString *error)
{
    if (_shellProgram.isEmpty()) {
        *error = QStringLiteral("No shell program configured");
        return QString();
    }

    // Everything the child needs is prepared before fork(); the child only
    // calls async-signal-safe functions.
    const QByteArray shell = QFile::encodeName(_shellProgram);
    const QByteArray directory = QFile::encodeName(workingDirectory);

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("TERM"), QStringLiteral("xterm-256color"));
    QList<QByteArray> environmentEntries;
    const QStringList keys = environment.keys();
    for (const QString &key : keys) {
        environmentEntries.append(QString(key + QLatin1Char('=') + environment.value(key)).toLocal8Bit());
    }
    std::vector<char *> envp;
    envp.reserve(environmentEntries.size() + 1);
    for (QByteArray &entry : environmentEntries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    QByteArray argv0 = shell;
    char *argv[] = {argv0.data(), nullptr};

    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
        *error = QStringLiteral("Cannot create status pipe: %1").arg(errnoString(errno));
        return QString();
    }

    struct winsize size;
    std::memset(&size, 0, sizeof(size));
    size.ws_row = static_cast<unsigned short>(qMax(1, lines));
    size.ws_col = static_cast<unsigned short>(qMax(1, columns));

    int masterFd = -1;
    const pid_t pid = ::forkpty(&masterFd, nullptr, nullptr, &size);
    if (pid < 0) {
        const int forkError = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        *error = QStringLiteral("Cannot open a pseudo-terminal: %1").arg(errnoString(forkError));
        return QString();
    }

    if (pid == 0) {
        ::close(errorPipe[0]);
        if (!directory.isEmpty() && ::chdir(directory.constData()) < 0) {
            reportChildFailure(errorPipe[1], ChangeDirectory);
        }
        ::execve(shell.constData(), argv, envp.data());
        reportChildFailure(errorPipe[1], Exec);
    }

    ::close(errorPipe[1]);

    ChildFailure failure{0, 0};
    ssize_t count;
    do {
        count = ::read(errorPipe[0], &failure, sizeof(failure));
    } while (count < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (count == static_cast<ssize_t>(sizeof(failure))) {
        ::close(masterFd);
        ::waitpid(pid, nullptr, 0);
        if (failure.stage == ChangeDirectory) {
            *error = QStringLiteral("Cannot change to directory %1: %2").arg(workingDirectory, errnoString(failure.error));
        } else {
            *error = QStringLiteral("Cannot start %1: %2").arg(_shellProgram, errnoString(failure.error));
        }
        qCWarning(TermgridPty) << "Spawn failed:" << *error;
        return QString();
    }

    ::fcntl(masterFd, F_SETFL, ::fcntl(masterFd, F_GETFL) | O_NONBLOCK);
    ::fcntl(masterFd, F_SETFD, FD_CLOEXEC);

    const QString sessionId = QStringLiteral("pty-") + QString::number(_nextId++);

    PtyProcess process;
    process.masterFd = masterFd;
    process.pid = pid;
    process.readNotifier = new QSocketNotifier(masterFd, QSocketNotifier::Read, this);
    process.readNotifier->setEnabled(false);
    connect(process.readNotifier, &QSocketNotifier::activated, this, [this, sessionId]() {
        readFromPty(sessionId);
    });
    process.writeNotifier = new QSocketNotifier(masterFd, QSocketNotifier::Write, this);
    process.writeNotifier->setEnabled(false);
    connect(process.writeNotifier, &QSocketNotifier::activated, this, [this, sessionId]() {
        flushInput(sessionId);
    });

    _processes.insert(sessionId, process);
    qCDebug(TermgridPty) << "Started" << _shellProgram << "as" << sessionId << "pid" << pid << "size" << columns << "x" << lines;
    return sessionId;
}

void PtyBackend::readFromPty(const QString &sessionId)
{
    auto it = _processes.find(sessionId);
    if (it == _processes.end() || it->hungUp) {
        return;
    }

    char buffer[4096];
    const ssize_t count = ::read(it->masterFd, buffer, sizeof(buffer));
    if (count > 0) {
        Q_EMIT outputReceived(sessionId, QByteArray(buffer, static_cast<int>(count)));
        return;
    }
    if (count < 0 && (errno == EAGAIN || errno == EINTR)) {
        return;
    }

    // EOF, or EIO once the slave side has been closed by the last process
    hangUp(sessionId);
}

void PtyBackend::flushInput(const QString &sessionId)
{
    auto it = _processes.find(sessionId);
    if (it == _processes.end() || it->hungUp) {
        return;
    }

    PtyProcess &process = it.value();
    while (!process.pendingInput.isEmpty()) {
        const ssize_t count = ::write(process.masterFd, process.pendingInput.constData(), process.pendingInput.size());
        if (count > 0) {
            process.pendingInput.remove(0, static_cast<int>(count));
            continue;
        }
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count < 0 && errno == EAGAIN) {
            break;
        }
        qCWarning(TermgridPty) << "Dropping" << process.pendingInput.size() << "input bytes for" << sessionId << ":" << errnoString(errno);
        process.pendingInput.clear();
        break;
    }
    process.writeNotifier->setEnabled(!process.pendingInput.isEmpty());
}

void PtyBackend::hangUp(const QString &sessionId)
{
    auto it = _processes.find(sessionId);
    if (it == _processes.end() || it->hungUp) {
        return;
    }

    PtyProcess &process = it.value();
    process.hungUp = true;
    process.pendingInput.clear();
    process.readNotifier->setEnabled(false);
    process.readNotifier->deleteLater();
    process.readNotifier = nullptr;
    process.writeNotifier->setEnabled(false);
    process.writeNotifier->deleteLater();
    process.writeNotifier = nullptr;
    ::close(process.masterFd);
    process.masterFd = -1;

    reap(sessionId);
}

void PtyBackend::reap(const QString &sessionId)
{
    auto it = _processes.find(sessionId);
    if (it == _processes.end()) {
        return;
    }

    int status = 0;
    const pid_t result = ::waitpid(it->pid, &status, WNOHANG);
    if (result == 0) {
        // The shell closed its terminal but has not exited yet
        if (++it->reapAttempts == MaxReapAttempts) {
            qCWarning(TermgridPty) << sessionId << "did not exit after hangup, sending SIGKILL";
            ::kill(it->pid, SIGKILL);
        }
        QTimer::singleShot(ReapIntervalMs, this, [this, sessionId]() {
            reap(sessionId);
        });
        return;
    }

    std::optional<int> exitCode;
    if (result > 0 && WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    }
    _processes.erase(it);

    qCDebug(TermgridPty) << sessionId << "exited with" << (exitCode ? QString::number(*exitCode) : QStringLiteral("signal"));
    Q_EMIT sessionExited(sessionId, exitCode);
}

void PtyBackend::escalate(const QString &sessionId)
{
    auto it = _processes.constFind(sessionId);
    if (it == _processes.constEnd() || it->hungUp) {
        return;
    }
    qCWarning(TermgridPty) << sessionId << "ignored SIGHUP, sending SIGKILL";
    ::kill(it->pid, SIGKILL);
}

void PtyBackend::write(const QString &sessionId, const QByteArray &data, AckCallback callback)
{
    auto it = _processes.find(sessionId);
    if (it == _processes.end() || it->hungUp) {
        deliver([callback, sessionId]() {
            if (callback) {
                callback(false, QStringLiteral("Session %1 has exited").arg(sessionId));
            }
        });
        return;
    }

    it->pendingInput.append(data);
    flushInput(sessionId);
    deliver([callback]() {
        if (callback) {
            callback(true, QString());
        }
    });
}

void PtyBackend::resize(const QString &sessionId, int lines, int columns, AckCallback callback)
{
    QString error;
    auto it = _processes.constFind(sessionId);
    if (it == _processes.constEnd() || it->hungUp) {
        error = QStringLiteral("Session %1 has exited").arg(sessionId);
    } else {
        struct winsize size;
        std::memset(&size, 0, sizeof(size));
        size.ws_row = static_cast<unsigned short>(qMax(1, lines));
        size.ws_col = static_cast<unsigned short>(qMax(1, columns));
        if (::ioctl(it->masterFd, TIOCSWINSZ, &size) < 0) {
            error = errnoString(errno);
        }
    }

    deliver([callback, error]() {
        if (callback) {
            callback(error.isEmpty(), error);
        }
    });
}

void PtyBackend::kill(const QString &sessionId, AckCallback callback)
{
    QString error;
    auto it = _processes.constFind(sessionId);
    if (it != _processes.constEnd() && !it->hungUp) {
        if (::kill(it->pid, SIGHUP) < 0 && errno != ESRCH) {
            error = errnoString(errno);
        } else {
            QTimer::singleShot(HangupGraceMs, this, [this, sessionId]() {
                escalate(sessionId);
            });
        }
    }

    deliver([callback, error]() {
        if (callback) {
            callback(error.isEmpty(), error);
        }
    });
}

} // namespace Termgrid

#include "moc_PtyBackend.cpp"
